#include <algorithm>
#include <stdexcept>
#include <thread>

#include "dlc/chunk_scheduler.hpp"
#include "utils/logger.hpp"

namespace plushlink::dlc
{

ChunkScheduler::ChunkScheduler(Transport &transport, NotificationRouter &router,
                               utils::CallbackDispatcher &progress_dispatcher,
                               ChunkSchedulerOptions options)
    : m_transport(transport), m_router(router), m_dispatcher(progress_dispatcher),
      m_options(options)
{
}

size_t ChunkScheduler::effective_chunk_size(size_t requested) const
{
    const size_t link_max = m_transport.max_write_size();
    if (link_max == 0)
        throw std::logic_error("transport reports a zero max_write_size");
    if (requested == 0)
        return link_max;
    return std::min(requested, link_max);
}

size_t ChunkScheduler::chunk_count(size_t payload_size, size_t chunk_size) noexcept
{
    if (payload_size == 0 || chunk_size == 0)
        return 1;
    return (payload_size + chunk_size - 1) / chunk_size;
}

DlcResult<ChunkStats> ChunkScheduler::send(std::span<const uint8_t> payload, size_t chunk_size,
                                           bool ack_mode, const ProgressCallback &progress,
                                           const CancellationToken *cancel)
{
    ChunkStats stats;
    stats.chunk_size = effective_chunk_size(chunk_size);
    const size_t total = payload.size();
    const size_t count = chunk_count(total, stats.chunk_size);

    LOGGER_DEBUG("chunks: sending {} bytes as {} chunk(s) of <= {} bytes ({})", total, count,
                 stats.chunk_size, ack_mode ? "step-ack" : "streaming");

    for (size_t i = 0; i < count; ++i)
    {
        const size_t offset = i * stats.chunk_size;
        const size_t len = std::min(stats.chunk_size, total - offset);
        const int offset_code = static_cast<int>(offset);

        NotificationRouter::WaitHandle ack;
        if (ack_mode)
            ack = m_router.register_waiter(SignalKind::ChunkAck);
        // Checked after registering so a cancel that races the registration is still seen.
        if (cancel && cancel->is_cancelled())
            return DlcResult<ChunkStats>::error(TransferError::Cancelled, offset_code);

        auto written = m_transport.write(Endpoint::File, payload.subspan(offset, len));
        if (written.is_error())
        {
            if (written.error() == TransportError::NotConnected)
            {
                LOGGER_WARN("chunks: link lost at offset {}", offset);
                return DlcResult<ChunkStats>::error(TransferError::TransportFailure, offset_code);
            }
            LOGGER_WARN("chunks: write of chunk {} at offset {} failed", i, offset);
            return DlcResult<ChunkStats>::error(TransferError::ChunkFailed, offset_code);
        }

        if (ack_mode)
        {
            ++stats.acks_awaited;
            auto acked = m_router.await_signal(ack, m_options.chunk_ack_timeout);
            if (acked.is_error())
            {
                switch (acked.error())
                {
                case WaitError::Cancelled:
                    return DlcResult<ChunkStats>::error(TransferError::Cancelled, offset_code);
                case WaitError::LinkLost:
                    return DlcResult<ChunkStats>::error(TransferError::TransportFailure,
                                                        offset_code);
                case WaitError::TimedOut:
                    LOGGER_WARN("chunks: no ack for chunk {} at offset {}", i, offset);
                    return DlcResult<ChunkStats>::error(TransferError::ChunkFailed, offset_code);
                }
            }
        }

        ++stats.chunks_sent;
        stats.bytes_sent += len;
        if (progress)
        {
            m_dispatcher.post([progress, sent = stats.bytes_sent, total]
                              { progress(sent, total); });
        }

        const bool last = (i + 1 == count);
        if (!last && m_options.pacing.count() > 0)
        {
            if (cancel)
            {
                if (cancel->wait_for(m_options.pacing))
                {
                    return DlcResult<ChunkStats>::error(
                        TransferError::Cancelled, static_cast<int>(offset + len));
                }
            }
            else
            {
                std::this_thread::sleep_for(m_options.pacing);
            }
        }
    }

    return DlcResult<ChunkStats>::ok(stats);
}

} // namespace plushlink::dlc
