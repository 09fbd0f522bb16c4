#pragma once
/**
 * @file chunk_scheduler.hpp
 * @brief Splits a payload into link-sized writes on the File endpoint and paces them.
 *
 * Streaming mode writes chunks back to back (plus an optional fixed pacing delay).
 * Step-ack mode registers a ChunkAck waiter before each write and waits for it before
 * the next chunk, so a slow receiver can never be overrun.
 *
 * A failed write or a missing ack aborts the whole send; nothing is resumed.
 */
#include <chrono>
#include <cstddef>
#include <functional>
#include <span>

#include "dlc/cancellation.hpp"
#include "dlc/notification_router.hpp"
#include "dlc/transfer_error.hpp"
#include "dlc/transport.hpp"
#include "plushlink_utils_export.h"
#include "utils/callback_dispatcher.hpp"

namespace plushlink::dlc
{

/// Cumulative bytes sent and the payload total.
using ProgressCallback = std::function<void(size_t bytes_sent, size_t total)>;

struct ChunkStats
{
    size_t chunk_size{0}; ///< Effective size after the link limit was applied.
    size_t chunks_sent{0};
    size_t bytes_sent{0};
    size_t acks_awaited{0};
};

struct ChunkSchedulerOptions
{
    std::chrono::milliseconds chunk_ack_timeout{2000};
    std::chrono::milliseconds pacing{0};
};

class PLUSHLINK_UTILS_EXPORT ChunkScheduler
{
  public:
    /**
     * @param progress_dispatcher Thread that runs progress callbacks, so a slow callback
     *        never stalls the link.
     */
    ChunkScheduler(Transport &transport, NotificationRouter &router,
                   utils::CallbackDispatcher &progress_dispatcher, ChunkSchedulerOptions options);

    /**
     * @brief Sends `payload` as ceil(size / effective_chunk) writes (one empty write for an
     *        empty payload).
     * @param chunk_size Requested chunk size; 0 or anything above the link maximum means
     *        the link maximum.
     * @param cancel Optional token checked between chunks and during pacing.
     * @return Stats, or ChunkFailed (code = byte offset of the failed chunk),
     *         TransportFailure (link lost), Cancelled.
     */
    [[nodiscard]] DlcResult<ChunkStats> send(std::span<const uint8_t> payload, size_t chunk_size,
                                             bool ack_mode, const ProgressCallback &progress = {},
                                             const CancellationToken *cancel = nullptr);

    /// Chunk size actually used for a requested size on this transport.
    [[nodiscard]] size_t effective_chunk_size(size_t requested) const;

    /// Number of writes a payload of `payload_size` needs.
    [[nodiscard]] static size_t chunk_count(size_t payload_size, size_t chunk_size) noexcept;

  private:
    Transport &m_transport;
    NotificationRouter &m_router;
    utils::CallbackDispatcher &m_dispatcher;
    ChunkSchedulerOptions m_options;
};

} // namespace plushlink::dlc
