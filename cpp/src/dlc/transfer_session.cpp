#include <stdexcept>

#include <fmt/format.h>

#include "dlc/transfer_session.hpp"
#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"

namespace plushlink::dlc
{

const char *to_string(SessionState state) noexcept
{
    switch (state)
    {
    case SessionState::Idle:
        return "Idle";
    case SessionState::Reserved:
        return "Reserved";
    case SessionState::Negotiating:
        return "Negotiating";
    case SessionState::Sending:
        return "Sending";
    case SessionState::AwaitingCompletion:
        return "AwaitingCompletion";
    case SessionState::Committed:
        return "Committed";
    case SessionState::Aborted:
        return "Aborted";
    }
    return "Unknown";
}

namespace
{
TransferError from_wait_error(WaitError err, TransferError on_timeout) noexcept
{
    switch (err)
    {
    case WaitError::TimedOut:
        return on_timeout;
    case WaitError::Cancelled:
        return TransferError::Cancelled;
    case WaitError::LinkLost:
        return TransferError::TransportFailure;
    }
    return on_timeout;
}
} // namespace

TransferSession::TransferSession(Transport &transport, NotificationRouter &router,
                                 SlotRegistry &registry, const ProtocolConfig &protocol,
                                 utils::CallbackDispatcher &progress_dispatcher,
                                 SessionOptions options)
    : m_transport(transport), m_router(router), m_registry(registry), m_protocol(protocol),
      m_scheduler(transport, router, progress_dispatcher,
                  ChunkSchedulerOptions{options.chunk_ack_timeout, options.pacing}),
      m_options(options)
{
}

TransferSession::~TransferSession()
{
    revert_if_unfinished();
}

bool TransferSession::is_terminal_locked() const noexcept
{
    return m_state == SessionState::Committed || m_state == SessionState::Aborted;
}

void TransferSession::revert_if_unfinished() noexcept
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == SessionState::Idle || is_terminal_locked())
            return;
        m_state = SessionState::Aborted;
        if (!m_failure)
            m_failure = TransferError::Cancelled;
        m_running = false;
    }
    m_registry.end_upload(m_slot, m_previous_state);
    LOGGER_WARN("upload to slot {} abandoned before completion; slot reverted to {}", m_slot,
                to_string(m_previous_state));
}

void TransferSession::set_state(SessionState next)
{
    SessionState prev;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        prev = m_state;
        m_state = next;
    }
    LOGGER_DEBUG("session(slot {}): {} -> {}", m_slot, to_string(prev), to_string(next));
}

DlcStatus TransferSession::request(int slot, size_t size)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != SessionState::Idle)
        {
            throw std::logic_error(fmt::format("request() on a session in state {}",
                                               to_string(m_state)));
        }
    }

    if (!m_registry.is_valid(slot))
        return DlcStatus::error(TransferError::InvalidSlot, slot);
    if (size > m_options.max_payload_bytes || size > protocol::kMaxEncodableLength)
    {
        LOGGER_WARN("upload of {} bytes to slot {} refused: limit is {} bytes", size, slot,
                    m_options.max_payload_bytes);
        return DlcStatus::error(TransferError::PayloadTooLarge, slot);
    }

    auto reserved = m_registry.begin_upload(slot);
    if (reserved.is_error())
        return reserved.forward_error<std::monostate>();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_slot = slot;
        m_total_bytes = size;
        m_previous_state = reserved.content();
        m_state = SessionState::Reserved;
    }
    LOGGER_DEBUG("session(slot {}): Idle -> Reserved ({} bytes)", slot, size);
    return DlcStatus::ok();
}

DlcResult<UploadReport> TransferSession::run(std::span<const uint8_t> payload,
                                             const ProgressCallback &progress)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == SessionState::Aborted && m_failure)
            return DlcResult<UploadReport>::error(*m_failure, m_slot);
        if (m_state != SessionState::Reserved)
        {
            throw std::logic_error(
                fmt::format("run() on a session in state {}", to_string(m_state)));
        }
        if (payload.size() != m_total_bytes)
        {
            throw std::logic_error(fmt::format("run() with {} bytes, {} were requested",
                                               payload.size(), m_total_bytes));
        }
        m_running = true;
    }

    // Any exit that is neither a commit nor an explicit abort still restores the slot.
    auto revert = basics::make_scope_guard([this]() noexcept { revert_if_unfinished(); });

    const auto started = std::chrono::steady_clock::now();
    const auto slot_byte = static_cast<uint8_t>(m_slot);

    // --- Negotiate ---
    auto ready = m_router.register_waiter(SignalKind::TransferReady);
    if (m_cancel.is_cancelled())
        return abort(TransferError::Cancelled, 0);

    const Bytes start_cmd = protocol::encode_start_transfer(
        m_protocol, slot_byte, static_cast<uint32_t>(m_total_bytes), m_options.ack_mode);
    if (auto w = m_transport.write(Endpoint::Command, start_cmd); w.is_error())
        return abort(TransferError::TransportFailure, 0);
    set_state(SessionState::Negotiating);

    auto ready_sig = m_router.await_signal(ready, m_options.ready_timeout);
    if (ready_sig.is_error())
        return abort(from_wait_error(ready_sig.error(), TransferError::NotReady), 0);
    if (auto echo = protocol::ready_slot_echo(m_protocol, ready_sig.content());
        echo && *echo != slot_byte)
    {
        LOGGER_WARN("device signalled ready for slot {} while uploading to slot {}", *echo,
                    m_slot);
        return abort(TransferError::DeviceRejected, m_protocol.start_transfer_opcode);
    }

    // --- Send ---
    set_state(SessionState::Sending);
    auto complete = m_router.register_waiter(SignalKind::TransferComplete);
    if (m_cancel.is_cancelled())
        return abort(TransferError::Cancelled, 0);

    auto sent = m_scheduler.send(payload, m_options.chunk_size, m_options.ack_mode, progress,
                                 &m_cancel);
    if (sent.is_error())
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_bytes_sent = static_cast<size_t>(sent.error_code());
        }
        return abort(sent.error(), sent.error_code());
    }
    const ChunkStats stats = sent.content();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_bytes_sent = stats.bytes_sent;
    }

    // --- Await completion ---
    set_state(SessionState::AwaitingCompletion);
    auto done = m_router.await_signal(complete, m_options.completion_timeout);
    if (done.is_error())
    {
        return abort(from_wait_error(done.error(), TransferError::CompletionTimeout),
                     static_cast<int>(stats.bytes_sent));
    }

    // --- Commit ---
    m_registry.commit_upload(m_slot);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = SessionState::Committed;
        m_running = false;
    }
    revert.dismiss();

    UploadReport report;
    report.slot = m_slot;
    report.total_bytes = m_total_bytes;
    report.chunk_size = stats.chunk_size;
    report.chunks_sent = stats.chunks_sent;
    report.acks_awaited = stats.acks_awaited;
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    LOGGER_INFO("slot {} committed: {} bytes in {} chunk(s), {} ms", report.slot,
                report.total_bytes, report.chunks_sent, report.elapsed.count());
    return DlcResult<UploadReport>::ok(report);
}

DlcResult<UploadReport> TransferSession::abort(TransferError err, int code)
{
    SessionState from;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        from = m_state;
        m_state = SessionState::Aborted;
        m_failure = err;
        m_running = false;
    }
    m_registry.end_upload(m_slot, m_previous_state);
    if (err == TransferError::Cancelled)
    {
        LOGGER_INFO("upload to slot {} cancelled in {}", m_slot, to_string(from));
    }
    else
    {
        LOGGER_WARN("upload to slot {} aborted in {}: {} ({}); slot reverted to {}", m_slot,
                    to_string(from), to_string(err), code, to_string(m_previous_state));
    }
    return DlcResult<UploadReport>::error(err, code);
}

void TransferSession::cancel()
{
    bool revert_now = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (is_terminal_locked())
            return;
        if (m_state == SessionState::Idle)
        {
            m_state = SessionState::Aborted;
            m_failure = TransferError::Cancelled;
            return;
        }
        if (!m_running)
        {
            // Reserved but run() never started: nothing is blocked, revert right here.
            m_state = SessionState::Aborted;
            m_failure = TransferError::Cancelled;
            revert_now = true;
        }
    }

    if (revert_now)
    {
        m_registry.end_upload(m_slot, m_previous_state);
        LOGGER_INFO("upload to slot {} cancelled before it started", m_slot);
        return;
    }

    m_cancel.cancel();
    m_router.fail(SignalKind::TransferReady, WaitError::Cancelled);
    m_router.fail(SignalKind::ChunkAck, WaitError::Cancelled);
    m_router.fail(SignalKind::TransferComplete, WaitError::Cancelled);
}

SessionState TransferSession::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

SessionOutcome TransferSession::outcome() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == SessionState::Committed)
        return SessionOutcome::Succeeded;
    if (m_state == SessionState::Aborted)
        return SessionOutcome::Failed;
    return SessionOutcome::Pending;
}

std::optional<TransferError> TransferSession::failure() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failure;
}

size_t TransferSession::bytes_sent() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bytes_sent;
}

} // namespace plushlink::dlc
