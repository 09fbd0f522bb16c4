#pragma once
/**
 * @file transfer_session.hpp
 * @brief State machine that owns one upload from reservation to commit.
 *
 * @code
 *   Idle --request--> Reserved --start-transfer written--> Negotiating
 *        --ready--> Sending --last chunk--> AwaitingCompletion --complete--> Committed
 *   any non-terminal state --timeout / transport error / cancel--> Aborted
 * @endcode
 *
 * Only Committed marks the slot Uploaded. Aborted restores the slot's state from before
 * the session. Waiters are registered before the write that provokes them, so a device
 * that answers from inside write() is still heard.
 */
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <span>

#include "dlc/cancellation.hpp"
#include "dlc/chunk_scheduler.hpp"
#include "dlc/notification_router.hpp"
#include "dlc/protocol.hpp"
#include "dlc/slot_registry.hpp"
#include "dlc/transport.hpp"
#include "plushlink_utils_export.h"
#include "utils/callback_dispatcher.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace plushlink::dlc
{

enum class SessionState
{
    Idle,
    Reserved,
    Negotiating,
    Sending,
    AwaitingCompletion,
    Committed,
    Aborted,
};

PLUSHLINK_UTILS_EXPORT const char *to_string(SessionState state) noexcept;

enum class SessionOutcome
{
    Pending,
    Succeeded,
    Failed,
};

struct SessionOptions
{
    size_t max_payload_bytes{protocol::kMaxEncodableLength};
    size_t chunk_size{0}; ///< 0 = link maximum.
    bool ack_mode{false};
    std::chrono::milliseconds ready_timeout{3000};
    std::chrono::milliseconds chunk_ack_timeout{2000};
    std::chrono::milliseconds completion_timeout{10000};
    std::chrono::milliseconds pacing{0};
};

/// Summary of a committed upload.
struct UploadReport
{
    int slot{0};
    size_t total_bytes{0};
    size_t chunk_size{0};
    size_t chunks_sent{0};
    size_t acks_awaited{0};
    std::chrono::milliseconds elapsed{0};
};

class PLUSHLINK_UTILS_EXPORT TransferSession
{
  public:
    TransferSession(Transport &transport, NotificationRouter &router, SlotRegistry &registry,
                    const ProtocolConfig &protocol, utils::CallbackDispatcher &progress_dispatcher,
                    SessionOptions options);

    /// Reverts a reservation that was never run.
    ~TransferSession();

    TransferSession(const TransferSession &) = delete;
    TransferSession &operator=(const TransferSession &) = delete;

    /**
     * @brief Validates and reserves the slot (Idle -> Reserved). No device I/O.
     *        Errors, in check order: InvalidSlot, PayloadTooLarge, SlotBusy, SlotInUse.
     * @throws std::logic_error if the session is not Idle.
     */
    [[nodiscard]] DlcStatus request(int slot, size_t size);

    /**
     * @brief Runs negotiation, chunk delivery and the completion wait. Blocks.
     * @throws std::logic_error if not Reserved or if payload.size() differs from request().
     */
    [[nodiscard]] DlcResult<UploadReport> run(std::span<const uint8_t> payload,
                                              const ProgressCallback &progress = {});

    /**
     * @brief Forces Aborted from any non-terminal state. Safe from any thread; wakes a
     *        blocked run() immediately.
     */
    void cancel();

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] SessionOutcome outcome() const;
    /// Reason for a Failed outcome.
    [[nodiscard]] std::optional<TransferError> failure() const;
    [[nodiscard]] int slot() const noexcept { return m_slot; }
    [[nodiscard]] size_t total_bytes() const noexcept { return m_total_bytes; }
    [[nodiscard]] size_t bytes_sent() const;

  private:
    DlcResult<UploadReport> abort(TransferError err, int code);
    void set_state(SessionState next);
    void revert_if_unfinished() noexcept;
    [[nodiscard]] bool is_terminal_locked() const noexcept;

    Transport &m_transport;
    NotificationRouter &m_router;
    SlotRegistry &m_registry;
    const ProtocolConfig &m_protocol;
    ChunkScheduler m_scheduler;
    SessionOptions m_options;
    CancellationToken m_cancel;

    mutable std::mutex m_mutex;
    SessionState m_state{SessionState::Idle};
    std::optional<TransferError> m_failure;
    bool m_running{false};
    int m_slot{-1};
    size_t m_total_bytes{0};
    size_t m_bytes_sent{0};
    SlotState m_previous_state{SlotState::Empty};
};

} // namespace plushlink::dlc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
