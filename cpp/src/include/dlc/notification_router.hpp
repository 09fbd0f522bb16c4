#pragma once
/**
 * @file notification_router.hpp
 * @brief Demultiplexes device notifications into one-shot, keyed waiters.
 *
 * Protocol code registers interest in a SignalKind *before* writing the command that
 * provokes it, then blocks in await_signal() until the matching notification arrives,
 * the wait times out, or the waiter is failed (cancel, link loss).
 *
 * There is no buffering: a notification with no outstanding waiter for its kind is
 * dropped and counted. A stale notification can therefore never satisfy a later wait.
 *
 * @code
 *   auto ready = router.register_waiter(SignalKind::TransferReady);
 *   transport.write(Endpoint::Command, start_cmd);
 *   auto r = router.await_signal(ready, std::chrono::milliseconds(3000));
 * @endcode
 */
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "dlc/protocol.hpp"
#include "plushlink_utils_export.h"
#include "utils/result.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace plushlink::dlc
{

/// Thrown when a second waiter is registered for a kind that already has one.
class PLUSHLINK_UTILS_EXPORT DuplicateWaiter : public std::logic_error
{
  public:
    explicit DuplicateWaiter(SignalKind kind);
    SignalKind kind() const noexcept { return m_kind; }

  private:
    SignalKind m_kind;
};

/// Why a wait ended without a notification.
enum class WaitError
{
    TimedOut,
    Cancelled,
    LinkLost,
};

class PLUSHLINK_UTILS_EXPORT NotificationRouter
{
  public:
    /**
     * @class WaitHandle
     * @brief Move-only token for one registration. Destroying an unresolved handle
     *        releases the registration.
     */
    class PLUSHLINK_UTILS_EXPORT WaitHandle
    {
      public:
        WaitHandle() = default;
        ~WaitHandle();
        WaitHandle(WaitHandle &&other) noexcept;
        WaitHandle &operator=(WaitHandle &&other) noexcept;
        WaitHandle(const WaitHandle &) = delete;
        WaitHandle &operator=(const WaitHandle &) = delete;

        [[nodiscard]] bool valid() const noexcept { return m_router != nullptr; }
        [[nodiscard]] SignalKind kind() const noexcept { return m_kind; }

      private:
        friend class NotificationRouter;
        WaitHandle(NotificationRouter *router, SignalKind kind, uint64_t id) noexcept
            : m_router(router), m_kind(kind), m_id(id)
        {
        }

        NotificationRouter *m_router{nullptr};
        SignalKind m_kind{SignalKind::TransferReady};
        uint64_t m_id{0};
    };

    explicit NotificationRouter(const ProtocolConfig &cfg);
    ~NotificationRouter();

    NotificationRouter(const NotificationRouter &) = delete;
    NotificationRouter &operator=(const NotificationRouter &) = delete;

    /**
     * @brief Registers the single outstanding waiter for `kind`.
     * @throws DuplicateWaiter if `kind` already has an unconsumed registration.
     */
    [[nodiscard]] WaitHandle register_waiter(SignalKind kind);

    /**
     * @brief Entry point for raw notification bytes from the transport. Resolves the
     *        matching waiter with the bytes, or drops them.
     */
    void on_notification(std::span<const uint8_t> bytes);

    /**
     * @brief Blocks until the handle's waiter is resolved or `timeout` expires.
     *        The registration is consumed in every case and the handle becomes invalid.
     * @return The notification bytes, or the WaitError that ended the wait.
     * @throws std::logic_error if the handle is not valid.
     */
    [[nodiscard]] utils::Result<Bytes, WaitError> await_signal(WaitHandle &handle,
                                                               std::chrono::milliseconds timeout);

    /// Withdraws a registration without waiting. No-op on an invalid handle.
    void release(WaitHandle &handle) noexcept;

    /// Resolves the waiter for `kind`, if any, with `reason`.
    void fail(SignalKind kind, WaitError reason);

    /// Resolves every outstanding waiter with `reason`.
    void fail_all(WaitError reason);

    [[nodiscard]] bool has_waiter(SignalKind kind) const;
    [[nodiscard]] size_t pending_count() const;
    /// Notifications discarded because no waiter wanted them.
    [[nodiscard]] size_t dropped_count() const;

  private:
    struct Entry
    {
        uint64_t id;
        bool resolved{false};
        Bytes payload;
        std::optional<WaitError> error;
    };

    void release_id(SignalKind kind, uint64_t id) noexcept;

    SignalClassifier m_classifier;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<SignalKind, Entry> m_waiters;
    uint64_t m_next_id{1};
    size_t m_dropped{0};
};

} // namespace plushlink::dlc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
