#include <fmt/format.h>

#include "dlc/notification_router.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

namespace plushlink::dlc
{

DuplicateWaiter::DuplicateWaiter(SignalKind kind)
    : std::logic_error(fmt::format("a waiter for {} is already registered", to_string(kind))),
      m_kind(kind)
{
}

// ---------------------------------------------------------------------------
// WaitHandle
// ---------------------------------------------------------------------------

NotificationRouter::WaitHandle::~WaitHandle()
{
    if (m_router)
        m_router->release(*this);
}

NotificationRouter::WaitHandle::WaitHandle(WaitHandle &&other) noexcept
    : m_router(std::exchange(other.m_router, nullptr)), m_kind(other.m_kind), m_id(other.m_id)
{
}

NotificationRouter::WaitHandle &
NotificationRouter::WaitHandle::operator=(WaitHandle &&other) noexcept
{
    if (this != &other)
    {
        if (m_router)
            m_router->release(*this);
        m_router = std::exchange(other.m_router, nullptr);
        m_kind = other.m_kind;
        m_id = other.m_id;
    }
    return *this;
}

// ---------------------------------------------------------------------------
// NotificationRouter
// ---------------------------------------------------------------------------

NotificationRouter::NotificationRouter(const ProtocolConfig &cfg) : m_classifier(cfg) {}

NotificationRouter::~NotificationRouter()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_waiters.empty())
    {
        LOGGER_WARN("NotificationRouter destroyed with {} outstanding waiter(s)",
                    m_waiters.size());
    }
}

NotificationRouter::WaitHandle NotificationRouter::register_waiter(SignalKind kind)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_waiters.count(kind) != 0)
        throw DuplicateWaiter(kind);
    const uint64_t id = m_next_id++;
    m_waiters.emplace(kind, Entry{.id = id});
    LOGGER_TRACE("router: waiter #{} registered for {}", id, to_string(kind));
    return WaitHandle(this, kind, id);
}

void NotificationRouter::on_notification(std::span<const uint8_t> bytes)
{
    const auto kind = m_classifier.classify(bytes);
    if (!kind)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_dropped;
        LOGGER_DEBUG("router: dropped unclassified notification [{}]",
                     format_tools::hex_bytes(bytes));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_waiters.find(*kind);
        if (it == m_waiters.end() || it->second.resolved)
        {
            ++m_dropped;
            LOGGER_DEBUG("router: dropped {} with no outstanding waiter [{}]", to_string(*kind),
                         format_tools::hex_bytes(bytes));
            return;
        }
        it->second.resolved = true;
        it->second.payload.assign(bytes.begin(), bytes.end());
        LOGGER_TRACE("router: {} resolved waiter #{}", to_string(*kind), it->second.id);
    }
    m_cv.notify_all();
}

utils::Result<Bytes, WaitError> NotificationRouter::await_signal(WaitHandle &handle,
                                                                 std::chrono::milliseconds timeout)
{
    if (handle.m_router != this)
        throw std::logic_error("await_signal called with a handle that is not registered here");

    const SignalKind kind = handle.m_kind;
    const uint64_t id = handle.m_id;
    handle.m_router = nullptr; // consumed below in every path

    std::unique_lock<std::mutex> lock(m_mutex);
    auto is_done = [&]
    {
        auto it = m_waiters.find(kind);
        return it == m_waiters.end() || it->second.id != id || it->second.resolved;
    };
    m_cv.wait_for(lock, timeout, is_done);

    auto it = m_waiters.find(kind);
    if (it == m_waiters.end() || it->second.id != id)
    {
        // Released from another thread while we waited.
        return utils::Result<Bytes, WaitError>::error(WaitError::Cancelled);
    }
    Entry entry = std::move(it->second);
    m_waiters.erase(it);

    if (!entry.resolved)
    {
        LOGGER_DEBUG("router: wait for {} timed out after {} ms", to_string(kind),
                     timeout.count());
        return utils::Result<Bytes, WaitError>::error(WaitError::TimedOut);
    }
    if (entry.error)
        return utils::Result<Bytes, WaitError>::error(*entry.error);
    return utils::Result<Bytes, WaitError>::ok(std::move(entry.payload));
}

void NotificationRouter::release(WaitHandle &handle) noexcept
{
    if (handle.m_router != this)
        return;
    handle.m_router = nullptr;
    release_id(handle.m_kind, handle.m_id);
}

void NotificationRouter::release_id(SignalKind kind, uint64_t id) noexcept
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_waiters.find(kind);
        if (it == m_waiters.end() || it->second.id != id)
            return;
        m_waiters.erase(it);
    }
    m_cv.notify_all();
}

void NotificationRouter::fail(SignalKind kind, WaitError reason)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_waiters.find(kind);
        if (it == m_waiters.end() || it->second.resolved)
            return;
        it->second.resolved = true;
        it->second.error = reason;
    }
    m_cv.notify_all();
}

void NotificationRouter::fail_all(WaitError reason)
{
    size_t failed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto &[kind, entry] : m_waiters)
        {
            if (!entry.resolved)
            {
                entry.resolved = true;
                entry.error = reason;
                ++failed;
            }
        }
    }
    if (failed > 0)
    {
        LOGGER_DEBUG("router: failed {} outstanding waiter(s)", failed);
        m_cv.notify_all();
    }
}

bool NotificationRouter::has_waiter(SignalKind kind) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waiters.count(kind) != 0;
}

size_t NotificationRouter::pending_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waiters.size();
}

size_t NotificationRouter::dropped_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

} // namespace plushlink::dlc
