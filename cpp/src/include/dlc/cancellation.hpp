#pragma once
/**
 * @file cancellation.hpp
 * @brief One-way cancel flag that also interrupts pacing delays.
 */
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace plushlink::dlc
{

class CancellationToken
{
  public:
    void cancel()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
        }
        m_cv.notify_all();
    }

    [[nodiscard]] bool is_cancelled() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_cancelled;
    }

    /// Sleeps for `delay` unless cancelled first. Returns true if cancelled.
    bool wait_for(std::chrono::milliseconds delay) const
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, delay, [this] { return m_cancelled; });
    }

  private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    bool m_cancelled{false};
};

} // namespace plushlink::dlc
