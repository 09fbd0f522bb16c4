#pragma once
/**
 * @file callback_dispatcher.hpp
 * @brief Runs user-provided callbacks on a dedicated worker thread.
 *
 * Used wherever a producer must hand work to user code without ever blocking on it:
 * the Logger's write-error callback and the ChunkScheduler's progress callback.
 * Callbacks run in the order they were posted.
 */
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "plushlink_utils_export.h"

namespace plushlink::utils
{

class PLUSHLINK_UTILS_EXPORT CallbackDispatcher
{
  public:
    CallbackDispatcher();
    ~CallbackDispatcher();

    CallbackDispatcher(const CallbackDispatcher &) = delete;
    CallbackDispatcher &operator=(const CallbackDispatcher &) = delete;

    /**
     * @brief Queues `fn` for execution on the worker thread. Never blocks on `fn`.
     * Posting after shutdown() is a silent no-op.
     */
    void post(std::function<void()> fn);

    /**
     * @brief Blocks until every callback posted before this call has run.
     */
    void drain();

    /**
     * @brief Runs the remaining queue, then stops and joins the worker. Idempotent.
     */
    void shutdown();

  private:
    void run();

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    bool busy_{false};
    std::thread worker_;
    std::atomic<bool> shutdown_requested_{false};
};

} // namespace plushlink::utils
