#include "utils/callback_dispatcher.hpp"

#include <exception>

#include <fmt/core.h>

namespace plushlink::utils
{

CallbackDispatcher::CallbackDispatcher()
{
    worker_ = std::thread([this] { this->run(); });
}

CallbackDispatcher::~CallbackDispatcher()
{
    shutdown();
}

void CallbackDispatcher::post(std::function<void()> fn)
{
    if (shutdown_requested_.load(std::memory_order_relaxed))
        return;
    {
        std::lock_guard<std::mutex> lg(mutex_);
        queue_.push_back(std::move(fn));
    }
    cv_.notify_one();
}

void CallbackDispatcher::drain()
{
    std::unique_lock<std::mutex> ul(mutex_);
    idle_cv_.wait(ul, [this] { return queue_.empty() && !busy_; });
}

void CallbackDispatcher::shutdown()
{
    if (shutdown_requested_.exchange(true))
    {
        return;
    }
    cv_.notify_one();
    if (worker_.joinable())
    {
        worker_.join();
    }
    idle_cv_.notify_all();
}

void CallbackDispatcher::run()
{
    for (;;)
    {
        std::function<void()> fn;
        {
            std::unique_lock<std::mutex> ul(mutex_);
            busy_ = false;
            if (queue_.empty())
            {
                idle_cv_.notify_all();
            }
            cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
            if (queue_.empty())
            {
                return; // shutdown requested and nothing left to run
            }
            fn = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }
        // A throwing callback must not terminate the dispatcher thread; report it where the
        // logger cannot recurse into itself.
        try
        {
            fn();
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "[plushlink::CallbackDispatcher] callback threw: {}\n", e.what());
        }
        catch (...)
        {
            fmt::print(stderr, "[plushlink::CallbackDispatcher] callback threw a non-std exception\n");
        }
    }
}

} // namespace plushlink::utils
