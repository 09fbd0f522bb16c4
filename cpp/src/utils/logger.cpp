/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous command-queue logger.
 ******************************************************************************/

#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "pll_platform.hpp"
#include "utils/callback_dispatcher.hpp"
#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"
#if defined(PLUSHLINK_IS_POSIX)
#include "utils/logger_sinks/syslog_sink.hpp"
#endif

namespace plushlink::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

namespace
{

LogMessage make_message(Logger::Level lvl, std::string &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

// Used while the worker is not running: the message goes straight to stderr.
void write_direct(Logger::Level lvl, std::string &&body) noexcept
{
    try
    {
        fmt::print(stderr, "{}", Sink::format_logmsg(make_message(lvl, std::move(body))));
    }
    catch (const std::exception &)
    {
        // stderr itself failed; there is nowhere left to report to.
    }
}

} // namespace

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command =
    std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                 SetErrorCallbackCommand>;

struct LoggerImpl
{
    LoggerImpl() : sink_(std::make_unique<ConsoleSink>()) {}

    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void shutdown();
    void report_error(const std::string &message);

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    std::unique_ptr<CallbackDispatcher> callback_dispatcher_;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex lifecycle_mutex_;
    size_t max_queue_size_{10000};
    std::atomic<size_t> messages_dropped_{0};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    bool shutdown_requested_{false}; // guarded by queue_mutex_
};

// Every command that carries a promise is resolved with `false` when it cannot be queued,
// so callers blocked on the future never hang.
static void reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, SetSinkCommand> || std::is_same_v<T, FlushCommand> ||
                          std::is_same_v<T, SetErrorCallbackCommand>)
            {
                if (arg.promise)
                    arg.promise->set_value(false);
            }
        },
        cmd);
}

void LoggerImpl::start_worker()
{
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (worker_thread_.joinable())
        return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_requested_ = false;
    }
    callback_dispatcher_ = std::make_unique<CallbackDispatcher>();
    worker_thread_ = std::thread(&LoggerImpl::worker_loop, this);
}

bool LoggerImpl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_)
        {
            reject_command(cmd);
            return false;
        }
        if (queue_.size() >= max_queue_size_ && std::holds_alternative<LogMessage>(cmd))
        {
            messages_dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void LoggerImpl::report_error(const std::string &message)
{
    if (error_callback_ && callback_dispatcher_)
    {
        auto cb = error_callback_;
        callback_dispatcher_->post([cb, message]() { cb(message); });
    }
    else
    {
        fmt::print(stderr, "[PLL_Logger] {}\n", message);
    }
}

void LoggerImpl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_; });
            local_queue.swap(queue_);
            stopping = shutdown_requested_;
        }

        if (const size_t dropped = messages_dropped_.exchange(0, std::memory_order_relaxed);
            dropped > 0)
        {
            local_queue.insert(local_queue.begin(),
                               make_message(Logger::Level::L_WARNING,
                                            fmt::format("Logger queue overflow: {} messages "
                                                        "dropped.",
                                                        dropped)));
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&cmd))
                {
                    if (sink_ &&
                        msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg);
                    }
                    continue;
                }

                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            const std::string old_desc = sink_ ? sink_->description() : "null";
                            if (sink_)
                            {
                                sink_->write(make_message(
                                    Logger::Level::L_SYSTEM,
                                    fmt::format("Switching log sink to: {}",
                                                arg.new_sink->description())));
                                sink_->flush();
                            }
                            sink_ = std::move(arg.new_sink);
                            sink_->write(make_message(
                                Logger::Level::L_SYSTEM,
                                fmt::format("Log sink switched from: {}", old_desc)));
                            arg.promise->set_value(true);
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            if (sink_)
                                sink_->flush();
                            arg.promise->set_value(true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            arg.promise->set_value(true);
                        }
                    },
                    cmd);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }
        local_queue.clear();

        if (stopping)
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!queue_.empty())
                continue;
            break;
        }
    }

    try
    {
        if (sink_)
        {
            sink_->write(make_message(Logger::Level::L_SYSTEM, "Logger is shutting down."));
            sink_->flush();
        }
    }
    catch (const std::exception &e)
    {
        report_error(fmt::format("Logger worker error during shutdown: {}", e.what()));
    }
}

void LoggerImpl::shutdown()
{
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_)
            return;
        shutdown_requested_ = true;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
        worker_thread_.join();
    if (callback_dispatcher_)
        callback_dispatcher_->shutdown();
}

// --- Logger public API ---

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}
Logger::~Logger()
{
    if (pImpl)
        pImpl->shutdown();
}

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Initialized;
}

namespace
{
// Builds a sink on the caller's thread so construction errors surface here, then hands it to
// the worker and waits until the swap has happened.
template <typename MakeSink>
bool install_sink(LoggerImpl &impl, const char *what, MakeSink &&make_sink)
{
    if (!Logger::lifecycle_initialized())
        return false;
    try
    {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        impl.enqueue_command(SetSinkCommand{make_sink(), promise});
        return future.get();
    }
    catch (const std::exception &e)
    {
        impl.enqueue_command(
            SinkCreationErrorCommand{fmt::format("Failed to create {}: {}", what, e.what())});
    }
    return false;
}
} // namespace

bool Logger::set_console()
{
    return install_sink(*pImpl, "ConsoleSink", [] { return std::make_unique<ConsoleSink>(); });
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    return install_sink(*pImpl, "FileSink", [&]
                        { return std::make_unique<FileSink>(utf8_path, use_flock); });
}

bool Logger::set_syslog(const char *ident, int option, int facility)
{
#if defined(PLUSHLINK_IS_POSIX)
    return install_sink(*pImpl, "SyslogSink", [&]
                        { return std::make_unique<SyslogSink>(ident, option, facility); });
#else
    (void)ident;
    (void)option;
    (void)facility;
    return false;
#endif
}

void Logger::shutdown()
{
    if (pImpl)
        pImpl->shutdown();
}

void Logger::flush()
{
    if (!lifecycle_initialized())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!lifecycle_initialized())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    if (name == "trace")
        return Level::L_TRACE;
    if (name == "debug")
        return Level::L_DEBUG;
    if (name == "info")
        return Level::L_INFO;
    if (name == "warn" || name == "warning")
        return Level::L_WARNING;
    if (name == "error")
        return Level::L_ERROR;
    if (name == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
    {
        write_direct(lvl, std::move(body));
        return;
    }
    try
    {
        // A full queue counts the drop; a racing shutdown discards the message.
        pImpl->enqueue_command(make_message(lvl, std::move(body)));
    }
    catch (const std::bad_alloc &)
    {
        pImpl->messages_dropped_.fetch_add(1, std::memory_order_relaxed);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("plushlink::utils::Logger");
    module.set_startup(
        [](const char *)
        {
            Logger::instance().pImpl->start_worker();
            g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
        });
    module.set_shutdown(
        [](const char *)
        {
            LoggerState expected = LoggerState::Initialized;
            if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                                       std::memory_order_acq_rel))
            {
                Logger::instance().shutdown();
                g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            }
        },
        5000 /*ms timeout*/);
    return module;
}

} // namespace plushlink::utils
