#pragma once
/**
 * @file debounced_json_store.hpp
 * @brief Persists a JSON document to disk, coalescing bursts of updates into one write.
 *
 * persist() replaces the pending document and restarts the delay; a background thread
 * writes it once the delay passes without another persist(). flush() writes the pending
 * document on the caller's thread right away. Every write goes to `<path>.tmp` first and
 * is renamed over `<path>`, so a reader never sees a half-written file.
 */
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <thread>

#include <nlohmann/json.hpp>

#include "plushlink_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace plushlink::utils
{

class PLUSHLINK_UTILS_EXPORT DebouncedJsonStore
{
  public:
    DebouncedJsonStore(std::filesystem::path path, std::chrono::milliseconds delay);

    /// Writes any pending document, then stops the background thread.
    ~DebouncedJsonStore();

    DebouncedJsonStore(const DebouncedJsonStore &) = delete;
    DebouncedJsonStore &operator=(const DebouncedJsonStore &) = delete;

    /// Stores `doc` as the pending document and (re)arms the delay.
    void persist(nlohmann::json doc);

    /**
     * @brief Cancels the pending delay and writes synchronously.
     * @return true if nothing was pending or the write succeeded.
     */
    bool flush();

    /// Reads the file. Missing, unreadable or non-object content yields an empty object.
    [[nodiscard]] nlohmann::json load() const;

    [[nodiscard]] bool has_pending() const;
    /// Number of successful writes so far.
    [[nodiscard]] size_t write_count() const;
    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

  private:
    void worker_loop();
    bool write_now(const nlohmann::json &doc);

    std::filesystem::path m_path;
    std::chrono::milliseconds m_delay;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::optional<nlohmann::json> m_pending;
    std::chrono::steady_clock::time_point m_deadline;
    bool m_stop{false};
    size_t m_writes{0};
    // One write at a time; an older document never lands after a newer one.
    bool m_in_flight{false};
    std::thread m_worker;
};

} // namespace plushlink::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
