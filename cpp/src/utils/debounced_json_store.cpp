#include <fstream>
#include <string>
#include <system_error>

#include "utils/debounced_json_store.hpp"
#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"

namespace plushlink::utils
{

namespace fs = std::filesystem;

DebouncedJsonStore::DebouncedJsonStore(fs::path path, std::chrono::milliseconds delay)
    : m_path(std::move(path)), m_delay(delay)
{
    m_worker = std::thread(&DebouncedJsonStore::worker_loop, this);
}

DebouncedJsonStore::~DebouncedJsonStore()
{
    (void)flush();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv.notify_all();
    if (m_worker.joinable())
        m_worker.join();
}

void DebouncedJsonStore::persist(nlohmann::json doc)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending = std::move(doc);
        m_deadline = std::chrono::steady_clock::now() + m_delay;
    }
    m_cv.notify_all();
}

bool DebouncedJsonStore::flush()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return !m_in_flight; });
    std::optional<nlohmann::json> doc;
    doc.swap(m_pending);
    if (!doc)
        return true;
    m_in_flight = true;
    lock.unlock();
    auto release = basics::make_scope_guard(
        [this]() noexcept
        {
            {
                std::lock_guard<std::mutex> relock(m_mutex);
                m_in_flight = false;
            }
            m_cv.notify_all();
        });

    return write_now(*doc);
}

void DebouncedJsonStore::worker_loop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stop)
    {
        if (!m_pending || m_in_flight)
        {
            m_cv.wait(lock, [this] { return m_stop || (m_pending.has_value() && !m_in_flight); });
            continue;
        }
        // A persist() during the wait moves the deadline; loop and wait again.
        const auto deadline = m_deadline;
        if (m_cv.wait_until(lock, deadline, [this, deadline]
                            { return m_stop || !m_pending || m_deadline != deadline; }))
        {
            continue;
        }
        if (m_in_flight)
            continue;

        nlohmann::json doc = std::move(*m_pending);
        m_pending.reset();
        m_in_flight = true;
        lock.unlock();
        {
            auto relock = basics::make_scope_guard(
                [&]() noexcept
                {
                    lock.lock();
                    m_in_flight = false;
                    m_cv.notify_all();
                });
            if (!write_now(doc))
                LOGGER_WARN("DebouncedJsonStore: deferred write of '{}' dropped", m_path.string());
        }
    }
}

bool DebouncedJsonStore::write_now(const nlohmann::json &doc)
{
    std::error_code ec;
    if (m_path.has_parent_path())
    {
        fs::create_directories(m_path.parent_path(), ec);
        if (ec)
        {
            LOGGER_ERROR("DebouncedJsonStore: cannot create '{}': {}",
                         m_path.parent_path().string(), ec.message());
            return false;
        }
    }

    // Strings from the radio are not guaranteed to be UTF-8; invalid bytes become U+FFFD.
    std::string text;
    try
    {
        text = doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_ERROR("DebouncedJsonStore: cannot serialize '{}': {}", m_path.string(), e.what());
        return false;
    }

    fs::path tmp = m_path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open())
        {
            LOGGER_ERROR("DebouncedJsonStore: cannot open '{}' for writing", tmp.string());
            return false;
        }
        out << text;
        out.flush();
        if (!out)
        {
            LOGGER_ERROR("DebouncedJsonStore: write to '{}' failed", tmp.string());
            return false;
        }
    }

    fs::rename(tmp, m_path, ec);
    if (ec)
    {
        LOGGER_ERROR("DebouncedJsonStore: rename '{}' -> '{}' failed: {}", tmp.string(),
                     m_path.string(), ec.message());
        fs::remove(tmp, ec);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_writes;
    }
    LOGGER_DEBUG("DebouncedJsonStore: wrote '{}'", m_path.string());
    return true;
}

nlohmann::json DebouncedJsonStore::load() const
{
    std::error_code ec;
    if (!fs::exists(m_path, ec))
    {
        LOGGER_INFO("DebouncedJsonStore: '{}' not found, starting empty", m_path.string());
        return nlohmann::json::object();
    }
    std::ifstream in(m_path);
    if (!in.is_open())
    {
        LOGGER_ERROR("DebouncedJsonStore: cannot open '{}', starting empty", m_path.string());
        return nlohmann::json::object();
    }
    nlohmann::json j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
    {
        LOGGER_WARN("DebouncedJsonStore: '{}' is not a JSON object, starting empty",
                    m_path.string());
        return nlohmann::json::object();
    }
    return j;
}

bool DebouncedJsonStore::has_pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.has_value();
}

size_t DebouncedJsonStore::write_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_writes;
}

} // namespace plushlink::utils
