#include <algorithm>

#include "utils/known_device_cache.hpp"
#include "utils/logger.hpp"

namespace plushlink::utils
{

using nlohmann::json;

namespace
{

double to_epoch_seconds(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_seconds(double s)
{
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(s)));
}

template <typename T> json optional_to_json(const std::optional<T> &v)
{
    return v ? json(*v) : json(nullptr);
}

template <typename T> std::optional<T> optional_from_json(const json &obj, const char *key)
{
    if (!obj.contains(key) || obj.at(key).is_null())
        return std::nullopt;
    return obj.at(key).get<T>();
}

json device_to_json(const KnownDevice &d)
{
    return json{{"address", d.address},
                {"device_name", optional_to_json(d.device_name)},
                {"name", optional_to_json(d.name)},
                {"name_id", optional_to_json(d.name_id)},
                {"firmware_revision", optional_to_json(d.firmware_revision)},
                {"last_seen", to_epoch_seconds(d.last_seen)}};
}

KnownDevice device_from_json(const std::string &key, const json &j)
{
    KnownDevice d;
    d.address = j.value("address", key);
    d.device_name = optional_from_json<std::string>(j, "device_name");
    d.name = optional_from_json<std::string>(j, "name");
    d.name_id = optional_from_json<int>(j, "name_id");
    d.firmware_revision = optional_from_json<std::string>(j, "firmware_revision");
    d.last_seen = from_epoch_seconds(j.value("last_seen", 0.0));
    return d;
}

} // namespace

KnownDeviceCache::KnownDeviceCache(std::filesystem::path path,
                                   std::chrono::milliseconds save_delay)
    : m_store(std::move(path), save_delay)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    load_locked();
}

KnownDeviceCache::~KnownDeviceCache() = default;

void KnownDeviceCache::load_locked()
{
    const json doc = m_store.load();
    // Files written by the older pairing tool keep the table under "furbies"; the next save
    // rewrites them under "devices".
    const char *table_key = doc.contains("devices") ? "devices" : "furbies";
    if (!doc.contains(table_key) || !doc.at(table_key).is_object())
        return;

    for (const auto &[key, entry] : doc.at(table_key).items())
    {
        try
        {
            m_devices.emplace(key, device_from_json(key, entry));
        }
        catch (const json::exception &e)
        {
            LOGGER_WARN("KnownDeviceCache: skipping malformed entry '{}': {}", key, e.what());
        }
    }
    LOGGER_INFO("KnownDeviceCache: loaded {} known device(s) from '{}'", m_devices.size(),
                m_store.path().string());
}

void KnownDeviceCache::schedule_save_locked()
{
    json devices = json::object();
    for (const auto &[addr, d] : m_devices)
        devices[addr] = device_to_json(d);
    m_store.persist(json{{"devices", std::move(devices)}});
}

KnownDevice KnownDeviceCache::add_or_update(const std::string &address,
                                            const DeviceUpdate &update)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto [it, inserted] = m_devices.try_emplace(address);
    KnownDevice &d = it->second;
    if (inserted)
    {
        d.address = address;
        LOGGER_INFO("KnownDeviceCache: adding {}", address);
    }
    else
    {
        LOGGER_DEBUG("KnownDeviceCache: updating {}", address);
    }

    if (update.device_name)
        d.device_name = update.device_name;
    if (update.name)
        d.name = update.name;
    if (update.name_id)
        d.name_id = update.name_id;
    if (update.firmware_revision)
        d.firmware_revision = update.firmware_revision;
    d.last_seen = std::chrono::system_clock::now();

    schedule_save_locked();
    return d;
}

std::optional<KnownDevice> KnownDeviceCache::get(const std::string &address) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(address);
    if (it == m_devices.end())
        return std::nullopt;
    return it->second;
}

std::vector<KnownDevice> KnownDeviceCache::get_all() const
{
    std::vector<KnownDevice> out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        out.reserve(m_devices.size());
        for (const auto &[addr, d] : m_devices)
            out.push_back(d);
    }
    std::stable_sort(out.begin(), out.end(), [](const KnownDevice &a, const KnownDevice &b)
                     { return a.last_seen > b.last_seen; });
    return out;
}

bool KnownDeviceCache::remove(const std::string &address)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_devices.erase(address) == 0)
        return false;
    schedule_save_locked();
    LOGGER_INFO("KnownDeviceCache: removed {}", address);
    return true;
}

void KnownDeviceCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const size_t count = m_devices.size();
    m_devices.clear();
    schedule_save_locked();
    LOGGER_INFO("KnownDeviceCache: cleared ({} entries removed)", count);
}

std::vector<std::string> KnownDeviceCache::addresses() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    out.reserve(m_devices.size());
    for (const auto &[addr, d] : m_devices)
        out.push_back(addr);
    return out;
}

bool KnownDeviceCache::update_name(const std::string &address, const std::string &name,
                                   int name_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(address);
    if (it == m_devices.end())
    {
        LOGGER_WARN("KnownDeviceCache: cannot rename unknown device {}", address);
        return false;
    }
    it->second.name = name;
    it->second.name_id = name_id;
    it->second.last_seen = std::chrono::system_clock::now();
    schedule_save_locked();
    LOGGER_INFO("KnownDeviceCache: {} is now '{}' (id {})", address, name, name_id);
    return true;
}

std::optional<KnownDevice> KnownDeviceCache::most_recent() const
{
    auto all = get_all();
    if (all.empty())
        return std::nullopt;
    return all.front();
}

size_t KnownDeviceCache::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_devices.size();
}

bool KnownDeviceCache::flush()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        schedule_save_locked();
    }
    return m_store.flush();
}

} // namespace plushlink::utils
