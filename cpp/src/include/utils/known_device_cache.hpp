#pragma once
/**
 * @file known_device_cache.hpp
 * @brief Persistent record of the toys this host has connected to.
 *
 * Entries are keyed by the device's Bluetooth address. Every mutation schedules a
 * debounced save through a DebouncedJsonStore; call flush() before exit to make sure the
 * last change is on disk. On-disk layout:
 *
 * @code
 *   { "devices": { "AA:BB:CC:DD:EE:FF": { "address": "AA:BB:CC:DD:EE:FF",
 *                                          "device_name": "Furby", "name": "Dah-Noh",
 *                                          "name_id": 7, "firmware_revision": null,
 *                                          "last_seen": 1760000000.25 } } }
 * @endcode
 */
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "plushlink_utils_export.h"
#include "utils/debounced_json_store.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace plushlink::utils
{

struct KnownDevice
{
    std::string address;
    std::optional<std::string> device_name;
    std::optional<std::string> name;
    std::optional<int> name_id;
    std::optional<std::string> firmware_revision;
    std::chrono::system_clock::time_point last_seen{};
};

/// Fields to change in add_or_update(). Unset fields keep their stored value.
struct DeviceUpdate
{
    std::optional<std::string> device_name;
    std::optional<std::string> name;
    std::optional<int> name_id;
    std::optional<std::string> firmware_revision;
};

class PLUSHLINK_UTILS_EXPORT KnownDeviceCache
{
  public:
    /// Loads `path` (a missing or corrupt file starts an empty cache).
    explicit KnownDeviceCache(std::filesystem::path path,
                              std::chrono::milliseconds save_delay = std::chrono::milliseconds(1000));
    ~KnownDeviceCache();

    KnownDeviceCache(const KnownDeviceCache &) = delete;
    KnownDeviceCache &operator=(const KnownDeviceCache &) = delete;

    /// Creates or updates the entry for `address`; `last_seen` is always refreshed.
    KnownDevice add_or_update(const std::string &address, const DeviceUpdate &update = {});

    [[nodiscard]] std::optional<KnownDevice> get(const std::string &address) const;

    /// All entries, most recently seen first.
    [[nodiscard]] std::vector<KnownDevice> get_all() const;

    /// @return false if `address` was not cached.
    bool remove(const std::string &address);
    void clear();
    [[nodiscard]] std::vector<std::string> addresses() const;

    /// Sets name and name_id of a known device. @return false (and logs) if unknown.
    bool update_name(const std::string &address, const std::string &name, int name_id);

    [[nodiscard]] std::optional<KnownDevice> most_recent() const;
    [[nodiscard]] size_t size() const;

    /// Writes the current contents now. @return false if the write failed.
    bool flush();

  private:
    void load_locked();
    void schedule_save_locked();

    mutable std::mutex m_mutex;
    std::map<std::string, KnownDevice> m_devices;
    DebouncedJsonStore m_store;
};

} // namespace plushlink::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
