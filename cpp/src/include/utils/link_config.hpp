#pragma once

/**
 * @file link_config.hpp
 * @brief LinkConfig: layered JSON configuration for the DLC link and its collaborators.
 *
 * ## Config loading, layered (priority low → high)
 *
 *  1. Built-in C++ defaults (the member initializers below)
 *  2. A JSON file: the explicit path passed to load(), else `PLUSHLINK_CONFIG_FILE`
 *  3. `PLUSHLINK_LOG_LEVEL` / `PLUSHLINK_CACHE_FILE` env var overrides
 *
 * A missing file is not an error (defaults are used and a warning is logged). A file that
 * is not valid JSON, or a known key with the wrong type or an out-of-range value, raises
 * std::invalid_argument naming the key. Unknown keys are ignored.
 *
 * @code
 *   {
 *     "logging":  { "level": "debug", "file": "plushlink.log" },
 *     "dlc":      { "slot_count": 4, "chunk_size": 20, "ack_mode": false,
 *                   "timeouts": { "ready_ms": 3000, "completion_ms": 10000 } },
 *     "protocol": { "ready_prefix": [36, 2], "trigger_opcode": 19 },
 *     "cache":    { "path": "known_devices.json", "debounce_ms": 1000 }
 *   }
 * @endcode
 */

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "dlc/dlc_controller.hpp"
#include "plushlink_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace plushlink
{

class PLUSHLINK_UTILS_EXPORT LinkConfig
{
  public:
    /// Environment variable naming the config file when load() gets no explicit path.
    static constexpr const char *kConfigFileEnv = "PLUSHLINK_CONFIG_FILE";
    static constexpr const char *kLogLevelEnv = "PLUSHLINK_LOG_LEVEL";
    static constexpr const char *kCacheFileEnv = "PLUSHLINK_CACHE_FILE";

    /**
     * @brief Runs the full layered load.
     * @param explicit_path Config file to read; when empty `PLUSHLINK_CONFIG_FILE` is tried.
     * @throws std::invalid_argument on malformed JSON or a badly typed key.
     */
    static LinkConfig load(const std::filesystem::path &explicit_path = {});

    /// Built-in defaults with `j` applied on top. No file or environment access.
    static LinkConfig from_json(const nlohmann::json &j);

    /// Applies the keys present in `j` over the current values.
    void merge_json(const nlohmann::json &j);

    /// Applies the `PLUSHLINK_LOG_LEVEL` and `PLUSHLINK_CACHE_FILE` overrides.
    void apply_env_overrides();

    /// The complete effective configuration, in the same shape load() reads.
    [[nodiscard]] nlohmann::json to_json() const;

    /// Options for a DlcController built from this config.
    [[nodiscard]] dlc::DlcOptions dlc_options() const { return options; }

    /**
     * @brief Pushes the logging section into the Logger (level and, if set, a file sink).
     * @return false if the file sink could not be installed.
     */
    bool apply_logging() const;

    // --- logging ---
    std::string log_level{"info"};
    std::filesystem::path log_file;

    // --- dlc + protocol ---
    dlc::DlcOptions options;

    // --- cache ---
    std::filesystem::path cache_path{"known_devices.json"};
    std::chrono::milliseconds cache_debounce{1000};

    /// File the config was read from; empty when only defaults and env were used.
    std::filesystem::path source_path;
};

} // namespace plushlink

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
