/**
 * @file link_config.cpp
 * @brief LinkConfig layered loading.
 *
 * Config loading strategy (priority low → high):
 *  1. Built-in C++ defaults (member initializers)
 *  2. The explicit file, or PLUSHLINK_CONFIG_FILE when no explicit file is given
 *  3. PLUSHLINK_LOG_LEVEL / PLUSHLINK_CACHE_FILE process-level overrides
 */
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "utils/link_config.hpp"
#include "utils/logger.hpp"

namespace plushlink
{

namespace fs = std::filesystem;
using nlohmann::json;

namespace
{

[[noreturn]] void bad_key(const std::string &key, const char *expected)
{
    throw std::invalid_argument(
        fmt::format("config key '{}' has the wrong type or value: expected {}", key, expected));
}

bool is_non_negative_integer(const json &v)
{
    return v.is_number_unsigned() || (v.is_number_integer() && v.get<int64_t>() >= 0);
}

std::string join(const std::string &section, const char *key)
{
    return section.empty() ? std::string(key) : section + "." + key;
}

bool read_bool(const json &obj, const std::string &section, const char *key, bool &out)
{
    if (!obj.contains(key))
        return false;
    const auto &v = obj.at(key);
    if (!v.is_boolean())
        bad_key(join(section, key), "a boolean");
    out = v.get<bool>();
    return true;
}

bool read_uint(const json &obj, const std::string &section, const char *key, uint64_t max,
               uint64_t &out)
{
    if (!obj.contains(key))
        return false;
    const auto &v = obj.at(key);
    if (!is_non_negative_integer(v) || v.get<uint64_t>() > max)
        bad_key(join(section, key), fmt::format("an integer in [0, {}]", max).c_str());
    out = v.get<uint64_t>();
    return true;
}

void read_size(const json &obj, const std::string &section, const char *key, uint64_t max,
               size_t &out)
{
    uint64_t v = 0;
    if (read_uint(obj, section, key, max, v))
        out = static_cast<size_t>(v);
}

void read_byte(const json &obj, const std::string &section, const char *key, uint8_t &out)
{
    uint64_t v = 0;
    if (read_uint(obj, section, key, 0xFF, v))
        out = static_cast<uint8_t>(v);
}

void read_ms(const json &obj, const std::string &section, const char *key,
             std::chrono::milliseconds &out)
{
    uint64_t v = 0;
    if (read_uint(obj, section, key, 24ULL * 3600 * 1000, v))
        out = std::chrono::milliseconds(static_cast<int64_t>(v));
}

void read_string(const json &obj, const std::string &section, const char *key, std::string &out)
{
    if (!obj.contains(key))
        return;
    const auto &v = obj.at(key);
    if (!v.is_string())
        bad_key(join(section, key), "a string");
    out = v.get<std::string>();
}

void read_path(const json &obj, const std::string &section, const char *key, fs::path &out)
{
    std::string s;
    if (!obj.contains(key))
        return;
    read_string(obj, section, key, s);
    out = fs::path(s);
}

void read_prefix(const json &obj, const std::string &section, const char *key, dlc::Bytes &out)
{
    if (!obj.contains(key))
        return;
    const auto &v = obj.at(key);
    if (!v.is_array() || v.empty())
        bad_key(join(section, key), "a non-empty array of byte values");
    dlc::Bytes bytes;
    for (const auto &b : v)
    {
        if (!is_non_negative_integer(b) || b.get<uint64_t>() > 0xFF)
            bad_key(join(section, key), "a non-empty array of byte values");
        bytes.push_back(static_cast<uint8_t>(b.get<uint64_t>()));
    }
    out = std::move(bytes);
}

const json &section_of(const json &j, const char *name)
{
    static const json empty = json::object();
    if (!j.contains(name))
        return empty;
    const auto &s = j.at(name);
    if (!s.is_object())
        bad_key(name, "an object");
    return s;
}

json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return json{};
    json j = json::parse(f, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
    {
        throw std::invalid_argument(
            fmt::format("config file '{}' is not a JSON object", path.string()));
    }
    return j;
}

} // anonymous namespace

LinkConfig LinkConfig::from_json(const json &j)
{
    LinkConfig cfg;
    cfg.merge_json(j);
    return cfg;
}

void LinkConfig::merge_json(const json &j)
{
    if (!j.is_object())
        throw std::invalid_argument("config root must be a JSON object");

    const auto &logging = section_of(j, "logging");
    read_string(logging, "logging", "level", log_level);
    if (!utils::Logger::parse_level(log_level))
        bad_key("logging.level", "one of trace, debug, info, warn, error, system");
    read_path(logging, "logging", "file", log_file);

    const auto &d = section_of(j, "dlc");
    read_size(d, "dlc", "slot_count", 255, options.slot_count);
    if (options.slot_count == 0)
        bad_key("dlc.slot_count", "an integer in [1, 255]");
    read_size(d, "dlc", "max_payload_bytes", dlc::protocol::kMaxEncodableLength,
              options.session.max_payload_bytes);
    read_size(d, "dlc", "chunk_size", 0xFFFF, options.session.chunk_size);
    read_bool(d, "dlc", "ack_mode", options.session.ack_mode);
    read_ms(d, "dlc", "pacing_ms", options.session.pacing);

    if (d.contains("timeouts"))
    {
        const auto &t = d.at("timeouts");
        if (!t.is_object())
            bad_key("dlc.timeouts", "an object");
        const std::string s = "dlc.timeouts";
        read_ms(t, s, "ready_ms", options.session.ready_timeout);
        read_ms(t, s, "chunk_ack_ms", options.session.chunk_ack_timeout);
        read_ms(t, s, "completion_ms", options.session.completion_timeout);
        read_ms(t, s, "command_ack_ms", options.lifecycle.command_ack_timeout);
        read_ms(t, s, "status_ms", options.lifecycle.status_timeout);
    }

    const auto &p = section_of(j, "protocol");
    auto &proto = options.protocol;
    read_byte(p, "protocol", "start_transfer_opcode", proto.start_transfer_opcode);
    read_prefix(p, "protocol", "ready_prefix", proto.ready_prefix);
    read_prefix(p, "protocol", "complete_prefix", proto.complete_prefix);
    read_prefix(p, "protocol", "chunk_ack_prefix", proto.chunk_ack_prefix);
    read_byte(p, "protocol", "load_opcode", proto.load_opcode);
    read_byte(p, "protocol", "activate_opcode", proto.activate_opcode);
    read_byte(p, "protocol", "deactivate_opcode", proto.deactivate_opcode);
    read_byte(p, "protocol", "delete_opcode", proto.delete_opcode);
    read_byte(p, "protocol", "status_opcode", proto.status_opcode);
    read_byte(p, "protocol", "trigger_opcode", proto.trigger_opcode);
    read_byte(p, "protocol", "dlc_input_id", proto.dlc_input_id);

    const auto &c = section_of(j, "cache");
    read_path(c, "cache", "path", cache_path);
    read_ms(c, "cache", "debounce_ms", cache_debounce);
}

void LinkConfig::apply_env_overrides()
{
    if (const char *env = std::getenv(kLogLevelEnv))
    {
        if (!utils::Logger::parse_level(env))
        {
            throw std::invalid_argument(
                fmt::format("{}='{}' is not a log level", kLogLevelEnv, env));
        }
        log_level = env;
    }
    if (const char *env = std::getenv(kCacheFileEnv))
        cache_path = fs::path(env);
}

LinkConfig LinkConfig::load(const fs::path &explicit_path)
{
    LinkConfig cfg;

    fs::path file = explicit_path;
    if (file.empty())
    {
        if (const char *env = std::getenv(kConfigFileEnv))
            file = fs::path(env);
    }

    if (!file.empty())
    {
        json j = read_json_file(file);
        if (j.is_null())
        {
            LOGGER_WARN("LinkConfig: config file '{}' not readable, using defaults",
                        file.string());
        }
        else
        {
            LOGGER_INFO("LinkConfig: loading '{}'", file.string());
            cfg.merge_json(j);
            cfg.source_path = file;
        }
    }
    else
    {
        LOGGER_DEBUG("LinkConfig: no config file given, using built-in defaults");
    }

    cfg.apply_env_overrides();

    LOGGER_DEBUG("LinkConfig: log_level   = {}", cfg.log_level);
    LOGGER_DEBUG("LinkConfig: slot_count  = {}", cfg.options.slot_count);
    LOGGER_DEBUG("LinkConfig: chunk_size  = {}", cfg.options.session.chunk_size);
    LOGGER_DEBUG("LinkConfig: ack_mode    = {}", cfg.options.session.ack_mode);
    LOGGER_DEBUG("LinkConfig: cache_path  = {}", cfg.cache_path.string());
    return cfg;
}

json LinkConfig::to_json() const
{
    const auto &s = options.session;
    const auto &l = options.lifecycle;
    const auto &p = options.protocol;
    return json{
        {"logging", {{"level", log_level}, {"file", log_file.string()}}},
        {"dlc",
         {{"slot_count", options.slot_count},
          {"max_payload_bytes", s.max_payload_bytes},
          {"chunk_size", s.chunk_size},
          {"ack_mode", s.ack_mode},
          {"pacing_ms", s.pacing.count()},
          {"timeouts",
           {{"ready_ms", s.ready_timeout.count()},
            {"chunk_ack_ms", s.chunk_ack_timeout.count()},
            {"completion_ms", s.completion_timeout.count()},
            {"command_ack_ms", l.command_ack_timeout.count()},
            {"status_ms", l.status_timeout.count()}}}}},
        {"protocol",
         {{"start_transfer_opcode", p.start_transfer_opcode},
          {"ready_prefix", p.ready_prefix},
          {"complete_prefix", p.complete_prefix},
          {"chunk_ack_prefix", p.chunk_ack_prefix},
          {"load_opcode", p.load_opcode},
          {"activate_opcode", p.activate_opcode},
          {"deactivate_opcode", p.deactivate_opcode},
          {"delete_opcode", p.delete_opcode},
          {"status_opcode", p.status_opcode},
          {"trigger_opcode", p.trigger_opcode},
          {"dlc_input_id", p.dlc_input_id}}},
        {"cache", {{"path", cache_path.string()}, {"debounce_ms", cache_debounce.count()}}},
    };
}

bool LinkConfig::apply_logging() const
{
    auto &logger = utils::Logger::instance();
    if (auto lvl = utils::Logger::parse_level(log_level))
        logger.set_level(*lvl);
    if (log_file.empty())
        return true;
    if (!logger.set_logfile(log_file.string()))
    {
        LOGGER_ERROR("LinkConfig: could not open log file '{}'", log_file.string());
        return false;
    }
    return true;
}

} // namespace plushlink
