// tests/test_framework/shared_test_helpers.h
#pragma once

#include "pll_platform.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file shared_test_helpers.h
 * @brief File, environment and payload helpers shared by the test layers.
 */

namespace plushlink::tests::helper
{

namespace fs = std::filesystem;

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const fs::path &path, std::string &out);

/// Counts lines, optionally only those containing / not containing a substring.
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls a file until `expected` appears in it or `timeout` passes.
 */
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(5));

/// A fresh path under the temp directory, unique per process and call. Nothing is created.
fs::path unique_temp_path(const std::string &stem, const std::string &extension = "");

/// Deterministic payload of `size` bytes (value depends on index and seed).
std::vector<uint8_t> make_payload(size_t size, uint8_t seed = 0);

/**
 * @class ScopedEnv
 * @brief Sets (or unsets) an environment variable and restores the old value on scope exit.
 */
class ScopedEnv
{
  public:
    ScopedEnv(std::string name, std::optional<std::string> value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

  private:
    std::string name_;
    std::optional<std::string> previous_;
};

/**
 * @class TempFileGuard
 * @brief Removes the given paths (ignoring errors) when it goes out of scope.
 */
class TempFileGuard
{
  public:
    TempFileGuard() = default;
    ~TempFileGuard();
    TempFileGuard(const TempFileGuard &) = delete;
    TempFileGuard &operator=(const TempFileGuard &) = delete;

    fs::path add(fs::path p);

  private:
    std::vector<fs::path> paths_;
};

} // namespace plushlink::tests::helper
