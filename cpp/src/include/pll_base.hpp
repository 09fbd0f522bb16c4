#pragma once
/**
 * @file pll_base.hpp
 * @brief Layer 1: Basic modules built on pll_platform.
 *
 * Provides format_tools, the Result type, scope_guard and module_def for lifecycle module
 * registration. Include this when you need formatting, result types or basic RAII guards.
 */
#include "pll_platform.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
#include "utils/result.hpp"
#include "utils/scope_guard.hpp"
#include "utils/module_def.hpp"
