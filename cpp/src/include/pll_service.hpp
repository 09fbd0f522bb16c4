#pragma once
/**
 * @file pll_service.hpp
 * @brief Layer 2: Service modules built on pll_base.
 *
 * Provides lifecycle management, logging, the callback dispatcher, layered configuration
 * and the persisted known-device cache.
 */
#include "pll_base.hpp"

#include "utils/callback_dispatcher.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/link_config.hpp"
#include "utils/debounced_json_store.hpp"
#include "utils/known_device_cache.hpp"
