#pragma once
/**
 * @file pll_dlc.hpp
 * @brief Layer 3: DLC transfer subsystem built on pll_service.
 *
 * Include this to drive uploads and slot lifecycle commands against a Transport.
 * The in-process SimulatedDevice lives in dlc/simulated_device.hpp (plushlink_simulator).
 */
#include "pll_service.hpp"

#include "dlc/transfer_error.hpp"
#include "dlc/protocol.hpp"
#include "dlc/transport.hpp"
#include "dlc/cancellation.hpp"
#include "dlc/notification_router.hpp"
#include "dlc/slot_registry.hpp"
#include "dlc/chunk_scheduler.hpp"
#include "dlc/transfer_session.hpp"
#include "dlc/slot_lifecycle_controller.hpp"
#include "dlc/dlc_controller.hpp"
