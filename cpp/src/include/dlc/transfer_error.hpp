#pragma once
/**
 * @file transfer_error.hpp
 * @brief Error taxonomy and slot state shared by every DLC component.
 */
#include <cstdint>
#include <vector>

#include "plushlink_utils_export.h"
#include "utils/result.hpp"

namespace plushlink::dlc
{

/**
 * @brief Typed outcome of a DLC operation. The Result detail code carries context:
 *        the byte offset for ChunkFailed, the command opcode for Unacknowledged and
 *        DeviceRejected.
 */
enum class TransferError
{
    // Validation: rejected before any device I/O.
    InvalidSlot,
    PayloadTooLarge,
    SlotBusy,
    SlotInUse,
    SlotNotUploaded,
    NoActiveSlot,
    // Timeouts: the device did not answer in time.
    NotReady,
    CompletionTimeout,
    Unacknowledged,
    // Link and delivery failures.
    TransportFailure,
    ChunkFailed,
    Cancelled,
    DeviceRejected,
};

PLUSHLINK_UTILS_EXPORT const char *to_string(TransferError err) noexcept;

/// Lifecycle state of one slot. Values match the device's status reply.
enum class SlotState : uint8_t
{
    Empty = 0,
    Uploading = 1,
    Uploaded = 2,
    Active = 3,
};

PLUSHLINK_UTILS_EXPORT const char *to_string(SlotState state) noexcept;

/// Read-only view of every slot, indexed by slot number.
using SlotSnapshot = std::vector<SlotState>;

template <typename T> using DlcResult = utils::Result<T, TransferError>;
using DlcStatus = utils::Status<TransferError>;

} // namespace plushlink::dlc
