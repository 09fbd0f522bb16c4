#pragma once
/**
 * @file protocol.hpp
 * @brief Byte layouts of the DLC commands and classification of device notifications.
 *
 * The wire format is only partially documented, so every opcode and notification
 * prefix lives in ProtocolConfig and can be overridden from the configuration file.
 *
 * Default layouts:
 *   start-transfer   50 <slot> <len hi> <len mid> <len lo> <ack 0|1>
 *   ready            24 02 [<slot>]
 *   complete         24 03
 *   chunk ack        09
 *   load/activate    60 <slot> / 61 <slot>
 *   deactivate/del   62 <slot> / 74 <slot>
 *   lifecycle ack    <opcode> <slot> <success>
 *   status           72  ->  72 <s0> <s1> ...
 *   trigger action   13 00 <input> <index> <subindex> <specific>
 */
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "dlc/transfer_error.hpp"
#include "plushlink_utils_export.h"

namespace plushlink::dlc
{

using Bytes = std::vector<uint8_t>;

struct ProtocolConfig
{
    uint8_t start_transfer_opcode{0x50};
    Bytes ready_prefix{0x24, 0x02};
    Bytes complete_prefix{0x24, 0x03};
    Bytes chunk_ack_prefix{0x09};
    uint8_t load_opcode{0x60};
    uint8_t activate_opcode{0x61};
    uint8_t deactivate_opcode{0x62};
    uint8_t delete_opcode{0x74};
    uint8_t status_opcode{0x72};
    uint8_t trigger_opcode{0x13};
    uint8_t dlc_input_id{75};
};

/// Kinds of device notification the router can wait for.
enum class SignalKind
{
    TransferReady,
    TransferComplete,
    ChunkAck,
    LoadAck,
    ActivateAck,
    DeactivateAck,
    DeleteAck,
    SlotStatus,
};

PLUSHLINK_UTILS_EXPORT const char *to_string(SignalKind kind) noexcept;

/// Decoded `<opcode> <slot> <success>` acknowledgment.
struct LifecycleAck
{
    uint8_t opcode;
    uint8_t slot;
    bool success;
};

namespace protocol
{

/// Largest length the 24-bit length field of start-transfer can carry.
inline constexpr uint32_t kMaxEncodableLength = 0xFFFFFF;

/// @throws std::invalid_argument if total_length does not fit in 24 bits.
PLUSHLINK_UTILS_EXPORT Bytes encode_start_transfer(const ProtocolConfig &cfg, uint8_t slot,
                                                   uint32_t total_length, bool ack_mode);
PLUSHLINK_UTILS_EXPORT Bytes encode_slot_command(uint8_t opcode, uint8_t slot);
PLUSHLINK_UTILS_EXPORT Bytes encode_status_query(const ProtocolConfig &cfg);
PLUSHLINK_UTILS_EXPORT Bytes encode_trigger_action(const ProtocolConfig &cfg, uint8_t index,
                                                   uint8_t subindex, uint8_t specific);

PLUSHLINK_UTILS_EXPORT std::optional<LifecycleAck>
decode_lifecycle_ack(std::span<const uint8_t> bytes) noexcept;

/**
 * @brief Decodes a status reply into one state per slot. Returns nullopt if the reply is
 *        shorter than `slot_count` states or a state byte is out of range.
 */
PLUSHLINK_UTILS_EXPORT std::optional<SlotSnapshot>
decode_slot_status(const ProtocolConfig &cfg, std::span<const uint8_t> bytes,
                   size_t slot_count) noexcept;

/// Slot byte echoed after the ready prefix, if the device sent one.
PLUSHLINK_UTILS_EXPORT std::optional<uint8_t>
ready_slot_echo(const ProtocolConfig &cfg, std::span<const uint8_t> bytes) noexcept;

} // namespace protocol

/**
 * @class SignalClassifier
 * @brief Maps raw notification bytes to a SignalKind by prefix. Longer prefixes are tried
 *        first, so `24 02` never shadows a more specific rule.
 */
class PLUSHLINK_UTILS_EXPORT SignalClassifier
{
  public:
    explicit SignalClassifier(const ProtocolConfig &cfg);

    [[nodiscard]] std::optional<SignalKind> classify(std::span<const uint8_t> bytes) const noexcept;

  private:
    std::vector<std::pair<Bytes, SignalKind>> m_rules;
};

} // namespace plushlink::dlc
