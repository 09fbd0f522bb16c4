#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

#include "dlc/protocol.hpp"

namespace plushlink::dlc
{

const char *to_string(TransferError err) noexcept
{
    switch (err)
    {
    case TransferError::InvalidSlot:
        return "InvalidSlot";
    case TransferError::PayloadTooLarge:
        return "PayloadTooLarge";
    case TransferError::SlotBusy:
        return "SlotBusy";
    case TransferError::SlotInUse:
        return "SlotInUse";
    case TransferError::SlotNotUploaded:
        return "SlotNotUploaded";
    case TransferError::NoActiveSlot:
        return "NoActiveSlot";
    case TransferError::NotReady:
        return "NotReady";
    case TransferError::CompletionTimeout:
        return "CompletionTimeout";
    case TransferError::Unacknowledged:
        return "Unacknowledged";
    case TransferError::TransportFailure:
        return "TransportFailure";
    case TransferError::ChunkFailed:
        return "ChunkFailed";
    case TransferError::Cancelled:
        return "Cancelled";
    case TransferError::DeviceRejected:
        return "DeviceRejected";
    }
    return "Unknown";
}

const char *to_string(SlotState state) noexcept
{
    switch (state)
    {
    case SlotState::Empty:
        return "Empty";
    case SlotState::Uploading:
        return "Uploading";
    case SlotState::Uploaded:
        return "Uploaded";
    case SlotState::Active:
        return "Active";
    }
    return "Unknown";
}

const char *to_string(SignalKind kind) noexcept
{
    switch (kind)
    {
    case SignalKind::TransferReady:
        return "TransferReady";
    case SignalKind::TransferComplete:
        return "TransferComplete";
    case SignalKind::ChunkAck:
        return "ChunkAck";
    case SignalKind::LoadAck:
        return "LoadAck";
    case SignalKind::ActivateAck:
        return "ActivateAck";
    case SignalKind::DeactivateAck:
        return "DeactivateAck";
    case SignalKind::DeleteAck:
        return "DeleteAck";
    case SignalKind::SlotStatus:
        return "SlotStatus";
    }
    return "Unknown";
}

namespace protocol
{

Bytes encode_start_transfer(const ProtocolConfig &cfg, uint8_t slot, uint32_t total_length,
                            bool ack_mode)
{
    if (total_length > kMaxEncodableLength)
    {
        throw std::invalid_argument(
            fmt::format("start-transfer length {} does not fit in 24 bits", total_length));
    }
    return Bytes{cfg.start_transfer_opcode,
                 slot,
                 static_cast<uint8_t>((total_length >> 16) & 0xFF),
                 static_cast<uint8_t>((total_length >> 8) & 0xFF),
                 static_cast<uint8_t>(total_length & 0xFF),
                 static_cast<uint8_t>(ack_mode ? 1 : 0)};
}

Bytes encode_slot_command(uint8_t opcode, uint8_t slot)
{
    return Bytes{opcode, slot};
}

Bytes encode_status_query(const ProtocolConfig &cfg)
{
    return Bytes{cfg.status_opcode};
}

Bytes encode_trigger_action(const ProtocolConfig &cfg, uint8_t index, uint8_t subindex,
                            uint8_t specific)
{
    return Bytes{cfg.trigger_opcode, 0x00, cfg.dlc_input_id, index, subindex, specific};
}

std::optional<LifecycleAck> decode_lifecycle_ack(std::span<const uint8_t> bytes) noexcept
{
    if (bytes.size() < 3)
        return std::nullopt;
    return LifecycleAck{bytes[0], bytes[1], bytes[2] != 0};
}

std::optional<SlotSnapshot> decode_slot_status(const ProtocolConfig &cfg,
                                               std::span<const uint8_t> bytes,
                                               size_t slot_count) noexcept
{
    if (bytes.empty() || bytes[0] != cfg.status_opcode || bytes.size() < slot_count + 1)
        return std::nullopt;

    SlotSnapshot states;
    states.reserve(slot_count);
    for (size_t i = 0; i < slot_count; ++i)
    {
        const uint8_t raw = bytes[i + 1];
        if (raw > static_cast<uint8_t>(SlotState::Active))
            return std::nullopt;
        states.push_back(static_cast<SlotState>(raw));
    }
    return states;
}

std::optional<uint8_t> ready_slot_echo(const ProtocolConfig &cfg,
                                       std::span<const uint8_t> bytes) noexcept
{
    if (bytes.size() <= cfg.ready_prefix.size())
        return std::nullopt;
    return bytes[cfg.ready_prefix.size()];
}

} // namespace protocol

SignalClassifier::SignalClassifier(const ProtocolConfig &cfg)
{
    m_rules = {
        {cfg.ready_prefix, SignalKind::TransferReady},
        {cfg.complete_prefix, SignalKind::TransferComplete},
        {cfg.chunk_ack_prefix, SignalKind::ChunkAck},
        {Bytes{cfg.load_opcode}, SignalKind::LoadAck},
        {Bytes{cfg.activate_opcode}, SignalKind::ActivateAck},
        {Bytes{cfg.deactivate_opcode}, SignalKind::DeactivateAck},
        {Bytes{cfg.delete_opcode}, SignalKind::DeleteAck},
        {Bytes{cfg.status_opcode}, SignalKind::SlotStatus},
    };
    for (const auto &[prefix, kind] : m_rules)
    {
        if (prefix.empty())
        {
            throw std::invalid_argument(
                fmt::format("empty notification prefix for {}", to_string(kind)));
        }
    }
    std::stable_sort(m_rules.begin(), m_rules.end(), [](const auto &a, const auto &b)
                     { return a.first.size() > b.first.size(); });
}

std::optional<SignalKind> SignalClassifier::classify(std::span<const uint8_t> bytes) const noexcept
{
    for (const auto &[prefix, kind] : m_rules)
    {
        if (bytes.size() >= prefix.size() &&
            std::equal(prefix.begin(), prefix.end(), bytes.begin()))
        {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace plushlink::dlc
