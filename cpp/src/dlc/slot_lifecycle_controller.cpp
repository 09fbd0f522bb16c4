#include "dlc/slot_lifecycle_controller.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"

namespace plushlink::dlc
{

SlotLifecycleController::SlotLifecycleController(Transport &transport,
                                                 NotificationRouter &router,
                                                 SlotRegistry &registry,
                                                 const ProtocolConfig &protocol,
                                                 LifecycleOptions options)
    : m_transport(transport), m_router(router), m_registry(registry), m_protocol(protocol),
      m_options(options)
{
}

DlcStatus SlotLifecycleController::send_and_confirm(SignalKind ack_kind, uint8_t opcode, int slot)
{
    const auto slot_byte = static_cast<uint8_t>(slot);
    auto ack = m_router.register_waiter(ack_kind);

    if (auto w = m_transport.write(Endpoint::Command, protocol::encode_slot_command(opcode, slot_byte));
        w.is_error())
    {
        LOGGER_WARN("lifecycle: write of command {:#04x} for slot {} failed", opcode, slot);
        return DlcStatus::error(TransferError::TransportFailure, opcode);
    }

    auto reply = m_router.await_signal(ack, m_options.command_ack_timeout);
    if (reply.is_error())
    {
        switch (reply.error())
        {
        case WaitError::TimedOut:
            LOGGER_WARN("lifecycle: command {:#04x} for slot {} was not acknowledged", opcode,
                        slot);
            return DlcStatus::error(TransferError::Unacknowledged, opcode);
        case WaitError::Cancelled:
            return DlcStatus::error(TransferError::Cancelled, opcode);
        case WaitError::LinkLost:
            return DlcStatus::error(TransferError::TransportFailure, opcode);
        }
    }

    const auto decoded = protocol::decode_lifecycle_ack(reply.content());
    if (!decoded || decoded->slot != slot_byte || !decoded->success)
    {
        LOGGER_WARN("lifecycle: device rejected command {:#04x} for slot {} [{}]", opcode, slot,
                    format_tools::hex_bytes(reply.content()));
        return DlcStatus::error(TransferError::DeviceRejected, opcode);
    }
    return DlcStatus::ok();
}

DlcStatus SlotLifecycleController::load(int slot)
{
    std::lock_guard<std::mutex> lock(m_op_mutex);
    if (!m_registry.is_valid(slot))
        return DlcStatus::error(TransferError::InvalidSlot, slot);
    const SlotState st = m_registry.state(slot);
    if (st != SlotState::Uploaded && st != SlotState::Active)
        return DlcStatus::error(TransferError::SlotNotUploaded, slot);

    auto r = send_and_confirm(SignalKind::LoadAck, m_protocol.load_opcode, slot);
    if (r.is_ok())
        LOGGER_INFO("slot {} loaded", slot);
    return r;
}

DlcStatus SlotLifecycleController::activate(int slot)
{
    std::lock_guard<std::mutex> lock(m_op_mutex);
    // Held until the registry reflects the device's answer; an upload cannot slip in between.
    if (auto held = m_registry.hold_for_command(slot); held.is_error())
        return held;
    auto release = basics::make_scope_guard([this, slot]() noexcept
                                            { m_registry.release_command_hold(slot); });

    const SlotState st = m_registry.state(slot);
    if (st == SlotState::Active)
        return DlcStatus::ok();
    if (st != SlotState::Uploaded)
        return DlcStatus::error(TransferError::SlotNotUploaded, slot);

    auto r = send_and_confirm(SignalKind::ActivateAck, m_protocol.activate_opcode, slot);
    if (r.is_error())
        return r;
    auto marked = m_registry.mark_active(slot);
    if (marked.is_ok())
        LOGGER_INFO("slot {} active", slot);
    return marked;
}

DlcStatus SlotLifecycleController::deactivate()
{
    std::lock_guard<std::mutex> lock(m_op_mutex);
    const auto active = m_registry.active_slot();
    if (!active)
    {
        LOGGER_DEBUG("lifecycle: deactivate with no active slot");
        return DlcStatus::ok();
    }

    auto r = send_and_confirm(SignalKind::DeactivateAck, m_protocol.deactivate_opcode, *active);
    if (r.is_error())
        return r;
    m_registry.demote_active();
    LOGGER_INFO("slot {} deactivated", *active);
    return DlcStatus::ok();
}

DlcStatus SlotLifecycleController::delete_slot(int slot)
{
    std::lock_guard<std::mutex> lock(m_op_mutex);
    if (!m_registry.is_valid(slot))
        return DlcStatus::error(TransferError::InvalidSlot, slot);
    if (m_registry.state(slot) == SlotState::Active)
        return DlcStatus::error(TransferError::SlotInUse, slot);
    if (auto held = m_registry.hold_for_command(slot); held.is_error())
        return held;
    auto release = basics::make_scope_guard([this, slot]() noexcept
                                            { m_registry.release_command_hold(slot); });

    auto r = send_and_confirm(SignalKind::DeleteAck, m_protocol.delete_opcode, slot);
    if (r.is_error())
        return r;
    auto cleared = m_registry.mark_empty(slot);
    if (cleared.is_ok())
        LOGGER_INFO("slot {} deleted", slot);
    return cleared;
}

DlcResult<SlotSnapshot> SlotLifecycleController::query_status()
{
    std::lock_guard<std::mutex> lock(m_op_mutex);
    const uint8_t opcode = m_protocol.status_opcode;
    auto reply_handle = m_router.register_waiter(SignalKind::SlotStatus);

    if (auto w = m_transport.write(Endpoint::Command, protocol::encode_status_query(m_protocol));
        w.is_error())
    {
        return DlcResult<SlotSnapshot>::error(TransferError::TransportFailure, opcode);
    }

    auto reply = m_router.await_signal(reply_handle, m_options.status_timeout);
    if (reply.is_error())
    {
        switch (reply.error())
        {
        case WaitError::TimedOut:
            LOGGER_WARN("lifecycle: slot status query was not answered");
            return DlcResult<SlotSnapshot>::error(TransferError::Unacknowledged, opcode);
        case WaitError::Cancelled:
            return DlcResult<SlotSnapshot>::error(TransferError::Cancelled, opcode);
        case WaitError::LinkLost:
            return DlcResult<SlotSnapshot>::error(TransferError::TransportFailure, opcode);
        }
    }

    auto states =
        protocol::decode_slot_status(m_protocol, reply.content(), m_registry.slot_count());
    if (!states)
    {
        LOGGER_WARN("lifecycle: malformed slot status reply [{}]",
                    format_tools::hex_bytes(reply.content()));
        return DlcResult<SlotSnapshot>::error(TransferError::DeviceRejected, opcode);
    }
    auto stored = m_registry.replace_all(*states);
    LOGGER_DEBUG("lifecycle: slot status refreshed from device");
    return DlcResult<SlotSnapshot>::ok(std::move(stored));
}

} // namespace plushlink::dlc
