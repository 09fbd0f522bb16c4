#include <stdexcept>

#include <fmt/format.h>

#include "dlc/slot_registry.hpp"
#include "utils/logger.hpp"

namespace plushlink::dlc
{

SlotRegistry::SlotRegistry(size_t slot_count) : m_slots(slot_count, SlotState::Empty)
{
    if (slot_count == 0 || slot_count > 255)
    {
        throw std::invalid_argument(
            fmt::format("slot count must be between 1 and 255, got {}", slot_count));
    }
}

bool SlotRegistry::is_valid(int slot) const noexcept
{
    return slot >= 0 && static_cast<size_t>(slot) < m_slots.size();
}

SlotState SlotRegistry::state(int slot) const
{
    if (!is_valid(slot))
        throw std::out_of_range(fmt::format("slot {} out of range", slot));
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots[static_cast<size_t>(slot)];
}

SlotSnapshot SlotRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots;
}

std::optional<int> SlotRegistry::active_slot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (size_t i = 0; i < m_slots.size(); ++i)
    {
        if (m_slots[i] == SlotState::Active)
            return static_cast<int>(i);
    }
    return std::nullopt;
}

std::optional<int> SlotRegistry::uploading_slot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_uploading;
}

DlcResult<SlotState> SlotRegistry::begin_upload(int slot)
{
    if (!is_valid(slot))
        return DlcResult<SlotState>::error(TransferError::InvalidSlot, slot);

    SlotSnapshot snap;
    SlotState previous = SlotState::Empty;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto &st = m_slots[static_cast<size_t>(slot)];
        if (m_uploading)
            return DlcResult<SlotState>::error(TransferError::SlotBusy, *m_uploading);
        if (m_command_hold == slot)
            return DlcResult<SlotState>::error(TransferError::SlotBusy, slot);
        if (st == SlotState::Active)
            return DlcResult<SlotState>::error(TransferError::SlotInUse, slot);
        previous = st;
        st = SlotState::Uploading;
        m_uploading = slot;
        snap = m_slots;
    }
    LOGGER_DEBUG("slot {}: {} -> Uploading", slot, to_string(previous));
    notify(snap);
    return DlcResult<SlotState>::ok(previous);
}

void SlotRegistry::commit_upload(int slot)
{
    SlotSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_uploading != slot)
        {
            throw std::logic_error(
                fmt::format("commit_upload({}) without a matching begin_upload", slot));
        }
        m_slots[static_cast<size_t>(slot)] = SlotState::Uploaded;
        m_uploading.reset();
        snap = m_slots;
    }
    LOGGER_DEBUG("slot {}: Uploading -> Uploaded", slot);
    notify(snap);
}

void SlotRegistry::end_upload(int slot, SlotState previous) noexcept
{
    SlotSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_uploading != slot)
            return;
        m_slots[static_cast<size_t>(slot)] = previous;
        m_uploading.reset();
        snap = m_slots;
    }
    LOGGER_DEBUG("slot {}: Uploading -> {} (reverted)", slot, to_string(previous));
    notify(snap);
}

DlcStatus SlotRegistry::mark_active(int slot)
{
    if (!is_valid(slot))
        return DlcStatus::error(TransferError::InvalidSlot, slot);

    SlotSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto &st = m_slots[static_cast<size_t>(slot)];
        if (st == SlotState::Active)
            return DlcStatus::ok();
        if (st != SlotState::Uploaded)
            return DlcStatus::error(TransferError::SlotNotUploaded, slot);
        for (auto &other : m_slots)
        {
            if (other == SlotState::Active)
                other = SlotState::Uploaded;
        }
        st = SlotState::Active;
        snap = m_slots;
    }
    LOGGER_DEBUG("slot {}: Uploaded -> Active", slot);
    notify(snap);
    return DlcStatus::ok();
}

std::optional<int> SlotRegistry::demote_active()
{
    SlotSnapshot snap;
    std::optional<int> demoted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (size_t i = 0; i < m_slots.size(); ++i)
        {
            if (m_slots[i] == SlotState::Active)
            {
                m_slots[i] = SlotState::Uploaded;
                demoted = static_cast<int>(i);
                break;
            }
        }
        if (!demoted)
            return std::nullopt;
        snap = m_slots;
    }
    LOGGER_DEBUG("slot {}: Active -> Uploaded", *demoted);
    notify(snap);
    return demoted;
}

DlcStatus SlotRegistry::mark_empty(int slot)
{
    if (!is_valid(slot))
        return DlcStatus::error(TransferError::InvalidSlot, slot);

    SlotSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto &st = m_slots[static_cast<size_t>(slot)];
        if (st == SlotState::Active)
            return DlcStatus::error(TransferError::SlotInUse, slot);
        if (m_uploading == slot)
            return DlcStatus::error(TransferError::SlotBusy, slot);
        st = SlotState::Empty;
        snap = m_slots;
    }
    LOGGER_DEBUG("slot {}: -> Empty", slot);
    notify(snap);
    return DlcStatus::ok();
}

DlcStatus SlotRegistry::hold_for_command(int slot)
{
    if (!is_valid(slot))
        return DlcStatus::error(TransferError::InvalidSlot, slot);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_uploading == slot)
        return DlcStatus::error(TransferError::SlotBusy, slot);
    if (m_command_hold)
    {
        throw std::logic_error(fmt::format("hold_for_command({}) while slot {} is held", slot,
                                           *m_command_hold));
    }
    m_command_hold = slot;
    return DlcStatus::ok();
}

void SlotRegistry::release_command_hold(int slot) noexcept
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_command_hold == slot)
        m_command_hold.reset();
}

SlotSnapshot SlotRegistry::replace_all(const SlotSnapshot &states)
{
    if (states.size() != m_slots.size())
    {
        throw std::invalid_argument(fmt::format("status for {} slots, registry has {}",
                                                states.size(), m_slots.size()));
    }

    SlotSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        bool seen_active = false;
        for (size_t i = 0; i < states.size(); ++i)
        {
            SlotState st = states[i];
            if (m_uploading == static_cast<int>(i))
            {
                st = SlotState::Uploading;
            }
            else if (st == SlotState::Uploading)
            {
                st = SlotState::Empty;
            }
            else if (st == SlotState::Active)
            {
                if (seen_active)
                {
                    LOGGER_WARN("device reports more than one active slot; slot {} demoted", i);
                    st = SlotState::Uploaded;
                }
                seen_active = true;
            }
            m_slots[i] = st;
        }
        snap = m_slots;
    }
    notify(snap);
    return snap;
}

void SlotRegistry::set_listener(Listener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

void SlotRegistry::notify(const SlotSnapshot &snap) const noexcept
{
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listener = m_listener;
    }
    if (!listener)
        return;
    try
    {
        listener(snap);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("slot listener threw: {}", e.what());
    }
}

} // namespace plushlink::dlc
