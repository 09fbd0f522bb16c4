#include <stdexcept>

#include "dlc/simulated_device.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

namespace plushlink::dlc
{

SimulatedDevice::SimulatedDevice(SimulatedDeviceOptions options)
    : m_options(std::move(options)), m_slots(m_options.slot_count, SlotState::Empty),
      m_contents(m_options.slot_count)
{
    if (m_options.max_write_size == 0)
        throw std::invalid_argument("simulated device needs a non-zero max_write_size");
}

utils::Status<TransportError> SimulatedDevice::write(Endpoint endpoint,
                                                     std::span<const uint8_t> bytes)
{
    std::vector<Bytes> replies;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_connected)
            return utils::Status<TransportError>::error(TransportError::NotConnected);
        if (bytes.size() > m_options.max_write_size)
        {
            return utils::Status<TransportError>::error(TransportError::Oversized,
                                                        static_cast<int>(bytes.size()));
        }
        m_writes.push_back(RecordedWrite{endpoint, Bytes(bytes.begin(), bytes.end())});

        if (endpoint == Endpoint::Command)
        {
            handle_command(bytes, replies);
        }
        else
        {
            const size_t index = m_transfer ? m_transfer->file_writes : 0;
            if (m_transfer && m_fail_file_write_at == index)
            {
                m_fail_file_write_at.reset();
                ++m_transfer->file_writes;
                return utils::Status<TransportError>::error(TransportError::WriteFailed);
            }
            handle_file(bytes, replies);
        }
    }
    deliver(replies);
    return utils::Status<TransportError>::ok();
}

void SimulatedDevice::handle_command(std::span<const uint8_t> bytes, std::vector<Bytes> &out)
{
    if (bytes.empty())
        return;
    const ProtocolConfig &p = m_options.protocol;
    const uint8_t op = bytes[0];

    if (op == p.start_transfer_opcode && bytes.size() >= 6)
    {
        const uint8_t slot = bytes[1];
        if (slot >= m_slots.size())
            return;
        const size_t length = (static_cast<size_t>(bytes[2]) << 16) |
                              (static_cast<size_t>(bytes[3]) << 8) | bytes[4];
        m_transfer = Transfer{.slot = slot, .expected = length, .ack_mode = bytes[5] != 0};
        m_slots[slot] = SlotState::Uploading;
        if (m_respond_ready)
        {
            Bytes ready = p.ready_prefix;
            ready.push_back(m_ready_slot_override.value_or(slot));
            out.push_back(std::move(ready));
        }
        return;
    }

    if (op == p.status_opcode)
    {
        if (m_answer_status)
        {
            Bytes reply{op};
            for (SlotState st : m_slots)
                reply.push_back(static_cast<uint8_t>(st));
            out.push_back(std::move(reply));
        }
        return;
    }

    if (op == p.trigger_opcode)
    {
        m_last_trigger = Bytes(bytes.begin(), bytes.end());
        return;
    }

    if (bytes.size() < 2)
        return;
    const uint8_t slot = bytes[1];
    const bool in_range = slot < m_slots.size();
    bool success = in_range && !m_reject_commands;

    if (op == p.load_opcode)
    {
        success = success &&
                  (m_slots[slot] == SlotState::Uploaded || m_slots[slot] == SlotState::Active);
    }
    else if (op == p.activate_opcode)
    {
        success = success &&
                  (m_slots[slot] == SlotState::Uploaded || m_slots[slot] == SlotState::Active);
        if (success)
        {
            for (auto &st : m_slots)
            {
                if (st == SlotState::Active)
                    st = SlotState::Uploaded;
            }
            m_slots[slot] = SlotState::Active;
        }
    }
    else if (op == p.deactivate_opcode)
    {
        if (success && m_slots[slot] == SlotState::Active)
            m_slots[slot] = SlotState::Uploaded;
    }
    else if (op == p.delete_opcode)
    {
        success = success && m_slots[slot] != SlotState::Active;
        if (success)
        {
            m_slots[slot] = SlotState::Empty;
            m_contents[slot].clear();
        }
    }
    else
    {
        LOGGER_DEBUG("simulated device: ignoring command [{}]", format_tools::hex_bytes(bytes));
        return;
    }

    if (m_ack_commands)
        out.push_back(Bytes{op, slot, static_cast<uint8_t>(success ? 1 : 0)});
}

void SimulatedDevice::handle_file(std::span<const uint8_t> bytes, std::vector<Bytes> &out)
{
    if (!m_transfer)
        return;
    Transfer &t = *m_transfer;
    ++t.file_writes;
    t.received.insert(t.received.end(), bytes.begin(), bytes.end());

    if (t.ack_mode && m_ack_chunks)
        out.push_back(m_options.protocol.chunk_ack_prefix);

    if (t.received.size() >= t.expected)
    {
        if (m_respond_complete)
        {
            m_slots[t.slot] = SlotState::Uploaded;
            m_contents[t.slot] = std::move(t.received);
            out.push_back(m_options.protocol.complete_prefix);
        }
        m_transfer.reset();
    }
}

void SimulatedDevice::deliver(const std::vector<Bytes> &notifications)
{
    if (notifications.empty())
        return;
    std::lock_guard<std::mutex> lock(m_handler_mutex);
    for (const auto &n : notifications)
    {
        if (m_notify)
            m_notify(n);
    }
}

void SimulatedDevice::set_notify_handler(NotifyHandler handler)
{
    std::lock_guard<std::mutex> lock(m_handler_mutex);
    m_notify = std::move(handler);
}

void SimulatedDevice::set_link_lost_handler(LinkLostHandler handler)
{
    std::lock_guard<std::mutex> lock(m_handler_mutex);
    m_link_lost = std::move(handler);
}

size_t SimulatedDevice::max_write_size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_options.max_write_size;
}

void SimulatedDevice::set_max_write_size(size_t size)
{
    if (size == 0)
        throw std::invalid_argument("max_write_size must be non-zero");
    std::lock_guard<std::mutex> lock(m_mutex);
    m_options.max_write_size = size;
}

void SimulatedDevice::set_respond_ready(bool on)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_respond_ready = on;
}

void SimulatedDevice::set_respond_complete(bool on)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_respond_complete = on;
}

void SimulatedDevice::set_ack_chunks(bool on)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_ack_chunks = on;
}

void SimulatedDevice::set_ack_commands(bool on)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_ack_commands = on;
}

void SimulatedDevice::set_reject_commands(bool on)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_reject_commands = on;
}

void SimulatedDevice::set_answer_status(bool on)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_answer_status = on;
}

void SimulatedDevice::set_ready_slot_override(std::optional<uint8_t> slot)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_ready_slot_override = slot;
}

void SimulatedDevice::fail_file_write_at(std::optional<size_t> index)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fail_file_write_at = index;
}

void SimulatedDevice::set_slot_states(const SlotSnapshot &states)
{
    if (states.size() != m_options.slot_count)
        throw std::invalid_argument("slot table size does not match slot_count");
    std::lock_guard<std::mutex> lock(m_mutex);
    m_slots = states;
}

void SimulatedDevice::disconnect()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_connected)
            return;
        m_connected = false;
        m_transfer.reset();
    }
    std::lock_guard<std::mutex> lock(m_handler_mutex);
    if (m_link_lost)
        m_link_lost();
}

void SimulatedDevice::reconnect()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connected = true;
}

void SimulatedDevice::inject_notification(std::span<const uint8_t> bytes)
{
    deliver({Bytes(bytes.begin(), bytes.end())});
}

std::vector<RecordedWrite> SimulatedDevice::writes() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_writes;
}

std::vector<Bytes> SimulatedDevice::writes_to(Endpoint endpoint) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Bytes> out;
    for (const auto &w : m_writes)
    {
        if (w.endpoint == endpoint)
            out.push_back(w.bytes);
    }
    return out;
}

size_t SimulatedDevice::file_write_count() const
{
    return writes_to(Endpoint::File).size();
}

SlotSnapshot SimulatedDevice::slot_states() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots;
}

Bytes SimulatedDevice::slot_content(int slot) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (slot < 0 || static_cast<size_t>(slot) >= m_contents.size())
        throw std::out_of_range("slot out of range");
    return m_contents[static_cast<size_t>(slot)];
}

std::optional<Bytes> SimulatedDevice::last_trigger() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_trigger;
}

void SimulatedDevice::clear_writes()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_writes.clear();
}

} // namespace plushlink::dlc
