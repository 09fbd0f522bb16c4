#pragma once
/**
 * @file simulated_device.hpp
 * @brief In-process Transport that behaves like the toy's DLC endpoints.
 *
 * Answers start-transfer with a ready notification, acknowledges file chunks in step-ack
 * mode, sends the completion notification once the announced length has arrived, answers
 * slot commands and the status query. Notifications are delivered synchronously from
 * inside write(), after the device lock is released.
 *
 * Every reply can be switched off and writes can be made to fail, so timeouts and
 * transport errors can be provoked deterministically.
 *
 * Built into the plushlink_simulator static library, which only tests and examples link.
 */
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

#include "dlc/protocol.hpp"
#include "dlc/transport.hpp"

namespace plushlink::dlc
{

struct SimulatedDeviceOptions
{
    size_t slot_count{4};
    size_t max_write_size{20};
    ProtocolConfig protocol;
};

/// One write as the device received it.
struct RecordedWrite
{
    Endpoint endpoint;
    Bytes bytes;
};

class SimulatedDevice : public Transport
{
  public:
    explicit SimulatedDevice(SimulatedDeviceOptions options = {});

    // --- Transport ---
    [[nodiscard]] utils::Status<TransportError> write(Endpoint endpoint,
                                                      std::span<const uint8_t> bytes) override;
    void set_notify_handler(NotifyHandler handler) override;
    void set_link_lost_handler(LinkLostHandler handler) override;
    [[nodiscard]] size_t max_write_size() const override;

    // --- Behaviour switches ---
    void set_max_write_size(size_t size);
    void set_respond_ready(bool on);
    void set_respond_complete(bool on);
    void set_ack_chunks(bool on);
    void set_ack_commands(bool on);
    /// Acknowledge slot commands with success = 0.
    void set_reject_commands(bool on);
    void set_answer_status(bool on);
    /// Echo this slot in the ready notification instead of the requested one.
    void set_ready_slot_override(std::optional<uint8_t> slot);
    /// Fail the n-th (0-based) File write of the next transfer.
    void fail_file_write_at(std::optional<size_t> index);
    /// Sets the device-side slot table.
    void set_slot_states(const SlotSnapshot &states);

    /// Drops the link: further writes fail with NotConnected and the link-lost handler fires.
    void disconnect();
    void reconnect();

    /// Delivers arbitrary bytes as if the device had notified them.
    void inject_notification(std::span<const uint8_t> bytes);

    // --- Inspection ---
    [[nodiscard]] std::vector<RecordedWrite> writes() const;
    [[nodiscard]] std::vector<Bytes> writes_to(Endpoint endpoint) const;
    [[nodiscard]] size_t file_write_count() const;
    [[nodiscard]] SlotSnapshot slot_states() const;
    /// Content committed to a slot by the last completed transfer.
    [[nodiscard]] Bytes slot_content(int slot) const;
    [[nodiscard]] std::optional<Bytes> last_trigger() const;
    void clear_writes();

  private:
    struct Transfer
    {
        uint8_t slot;
        size_t expected;
        bool ack_mode;
        size_t file_writes{0};
        Bytes received;
    };

    void handle_command(std::span<const uint8_t> bytes, std::vector<Bytes> &out);
    void handle_file(std::span<const uint8_t> bytes, std::vector<Bytes> &out);
    void deliver(const std::vector<Bytes> &notifications);

    SimulatedDeviceOptions m_options;
    mutable std::mutex m_mutex;
    std::mutex m_handler_mutex;
    NotifyHandler m_notify;
    LinkLostHandler m_link_lost;

    bool m_connected{true};
    bool m_respond_ready{true};
    bool m_respond_complete{true};
    bool m_ack_chunks{true};
    bool m_ack_commands{true};
    bool m_reject_commands{false};
    bool m_answer_status{true};
    std::optional<uint8_t> m_ready_slot_override;
    std::optional<size_t> m_fail_file_write_at;

    std::optional<Transfer> m_transfer;
    SlotSnapshot m_slots;
    std::vector<Bytes> m_contents;
    std::vector<RecordedWrite> m_writes;
    std::optional<Bytes> m_last_trigger;
};

} // namespace plushlink::dlc
