#pragma once
/**
 * @file slot_lifecycle_controller.hpp
 * @brief load / activate / deactivate / delete for uploaded slots, plus the status query.
 *
 * Each command is written once and its acknowledgment awaited with a bounded timeout.
 * The registry changes only after a positive acknowledgment; a timeout or a rejection
 * leaves every slot exactly as it was. Operations are serialized.
 */
#include <chrono>
#include <mutex>

#include "dlc/notification_router.hpp"
#include "dlc/protocol.hpp"
#include "dlc/slot_registry.hpp"
#include "dlc/transport.hpp"
#include "plushlink_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace plushlink::dlc
{

struct LifecycleOptions
{
    std::chrono::milliseconds command_ack_timeout{2000};
    std::chrono::milliseconds status_timeout{2000};
};

class PLUSHLINK_UTILS_EXPORT SlotLifecycleController
{
  public:
    SlotLifecycleController(Transport &transport, NotificationRouter &router,
                            SlotRegistry &registry, const ProtocolConfig &protocol,
                            LifecycleOptions options);

    /// Requires Uploaded (Active is accepted and re-sent). No state change.
    [[nodiscard]] DlcStatus load(int slot);

    /// Requires Uploaded. Already Active succeeds without I/O.
    [[nodiscard]] DlcStatus activate(int slot);

    /// Demotes the Active slot to Uploaded. No-op without I/O when nothing is active.
    [[nodiscard]] DlcStatus deactivate();

    /// Rejects Active (SlotInUse) and a slot being uploaded (SlotBusy).
    [[nodiscard]] DlcStatus delete_slot(int slot);

    /// Asks the device for every slot's state and replaces the registry with it.
    [[nodiscard]] DlcResult<SlotSnapshot> query_status();

  private:
    DlcStatus send_and_confirm(SignalKind ack_kind, uint8_t opcode, int slot);

    Transport &m_transport;
    NotificationRouter &m_router;
    SlotRegistry &m_registry;
    const ProtocolConfig &m_protocol;
    LifecycleOptions m_options;
    std::mutex m_op_mutex;
};

} // namespace plushlink::dlc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
