#pragma once
/**
 * @file dlc_controller.hpp
 * @brief Per-connection entry point of the DLC subsystem.
 *
 * Owns the router, the slot registry and the lifecycle controller for one device link,
 * wires the Transport's notify and link-lost callbacks into them, and runs uploads one at a
 * time. A second upload while one is in flight is refused with SlotBusy.
 *
 * @code
 *   DlcController dlc(transport, config.dlc_options());
 *   dlc.initialize();                       // reads slot states from the device
 *   auto r = dlc.upload(2, bytes);
 *   if (r.is_ok() && dlc.activate(2).is_ok())
 *       dlc.trigger_action(0, 0, 0);
 * @endcode
 */
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>

#include "dlc/chunk_scheduler.hpp"
#include "dlc/notification_router.hpp"
#include "dlc/protocol.hpp"
#include "dlc/slot_lifecycle_controller.hpp"
#include "dlc/slot_registry.hpp"
#include "dlc/transfer_session.hpp"
#include "dlc/transport.hpp"
#include "plushlink_utils_export.h"
#include "utils/callback_dispatcher.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace plushlink::dlc
{

struct DlcOptions
{
    size_t slot_count{4};
    SessionOptions session;
    LifecycleOptions lifecycle;
    ProtocolConfig protocol;
};

/// Per-upload overrides of the configured defaults.
struct UploadParams
{
    std::optional<size_t> chunk_size;
    std::optional<bool> ack_mode;
    ProgressCallback progress;
};

class PLUSHLINK_UTILS_EXPORT DlcController
{
  public:
    DlcController(Transport &transport, DlcOptions options);
    /// Detaches from the transport and drains pending progress callbacks.
    ~DlcController();

    DlcController(const DlcController &) = delete;
    DlcController &operator=(const DlcController &) = delete;

    /**
     * @brief Seeds the registry from the device's status reply. On failure every slot stays
     *        Empty and the error is returned for the caller to log or retry.
     */
    DlcResult<SlotSnapshot> initialize();

    /// Runs one upload to completion on the calling thread.
    [[nodiscard]] DlcResult<UploadReport> upload(int slot, std::span<const uint8_t> payload,
                                                 const UploadParams &params = {});

    /// Cancels the in-flight upload, if any. Returns true if there was one.
    bool cancel_upload();
    [[nodiscard]] bool upload_in_flight() const;

    [[nodiscard]] DlcStatus load(int slot);
    [[nodiscard]] DlcStatus activate(int slot);
    [[nodiscard]] DlcStatus deactivate();
    [[nodiscard]] DlcStatus delete_slot(int slot);
    [[nodiscard]] DlcResult<SlotSnapshot> query_status();

    /**
     * @brief Fires the active DLC's action: `13 00 <input> index subindex specific`.
     *        Requires an Active slot. Fire-and-forget: no acknowledgment is awaited.
     */
    [[nodiscard]] DlcStatus trigger_action(uint8_t index, uint8_t subindex, uint8_t specific);

    /// Read-only view of the registry.
    [[nodiscard]] SlotSnapshot slot_status() const;

    void set_slot_listener(SlotRegistry::Listener listener);

    /// Fails every outstanding wait with a transport error. Wired to the transport.
    void on_link_lost();

    /// Blocks until every progress callback posted so far has run.
    void flush_callbacks();

    [[nodiscard]] const DlcOptions &options() const noexcept { return m_options; }
    [[nodiscard]] NotificationRouter &router() noexcept { return m_router; }

  private:
    DlcOptions m_options;
    Transport &m_transport;
    NotificationRouter m_router;
    SlotRegistry m_registry;
    utils::CallbackDispatcher m_progress_dispatcher;
    SlotLifecycleController m_lifecycle;

    mutable std::mutex m_session_mutex;
    TransferSession *m_active_session{nullptr};
};

} // namespace plushlink::dlc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
