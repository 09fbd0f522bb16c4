#include "dlc/dlc_controller.hpp"
#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"

namespace plushlink::dlc
{

DlcController::DlcController(Transport &transport, DlcOptions options)
    : m_options(std::move(options)), m_transport(transport), m_router(m_options.protocol),
      m_registry(m_options.slot_count),
      m_lifecycle(transport, m_router, m_registry, m_options.protocol, m_options.lifecycle)
{
    m_transport.set_notify_handler([this](std::span<const uint8_t> bytes)
                                   { m_router.on_notification(bytes); });
    m_transport.set_link_lost_handler([this] { on_link_lost(); });
}

DlcController::~DlcController()
{
    m_transport.set_notify_handler({});
    m_transport.set_link_lost_handler({});
    m_progress_dispatcher.shutdown();
}

DlcResult<SlotSnapshot> DlcController::initialize()
{
    auto status = m_lifecycle.query_status();
    if (status.is_error())
    {
        LOGGER_WARN("slot status unavailable ({}); assuming every slot is empty",
                    to_string(status.error()));
    }
    else
    {
        LOGGER_INFO("DLC ready: {} slot(s), active slot {}", m_registry.slot_count(),
                    m_registry.active_slot().value_or(-1));
    }
    return status;
}

DlcResult<UploadReport> DlcController::upload(int slot, std::span<const uint8_t> payload,
                                              const UploadParams &params)
{
    SessionOptions opts = m_options.session;
    if (params.chunk_size)
        opts.chunk_size = *params.chunk_size;
    if (params.ack_mode)
        opts.ack_mode = *params.ack_mode;

    TransferSession session(m_transport, m_router, m_registry, m_options.protocol,
                            m_progress_dispatcher, opts);
    auto reserved = session.request(slot, payload.size());
    if (reserved.is_error())
    {
        LOGGER_WARN("upload to slot {} refused: {}", slot, to_string(reserved.error()));
        return reserved.forward_error<UploadReport>();
    }

    {
        std::lock_guard<std::mutex> lock(m_session_mutex);
        m_active_session = &session;
    }
    auto clear = basics::make_scope_guard(
        [this]() noexcept
        {
            std::lock_guard<std::mutex> lock(m_session_mutex);
            m_active_session = nullptr;
        });

    LOGGER_INFO("uploading {} bytes to slot {} ({} mode)", payload.size(), slot,
                opts.ack_mode ? "step-ack" : "streaming");
    return session.run(payload, params.progress);
}

bool DlcController::cancel_upload()
{
    std::lock_guard<std::mutex> lock(m_session_mutex);
    if (!m_active_session)
        return false;
    m_active_session->cancel();
    return true;
}

bool DlcController::upload_in_flight() const
{
    return m_registry.uploading_slot().has_value();
}

DlcStatus DlcController::load(int slot)
{
    return m_lifecycle.load(slot);
}

DlcStatus DlcController::activate(int slot)
{
    return m_lifecycle.activate(slot);
}

DlcStatus DlcController::deactivate()
{
    return m_lifecycle.deactivate();
}

DlcStatus DlcController::delete_slot(int slot)
{
    return m_lifecycle.delete_slot(slot);
}

DlcResult<SlotSnapshot> DlcController::query_status()
{
    return m_lifecycle.query_status();
}

DlcStatus DlcController::trigger_action(uint8_t index, uint8_t subindex, uint8_t specific)
{
    const auto active = m_registry.active_slot();
    if (!active)
        return DlcStatus::error(TransferError::NoActiveSlot);

    const Bytes cmd = protocol::encode_trigger_action(m_options.protocol, index, subindex, specific);
    if (auto w = m_transport.write(Endpoint::Command, cmd); w.is_error())
        return DlcStatus::error(TransferError::TransportFailure, m_options.protocol.trigger_opcode);
    LOGGER_DEBUG("triggered DLC action {}/{}/{} on slot {}", index, subindex, specific, *active);
    return DlcStatus::ok();
}

SlotSnapshot DlcController::slot_status() const
{
    return m_registry.snapshot();
}

void DlcController::set_slot_listener(SlotRegistry::Listener listener)
{
    m_registry.set_listener(std::move(listener));
}

void DlcController::on_link_lost()
{
    LOGGER_WARN("link lost; failing {} outstanding wait(s)", m_router.pending_count());
    m_router.fail_all(WaitError::LinkLost);
}

void DlcController::flush_callbacks()
{
    m_progress_dispatcher.drain();
}

} // namespace plushlink::dlc
