#pragma once
/**
 * @file slot_registry.hpp
 * @brief In-memory mirror of the device's content slots.
 *
 * The registry is the only place slot state lives. It never holds two Active slots, only
 * promotes Uploaded slots to Active, and tracks whether an upload is in flight (at most
 * one per connection). Every method is thread-safe; snapshots are taken under the lock
 * so an observer never sees a half-applied transition.
 */
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>

#include "dlc/transfer_error.hpp"
#include "plushlink_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace plushlink::dlc
{

class PLUSHLINK_UTILS_EXPORT SlotRegistry
{
  public:
    /// Called after every change with the new snapshot, outside the registry lock.
    using Listener = std::function<void(const SlotSnapshot &)>;

    /// @throws std::invalid_argument if slot_count is 0 or above 255.
    explicit SlotRegistry(size_t slot_count);

    SlotRegistry(const SlotRegistry &) = delete;
    SlotRegistry &operator=(const SlotRegistry &) = delete;

    [[nodiscard]] size_t slot_count() const noexcept { return m_slots.size(); }
    [[nodiscard]] bool is_valid(int slot) const noexcept;

    /// @throws std::out_of_range for an invalid index.
    [[nodiscard]] SlotState state(int slot) const;
    [[nodiscard]] SlotSnapshot snapshot() const;
    [[nodiscard]] std::optional<int> active_slot() const;
    [[nodiscard]] std::optional<int> uploading_slot() const;

    // --- Upload transitions (TransferSession) ---

    /**
     * @brief Reserves `slot` for an upload and marks it Uploading.
     * @return The state the slot had before, for end_upload().
     *         Errors: InvalidSlot, SlotBusy (an upload is in flight), SlotInUse (slot is Active).
     */
    [[nodiscard]] DlcResult<SlotState> begin_upload(int slot);

    /// Uploading -> Uploaded. The only transition that produces Uploaded content.
    void commit_upload(int slot);

    /// Uploading -> `previous`, releasing the in-flight reservation.
    void end_upload(int slot, SlotState previous) noexcept;

    // --- Lifecycle transitions (SlotLifecycleController) ---

    /**
     * @brief Makes `slot` Active and demotes any other Active slot to Uploaded in one step.
     *        Errors: InvalidSlot, SlotNotUploaded.
     */
    [[nodiscard]] DlcStatus mark_active(int slot);

    /// Demotes the Active slot, if any, to Uploaded. Returns the demoted index.
    std::optional<int> demote_active();

    /// Errors: InvalidSlot, SlotInUse (Active), SlotBusy (being uploaded).
    [[nodiscard]] DlcStatus mark_empty(int slot);

    /**
     * @brief Holds `slot` while a lifecycle command for it is on the wire. begin_upload()
     *        on a held slot fails with SlotBusy until release_command_hold().
     *        Errors: InvalidSlot, SlotBusy (the slot is being uploaded).
     */
    [[nodiscard]] DlcStatus hold_for_command(int slot);
    void release_command_hold(int slot) noexcept;

    /**
     * @brief Replaces every slot with device-reported states. A slot this connection is
     *        uploading keeps Uploading; any other slot the device reports as Uploading is
     *        an interrupted transfer and becomes Empty. Only the first Active slot is kept.
     * @return The snapshot actually stored.
     * @throws std::invalid_argument if the size does not match slot_count().
     */
    SlotSnapshot replace_all(const SlotSnapshot &states);

    void set_listener(Listener listener);

  private:
    void notify(const SlotSnapshot &snap) const noexcept;

    mutable std::mutex m_mutex;
    SlotSnapshot m_slots;
    std::optional<int> m_uploading;
    std::optional<int> m_command_hold;
    Listener m_listener;
};

} // namespace plushlink::dlc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
