#pragma once
/**
 * @file transport.hpp
 * @brief The link capability the DLC core consumes. Discovery, pairing and
 *        characteristic subscription live behind this interface.
 */
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>

#include "utils/result.hpp"

namespace plushlink::dlc
{

/// Write characteristics of the toy.
enum class Endpoint
{
    Command, ///< General-purpose command characteristic.
    File,    ///< Bulk file-data characteristic.
};

enum class TransportError
{
    NotConnected,
    WriteFailed,
    Oversized,
};

class Transport
{
  public:
    using NotifyHandler = std::function<void(std::span<const uint8_t>)>;
    using LinkLostHandler = std::function<void()>;

    virtual ~Transport() = default;

    /// One outbound write. No implicit chunking: `bytes` must fit max_write_size().
    [[nodiscard]] virtual utils::Status<TransportError> write(Endpoint endpoint,
                                                              std::span<const uint8_t> bytes) = 0;

    /**
     * @brief Installs the receiver for notification bytes from every notify characteristic.
     * Handlers are called one at a time, in arrival order. Passing an empty function detaches.
     */
    virtual void set_notify_handler(NotifyHandler handler) = 0;

    virtual void set_link_lost_handler(LinkLostHandler handler) = 0;

    /// Link-defined maximum payload of a single write.
    [[nodiscard]] virtual size_t max_write_size() const = 0;
};

} // namespace plushlink::dlc
