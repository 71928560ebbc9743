/**
 * @file Senders.hpp
 * @brief One outbound UDP socket per address family present in a destination list.
 */

#pragma once

#include "SocketAddress.hpp"
#include "UdpSocket.hpp"

#include <optional>
#include <span>
#include <utility>

namespace udprelay
{

/**
 * @class Senders
 * @ingroup forwarding
 * @brief The relay's sending sockets: at most one IPv4 and one IPv6 socket.
 *
 * Each socket is bound to the wildcard address of its family on an ephemeral port
 * and only exists when the destination list holds an address of that family. The
 * sockets are created once and reused for every datagram.
 */
class Senders
{
  public:
    /**
     * @brief Opens the senders needed to reach every address in @p destinations.
     *
     * @throws SocketException if binding either socket fails.
     */
    static Senders forDestinations(std::span<const SocketAddress> destinations);

    /**
     * @brief Sends @p data to @p destination through the socket of its family.
     *
     * @throws std::logic_error if no socket exists for the destination's family. That
     *         cannot happen for destinations taken from the list the senders were built
     *         from.
     * @throws SocketException if the send fails.
     */
    void sendTo(std::span<const std::byte> data, const SocketAddress& destination) const;

    [[nodiscard]] const std::optional<UdpSocket>& ipv4() const noexcept { return _senderV4; }

    [[nodiscard]] const std::optional<UdpSocket>& ipv6() const noexcept { return _senderV6; }

  private:
    Senders(std::optional<UdpSocket> senderV4, std::optional<UdpSocket> senderV6) noexcept
        : _senderV4(std::move(senderV4)), _senderV6(std::move(senderV6))
    {
    }

    std::optional<UdpSocket> _senderV4; ///< Bound to 0.0.0.0:0 if any destination is IPv4.
    std::optional<UdpSocket> _senderV6; ///< Bound to [::]:0 if any destination is IPv6.
};

} // namespace udprelay
