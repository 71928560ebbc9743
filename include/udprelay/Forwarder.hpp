/**
 * @file Forwarder.hpp
 * @brief Receive-and-fan-out loop of the relay.
 */

#pragma once

#include "common.hpp"
#include "ListenerSpec.hpp"
#include "Senders.hpp"
#include "SocketAddress.hpp"
#include "UdpSocket.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace udprelay
{

/**
 * @brief Opens the socket described by @p spec.
 * @ingroup forwarding
 *
 * - Unicast: bind to the address.
 * - IPv4 multicast: bind to `0.0.0.0:<group port>`, then join the group on the
 *   interface owning the local address.
 * - IPv6 multicast: bind to `[::]:<group port>`, then join the group on the interface
 *   index.
 *
 * @throws SocketException if the bind or the group join fails. Firewall rules and
 *         interfaces without multicast support are common causes of join failures.
 */
UdpSocket openListener(const ListenerSpec& spec);

/**
 * @class Forwarder
 * @ingroup forwarding
 * @brief Relays every datagram received on the listener to a fixed list of destinations.
 *
 * Single-threaded and blocking. Each datagram is copied, unmodified, to every
 * destination in list order before the next one is received. Datagrams longer than
 * MtuPayloadSize are truncated. The origin of a datagram is not looked at.
 *
 * Any receive or send failure ends relaying with a SocketException. Destinations
 * earlier in the list may already have received the datagram; nothing is retried.
 *
 * ### Example
 * @code
 * SocketInitializer init;
 * Forwarder forwarder(resolveListener("224.10.10.10:4000"),
 *                     resolveDestinations(std::vector<std::string>{"127.0.0.1:4001", "[::1]:4002"}));
 * forwarder.run(); // returns only by throwing
 * @endcode
 */
class Forwarder
{
  public:
    /**
     * @brief Opens the listener, then the senders for @p destinations.
     *
     * @throws std::invalid_argument if @p destinations is empty.
     * @throws SocketException if any socket cannot be opened, bound or joined.
     */
    Forwarder(const ListenerSpec& listener, std::vector<SocketAddress> destinations);

    /**
     * @brief Relays one datagram.
     *
     * Blocks until a datagram arrives, then sends it to every destination.
     *
     * @return Number of bytes relayed to each destination.
     * @throws SocketException on a receive or send failure.
     */
    std::size_t relayOnce();

    /**
     * @brief Relays datagrams until an I/O error occurs.
     *
     * @throws SocketException on the first receive or send failure.
     */
    [[noreturn]] void run();

    /**
     * @brief The bound listener address (useful when listening on port 0).
     */
    [[nodiscard]] SocketAddress getListenerAddress() const { return _listener.getLocalAddress(); }

    [[nodiscard]] const std::vector<SocketAddress>& destinations() const noexcept { return _destinations; }

    [[nodiscard]] const Senders& senders() const noexcept { return _senders; }

  private:
    std::vector<SocketAddress> _destinations;
    UdpSocket _listener;
    Senders _senders;
    std::array<std::byte, MtuPayloadSize> _buffer{}; ///< Reused for every datagram.
};

} // namespace udprelay
