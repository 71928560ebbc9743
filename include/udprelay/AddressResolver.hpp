/**
 * @file AddressResolver.hpp
 * @brief Text to listener specification and destination list.
 */

#pragma once

#include "ListenerSpec.hpp"
#include "SocketAddress.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace udprelay
{

/**
 * @brief Parse a listener specification.
 * @ingroup addressing
 *
 * Grammar:
 * - `<ipv4>:<port>` or `[<ipv6>]:<port>`: a unicast listener, or a multicast listener
 *   with default interface selection when the IP is multicast.
 * - `<ipv4-multicast>:<port>/<ipv4>`: IPv4 group joined on the interface owning the
 *   given local address.
 * - `[<ipv6-multicast>]:<port>/<index>`: IPv6 group joined on the interface with the
 *   given numeric index. The index is decimal and may carry one leading `+`.
 *
 * A `/detail` suffix is only valid after a multicast group, and the detail must match
 * the group's family.
 *
 * @code
 * resolveListener("10.1.1.10:4000");                // Unicast(10.1.1.10:4000)
 * resolveListener("224.10.10.10:4000");             // MulticastV4(224.10.10.10:4000, 0.0.0.0)
 * resolveListener("224.10.10.10:4000/192.168.1.10"); // MulticastV4(224.10.10.10:4000, 192.168.1.10)
 * resolveListener("[ff0e::1]:4000/2");              // MulticastV6([ff0e::1]:4000, 2)
 * @endcode
 *
 * @throws AddressParseException with the message `invalid listener specification`
 *         for any malformed input.
 */
ListenerSpec resolveListener(std::string_view text);

/**
 * @brief Parse destination socket addresses, unicast or multicast, IPv4 or IPv6.
 * @ingroup addressing
 *
 * Order is preserved. An empty input yields an empty list.
 *
 * @throws AddressParseException for the first token that is not a socket address;
 *         `token()` names it and `what()` holds the parse diagnostic.
 */
std::vector<SocketAddress> resolveDestinations(std::span<const std::string> tokens);

} // namespace udprelay
