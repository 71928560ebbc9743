/**
 * @file ListenerSpec.hpp
 * @brief Description of the address the relay receives on.
 */

#pragma once

#include "SocketAddress.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace udprelay
{

/**
 * @brief Receive on a unicast address, IPv4 or IPv6. The socket binds to it directly.
 * @ingroup addressing
 */
struct UnicastListener
{
    SocketAddress address;
};

/**
 * @brief Join an IPv4 multicast group on the interface owning @ref localAddress.
 * @ingroup addressing
 *
 * `localAddress` is `0.0.0.0` when no interface was given, letting the system choose.
 */
struct MulticastV4Listener
{
    SocketAddress group;
    in_addr localAddress;
};

/**
 * @brief Join an IPv6 multicast group on the interface with index @ref interfaceId.
 * @ingroup addressing
 *
 * `interfaceId` is 0 when no interface was given, letting the system choose.
 */
struct MulticastV6Listener
{
    SocketAddress group;
    std::uint32_t interfaceId;
};

/**
 * @class ListenerSpec
 * @ingroup addressing
 * @brief How the relay receives packets: a unicast address or a multicast group.
 *
 * A closed set of three variants. Instances are only created through the factories,
 * which enforce that a multicast variant holds a multicast group of its family and
 * that the unicast variant never holds a multicast address.
 *
 * @code
 * const ListenerSpec spec = ListenerSpec::multicastV4(SocketAddress::parse("224.10.10.10:4000"),
 *                                                     *parseIPv4Address("192.168.1.10"));
 * if (const auto* mc = spec.asMulticastV4())
 *     joinOn(mc->localAddress);
 * @endcode
 *
 * @see resolveListener()
 */
class ListenerSpec
{
  public:
    using Variant = std::variant<UnicastListener, MulticastV4Listener, MulticastV6Listener>;

    enum class Kind
    {
        Unicast,
        MulticastV4,
        MulticastV6
    };

    /**
     * @brief The listener for a bare socket address.
     *
     * A multicast address becomes the matching multicast variant with default
     * interface selection (`0.0.0.0` for IPv4, index 0 for IPv6). Any other address
     * becomes a unicast listener.
     */
    static ListenerSpec fromAddress(const SocketAddress& address);

    /**
     * @brief An IPv4 multicast listener.
     *
     * @throws AddressParseException if @p group is not an IPv4 multicast address.
     */
    static ListenerSpec multicastV4(const SocketAddress& group, in_addr localAddress);

    /**
     * @brief An IPv6 multicast listener.
     *
     * @throws AddressParseException if @p group is not an IPv6 multicast address.
     */
    static ListenerSpec multicastV6(const SocketAddress& group, std::uint32_t interfaceId);

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(_variant.index()); }

    [[nodiscard]] const UnicastListener* asUnicast() const noexcept { return std::get_if<UnicastListener>(&_variant); }

    [[nodiscard]] const MulticastV4Listener* asMulticastV4() const noexcept
    {
        return std::get_if<MulticastV4Listener>(&_variant);
    }

    [[nodiscard]] const MulticastV6Listener* asMulticastV6() const noexcept
    {
        return std::get_if<MulticastV6Listener>(&_variant);
    }

    /**
     * @brief The unicast address, or the multicast group.
     */
    [[nodiscard]] const SocketAddress& address() const noexcept;

    [[nodiscard]] const Variant& variant() const noexcept { return _variant; }

    /**
     * @brief Text form that resolveListener() accepts back, e.g. `"224.10.10.10:4000/192.168.1.10"`.
     *
     * Default interface selections are omitted.
     */
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const ListenerSpec& lhs, const ListenerSpec& rhs) noexcept;

  private:
    explicit ListenerSpec(Variant variant) : _variant(std::move(variant)) {}

    Variant _variant;
};

inline bool operator!=(const ListenerSpec& lhs, const ListenerSpec& rhs) noexcept
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const ListenerSpec& spec);

} // namespace udprelay
