#include "udprelay/ListenerSpec.hpp"
#include "udprelay/AddressParseException.hpp"

using namespace udprelay;

ListenerSpec ListenerSpec::fromAddress(const SocketAddress& address)
{
    if (!address.isMulticast())
        return ListenerSpec(UnicastListener{address});

    if (address.isIPv4())
    {
        in_addr any{};
        any.s_addr = htonl(INADDR_ANY);
        return ListenerSpec(MulticastV4Listener{address, any});
    }

    return ListenerSpec(MulticastV6Listener{address, 0});
}

ListenerSpec ListenerSpec::multicastV4(const SocketAddress& group, const in_addr localAddress)
{
    if (!group.isIPv4() || !group.isMulticast())
        throw AddressParseException("not an IPv4 multicast group", group.toString());

    return ListenerSpec(MulticastV4Listener{group, localAddress});
}

ListenerSpec ListenerSpec::multicastV6(const SocketAddress& group, const std::uint32_t interfaceId)
{
    if (!group.isIPv6() || !group.isMulticast())
        throw AddressParseException("not an IPv6 multicast group", group.toString());

    return ListenerSpec(MulticastV6Listener{group, interfaceId});
}

const SocketAddress& ListenerSpec::address() const noexcept
{
    if (const auto* unicast = asUnicast())
        return unicast->address;
    if (const auto* v4 = asMulticastV4())
        return v4->group;
    return std::get<MulticastV6Listener>(_variant).group;
}

std::string ListenerSpec::toString() const
{
    std::string out = address().toString();

    if (const auto* v4 = asMulticastV4(); v4 && v4->localAddress.s_addr != htonl(INADDR_ANY))
        out.append("/").append(ipv4ToString(v4->localAddress));
    else if (const auto* v6 = asMulticastV6(); v6 && v6->interfaceId != 0)
        out.append("/").append(std::to_string(v6->interfaceId));

    return out;
}

namespace udprelay
{

bool operator==(const ListenerSpec& lhs, const ListenerSpec& rhs) noexcept
{
    if (lhs.kind() != rhs.kind() || lhs.address() != rhs.address())
        return false;

    if (const auto* v4 = lhs.asMulticastV4())
        return sameIPv4(v4->localAddress, rhs.asMulticastV4()->localAddress);
    if (const auto* v6 = lhs.asMulticastV6())
        return v6->interfaceId == rhs.asMulticastV6()->interfaceId;
    return true;
}

std::ostream& operator<<(std::ostream& os, const ListenerSpec& spec)
{
    switch (spec.kind())
    {
        case ListenerSpec::Kind::Unicast:
            return os << "Unicast(" << spec.toString() << ")";
        case ListenerSpec::Kind::MulticastV4:
            return os << "MulticastV4(" << spec.address() << ", local "
                      << ipv4ToString(spec.asMulticastV4()->localAddress) << ")";
        case ListenerSpec::Kind::MulticastV6:
            return os << "MulticastV6(" << spec.address() << ", interface " << spec.asMulticastV6()->interfaceId
                      << ")";
    }
    return os;
}

} // namespace udprelay
