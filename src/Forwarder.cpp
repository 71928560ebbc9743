#include "udprelay/Forwarder.hpp"

#include <stdexcept>
#include <utility>

using namespace udprelay;

UdpSocket udprelay::openListener(const ListenerSpec& spec)
{
    if (const auto* unicast = spec.asUnicast())
        return UdpSocket(unicast->address);

    if (const auto* v4 = spec.asMulticastV4())
    {
        UdpSocket socket(SocketAddress::anyIPv4(v4->group.port()));
        socket.joinGroupIPv4(v4->group.ipv4(), v4->localAddress);
        return socket;
    }

    const auto& v6 = std::get<MulticastV6Listener>(spec.variant());
    UdpSocket socket(SocketAddress::anyIPv6(v6.group.port()));
    socket.joinGroupIPv6(v6.group.ipv6(), v6.interfaceId);
    return socket;
}

namespace
{

std::vector<SocketAddress> requireDestinations(std::vector<SocketAddress> destinations)
{
    if (destinations.empty())
        throw std::invalid_argument("Forwarder: at least one destination is required");
    return destinations;
}

} // namespace

Forwarder::Forwarder(const ListenerSpec& listener, std::vector<SocketAddress> destinations)
    : _destinations(requireDestinations(std::move(destinations))), _listener(openListener(listener)),
      _senders(Senders::forDestinations(_destinations))
{
}

std::size_t Forwarder::relayOnce()
{
    const std::size_t received = _listener.receive(_buffer);
    const std::span<const std::byte> datagram(_buffer.data(), received);

    for (const auto& destination : _destinations)
        _senders.sendTo(datagram, destination);

    return received;
}

void Forwarder::run()
{
    for (;;)
        relayOnce();
}
