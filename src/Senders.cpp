#include "udprelay/Senders.hpp"

#include <algorithm>
#include <stdexcept>

using namespace udprelay;

Senders Senders::forDestinations(const std::span<const SocketAddress> destinations)
{
    std::optional<UdpSocket> senderV4;
    if (std::any_of(destinations.begin(), destinations.end(), [](const SocketAddress& a) { return a.isIPv4(); }))
        senderV4.emplace(SocketAddress::anyIPv4());

    std::optional<UdpSocket> senderV6;
    if (std::any_of(destinations.begin(), destinations.end(), [](const SocketAddress& a) { return a.isIPv6(); }))
        senderV6.emplace(SocketAddress::anyIPv6());

    return {std::move(senderV4), std::move(senderV6)};
}

void Senders::sendTo(const std::span<const std::byte> data, const SocketAddress& destination) const
{
    const auto& sender = destination.isIPv4() ? _senderV4 : _senderV6;
    if (!sender)
        throw std::logic_error("Senders::sendTo(): no sender socket for the family of " + destination.toString());

    sender->sendTo(data, destination);
}
