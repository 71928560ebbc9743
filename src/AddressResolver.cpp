#include "udprelay/AddressResolver.hpp"
#include "udprelay/AddressParseException.hpp"

using namespace udprelay;

namespace
{

constexpr const char* InvalidListener = "invalid listener specification";

} // namespace

ListenerSpec udprelay::resolveListener(const std::string_view text)
{
    if (const auto addr = SocketAddress::tryParse(text))
        return ListenerSpec::fromAddress(*addr);

    const auto slash = text.find('/');
    if (slash == std::string_view::npos)
        throw AddressParseException(InvalidListener, text);

    const auto group = SocketAddress::tryParse(text.substr(0, slash));
    if (!group || !group->isMulticast())
        throw AddressParseException(InvalidListener, text);

    const std::string_view detail = text.substr(slash + 1);

    if (group->isIPv4())
    {
        const auto localAddress = parseIPv4Address(detail);
        if (!localAddress)
            throw AddressParseException(InvalidListener, text);
        return ListenerSpec::multicastV4(*group, *localAddress);
    }

    // One leading '+' is accepted before the digits of the interface index
    const std::string_view digits = detail.starts_with('+') ? detail.substr(1) : detail;
    const auto interfaceId = internal::parseDecimal<std::uint32_t>(digits);
    if (!interfaceId)
        throw AddressParseException(InvalidListener, text);
    return ListenerSpec::multicastV6(*group, *interfaceId);
}

std::vector<SocketAddress> udprelay::resolveDestinations(const std::span<const std::string> tokens)
{
    std::vector<SocketAddress> destinations;
    destinations.reserve(tokens.size());

    for (const auto& token : tokens)
        destinations.push_back(SocketAddress::parse(token));

    return destinations;
}
