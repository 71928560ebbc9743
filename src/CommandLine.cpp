#include "udprelay/CommandLine.hpp"
#include "udprelay/AddressParseException.hpp"
#include "udprelay/AddressResolver.hpp"

#include <optional>
#include <utility>

using namespace udprelay;

namespace
{

constexpr std::string_view Usage = R"(UDP relay

usage: udprelay <listener_spec> <target_addr> [<target_addr>...]

listener_spec:

  <ipv4>:<port>                   unicast, or IPv4 multicast group on any interface
  [<ipv6>]:<port>                 unicast, or IPv6 multicast group on the default interface
  <ipv4-group>:<port>/<local_ip>  IPv4 multicast group joined on the interface owning local_ip
  [<ipv6-group>]:<port>/<index>   IPv6 multicast group joined on interface number index

examples:

  Relay an incoming IPv4 unicast stream to IPv4 localhost

    udprelay 10.1.1.10:4000 127.0.0.1:4001

  Relay an incoming IPv4 unicast stream to IPv4 and IPv6 localhost

    udprelay 10.1.1.10:4000 127.0.0.1:4001 [::1]:4002

  Join an IPv4 multicast group on any interface and relay to a remote address

    udprelay 224.10.10.10:4000 10.1.1.11:4000

  Join an IPv4 multicast group on the interface with local address 192.168.1.10
  and relay to a local port

    udprelay 224.10.10.10:4000/192.168.1.10 127.0.0.1:4001

  Join an IPv6 multicast group on interface 2 and relay to a local port

    udprelay [ff05::1]:4000/2 [::1]:4001
)";

} // namespace

Arguments udprelay::parseArguments(const std::span<const std::string> args)
{
    if (args.empty())
        throw ArgumentException(ArgumentError::MissingArguments, "Missing arguments");

    const std::string& first = args.front();
    if (first == "--help" || first == "-h")
        throw ArgumentException(ArgumentError::HelpRequested, "Help requested");

    std::optional<ListenerSpec> listener;
    try
    {
        listener = resolveListener(first);
    }
    catch (const AddressParseException&)
    {
        throw ArgumentException(ArgumentError::InvalidListener, "Failed to parse the listener specification");
    }

    std::vector<SocketAddress> destinations;
    try
    {
        destinations = resolveDestinations(args.subspan(1));
    }
    catch (const AddressParseException& ex)
    {
        throw ArgumentException(ArgumentError::InvalidDestination,
                                "Failed to parse a destination address '" + ex.token() + "': " + ex.what());
    }

    if (destinations.empty())
        throw ArgumentException(ArgumentError::MissingArguments, "Missing arguments");

    return Arguments{*listener, std::move(destinations)};
}

std::string_view udprelay::usage() noexcept
{
    return Usage;
}
