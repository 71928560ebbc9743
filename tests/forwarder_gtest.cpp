// GoogleTest unit tests for the forwarding engine
#include "test_helpers.hpp"
#include "udprelay/AddressResolver.hpp"
#include "udprelay/Forwarder.hpp"
#include "udprelay/ListenerSpec.hpp"
#include "udprelay/Senders.hpp"
#include "udprelay/SocketException.hpp"
#include "udprelay/SocketInitializer.hpp"
#include "udprelay/SocketTimeoutException.hpp"
#include <array>
#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace udprelay;
using namespace udprelay::test;

namespace
{

std::string receiveText(const UdpSocket& socket)
{
    std::array<std::byte, MaxUdpPayloadIPv4> buf{};
    const std::size_t n = socket.receive(buf);
    return asString(std::span(buf).first(n));
}

Port unusedPort()
{
    const UdpSocket probe(SocketAddress::parse("127.0.0.1:0"));
    return probe.getLocalAddress().port();
}

} // namespace

TEST(ForwarderTest, RelaysInOrderToEveryDestination)
{
    SocketInitializer init;
    const UdpSocket first = loopbackReceiver();
    const UdpSocket second = loopbackReceiver();
    Forwarder forwarder(ListenerSpec::fromAddress(SocketAddress::parse("127.0.0.1:0")),
                        {first.getLocalAddress(), second.getLocalAddress()});
    const UdpSocket client(SocketAddress::anyIPv4());

    for (int i = 0; i < 10; ++i)
    {
        const std::string msg = "packet number " + std::to_string(i);
        client.sendTo(asBytes(msg), forwarder.getListenerAddress());
        EXPECT_EQ(forwarder.relayOnce(), msg.size());
    }

    for (int i = 0; i < 10; ++i)
    {
        const std::string expected = "packet number " + std::to_string(i);
        EXPECT_EQ(receiveText(first), expected);
        EXPECT_EQ(receiveText(second), expected);
    }
}

TEST(ForwarderTest, DuplicateDestinationReceivesTwice)
{
    SocketInitializer init;
    const UdpSocket receiver = loopbackReceiver();
    Forwarder forwarder(ListenerSpec::fromAddress(SocketAddress::parse("127.0.0.1:0")),
                        {receiver.getLocalAddress(), receiver.getLocalAddress()});
    const UdpSocket client(SocketAddress::anyIPv4());

    client.sendTo(asBytes("twice"), forwarder.getListenerAddress());
    forwarder.relayOnce();

    EXPECT_EQ(receiveText(receiver), "twice");
    EXPECT_EQ(receiveText(receiver), "twice");
}

TEST(ForwarderTest, RelaysAcrossAddressFamilies)
{
    SocketInitializer init;
    if (!ipv6LoopbackAvailable())
        GTEST_SKIP() << "IPv6 loopback not available";

    const UdpSocket v4 = loopbackReceiver();
    UdpSocket v6(SocketAddress::parse("[::1]:0"));
    v6.setSoRecvTimeout(2000);

    Forwarder forwarder(ListenerSpec::fromAddress(SocketAddress::parse("127.0.0.1:0")),
                        {v4.getLocalAddress(), v6.getLocalAddress()});
    ASSERT_TRUE(forwarder.senders().ipv4().has_value());
    ASSERT_TRUE(forwarder.senders().ipv6().has_value());

    const UdpSocket client(SocketAddress::anyIPv4());
    client.sendTo(asBytes("both families"), forwarder.getListenerAddress());
    forwarder.relayOnce();

    EXPECT_EQ(receiveText(v4), "both families");
    EXPECT_EQ(receiveText(v6), "both families");
}

TEST(ForwarderTest, TruncatesToMtuPayload)
{
    SocketInitializer init;
    const UdpSocket receiver = loopbackReceiver();
    Forwarder forwarder(ListenerSpec::fromAddress(SocketAddress::parse("127.0.0.1:0")), {receiver.getLocalAddress()});
    const UdpSocket client(SocketAddress::anyIPv4());

    std::string msg;
    for (int i = 0; i < 2000; ++i)
        msg.push_back(static_cast<char>('a' + i % 26));
    client.sendTo(asBytes(msg), forwarder.getListenerAddress());

    EXPECT_EQ(forwarder.relayOnce(), MtuPayloadSize);
    EXPECT_EQ(receiveText(receiver), msg.substr(0, MtuPayloadSize));
}

TEST(ForwarderTest, RelaysEmptyDatagram)
{
    SocketInitializer init;
    const UdpSocket receiver = loopbackReceiver();
    Forwarder forwarder(ListenerSpec::fromAddress(SocketAddress::parse("127.0.0.1:0")), {receiver.getLocalAddress()});
    const UdpSocket client(SocketAddress::anyIPv4());

    client.sendTo({}, forwarder.getListenerAddress());
    EXPECT_EQ(forwarder.relayOnce(), 0u);
    EXPECT_EQ(receiveText(receiver), "");
}

TEST(ForwarderTest, RequiresDestinations)
{
    SocketInitializer init;
    EXPECT_THROW(Forwarder(ListenerSpec::fromAddress(SocketAddress::parse("127.0.0.1:0")), {}),
                 std::invalid_argument);
}

TEST(ForwarderTest, ListenerPortInUse)
{
    SocketInitializer init;
    const UdpSocket occupant(SocketAddress::parse("127.0.0.1:0"));
    EXPECT_THROW(Forwarder(ListenerSpec::fromAddress(occupant.getLocalAddress()),
                           {SocketAddress::parse("127.0.0.1:9")}),
                 SocketException);
}

TEST(ForwarderTest, SendFailureStopsRun)
{
    SocketInitializer init;
    const UdpSocket good = loopbackReceiver();
    // Broadcast without SO_BROADCAST is refused by the sender
    Forwarder forwarder(ListenerSpec::fromAddress(SocketAddress::parse("127.0.0.1:0")),
                        {good.getLocalAddress(), SocketAddress::parse("255.255.255.255:9")});
    const UdpSocket client(SocketAddress::anyIPv4());

    client.sendTo(asBytes("partial"), forwarder.getListenerAddress());
    EXPECT_THROW(forwarder.run(), SocketException);

    // Destinations before the failing one already got the datagram
    EXPECT_EQ(receiveText(good), "partial");
}

TEST(ForwarderTest, MulticastListenerBindsWildcard)
{
    SocketInitializer init;
    const Port port = unusedPort();
    const UdpSocket receiver = loopbackReceiver();

    try
    {
        Forwarder forwarder(resolveListener("239.255.10.10:" + std::to_string(port)), {receiver.getLocalAddress()});
        EXPECT_EQ(forwarder.getListenerAddress(), SocketAddress::anyIPv4(port));

        const UdpSocket client(SocketAddress::anyIPv4());
        client.sendTo(asBytes("via wildcard"), SocketAddress::parse("127.0.0.1:" + std::to_string(port)));
        forwarder.relayOnce();
        EXPECT_EQ(receiveText(receiver), "via wildcard");
    }
    catch (const SocketException& ex)
    {
        GTEST_SKIP() << "Multicast join not available: " << ex.what();
    }
}

TEST(ForwarderTest, MulticastLoopback)
{
    SocketInitializer init;
    const Port port = unusedPort();
    const std::string group = "239.255.10.11:" + std::to_string(port);

    std::optional<UdpSocket> listener;
    try
    {
        listener.emplace(openListener(resolveListener(group + "/127.0.0.1")));
    }
    catch (const SocketException& ex)
    {
        GTEST_SKIP() << "Multicast join not available: " << ex.what();
    }
    listener->setSoRecvTimeout(500);

    UdpSocket sender(SocketAddress::anyIPv4());
    sender.setMulticastInterfaceIPv4(*parseIPv4Address("127.0.0.1"));
    try
    {
        sender.sendTo(asBytes("group"), SocketAddress::parse(group));
        EXPECT_EQ(receiveText(*listener), "group");
    }
    catch (const SocketException& ex)
    {
        GTEST_SKIP() << "Multicast delivery not available: " << ex.what();
    }
}

TEST(ForwarderTest, MulticastListenerIPv6)
{
    SocketInitializer init;
    if (!ipv6LoopbackAvailable())
        GTEST_SKIP() << "IPv6 loopback not available";

    try
    {
        const UdpSocket listener = openListener(resolveListener("[ff02::1:3]:0"));
        EXPECT_TRUE(listener.getLocalAddress().isIPv6());
    }
    catch (const SocketException& ex)
    {
        GTEST_SKIP() << "IPv6 multicast join not available: " << ex.what();
    }
}

TEST(SendersTest, OpensOnlyNeededFamilies)
{
    SocketInitializer init;
    const std::vector<SocketAddress> v4Only{SocketAddress::parse("127.0.0.1:4001"),
                                            SocketAddress::parse("10.0.0.1:4002")};
    const Senders senders = Senders::forDestinations(v4Only);
    EXPECT_TRUE(senders.ipv4().has_value());
    EXPECT_FALSE(senders.ipv6().has_value());

    // Senders are bound to the wildcard address on an ephemeral port
    const SocketAddress local = senders.ipv4()->getLocalAddress();
    EXPECT_EQ(local.ipString(), "0.0.0.0");
    EXPECT_NE(local.port(), 0);
}

TEST(SendersTest, NoDestinationsNoSockets)
{
    SocketInitializer init;
    const Senders senders = Senders::forDestinations({});
    EXPECT_FALSE(senders.ipv4().has_value());
    EXPECT_FALSE(senders.ipv6().has_value());
}

TEST(SendersTest, MissingFamilyIsLogicError)
{
    SocketInitializer init;
    const std::vector<SocketAddress> v4Only{SocketAddress::parse("127.0.0.1:4001")};
    const Senders senders = Senders::forDestinations(v4Only);
    EXPECT_THROW(senders.sendTo(asBytes("x"), SocketAddress::parse("[::1]:4001")), std::logic_error);
}

TEST(SendersTest, SendsFromMatchingFamily)
{
    SocketInitializer init;
    const UdpSocket receiver = loopbackReceiver();
    const std::vector<SocketAddress> destinations{receiver.getLocalAddress()};
    const Senders senders = Senders::forDestinations(destinations);

    senders.sendTo(asBytes("hello"), receiver.getLocalAddress());
    EXPECT_EQ(receiveText(receiver), "hello");
}
