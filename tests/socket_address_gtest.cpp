// GoogleTest unit tests for SocketAddress parsing and formatting
#include "udprelay/AddressParseException.hpp"
#include "udprelay/SocketAddress.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace udprelay;

TEST(SocketAddressTest, ParseIPv4)
{
    const auto addr = SocketAddress::tryParse("10.1.1.10:4000");
    ASSERT_TRUE(addr.has_value());
    EXPECT_TRUE(addr->isIPv4());
    EXPECT_FALSE(addr->isIPv6());
    EXPECT_EQ(addr->port(), 4000);
    EXPECT_EQ(addr->ipString(), "10.1.1.10");
    EXPECT_EQ(addr->toString(), "10.1.1.10:4000");
    EXPECT_FALSE(addr->isMulticast());
}

TEST(SocketAddressTest, ParseIPv6)
{
    const auto addr = SocketAddress::tryParse("[2001::1]:4000");
    ASSERT_TRUE(addr.has_value());
    EXPECT_TRUE(addr->isIPv6());
    EXPECT_EQ(addr->port(), 4000);
    EXPECT_EQ(addr->scopeId(), 0u);
    EXPECT_EQ(addr->toString(), "[2001::1]:4000");
    EXPECT_FALSE(addr->isMulticast());
}

TEST(SocketAddressTest, ParseIPv6WithScope)
{
    const auto addr = SocketAddress::tryParse("[fe80::1%3]:5353");
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(addr->scopeId(), 3u);
    EXPECT_EQ(addr->toString(), "[fe80::1%3]:5353");
}

TEST(SocketAddressTest, PortBounds)
{
    EXPECT_EQ(SocketAddress::parse("127.0.0.1:0").port(), 0);
    EXPECT_EQ(SocketAddress::parse("127.0.0.1:65535").port(), 65535);
    EXPECT_EQ(SocketAddress::parse("127.0.0.1:08080").port(), 8080);
    EXPECT_EQ(SocketAddress::parse("1.2.3.4:004000").port(), 4000);
    EXPECT_EQ(SocketAddress::parse("[::1]:0000000000065535").port(), 65535);
    EXPECT_FALSE(SocketAddress::tryParse("127.0.0.1:65536"));
    EXPECT_FALSE(SocketAddress::tryParse("127.0.0.1:99999999999999999999"));
}

TEST(SocketAddressTest, RejectsMalformedText)
{
    for (const std::string text : {"", "10.1.1.10", "10.1.1.10:", ":4000", "10.1.1:4000", "10.1.1.256:4000",
                                   "010.1.1.10:4000", "10.1.1.10:-1", "10.1.1.10:+80", " 10.1.1.10:4000",
                                   "10.1.1.10:4000 ", "localhost:4000", "::1:4000", "[::1]", "[::1]4000",
                                   "[::1]:4000]", "[::1%eth0]:4000", "[10.1.1.10]:4000", "[::1]:4000/2",
                                   "10.1.1.10:4000/192.168.1.10"})
    {
        EXPECT_FALSE(SocketAddress::tryParse(text).has_value()) << "accepted: '" << text << "'";
    }
}

TEST(SocketAddressTest, ParseThrowsWithToken)
{
    try
    {
        (void) SocketAddress::parse("not-an-address");
        FAIL() << "expected AddressParseException";
    }
    catch (const AddressParseException& ex)
    {
        EXPECT_EQ(ex.token(), "not-an-address");
        EXPECT_STREQ(ex.what(), "invalid socket address syntax");
    }
}

TEST(SocketAddressTest, MulticastRanges)
{
    EXPECT_TRUE(SocketAddress::parse("224.0.0.1:1").isMulticast());
    EXPECT_TRUE(SocketAddress::parse("224.10.10.10:4000").isMulticast());
    EXPECT_TRUE(SocketAddress::parse("239.255.255.255:1").isMulticast());
    EXPECT_FALSE(SocketAddress::parse("223.255.255.255:1").isMulticast());
    EXPECT_FALSE(SocketAddress::parse("240.0.0.1:1").isMulticast());

    EXPECT_TRUE(SocketAddress::parse("[ff0e::1]:4000").isMulticast());
    EXPECT_TRUE(SocketAddress::parse("[ff02::fb]:5353").isMulticast());
    EXPECT_FALSE(SocketAddress::parse("[fe80::1]:1").isMulticast());
    EXPECT_FALSE(SocketAddress::parse("[::1]:1").isMulticast());
}

TEST(SocketAddressTest, Wildcards)
{
    const SocketAddress any4 = SocketAddress::anyIPv4(4000);
    EXPECT_TRUE(any4.isIPv4());
    EXPECT_EQ(any4.toString(), "0.0.0.0:4000");
    EXPECT_EQ(any4, SocketAddress::parse("0.0.0.0:4000"));
    EXPECT_EQ(SocketAddress(), SocketAddress::anyIPv4());

    const SocketAddress any6 = SocketAddress::anyIPv6();
    EXPECT_TRUE(any6.isIPv6());
    EXPECT_EQ(any6.toString(), "[::]:0");
}

TEST(SocketAddressTest, Equality)
{
    EXPECT_EQ(SocketAddress::parse("[2001:db8::1]:80"), SocketAddress::parse("[2001:0db8:0:0::1]:80"));
    EXPECT_NE(SocketAddress::parse("127.0.0.1:80"), SocketAddress::parse("127.0.0.1:81"));
    EXPECT_NE(SocketAddress::parse("127.0.0.1:80"), SocketAddress::parse("127.0.0.2:80"));
    EXPECT_NE(SocketAddress::parse("[::1]:80"), SocketAddress::parse("127.0.0.1:80"));
    EXPECT_NE(SocketAddress::parse("[fe80::1%1]:80"), SocketAddress::parse("[fe80::1%2]:80"));
}

TEST(SocketAddressTest, SockaddrRoundTrip)
{
    const SocketAddress addr = SocketAddress::parse("[ff0e::1]:4000");
    EXPECT_EQ(addr.size(), static_cast<socklen_t>(sizeof(sockaddr_in6)));
    EXPECT_EQ(SocketAddress::fromSockaddr(addr.data(), addr.size()), addr);

    sockaddr_storage unsupported{};
    unsupported.ss_family = AF_UNSPEC;
    EXPECT_THROW(SocketAddress::fromSockaddr(reinterpret_cast<const sockaddr*>(&unsupported), sizeof(unsupported)),
                 SocketException);
}

TEST(SocketAddressTest, ParseIPv4AddressWithoutPort)
{
    const auto ip = parseIPv4Address("192.168.1.10");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(ipv4ToString(*ip), "192.168.1.10");

    EXPECT_FALSE(parseIPv4Address(""));
    EXPECT_FALSE(parseIPv4Address("192.168.1.10:80"));
    EXPECT_FALSE(parseIPv4Address("::1"));
    EXPECT_FALSE(parseIPv4Address("2"));
}
