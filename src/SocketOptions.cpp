// SocketOptions.cpp

#include "udprelay/SocketOptions.hpp"
#include "udprelay/SocketException.hpp"

namespace udprelay
{

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setOption(const int level, const int optName, const int value)
{
    setOption(level, optName, &value, static_cast<socklen_t>(sizeof(value)));
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setOption(const int level, const int optName, const void* value, const socklen_t len)
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("setOption() failed: socket not open.");

    if (!value || len == 0)
        throw SocketException("setOption() failed: null buffer or zero length.");

    if (::setsockopt(_sockFd, level, optName,
#ifdef _WIN32
                     static_cast<const char*>(value),
#else
                     value,
#endif
                     len) < 0)
    {
        internal::throwLastSockError();
    }
}

int SocketOptions::getOption(const int level, const int optName) const
{
    int value = 0;
    socklen_t len = sizeof(value);

    getOption(level, optName, &value, &len);
    return value;
}

void SocketOptions::getOption(const int level, const int optName, void* result, socklen_t* len) const
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("getOption() failed: socket not open.");

    if (!result || !len || *len == 0)
        throw SocketException("getOption() failed: invalid buffer or length.");

    if (::getsockopt(_sockFd, level, optName,
#ifdef _WIN32
                     static_cast<char*>(result),
#else
                     result,
#endif
                     len) < 0)
    {
        internal::throwLastSockError();
    }
}

void SocketOptions::setSoRecvTimeout(const int millis)
{
    if (millis < 0)
        throw SocketException("setSoRecvTimeout() failed: timeout must be non-negative.");

#ifdef _WIN32
    const auto timeout = static_cast<DWORD>(millis);
#else
    timeval timeout{};
    timeout.tv_sec = millis / 1000;
    timeout.tv_usec = (millis % 1000) * 1000;
#endif
    setOption(SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
}

int SocketOptions::getSoRecvTimeout() const
{
#ifdef _WIN32
    DWORD timeout = 0;
    socklen_t len = sizeof(timeout);
    getOption(SOL_SOCKET, SO_RCVTIMEO, &timeout, &len);
    return static_cast<int>(timeout);
#else
    timeval timeout{};
    socklen_t len = sizeof(timeout);
    getOption(SOL_SOCKET, SO_RCVTIMEO, &timeout, &len);
    return static_cast<int>(timeout.tv_sec * 1000 + timeout.tv_usec / 1000);
#endif
}

void SocketOptions::joinGroupIPv4(const in_addr group, const in_addr iface)
{
    if (!IN_MULTICAST(ntohl(group.s_addr)))
        throw SocketException("joinGroupIPv4() failed: not an IPv4 multicast address.");

    ip_mreq mreq{};
    mreq.imr_multiaddr = group;
    mreq.imr_interface = iface;
    setOption(IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq));
}

void SocketOptions::joinGroupIPv6(const in6_addr& group, const unsigned int ifindex)
{
    if (!IN6_IS_ADDR_MULTICAST(&group))
        throw SocketException("joinGroupIPv6() failed: not an IPv6 multicast address.");

    ipv6_mreq mreq{};
    mreq.ipv6mr_multiaddr = group;
    mreq.ipv6mr_interface = ifindex;
    setOption(IPPROTO_IPV6, IPV6_JOIN_GROUP, &mreq, sizeof(mreq));
}

void SocketOptions::setMulticastInterfaceIPv4(const in_addr addr)
{
#if defined(_WIN32)
    // Windows expects a DWORD containing the IPv4 address in network byte order
    const auto v = static_cast<DWORD>(addr.s_addr);
    setOption(IPPROTO_IP, IP_MULTICAST_IF, &v, sizeof(v));
#else
    setOption(IPPROTO_IP, IP_MULTICAST_IF, &addr, sizeof(addr));
#endif
}

} // namespace udprelay
