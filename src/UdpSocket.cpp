#include "udprelay/UdpSocket.hpp"
#include "udprelay/SocketException.hpp"
#include "udprelay/SocketTimeoutException.hpp"

using namespace udprelay;

UdpSocket::UdpSocket(const SocketAddress& localAddress)
    : SocketOptions(INVALID_SOCKET), _family(localAddress.family())
{
    setSocketFd(::socket(_family, SOCK_DGRAM, IPPROTO_UDP));
    if (getSocketFd() == INVALID_SOCKET)
        internal::throwLastSockError();

    try
    {
        if (::bind(getSocketFd(), localAddress.data(), localAddress.size()) == SOCKET_ERROR)
            internal::throwLastSockError();
    }
    catch (const SocketException&)
    {
        cleanupAndRethrow();
    }
}

void UdpSocket::cleanupAndRethrow()
{
    internal::tryCloseNoexcept(getSocketFd());
    setSocketFd(INVALID_SOCKET);
    throw;
}

UdpSocket::~UdpSocket() noexcept
{
    internal::tryCloseNoexcept(getSocketFd());
}

void UdpSocket::close()
{
    internal::closeOrThrow(getSocketFd());
    setSocketFd(INVALID_SOCKET);
}

std::size_t UdpSocket::receive(const std::span<std::byte> buffer) const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("UdpSocket::receive(): socket is not open.");

    const auto n = internal::recvInto(getSocketFd(), buffer, 0);
    if (n == SOCKET_ERROR)
    {
        const int err = GetSocketError();
#ifdef _WIN32
        // Windows reports a truncated datagram as an error after filling the buffer
        if (err == WSAEMSGSIZE)
            return buffer.size();
        if (err == WSAETIMEDOUT)
            throw SocketTimeoutException();
#else
        if (err == EAGAIN || err == EWOULDBLOCK)
            throw SocketTimeoutException();
#endif
        throw SocketException(err, SocketErrorMessage(err));
    }

    return static_cast<std::size_t>(n);
}

void UdpSocket::sendTo(const std::span<const std::byte> data, const SocketAddress& destination) const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("UdpSocket::sendTo(): socket is not open.");

    if (destination.family() != _family)
        throw SocketException("UdpSocket::sendTo(): destination " + destination.toString() +
                              " does not match the socket's address family.");

    internal::sendExactTo(getSocketFd(), data, destination.data(), destination.size());
}

SocketAddress UdpSocket::getLocalAddress() const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("UdpSocket::getLocalAddress(): socket is not open.");

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(getSocketFd(), reinterpret_cast<sockaddr*>(&addr), &len) == SOCKET_ERROR)
        internal::throwLastSockError();

    return SocketAddress::fromSockaddr(reinterpret_cast<const sockaddr*>(&addr), len);
}
