/**
 * @file UdpSocket.hpp
 * @brief RAII UDP socket bound to a single local address.
 */

#pragma once

#include "common.hpp"
#include "SocketAddress.hpp"
#include "SocketOptions.hpp"

#include <cstddef>
#include <span>

namespace udprelay
{

/**
 * @class UdpSocket
 * @ingroup udp
 * @brief Unconnected UDP socket, created and bound in one step.
 *
 * The socket family follows the bind address: an IPv4 address yields an `AF_INET`
 * socket, an IPv6 address an `AF_INET6` socket. The descriptor is closed when the
 * object is destroyed. The class is move-only.
 *
 * ### Example
 * @code
 * UdpSocket receiver(SocketAddress::parse("127.0.0.1:4000"));
 * UdpSocket sender(SocketAddress::anyIPv4());
 *
 * const std::string msg = "hello";
 * sender.sendTo(std::as_bytes(std::span{msg}), receiver.getLocalAddress());
 *
 * std::array<std::byte, MtuPayloadSize> buf{};
 * const std::size_t n = receiver.receive(buf);
 * @endcode
 *
 * @note Not thread-safe.
 */
class UdpSocket : public SocketOptions
{
  public:
    /**
     * @brief Creates a UDP socket for the family of @p localAddress and binds it.
     *
     * A port of 0 binds an ephemeral port; use getLocalAddress() to learn it.
     *
     * @param[in] localAddress Address to bind, e.g. `0.0.0.0:0` or `[::1]:4001`.
     *
     * `SO_REUSEADDR` is not set, so binding a port that is already bound fails.
     *
     * @throws SocketException if the socket cannot be created or bound
     *         (e.g. address in use, address not available on this host).
     */
    explicit UdpSocket(const SocketAddress& localAddress);

    /**
     * @brief Closes the socket. Errors are ignored.
     */
    ~UdpSocket() noexcept override;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    UdpSocket(UdpSocket&& rhs) noexcept : SocketOptions(rhs.getSocketFd()), _family(rhs._family)
    {
        rhs.setSocketFd(INVALID_SOCKET);
    }

    UdpSocket& operator=(UdpSocket&& rhs) noexcept
    {
        if (this != &rhs)
        {
            // Close errors are not reportable from a noexcept move
            internal::tryCloseNoexcept(getSocketFd());
            setSocketFd(rhs.getSocketFd());
            _family = rhs._family;
            rhs.setSocketFd(INVALID_SOCKET);
        }
        return *this;
    }

    /**
     * @brief Blocks until one datagram arrives and copies it into @p buffer.
     *
     * The sender address is discarded. A datagram longer than @p buffer is truncated to
     * `buffer.size()` bytes; the truncation is not reported.
     *
     * @return Number of bytes stored in @p buffer (0 for an empty datagram).
     *
     * @throws SocketTimeoutException if a receive timeout is set and expires.
     * @throws SocketException on any other receive failure.
     */
    std::size_t receive(std::span<std::byte> buffer) const;

    /**
     * @brief Sends @p data as a single datagram to @p destination.
     *
     * An empty span sends an empty datagram.
     *
     * @throws SocketException if @p destination's family differs from the socket's,
     *         or `sendto()` fails or sends a partial datagram.
     */
    void sendTo(std::span<const std::byte> data, const SocketAddress& destination) const;

    /**
     * @brief The address the socket is bound to, with the actual port.
     *
     * @throws SocketException if `getsockname()` fails.
     */
    [[nodiscard]] SocketAddress getLocalAddress() const;

    /**
     * @brief `AF_INET` or `AF_INET6`.
     */
    [[nodiscard]] int family() const noexcept { return _family; }

    [[nodiscard]] bool isValid() const noexcept { return getSocketFd() != INVALID_SOCKET; }

    /**
     * @brief Closes the socket.
     *
     * @throws SocketException if closing fails.
     */
    void close();

  private:
    int _family; ///< Address family the socket was created with.

    void cleanupAndRethrow();
};

} // namespace udprelay
