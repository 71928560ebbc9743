/**
 * @file SocketOptions.hpp
 * @brief Socket option access shared by the udprelay socket classes.
 */

#pragma once

#include "common.hpp"

namespace udprelay
{

/**
 * @class SocketOptions
 * @ingroup udp
 * @brief Base class for raw socket option access via `setsockopt()` and `getsockopt()`.
 *
 * Derived socket classes pass their descriptor to the constructor and call
 * `setSocketFd()` after a move. This class does **not** own the descriptor and never
 * closes it.
 *
 * Besides the generic accessors it exposes the few tunables the relay needs:
 * address reuse, receive timeout and multicast group membership.
 *
 * @note Not thread-safe.
 */
class SocketOptions
{
  public:
    /**
     * @param[in] sock A socket descriptor, or `INVALID_SOCKET` if not yet created.
     */
    explicit SocketOptions(const SOCKET sock) noexcept : _sockFd(sock) {}

    virtual ~SocketOptions() = default;

    /**
     * @brief The native descriptor. Ownership stays with the socket object.
     */
    [[nodiscard]] SOCKET getSocketFd() const noexcept { return _sockFd; }

    /**
     * @brief Sets an integer socket option.
     *
     * @code
     * socket.setOption(SOL_SOCKET, SO_REUSEADDR, 1);
     * @endcode
     *
     * @throws SocketException if the socket is invalid or `setsockopt()` fails.
     */
    void setOption(int level, int optName, int value);

    /**
     * @brief Sets a socket option from a structured or binary value (e.g. `ip_mreq`).
     *
     * @throws SocketException if the socket is invalid, @p value is null, @p len is zero
     *         or `setsockopt()` fails.
     */
    void setOption(int level, int optName, const void* value, socklen_t len);

    /**
     * @brief Reads an integer socket option.
     *
     * @throws SocketException if the socket is invalid or `getsockopt()` fails.
     */
    [[nodiscard]] int getOption(int level, int optName) const;

    /**
     * @brief Reads a structured socket option into @p result.
     *
     * @throws SocketException if the socket is invalid, the buffer is invalid or
     *         `getsockopt()` fails.
     */
    void getOption(int level, int optName, void* result, socklen_t* len) const;

    /**
     * @brief Sets the receive timeout (`SO_RCVTIMEO`) in milliseconds; 0 disables it.
     *
     * A receive that times out throws SocketTimeoutException.
     *
     * @throws SocketException if @p millis is negative or `setsockopt()` fails.
     */
    void setSoRecvTimeout(int millis);

    [[nodiscard]] int getSoRecvTimeout() const;

    /**
     * @brief Joins an IPv4 multicast group (`IP_ADD_MEMBERSHIP`).
     *
     * @param[in] group Multicast group address (224.0.0.0/4).
     * @param[in] iface Address of the local interface that joins; `INADDR_ANY` lets the
     *                  system pick.
     *
     * @throws SocketException if @p group is not multicast or the network stack refuses
     *         the membership.
     */
    void joinGroupIPv4(in_addr group, in_addr iface);

    /**
     * @brief Joins an IPv6 multicast group (`IPV6_JOIN_GROUP`).
     *
     * @param[in] group   Multicast group address (ff00::/8).
     * @param[in] ifindex Interface index; 0 lets the system pick.
     *
     * @throws SocketException if @p group is not multicast or the network stack refuses
     *         the membership.
     */
    void joinGroupIPv6(const in6_addr& group, unsigned int ifindex);

    /**
     * @brief Selects the outgoing interface for IPv4 multicast (`IP_MULTICAST_IF`).
     */
    void setMulticastInterfaceIPv4(in_addr addr);

  protected:
    /**
     * @brief Updates the descriptor after creation, move or close.
     */
    void setSocketFd(const SOCKET sock) noexcept { _sockFd = sock; }

  private:
    SOCKET _sockFd = INVALID_SOCKET; ///< Descriptor of the owning socket (not owned here).
};

} // namespace udprelay
