/**
 * @file common.hpp
 * @brief Common platform includes, socket types and internal helpers for udprelay.
 */

#pragma once

#include "SocketException.hpp"

#include <cstddef> // std::size_t
#include <cstdint>
#include <source_location>
#include <span>
#include <string>
#include <utility>

#ifdef _WIN32

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <winsock2.h> // Must come first: socket, bind, recv, sendto, etc.
#include <ws2tcpip.h> // inet_pton, inet_ntop, ip_mreq, ipv6_mreq
#include <windows.h>  // FormatMessageA

#ifdef _MSC_VER
#pragma comment(lib, "Ws2_32.lib") // Winsock library
#endif

#else

#include <arpa/inet.h>  // inet_pton, inet_ntop
#include <cerrno>       // errno
#include <cstring>      // strerror
#include <netinet/in.h> // sockaddr_in, sockaddr_in6, ip_mreq, ipv6_mreq
#include <sys/socket.h> // socket
#include <sys/time.h>   // timeval
#include <sys/types.h>  // socket
#include <unistd.h>     // close

#endif

/**
 * @defgroup udprelay udprelay: UDP unicast and multicast relay
 * @brief Address model, socket primitives and forwarding engine of the relay.
 */

/**
 * @defgroup core Core Utilities and Types
 * @ingroup udprelay
 * @brief Platform abstractions and helpers used across the relay.
 */

/**
 * @defgroup internal Internal Helpers
 * @ingroup udprelay
 * @brief Implementation-only utilities. Not part of the public API.
 */

/**
 * @defgroup udp UDP Sockets
 * @ingroup udprelay
 * @brief RAII UDP socket and socket options.
 */

/**
 * @defgroup addressing Addressing
 * @ingroup udprelay
 * @brief Socket addresses, listener specifications and their text forms.
 */

/**
 * @defgroup forwarding Forwarding
 * @ingroup udprelay
 * @brief Listener materialization, sender sockets and the relay loop.
 */

/**
 * @defgroup exceptions Exception Classes
 * @ingroup udprelay
 * @brief Exception types used for error reporting.
 */

namespace udprelay
{

#ifdef _WIN32

typedef long ssize_t;

inline int InitSockets()
{
    WSADATA WSAData;
    return WSAStartup(MAKEWORD(2, 2), &WSAData);
}

inline int CleanupSockets()
{
    return WSACleanup();
}

inline int GetSocketError()
{
    return WSAGetLastError();
}

inline int CloseSocket(SOCKET fd)
{
    return closesocket(fd);
}

#define UDPRELAY_TIMEOUT_CODE WSAETIMEDOUT

#else

typedef int SOCKET;
constexpr SOCKET INVALID_SOCKET = -1;
constexpr SOCKET SOCKET_ERROR = -1;

#define UDPRELAY_TIMEOUT_CODE ETIMEDOUT

constexpr int InitSockets()
{
    return 0;
}

constexpr int CleanupSockets()
{
    return 0;
}

inline int GetSocketError()
{
    return errno;
}

inline int CloseSocket(const SOCKET fd)
{
    return close(fd);
}

#endif

/**
 * @brief Convert a socket-related error code to a human-readable message.
 * @ingroup core
 *
 * @param[in] error Numeric error code (`errno` or `WSAGetLastError()`).
 * @return A best-effort description, or an empty string when @p error is zero.
 *
 * @note Never throws.
 */
std::string SocketErrorMessage(int error);

/**
 * @typedef Port
 * @brief UDP port number.
 * @ingroup core
 */
using Port = std::uint16_t;

/**
 * @brief Size of the relay receive buffer: the payload of a standard Ethernet MTU.
 * @ingroup core
 *
 * Datagrams longer than this are truncated by the receive call. The relay neither
 * grows the buffer nor reports the truncation.
 */
inline constexpr std::size_t MtuPayloadSize = 1500;

/**
 * @brief Largest UDP payload that fits an IPv4 datagram.
 * @ingroup core
 */
inline constexpr std::size_t MaxUdpPayloadIPv4 = 65507;

} // namespace udprelay

namespace udprelay::internal
{

/**
 * @brief Closes a socket descriptor, ignoring failures.
 * @ingroup internal
 *
 * For destructors and cleanup paths where exceptions must not escape.
 *
 * @param[in] fd Descriptor to close; `INVALID_SOCKET` is a no-op.
 * @return `true` if the descriptor was invalid or closed, `false` if closing failed.
 */
inline bool tryCloseNoexcept(const SOCKET fd) noexcept
{
    if (fd == INVALID_SOCKET)
        return true;
    return CloseSocket(fd) == 0;
}

/**
 * @brief Closes a socket descriptor and throws on failure.
 * @ingroup internal
 *
 * @param[in] fd Descriptor to close; `INVALID_SOCKET` is a no-op.
 * @throws SocketException If `close()`/`closesocket()` fails.
 */
inline void closeOrThrow(const SOCKET fd)
{
    if (fd == INVALID_SOCKET)
        return;
    if (CloseSocket(fd) != 0)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
}

/**
 * @brief Throw a SocketException for the last socket error.
 * @ingroup internal
 *
 * When built with `UDPRELAY_INCLUDE_ERROR_CONTEXT=1` the message is suffixed with
 * the call site (`file:line function`).
 *
 * @param[in] loc Call-site information, captured automatically.
 * @throws SocketException Always.
 */
[[noreturn]] inline void throwLastSockError(const std::source_location& loc = std::source_location::current())
{
    const int err = GetSocketError();
#if UDPRELAY_INCLUDE_ERROR_CONTEXT
    std::string msg = SocketErrorMessage(err);
    msg.append(" [at ")
        .append(loc.file_name())
        .append(":")
        .append(std::to_string(loc.line()))
        .append(" ")
        .append(loc.function_name())
        .append("]");
    throw SocketException(err, msg);
#else
    (void) loc;
    throw SocketException(err, SocketErrorMessage(err));
#endif
}

/**
 * @brief Receive one datagram into @p dst with `recv()`.
 * @ingroup internal
 *
 * The sender address is not collected. Datagrams longer than @p dst are truncated
 * by the system call.
 *
 * @retval >=0 Number of bytes stored (0 for an empty datagram).
 * @retval SOCKET_ERROR On error; call GetSocketError() for details.
 */
inline ssize_t recvInto(const SOCKET fd, std::span<std::byte> dst, const int flags)
{
    return ::recv(fd, reinterpret_cast<char*>(dst.data()),
#if defined(_WIN32)
                  static_cast<int>(dst.size()),
#else
                  dst.size(),
#endif
                  flags);
}

/**
 * @brief Sends an entire datagram to @p addr using `sendto()`.
 * @ingroup internal
 *
 * Uses `MSG_NOSIGNAL` on POSIX. A zero-length datagram is sent as such.
 *
 * @throws SocketException If the socket is invalid, `sendto()` fails or only part
 *         of the datagram was accepted.
 */
void sendExactTo(SOCKET fd, std::span<const std::byte> data, const sockaddr* addr, socklen_t addrLen);

} // namespace udprelay::internal
