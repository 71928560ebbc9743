/**
 * @file SocketAddress.hpp
 * @brief IPv4/IPv6 socket address value type for udprelay.
 */

#pragma once

#include "common.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace udprelay
{

/**
 * @brief Parse a plain IPv4 address (dotted quad, no port).
 * @ingroup addressing
 *
 * @param[in] text Candidate address, e.g. `"192.168.1.10"`.
 * @return The address in network byte order, or `std::nullopt` if @p text is not a
 *         valid IPv4 literal.
 */
std::optional<in_addr> parseIPv4Address(std::string_view text);

/**
 * @brief Format an IPv4 address as a dotted quad.
 * @ingroup addressing
 */
std::string ipv4ToString(const in_addr& addr);

/**
 * @brief Compare two IPv4 addresses.
 * @ingroup addressing
 */
inline bool sameIPv4(const in_addr& lhs, const in_addr& rhs) noexcept
{
    return lhs.s_addr == rhs.s_addr;
}

/**
 * @class SocketAddress
 * @ingroup addressing
 * @brief An IPv4 or IPv6 socket address (IP and port, plus scope id for IPv6).
 *
 * Value type holding a `sockaddr_in` or `sockaddr_in6` inside a `sockaddr_storage`,
 * so that it can be handed straight to `bind()` and `sendto()`.
 *
 * ### Text form
 * - IPv4: `a.b.c.d:port`
 * - IPv6: `[addr]:port` or `[addr%scope]:port` with a numeric scope id
 *
 * @code
 * const SocketAddress dst = SocketAddress::parse("[::1]:4001");
 * dst.isIPv6();      // true
 * dst.port();        // 4001
 * dst.toString();    // "[::1]:4001"
 * @endcode
 */
class SocketAddress
{
  public:
    /**
     * @brief Constructs the IPv4 unspecified address `0.0.0.0:0`.
     */
    SocketAddress() noexcept;

    /**
     * @brief Constructs an IPv4 socket address.
     * @param[in] ip   IPv4 address in network byte order.
     * @param[in] port Port in host byte order.
     */
    SocketAddress(const in_addr& ip, Port port) noexcept;

    /**
     * @brief Constructs an IPv6 socket address.
     * @param[in] ip      IPv6 address.
     * @param[in] port    Port in host byte order.
     * @param[in] scopeId Scope id (interface index) for link-local addresses, 0 otherwise.
     */
    SocketAddress(const in6_addr& ip, Port port, std::uint32_t scopeId = 0) noexcept;

    /**
     * @brief Build a SocketAddress from a system address structure.
     *
     * @throws SocketException If the family is neither `AF_INET` nor `AF_INET6`, or
     *         @p len is too short for the family.
     */
    static SocketAddress fromSockaddr(const sockaddr* addr, socklen_t len);

    /**
     * @brief Parse the text form of a socket address.
     *
     * Accepts exactly `<ipv4>:<port>` or `[<ipv6>]:<port>` (optionally with a numeric
     * `%scope` inside the brackets). Whitespace, unbracketed IPv6 literals, missing or
     * out-of-range ports and trailing text are rejected. No name resolution is done.
     *
     * @return The parsed address, or `std::nullopt`.
     */
    static std::optional<SocketAddress> tryParse(std::string_view text);

    /**
     * @brief Parse the text form of a socket address, throwing on failure.
     *
     * @throws AddressParseException With the diagnostic `invalid socket address syntax`.
     * @see tryParse()
     */
    static SocketAddress parse(std::string_view text);

    /**
     * @brief `0.0.0.0:<port>`.
     */
    static SocketAddress anyIPv4(Port port = 0) noexcept;

    /**
     * @brief `[::]:<port>`.
     */
    static SocketAddress anyIPv6(Port port = 0) noexcept;

    /**
     * @brief `AF_INET` or `AF_INET6`.
     */
    [[nodiscard]] int family() const noexcept { return _storage.ss_family; }

    [[nodiscard]] bool isIPv4() const noexcept { return family() == AF_INET; }

    [[nodiscard]] bool isIPv6() const noexcept { return family() == AF_INET6; }

    /**
     * @brief Port in host byte order.
     */
    [[nodiscard]] Port port() const noexcept;

    /**
     * @brief The IPv4 address. Only meaningful when isIPv4() is true.
     */
    [[nodiscard]] in_addr ipv4() const noexcept;

    /**
     * @brief The IPv6 address. Only meaningful when isIPv6() is true.
     */
    [[nodiscard]] in6_addr ipv6() const noexcept;

    /**
     * @brief The IPv6 scope id, 0 for IPv4 addresses.
     */
    [[nodiscard]] std::uint32_t scopeId() const noexcept;

    /**
     * @brief Whether the IP lies in the multicast range of its family.
     *
     * IPv4: 224.0.0.0/4. IPv6: ff00::/8.
     */
    [[nodiscard]] bool isMulticast() const noexcept;

    /**
     * @brief The IP part without the port, e.g. `"224.10.10.10"` or `"ff0e::1"`.
     */
    [[nodiscard]] std::string ipString() const;

    /**
     * @brief The text form, e.g. `"10.1.1.10:4000"` or `"[ff0e::1]:4000"`.
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Pointer to the address, ready for `bind()`/`sendto()`.
     */
    [[nodiscard]] const sockaddr* data() const noexcept { return reinterpret_cast<const sockaddr*>(&_storage); }

    /**
     * @brief Length of the family-specific address structure.
     */
    [[nodiscard]] socklen_t size() const noexcept;

    friend bool operator==(const SocketAddress& lhs, const SocketAddress& rhs) noexcept;

  private:
    sockaddr_storage _storage{}; ///< Holds a sockaddr_in or a sockaddr_in6.

    [[nodiscard]] const sockaddr_in& asIPv4() const noexcept
    {
        return *reinterpret_cast<const sockaddr_in*>(&_storage);
    }

    [[nodiscard]] const sockaddr_in6& asIPv6() const noexcept
    {
        return *reinterpret_cast<const sockaddr_in6*>(&_storage);
    }
};

inline bool operator!=(const SocketAddress& lhs, const SocketAddress& rhs) noexcept
{
    return !(lhs == rhs);
}

/**
 * @brief Writes toString() to @p os. Lets GoogleTest print addresses.
 */
std::ostream& operator<<(std::ostream& os, const SocketAddress& addr);

} // namespace udprelay

namespace udprelay::internal
{

/**
 * @brief Parse a non-empty run of decimal digits into @p T.
 * @ingroup internal
 *
 * Signs, whitespace, other characters and values out of range for @p T are rejected.
 */
template <typename T> std::optional<T> parseDecimal(const std::string_view text) noexcept
{
    if (text.empty())
        return std::nullopt;

    T value{};
    const char* first = text.data();
    const char* last = first + text.size();
    if (const auto [ptr, ec] = std::from_chars(first, last, value); ec != std::errc{} || ptr != last)
        return std::nullopt;
    return value;
}

} // namespace udprelay::internal
