#include "udprelay/SocketAddress.hpp"
#include "udprelay/AddressParseException.hpp"

#include <cstring>

using namespace udprelay;

namespace
{

// Leading zeros are allowed; the value must fit 16 bits
std::optional<Port> parsePort(const std::string_view text)
{
    return internal::parseDecimal<Port>(text);
}

std::optional<in6_addr> parseIPv6Address(const std::string_view text)
{
    // inet_pton needs a NUL-terminated string
    const std::string literal{text};
    in6_addr out{};
    if (inet_pton(AF_INET6, literal.c_str(), &out) != 1)
        return std::nullopt;
    return out;
}

// "[addr]:port" or "[addr%scope]:port"
std::optional<SocketAddress> parseBracketedIPv6(const std::string_view text)
{
    const auto close = text.find(']');
    if (close == std::string_view::npos)
        return std::nullopt;

    const std::string_view rest = text.substr(close + 1);
    if (rest.empty() || rest.front() != ':')
        return std::nullopt;

    const auto port = parsePort(rest.substr(1));
    if (!port)
        return std::nullopt;

    std::string_view host = text.substr(1, close - 1);
    std::uint32_t scopeId = 0;
    if (const auto percent = host.find('%'); percent != std::string_view::npos)
    {
        const auto scope = internal::parseDecimal<std::uint32_t>(host.substr(percent + 1));
        if (!scope)
            return std::nullopt;
        scopeId = *scope;
        host = host.substr(0, percent);
    }

    const auto ip = parseIPv6Address(host);
    if (!ip)
        return std::nullopt;

    return SocketAddress(*ip, *port, scopeId);
}

// "a.b.c.d:port"
std::optional<SocketAddress> parseIPv4WithPort(const std::string_view text)
{
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos)
        return std::nullopt;

    const auto ip = parseIPv4Address(text.substr(0, colon));
    if (!ip)
        return std::nullopt;

    const auto port = parsePort(text.substr(colon + 1));
    if (!port)
        return std::nullopt;

    return SocketAddress(*ip, *port);
}

} // namespace

std::optional<in_addr> udprelay::parseIPv4Address(const std::string_view text)
{
    // Rejects anything inet_pton would not take as a dotted quad, including ':' and '/'
    const std::string literal{text};
    in_addr out{};
    if (literal.empty() || inet_pton(AF_INET, literal.c_str(), &out) != 1)
        return std::nullopt;
    return out;
}

std::string udprelay::ipv4ToString(const in_addr& addr)
{
    char buf[INET_ADDRSTRLEN]{};
    if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr)
        return {};
    return buf;
}

SocketAddress::SocketAddress() noexcept
{
    auto& sin = *reinterpret_cast<sockaddr_in*>(&_storage);
    sin.sin_family = AF_INET;
    sin.sin_addr.s_addr = htonl(INADDR_ANY);
    sin.sin_port = 0;
}

SocketAddress::SocketAddress(const in_addr& ip, const Port port) noexcept
{
    auto& sin = *reinterpret_cast<sockaddr_in*>(&_storage);
    sin.sin_family = AF_INET;
    sin.sin_addr = ip;
    sin.sin_port = htons(port);
}

SocketAddress::SocketAddress(const in6_addr& ip, const Port port, const std::uint32_t scopeId) noexcept
{
    auto& sin6 = *reinterpret_cast<sockaddr_in6*>(&_storage);
    sin6.sin6_family = AF_INET6;
    sin6.sin6_addr = ip;
    sin6.sin6_port = htons(port);
    sin6.sin6_scope_id = scopeId;
}

SocketAddress SocketAddress::fromSockaddr(const sockaddr* addr, const socklen_t len)
{
    if (addr == nullptr)
        throw SocketException("SocketAddress::fromSockaddr(): null address");

    if (addr->sa_family == AF_INET && len >= static_cast<socklen_t>(sizeof(sockaddr_in)))
    {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(addr);
        return {sin->sin_addr, ntohs(sin->sin_port)};
    }

    if (addr->sa_family == AF_INET6 && len >= static_cast<socklen_t>(sizeof(sockaddr_in6)))
    {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(addr);
        return {sin6->sin6_addr, ntohs(sin6->sin6_port), sin6->sin6_scope_id};
    }

    throw SocketException("SocketAddress::fromSockaddr(): unsupported address family");
}

std::optional<SocketAddress> SocketAddress::tryParse(const std::string_view text)
{
    if (text.empty())
        return std::nullopt;

    if (text.front() == '[')
        return parseBracketedIPv6(text);

    return parseIPv4WithPort(text);
}

SocketAddress SocketAddress::parse(const std::string_view text)
{
    if (auto addr = tryParse(text))
        return *addr;
    throw AddressParseException("invalid socket address syntax", text);
}

SocketAddress SocketAddress::anyIPv4(const Port port) noexcept
{
    in_addr any{};
    any.s_addr = htonl(INADDR_ANY);
    return {any, port};
}

SocketAddress SocketAddress::anyIPv6(const Port port) noexcept
{
    return {in6addr_any, port};
}

Port SocketAddress::port() const noexcept
{
    return ntohs(isIPv4() ? asIPv4().sin_port : asIPv6().sin6_port);
}

in_addr SocketAddress::ipv4() const noexcept
{
    return asIPv4().sin_addr;
}

in6_addr SocketAddress::ipv6() const noexcept
{
    return asIPv6().sin6_addr;
}

std::uint32_t SocketAddress::scopeId() const noexcept
{
    return isIPv6() ? asIPv6().sin6_scope_id : 0;
}

bool SocketAddress::isMulticast() const noexcept
{
    if (isIPv4())
        return IN_MULTICAST(ntohl(asIPv4().sin_addr.s_addr));
    return IN6_IS_ADDR_MULTICAST(&asIPv6().sin6_addr);
}

std::string SocketAddress::ipString() const
{
    if (isIPv4())
        return ipv4ToString(asIPv4().sin_addr);

    char buf[INET6_ADDRSTRLEN]{};
    if (inet_ntop(AF_INET6, &asIPv6().sin6_addr, buf, sizeof(buf)) == nullptr)
        return {};
    return buf;
}

std::string SocketAddress::toString() const
{
    if (isIPv4())
        return ipString() + ":" + std::to_string(port());

    std::string out = "[" + ipString();
    if (scopeId() != 0)
        out.append("%").append(std::to_string(scopeId()));
    out.append("]:").append(std::to_string(port()));
    return out;
}

socklen_t SocketAddress::size() const noexcept
{
    return static_cast<socklen_t>(isIPv4() ? sizeof(sockaddr_in) : sizeof(sockaddr_in6));
}

namespace udprelay
{

bool operator==(const SocketAddress& lhs, const SocketAddress& rhs) noexcept
{
    if (lhs.family() != rhs.family() || lhs.port() != rhs.port())
        return false;

    if (lhs.isIPv4())
        return sameIPv4(lhs.asIPv4().sin_addr, rhs.asIPv4().sin_addr);

    return std::memcmp(&lhs.asIPv6().sin6_addr, &rhs.asIPv6().sin6_addr, sizeof(in6_addr)) == 0 &&
           lhs.scopeId() == rhs.scopeId();
}

std::ostream& operator<<(std::ostream& os, const SocketAddress& addr)
{
    return os << addr.toString();
}

} // namespace udprelay
