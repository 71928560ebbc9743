#include "udprelay/common.hpp"

#include <system_error>

using namespace udprelay;

std::string udprelay::SocketErrorMessage(int error)
{
    if (error == 0)
        return {};

    // Some APIs return negative errno-like values
    if (error < 0)
        error = -error;

#ifdef _WIN32
    LPSTR buffer = nullptr;
    constexpr DWORD flags = FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS;
    const DWORD size = ::FormatMessageA(flags, nullptr, static_cast<DWORD>(error),
                                        MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), reinterpret_cast<LPSTR>(&buffer), 0,
                                        nullptr);
    if (size != 0 && buffer)
    {
        std::string msg(buffer, size);
        ::LocalFree(buffer);

        // FormatMessage appends CR/LF and a trailing period
        while (!msg.empty() && (msg.back() == '\r' || msg.back() == '\n' || msg.back() == ' ' || msg.back() == '.'))
            msg.pop_back();

        if (!msg.empty())
            return msg;
    }

    return "Unknown error " + std::to_string(error);
#else
    try
    {
        if (std::string m = std::system_category().message(error); !m.empty())
            return m;
    }
    catch (const std::exception&)
    {
        // Fall through to strerror()
    }

    if (const char* m = ::strerror(error); m && *m)
        return {m};

    return "Unknown error " + std::to_string(error);
#endif
}

void internal::sendExactTo(const SOCKET fd, const std::span<const std::byte> data, const sockaddr* addr,
                           const socklen_t addrLen)
{
    if (fd == INVALID_SOCKET)
        throw SocketException("sendExactTo(): invalid socket");

    int flags = 0;
#ifndef _WIN32
    flags = MSG_NOSIGNAL;
#endif

    const auto sent = ::sendto(fd,
#ifdef _WIN32
                               reinterpret_cast<const char*>(data.data()), static_cast<int>(data.size()),
#else
                               data.data(), data.size(),
#endif
                               flags, addr, addrLen);

    if (sent == SOCKET_ERROR)
        throwLastSockError();

    if (static_cast<std::size_t>(sent) != data.size())
        throw SocketException("sendExactTo(): partial datagram was sent.");
}
