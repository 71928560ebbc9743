/**
 * @file SocketInitializer.hpp
 * @brief RAII helper for socket subsystem initialization and cleanup in udprelay.
 */

#pragma once

#include "common.hpp"
#include "SocketException.hpp"

#include <iostream>

namespace udprelay
{
/**
 * @brief Initializes the socket subsystem for the lifetime of the object.
 *
 * Calls WSAStartup/WSACleanup on Windows and does nothing elsewhere. Create one in
 * `main()` (and in each test) before any socket is opened.
 */
class SocketInitializer
{
  public:
    /**
     * @throws SocketException if initialization fails.
     */
    SocketInitializer()
    {
        if (InitSockets() != 0)
        {
            const int error = GetSocketError();
            throw SocketException(error, SocketErrorMessage(error));
        }
    }

    /**
     * @note Cleanup failures are reported on stderr, never thrown.
     */
    ~SocketInitializer() noexcept
    {
        if (CleanupSockets() != 0)
            std::cerr << "Socket cleanup failed: " << SocketErrorMessage(GetSocketError()) << std::endl;
    }

    SocketInitializer(const SocketInitializer& rhs) = delete;
    SocketInitializer& operator=(const SocketInitializer& rhs) = delete;
};

} // namespace udprelay
