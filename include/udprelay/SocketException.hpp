/**
 * @file SocketException.hpp
 * @brief Exception class for socket-related errors in udprelay.
 */

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

namespace udprelay
{

/**
 * @class SocketException
 * @ingroup exceptions
 * @brief Represents a failed socket operation (bind, join, receive, send, close).
 *
 * Carries the platform error code (`errno` on POSIX, `WSAGetLastError()` on Windows)
 * next to a descriptive message. Every startup and runtime I/O failure of the relay
 * reaches the caller as a SocketException.
 *
 * ### Example
 * @code
 * try {
 *     Forwarder forwarder(listener, destinations);
 *     forwarder.run();
 * } catch (const SocketException& ex) {
 *     std::cerr << "Failed to forward: " << ex.what() << std::endl;
 * }
 * @endcode
 */
class SocketException : public std::runtime_error
{
  public:
    /**
     * @brief Constructs a SocketException with a message and no error code.
     *
     * Used for precondition failures that do not come from the operating system.
     *
     * @param message Human-readable description of the failure.
     */
    explicit SocketException(const std::string& message = "SocketException")
        : std::runtime_error(message), _errorCode(0)
    {
    }

    /**
     * @brief Constructs a SocketException with a platform error code and message.
     *
     * The resulting `what()` reads `"<message> (error code <code>)"`.
     *
     * @param code    Error code reported by the operating system.
     * @param message Description of the failure.
     */
    explicit SocketException(const int code, const std::string& message = "SocketException")
        : std::runtime_error(buildErrorMessage(message, code)), _errorCode(code)
    {
    }

    /**
     * @brief Platform error code, or 0 when the failure did not come from the OS.
     */
    [[nodiscard]] int getErrorCode() const noexcept { return _errorCode; }

    ~SocketException() override = default;

  private:
    int _errorCode; ///< Platform-specific error code (errno, WSA error).

    static std::string buildErrorMessage(const std::string& msg, const int code)
    {
        std::ostringstream oss;
        oss << msg << " (error code " << code << ")";
        return oss.str();
    }
};

} // namespace udprelay
