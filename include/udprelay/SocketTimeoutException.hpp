/**
 * @file SocketTimeoutException.hpp
 * @brief Exception class for socket operation timeouts in udprelay.
 */

#pragma once

#include "common.hpp"
#include "SocketException.hpp"

#include <string>
#include <utility>

namespace udprelay
{

/**
 * @class SocketTimeoutException
 * @ingroup exceptions
 * @brief Thrown when a receive exceeds the timeout set with `setSoRecvTimeout()`.
 *
 * The relay itself never sets a timeout; tests do, so that a missing datagram fails
 * the test instead of blocking it.
 */
class SocketTimeoutException final : public SocketException
{
  public:
    /**
     * @param errorCode The platform timeout code (default: UDPRELAY_TIMEOUT_CODE).
     * @param message Optional message. If empty, it is generated from the error code.
     */
    explicit SocketTimeoutException(const int errorCode = UDPRELAY_TIMEOUT_CODE, std::string message = "")
        : SocketException(errorCode, message.empty() ? SocketErrorMessage(errorCode) : std::move(message))
    {
    }
};

} // namespace udprelay
