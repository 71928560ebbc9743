/**
 * @file AddressParseException.hpp
 * @brief Exception class for unparsable address and listener text.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace udprelay
{

/**
 * @class AddressParseException
 * @ingroup exceptions
 * @brief Thrown when a text token is not a valid socket address or listener specification.
 *
 * `what()` holds the diagnostic, `token()` the text that failed to parse.
 *
 * @code
 * try {
 *     auto destinations = resolveDestinations(tokens);
 * } catch (const AddressParseException& ex) {
 *     std::cerr << ex.token() << ": " << ex.what() << std::endl;
 * }
 * @endcode
 */
class AddressParseException : public std::runtime_error
{
  public:
    /**
     * @param message Diagnostic, e.g. "invalid socket address syntax".
     * @param token   The offending input text.
     */
    AddressParseException(const std::string& message, const std::string_view token)
        : std::runtime_error(message), _token(token)
    {
    }

    /**
     * @brief The text that failed to parse.
     */
    [[nodiscard]] const std::string& token() const noexcept { return _token; }

  private:
    std::string _token; ///< Offending input text.
};

} // namespace udprelay
