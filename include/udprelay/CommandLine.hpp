/**
 * @file CommandLine.hpp
 * @brief Command-line arguments of the udprelay executable.
 */

#pragma once

#include "ListenerSpec.hpp"
#include "SocketAddress.hpp"

#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace udprelay
{

/**
 * @brief Parsed command line: where to listen and where to relay to.
 */
struct Arguments
{
    ListenerSpec listener;
    std::vector<SocketAddress> destinations; ///< Never empty.
};

/**
 * @brief Why the command line was not accepted.
 */
enum class ArgumentError
{
    HelpRequested,     ///< `--help` or `-h` given as the first argument.
    MissingArguments,  ///< No listener, or no destination.
    InvalidListener,   ///< The listener specification did not parse.
    InvalidDestination ///< A destination address did not parse.
};

/**
 * @class ArgumentException
 * @ingroup exceptions
 * @brief Thrown by parseArguments(); `kind()` tells the caller how to react.
 */
class ArgumentException : public std::runtime_error
{
  public:
    ArgumentException(const ArgumentError kind, const std::string& message)
        : std::runtime_error(message), _kind(kind)
    {
    }

    [[nodiscard]] ArgumentError kind() const noexcept { return _kind; }

  private:
    ArgumentError _kind;
};

/**
 * @brief Parse the arguments following the program name.
 *
 * The first argument is the listener specification, every further argument a
 * destination. The listener is checked first, then each destination, then that at
 * least one destination was given.
 *
 * @throws ArgumentException on any rejected command line.
 * @see resolveListener(), resolveDestinations()
 */
Arguments parseArguments(std::span<const std::string> args);

/**
 * @brief Usage text with examples, for `--help` and for missing arguments.
 */
std::string_view usage() noexcept;

} // namespace udprelay
