// udprelay: relay UDP datagrams from one unicast address or multicast group to a list of destinations.

#include "udprelay/CommandLine.hpp"
#include "udprelay/Forwarder.hpp"
#include "udprelay/SocketException.hpp"
#include "udprelay/SocketInitializer.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace udprelay;

int main(int argc, char* argv[])
{
    const std::vector<std::string> args(argv + 1, argv + argc);

    std::optional<Arguments> parsed;
    try
    {
        parsed = parseArguments(args);
    }
    catch (const ArgumentException& ex)
    {
        switch (ex.kind())
        {
            case ArgumentError::HelpRequested:
                std::cout << usage() << std::endl;
                return EXIT_SUCCESS;
            case ArgumentError::MissingArguments:
                std::cerr << ex.what() << "\n" << std::endl;
                std::cout << usage() << std::endl;
                break;
            case ArgumentError::InvalidListener:
            case ArgumentError::InvalidDestination:
                std::cerr << ex.what() << std::endl;
                break;
        }
        return EXIT_FAILURE;
    }

    try
    {
        SocketInitializer sockInit;
        Forwarder forwarder(parsed->listener, std::move(parsed->destinations));
        forwarder.run();
    }
    catch (const SocketException& se)
    {
        std::cerr << "Failed to forward: " << se.what() << std::endl;
    }

    return EXIT_FAILURE;
}
