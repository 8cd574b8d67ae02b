#include "xferstat/client/config.hpp"

#include <stdexcept>
#include <string>

namespace xferstat::client
{

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error("Usage: xferstat-client [player@]<server>:<port> [--log <file>]");
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        std::string host_part = endpoint;
        if (const auto at_pos = endpoint.find('@'); at_pos != std::string::npos)
        {
            config.player_id = endpoint.substr(0, at_pos);
            host_part = endpoint.substr(at_pos + 1);
            if (config.player_id.empty())
            {
                throw std::runtime_error("Empty player id before '@'");
            }
        }

        const auto colon_pos = host_part.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = host_part.substr(0, colon_pos);
        const auto port = std::stoi(host_part.substr(colon_pos + 1));
        if (port <= 0 || port > 65535)
        {
            throw std::runtime_error("Port out of range: " + std::to_string(port));
        }
        config.port = static_cast<std::uint16_t>(port);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace xferstat::client
