#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace xferstat::client
{

    struct ClientConfig
    {
        std::string player_id{"cli"};
        std::string host;
        std::uint16_t port{};
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace xferstat::client
