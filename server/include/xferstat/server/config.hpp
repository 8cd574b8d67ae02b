#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace xferstat::server
{

    struct ServerConfig
    {
        static constexpr std::uint64_t kDefaultChunkSize = 256 * 1024;
        static constexpr std::uint64_t kMaxChunkSize = 4 * 1024 * 1024;

        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::uint64_t chunk_size{kDefaultChunkSize};
        // Zero disables the stalled transfer sweep.
        std::chrono::seconds stall_timeout{std::chrono::seconds{60}};
        std::chrono::seconds sweep_interval{std::chrono::seconds{10}};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
    };

} // namespace xferstat::server
