#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "xferstat/server/server.hpp"
#include "xferstat/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    using xferstat::server::ServerConfig;

    void print_usage(const char *program_name)
    {
        std::cout << "xferstat server " << xferstat::version() << "\n"
                  << "Usage: " << program_name
                  << " --port <PORT> --root <MEDIA_ROOT> [--address <ADDRESS>] [--threads <N>]\n"
                     "       [--chunk-size <BYTES>] [--stall-timeout <seconds>] [--sweep-interval <seconds>]\n"
                     "       [--log <FILE>] [--log-level <trace|debug|info|warn|error>]\n";
    }

    using OptionSetter = std::function<void(ServerConfig &, const std::string &)>;

    const std::map<std::string, OptionSetter> &option_setters()
    {
        static const std::map<std::string, OptionSetter> setters{
            {"--port", [](ServerConfig &config, const std::string &value)
             { config.port = static_cast<std::uint16_t>(std::stoi(value)); }},
            {"--root", [](ServerConfig &config, const std::string &value)
             { config.root = std::filesystem::path(value); }},
            {"--address", [](ServerConfig &config, const std::string &value)
             { config.address = value; }},
            {"--threads", [](ServerConfig &config, const std::string &value)
             { config.worker_threads = static_cast<std::size_t>(std::stoul(value)); }},
            {"--chunk-size", [](ServerConfig &config, const std::string &value)
             { config.chunk_size = std::stoull(value); }},
            {"--stall-timeout", [](ServerConfig &config, const std::string &value)
             { config.stall_timeout = std::chrono::seconds(std::stoll(value)); }},
            {"--sweep-interval", [](ServerConfig &config, const std::string &value)
             { config.sweep_interval = std::chrono::seconds(std::stoll(value)); }},
            {"--log", [](ServerConfig &config, const std::string &value)
             { config.log_file = std::filesystem::path(value); }},
            {"--log-level", [](ServerConfig &config, const std::string &value)
             { config.log_level = value; }},
        };
        return setters;
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::optional<std::string> validate(const ServerConfig &config)
    {
        if (config.port == 0 || config.root.empty())
        {
            return "--port and --root are required";
        }
        if (config.chunk_size == 0 || config.chunk_size > ServerConfig::kMaxChunkSize)
        {
            return "--chunk-size must be between 1 and " + std::to_string(ServerConfig::kMaxChunkSize);
        }
        if (config.stall_timeout.count() < 0 || config.sweep_interval.count() < 0)
        {
            return "Timeouts must not be negative";
        }
        if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off")
        {
            return "Unknown log level: " + config.log_level;
        }
        return std::nullopt;
    }

} // namespace

int main(int argc, char *argv[])
{
    using xferstat::server::Server;

    ServerConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        const auto setter = option_setters().find(arg);
        if (setter == option_setters().end())
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        try
        {
            setter->second(config, *value);
        }
        catch (const std::exception &)
        {
            std::cerr << "Invalid value for " << arg << ": " << *value << std::endl;
            return EXIT_FAILURE;
        }
    }

    if (const auto problem = validate(config))
    {
        std::cerr << *problem << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting xferstat server {} on {}:{}", xferstat::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
