#pragma once

#include <asio.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "xferstat/client/config.hpp"
#include "xferstat/client/logger.hpp"
#include "xferstat/protocol.hpp"

namespace xferstat::client
{

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);

        int run();

    private:
        void connect();
        void interactive_shell();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);

        bool handle_status(const std::vector<std::string> &args);
        bool handle_show(const std::vector<std::string> &args);
        bool handle_terminate(const std::vector<std::string> &args);
        bool handle_watch(const std::vector<std::string> &args);
        bool handle_fetch(const std::vector<std::string> &args);
        bool perform_fetch(const std::string &remote_path, const std::filesystem::path &local_target);

        protocol::ResponseEnvelope rpc(protocol::Command command,
                                       const nlohmann::json &payload = nlohmann::json::object());
        void print_help() const;
        void print_error(const protocol::ResponseEnvelope &response) const;
        std::string next_request_id();

        ClientConfig config_;
        Logger logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::uint64_t request_counter_{0};
    };

} // namespace xferstat::client
