#include "xferstat/client/session.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "xferstat/error_codes.hpp"
#include "xferstat/framing.hpp"
#include "xferstat/version.hpp"

namespace xferstat::client
{

    namespace
    {

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          socket_(io_context_) {}

    int ClientSession::run()
    {
        try
        {
            connect();
            const auto pong = rpc(protocol::Command::Ping);
            if (pong.kind != protocol::ResponseKind::Ok)
            {
                throw std::runtime_error("Server rejected ping: " + pong.message);
            }
            std::cout << "Connected to " << config_.host << ':' << config_.port << " as player "
                      << config_.player_id << std::endl;
            interactive_shell();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
        return 0;
    }

    void ClientSession::connect()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(config_.host, std::to_string(config_.port));
        asio::connect(socket_, results);
        logger_.log("info", "connected to ", config_.host, ':', config_.port);
    }

    void ClientSession::interactive_shell()
    {
        while (true)
        {
            std::cout << config_.player_id << "> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line))
            {
                std::cout << std::endl;
                break;
            }
            const auto tokens = split_tokens(line);
            if (tokens.empty())
            {
                continue;
            }
            logger_.log("cmd", line);

            const auto command = to_upper(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

            if (command == "EXIT" || command == "QUIT")
            {
                std::cout << "OK" << std::endl;
                break;
            }
            if (!dispatch(command, args))
            {
                std::cout << "Unknown command. Type HELP for the list of commands." << std::endl;
            }
        }
    }

    bool ClientSession::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "HELP")
        {
            print_help();
            return true;
        }
        if (command == "STATUS")
        {
            return handle_status(args);
        }
        if (command == "SHOW")
        {
            return handle_show(args);
        }
        if (command == "TERMINATE")
        {
            return handle_terminate(args);
        }
        if (command == "WATCH")
        {
            return handle_watch(args);
        }
        if (command == "FETCH")
        {
            return handle_fetch(args);
        }
        return false;
    }

    protocol::ResponseEnvelope ClientSession::rpc(protocol::Command command, const nlohmann::json &payload)
    {
        protocol::RequestEnvelope envelope;
        envelope.command = command;
        envelope.payload = payload;
        envelope.request_id = next_request_id();

        const auto frame = protocol::encode_frame(nlohmann::json(envelope));
        asio::write(socket_, asio::buffer(frame));

        std::array<std::uint8_t, protocol::kFrameHeaderSize> header{};
        asio::read(socket_, asio::buffer(header));
        const auto size = protocol::decode_frame_header(header);
        std::vector<std::uint8_t> buffer(size);
        asio::read(socket_, asio::buffer(buffer));

        nlohmann::json json_response;
        try
        {
            json_response = nlohmann::json::parse(buffer.begin(), buffer.end());
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            logger_.log("rpc", "parse_error size=", size, " msg=", ex.what());
            throw std::runtime_error("Failed to decode server response");
        }
        auto response = json_response.get<protocol::ResponseEnvelope>();
        if (response.request_id != envelope.request_id)
        {
            throw std::runtime_error("Response does not match request " + *envelope.request_id);
        }
        if (response.kind == protocol::ResponseKind::Error)
        {
            logger_.log("rpc", protocol::to_string(command), " error=", to_string(response.error),
                        " msg=", response.message);
        }
        else
        {
            logger_.log("rpc", protocol::to_string(command), " ok");
        }
        return response;
    }

    void ClientSession::print_help() const
    {
        std::cout << "xferstat client " << version() << "\n"
                  << "Commands:\n"
                  << "  STATUS [--history] [--mine] [STREAM|DOWNLOAD|UPLOAD]  list transfers\n"
                  << "  SHOW <id> [--history]                                 details of one transfer\n"
                  << "  TERMINATE <id>                                        stop a transfer\n"
                  << "  WATCH <count> [seconds]                               repeat STATUS\n"
                  << "  FETCH <remote> <local>                                download a file\n"
                  << "  HELP, EXIT" << std::endl;
    }

    void ClientSession::print_error(const protocol::ResponseEnvelope &response) const
    {
        std::cout << "ERROR: " << to_string(response.error) << std::endl;
        if (!response.message.empty())
        {
            std::cout << response.message << std::endl;
        }
    }

    std::string ClientSession::next_request_id()
    {
        return config_.player_id + "-" + std::to_string(++request_counter_);
    }

} // namespace xferstat::client
