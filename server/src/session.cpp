#include "xferstat/server/session.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <span>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace xferstat::server
{

    Session::Session(asio::ip::tcp::socket socket, ServerServices services)
        : socket_(std::move(socket)), services_(services)
    {
        peer_ = remote_endpoint();
    }

    Session::~Session()
    {
        on_disconnect();
    }

    void Session::start()
    {
        spdlog::info("Client connected from {}", peer_);
        read_frame_header();
    }

    void Session::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        std::error_code ec;
        spdlog::info("Closing connection for {}", peer_);
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        on_disconnect();
    }

    void Session::read_frame_header()
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(header_buffer_),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 if (ec != asio::error::eof)
                                 {
                                     spdlog::debug("Read error from {}: {}", peer_, ec.message());
                                 }
                                 stop();
                                 return;
                             }
                             std::uint32_t payload_size = 0;
                             try
                             {
                                 payload_size = protocol::decode_frame_header(header_buffer_);
                             }
                             catch (const std::length_error &ex)
                             {
                                 spdlog::warn("Dropping {}: {}", peer_, ex.what());
                                 stop();
                                 return;
                             }
                             if (payload_size == 0)
                             {
                                 read_frame_header();
                                 return;
                             }
                             buffer_.resize(payload_size);
                             read_frame_payload(payload_size);
                         });
    }

    void Session::read_frame_payload(std::size_t size)
    {
        auto self = shared_from_this();
        asio::async_read(socket_, asio::buffer(buffer_.data(), size),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 stop();
                                 return;
                             }
                             try
                             {
                                 const auto json = nlohmann::json::parse(buffer_.begin(), buffer_.end());
                                 process_message(json);
                             }
                             catch (const std::exception &ex)
                             {
                                 send_error(ErrorCode::InvalidPayload, ex.what());
                             }
                             read_frame_header();
                         });
    }

    void Session::process_message(const nlohmann::json &json)
    {
        protocol::RequestEnvelope envelope;
        try
        {
            envelope = json.get<protocol::RequestEnvelope>();
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::InvalidCommand, ex.what());
            return;
        }

        spdlog::debug("{} -> command {}", peer_, protocol::to_string(envelope.command));

        switch (envelope.command)
        {
        case protocol::Command::Ping:
            send_response(protocol::ResponseEnvelope{.request_id = envelope.request_id});
            break;
        case protocol::Command::StreamOpen:
            handle_stream_open(envelope);
            break;
        case protocol::Command::StreamChunk:
            handle_stream_chunk(envelope);
            break;
        case protocol::Command::StreamClose:
            handle_stream_close(envelope);
            break;
        case protocol::Command::StatusList:
            handle_status_list(envelope);
            break;
        case protocol::Command::StatusGet:
            handle_status_get(envelope);
            break;
        case protocol::Command::StatusTerminate:
            handle_status_terminate(envelope);
            break;
        default:
            send_error(ErrorCode::Unsupported, "Command not supported", envelope.request_id);
            break;
        }
    }

    void Session::send_response(const protocol::ResponseEnvelope &envelope)
    {
        if (stopped_)
        {
            return;
        }
        std::vector<std::uint8_t> frame;
        try
        {
            frame = protocol::encode_frame(nlohmann::json(envelope));
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to encode response for {}: {}", peer_, ex.what());
            protocol::ResponseEnvelope fallback{
                .kind = protocol::ResponseKind::Error,
                .error = ErrorCode::InternalError,
                .message = "Failed to encode response",
                .request_id = envelope.request_id,
            };
            frame = protocol::encode_frame(nlohmann::json(fallback));
        }
        write_queue_.push_back(std::move(frame));
        if (write_queue_.size() == 1)
        {
            write_next();
        }
    }

    void Session::send_error(ErrorCode code, std::string message, std::optional<std::string> request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Error;
        envelope.error = code;
        envelope.message = std::move(message);
        envelope.request_id = std::move(request_id);
        send_response(envelope);
    }

    void Session::write_next()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(write_queue_.front()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  write_queue_.clear();
                                  stop();
                                  return;
                              }
                              write_queue_.pop_front();
                              if (!write_queue_.empty())
                              {
                                  write_next();
                              }
                          });
    }

    void Session::on_disconnect()
    {
        while (!streams_.empty())
        {
            close_stream(streams_.begin());
        }
    }

    std::string Session::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace xferstat::server
