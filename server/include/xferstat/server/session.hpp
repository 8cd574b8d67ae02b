#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "xferstat/error_codes.hpp"
#include "xferstat/framing.hpp"
#include "xferstat/protocol.hpp"
#include "xferstat/server/media_library.hpp"
#include "xferstat/server/status_registry.hpp"
#include "xferstat/transfer_status.hpp"

namespace xferstat::server
{

    struct ServerServices
    {
        MediaLibrary &library;
        StatusRegistry &registry;
        std::uint64_t chunk_size;
    };

    // One client connection. Completion handlers run on the socket's strand.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        struct OpenStream
        {
            protocol::TransferKind kind{};
            std::shared_ptr<TransferStatus> status;
            MediaFile file;
            std::uint64_t position{};
        };

        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);
        void send_response(const protocol::ResponseEnvelope &envelope);
        void send_error(ErrorCode code, std::string message, std::optional<std::string> request_id = std::nullopt);
        void write_next();
        void on_disconnect();

        // Command handlers
        void handle_stream_open(const protocol::RequestEnvelope &envelope);
        void handle_stream_chunk(const protocol::RequestEnvelope &envelope);
        void handle_stream_close(const protocol::RequestEnvelope &envelope);
        void handle_status_list(const protocol::RequestEnvelope &envelope);
        void handle_status_get(const protocol::RequestEnvelope &envelope);
        void handle_status_terminate(const protocol::RequestEnvelope &envelope);

        void close_stream(std::unordered_map<std::string, OpenStream>::iterator it);

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;
        std::string peer_;
        bool stopped_{false};

        std::array<std::uint8_t, protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<std::vector<std::uint8_t>> write_queue_;

        std::unordered_map<std::string, OpenStream> streams_;
    };

} // namespace xferstat::server
