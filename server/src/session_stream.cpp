#include "xferstat/server/session.hpp"

#include <algorithm>
#include <vector>

#include <spdlog/spdlog.h>

#include "session_common.hpp"
#include "xferstat/crypto.hpp"
#include "xferstat/encoding/base64.hpp"
#include "xferstat/status_error.hpp"

namespace xferstat::server
{

    void Session::handle_stream_open(const protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<protocol::StreamOpenRequest>();
            if (request.kind == protocol::TransferKind::Upload)
            {
                send_error(ErrorCode::Unsupported, "Uploads are not served", envelope.request_id);
                return;
            }
            if (request.player_id.empty())
            {
                send_error(ErrorCode::InvalidArgument, "Missing player id", envelope.request_id);
                return;
            }
            auto file = services_.library.resolve(request.path);
            if (request.offset > file.size)
            {
                send_error(ErrorCode::InvalidArgument, "Offset beyond end of file", envelope.request_id);
                return;
            }
            const auto content_hash = crypto::hash_file(file.path);

            auto player = std::make_shared<const Player>(Player{
                .id = request.player_id,
                .name = request.player_name.empty() ? request.player_id : request.player_name,
                .address = peer_,
            });
            auto status = services_.registry.create(request.kind, std::move(player));
            status->set_file(file.relative);
            status->set_bytes_total(static_cast<std::int64_t>(file.size));
            if (request.offset > 0)
            {
                status->add_bytes_skipped(static_cast<std::int64_t>(request.offset));
            }

            const protocol::StreamDescriptor descriptor{
                .transfer_id = status->id(),
                .total_size = file.size,
                .chunk_size = services_.chunk_size,
                .content_hash = content_hash,
            };
            spdlog::info("Opened {} for {}", status->describe(), peer_);
            streams_[status->id()] = OpenStream{
                .kind = request.kind,
                .status = std::move(status),
                .file = std::move(file),
                .position = request.offset,
            };
            send_response(session_common::make_ok_response(descriptor, envelope.request_id));
        }
        catch (const LibraryError &ex)
        {
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("STREAM_OPEN failed for {}: {}", peer_, ex.what());
            send_error(ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_stream_chunk(const protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<protocol::StreamChunkRequest>();
            auto it = streams_.find(request.transfer_id);
            if (it == streams_.end())
            {
                send_error(ErrorCode::NotFound, "Unknown transfer", envelope.request_id);
                return;
            }
            auto &stream = it->second;
            if (stream.status->terminated())
            {
                spdlog::info("Stopping {} on request", stream.status->describe());
                close_stream(it);
                send_error(ErrorCode::Terminated, "Transfer terminated", envelope.request_id);
                return;
            }
            if (request.offset > stream.file.size)
            {
                send_error(ErrorCode::InvalidArgument, "Invalid offset", envelope.request_id);
                return;
            }
            if (request.offset > stream.position)
            {
                stream.status->add_bytes_skipped(static_cast<std::int64_t>(request.offset - stream.position));
            }

            const auto limit = request.max_bytes == 0 ? services_.chunk_size
                                                      : std::min<std::uint64_t>(services_.chunk_size, request.max_bytes);
            std::vector<std::byte> data;
            try
            {
                data = session_common::read_chunk(stream.file, request.offset, limit);
            }
            catch (const StatusError &ex)
            {
                spdlog::error("{} for {}: {}", stream.status->describe(), peer_, ex.what());
                close_stream(it);
                send_error(ex.code(), ex.what(), envelope.request_id);
                return;
            }

            stream.status->add_bytes_transferred(static_cast<std::int64_t>(data.size()));
            stream.position = request.offset + data.size();
            const bool done = stream.position >= stream.file.size;

            const protocol::StreamChunkResponse chunk{
                .transfer_id = request.transfer_id,
                .offset = request.offset,
                .bytes = data.size(),
                .done = done,
                .data_base64 = encoding::encode_base64(data),
                .chunk_hash = crypto::hash_bytes(data),
            };
            if (done)
            {
                spdlog::info("Completed {}", stream.status->describe());
                close_stream(it);
            }
            send_response(session_common::make_ok_response(chunk, envelope.request_id));
        }
        catch (const StatusError &ex)
        {
            send_error(ex.code(), ex.what(), envelope.request_id);
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("STREAM_CHUNK failed for {}: {}", peer_, ex.what());
            send_error(ErrorCode::InternalError, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_stream_close(const protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<protocol::TransferRequest>();
            auto it = streams_.find(request.transfer_id);
            if (it == streams_.end())
            {
                send_error(ErrorCode::NotFound, "Unknown transfer", envelope.request_id);
                return;
            }
            close_stream(it);
            send_response(session_common::make_ok_response(nlohmann::json::object(), envelope.request_id));
        }
        catch (const nlohmann::json::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
    }

    void Session::close_stream(std::unordered_map<std::string, OpenStream>::iterator it)
    {
        services_.registry.remove(it->second.kind, it->second.status);
        spdlog::debug("Closed transfer {} for {}", it->first, peer_);
        streams_.erase(it);
    }

} // namespace xferstat::server
