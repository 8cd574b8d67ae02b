#include <array>
#include <cstdint>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "xferstat/crypto.hpp"
#include "xferstat/encoding/base64.hpp"
#include "xferstat/error_codes.hpp"
#include "xferstat/framing.hpp"
#include "xferstat/protocol.hpp"

using namespace xferstat;
using namespace xferstat::protocol;

void run_transfer_status_tests();
void run_server_component_tests();

namespace
{

    void test_request_roundtrip()
    {
        StatusListRequest list_req{.kind = TransferKind::Download, .player_id = std::string("kitchen")};
        RequestEnvelope envelope{};
        envelope.command = Command::StatusList;
        envelope.payload = list_req;
        envelope.request_id = std::string("kitchen-7");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "STATUS_LIST");
        const auto decoded = json.get<RequestEnvelope>();

        assert(decoded.command == Command::StatusList);
        assert(decoded.payload == envelope.payload);
        assert(decoded.request_id == envelope.request_id);

        const auto decoded_list = decoded.payload.get<StatusListRequest>();
        assert(decoded_list.kind == TransferKind::Download);
        assert(decoded_list.player_id == std::string("kitchen"));
        assert(!decoded_list.include_history);
    }

    void test_unknown_labels()
    {
        assert(!command_from_string("LIST").has_value());
        assert(command_from_string("STATUS_TERMINATE") == Command::StatusTerminate);
        assert(transfer_kind_from_string("UPLOAD") == TransferKind::Upload);
        assert(!transfer_kind_from_string("upload").has_value());

        bool caught = false;
        try
        {
            (void)nlohmann::json{{"cmd", "DELETE"}}.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);

        assert(to_string(ErrorCode::Terminated) == "terminated");
        assert(error_code_from_int(to_int(ErrorCode::NotFound)) == ErrorCode::NotFound);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

    void test_error_response()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Error;
        envelope.error = ErrorCode::Terminated;
        envelope.message = "Transfer was terminated";
        envelope.request_id = std::string("cli-3");

        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "ERROR");
        assert(json.at("error") == to_int(ErrorCode::Terminated));

        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::Terminated);
        assert(decoded.message == envelope.message);
        assert(decoded.request_id == envelope.request_id);
    }

    void test_stream_open_defaults()
    {
        const auto json = nlohmann::json{{"path", "album/track01.flac"}, {"player_id", "livingroom"}};
        const auto request = json.get<StreamOpenRequest>();
        assert(request.kind == TransferKind::Stream);
        assert(request.offset == 0);
        assert(request.player_name.empty());

        StreamOpenRequest resumed{
            .path = "album/track02.flac",
            .player_id = "livingroom",
            .player_name = "Living room",
            .kind = TransferKind::Download,
            .offset = 4096,
        };
        const auto decoded = nlohmann::json(resumed).get<StreamOpenRequest>();
        assert(decoded.kind == TransferKind::Download);
        assert(decoded.offset == 4096);
        assert(decoded.player_name == "Living room");
    }

    void test_snapshot_optional_fields()
    {
        TransferSnapshot snapshot{
            .id = "b6a0c1de-0000-4000-8000-000000000001",
            .kind = TransferKind::Stream,
            .player_id = "kitchen",
            .player_name = "Kitchen",
            .file = "album/track01.flac",
            .bytes_transferred = 1024,
            .bytes_skipped = 0,
            .bytes_total = 4096,
            .active = true,
            .millis_since_last_update = 1200,
            .history_length_millis = 995000,
        };

        const auto bare = nlohmann::json(snapshot);
        assert(!bare.contains("average_rate"));
        assert(!bare.contains("samples"));
        const auto decoded_bare = bare.get<TransferSnapshot>();
        assert(!decoded_bare.average_rate.has_value());
        assert(!decoded_bare.samples.has_value());
        assert(decoded_bare.active);

        snapshot.average_rate = 512.0;
        snapshot.eta_millis = 6000;
        snapshot.samples = std::vector<Sample>{{.bytes_transferred = 0, .timestamp = 100},
                                               {.bytes_transferred = 1024, .timestamp = 2100}};
        const auto full = nlohmann::json(snapshot);
        assert(full.at("samples").at(1).at("bytes") == 1024);
        const auto decoded = full.get<TransferSnapshot>();
        assert(decoded.average_rate == 512.0);
        assert(decoded.eta_millis == std::optional<std::int64_t>(6000));
        assert(decoded.samples == snapshot.samples);

        StatusListResponse list{.transfers = {snapshot, decoded_bare}};
        const auto decoded_list = nlohmann::json(list).get<StatusListResponse>();
        assert(decoded_list.transfers.size() == 2);
        assert(decoded_list.transfers[0].file == snapshot.file);
    }

    void test_framing()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::StreamChunk;
        envelope.payload = StreamChunkRequest{.transfer_id = "t-1", .offset = 2048, .max_bytes = 1024};

        const auto json = nlohmann::json(envelope);
        const auto frame = encode_frame(json);
        assert(frame.size() > kFrameHeaderSize);

        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial.has_value());

        const auto decoded = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size()));
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        const auto decoded_envelope = decoded->message.get<RequestEnvelope>();
        assert(decoded_envelope.command == Command::StreamChunk);
        assert(decoded_envelope.payload == envelope.payload);

        const std::array<std::uint8_t, kFrameHeaderSize> header{frame[0], frame[1], frame[2], frame[3]};
        assert(decode_frame_header(header) == frame.size() - kFrameHeaderSize);

        // 0x7F000000 bytes is far above the frame limit.
        const std::array<std::uint8_t, kFrameHeaderSize> oversized{0x7F, 0x00, 0x00, 0x00};
        bool caught = false;
        try
        {
            (void)decode_frame_header(oversized);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_base64()
    {
        const std::string text = "chunk data";
        const auto bytes = std::as_bytes(std::span(text.data(), text.size()));
        const auto encoded = encoding::encode_base64(bytes);
        assert(encoded == "Y2h1bmsgZGF0YQ==");

        const auto decoded = encoding::decode_base64(encoded);
        assert(decoded.has_value());
        assert(decoded->size() == text.size());
        assert(std::string(reinterpret_cast<const char *>(decoded->data()), decoded->size()) == text);

        assert(encoding::encode_base64({}).empty());
        assert(!encoding::decode_base64("Y2h1bm*").has_value());
        assert(!encoding::decode_base64("Y2h1b").has_value());
    }

    void test_crypto()
    {
        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(!chunk_hash.empty());

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        const auto stream_hash = crypto::hash_stream(stream);
        assert(chunk_hash == stream_hash);

        const auto temp_dir = std::filesystem::temp_directory_path();
        const auto file_path = temp_dir / "xferstat_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        const auto file_hash = crypto::hash_file(file_path);
        assert(file_hash == chunk_hash);
        std::filesystem::remove(file_path);

        const std::array<std::byte, 1> other = {std::byte{0x01}};
        assert(crypto::hash_bytes(other) != chunk_hash);
    }

} // namespace

int main()
{
    try
    {
        test_request_roundtrip();
        test_unknown_labels();
        test_error_response();
        test_stream_open_defaults();
        test_snapshot_optional_fields();
        test_framing();
        test_base64();
        test_crypto();
        run_transfer_status_tests();
        run_server_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
