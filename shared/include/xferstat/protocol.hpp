/**
 * xferstat - Wire schema for the streaming and status RPCs, with JSON serialization.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "xferstat/error_codes.hpp"
#include "xferstat/sample_history.hpp"

namespace xferstat
{

    void to_json(nlohmann::json &json, const Sample &sample);
    void from_json(const nlohmann::json &json, Sample &sample);

} // namespace xferstat

namespace xferstat::protocol
{

    enum class Command : std::uint8_t
    {
        Ping,
        StreamOpen,
        StreamChunk,
        StreamClose,
        StatusList,
        StatusGet,
        StatusTerminate
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    enum class TransferKind : std::uint8_t
    {
        Stream,
        Download,
        Upload
    };

    std::string_view to_string(TransferKind kind) noexcept;
    std::optional<TransferKind> transfer_kind_from_string(std::string_view value) noexcept;

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct StreamOpenRequest
    {
        std::string path;
        std::string player_id;
        std::string player_name{};
        TransferKind kind{TransferKind::Stream};
        std::uint64_t offset{};
    };

    void to_json(nlohmann::json &json, const StreamOpenRequest &request);
    void from_json(const nlohmann::json &json, StreamOpenRequest &request);

    struct StreamDescriptor
    {
        std::string transfer_id;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::string content_hash;
    };

    void to_json(nlohmann::json &json, const StreamDescriptor &descriptor);
    void from_json(const nlohmann::json &json, StreamDescriptor &descriptor);

    struct StreamChunkRequest
    {
        std::string transfer_id;
        std::uint64_t offset{};
        std::uint64_t max_bytes{};
    };

    void to_json(nlohmann::json &json, const StreamChunkRequest &request);
    void from_json(const nlohmann::json &json, StreamChunkRequest &request);

    struct StreamChunkResponse
    {
        std::string transfer_id;
        std::uint64_t offset{};
        std::uint64_t bytes{};
        bool done{};
        std::string data_base64;
        std::string chunk_hash;
    };

    void to_json(nlohmann::json &json, const StreamChunkResponse &response);
    void from_json(const nlohmann::json &json, StreamChunkResponse &response);

    // STREAM_CLOSE and STATUS_TERMINATE
    struct TransferRequest
    {
        std::string transfer_id;
    };

    void to_json(nlohmann::json &json, const TransferRequest &request);
    void from_json(const nlohmann::json &json, TransferRequest &request);

    struct StatusGetRequest
    {
        std::string transfer_id;
        bool include_history{};
    };

    void to_json(nlohmann::json &json, const StatusGetRequest &request);
    void from_json(const nlohmann::json &json, StatusGetRequest &request);

    struct StatusListRequest
    {
        std::optional<TransferKind> kind{};
        std::optional<std::string> player_id{};
        bool include_history{};
    };

    void to_json(nlohmann::json &json, const StatusListRequest &request);
    void from_json(const nlohmann::json &json, StatusListRequest &request);

    struct TransferSnapshot
    {
        std::string id;
        TransferKind kind{TransferKind::Stream};
        std::string player_id;
        std::string player_name;
        std::string file;
        std::int64_t bytes_transferred{};
        std::int64_t bytes_skipped{};
        std::int64_t bytes_total{};
        bool active{};
        std::int64_t millis_since_last_update{};
        std::int64_t history_length_millis{};
        std::optional<double> average_rate{};
        std::optional<double> recent_rate{};
        std::optional<std::int64_t> eta_millis{};
        std::optional<std::vector<Sample>> samples{};
    };

    void to_json(nlohmann::json &json, const TransferSnapshot &snapshot);
    void from_json(const nlohmann::json &json, TransferSnapshot &snapshot);

    struct StatusListResponse
    {
        std::vector<TransferSnapshot> transfers;
    };

    void to_json(nlohmann::json &json, const StatusListResponse &response);
    void from_json(const nlohmann::json &json, StatusListResponse &response);

} // namespace xferstat::protocol
