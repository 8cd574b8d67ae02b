#include "xferstat/protocol.hpp"

#include <array>
#include <stdexcept>

namespace xferstat
{

    void to_json(nlohmann::json &json, const Sample &sample)
    {
        json = {
            {"bytes", sample.bytes_transferred},
            {"timestamp", sample.timestamp},
        };
    }

    void from_json(const nlohmann::json &json, Sample &sample)
    {
        sample.bytes_transferred = json.at("bytes").get<std::int64_t>();
        sample.timestamp = json.at("timestamp").get<std::int64_t>();
    }

} // namespace xferstat

namespace xferstat::protocol
{

    namespace
    {

        template <typename Enum>
        struct Mapping
        {
            Enum value;
            std::string_view label;
        };

        constexpr std::array<Mapping<Command>, 7> kCommandMappings{{
            {Command::Ping, "PING"},
            {Command::StreamOpen, "STREAM_OPEN"},
            {Command::StreamChunk, "STREAM_CHUNK"},
            {Command::StreamClose, "STREAM_CLOSE"},
            {Command::StatusList, "STATUS_LIST"},
            {Command::StatusGet, "STATUS_GET"},
            {Command::StatusTerminate, "STATUS_TERMINATE"},
        }};

        constexpr std::array<Mapping<ResponseKind>, 2> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
        }};

        constexpr std::array<Mapping<TransferKind>, 3> kTransferKindMappings{{
            {TransferKind::Stream, "STREAM"},
            {TransferKind::Download, "DOWNLOAD"},
            {TransferKind::Upload, "UPLOAD"},
        }};

        template <typename Enum, std::size_t N>
        std::string_view label_of(const std::array<Mapping<Enum>, N> &mappings, Enum value) noexcept
        {
            for (const auto &mapping : mappings)
            {
                if (mapping.value == value)
                {
                    return mapping.label;
                }
            }
            return "UNKNOWN";
        }

        template <typename Enum, std::size_t N>
        std::optional<Enum> value_of(const std::array<Mapping<Enum>, N> &mappings, std::string_view label) noexcept
        {
            for (const auto &mapping : mappings)
            {
                if (mapping.label == label)
                {
                    return mapping.value;
                }
            }
            return std::nullopt;
        }

        TransferKind parse_transfer_kind(const nlohmann::json &json)
        {
            const auto label = json.get<std::string>();
            auto kind = transfer_kind_from_string(label);
            if (!kind)
            {
                throw std::runtime_error("Unknown transfer kind: " + label);
            }
            return *kind;
        }

        void read_request_id(const nlohmann::json &json, std::optional<std::string> &request_id)
        {
            if (auto it = json.find("id"); it != json.end())
            {
                request_id = it->get<std::string>();
            }
            else
            {
                request_id.reset();
            }
        }

        template <typename T>
        void read_optional(const nlohmann::json &json, const char *key, std::optional<T> &value)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                value = it->get<T>();
            }
            else
            {
                value.reset();
            }
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        return label_of(kCommandMappings, command);
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        return value_of(kCommandMappings, value);
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        return label_of(kResponseMappings, kind);
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        return value_of(kResponseMappings, value);
    }

    std::string_view to_string(TransferKind kind) noexcept
    {
        return label_of(kTransferKindMappings, kind);
    }

    std::optional<TransferKind> transfer_kind_from_string(std::string_view value) noexcept
    {
        return value_of(kTransferKindMappings, value);
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        envelope.error = error_code_from_int(json.value("error", std::uint16_t{0}));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        read_request_id(json, envelope.request_id);
    }

    void to_json(nlohmann::json &json, const StreamOpenRequest &request)
    {
        json = {
            {"path", request.path},
            {"player_id", request.player_id},
            {"player_name", request.player_name},
            {"kind", to_string(request.kind)},
            {"offset", request.offset},
        };
    }

    void from_json(const nlohmann::json &json, StreamOpenRequest &request)
    {
        request.path = json.at("path").get<std::string>();
        request.player_id = json.at("player_id").get<std::string>();
        request.player_name = json.value("player_name", std::string{});
        request.kind = json.contains("kind") ? parse_transfer_kind(json.at("kind")) : TransferKind::Stream;
        request.offset = json.value("offset", std::uint64_t{0});
    }

    void to_json(nlohmann::json &json, const StreamDescriptor &descriptor)
    {
        json = {
            {"transfer_id", descriptor.transfer_id},
            {"total_size", descriptor.total_size},
            {"chunk_size", descriptor.chunk_size},
            {"content_hash", descriptor.content_hash},
        };
    }

    void from_json(const nlohmann::json &json, StreamDescriptor &descriptor)
    {
        descriptor.transfer_id = json.at("transfer_id").get<std::string>();
        descriptor.total_size = json.value("total_size", std::uint64_t{0});
        descriptor.chunk_size = json.value("chunk_size", std::uint64_t{0});
        descriptor.content_hash = json.value("content_hash", std::string{});
    }

    void to_json(nlohmann::json &json, const StreamChunkRequest &request)
    {
        json = {
            {"transfer_id", request.transfer_id},
            {"offset", request.offset},
            {"max_bytes", request.max_bytes},
        };
    }

    void from_json(const nlohmann::json &json, StreamChunkRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
        request.offset = json.value("offset", std::uint64_t{0});
        request.max_bytes = json.value("max_bytes", std::uint64_t{0});
    }

    void to_json(nlohmann::json &json, const StreamChunkResponse &response)
    {
        json = {
            {"transfer_id", response.transfer_id},
            {"offset", response.offset},
            {"bytes", response.bytes},
            {"done", response.done},
            {"data", response.data_base64},
            {"chunk_hash", response.chunk_hash},
        };
    }

    void from_json(const nlohmann::json &json, StreamChunkResponse &response)
    {
        response.transfer_id = json.at("transfer_id").get<std::string>();
        response.offset = json.value("offset", std::uint64_t{0});
        response.bytes = json.value("bytes", std::uint64_t{0});
        response.done = json.value("done", false);
        response.data_base64 = json.value("data", std::string{});
        response.chunk_hash = json.value("chunk_hash", std::string{});
    }

    void to_json(nlohmann::json &json, const TransferRequest &request)
    {
        json = {{"transfer_id", request.transfer_id}};
    }

    void from_json(const nlohmann::json &json, TransferRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const StatusGetRequest &request)
    {
        json = {
            {"transfer_id", request.transfer_id},
            {"include_history", request.include_history},
        };
    }

    void from_json(const nlohmann::json &json, StatusGetRequest &request)
    {
        request.transfer_id = json.at("transfer_id").get<std::string>();
        request.include_history = json.value("include_history", false);
    }

    void to_json(nlohmann::json &json, const StatusListRequest &request)
    {
        json = {{"include_history", request.include_history}};
        if (request.kind)
        {
            json["kind"] = to_string(*request.kind);
        }
        if (request.player_id)
        {
            json["player_id"] = *request.player_id;
        }
    }

    void from_json(const nlohmann::json &json, StatusListRequest &request)
    {
        if (auto it = json.find("kind"); it != json.end() && !it->is_null())
        {
            request.kind = parse_transfer_kind(*it);
        }
        else
        {
            request.kind.reset();
        }
        read_optional(json, "player_id", request.player_id);
        request.include_history = json.value("include_history", false);
    }

    void to_json(nlohmann::json &json, const TransferSnapshot &snapshot)
    {
        json = {
            {"id", snapshot.id},
            {"kind", to_string(snapshot.kind)},
            {"player_id", snapshot.player_id},
            {"player_name", snapshot.player_name},
            {"file", snapshot.file},
            {"bytes_transferred", snapshot.bytes_transferred},
            {"bytes_skipped", snapshot.bytes_skipped},
            {"bytes_total", snapshot.bytes_total},
            {"active", snapshot.active},
            {"millis_since_last_update", snapshot.millis_since_last_update},
            {"history_length_millis", snapshot.history_length_millis},
        };
        if (snapshot.average_rate)
        {
            json["average_rate"] = *snapshot.average_rate;
        }
        if (snapshot.recent_rate)
        {
            json["recent_rate"] = *snapshot.recent_rate;
        }
        if (snapshot.eta_millis)
        {
            json["eta_millis"] = *snapshot.eta_millis;
        }
        if (snapshot.samples)
        {
            json["samples"] = *snapshot.samples;
        }
    }

    void from_json(const nlohmann::json &json, TransferSnapshot &snapshot)
    {
        snapshot.id = json.at("id").get<std::string>();
        snapshot.kind = parse_transfer_kind(json.at("kind"));
        snapshot.player_id = json.value("player_id", std::string{});
        snapshot.player_name = json.value("player_name", std::string{});
        snapshot.file = json.value("file", std::string{});
        snapshot.bytes_transferred = json.value("bytes_transferred", std::int64_t{0});
        snapshot.bytes_skipped = json.value("bytes_skipped", std::int64_t{0});
        snapshot.bytes_total = json.value("bytes_total", std::int64_t{0});
        snapshot.active = json.value("active", false);
        snapshot.millis_since_last_update = json.value("millis_since_last_update", std::int64_t{0});
        snapshot.history_length_millis = json.value("history_length_millis", std::int64_t{0});
        read_optional(json, "average_rate", snapshot.average_rate);
        read_optional(json, "recent_rate", snapshot.recent_rate);
        read_optional(json, "eta_millis", snapshot.eta_millis);
        read_optional(json, "samples", snapshot.samples);
    }

    void to_json(nlohmann::json &json, const StatusListResponse &response)
    {
        json = {{"transfers", response.transfers}};
    }

    void from_json(const nlohmann::json &json, StatusListResponse &response)
    {
        response.transfers = json.value("transfers", std::vector<TransferSnapshot>{});
    }

} // namespace xferstat::protocol
