#include "session_common.hpp"

#include <fstream>
#include <string>
#include <utility>

#include "xferstat/status_error.hpp"
#include "xferstat/throughput.hpp"

namespace xferstat::server::session_common
{

    protocol::ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id)
    {
        protocol::ResponseEnvelope envelope;
        envelope.kind = protocol::ResponseKind::Ok;
        envelope.payload = std::move(payload);
        envelope.error = ErrorCode::Ok;
        envelope.request_id = request_id;
        return envelope;
    }

    protocol::TransferSnapshot make_snapshot(const StatusEntry &entry, bool include_history)
    {
        const auto &status = *entry.status;
        const auto history = status.history();

        protocol::TransferSnapshot snapshot;
        snapshot.id = status.id();
        snapshot.kind = entry.kind;
        if (const auto &player = status.player())
        {
            snapshot.player_id = player->id;
            snapshot.player_name = player->name;
        }
        snapshot.file = status.file().generic_string();
        snapshot.bytes_transferred = status.bytes_transferred();
        snapshot.bytes_skipped = status.bytes_skipped();
        snapshot.bytes_total = status.bytes_total();
        snapshot.active = status.is_active();
        snapshot.millis_since_last_update = status.millis_since_last_update();
        snapshot.history_length_millis = status.history_length_millis();
        snapshot.average_rate = average_rate(history);
        snapshot.recent_rate = windowed_rate(history, kRecentRateWindowMillis);

        const auto rate = snapshot.recent_rate ? snapshot.recent_rate : snapshot.average_rate;
        if (snapshot.active && rate)
        {
            snapshot.eta_millis = estimate_remaining_millis(snapshot.bytes_transferred + snapshot.bytes_skipped,
                                                            snapshot.bytes_total, *rate);
        }
        if (include_history)
        {
            snapshot.samples = history.to_vector();
        }
        return snapshot;
    }

    std::vector<std::byte> read_chunk(const MediaFile &file, std::uint64_t offset, std::uint64_t max_bytes)
    {
        std::ifstream input(file.path, std::ios::binary);
        if (!input.is_open())
        {
            throw StatusError(ErrorCode::InternalError, "Failed to open " + file.relative);
        }
        input.seekg(static_cast<std::streamoff>(offset));
        std::vector<std::byte> data(static_cast<std::size_t>(max_bytes));
        input.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(data.size()));
        data.resize(static_cast<std::size_t>(input.gcount()));
        if (data.empty() && max_bytes > 0 && offset < file.size)
        {
            throw StatusError(ErrorCode::InternalError,
                              file.relative + " ended at offset " + std::to_string(offset) + " of " +
                                  std::to_string(file.size));
        }
        return data;
    }

} // namespace xferstat::server::session_common
