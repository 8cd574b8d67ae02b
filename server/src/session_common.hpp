#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "xferstat/protocol.hpp"
#include "xferstat/server/media_library.hpp"
#include "xferstat/server/status_registry.hpp"

namespace xferstat::server::session_common
{

    // Window of the "recent" rate reported next to the whole-history average.
    constexpr std::int64_t kRecentRateWindowMillis = 30'000;

    protocol::ResponseEnvelope make_ok_response(nlohmann::json payload, const std::optional<std::string> &request_id);

    protocol::TransferSnapshot make_snapshot(const StatusEntry &entry, bool include_history);

    // Up to max_bytes of file from offset. Throws StatusError(InternalError) when the
    // file cannot be opened or ends before the size recorded at open.
    std::vector<std::byte> read_chunk(const MediaFile &file, std::uint64_t offset, std::uint64_t max_bytes);

} // namespace xferstat::server::session_common
