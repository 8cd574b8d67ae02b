/**
 * xferstat - Length-prefixed JSON framing helpers.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace xferstat::protocol
{

    constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);
    constexpr std::size_t kMaxFramePayload = 16u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    // Payload size announced by a frame header. Throws std::length_error above kMaxFramePayload.
    std::uint32_t decode_frame_header(std::span<const std::uint8_t, kFrameHeaderSize> header);

    // nullopt until the buffer holds a complete frame.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

} // namespace xferstat::protocol
