#include "xferstat/framing.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace xferstat::protocol
{

    namespace
    {

        void check_payload_size(std::size_t size)
        {
            if (size > kMaxFramePayload)
            {
                throw std::length_error("Frame payload of " + std::to_string(size) + " bytes exceeds limit");
            }
        }

    } // namespace

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump();
        check_payload_size(text.size());

        const auto size = static_cast<std::uint32_t>(text.size());
        std::vector<std::uint8_t> frame;
        frame.reserve(kFrameHeaderSize + text.size());
        frame.push_back(static_cast<std::uint8_t>(size >> 24));
        frame.push_back(static_cast<std::uint8_t>(size >> 16));
        frame.push_back(static_cast<std::uint8_t>(size >> 8));
        frame.push_back(static_cast<std::uint8_t>(size));
        frame.insert(frame.end(), text.begin(), text.end());
        return frame;
    }

    std::uint32_t decode_frame_header(std::span<const std::uint8_t, kFrameHeaderSize> header)
    {
        std::uint32_t size = 0;
        for (const auto byte : header)
        {
            size = (size << 8) | byte;
        }
        check_payload_size(size);
        return size;
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = decode_frame_header(buffer.first<kFrameHeaderSize>());
        if (buffer.size() - kFrameHeaderSize < payload_size)
        {
            return std::nullopt;
        }
        const auto payload = buffer.subspan(kFrameHeaderSize, payload_size);
        return DecodedFrame{
            .message = nlohmann::json::parse(payload.begin(), payload.end()),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
    }

} // namespace xferstat::protocol
