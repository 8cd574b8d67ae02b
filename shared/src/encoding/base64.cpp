#include "xferstat/encoding/base64.hpp"

#include <array>
#include <cstdint>

namespace xferstat::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        constexpr char kPad = '=';

        consteval std::array<std::int8_t, 256> make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(-1);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::size_t i = 0;
        for (; i + 3 <= data.size(); i += 3)
        {
            const auto group = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                               (std::to_integer<std::uint32_t>(data[i + 1]) << 8) |
                               std::to_integer<std::uint32_t>(data[i + 2]);
            output.push_back(kAlphabet[(group >> 18) & 0x3F]);
            output.push_back(kAlphabet[(group >> 12) & 0x3F]);
            output.push_back(kAlphabet[(group >> 6) & 0x3F]);
            output.push_back(kAlphabet[group & 0x3F]);
        }

        const auto remaining = data.size() - i;
        if (remaining > 0)
        {
            std::uint32_t group = std::to_integer<std::uint32_t>(data[i]) << 16;
            if (remaining == 2)
            {
                group |= std::to_integer<std::uint32_t>(data[i + 1]) << 8;
            }
            output.push_back(kAlphabet[(group >> 18) & 0x3F]);
            output.push_back(kAlphabet[(group >> 12) & 0x3F]);
            output.push_back(remaining == 2 ? kAlphabet[(group >> 6) & 0x3F] : kPad);
            output.push_back(kPad);
        }
        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        while (!input.empty() && input.back() == kPad)
        {
            input.remove_suffix(1);
        }
        if (input.size() % 4 == 1)
        {
            return std::nullopt;
        }

        std::vector<std::byte> output;
        output.reserve((input.size() * 3) / 4);

        std::uint32_t accumulator = 0;
        int bits = 0;
        for (const char ch : input)
        {
            const auto value = kDecodeTable[static_cast<unsigned char>(ch)];
            if (value < 0)
            {
                return std::nullopt;
            }
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            bits += 6;
            if (bits >= 8)
            {
                bits -= 8;
                output.push_back(static_cast<std::byte>((accumulator >> bits) & 0xFF));
            }
        }
        return output;
    }

} // namespace xferstat::encoding
