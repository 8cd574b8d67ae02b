#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xferstat::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // nullopt on characters outside the alphabet or a truncated final quantum.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace xferstat::encoding
