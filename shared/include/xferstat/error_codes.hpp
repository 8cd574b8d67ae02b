/**
 * xferstat - Error codes shared by the status core, the server and the wire protocol.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace xferstat
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        InvalidArgument = 3,
        PreconditionFailed = 4,
        NotFound = 5,
        Terminated = 6,
        Unsupported = 7,
        Busy = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace xferstat
