#include "xferstat/error_codes.hpp"

#include <array>

namespace xferstat
{

    namespace
    {
        struct ErrorCodeLabel
        {
            ErrorCode code;
            std::string_view label;
        };

        constexpr std::array<ErrorCodeLabel, 10> kLabels{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::PreconditionFailed, "precondition_failed"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::Terminated, "terminated"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::Busy, "busy"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kLabels)
        {
            if (entry.code == code)
            {
                return entry.label;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kLabels)
        {
            if (to_int(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace xferstat
