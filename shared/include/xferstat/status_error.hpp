#pragma once

#include <stdexcept>
#include <string>

#include "xferstat/error_codes.hpp"

namespace xferstat
{

    class StatusError : public std::runtime_error
    {
    public:
        StatusError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace xferstat
