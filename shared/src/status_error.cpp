#include "xferstat/status_error.hpp"

#include <utility>

namespace xferstat
{

    StatusError::StatusError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code)
    {
    }

} // namespace xferstat
