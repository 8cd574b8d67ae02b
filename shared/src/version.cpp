#include "xferstat/version.hpp"

#ifndef XFERSTAT_VERSION
#define XFERSTAT_VERSION "0.0.0"
#endif

namespace xferstat
{

    std::string_view version() noexcept
    {
        return XFERSTAT_VERSION;
    }

} // namespace xferstat
