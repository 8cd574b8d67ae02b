/**
 * xferstat - Millisecond wall-clock source used for sample timestamps.
 */
#pragma once

#include <cstdint>
#include <functional>

namespace xferstat
{

    using MillisClock = std::function<std::int64_t()>;

    // Milliseconds since the Unix epoch.
    std::int64_t system_millis();

} // namespace xferstat
