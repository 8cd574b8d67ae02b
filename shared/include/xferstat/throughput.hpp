/**
 * xferstat - Rate figures derived from a sample history.
 */
#pragma once

#include <cstdint>
#include <optional>

#include "xferstat/sample_history.hpp"

namespace xferstat
{

    // Bytes per second between the first and the last sample.
    std::optional<double> average_rate(const SampleHistory &history);

    // Bytes per second over the samples taken within window_millis of the last one.
    std::optional<double> windowed_rate(const SampleHistory &history, std::int64_t window_millis);

    std::optional<std::int64_t> estimate_remaining_millis(std::int64_t bytes_done, std::int64_t bytes_total,
                                                          double bytes_per_second);

} // namespace xferstat
