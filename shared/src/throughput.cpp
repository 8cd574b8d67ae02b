#include "xferstat/throughput.hpp"

#include <cmath>

namespace xferstat
{

    namespace
    {

        std::optional<double> rate_between(const SampleHistory &history, std::size_t from, std::size_t to)
        {
            const auto &start = history[from];
            const auto &end = history[to];
            const auto elapsed = end.timestamp - start.timestamp;
            if (elapsed <= 0)
            {
                return std::nullopt;
            }
            // A reactivated transfer starts counting from zero again; a window
            // spanning the reset says nothing about the current rate.
            for (std::size_t i = from + 1; i <= to; ++i)
            {
                if (history[i].bytes_transferred < history[i - 1].bytes_transferred)
                {
                    return std::nullopt;
                }
            }
            const auto bytes = end.bytes_transferred - start.bytes_transferred;
            return static_cast<double>(bytes) * 1000.0 / static_cast<double>(elapsed);
        }

    } // namespace

    std::optional<double> average_rate(const SampleHistory &history)
    {
        if (history.size() < 2)
        {
            return std::nullopt;
        }
        return rate_between(history, 0, history.size() - 1);
    }

    std::optional<double> windowed_rate(const SampleHistory &history, std::int64_t window_millis)
    {
        if (history.size() < 2 || window_millis <= 0)
        {
            return std::nullopt;
        }
        const auto last_index = history.size() - 1;
        const auto cutoff = history[last_index].timestamp - window_millis;
        auto first_index = last_index;
        while (first_index > 0 && history[first_index - 1].timestamp >= cutoff)
        {
            --first_index;
        }
        if (first_index == last_index)
        {
            return std::nullopt;
        }
        return rate_between(history, first_index, last_index);
    }

    std::optional<std::int64_t> estimate_remaining_millis(std::int64_t bytes_done, std::int64_t bytes_total,
                                                          double bytes_per_second)
    {
        if (bytes_total <= 0 || bytes_done >= bytes_total || !(bytes_per_second > 0.0))
        {
            return std::nullopt;
        }
        const auto remaining = static_cast<double>(bytes_total - bytes_done);
        return static_cast<std::int64_t>(std::ceil(remaining * 1000.0 / bytes_per_second));
    }

} // namespace xferstat
