#include "xferstat/clock.hpp"

#include <chrono>

namespace xferstat
{

    std::int64_t system_millis()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

} // namespace xferstat
