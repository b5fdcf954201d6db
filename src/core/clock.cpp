#include <dtcalc/core/clock.hpp>

#include <chrono>
#include <ctime>

namespace dtcalc {

auto system_clock() -> Clock {
    return []() -> Instant {
        const std::time_t raw =
            std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        if (::localtime_r(&raw, &local) == nullptr) {
            // Without a local zone fall back to UTC; the value is still a valid instant.
            ::gmtime_r(&raw, &local);
        }
        return Instant{
            .year = local.tm_year + 1900,
            .month = static_cast<unsigned>(local.tm_mon + 1),
            .day = static_cast<unsigned>(local.tm_mday),
            .time = TimeOfDay{
                .hour = local.tm_hour,
                .minute = local.tm_min,
                // tm_sec may report a leap second.
                .second = local.tm_sec > 59 ? 59 : local.tm_sec,
            },
        };
    };
}

auto fixed_clock(Instant instant) -> Clock {
    if (!instant.time) {
        instant.time = TimeOfDay{};
    }
    return [instant]() -> Instant { return instant; };
}

}  // namespace dtcalc
