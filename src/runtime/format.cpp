#include <dtcalc/runtime/format.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <type_traits>
#include <utility>

namespace dtcalc::runtime {

auto format_instant(const Instant& instant) -> std::string {
    if (!instant.time) {
        return fmt::format("{:04}-{:02}-{:02}", instant.year, instant.month, instant.day);
    }
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}", instant.year, instant.month,
                       instant.day, instant.time->hour, instant.time->minute,
                       instant.time->second);
}

auto format_duration(const Duration& duration) -> std::string {
    const std::array<std::pair<std::int64_t, std::string_view>, 7> parts = {{
        {duration.years, "year"},
        {duration.months, "month"},
        {duration.weeks, "week"},
        {duration.days, "day"},
        {duration.hours, "hour"},
        {duration.minutes, "minute"},
        {duration.seconds, "second"},
    }};

    fmt::memory_buffer out;
    for (const auto& [count, unit] : parts) {
        if (count == 0) {
            continue;
        }
        if (out.size() != 0) {
            out.push_back(' ');
        }
        const bool singular = count == 1 || count == -1;
        fmt::format_to(std::back_inserter(out), "{} {}{}", count, unit, singular ? "" : "s");
    }
    if (out.size() == 0) {
        return "0 days";
    }
    return fmt::to_string(out);
}

auto format_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Instant>) {
                return format_instant(v);
            } else {
                return format_duration(v);
            }
        },
        value);
}

}  // namespace dtcalc::runtime
