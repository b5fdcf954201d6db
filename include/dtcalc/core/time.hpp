#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <variant>

namespace dtcalc {

/// Wall-clock time of day, second precision, no time zone.
struct TimeOfDay {
    int hour = 0;
    int minute = 0;
    int second = 0;
    auto operator<=>(const TimeOfDay&) const = default;
};

/// Civil date with an optional time of day.
///
/// Without `time` the value is a pure date; arithmetic keeps it that way unless
/// a clock component forces a time of day into existence.
struct Instant {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
    std::optional<TimeOfDay> time;

    [[nodiscard]] auto has_time() const -> bool { return time.has_value(); }
    auto operator<=>(const Instant&) const = default;
};

/// Signed calendar + clock quantity.
///
/// years/months/weeks/days are calendar units (applied with calendar rules);
/// hours/minutes/seconds are clock units (fixed length).  Components are never
/// normalized into one another.
struct Duration {
    std::int64_t years = 0;
    std::int64_t months = 0;
    std::int64_t weeks = 0;
    std::int64_t days = 0;
    std::int64_t hours = 0;
    std::int64_t minutes = 0;
    std::int64_t seconds = 0;

    [[nodiscard]] auto is_zero() const -> bool;
    [[nodiscard]] auto has_clock() const -> bool;

    auto operator==(const Duration&) const -> bool = default;
};

/// A parsed operand or an evaluation result.
using Value = std::variant<Instant, Duration>;

[[nodiscard]] auto operator+(const Duration& lhs, const Duration& rhs) -> Duration;
[[nodiscard]] auto operator-(const Duration& lhs, const Duration& rhs) -> Duration;
[[nodiscard]] auto operator-(const Duration& value) -> Duration;

}  // namespace dtcalc
