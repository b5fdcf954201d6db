#pragma once

#include <dtcalc/core/error.hpp>
#include <dtcalc/core/time.hpp>

#include <cstdint>
#include <expected>

namespace dtcalc {

/// Supported year range; results outside it are `OutOfRange`.
inline constexpr int kMinYear = 1;
inline constexpr int kMaxYear = 9999;

[[nodiscard]] auto is_leap_year(int year) -> bool;

/// Number of days in `month` (1..12) of `year`; 0 for an invalid month.
[[nodiscard]] auto days_in_month(int year, unsigned month) -> unsigned;

[[nodiscard]] auto is_valid_date(int year, unsigned month, unsigned day) -> bool;
[[nodiscard]] auto is_valid_time(const TimeOfDay& time) -> bool;

/// Shift by whole months, clamping the day to the last day of the target month.
/// Jan 31 + 1 month is Feb 28 (Feb 29 in a leap year), never Mar 3.
[[nodiscard]] auto add_months(const Instant& instant, std::int64_t months)
    -> std::expected<Instant, EvalError>;

/// Shift by whole days.
[[nodiscard]] auto add_days(const Instant& instant, std::int64_t days)
    -> std::expected<Instant, EvalError>;

/// Instant + Duration.
///
/// Calendar components go first: years, then months (each clamped), then
/// weeks * 7 + days.  Clock components are then added as a fixed number of
/// seconds with carry across midnight.  A pure date only gains a time of day
/// when a clock component is non-zero.
[[nodiscard]] auto add(const Instant& instant, const Duration& duration)
    -> std::expected<Instant, EvalError>;

/// Instant - Duration, i.e. `add(instant, -duration)`.
[[nodiscard]] auto subtract(const Instant& instant, const Duration& duration)
    -> std::expected<Instant, EvalError>;

/// Elapsed time from `rhs` to `lhs` (sign of lhs - rhs).
///
/// Two dates give whole days only.  If either side has a time the elapsed
/// seconds are split into days, hours, minutes and seconds, all with the same
/// sign; a missing time counts as midnight.
[[nodiscard]] auto difference(const Instant& lhs, const Instant& rhs) -> Duration;

}  // namespace dtcalc
