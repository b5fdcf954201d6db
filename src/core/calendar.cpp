#include <dtcalc/core/calendar.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <chrono>

namespace dtcalc {

namespace {

constexpr std::int64_t kSecondsPerDay = 86'400;
// Days from 0001-01-01 to 9999-12-31; no valid shift is longer.
constexpr std::int64_t kMaxSpanDays = 3'652'059;
constexpr std::int64_t kMaxSpanMonths = static_cast<std::int64_t>(kMaxYear) * 12;

auto out_of_range() -> EvalError {
    return make_error(ErrorKind::OutOfRange,
                      fmt::format("result is outside the supported years {}..{}", kMinYear,
                                  kMaxYear));
}

auto in_span(std::int64_t value, std::int64_t limit) -> bool {
    return value >= -limit && value <= limit;
}

auto to_sys_days(const Instant& instant) -> std::chrono::sys_days {
    using namespace std::chrono;
    return sys_days{year{instant.year} / month{instant.month} / day{instant.day}};
}

auto seconds_of(const TimeOfDay& time) -> std::int64_t {
    return static_cast<std::int64_t>(time.hour) * 3600 +
           static_cast<std::int64_t>(time.minute) * 60 + time.second;
}

auto year_in_range(std::int64_t year) -> bool {
    return year >= kMinYear && year <= kMaxYear;
}

}  // namespace

auto is_leap_year(int year) -> bool {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

auto days_in_month(int year, unsigned month) -> unsigned {
    switch (month) {
        case 1:
        case 3:
        case 5:
        case 7:
        case 8:
        case 10:
        case 12:
            return 31;
        case 4:
        case 6:
        case 9:
        case 11:
            return 30;
        case 2:
            return is_leap_year(year) ? 29 : 28;
        default:
            return 0;
    }
}

auto is_valid_date(int year, unsigned month, unsigned day) -> bool {
    if (!year_in_range(year) || month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= days_in_month(year, month);
}

auto is_valid_time(const TimeOfDay& time) -> bool {
    return time.hour >= 0 && time.hour <= 23 && time.minute >= 0 && time.minute <= 59 &&
           time.second >= 0 && time.second <= 59;
}

auto add_months(const Instant& instant, std::int64_t months)
    -> std::expected<Instant, EvalError> {
    if (!in_span(months, kMaxSpanMonths)) {
        return std::unexpected(out_of_range());
    }
    const std::int64_t index =
        static_cast<std::int64_t>(instant.year) * 12 + (instant.month - 1) + months;
    const std::int64_t year = index >= 0 ? index / 12 : -1;
    if (!year_in_range(year)) {
        return std::unexpected(out_of_range());
    }
    Instant shifted = instant;
    shifted.year = static_cast<int>(year);
    shifted.month = static_cast<unsigned>(index % 12) + 1;
    shifted.day = std::min(instant.day, days_in_month(shifted.year, shifted.month));
    return shifted;
}

auto add_days(const Instant& instant, std::int64_t days) -> std::expected<Instant, EvalError> {
    using namespace std::chrono;
    if (!in_span(days, kMaxSpanDays)) {
        return std::unexpected(out_of_range());
    }
    const year_month_day ymd{to_sys_days(instant) + std::chrono::days{days}};
    if (!year_in_range(static_cast<int>(ymd.year()))) {
        return std::unexpected(out_of_range());
    }
    Instant shifted = instant;
    shifted.year = static_cast<int>(ymd.year());
    shifted.month = static_cast<unsigned>(ymd.month());
    shifted.day = static_cast<unsigned>(ymd.day());
    return shifted;
}

auto add(const Instant& instant, const Duration& duration) -> std::expected<Instant, EvalError> {
    using namespace std::chrono;
    if (!in_span(duration.years, kMaxYear) || !in_span(duration.weeks, kMaxSpanDays) ||
        !in_span(duration.days, kMaxSpanDays)) {
        return std::unexpected(out_of_range());
    }

    auto shifted = add_months(instant, duration.years * 12);
    if (!shifted) {
        return shifted;
    }
    shifted = add_months(*shifted, duration.months);
    if (!shifted) {
        return shifted;
    }
    shifted = add_days(*shifted, duration.weeks * 7 + duration.days);
    if (!shifted || !duration.has_clock()) {
        return shifted;
    }

    if (!in_span(duration.hours, kMaxSpanDays * 24) ||
        !in_span(duration.minutes, kMaxSpanDays * 24 * 60) ||
        !in_span(duration.seconds, kMaxSpanDays * kSecondsPerDay)) {
        return std::unexpected(out_of_range());
    }
    const std::int64_t clock = duration.hours * 3600 + duration.minutes * 60 + duration.seconds;
    const sys_seconds point = to_sys_days(*shifted) +
                              std::chrono::seconds{seconds_of(shifted->time.value_or(TimeOfDay{})) +
                                                   clock};
    const auto day_point = floor<std::chrono::days>(point);
    const year_month_day ymd{day_point};
    if (!year_in_range(static_cast<int>(ymd.year()))) {
        return std::unexpected(out_of_range());
    }
    const hh_mm_ss<std::chrono::seconds> hms{point - day_point};
    return Instant{
        .year = static_cast<int>(ymd.year()),
        .month = static_cast<unsigned>(ymd.month()),
        .day = static_cast<unsigned>(ymd.day()),
        .time =
            TimeOfDay{
                .hour = static_cast<int>(hms.hours().count()),
                .minute = static_cast<int>(hms.minutes().count()),
                .second = static_cast<int>(hms.seconds().count()),
            },
    };
}

auto subtract(const Instant& instant, const Duration& duration)
    -> std::expected<Instant, EvalError> {
    return add(instant, -duration);
}

auto difference(const Instant& lhs, const Instant& rhs) -> Duration {
    const std::int64_t day_delta = (to_sys_days(lhs) - to_sys_days(rhs)).count();
    if (!lhs.has_time() && !rhs.has_time()) {
        return Duration{.days = day_delta};
    }
    const std::int64_t total = day_delta * kSecondsPerDay +
                               seconds_of(lhs.time.value_or(TimeOfDay{})) -
                               seconds_of(rhs.time.value_or(TimeOfDay{}));
    // Truncating division keeps every component on the sign of `total`.
    std::int64_t rest = total % kSecondsPerDay;
    Duration elapsed{.days = total / kSecondsPerDay};
    elapsed.hours = rest / 3600;
    rest %= 3600;
    elapsed.minutes = rest / 60;
    elapsed.seconds = rest % 60;
    return elapsed;
}

}  // namespace dtcalc
