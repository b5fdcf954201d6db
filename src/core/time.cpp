#include <dtcalc/core/time.hpp>

namespace dtcalc {

auto Duration::is_zero() const -> bool {
    return years == 0 && months == 0 && weeks == 0 && days == 0 && !has_clock();
}

auto Duration::has_clock() const -> bool {
    return hours != 0 || minutes != 0 || seconds != 0;
}

auto operator+(const Duration& lhs, const Duration& rhs) -> Duration {
    return Duration{
        .years = lhs.years + rhs.years,
        .months = lhs.months + rhs.months,
        .weeks = lhs.weeks + rhs.weeks,
        .days = lhs.days + rhs.days,
        .hours = lhs.hours + rhs.hours,
        .minutes = lhs.minutes + rhs.minutes,
        .seconds = lhs.seconds + rhs.seconds,
    };
}

auto operator-(const Duration& value) -> Duration {
    return Duration{
        .years = -value.years,
        .months = -value.months,
        .weeks = -value.weeks,
        .days = -value.days,
        .hours = -value.hours,
        .minutes = -value.minutes,
        .seconds = -value.seconds,
    };
}

auto operator-(const Duration& lhs, const Duration& rhs) -> Duration {
    return lhs + (-rhs);
}

}  // namespace dtcalc
