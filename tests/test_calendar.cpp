#include <dtcalc/core/calendar.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace dtcalc;

namespace {

auto date(int y, unsigned m, unsigned d) -> Instant {
    return Instant{.year = y, .month = m, .day = d, .time = std::nullopt};
}

auto datetime(int y, unsigned m, unsigned d, int hh, int mm, int ss = 0) -> Instant {
    return Instant{.year = y,
                   .month = m,
                   .day = d,
                   .time = TimeOfDay{.hour = hh, .minute = mm, .second = ss}};
}

}  // namespace

TEST_CASE("Leap years and month lengths", "[calendar]") {
    REQUIRE(is_leap_year(2024));
    REQUIRE_FALSE(is_leap_year(2023));
    REQUIRE_FALSE(is_leap_year(1900));
    REQUIRE(is_leap_year(2000));

    REQUIRE(days_in_month(2024, 2) == 29);
    REQUIRE(days_in_month(2023, 2) == 28);
    REQUIRE(days_in_month(2024, 4) == 30);
    REQUIRE(days_in_month(2024, 12) == 31);
    REQUIRE(days_in_month(2024, 13) == 0);

    REQUIRE(is_valid_date(2024, 2, 29));
    REQUIRE_FALSE(is_valid_date(2023, 2, 29));
    REQUIRE_FALSE(is_valid_date(0, 1, 1));
    REQUIRE(is_valid_time(TimeOfDay{.hour = 23, .minute = 59, .second = 59}));
    REQUIRE_FALSE(is_valid_time(TimeOfDay{.hour = 24, .minute = 0, .second = 0}));
}

TEST_CASE("Month arithmetic clamps to the end of the month", "[calendar]") {
    SECTION("leap year") {
        auto r = add_months(date(2024, 1, 31), 1);
        REQUIRE(r.has_value());
        REQUIRE(*r == date(2024, 2, 29));
    }
    SECTION("common year") {
        auto r = add_months(date(2023, 1, 31), 1);
        REQUIRE(r.has_value());
        REQUIRE(*r == date(2023, 2, 28));
    }
    SECTION("backwards") {
        auto r = add_months(date(2024, 3, 31), -1);
        REQUIRE(r.has_value());
        REQUIRE(*r == date(2024, 2, 29));
    }
    SECTION("across year boundaries") {
        REQUIRE(*add_months(date(2024, 12, 15), 1) == date(2025, 1, 15));
        REQUIRE(*add_months(date(2024, 1, 15), -1) == date(2023, 12, 15));
        REQUIRE(*add_months(date(2024, 5, 31), 12) == date(2025, 5, 31));
        REQUIRE(*add_months(date(2024, 5, 31), -25) == date(2022, 4, 30));
    }
}

TEST_CASE("Years are applied before months", "[calendar]") {
    REQUIRE(*add(date(2024, 2, 29), Duration{.years = 1}) == date(2025, 2, 28));
    REQUIRE(*add(date(2024, 2, 29), Duration{.years = 4}) == date(2028, 2, 29));
    // 2024-02-29 -> 2025-02-28 -> 2025-03-28
    REQUIRE(*add(date(2024, 2, 29), Duration{.years = 1, .months = 1}) == date(2025, 3, 28));
}

TEST_CASE("Months are applied before days", "[calendar]") {
    // 2024-01-31 -> 2024-02-29 -> 2024-03-01
    REQUIRE(*add(date(2024, 1, 31), Duration{.months = 1, .days = 1}) == date(2024, 3, 1));
    REQUIRE(*add(date(2024, 1, 1), Duration{.weeks = 2, .days = 1}) == date(2024, 1, 16));
}

TEST_CASE("Day arithmetic crosses months and years", "[calendar]") {
    REQUIRE(*add(date(2023, 12, 31), Duration{.days = 1}) == date(2024, 1, 1));
    REQUIRE(*subtract(date(2024, 3, 1), Duration{.days = 1}) == date(2024, 2, 29));
    REQUIRE(*add(date(2024, 7, 10), Duration{.days = 300}) == date(2025, 5, 6));
}

TEST_CASE("Clock components carry across midnight", "[calendar]") {
    SECTION("carry forward") {
        auto r = add(datetime(2024, 12, 31, 23, 30), Duration{.minutes = 45});
        REQUIRE(r.has_value());
        REQUIRE(*r == datetime(2025, 1, 1, 0, 15));
    }
    SECTION("borrow backwards") {
        auto r = subtract(datetime(2024, 1, 1, 0, 10), Duration{.minutes = 20});
        REQUIRE(r.has_value());
        REQUIRE(*r == datetime(2023, 12, 31, 23, 50));
    }
    SECTION("many hours") {
        auto r = add(datetime(2024, 1, 1, 12, 0), Duration{.hours = 50, .seconds = 5});
        REQUIRE(r.has_value());
        REQUIRE(*r == datetime(2024, 1, 3, 14, 0, 5));
    }
}

TEST_CASE("A pure date gains a time only from clock components", "[calendar]") {
    auto with_hours = add(date(2024, 1, 1), Duration{.hours = 5});
    REQUIRE(with_hours.has_value());
    REQUIRE(with_hours->has_time());
    REQUIRE(*with_hours == datetime(2024, 1, 1, 5, 0));

    auto with_days = add(date(2024, 1, 1), Duration{.days = 5});
    REQUIRE(with_days.has_value());
    REQUIRE_FALSE(with_days->has_time());

    auto unchanged = add(date(2024, 1, 1), Duration{});
    REQUIRE(unchanged.has_value());
    REQUIRE(*unchanged == date(2024, 1, 1));

    // Calendar shifts keep an existing time of day.
    REQUIRE(*add(datetime(2024, 1, 31, 8, 15), Duration{.months = 1}) ==
            datetime(2024, 2, 29, 8, 15));
}

TEST_CASE("Results outside years 1..9999 are rejected", "[calendar]") {
    auto past_end = add(date(9999, 12, 31), Duration{.days = 1});
    REQUIRE_FALSE(past_end.has_value());
    REQUIRE(past_end.error().kind == ErrorKind::OutOfRange);

    auto before_start = subtract(date(1, 1, 1), Duration{.days = 1});
    REQUIRE_FALSE(before_start.has_value());
    REQUIRE(before_start.error().kind == ErrorKind::OutOfRange);

    REQUIRE(add(date(2024, 1, 1), Duration{.years = 1'000'000}).error().kind ==
            ErrorKind::OutOfRange);
    REQUIRE(add(date(2024, 1, 1), Duration{.months = -30'000}).error().kind ==
            ErrorKind::OutOfRange);
    REQUIRE(add(datetime(9999, 12, 31, 23, 0), Duration{.hours = 1}).error().kind ==
            ErrorKind::OutOfRange);

    REQUIRE(*add(date(1, 1, 1), Duration{.days = 3'652'058}) == date(9999, 12, 31));
}

TEST_CASE("Difference between two dates is whole days", "[calendar]") {
    REQUIRE(difference(date(2024, 7, 10), date(2023, 7, 10)) == Duration{.days = 366});
    REQUIRE(difference(date(2023, 7, 10), date(2024, 7, 10)) == Duration{.days = -366});
    REQUIRE(difference(date(2024, 7, 10), date(2024, 7, 10)).is_zero());
}

TEST_CASE("Difference with a time of day splits into clock components", "[calendar]") {
    REQUIRE(difference(datetime(2024, 1, 2, 6, 0), date(2024, 1, 1)) ==
            Duration{.days = 1, .hours = 6});
    REQUIRE(difference(date(2024, 1, 1), datetime(2024, 1, 2, 6, 30)) ==
            Duration{.days = -1, .hours = -6, .minutes = -30});
    REQUIRE(difference(datetime(2024, 1, 1, 10, 0, 5), datetime(2024, 1, 1, 9, 59, 50)) ==
            Duration{.seconds = 15});
}

TEST_CASE("Subtracting then adding a duration restores the instant", "[calendar]") {
    // Days of month stay at or below 28 so month steps never clamp.
    const std::vector<Instant> instants = {
        date(2024, 7, 10),
        date(2023, 1, 15),
        datetime(2024, 2, 28, 23, 59, 59),
        datetime(2000, 12, 1, 0, 0, 1),
    };
    const std::vector<Duration> durations = {
        Duration{.days = 300},
        Duration{.days = -45},
        Duration{.weeks = 3},
        Duration{.months = 6},
        Duration{.months = -14},
        Duration{.years = 1, .months = 6},
        Duration{.years = 25},
    };
    for (const auto& instant : instants) {
        for (const auto& duration : durations) {
            auto back = subtract(instant, duration);
            REQUIRE(back.has_value());
            auto restored = add(*back, duration);
            REQUIRE(restored.has_value());
            REQUIRE(*restored == instant);
        }
    }
}

TEST_CASE("Clock-only durations restore a datetime", "[calendar]") {
    const auto instant = datetime(2024, 2, 28, 23, 59, 59);
    const Duration duration{.hours = 36, .minutes = 5, .seconds = 90};
    auto back = subtract(instant, duration);
    REQUIRE(back.has_value());
    REQUIRE(*add(*back, duration) == instant);
}

TEST_CASE("Month clamping is not reversible", "[calendar]") {
    auto back = subtract(date(2024, 3, 31), Duration{.months = 1});
    REQUIRE(*back == date(2024, 2, 29));
    REQUIRE(*add(*back, Duration{.months = 1}) == date(2024, 3, 29));
}
