#include <dtcalc/runtime/format.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace dtcalc;
using namespace dtcalc::runtime;

TEST_CASE("Format dates and datetimes", "[format]") {
    REQUIRE(format_instant(Instant{.year = 2024, .month = 7, .day = 4}) == "2024-07-04");
    REQUIRE(format_instant(Instant{.year = 999, .month = 1, .day = 5}) == "0999-01-05");
    REQUIRE(format_instant(Instant{.year = 2024,
                                   .month = 12,
                                   .day = 31,
                                   .time = TimeOfDay{.hour = 7, .minute = 5, .second = 9}}) ==
            "2024-12-31 07:05:09");
    // Midnight is still printed when a time of day is present.
    REQUIRE(format_instant(
                Instant{.year = 2024, .month = 1, .day = 1, .time = TimeOfDay{}}) ==
            "2024-01-01 00:00:00");
}

TEST_CASE("Format durations largest unit first", "[format]") {
    REQUIRE(format_duration(Duration{.years = 1, .months = 6, .days = 10}) ==
            "1 year 6 months 10 days");
    REQUIRE(format_duration(Duration{.years = 2,
                                     .months = 1,
                                     .weeks = 3,
                                     .days = 1,
                                     .hours = 4,
                                     .minutes = 1,
                                     .seconds = 30}) ==
            "2 years 1 month 3 weeks 1 day 4 hours 1 minute 30 seconds");
    REQUIRE(format_duration(Duration{.weeks = 1}) == "1 week");
    REQUIRE(format_duration(Duration{.hours = 26}) == "26 hours");
}

TEST_CASE("Zero and negative durations", "[format]") {
    REQUIRE(format_duration(Duration{}) == "0 days");
    REQUIRE(format_duration(Duration{.days = -1, .hours = -2}) == "-1 day -2 hours");
    REQUIRE(format_duration(Duration{.days = -366}) == "-366 days");
    REQUIRE(format_duration(Duration{.minutes = -1}) == "-1 minute");
}

TEST_CASE("Format either kind of value", "[format]") {
    REQUIRE(format_value(Value{Duration{.days = 28}}) == "28 days");
    REQUIRE(format_value(Value{Instant{.year = 2026, .month = 1, .day = 4}}) == "2026-01-04");
}
