#include <dtcalc/parser/parser.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace dtcalc;
using dtcalc::parser::expand_two_digit_year;
using dtcalc::parser::parse_instant;
using dtcalc::parser::parse_keyword;

namespace {

const Instant kNow{
    .year = 2024,
    .month = 7,
    .day = 10,
    .time = TimeOfDay{.hour = 9, .minute = 30, .second = 15},
};

auto date(int y, unsigned m, unsigned d) -> Instant {
    return Instant{.year = y, .month = m, .day = d, .time = std::nullopt};
}

auto datetime(int y, unsigned m, unsigned d, int hh, int mm, int ss = 0) -> Instant {
    return Instant{.year = y,
                   .month = m,
                   .day = d,
                   .time = TimeOfDay{.hour = hh, .minute = mm, .second = ss}};
}

auto require_instant(const char* text) -> Instant {
    auto result = parse_instant(text, kNow);
    REQUIRE(result.has_value());
    return *result;
}

auto require_error(const char* text) -> ErrorKind {
    auto result = parse_instant(text, kNow);
    REQUIRE_FALSE(result.has_value());
    return result.error().kind;
}

}  // namespace

TEST_CASE("ISO dates", "[datetime]") {
    REQUIRE(require_instant("2024-07-10") == date(2024, 7, 10));
    REQUIRE(require_instant("2024-7-4") == date(2024, 7, 4));
    REQUIRE(require_instant("  2024-02-29 ") == date(2024, 2, 29));
    REQUIRE_FALSE(require_instant("2024-07-10").has_time());
}

TEST_CASE("Slash dates with month names or numbers", "[datetime]") {
    REQUIRE(require_instant("June/10/2024") == date(2024, 6, 10));
    REQUIRE(require_instant("jun/10/24") == date(2024, 6, 10));
    REQUIRE(require_instant("SEPT/1/2023") == date(2023, 9, 1));
    REQUIRE(require_instant("Sep/01/23") == date(2023, 9, 1));
    REQUIRE(require_instant("06/10/2024") == date(2024, 6, 10));
    REQUIRE(require_instant("6/10/24") == date(2024, 6, 10));
}

TEST_CASE("Two-digit years pivot at 68/69", "[datetime]") {
    REQUIRE(expand_two_digit_year(0) == 2000);
    REQUIRE(expand_two_digit_year(68) == 2068);
    REQUIRE(expand_two_digit_year(69) == 1969);
    REQUIRE(expand_two_digit_year(99) == 1999);

    REQUIRE(require_instant("01/01/68") == date(2068, 1, 1));
    REQUIRE(require_instant("01/01/69") == date(1969, 1, 1));
    REQUIRE(require_instant("12/31/99") == date(1999, 12, 31));
    REQUIRE(require_instant("Jan/01/00") == date(2000, 1, 1));
}

TEST_CASE("Dates followed by a time of day", "[datetime]") {
    REQUIRE(require_instant("2024-07-10 15:33") == datetime(2024, 7, 10, 15, 33));
    REQUIRE(require_instant("2024-07-10 15:33:20") == datetime(2024, 7, 10, 15, 33, 20));
    REQUIRE(require_instant("06/10/24 15:33") == datetime(2024, 6, 10, 15, 33));
    REQUIRE(require_instant("Jul/4/2024 7:05") == datetime(2024, 7, 4, 7, 5));
}

TEST_CASE("Twelve-hour times", "[datetime]") {
    REQUIRE(require_instant("2024-07-10 3:33 PM") == datetime(2024, 7, 10, 15, 33));
    REQUIRE(require_instant("2024-07-10 3:33PM") == datetime(2024, 7, 10, 15, 33));
    REQUIRE(require_instant("2024-07-10 12:05 am") == datetime(2024, 7, 10, 0, 5));
    REQUIRE(require_instant("2024-07-10 12:00 PM") == datetime(2024, 7, 10, 12, 0));
    REQUIRE(require_instant("2024-07-10 11:59:59 pm") == datetime(2024, 7, 10, 23, 59, 59));
}

TEST_CASE("Keywords resolve against the supplied time", "[datetime]") {
    auto today = parse_keyword("today", kNow);
    REQUIRE(today.has_value());
    REQUIRE(*today == date(2024, 7, 10));

    auto now = parse_keyword("NOW", kNow);
    REQUIRE(now.has_value());
    REQUIRE(*now == kNow);

    REQUIRE_FALSE(parse_keyword("tomorrow", kNow).has_value());
    REQUIRE(require_instant("Today") == date(2024, 7, 10));
}

TEST_CASE("Well-formed dates that do not exist", "[datetime]") {
    REQUIRE(require_error("2024-02-30") == ErrorKind::InvalidDateValue);
    REQUIRE(require_error("2023-02-29") == ErrorKind::InvalidDateValue);
    REQUIRE(require_error("2024-04-31") == ErrorKind::InvalidDateValue);
    REQUIRE(require_error("2024-13-01") == ErrorKind::InvalidDateValue);
    REQUIRE(require_error("13/01/2024") == ErrorKind::InvalidDateValue);
    REQUIRE(require_error("0000-01-01") == ErrorKind::InvalidDateValue);
    REQUIRE(require_error("2024-07-10 24:00") == ErrorKind::InvalidDateValue);
    REQUIRE(require_error("2024-07-10 10:60") == ErrorKind::InvalidDateValue);
    REQUIRE(require_error("2024-07-10 13:00 PM") == ErrorKind::InvalidDateValue);
    REQUIRE(require_error("2024-07-10 0:30 am") == ErrorKind::InvalidDateValue);

    auto result = parse_instant("2024-02-30", kNow);
    REQUIRE(result.error().message == "day 30 is out of range for 2024-02");
}

TEST_CASE("Text that is not a date", "[datetime]") {
    REQUIRE(require_error("2024/07/10") == ErrorKind::InvalidDateFormat);
    REQUIRE(require_error("July 10 2024") == ErrorKind::InvalidDateFormat);
    REQUIRE(require_error("Foo/10/2024") == ErrorKind::InvalidDateFormat);
    REQUIRE(require_error("2024 - 07 - 10") == ErrorKind::InvalidDateFormat);
    REQUIRE(require_error("07/10/202") == ErrorKind::InvalidDateFormat);
    REQUIRE(require_error("") == ErrorKind::InvalidDateFormat);
}

TEST_CASE("Trailing text after a date", "[datetime]") {
    SECTION("hour without minutes") {
        REQUIRE(require_error("2024-07-10 15") == ErrorKind::InvalidDateFormat);
    }
    SECTION("ISO 'T' separator") {
        REQUIRE(require_error("2024-07-10T15:33") == ErrorKind::InvalidDateFormat);
    }
    SECTION("unknown meridiem") {
        auto result = parse_instant("2024-07-10 15:33 xm", kNow);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == ErrorKind::InvalidDateFormat);
        REQUIRE(result.error().message == "unrecognized time '15:33 xm'");
        REQUIRE(result.error().column == 12);
    }
    SECTION("extra tokens after the time") {
        REQUIRE(require_error("2024-07-10 15:33 + 3d") == ErrorKind::InvalidDateFormat);
    }
}
