#include <dtcalc/core/calendar.hpp>
#include <dtcalc/parser/lexer.hpp>
#include <dtcalc/parser/parser.hpp>

#include <fmt/core.h>

#include <array>
#include <charconv>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dtcalc::parser {

namespace {

struct MonthName {
    std::string_view name;
    unsigned month;
};

constexpr std::array<MonthName, 24> kMonthNames = {{
    {"january", 1},   {"february", 2}, {"march", 3},     {"april", 4},
    {"may", 5},       {"june", 6},     {"july", 7},      {"august", 8},
    {"september", 9}, {"october", 10}, {"november", 11}, {"december", 12},
    {"jan", 1},       {"feb", 2},      {"mar", 3},       {"apr", 4},
    {"jun", 6},       {"jul", 7},      {"aug", 8},       {"sep", 9},
    {"sept", 9},      {"oct", 10},     {"nov", 11},      {"dec", 12},
}};

/// Date fields as written, before range checks.
struct RawDate {
    int year = 0;
    int month = 0;
    int day = 0;
    std::size_t next = 0;
};

struct RawTime {
    int hour = 0;
    int minute = 0;
    int second = 0;
    /// Set for 12-hour input: true for PM, false for AM.
    std::optional<bool> pm;
    std::size_t next = 0;
};

auto at(const std::vector<Token>& tokens, std::size_t index) -> const Token& {
    return index < tokens.size() ? tokens[index] : tokens.back();
}

auto is_number(const Token& token, std::size_t min_digits, std::size_t max_digits) -> bool {
    return token.kind == TokenKind::Number && token.lexeme.size() >= min_digits &&
           token.lexeme.size() <= max_digits;
}

auto to_int(const Token& token) -> int {
    int value = 0;
    auto result =
        std::from_chars(token.lexeme.data(), token.lexeme.data() + token.lexeme.size(), value);
    if (result.ec != std::errc()) {
        return -1;
    }
    return value;
}

auto lookup_month(std::string_view word) -> std::optional<unsigned> {
    for (const auto& entry : kMonthNames) {
        if (iequals(entry.name, word)) {
            return entry.month;
        }
    }
    return std::nullopt;
}

auto all_adjacent(const std::vector<Token>& tokens, std::size_t first, std::size_t count)
    -> bool {
    for (std::size_t i = first; i + 1 < first + count; ++i) {
        if (!adjacent(at(tokens, i), at(tokens, i + 1))) {
            return false;
        }
    }
    return true;
}

/// YYYY-MM-DD
auto match_iso_date(const std::vector<Token>& tokens, std::size_t pos) -> std::optional<RawDate> {
    if (!is_number(at(tokens, pos), 4, 4) || at(tokens, pos + 1).kind != TokenKind::Minus ||
        !is_number(at(tokens, pos + 2), 1, 2) || at(tokens, pos + 3).kind != TokenKind::Minus ||
        !is_number(at(tokens, pos + 4), 1, 2) || !all_adjacent(tokens, pos, 5)) {
        return std::nullopt;
    }
    return RawDate{
        .year = to_int(at(tokens, pos)),
        .month = to_int(at(tokens, pos + 2)),
        .day = to_int(at(tokens, pos + 4)),
        .next = pos + 5,
    };
}

/// Month/DD/YYYY, Month/DD/YY, MM/DD/YYYY, MM/DD/YY
auto match_slash_date(const std::vector<Token>& tokens, std::size_t pos)
    -> std::optional<RawDate> {
    const Token& head = at(tokens, pos);
    const Token& year_token = at(tokens, pos + 4);
    if (at(tokens, pos + 1).kind != TokenKind::Slash || !is_number(at(tokens, pos + 2), 1, 2) ||
        at(tokens, pos + 3).kind != TokenKind::Slash ||
        !(is_number(year_token, 2, 2) || is_number(year_token, 4, 4)) ||
        !all_adjacent(tokens, pos, 5)) {
        return std::nullopt;
    }

    int month = 0;
    if (head.kind == TokenKind::Word) {
        auto named = lookup_month(head.lexeme);
        if (!named) {
            return std::nullopt;
        }
        month = static_cast<int>(*named);
    } else if (is_number(head, 1, 2)) {
        month = to_int(head);
    } else {
        return std::nullopt;
    }

    int year = to_int(year_token);
    if (year_token.lexeme.size() == 2) {
        year = expand_two_digit_year(year);
    }
    return RawDate{
        .year = year,
        .month = month,
        .day = to_int(at(tokens, pos + 2)),
        .next = pos + 5,
    };
}

/// HH:MM, HH:MM:SS, optionally followed by AM/PM.
auto match_time(const std::vector<Token>& tokens, std::size_t pos) -> std::optional<RawTime> {
    if (!is_number(at(tokens, pos), 1, 2) || at(tokens, pos + 1).kind != TokenKind::Colon ||
        !is_number(at(tokens, pos + 2), 2, 2) || !all_adjacent(tokens, pos, 3)) {
        return std::nullopt;
    }
    RawTime time{
        .hour = to_int(at(tokens, pos)),
        .minute = to_int(at(tokens, pos + 2)),
        .second = 0,
        .pm = std::nullopt,
        .next = pos + 3,
    };
    if (at(tokens, time.next).kind == TokenKind::Colon) {
        if (!is_number(at(tokens, time.next + 1), 2, 2) ||
            !all_adjacent(tokens, time.next - 1, 3)) {
            return std::nullopt;
        }
        time.second = to_int(at(tokens, time.next + 1));
        time.next += 2;
    }
    const Token& meridiem = at(tokens, time.next);
    if (meridiem.kind == TokenKind::Word) {
        if (iequals(meridiem.lexeme, "am")) {
            time.pm = false;
        } else if (iequals(meridiem.lexeme, "pm")) {
            time.pm = true;
        } else {
            return std::nullopt;
        }
        time.next += 1;
    }
    return time;
}

auto invalid_value(std::string message) -> EvalError {
    return make_error(ErrorKind::InvalidDateValue, std::move(message));
}

auto validate_date(const RawDate& raw) -> std::expected<Instant, EvalError> {
    if (raw.year < kMinYear || raw.year > kMaxYear) {
        return std::unexpected(invalid_value(fmt::format("year {} is out of range", raw.year)));
    }
    if (raw.month < 1 || raw.month > 12) {
        return std::unexpected(invalid_value(fmt::format("month {} is out of range", raw.month)));
    }
    const auto month = static_cast<unsigned>(raw.month);
    if (raw.day < 1 || static_cast<unsigned>(raw.day) > days_in_month(raw.year, month)) {
        return std::unexpected(invalid_value(fmt::format("day {} is out of range for {:04}-{:02}",
                                                         raw.day, raw.year, raw.month)));
    }
    return Instant{
        .year = raw.year,
        .month = month,
        .day = static_cast<unsigned>(raw.day),
        .time = std::nullopt,
    };
}

auto validate_time(const RawTime& raw) -> std::expected<TimeOfDay, EvalError> {
    int hour = raw.hour;
    if (raw.pm.has_value()) {
        if (hour < 1 || hour > 12) {
            return std::unexpected(
                invalid_value(fmt::format("hour {} is out of range for a 12-hour clock", hour)));
        }
        hour %= 12;
        if (*raw.pm) {
            hour += 12;
        }
    }
    const TimeOfDay time{.hour = hour, .minute = raw.minute, .second = raw.second};
    if (!is_valid_time(time)) {
        return std::unexpected(invalid_value(fmt::format(
            "time {:02}:{:02}:{:02} is out of range", raw.hour, raw.minute, raw.second)));
    }
    return time;
}

}  // namespace

auto expand_two_digit_year(int year) -> int {
    return year <= 68 ? 2000 + year : 1900 + year;
}

auto parse_keyword(std::string_view text, const Instant& now) -> std::optional<Instant> {
    text = trim(text);
    if (iequals(text, "today")) {
        Instant today = now;
        today.time.reset();
        return today;
    }
    if (iequals(text, "now")) {
        Instant current = now;
        if (!current.time) {
            current.time = TimeOfDay{};
        }
        return current;
    }
    return std::nullopt;
}

auto parse_instant(std::string_view text, const Instant& now)
    -> std::expected<Instant, EvalError> {
    if (auto keyword = parse_keyword(text, now)) {
        return *keyword;
    }

    const auto tokens = tokenize(text);
    auto date = match_iso_date(tokens, 0);
    if (!date) {
        date = match_slash_date(tokens, 0);
    }
    if (!date) {
        return std::unexpected(make_error(ErrorKind::InvalidDateFormat,
                                          fmt::format("unrecognized date '{}'", trim(text)), 1));
    }

    std::optional<RawTime> time;
    if (at(tokens, date->next).kind != TokenKind::Eof) {
        time = match_time(tokens, date->next);
        if (!time || at(tokens, time->next).kind != TokenKind::Eof) {
            const Token& bad = at(tokens, date->next);
            return std::unexpected(
                make_error(ErrorKind::InvalidDateFormat,
                           fmt::format("unrecognized time '{}'", trim(text.substr(bad.offset))),
                           bad.column()));
        }
    }

    auto instant = validate_date(*date);
    if (!instant || !time) {
        return instant;
    }
    auto time_of_day = validate_time(*time);
    if (!time_of_day) {
        return std::unexpected(time_of_day.error());
    }
    instant->time = *time_of_day;
    return instant;
}

}  // namespace dtcalc::parser
