#include <dtcalc/parser/lexer.hpp>
#include <dtcalc/parser/parser.hpp>

#include <fmt/core.h>

#include <array>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace dtcalc::parser {

namespace {

enum class DurationUnit : std::uint8_t {
    Years,
    Months,
    Weeks,
    Days,
    Hours,
    Minutes,
    Seconds,
};

struct UnitName {
    std::string_view name;
    DurationUnit unit;
};

// Whole-word lookup: "mo" and "min" can never be mistaken for each other.
constexpr std::array<UnitName, 33> kUnitNames = {{
    {"y", DurationUnit::Years},         {"yr", DurationUnit::Years},
    {"yrs", DurationUnit::Years},       {"year", DurationUnit::Years},
    {"years", DurationUnit::Years},     {"mo", DurationUnit::Months},
    {"mon", DurationUnit::Months},      {"mos", DurationUnit::Months},
    {"month", DurationUnit::Months},    {"months", DurationUnit::Months},
    {"w", DurationUnit::Weeks},         {"wk", DurationUnit::Weeks},
    {"wks", DurationUnit::Weeks},       {"week", DurationUnit::Weeks},
    {"weeks", DurationUnit::Weeks},     {"d", DurationUnit::Days},
    {"day", DurationUnit::Days},        {"days", DurationUnit::Days},
    {"h", DurationUnit::Hours},         {"hr", DurationUnit::Hours},
    {"hrs", DurationUnit::Hours},       {"hour", DurationUnit::Hours},
    {"hours", DurationUnit::Hours},     {"m", DurationUnit::Minutes},
    {"min", DurationUnit::Minutes},     {"mins", DurationUnit::Minutes},
    {"minute", DurationUnit::Minutes},  {"minutes", DurationUnit::Minutes},
    {"s", DurationUnit::Seconds},       {"sec", DurationUnit::Seconds},
    {"secs", DurationUnit::Seconds},    {"second", DurationUnit::Seconds},
    {"seconds", DurationUnit::Seconds},
}};

// Larger than any shift that fits in years 1..9999, even expressed in seconds.
constexpr std::int64_t kMaxComponent = 1'000'000'000'000;

auto lookup_unit(std::string_view word) -> std::optional<DurationUnit> {
    for (const auto& entry : kUnitNames) {
        if (iequals(entry.name, word)) {
            return entry.unit;
        }
    }
    return std::nullopt;
}

auto invalid_token(const Token& token, std::string message) -> EvalError {
    return make_error(ErrorKind::InvalidDurationToken, std::move(message), token.column());
}

/// Add `value` to the component for `unit`; false when the running total
/// leaves the supported magnitude.
auto accumulate(Duration& duration, DurationUnit unit, std::int64_t value) -> bool {
    std::int64_t* component = nullptr;
    switch (unit) {
        case DurationUnit::Years:
            component = &duration.years;
            break;
        case DurationUnit::Months:
            component = &duration.months;
            break;
        case DurationUnit::Weeks:
            component = &duration.days;
            value *= 7;
            break;
        case DurationUnit::Days:
            component = &duration.days;
            break;
        case DurationUnit::Hours:
            component = &duration.hours;
            break;
        case DurationUnit::Minutes:
            component = &duration.minutes;
            break;
        case DurationUnit::Seconds:
            component = &duration.seconds;
            break;
    }
    // Both terms are at most 7 * kMaxComponent, so the sum cannot overflow.
    const std::int64_t total = *component + value;
    if (total > kMaxComponent || total < -kMaxComponent) {
        return false;
    }
    *component = total;
    return true;
}

}  // namespace

auto parse_duration(std::string_view text) -> std::expected<Duration, EvalError> {
    const auto tokens = tokenize(text);
    if (tokens.front().kind == TokenKind::Eof) {
        return std::unexpected(make_error(ErrorKind::EmptyDuration, "empty duration"));
    }

    Duration duration;
    std::size_t pos = 0;
    while (tokens[pos].kind != TokenKind::Eof) {
        std::int64_t sign = 1;
        const Token& first = tokens[pos];
        if (first.kind == TokenKind::Plus || first.kind == TokenKind::Minus) {
            sign = first.kind == TokenKind::Minus ? -1 : 1;
            pos += 1;
            if (tokens[pos].kind != TokenKind::Number || !adjacent(first, tokens[pos])) {
                return std::unexpected(invalid_token(
                    first, fmt::format("expected a number after '{}' in duration", first.lexeme)));
            }
        }

        const Token& number = tokens[pos];
        if (number.kind != TokenKind::Number) {
            return std::unexpected(invalid_token(
                number, number.kind == TokenKind::Eof
                            ? std::string("unexpected end of duration")
                            : fmt::format("unexpected '{}' in duration", number.lexeme)));
        }
        std::int64_t value = 0;
        const auto parsed =
            std::from_chars(number.lexeme.data(), number.lexeme.data() + number.lexeme.size(),
                            value);
        if (parsed.ec != std::errc() || value > kMaxComponent) {
            return std::unexpected(invalid_token(
                number, fmt::format("duration value '{}' is too large", number.lexeme)));
        }
        pos += 1;

        const Token& unit_token = tokens[pos];
        if (unit_token.kind != TokenKind::Word) {
            return std::unexpected(invalid_token(
                number, fmt::format("missing unit after '{}' in duration", number.lexeme)));
        }
        auto unit = lookup_unit(unit_token.lexeme);
        if (!unit) {
            return std::unexpected(invalid_token(
                unit_token, fmt::format("unsupported duration unit '{}'", unit_token.lexeme)));
        }
        if (!accumulate(duration, *unit, sign * value)) {
            return std::unexpected(invalid_token(
                number, fmt::format("total for duration unit '{}' is too large",
                                    unit_token.lexeme)));
        }
        pos += 1;
    }
    return duration;
}

}  // namespace dtcalc::parser
