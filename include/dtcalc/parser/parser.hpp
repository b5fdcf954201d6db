#pragma once

#include <dtcalc/core/error.hpp>
#include <dtcalc/core/time.hpp>
#include <dtcalc/parser/ast.hpp>

#include <expected>
#include <optional>
#include <string_view>

namespace dtcalc::parser {

/// Parse a compound duration such as `1y6mo10d` or `2 weeks 3 days`.
///
/// Pairs of `[sign]<integer><unit>` may be separated by whitespace; repeated
/// units accumulate.  Weeks are stored as 7 days each.
[[nodiscard]] auto parse_duration(std::string_view text) -> std::expected<Duration, EvalError>;

/// Resolve `today` (date only) or `now` (date and time) against `now`.
[[nodiscard]] auto parse_keyword(std::string_view text, const Instant& now)
    -> std::optional<Instant>;

/// Parse an absolute date or datetime, or one of the keywords `today`/`now`
/// resolved against `now`.
///
/// Structural mismatches are `InvalidDateFormat`; well-formed text naming a
/// date or time that does not exist is `InvalidDateValue`.
[[nodiscard]] auto parse_instant(std::string_view text, const Instant& now)
    -> std::expected<Instant, EvalError>;

/// Parse one operand: keyword, then duration, then datetime, then date.
[[nodiscard]] auto parse_operand(std::string_view text, const Instant& now)
    -> std::expected<Operand, EvalError>;

/// Split `text` on its top-level `+` or `-` and parse both sides.
[[nodiscard]] auto parse_expression(std::string_view text, const Instant& now)
    -> std::expected<Expression, EvalError>;

/// Two-digit year pivot: 00..68 -> 2000..2068, 69..99 -> 1969..1999.
[[nodiscard]] auto expand_two_digit_year(int year) -> int;

}  // namespace dtcalc::parser
