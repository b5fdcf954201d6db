#pragma once

#include <dtcalc/core/clock.hpp>
#include <dtcalc/core/error.hpp>
#include <dtcalc/core/time.hpp>
#include <dtcalc/parser/ast.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace dtcalc::runtime {

/// Combine the two operands of a parsed expression.
///
///   Instant  +/- Duration -> Instant
///   Duration  +  Instant  -> Instant
///   Instant   -  Instant  -> Duration
///   Duration +/- Duration -> Duration
///
/// Instant + Instant and Duration - Instant are `KindMismatch`.
[[nodiscard]] auto apply(const parser::Expression& expression)
    -> std::expected<Value, EvalError>;

/// Parse and evaluate `text`, reading `clock` exactly once.
[[nodiscard]] auto evaluate_value(std::string_view text, const Clock& clock)
    -> std::expected<Value, EvalError>;

/// Parse, evaluate and format `text`.  The result has no trailing newline.
[[nodiscard]] auto evaluate(std::string_view text, const Clock& clock = system_clock())
    -> std::expected<std::string, EvalError>;

}  // namespace dtcalc::runtime
