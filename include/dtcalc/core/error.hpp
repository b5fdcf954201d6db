#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace dtcalc {

enum class ErrorKind : std::uint8_t {
    UnrecognizedOperand,
    InvalidDurationToken,
    EmptyDuration,
    InvalidDateFormat,
    InvalidDateValue,
    UnrecognizedOperator,
    OperandParseError,
    KindMismatch,
    OutOfRange,
};

/// Which side of a binary expression an error belongs to.
enum class Side : std::uint8_t {
    None,
    Left,
    Right,
};

/// Evaluation error with enough context for a one-line diagnostic.
///
/// `OperandParseError` wraps a failure from one operand: `side` and `operand`
/// say where it came from and `cause` keeps the inner kind.  For every other
/// kind `cause == kind`.
struct EvalError {
    ErrorKind kind = ErrorKind::UnrecognizedOperand;
    std::string message;
    /// 1-based column in the text that was being parsed, 0 when unknown.
    std::size_t column = 0;
    Side side = Side::None;
    std::string operand;
    ErrorKind cause = ErrorKind::UnrecognizedOperand;

    [[nodiscard]] auto root_cause() const -> ErrorKind { return cause; }
    [[nodiscard]] auto format() const -> std::string;
};

[[nodiscard]] auto make_error(ErrorKind kind, std::string message, std::size_t column = 0)
    -> EvalError;

/// Wrap an operand failure as `OperandParseError`.
[[nodiscard]] auto wrap_operand_error(EvalError inner, Side side, std::string_view operand)
    -> EvalError;

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;
[[nodiscard]] auto to_string(Side side) -> std::string_view;

}  // namespace dtcalc
