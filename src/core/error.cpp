#include <dtcalc/core/error.hpp>

#include <fmt/core.h>

#include <utility>

namespace dtcalc {

auto make_error(ErrorKind kind, std::string message, std::size_t column) -> EvalError {
    return EvalError{
        .kind = kind,
        .message = std::move(message),
        .column = column,
        .side = Side::None,
        .operand = {},
        .cause = kind,
    };
}

auto wrap_operand_error(EvalError inner, Side side, std::string_view operand) -> EvalError {
    return EvalError{
        .kind = ErrorKind::OperandParseError,
        .message = std::move(inner.message),
        .column = inner.column,
        .side = side,
        .operand = std::string(operand),
        .cause = inner.cause,
    };
}

auto EvalError::format() const -> std::string {
    if (kind == ErrorKind::OperandParseError) {
        return fmt::format("{} operand '{}': {}", to_string(side), operand, message);
    }
    return message;
}

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::UnrecognizedOperand:
            return "UnrecognizedOperand";
        case ErrorKind::InvalidDurationToken:
            return "InvalidDurationToken";
        case ErrorKind::EmptyDuration:
            return "EmptyDuration";
        case ErrorKind::InvalidDateFormat:
            return "InvalidDateFormat";
        case ErrorKind::InvalidDateValue:
            return "InvalidDateValue";
        case ErrorKind::UnrecognizedOperator:
            return "UnrecognizedOperator";
        case ErrorKind::OperandParseError:
            return "OperandParseError";
        case ErrorKind::KindMismatch:
            return "KindMismatch";
        case ErrorKind::OutOfRange:
            return "OutOfRange";
    }
    return "Unknown";
}

auto to_string(Side side) -> std::string_view {
    switch (side) {
        case Side::Left:
            return "left";
        case Side::Right:
            return "right";
        case Side::None:
            break;
    }
    return "";
}

}  // namespace dtcalc
