#pragma once

#include <dtcalc/core/time.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace dtcalc::parser {

/// One side of an expression.
using Operand = Value;

enum class BinaryOp : std::uint8_t {
    Add,
    Subtract,
};

/// `<operand> <+|-> <operand>`, with the source text of each side kept for
/// diagnostics.
struct Expression {
    Operand left;
    BinaryOp op = BinaryOp::Add;
    Operand right;
    std::string left_text;
    std::string right_text;
};

[[nodiscard]] inline auto to_symbol(BinaryOp op) -> std::string_view {
    return op == BinaryOp::Add ? "+" : "-";
}

[[nodiscard]] inline auto is_instant(const Operand& operand) -> bool {
    return std::holds_alternative<Instant>(operand);
}

}  // namespace dtcalc::parser
