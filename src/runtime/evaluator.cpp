#include <dtcalc/core/calendar.hpp>
#include <dtcalc/parser/parser.hpp>
#include <dtcalc/runtime/evaluator.hpp>
#include <dtcalc/runtime/format.hpp>

#include <spdlog/spdlog.h>

#include <type_traits>
#include <utility>
#include <variant>

namespace dtcalc::runtime {

namespace {

auto kind_name(const Value& value) -> std::string_view {
    return std::holds_alternative<Instant>(value) ? "instant" : "duration";
}

auto to_value(std::expected<Instant, EvalError> instant) -> std::expected<Value, EvalError> {
    if (!instant) {
        return std::unexpected(std::move(instant.error()));
    }
    return Value{*instant};
}

}  // namespace

auto apply(const parser::Expression& expression) -> std::expected<Value, EvalError> {
    const bool add = expression.op == parser::BinaryOp::Add;
    return std::visit(
        [add](const auto& lhs, const auto& rhs) -> std::expected<Value, EvalError> {
            using L = std::decay_t<decltype(lhs)>;
            using R = std::decay_t<decltype(rhs)>;
            if constexpr (std::is_same_v<L, Instant> && std::is_same_v<R, Duration>) {
                return to_value(add ? dtcalc::add(lhs, rhs) : subtract(lhs, rhs));
            } else if constexpr (std::is_same_v<L, Duration> && std::is_same_v<R, Instant>) {
                if (!add) {
                    return std::unexpected(make_error(ErrorKind::KindMismatch,
                                                      "cannot subtract a date from a duration"));
                }
                return to_value(dtcalc::add(rhs, lhs));
            } else if constexpr (std::is_same_v<L, Instant>) {
                if (add) {
                    return std::unexpected(
                        make_error(ErrorKind::KindMismatch, "cannot add two dates"));
                }
                return Value{difference(lhs, rhs)};
            } else {
                return Value{add ? lhs + rhs : lhs - rhs};
            }
        },
        expression.left, expression.right);
}

auto evaluate_value(std::string_view text, const Clock& clock)
    -> std::expected<Value, EvalError> {
    const Instant now = clock();
    auto expression = parser::parse_expression(text, now);
    if (!expression) {
        return std::unexpected(std::move(expression.error()));
    }
    spdlog::debug("evaluate: {} {} {}", kind_name(expression->left),
                  parser::to_symbol(expression->op), kind_name(expression->right));
    return apply(*expression);
}

auto evaluate(std::string_view text, const Clock& clock)
    -> std::expected<std::string, EvalError> {
    auto value = evaluate_value(text, clock);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    return format_value(*value);
}

}  // namespace dtcalc::runtime
