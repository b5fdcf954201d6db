#include <dtcalc/parser/lexer.hpp>
#include <dtcalc/parser/parser.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dtcalc::parser {

namespace {

/// `[+|-]<number><word>...`: the text was meant as a duration even if it
/// later fails to parse as one.
auto looks_like_duration(std::string_view text) -> bool {
    const auto tokens = tokenize(text);
    std::size_t pos = 0;
    if (tokens[pos].kind == TokenKind::Plus || tokens[pos].kind == TokenKind::Minus) {
        pos += 1;
    }
    return tokens[pos].kind == TokenKind::Number && pos + 1 < tokens.size() &&
           tokens[pos + 1].kind == TokenKind::Word;
}

struct Candidate {
    EvalError error;
    bool spaced = false;
};

}  // namespace

auto parse_operand(std::string_view text, const Instant& now)
    -> std::expected<Operand, EvalError> {
    text = trim(text);
    if (text.empty()) {
        return std::unexpected(make_error(ErrorKind::UnrecognizedOperand, "missing operand"));
    }

    if (auto keyword = parse_keyword(text, now)) {
        return Operand{*keyword};
    }

    auto duration = parse_duration(text);
    if (duration) {
        return Operand{*duration};
    }

    auto instant = parse_instant(text, now);
    if (instant) {
        return Operand{*instant};
    }

    if (instant.error().kind == ErrorKind::InvalidDateValue) {
        return std::unexpected(instant.error());
    }
    if (looks_like_duration(text)) {
        return std::unexpected(duration.error());
    }
    return std::unexpected(make_error(ErrorKind::UnrecognizedOperand,
                                      fmt::format("could not parse '{}'", text), 1));
}

auto parse_expression(std::string_view text, const Instant& now)
    -> std::expected<Expression, EvalError> {
    const std::string_view source = trim(text);
    const auto tokens = tokenize(source);

    // Every '+' or '-' after the first token may be the top-level operator.
    // The first one that leaves two valid operands wins, which keeps the dashes
    // of an ISO date on the operand side.
    std::optional<Candidate> preferred;
    const auto record = [&](const Token& token, EvalError error) {
        const bool spaced = token.offset > 0 &&
                            std::isspace(static_cast<unsigned char>(source[token.offset - 1])) != 0;
        if (!preferred || (spaced && !preferred->spaced)) {
            preferred = Candidate{.error = std::move(error), .spaced = spaced};
        }
    };

    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const Token& token = tokens[i];
        if (token.kind != TokenKind::Plus && token.kind != TokenKind::Minus) {
            continue;
        }
        const std::string_view left_text = trim(source.substr(0, token.offset));
        const std::string_view right_text = trim(source.substr(token.end()));

        auto left = parse_operand(left_text, now);
        if (!left) {
            record(token, wrap_operand_error(left.error(), Side::Left, left_text));
            continue;
        }
        auto right = parse_operand(right_text, now);
        if (!right) {
            record(token, wrap_operand_error(right.error(), Side::Right, right_text));
            continue;
        }

        spdlog::debug("split '{}' at column {}: '{}' {} '{}'", source, token.column(), left_text,
                      token.lexeme, right_text);
        return Expression{
            .left = std::move(*left),
            .op = token.kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Subtract,
            .right = std::move(*right),
            .left_text = std::string(left_text),
            .right_text = std::string(right_text),
        };
    }

    // A lone operand that names a nonexistent date reports that date, not a
    // fragment cut out of it at one of its own dashes.
    auto whole = parse_operand(source, now);
    if (!whole && whole.error().kind == ErrorKind::InvalidDateValue) {
        return std::unexpected(std::move(whole.error()));
    }
    if (!preferred || whole.has_value()) {
        return std::unexpected(make_error(
            ErrorKind::UnrecognizedOperator,
            source.empty() ? std::string("empty expression")
                           : fmt::format("expected '<operand> + <operand>' or "
                                         "'<operand> - <operand>', got '{}'",
                                         source)));
    }
    return std::unexpected(std::move(preferred->error));
}

}  // namespace dtcalc::parser
