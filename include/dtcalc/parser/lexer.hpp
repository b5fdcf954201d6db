#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace dtcalc::parser {

/// Token types for date/duration expressions.
enum class TokenKind : std::uint8_t {
    Number,  // ASCII digit run
    Word,    // ASCII letter run
    Plus,    // +
    Minus,   // -
    Slash,   // /
    Colon,   // :

    // Special
    Eof,
    Error,
};

/// A single token.  `offset` is the byte offset of the lexeme in the source.
struct Token {
    TokenKind kind = TokenKind::Error;
    std::string_view lexeme;
    std::size_t offset = 0;

    [[nodiscard]] auto end() const -> std::size_t { return offset + lexeme.size(); }
    /// 1-based column for diagnostics.
    [[nodiscard]] auto column() const -> std::size_t { return offset + 1; }
};

/// True when `b` starts exactly where `a` ends (no whitespace between them).
[[nodiscard]] auto adjacent(const Token& a, const Token& b) -> bool;

/// Tokenize an expression or operand.  The result always ends with `Eof`.
[[nodiscard]] auto tokenize(std::string_view source) -> std::vector<Token>;

/// ASCII case-insensitive equality.
[[nodiscard]] auto iequals(std::string_view lhs, std::string_view rhs) -> bool;

/// Strip leading and trailing whitespace.
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

}  // namespace dtcalc::parser
