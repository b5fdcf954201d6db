#include <dtcalc/parser/lexer.hpp>

#include <cctype>

namespace dtcalc::parser {

auto adjacent(const Token& a, const Token& b) -> bool {
    return a.end() == b.offset;
}

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

auto trim(std::string_view text) -> std::string_view {
    const auto is_space = [](char ch) -> bool {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto tokenize(std::string_view source) -> std::vector<Token> {
    std::vector<Token> tokens;

    const auto add_token = [&](TokenKind kind, std::size_t start, std::size_t length) {
        tokens.push_back(Token{
            .kind = kind,
            .lexeme = source.substr(start, length),
            .offset = start,
        });
    };

    const auto is_digit = [](char ch) -> bool {
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    };
    const auto is_alpha = [](char ch) -> bool {
        return std::isalpha(static_cast<unsigned char>(ch)) != 0;
    };

    std::size_t i = 0;

    const auto at_end = [&]() -> bool {
        return i >= source.size();
    };
    const auto peek = [&]() -> char {
        return at_end() ? '\0' : source[i];
    };

    while (!at_end()) {
        char ch = peek();
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            i += 1;
            continue;
        }

        std::size_t token_start = i;
        i += 1;

        if (is_digit(ch)) {
            while (is_digit(peek())) {
                i += 1;
            }
            add_token(TokenKind::Number, token_start, i - token_start);
            continue;
        }

        if (is_alpha(ch)) {
            while (is_alpha(peek())) {
                i += 1;
            }
            add_token(TokenKind::Word, token_start, i - token_start);
            continue;
        }

        switch (ch) {
            case '+':
                add_token(TokenKind::Plus, token_start, 1);
                continue;
            case '-':
                add_token(TokenKind::Minus, token_start, 1);
                continue;
            case '/':
                add_token(TokenKind::Slash, token_start, 1);
                continue;
            case ':':
                add_token(TokenKind::Colon, token_start, 1);
                continue;
            default:
                add_token(TokenKind::Error, token_start, 1);
                continue;
        }
    }

    tokens.push_back(Token{
        .kind = TokenKind::Eof,
        .lexeme = source.substr(source.size(), 0),
        .offset = source.size(),
    });
    return tokens;
}

}  // namespace dtcalc::parser
