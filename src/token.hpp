#pragma once
#include "source.hpp"
#include <string>

enum class TokenKind {
    // Content
    Keyword, Identifier, String, Number,
    Operator, Punctuation,

    // Layout
    Newline, Indent, Dedent,
};

// Layout tokens carry an empty lexeme.
struct Token {
    TokenKind kind = TokenKind::Newline;
    std::string lexeme{};
    SourceLoc loc{};
};

inline bool is_layout(TokenKind k) {
    return k == TokenKind::Newline || k == TokenKind::Indent || k == TokenKind::Dedent;
}
