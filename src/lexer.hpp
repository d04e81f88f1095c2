#pragma once
#include "diag.hpp"
#include "source.hpp"
#include "token.hpp"
#include "vocabulary.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

inline constexpr int kIndentWidth = 4;

// Either the whole token stream or the first error; never both.
struct LexResult {
    std::vector<Token> tokens;
    std::optional<CoreError> error;

    bool ok() const { return !error.has_value(); }
};

class Lexer {
public:
    Lexer(const Source& src, const Vocabulary& vocab);
    LexResult lex_all();

private:
    struct Rule {
        TokenKind kind;
        int (Lexer::*scan)(int s);
    };

    const Source& src_;
    const Vocabulary& vocab_;

    std::string_view line_;
    int line_no_ = 0;
    int line_offset_ = 0;
    int i_ = 0;

    std::vector<int> indent_{0};
    std::vector<Token> out_;
    std::optional<CoreError> error_;

    char cur() const;
    bool eol() const;

    void begin_line(int line1);
    int measure_indent();
    bool apply_indent(int width);
    bool scan_line();
    bool starts_token(int s);

    static const std::vector<Rule>& rules();

    bool fail(ErrorKind kind, int s, std::string message);
    Token make(TokenKind k, int s, int e) const;

    // Each scanner returns the end of its match, or s when it does not match
    // (possibly after recording an error).
    int scan_string(int s);
    int scan_operator(int s);
    int scan_punct(int s);
    int scan_number(int s);
    int scan_ident(int s);
};

LexResult lex(const Source& src, const Vocabulary& vocab);
