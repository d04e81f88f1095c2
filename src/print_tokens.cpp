#include "print_tokens.hpp"

const char* token_kind_name(TokenKind k) {
    switch (k) {
        case TokenKind::Keyword:     return "Keyword";
        case TokenKind::Identifier:  return "Identifier";
        case TokenKind::String:      return "String";
        case TokenKind::Number:      return "Number";
        case TokenKind::Operator:    return "Operator";
        case TokenKind::Punctuation: return "Punctuation";
        case TokenKind::Newline:     return "Newline";
        case TokenKind::Indent:      return "Indent";
        case TokenKind::Dedent:      return "Dedent";
    }
    return "?";
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& os) {
    for (const auto& t : tokens) {
        os << t.loc.line << ":" << t.loc.col << " " << token_kind_name(t.kind);
        if (!is_layout(t.kind)) os << " '" << t.lexeme << "'";
        os << "\n";
    }
}
