#include "lexer.hpp"
#include "source.hpp"
#include "vocabulary.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

bool require_(bool cond, const char* msg) {
    if (cond) return true;
    std::cerr << "  - " << msg << "\n";
    return false;
}

LexResult lex_text(const std::string& text) {
    Source src("test.amha", text);
    return lex(src, amhapy_vocabulary());
}

std::vector<TokenKind> kinds_of(const LexResult& r) {
    std::vector<TokenKind> out;
    for (const auto& t : r.tokens) out.push_back(t.kind);
    return out;
}

int count_kind(const LexResult& r, TokenKind k) {
    int n = 0;
    for (const auto& t : r.tokens) {
        if (t.kind == k) n++;
    }
    return n;
}

bool has_message(const LexResult& r, const std::string& needle) {
    return r.error && r.error->message.find(needle) != std::string::npos;
}

bool test_single_block_round_trip() {
    auto r = lex_text("ከሆነ x:\n    y = 1\nz = 2\n");
    if (!require_(r.ok(), "single block should lex")) return false;

    using K = TokenKind;
    const std::vector<K> expected = {
        K::Keyword, K::Identifier, K::Punctuation, K::Newline,
        K::Indent, K::Identifier, K::Punctuation, K::Number, K::Newline,
        K::Dedent, K::Identifier, K::Punctuation, K::Number, K::Newline,
    };
    return require_(kinds_of(r) == expected, "unexpected token kinds for one block");
}

bool test_nested_blocks_balanced() {
    const std::string text =
        "ሥራ ፈትሽ(ሀ):\n"
        "    ከሆነ ሀ ትልቅ 10:\n"
        "        ለ i በ ክልል(ሀ):\n"
        "            አሳይ i\n"
        "    ያለበለዚያ:\n"
        "        መመለስ ሐሰት\n"
        "አሳይ ፈትሽ(3)\n";
    auto r = lex_text(text);
    bool ok = true;
    ok &= require_(r.ok(), "nested program should lex");
    ok &= require_(count_kind(r, TokenKind::Indent) == 4, "expected four indents");
    ok &= require_(count_kind(r, TokenKind::Indent) == count_kind(r, TokenKind::Dedent),
                   "indents and dedents must balance");
    return ok;
}

bool test_dedents_flushed_at_end_of_input() {
    auto r = lex_text("ከሆነ ሀ:\n    ከሆነ ሁ:\n        አሳይ ሀ");
    if (!require_(r.ok(), "unterminated nested input should lex")) return false;

    const auto& toks = r.tokens;
    bool ok = true;
    ok &= require_(toks.size() >= 3, "too few tokens");
    ok &= require_(toks[toks.size() - 1].kind == TokenKind::Dedent &&
                   toks[toks.size() - 2].kind == TokenKind::Dedent &&
                   toks[toks.size() - 3].kind == TokenKind::Newline,
                   "input must end with Newline then two Dedents");
    return ok;
}

bool test_tabs_match_spaces() {
    auto spaces = lex_text("እስከሆነ ሀ:\n    ሀ = ሀ - 1\n    ከሆነ ሀ:\n        አሳይ ሀ\n");
    auto tabs = lex_text("እስከሆነ ሀ:\n\tሀ = ሀ - 1\n\tከሆነ ሀ:\n\t\tአሳይ ሀ\n");
    if (!require_(spaces.ok() && tabs.ok(), "both indentation styles should lex")) return false;
    if (!require_(spaces.tokens.size() == tabs.tokens.size(), "token counts differ")) return false;

    for (size_t i = 0; i < spaces.tokens.size(); ++i) {
        if (spaces.tokens[i].kind != tabs.tokens[i].kind ||
            spaces.tokens[i].lexeme != tabs.tokens[i].lexeme) {
            std::cerr << "  - token " << i << " differs between tabs and spaces\n";
            return false;
        }
    }
    return true;
}

bool test_tab_stops() {
    // Two spaces then a tab reach column 4.
    auto r = lex_text("ከሆነ ሀ:\n  \tአሳይ ሀ\n");
    return require_(r.ok() && count_kind(r, TokenKind::Indent) == 1, "tab should advance to the next stop");
}

bool test_blank_and_comment_lines_skipped() {
    auto r = lex_text(
        "ከሆነ ሀ:\n"
        "\n"
        "# top-level comment inside a block\n"
        "      # odd comment indentation\n"
        "    አሳይ ሀ\n"
        "   \n"
        "    አሳይ ሁ\n");
    bool ok = true;
    ok &= require_(r.ok(), "blank and comment lines must not affect indentation");
    ok &= require_(count_kind(r, TokenKind::Indent) == 1, "expected exactly one indent");
    ok &= require_(count_kind(r, TokenKind::Newline) == 3, "skipped lines must not emit Newline");
    return ok;
}

bool test_indent_jump_rejected() {
    auto r = lex_text("x = 1\n        y = 2\n");
    bool ok = true;
    ok &= require_(!r.ok(), "two-level jump must fail");
    ok &= require_(r.error && r.error->kind == ErrorKind::Indentation, "expected IndentationError");
    ok &= require_(r.error && r.error->line == 2, "error should name line 2");
    ok &= require_(has_message(r, "more than one level"), "unexpected message for jump");
    ok &= require_(r.tokens.empty(), "no partial token stream on error");
    return ok;
}

bool test_dedent_to_unknown_level_rejected() {
    auto r = lex_text("ከሆነ ሀ:\n    አሳይ ሀ\n  አሳይ ሁ\n");
    bool ok = true;
    ok &= require_(!r.ok(), "dedent to column 2 must fail");
    ok &= require_(r.error && r.error->kind == ErrorKind::Indentation, "expected IndentationError");
    ok &= require_(r.error && r.error->line == 3, "error should name line 3");
    return ok;
}

bool test_indent_not_multiple_rejected() {
    auto r = lex_text("   x = 1\n");
    bool ok = true;
    ok &= require_(r.error && r.error->kind == ErrorKind::Indentation, "expected IndentationError");
    ok &= require_(has_message(r, "multiple of 4"), "unexpected message for odd width");
    return ok;
}

bool test_unexpected_character() {
    auto r = lex_text("x = 1\ny = x @ 2\n");
    bool ok = true;
    ok &= require_(!r.ok(), "'@' must fail");
    ok &= require_(r.error && r.error->kind == ErrorKind::Lex, "expected LexError");
    ok &= require_(r.error && r.error->line == 2, "error should name line 2");
    ok &= require_(r.error && r.error->col == 7, "error should point at '@'");
    ok &= require_(has_message(r, "'@'"), "message should quote the offending text");
    ok &= require_(r.tokens.empty(), "no partial token stream on error");
    return ok;
}

bool test_unexpected_run_stops_at_next_token() {
    bool ok = true;
    auto glued = lex_text("z = x@y\n");
    ok &= require_(has_message(glued, "'@'") && !has_message(glued, "'@y'"), "quote stops before 'y'");
    ok &= require_(glued.error && glued.error->col == 6, "error should point at '@'");

    auto run = lex_text("ሀ = x@@ y\n");
    ok &= require_(has_message(run, "'@@'"), "adjacent bad characters quoted together");

    auto brace = lex_text("ሀ = {1: 2}\n");
    ok &= require_(has_message(brace, "'{'"), "quote stops before the number");

    auto wide = lex_text("ሀ = éx\n");
    ok &= require_(has_message(wide, "'é'"), "multi-byte character quoted whole");

    // An unterminated string still begins a token.
    auto str = lex_text("ሀ = @\"ሰ\n");
    ok &= require_(has_message(str, "'@'"), "quote stops before the string");
    return ok;
}

bool test_keyword_classification() {
    auto r = lex_text("ያለበለዚያ_ከሆነ ስም እኩል_አይደለም ሐሰት:\n    አሳይ ስም\n");
    if (!require_(r.ok(), "keywords should lex")) return false;

    const auto& t = r.tokens;
    bool ok = true;
    ok &= require_(t[0].kind == TokenKind::Keyword && t[0].lexeme == "ያለበለዚያ_ከሆነ", "elif keyword");
    ok &= require_(t[1].kind == TokenKind::Identifier && t[1].lexeme == "ስም", "identifier");
    ok &= require_(t[2].kind == TokenKind::Keyword && t[2].lexeme == "እኩል_አይደለም", "!= keyword");
    ok &= require_(t[3].kind == TokenKind::Keyword && t[3].lexeme == "ሐሰት", "False keyword");
    return ok;
}

bool test_latin_identifiers_accepted() {
    auto r = lex_text("total_2 = _count + x1\n");
    if (!require_(r.ok(), "latin identifiers should lex")) return false;
    return require_(r.tokens[0].kind == TokenKind::Identifier && r.tokens[0].lexeme == "total_2" &&
                    r.tokens[2].lexeme == "_count" && r.tokens[4].lexeme == "x1",
                    "latin identifiers kept whole");
}

bool test_operators_longest_first() {
    auto r = lex_text("a = b >= c == d != e <= f % g\n");
    if (!require_(r.ok(), "operators should lex")) return false;

    const auto& t = r.tokens;
    bool ok = true;
    ok &= require_(t[1].kind == TokenKind::Punctuation && t[1].lexeme == "=", "'=' is punctuation");
    ok &= require_(t[3].kind == TokenKind::Operator && t[3].lexeme == ">=", ">=");
    ok &= require_(t[5].lexeme == "==", "==");
    ok &= require_(t[7].lexeme == "!=", "!=");
    ok &= require_(t[9].lexeme == "<=", "<=");
    ok &= require_(t[11].kind == TokenKind::Operator && t[11].lexeme == "%", "%");
    return ok;
}

bool test_strings_and_comments() {
    auto r = lex_text("አሳይ \"ቁጥር # አንድ\", 'ነጠላ', \"አለ \\\"ጥቅስ\\\"\" # ማብራሪያ\n");
    if (!require_(r.ok(), "strings should lex")) return false;

    const auto& t = r.tokens;
    bool ok = true;
    ok &= require_(t.size() == 7, "print, three strings, two commas, newline");
    ok &= require_(t[1].kind == TokenKind::String && t[1].lexeme == "\"ቁጥር # አንድ\"", "'#' inside a string");
    ok &= require_(t[3].kind == TokenKind::String && t[3].lexeme == "'ነጠላ'", "single quotes");
    ok &= require_(t[5].kind == TokenKind::String && t[5].lexeme == "\"አለ \\\"ጥቅስ\\\"\"", "escaped quotes");
    ok &= require_(t[6].kind == TokenKind::Newline, "comment dropped");
    return ok;
}

bool test_unterminated_string() {
    auto r = lex_text("አሳይ \"ያልተዘጋ\n");
    bool ok = true;
    ok &= require_(r.error && r.error->kind == ErrorKind::Lex, "expected LexError");
    ok &= require_(has_message(r, "Unterminated string"), "unexpected message");
    return ok;
}

bool test_numbers_and_attribute_access() {
    auto r = lex_text("ሀ = 3.14 + 7\nሁ = ዝርዝር.ርዝመት\n");
    if (!require_(r.ok(), "numbers should lex")) return false;

    const auto& t = r.tokens;
    bool ok = true;
    ok &= require_(t[2].kind == TokenKind::Number && t[2].lexeme == "3.14", "decimal number");
    ok &= require_(t[4].kind == TokenKind::Number && t[4].lexeme == "7", "integer");
    ok &= require_(t[8].kind == TokenKind::Identifier && t[9].kind == TokenKind::Punctuation &&
                   t[9].lexeme == "." && t[10].kind == TokenKind::Identifier, "attribute access");
    return ok;
}

bool test_mixed_alphabet_identifier_rejected() {
    auto r = lex_text("ስምname = 1\n");
    bool ok = true;
    ok &= require_(r.error && r.error->kind == ErrorKind::Lex, "mixed identifier must fail");
    ok &= require_(has_message(r, "mixes Ethiopic and Latin"), "unexpected message");

    auto neutral = lex_text("_ስም_2 = name_3\n");
    ok &= require_(neutral.ok(), "underscores and digits are neutral");
    return ok;
}

bool test_invalid_utf8_rejected() {
    auto r = lex_text("ሀ = \xff\xfe\n");
    bool ok = true;
    ok &= require_(r.error && r.error->kind == ErrorKind::Lex, "expected LexError");
    ok &= require_(has_message(r, "Invalid UTF-8"), "unexpected message");
    return ok;
}

bool test_non_ethiopic_letters_rejected() {
    auto r = lex_text("ሀ = é\n");
    return require_(r.error && r.error->kind == ErrorKind::Lex && has_message(r, "Unexpected"),
                    "letters outside both alphabets are unexpected");
}

bool test_crlf_and_locations() {
    auto r = lex_text("ከሆነ ሀ:\r\n    አሳይ ሀ\r\n");
    if (!require_(r.ok(), "CRLF input should lex")) return false;

    const auto& t = r.tokens;
    bool ok = true;
    ok &= require_(t[0].loc.line == 1 && t[0].loc.col == 1, "first keyword at 1:1");
    ok &= require_(t[4].kind == TokenKind::Indent && t[4].loc.line == 2, "indent on line 2");
    ok &= require_(t[5].kind == TokenKind::Keyword && t[5].loc.line == 2 && t[5].loc.col == 5,
                   "print keyword at 2:5");
    ok &= require_(t[6].lexeme == "ሀ", "no carriage return in lexemes");
    return ok;
}

bool test_empty_input() {
    auto r = lex_text("");
    auto blank = lex_text("\n\n# ብቻ\n");
    return require_(r.ok() && r.tokens.empty() && blank.ok() && blank.tokens.empty(),
                    "empty input yields no tokens");
}

bool test_lexer_reusable() {
    Source src("reuse.amha", "ከሆነ ሀ:\n    አሳይ ሀ\n");
    Lexer lexer(src, amhapy_vocabulary());
    auto first = lexer.lex_all();
    auto second = lexer.lex_all();
    return require_(first.ok() && second.ok() && first.tokens.size() == second.tokens.size(),
                    "a second run starts from a fresh indentation stack");
}

} // namespace

int main() {
    struct Case { const char* name; bool (*fn)(); };
    const Case cases[] = {
        {"single_block_round_trip", test_single_block_round_trip},
        {"nested_blocks_balanced", test_nested_blocks_balanced},
        {"dedents_flushed_at_end_of_input", test_dedents_flushed_at_end_of_input},
        {"tabs_match_spaces", test_tabs_match_spaces},
        {"tab_stops", test_tab_stops},
        {"blank_and_comment_lines_skipped", test_blank_and_comment_lines_skipped},
        {"indent_jump_rejected", test_indent_jump_rejected},
        {"dedent_to_unknown_level_rejected", test_dedent_to_unknown_level_rejected},
        {"indent_not_multiple_rejected", test_indent_not_multiple_rejected},
        {"unexpected_character", test_unexpected_character},
        {"unexpected_run_stops_at_next_token", test_unexpected_run_stops_at_next_token},
        {"keyword_classification", test_keyword_classification},
        {"latin_identifiers_accepted", test_latin_identifiers_accepted},
        {"operators_longest_first", test_operators_longest_first},
        {"strings_and_comments", test_strings_and_comments},
        {"unterminated_string", test_unterminated_string},
        {"numbers_and_attribute_access", test_numbers_and_attribute_access},
        {"mixed_alphabet_identifier_rejected", test_mixed_alphabet_identifier_rejected},
        {"invalid_utf8_rejected", test_invalid_utf8_rejected},
        {"non_ethiopic_letters_rejected", test_non_ethiopic_letters_rejected},
        {"crlf_and_locations", test_crlf_and_locations},
        {"empty_input", test_empty_input},
        {"lexer_reusable", test_lexer_reusable},
    };

    int failed = 0;
    for (const auto& c : cases) {
        if (!c.fn()) {
            std::cerr << "FAIL " << c.name << "\n";
            failed++;
        }
    }
    if (failed) return 1;
    std::cout << "amhapy lexer tests passed\n";
    return 0;
}
