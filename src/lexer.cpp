#include "lexer.hpp"
#include <stdexcept>
#include <utility>

static bool is_digit(char c) { return c >= '0' && c <= '9'; }
static bool is_latin(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
static bool is_ethiopic(char32_t cp) { return cp >= 0x1200 && cp <= 0x137F; }

// Decodes the code point starting at s[i]. Returns its length in bytes, or 0
// for a malformed, overlong or surrogate sequence.
static int decode_utf8(std::string_view s, int i, char32_t& cp) {
    static const char32_t min_cp[] = {0, 0, 0x80, 0x800, 0x10000};

    unsigned char c = static_cast<unsigned char>(s[i]);
    int len = 0;
    if (c < 0x80)                { cp = c; return 1; }
    else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; len = 2; }
    else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; len = 3; }
    else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; len = 4; }
    else return 0;

    if (i + len > static_cast<int>(s.size())) return 0;
    for (int k = 1; k < len; ++k) {
        unsigned char cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min_cp[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return len;
}

Lexer::Lexer(const Source& src, const Vocabulary& vocab)
    : src_(src), vocab_(vocab) {}

char Lexer::cur() const { return eol() ? '\0' : line_[i_]; }
bool Lexer::eol() const { return i_ >= (int)line_.size(); }

Token Lexer::make(TokenKind k, int s, int e) const {
    return {k, std::string(line_.substr(s, e - s)), src_.loc_from_offset(line_offset_ + s)};
}

bool Lexer::fail(ErrorKind kind, int s, std::string message) {
    error_ = CoreError{kind, line_no_, s + 1, std::move(message)};
    return false;
}

void Lexer::begin_line(int line1) {
    line_no_ = line1;
    line_ = src_.line_text(line1);
    line_offset_ = src_.line_start(line1);
    i_ = 0;
}

int Lexer::measure_indent() {
    int width = 0;
    while (!eol() && (cur() == ' ' || cur() == '\t')) {
        if (cur() == '\t') width = (width / kIndentWidth + 1) * kIndentWidth;
        else width++;
        i_++;
    }
    return width;
}

bool Lexer::apply_indent(int width) {
    if (width % kIndentWidth != 0)
        return fail(ErrorKind::Indentation, i_,
                    "Indentation must be a multiple of " + std::to_string(kIndentWidth) + " spaces");

    int top = indent_.back();
    if (width > top) {
        if (width != top + kIndentWidth)
            return fail(ErrorKind::Indentation, i_,
                        "Indentation increased by more than one level (" +
                        std::to_string(kIndentWidth) + " spaces)");
        indent_.push_back(width);
        out_.push_back(make(TokenKind::Indent, i_, i_));
    } else if (width < top) {
        while (width < indent_.back()) {
            indent_.pop_back();
            out_.push_back(make(TokenKind::Dedent, i_, i_));
        }
        // Landed between two open levels.
        if (width != indent_.back())
            return fail(ErrorKind::Indentation, i_, "Indentation decreased to an inconsistent level");
    }
    return true;
}

// Tried in order at every position; the first match wins.
const std::vector<Lexer::Rule>& Lexer::rules() {
    static const std::vector<Rule> table = {
        {TokenKind::String,      &Lexer::scan_string},
        {TokenKind::Operator,    &Lexer::scan_operator},
        {TokenKind::Punctuation, &Lexer::scan_punct},
        {TokenKind::Number,      &Lexer::scan_number},
        {TokenKind::Identifier,  &Lexer::scan_ident},
    };
    return table;
}

int Lexer::scan_string(int s) {
    char quote = line_[s];
    if (quote != '"' && quote != '\'') return s;

    int j = s + 1;
    while (j < (int)line_.size()) {
        if (line_[j] == '\\') { j += 2; continue; }
        if (line_[j] == quote) return j + 1;
        j++;
    }
    fail(ErrorKind::Lex, s, "Unterminated string literal");
    return s;
}

int Lexer::scan_operator(int s) {
    // Two-character operators first.
    static const std::string_view ops[] = {
        ">=", "<=", "==", "!=",
        ">", "<", "+", "-", "*", "/", "%",
    };
    std::string_view rest = line_.substr(s);
    for (std::string_view op : ops) {
        if (rest.substr(0, op.size()) == op) return s + (int)op.size();
    }
    return s;
}

int Lexer::scan_punct(int s) {
    static constexpr std::string_view punct = ":(),=[].";
    return punct.find(line_[s]) != std::string_view::npos ? s + 1 : s;
}

int Lexer::scan_number(int s) {
    int j = s;
    while (j < (int)line_.size() && is_digit(line_[j])) j++;
    if (j == s) return s;
    if (j + 1 < (int)line_.size() && line_[j] == '.' && is_digit(line_[j + 1])) {
        j++;
        while (j < (int)line_.size() && is_digit(line_[j])) j++;
    }
    return j;
}

int Lexer::scan_ident(int s) {
    bool latin = false;
    bool ethiopic = false;

    int j = s;
    while (j < (int)line_.size()) {
        char c = line_[j];
        if ((unsigned char)c < 0x80) {
            if (is_latin(c)) latin = true;
            else if (is_digit(c)) { if (j == s) break; }
            else if (c != '_') break;
            j++;
            continue;
        }

        char32_t cp = 0;
        int len = decode_utf8(line_, j, cp);
        if (len == 0) {
            fail(ErrorKind::Lex, j, "Invalid UTF-8 sequence");
            return s;
        }
        if (!is_ethiopic(cp)) break;
        ethiopic = true;
        j += len;
    }

    if (latin && ethiopic) {
        fail(ErrorKind::Lex, s, "Identifier mixes Ethiopic and Latin letters: '" +
                                std::string(line_.substr(s, j - s)) + "'");
        return s;
    }
    return j;
}

bool Lexer::starts_token(int s) {
    for (const Rule& rule : rules()) {
        int e = (this->*rule.scan)(s);
        // A malformed token still starts here.
        if (error_) {
            error_.reset();
            return true;
        }
        if (e > s) return true;
    }
    return false;
}

bool Lexer::scan_line() {
    while (!eol()) {
        if (cur() == ' ' || cur() == '\t') { i_++; continue; }
        if (cur() == '#') break;

        int s = i_;
        bool matched = false;
        for (const Rule& rule : rules()) {
            int e = (this->*rule.scan)(s);
            if (error_) return false;
            if (e == s) continue;

            Token t = make(rule.kind, s, e);
            if (rule.kind == TokenKind::Identifier && vocab_.is_keyword(t.lexeme))
                t.kind = TokenKind::Keyword;
            out_.push_back(std::move(t));
            i_ = e;
            matched = true;
            break;
        }

        if (!matched) {
            // Quote only the run that no rule accepts.
            int e = s;
            do {
                e++;
                while (e < (int)line_.size() && ((unsigned char)line_[e] & 0xC0) == 0x80) e++;
            } while (e < (int)line_.size() && line_[e] != ' ' && line_[e] != '\t' &&
                     line_[e] != '#' && !starts_token(e));
            return fail(ErrorKind::Lex, s, "Unexpected characters or sequence '" +
                                           std::string(line_.substr(s, e - s)) + "'");
        }
    }
    return true;
}

LexResult Lexer::lex_all() {
    indent_.assign(1, 0);
    out_.clear();
    error_.reset();

    for (int ln = 1; ln <= src_.line_count(); ++ln) {
        begin_line(ln);
        int width = measure_indent();

        // Blank and comment-only lines leave the block structure alone.
        if (eol() || cur() == '#') continue;

        if (!apply_indent(width) || !scan_line()) {
            out_.clear();
            return LexResult{{}, error_};
        }
        out_.push_back(make(TokenKind::Newline, i_, i_));
    }

    SourceLoc end = src_.loc_from_offset(static_cast<int>(src_.text().size()));
    while (indent_.size() > 1) {
        indent_.pop_back();
        out_.push_back(Token{TokenKind::Dedent, {}, end});
    }
    if (indent_.size() != 1 || indent_.back() != 0)
        throw std::logic_error("indentation stack not back at the base level after input");

    LexResult result;
    result.tokens = std::move(out_);
    out_.clear();
    return result;
}

LexResult lex(const Source& src, const Vocabulary& vocab) {
    Lexer lexer(src, vocab);
    return lexer.lex_all();
}
