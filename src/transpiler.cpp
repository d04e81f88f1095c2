#include "transpiler.hpp"
#include "lexer.hpp"
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

static void replace_all(std::string& s, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string tighten_punctuation(std::string text) {
    static const std::pair<std::string_view, std::string_view> fixes[] = {
        {" :", ":"}, {" ,", ","}, {" )", ")"}, {"( ", "("},
        {"[ ", "["}, {" ]", "]"},
        {". ", "."}, {" .", "."},
    };
    for (const auto& [from, to] : fixes) replace_all(text, from, to);
    return text;
}

static std::string join(const std::vector<std::string>& words, size_t first) {
    std::string out;
    for (size_t i = first; i < words.size(); ++i) {
        if (i > first) out += ' ';
        out += words[i];
    }
    return out;
}

std::string assemble_line(const std::vector<Token>& line, int depth, const Vocabulary& vocab) {
    std::string indent(static_cast<size_t>(depth * kIndentWidth), ' ');
    if (line.empty()) return indent;

    std::vector<std::string> words;
    words.reserve(line.size());
    for (const auto& t : line) {
        if (t.kind == TokenKind::Keyword) {
            const std::string_view* target = vocab.lookup(t.lexeme);
            words.push_back(target ? std::string(*target) : t.lexeme);
        } else {
            words.push_back(t.lexeme);
        }
    }

    // `አሳይ a, b` takes its arguments without parentheses.
    if (words.front() == vocab.print_name()) {
        return indent + words.front() + "(" + tighten_punctuation(join(words, 1)) + ")";
    }
    return indent + tighten_punctuation(join(words, 0));
}

static bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t") == std::string::npos;
}

TranspileResult transpile(const std::vector<Token>& tokens, const Vocabulary& vocab) {
    std::vector<std::string> lines;
    std::vector<Token> buffer;
    int depth = 0;

    try {
        for (const auto& t : tokens) {
            switch (t.kind) {
                case TokenKind::Indent:
                    depth++;
                    break;
                case TokenKind::Dedent:
                    if (depth == 0)
                        return {{}, CoreError{ErrorKind::Transpile, t.loc.line, t.loc.col, "Unbalanced dedent"}};
                    depth--;
                    break;
                case TokenKind::Newline:
                    if (!buffer.empty()) {
                        lines.push_back(assemble_line(buffer, depth, vocab));
                        buffer.clear();
                    } else if (!lines.empty() && !is_blank(lines.back())) {
                        // Keep one separator, never a run of them.
                        lines.emplace_back();
                    }
                    break;
                default:
                    buffer.push_back(t);
                    break;
            }
        }

        // Input that did not end on a Newline.
        if (!buffer.empty()) lines.push_back(assemble_line(buffer, depth, vocab));

        std::ostringstream os;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i) os << '\n';
            os << lines[i];
        }
        return {os.str(), std::nullopt};
    } catch (const std::exception& e) {
        return {{}, CoreError{ErrorKind::Transpile, 0, 0,
                              std::string("Transpilation assembly error: ") + e.what()}};
    }
}
