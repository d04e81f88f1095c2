#include "diag.hpp"
#include <iostream>
#include <string>

// ANSI colour codes
static constexpr const char* RED    = "\033[31m";
static constexpr const char* YELLOW = "\033[33m";
static constexpr const char* BLUE   = "\033[34m";
static constexpr const char* RESET  = "\033[0m";

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Indentation: return "IndentationError";
        case ErrorKind::Lex:         return "LexError";
        case ErrorKind::Transpile:   return "TranspileError";
    }
    return "LexError";
}

std::string CoreError::str() const {
    std::string out = error_kind_name(kind);
    if (line > 0) out += " (line " + std::to_string(line) + ")";
    out += ": ";
    out += message;
    return out;
}

static const char* level_str(DiagLevel level) {
    switch (level) {
        case DiagLevel::Error:   return "error";
        case DiagLevel::Warning: return "warning";
        case DiagLevel::Note:    return "note";
    }
    return "error";
}

static const char* level_colour(DiagLevel level) {
    switch (level) {
        case DiagLevel::Error:   return RED;
        case DiagLevel::Warning: return YELLOW;
        case DiagLevel::Note:    return BLUE;
    }
    return RED;
}

// Terminal columns taken by the first n bytes of a UTF-8 line.
static int display_width(std::string_view line, int n) {
    int width = 0;
    for (int i = 0; i < n && i < static_cast<int>(line.size()); ++i) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if ((c & 0xC0) != 0x80) width++;
    }
    return width;
}

const char* DiagnosticEngine::paint(DiagLevel level) const {
    return colour_ ? level_colour(level) : "";
}

const char* DiagnosticEngine::reset() const {
    return colour_ ? RESET : "";
}

bool DiagnosticEngine::report(DiagLevel level,
                              SourceLoc loc,
                              const std::string& message) const
{
    if (level == DiagLevel::Error) {
        had_error_ = true;
    }

    // No position: header only.
    if (loc.line < 1) {
        std::cerr << src_.filename() << ": "
                  << paint(level) << level_str(level) << reset()
                  << ": " << message << "\n";
        return false;
    }

    // Header: file:line:col <coloured level>: message
    std::cerr
        << src_.filename() << ":"
        << loc.line << ":"
        << loc.col << " "
        << paint(level)
        << level_str(level)
        << reset()
        << ": "
        << message
        << "\n";

    auto line_content = src_.line_text(loc.line);
    std::cerr << "  " << line_content << "\n";

    // Caret line: spaces up to the column, then ^
    int caret_pos = display_width(line_content, loc.col - 1) + 1;
    if (caret_pos < 1) caret_pos = 1;

    std::cerr << "  ";
    for (int i = 1; i < caret_pos; ++i) {
        std::cerr << ' ';
    }
    std::cerr << paint(level) << "^" << reset() << "\n";

    return false;
}

bool DiagnosticEngine::report(const CoreError& err) const {
    SourceLoc loc;
    loc.line = err.line;
    loc.col = err.col < 1 ? 1 : err.col;
    if (err.line > 0) loc.offset = src_.line_start(err.line) + loc.col - 1;
    return report(DiagLevel::Error, loc,
                  std::string(error_kind_name(err.kind)) + ": " + err.message);
}

void DiagnosticEngine::note(const std::string& message) const {
    std::cerr << paint(DiagLevel::Note) << level_str(DiagLevel::Note) << reset()
              << ": " << message << "\n";
}
