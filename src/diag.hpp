#pragma once
#include "source.hpp"
#include <string>

enum class DiagLevel { Error, Warning, Note };

// The three ways a translation run can fail.
enum class ErrorKind { Indentation, Lex, Transpile };

const char* error_kind_name(ErrorKind kind);

// First error of a lex or transpile run. line/col are 1-based, 0 when no
// source position applies.
struct CoreError {
    ErrorKind kind = ErrorKind::Lex;
    int line = 0;
    int col = 0;
    std::string message;

    // "LexError (line 3): ..."
    std::string str() const;
};

class DiagnosticEngine {
public:
    explicit DiagnosticEngine(const Source& src, bool colour = true)
        : src_(src), colour_(colour) {}

    bool report(DiagLevel level, SourceLoc loc, const std::string& message) const;

    bool error(SourceLoc loc, const std::string& message) const {
        return report(DiagLevel::Error, loc, message);
    }

    bool report(const CoreError& err) const;

    // Location-less progress message.
    void note(const std::string& message) const;

    bool has_errors() const { return had_error_; }

private:
    const Source& src_;
    bool colour_;
    mutable bool had_error_ = false;

    const char* paint(DiagLevel level) const;
    const char* reset() const;
};
