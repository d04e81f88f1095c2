#pragma once
#include "diag.hpp"
#include "token.hpp"
#include "vocabulary.hpp"

#include <optional>
#include <string>
#include <vector>

struct TranspileResult {
    std::string text;
    std::optional<CoreError> error;

    bool ok() const { return !error.has_value(); }
};

// Rebuilds a Python program from a lexed AmhaPy token stream. Lines are
// joined with '\n'; there is no trailing newline.
TranspileResult transpile(const std::vector<Token>& tokens, const Vocabulary& vocab);

// One logical line (content tokens only) at the given block depth.
std::string assemble_line(const std::vector<Token>& line, int depth, const Vocabulary& vocab);

// Drops the spaces that joining tokens with ' ' leaves around
// ':' ',' '(' ')' '[' ']' and '.'. Textual, so string literals are not spared.
std::string tighten_punctuation(std::string text);
