#pragma once
#include <string>

struct RunResult {
    int exit_code = 0;
    std::string output; // stdout and stderr, interleaved
    bool launched = true; // false when the shell could not find or exec the interpreter
};

// Runs generated Python text with the given interpreter and captures what it
// prints. A non-zero exit_code is a failure of the translated program, not of
// the translation. Throws std::runtime_error if the script cannot be staged.
RunResult run_python(const std::string& code, const std::string& interpreter);
