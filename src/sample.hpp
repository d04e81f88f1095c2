#pragma once
#include <string>
#include <string_view>

// A small AmhaPy program touching every keyword group.
std::string_view sample_program();

// Writes sample_program() to path. Throws std::runtime_error on failure.
void write_sample(const std::string& path);
