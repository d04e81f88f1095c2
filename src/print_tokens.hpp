#pragma once
#include "token.hpp"
#include <ostream>
#include <vector>

const char* token_kind_name(TokenKind k);

// One token per line: "<line>:<col> <Kind> '<lexeme>'".
void print_tokens(const std::vector<Token>& tokens, std::ostream& os);
