#pragma once
#include <cstddef>
#include <string_view>
#include <unordered_map>

// Keyword table: AmhaPy spelling -> Python spelling.
//
// Built once and never modified afterwards, so one instance can be shared by
// every lexer and transpiler in the process.

class Vocabulary {
public:
    using Table = std::unordered_map<std::string_view, std::string_view>;

    Vocabulary(Table table, std::string_view print_keyword);

    // Returns nullptr if word is not a keyword.
    const std::string_view* lookup(std::string_view word) const;

    bool is_keyword(std::string_view word) const { return lookup(word) != nullptr; }

    // Python spelling of the print keyword ("print").
    std::string_view print_name() const { return print_name_; }

    std::size_t size() const { return table_.size(); }

private:
    Table table_;
    std::string_view print_name_;
};

const Vocabulary& amhapy_vocabulary();
