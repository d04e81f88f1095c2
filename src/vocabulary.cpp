#include "vocabulary.hpp"
#include <stdexcept>
#include <string>
#include <utility>

Vocabulary::Vocabulary(Table table, std::string_view print_keyword)
    : table_(std::move(table)) {
    auto it = table_.find(print_keyword);
    if (it == table_.end())
        throw std::logic_error("print keyword '" + std::string(print_keyword) + "' is not in the vocabulary");
    print_name_ = it->second;
}

const std::string_view* Vocabulary::lookup(std::string_view word) const {
    auto it = table_.find(word);
    return it == table_.end() ? nullptr : &it->second;
}

const Vocabulary& amhapy_vocabulary() {
    static const Vocabulary vocab({
        {"አሳይ",             "print"},
        {"ከሆነ",             "if"},
        {"ያለበለዚያ",          "else"},
        {"ያለበለዚያ_ከሆነ",      "elif"},
        {"ለ",               "for"},
        {"በ",               "in"},
        {"ክልል",             "range"},
        {"እስከሆነ",           "while"},
        {"ሥራ",              "def"},
        {"መመለስ",            "return"},
        {"እውነት",            "True"},
        {"ሐሰት",             "False"},
        {"እና",              "and"},
        {"ወይም",             "or"},
        {"አይደለም",           "not"},
        {"እኩል",             "=="},
        {"እኩል_አይደለም",       "!="},
        {"ትልቅ",             ">"},
        {"ትንሽ",             "<"},
        {"ትልቅ_ወይም_እኩል",    ">="},
        {"ትንሽ_ወይም_እኩል",    "<="},
    }, "አሳይ");
    return vocab;
}
