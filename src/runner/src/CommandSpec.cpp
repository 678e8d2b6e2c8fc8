#include "CommandSpec.hpp"

namespace {

std::string shell_word(const std::string& word) {
    if (!word.empty() && word.find_first_of(" \t\"'\\$`") == std::string::npos) {
        return word;
    }
    std::string out = "'";
    for (char c : word) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    return out + "'";
}

}

std::string CommandSpec::display() const {
    std::string out = shell_word(program);
    for (const auto& arg : args) {
        out += ' ';
        out += shell_word(arg);
    }
    return out;
}
