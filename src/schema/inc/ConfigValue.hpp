#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// Typed value of a configuration option
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    std::string,
    std::vector<std::string>
>;

// Plain text form: true/false, decimal, the string itself, "[a, b]"
std::string to_display_string(const ConfigValue& value);
