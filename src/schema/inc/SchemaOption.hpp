#pragma once

#include "ConfigValue.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class OptionType {
    String,
    Bool,
    Int,
    Enum,
    Secret,
    List
};

// Accepts string, bool/boolean, int/integer, enum, secret/password, list
OptionType parse_option_type(const std::string& name);
const char* to_string(OptionType type);

struct SchemaOption {
    std::string key;                       // dotted path, e.g. "wazuh.manager_ip"
    OptionType type = OptionType::String;
    ConfigValue default_value;
    std::string description;
    std::string category = "Uncategorized";

    // Constraints, all optional
    std::vector<std::string> allowed_values;
    std::optional<std::int64_t> min;
    std::optional<std::int64_t> max;
    std::optional<std::string> regex;

    bool is_secret() const { return type == OptionType::Secret; }
};
