#include "SchemaOption.hpp"
#include "StringUtils.hpp"
#include <stdexcept>
#include <type_traits>

std::string to_display_string(const ConfigValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return "[" + StringUtils::join(v, ", ") + "]";
        }
    }, value);
}

OptionType parse_option_type(const std::string& name) {
    const std::string lower = StringUtils::to_lower(name);
    if (lower == "string" || lower == "str") return OptionType::String;
    if (lower == "bool" || lower == "boolean") return OptionType::Bool;
    if (lower == "int" || lower == "integer") return OptionType::Int;
    if (lower == "enum") return OptionType::Enum;
    if (lower == "secret" || lower == "password") return OptionType::Secret;
    if (lower == "list") return OptionType::List;
    throw std::invalid_argument("Unknown option type: " + name);
}

const char* to_string(OptionType type) {
    switch (type) {
        case OptionType::String: return "string";
        case OptionType::Bool:   return "bool";
        case OptionType::Int:    return "int";
        case OptionType::Enum:   return "enum";
        case OptionType::Secret: return "secret";
        case OptionType::List:   return "list";
        default:                 return "unknown";
    }
}
