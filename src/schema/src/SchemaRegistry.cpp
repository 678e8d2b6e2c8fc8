#include "SchemaRegistry.hpp"
#include "LogUtils.hpp"
#include "ReefError.hpp"
#include "StringUtils.hpp"
#include "YamlUtils.hpp"
#include <algorithm>
#include <charconv>
#include <regex>
#include <set>

namespace {

bool value_matches_type(OptionType type, const ConfigValue& value) {
    switch (type) {
        case OptionType::Bool:   return std::holds_alternative<bool>(value);
        case OptionType::Int:    return std::holds_alternative<std::int64_t>(value);
        case OptionType::List:   return std::holds_alternative<std::vector<std::string>>(value);
        default:                 return std::holds_alternative<std::string>(value);
    }
}

ConfigValue coerce_bool(const SchemaOption& option, const std::string& raw) {
    static const std::set<std::string> truthy = {"true", "yes", "on", "1", "y"};
    static const std::set<std::string> falsy = {"false", "no", "off", "0", "n"};

    const std::string lower = StringUtils::to_lower(StringUtils::trimmed(raw));
    if (truthy.count(lower)) return true;
    if (falsy.count(lower)) return false;
    throw ReefError(ErrorCode::TypeMismatch,
                    "'" + option.key + "': Invalid type. Expected boolean, got '" + raw + "'", option.key);
}

ConfigValue coerce_int(const SchemaOption& option, const std::string& raw) {
    std::string text = StringUtils::trimmed(raw);
    if (!text.empty() && text.front() == '+') {
        text.erase(0, 1);
    }

    std::int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw ReefError(ErrorCode::TypeMismatch,
                        "'" + option.key + "': Invalid type. Expected integer, got '" + raw + "'", option.key);
    }
    return value;
}

ConfigValue coerce_list(const SchemaOption& option, const std::string& raw) {
    const std::string text = StringUtils::trimmed(raw);
    std::vector<std::string> items;
    if (text.empty()) {
        return items;
    }

    if (text.front() == '[') {
        try {
            YAML::Node node = YAML::Load(text);
            if (!node.IsSequence()) {
                throw ReefError(ErrorCode::TypeMismatch,
                                "'" + option.key + "': Invalid type. Expected list", option.key);
            }
            for (const auto& item : node) {
                if (!item.IsScalar()) {
                    throw ReefError(ErrorCode::TypeMismatch,
                                    "'" + option.key + "': list items must be scalars", option.key);
                }
                items.push_back(item.as<std::string>());
            }
        } catch (const YAML::Exception& e) {
            throw ReefError(ErrorCode::TypeMismatch,
                            "'" + option.key + "': Invalid list syntax: " + e.what(), option.key);
        }
        return items;
    }

    for (auto& part : StringUtils::split(text, ',')) {
        StringUtils::trim(part);
        if (!part.empty()) items.push_back(part);
    }
    return items;
}

ConfigValue coerce(const SchemaOption& option, const std::string& raw) {
    switch (option.type) {
        case OptionType::Bool: return coerce_bool(option, raw);
        case OptionType::Int:  return coerce_int(option, raw);
        case OptionType::List: return coerce_list(option, raw);
        case OptionType::Enum: return StringUtils::trimmed(raw);
        default:               return raw;
    }
}

bool is_allowed(const SchemaOption& option, const std::string& value) {
    return option.allowed_values.empty() ||
           std::find(option.allowed_values.begin(), option.allowed_values.end(), value) != option.allowed_values.end();
}

[[noreturn]] void declaration_error(const std::string& message) {
    throw SchemaDeclarationError("Schema declaration error: " + message);
}

}

SchemaRegistry::SchemaRegistry(std::vector<SchemaOption> options)
    : options_(std::move(options)) {

    for (size_t i = 0; i < options_.size(); ++i) {
        const SchemaOption& option = options_[i];

        if (option.key.empty()) {
            declaration_error("option #" + std::to_string(i + 1) + " has an empty key");
        }
        for (const auto& part : StringUtils::split(option.key, '.')) {
            if (part.empty()) {
                declaration_error("option key '" + option.key + "' has an empty path segment");
            }
        }
        if (!index_.emplace(option.key, i).second) {
            declaration_error("duplicate option key '" + option.key + "'");
        }
        if (option.type == OptionType::Enum && option.allowed_values.empty()) {
            declaration_error("enum option '" + option.key + "' declares no allowed_values");
        }
        if (option.min && option.max && *option.min > *option.max) {
            declaration_error("option '" + option.key + "' has min > max");
        }
        if (option.regex) {
            try {
                std::regex compiled(*option.regex);
            } catch (const std::regex_error& e) {
                declaration_error("option '" + option.key + "' has an invalid regex: " + e.what());
            }
        }
        if (!value_matches_type(option.type, option.default_value)) {
            declaration_error("default of '" + option.key + "' is not of type " + to_string(option.type));
        }
        try {
            check(option, option.default_value);
        } catch (const ReefError& e) {
            declaration_error("default of '" + option.key + "' is invalid: " + e.what());
        }
    }
}

SchemaRegistry SchemaRegistry::from_yaml(const YAML::Node& root) {
    if (!root || !root["variables"]) {
        declaration_error("missing top-level 'variables' list");
    }
    const YAML::Node& variables = root["variables"];
    if (!variables.IsSequence()) {
        declaration_error("'variables' must be a list");
    }

    std::vector<SchemaOption> options;
    options.reserve(variables.size());
    for (const auto& node : variables) {
        try {
            options.push_back(node.as<SchemaOption>());
        } catch (const YAML::Exception& e) {
            declaration_error(std::string("cannot decode option: ") + e.what());
        } catch (const std::runtime_error& e) {
            declaration_error(e.what());
        } catch (const std::invalid_argument& e) {
            declaration_error(e.what());
        }
    }
    return SchemaRegistry(std::move(options));
}

SchemaRegistry SchemaRegistry::from_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        declaration_error("cannot load schema file " + path + ": " + e.what());
    }
    SchemaRegistry registry = from_yaml(root);
    LogUtils::info("Loaded {} schema options from {}", registry.options().size(), path);
    return registry;
}

const SchemaOption& SchemaRegistry::resolve(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        throw ReefError(ErrorCode::UnknownOption, "'" + key + "' is not a declared option", key);
    }
    return options_[it->second];
}

bool SchemaRegistry::contains(const std::string& key) const {
    return index_.count(key) > 0;
}

ConfigValue SchemaRegistry::validate(const std::string& key, const std::string& raw) const {
    const SchemaOption& option = resolve(key);
    ConfigValue value = coerce(option, raw);
    check(option, value);
    return value;
}

void SchemaRegistry::check(const SchemaOption& option, const ConfigValue& value) const {
    if (!value_matches_type(option.type, value)) {
        throw ReefError(ErrorCode::TypeMismatch,
                        "'" + option.key + "': Invalid type. Expected " + to_string(option.type), option.key);
    }

    const std::string allowed_list = StringUtils::join(option.allowed_values, ", ");

    switch (option.type) {
        case OptionType::Int: {
            auto v = std::get<std::int64_t>(value);
            if (option.min && v < *option.min) {
                throw ReefError(ErrorCode::ConstraintViolation,
                                "'" + option.key + "': Value must be >= " + std::to_string(*option.min), option.key);
            }
            if (option.max && v > *option.max) {
                throw ReefError(ErrorCode::ConstraintViolation,
                                "'" + option.key + "': Value must be <= " + std::to_string(*option.max), option.key);
            }
            break;
        }
        case OptionType::String:
        case OptionType::Secret:
        case OptionType::Enum: {
            const auto& v = std::get<std::string>(value);
            if (!is_allowed(option, v)) {
                throw ReefError(ErrorCode::ConstraintViolation,
                                "'" + option.key + "': Value must be one of: " + allowed_list, option.key);
            }
            if (option.regex && option.type != OptionType::Enum &&
                !std::regex_match(v, std::regex(*option.regex))) {
                throw ReefError(ErrorCode::ConstraintViolation,
                                "'" + option.key + "': Value does not match required pattern: " + *option.regex,
                                option.key);
            }
            break;
        }
        case OptionType::List: {
            for (const auto& item : std::get<std::vector<std::string>>(value)) {
                if (!is_allowed(option, item)) {
                    throw ReefError(ErrorCode::ConstraintViolation,
                                    "'" + option.key + "': '" + item + "' is not one of: " + allowed_list,
                                    option.key);
                }
            }
            break;
        }
        case OptionType::Bool:
            break;
    }
}

std::string SchemaRegistry::display(const std::string& key, const ConfigValue& value) const {
    const SchemaOption& option = resolve(key);
    const std::string text = to_display_string(value);
    return option.is_secret() ? StringUtils::mask(text) : text;
}

std::vector<std::pair<std::string, std::vector<const SchemaOption*>>> SchemaRegistry::categories() const {
    std::vector<std::pair<std::string, std::vector<const SchemaOption*>>> out;
    std::unordered_map<std::string, size_t> position;
    for (const auto& option : options_) {
        auto it = position.find(option.category);
        if (it == position.end()) {
            it = position.emplace(option.category, out.size()).first;
            out.emplace_back(option.category, std::vector<const SchemaOption*>{});
        }
        out[it->second].second.push_back(&option);
    }
    return out;
}

namespace YAML {

static ConfigValue decode_default(const Node& node, const SchemaOption& option) {
    const bool missing = !node || node.IsNull();
    switch (option.type) {
        case OptionType::Bool:
            return missing ? false : node.as<bool>();
        case OptionType::Int:
            return missing ? std::int64_t{0} : node.as<std::int64_t>();
        case OptionType::List:
            if (missing) return std::vector<std::string>{};
            if (!node.IsSequence()) {
                throw std::runtime_error("default of list option '" + option.key + "' must be a list");
            }
            return node.as<std::vector<std::string>>();
        case OptionType::Enum:
            if (missing) {
                return option.allowed_values.empty() ? std::string() : option.allowed_values.front();
            }
            return node.as<std::string>();
        default:
            return missing ? std::string() : node.as<std::string>();
    }
}

bool convert<SchemaOption>::decode(const Node& node, SchemaOption& rhs) {
    static const std::set<std::string> valid_keys = {
        "name", "type", "default", "description", "category", "allowed_values", "validation"
    };
    check_unknown_keys(node, valid_keys, "schema variable");

    if (!node["name"]) {
        throw std::runtime_error("Missing required field 'name' in schema variable.");
    }
    rhs.key = node["name"].as<std::string>();

    if (node["type"]) {
        rhs.type = parse_option_type(node["type"].as<std::string>());
    }
    read_optional(node, "description", rhs.description);
    read_optional(node, "category", rhs.category);
    read_optional(node, "allowed_values", rhs.allowed_values);

    if (node["validation"]) {
        const auto& validation = node["validation"];
        static const std::set<std::string> validation_keys = {"min", "max", "regex"};
        check_unknown_keys(validation, validation_keys, "validation of " + rhs.key);

        if (validation["min"]) rhs.min = validation["min"].as<std::int64_t>();
        if (validation["max"]) rhs.max = validation["max"].as<std::int64_t>();
        if (validation["regex"]) rhs.regex = validation["regex"].as<std::string>();
    }

    rhs.default_value = decode_default(node["default"], rhs);
    return true;
}

}
