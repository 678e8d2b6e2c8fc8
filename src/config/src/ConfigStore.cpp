#include "ConfigStore.hpp"
#include "AtomicFile.hpp"
#include "LogUtils.hpp"
#include "ReefError.hpp"
#include "StringUtils.hpp"
#include <cstdlib>
#include <set>
#include <stdexcept>
#include <utility>

namespace {

bool looks_like_number(const std::string& s) {
    char* end = nullptr;
    std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size();
}

// Whether a plain scalar would be read back as something else
bool needs_quotes(const std::string& s, bool in_flow) {
    static const std::set<std::string> reserved = {
        "true", "false", "yes", "no", "on", "off", "y", "n", "null", "~"
    };

    if (s.empty() || s != StringUtils::trimmed(s)) return true;
    if (reserved.count(StringUtils::to_lower(s)) || looks_like_number(s)) return true;
    if (std::string("-?:,[]{}#&*!|>'\"%@`").find(s.front()) != std::string::npos) return true;
    if (s.find(": ") != std::string::npos || s.find(" #") != std::string::npos || s.back() == ':') return true;
    if (s.find_first_of("\n\r\t") != std::string::npos) return true;
    return in_flow && s.find_first_of(",[]{}") != std::string::npos;
}

std::string double_quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out += c;
        }
    }
    return out + "\"";
}

std::string single_quoted(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        out += c;
        if (c == '\'') out += '\'';
    }
    return out + "'";
}

// Keeps the quote style of the token being replaced
std::string string_token(const std::string& s, const std::string& previous) {
    if (!previous.empty() && previous.front() == '\'' && s.find_first_of("\n\r") == std::string::npos) {
        return single_quoted(s);
    }
    if (!previous.empty() && previous.front() == '"') {
        return double_quoted(s);
    }
    return needs_quotes(s, false) ? double_quoted(s) : s;
}

void apply(ConfigDocument& doc, const SchemaOption& option, const ConfigValue& value) {
    const ConfigNode* existing = doc.find(option.key);
    const std::string previous = existing ? existing->value : std::string();

    switch (option.type) {
        case OptionType::Bool:
            doc.set_scalar(option.key, std::get<bool>(value) ? "true" : "false");
            break;
        case OptionType::Int:
            doc.set_scalar(option.key, std::to_string(std::get<std::int64_t>(value)));
            break;
        case OptionType::List: {
            std::vector<std::string> tokens;
            for (const auto& item : std::get<std::vector<std::string>>(value)) {
                tokens.push_back(needs_quotes(item, true) ? double_quoted(item) : item);
            }
            doc.set_sequence(option.key, tokens);
            break;
        }
        default:
            doc.set_scalar(option.key, string_token(std::get<std::string>(value), previous));
            break;
    }
}

}

ConfigStore::ConfigStore(std::filesystem::path path, std::shared_ptr<const SchemaRegistry> schema)
    : path_(std::move(path)), schema_(std::move(schema)) {
    if (!schema_) {
        throw std::invalid_argument("ConfigStore requires a schema registry");
    }
    reload();
}

void ConfigStore::reload() {
    auto text = AtomicFile::read(path_);
    ConfigDocument loaded = ConfigDocument::parse(text.value_or(""));

    std::lock_guard<std::mutex> lock(mutex_);
    document_ = std::move(loaded);
    dirty_ = false;
    LogUtils::debug("Loaded config {} ({} top-level keys)", path_.string(), document_.nodes().size());
}

ConfigValue ConfigStore::get(const std::string& key) const {
    const SchemaOption& option = schema_->resolve(key);
    std::lock_guard<std::mutex> lock(mutex_);
    return get_locked(option);
}

ConfigValue ConfigStore::get_locked(const SchemaOption& option) const {
    try {
        std::optional<YAML::Node> node = document_.get(option.key);
        if (!node || node->IsNull()) {
            return option.default_value;
        }

        if (node->IsScalar()) {
            return schema_->validate(option.key, node->Scalar());
        }
        if (node->IsSequence() && option.type == OptionType::List) {
            std::vector<std::string> items;
            for (const auto& item : *node) {
                if (!item.IsScalar()) {
                    throw ReefError(ErrorCode::TypeMismatch,
                                    "'" + option.key + "': list items must be scalars", option.key);
                }
                items.push_back(item.Scalar());
            }
            ConfigValue value = items;
            schema_->check(option, value);
            return value;
        }
        throw ReefError(ErrorCode::TypeMismatch,
                        "'" + option.key + "': Invalid type. Expected " + to_string(option.type), option.key);
    } catch (const ReefError& e) {
        LogUtils::warn("Ignoring invalid value of {} in {}: {}", option.key, path_.string(), e.what());
    } catch (const YAML::Exception& e) {
        LogUtils::warn("Ignoring unreadable value of {} in {}: {}", option.key, path_.string(), e.what());
    }
    return option.default_value;
}

void ConfigStore::set(const std::string& key, const std::string& raw) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SchemaOption& option = schema_->resolve(key);
    ConfigValue value = schema_->validate(key, raw);

    ConfigDocument working = document_;
    apply(working, option, value);
    document_ = std::move(working);
    dirty_ = true;
    LogUtils::info("Set {} = {}", key, schema_->display(key, value));
}

void ConfigStore::merge(const Patch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    merge_locked(patch);
}

void ConfigStore::merge_locked(const Patch& patch) {
    std::vector<std::pair<const SchemaOption*, ConfigValue>> validated;
    validated.reserve(patch.size());
    for (const auto& [key, raw] : patch) {
        validated.emplace_back(&schema_->resolve(key), schema_->validate(key, raw));
    }

    ConfigDocument working = document_;
    for (const auto& [option, value] : validated) {
        apply(working, *option, value);
    }
    document_ = std::move(working);

    if (!validated.empty()) {
        dirty_ = true;
        for (const auto& [option, value] : validated) {
            LogUtils::debug("Merged {} = {}", option->key, schema_->display(option->key, value));
        }
        LogUtils::info("Merged {} keys into {}", validated.size(), path_.string());
    }
}

void ConfigStore::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    flush_locked();
}

void ConfigStore::flush_locked() {
    AtomicFile::write(path_, document_.render());
    dirty_ = false;
    LogUtils::debug("Flushed config to {}", path_.string());
}

void ConfigStore::commit(const Patch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (patch.empty() && !dirty_) {
        return;
    }

    ConfigDocument before = document_;
    const bool was_dirty = dirty_;
    merge_locked(patch);
    try {
        flush_locked();
    } catch (const ReefError& e) {
        document_ = std::move(before);
        dirty_ = was_dirty;
        LogUtils::error("Rolled back config changes: {}", e.what());
        throw;
    }
}

std::string ConfigStore::render() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return document_.render();
}

bool ConfigStore::is_dirty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dirty_;
}

std::map<std::string, std::string> ConfigStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::string> out;
    for (const auto& option : schema_->options()) {
        out[option.key] = schema_->display(option.key, get_locked(option));
    }
    return out;
}
