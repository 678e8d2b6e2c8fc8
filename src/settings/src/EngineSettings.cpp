#include "EngineSettings.hpp"
#include "YamlUtils.hpp"
#include <charconv>
#include <cstdlib>
#include <stdexcept>

namespace {

long long parse_grace_ms(const std::string& text, const std::string& source) {
    long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || value < 0) {
        throw std::runtime_error("Invalid cancel grace in " + source + ": '" + text + "'");
    }
    return value;
}

LogUtils::Level parse_level(const std::string& text, const std::string& source) {
    try {
        return LogUtils::parse_level(text);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string(e.what()) + " in " + source);
    }
}

void resolve_path(const std::filesystem::path& base, std::filesystem::path& path) {
    if (!path.empty() && path.is_relative()) {
        path = (base / path).lexically_normal();
    }
}

}

namespace YAML {

bool convert<EngineSettings>::decode(const Node& node, EngineSettings& rhs) {
    static const std::set<std::string> valid_keys = {
        "base_dir", "inventory_file", "config_file", "schema_file", "playbook",
        "ansible_config", "roles_path", "terraform_dir", "history_file",
        "log_file", "log_level", "cancel_grace_ms", "tail_lines"
    };
    check_unknown_keys(node, valid_keys, "settings");

    auto read_path = [&node](const char* key, std::filesystem::path& out) {
        if (node[key] && !node[key].IsNull()) {
            out = node[key].as<std::string>();
        }
    };
    read_path("base_dir", rhs.base_dir);
    read_path("inventory_file", rhs.inventory_file);
    read_path("config_file", rhs.config_file);
    read_path("schema_file", rhs.schema_file);
    read_path("playbook", rhs.playbook);
    read_path("ansible_config", rhs.ansible_config);
    read_path("roles_path", rhs.roles_path);
    read_path("terraform_dir", rhs.terraform_dir);
    read_path("history_file", rhs.history_file);
    read_path("log_file", rhs.log_file);

    if (node["log_level"]) {
        rhs.log_level = parse_level(node["log_level"].as<std::string>(), "settings::log_level");
    }
    if (node["cancel_grace_ms"]) {
        rhs.cancel_grace = std::chrono::milliseconds(
            parse_grace_ms(node["cancel_grace_ms"].as<std::string>(), "settings::cancel_grace_ms"));
    }
    if (node["tail_lines"]) {
        rhs.tail_lines = node["tail_lines"].as<size_t>();
    }
    return true;
}

}

EngineSettings EngineSettings::load(const std::string& file) {
    EngineSettings settings;
    if (!file.empty()) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(file);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Cannot load settings file " + file + ": " + e.what());
        }
        if (root && !root.IsNull()) {
            try {
                settings = root.as<EngineSettings>();
            } catch (const YAML::Exception& e) {
                throw std::runtime_error("Invalid settings in " + file + ": " + e.what());
            }
        }
        // A relative base_dir is taken from the settings file's directory
        if (settings.base_dir.is_relative()) {
            settings.base_dir = std::filesystem::path(file).parent_path() / settings.base_dir;
        }
    }
    settings.apply_environment();
    settings.resolve();
    return settings;
}

void EngineSettings::apply_environment() {
    if (const char* value = std::getenv("REEF_BASE_DIR"); value && *value) {
        base_dir = value;
    }
    if (const char* value = std::getenv("REEF_LOG_LEVEL"); value && *value) {
        log_level = parse_level(value, "REEF_LOG_LEVEL");
    }
    if (const char* value = std::getenv("REEF_CANCEL_GRACE_MS"); value && *value) {
        cancel_grace = std::chrono::milliseconds(parse_grace_ms(value, "REEF_CANCEL_GRACE_MS"));
    }
}

void EngineSettings::resolve() {
    base_dir = std::filesystem::absolute(base_dir).lexically_normal();
    if (!base_dir.has_filename() && base_dir.has_relative_path()) {
        base_dir = base_dir.parent_path();
    }
    resolve_path(base_dir, inventory_file);
    resolve_path(base_dir, config_file);
    resolve_path(base_dir, schema_file);
    resolve_path(base_dir, playbook);
    resolve_path(base_dir, ansible_config);
    resolve_path(base_dir, roles_path);
    resolve_path(base_dir, terraform_dir);
    resolve_path(base_dir, history_file);
    resolve_path(base_dir, log_file);
}
