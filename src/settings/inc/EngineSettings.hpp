#pragma once

#include "LogUtils.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

// File locations and tunables of one engine instance.
// Paths are relative to base_dir until resolve() makes them absolute.
struct EngineSettings {
    std::filesystem::path base_dir = ".";
    std::filesystem::path inventory_file = "ansible/inventory/hosts.ini";
    std::filesystem::path config_file = "ansible/inventory/group_vars/all.yml";
    std::filesystem::path schema_file = "config.schema.yml";
    std::filesystem::path playbook = "ansible/playbooks/experimental.yml";
    std::filesystem::path ansible_config = "ansible.cfg";
    std::filesystem::path roles_path = "ansible/roles";
    std::filesystem::path terraform_dir = "terraform";
    std::filesystem::path history_file = "log/jobs.jsonl";
    std::filesystem::path log_file = "log/reef.log";
    LogUtils::Level log_level = LogUtils::Level::Info;
    std::chrono::milliseconds cancel_grace{10000};
    size_t tail_lines = 20;

    // Defaults, then the YAML file if given, then REEF_* environment overrides.
    // Throws std::runtime_error on unreadable files, unknown keys or bad values.
    static EngineSettings load(const std::string& file = {});

    // Apply REEF_BASE_DIR, REEF_LOG_LEVEL and REEF_CANCEL_GRACE_MS
    void apply_environment();

    // Make base_dir absolute and every other path absolute against it
    void resolve();
};

namespace YAML {

template<>
struct convert<EngineSettings> {
    static bool decode(const Node& node, EngineSettings& rhs);
};

}
