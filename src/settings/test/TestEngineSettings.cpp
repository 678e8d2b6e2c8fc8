#include "EngineSettings.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

// Sets an environment variable for the lifetime of the object
class EnvOverride {
public:
    EnvOverride(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~EnvOverride() { unsetenv(name_); }

private:
    const char* name_;
};

static fs::path write_settings(const std::string& name, const std::string& content) {
    fs::path dir = fs::temp_directory_path() / ("reef_settings_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::ofstream(dir / "settings.yml") << content;
    return dir / "settings.yml";
}

void test_defaults() {
    EngineSettings settings = EngineSettings::load();
    assert(settings.base_dir == fs::current_path());
    assert(settings.inventory_file == settings.base_dir / "ansible/inventory/hosts.ini");
    assert(settings.config_file == settings.base_dir / "ansible/inventory/group_vars/all.yml");
    assert(settings.roles_path.filename() == "roles");
    assert(settings.log_level == LogUtils::Level::Info);
    assert(settings.cancel_grace == std::chrono::milliseconds(10000));
    assert(settings.tail_lines == 20);
    std::cout << "test_defaults passed" << std::endl;
}

void test_load_file_resolves_paths() {
    fs::path file = write_settings("file",
        "base_dir: deploy\n"
        "playbook: playbooks/site.yml\n"
        "terraform_dir: /opt/iac\n"
        "log_level: debug\n"
        "cancel_grace_ms: 2500\n"
        "tail_lines: 50\n");

    EngineSettings settings = EngineSettings::load(file.string());
    fs::path base = fs::absolute(file.parent_path() / "deploy").lexically_normal();
    assert(settings.base_dir == base);
    assert(settings.playbook == base / "playbooks/site.yml");
    assert(settings.terraform_dir == "/opt/iac");
    assert(settings.schema_file == base / "config.schema.yml");
    assert(settings.log_level == LogUtils::Level::Debug);
    assert(settings.cancel_grace == std::chrono::milliseconds(2500));
    assert(settings.tail_lines == 50);

    fs::remove_all(file.parent_path());
    std::cout << "test_load_file_resolves_paths passed" << std::endl;
}

void test_environment_overrides() {
    fs::path file = write_settings("env", "log_level: error\ncancel_grace_ms: 100\n");
    {
        EnvOverride base("REEF_BASE_DIR", "/srv/reef");
        EnvOverride level("REEF_LOG_LEVEL", "WARN");
        EnvOverride grace("REEF_CANCEL_GRACE_MS", "750");

        EngineSettings settings = EngineSettings::load(file.string());
        assert(settings.base_dir == "/srv/reef");
        assert(settings.history_file == "/srv/reef/log/jobs.jsonl");
        assert(settings.log_level == LogUtils::Level::Warn);
        assert(settings.cancel_grace == std::chrono::milliseconds(750));
    }
    {
        EnvOverride grace("REEF_CANCEL_GRACE_MS", "soon");
        bool threw = false;
        try {
            EngineSettings::load(file.string());
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()).find("REEF_CANCEL_GRACE_MS") != std::string::npos;
        }
        assert(threw);
    }

    fs::remove_all(file.parent_path());
    std::cout << "test_environment_overrides passed" << std::endl;
}

void test_rejects_bad_files() {
    fs::path unknown = write_settings("unknown", "inventory: hosts.ini\n");
    bool threw = false;
    try {
        EngineSettings::load(unknown.string());
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("inventory") != std::string::npos;
    }
    assert(threw);

    fs::path level = write_settings("level", "log_level: loud\n");
    threw = false;
    try {
        EngineSettings::load(level.string());
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("loud") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        EngineSettings::load((unknown.parent_path() / "missing.yml").string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    fs::path empty = write_settings("empty", "");
    EngineSettings settings = EngineSettings::load(empty.string());
    assert(settings.base_dir == fs::absolute(empty.parent_path()).lexically_normal());

    fs::remove_all(unknown.parent_path());
    fs::remove_all(level.parent_path());
    fs::remove_all(empty.parent_path());
    std::cout << "test_rejects_bad_files passed" << std::endl;
}

int main() {
    unsetenv("REEF_BASE_DIR");
    unsetenv("REEF_LOG_LEVEL");
    unsetenv("REEF_CANCEL_GRACE_MS");

    test_defaults();
    test_load_file_resolves_paths();
    test_environment_overrides();
    test_rejects_bad_files();

    std::cout << "All EngineSettings tests passed!" << std::endl;
    return 0;
}
