#include "ConfigStore.hpp"
#include "ReefError.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

static const char* kSchema = R"(
variables:
  - name: a
    type: int
    default: 1
  - name: b
    type: enum
    allowed_values: [x, y]
  - name: wazuh.manager.port
    type: int
    default: 1514
    category: Network
  - name: manager_name
    type: string
    default: manager
  - name: manager_password
    type: secret
    category: Credentials
  - name: enable_ufw
    type: bool
    default: false
  - name: roles
    type: list
    default: [common]
)";

static const std::string kDocument =
    "# reef variables\n"
    "a: 3        # count\n"
    "b: \"y\"\n"
    "wazuh:\n"
    "  manager:\n"
    "    port: 1514\n"
    "manager_name: 'mgr'\n"
    "enable_ufw: banana\n";

static fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("reef_config_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

static std::shared_ptr<const SchemaRegistry> make_schema() {
    return std::make_shared<const SchemaRegistry>(SchemaRegistry::from_yaml(YAML::Load(kSchema)));
}

static bool throws_code(ErrorCode code, const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ReefError& e) {
        return e.code() == code;
    }
    return false;
}

static std::string replaced(std::string text, const std::string& from, const std::string& to) {
    auto pos = text.find(from);
    assert(pos != std::string::npos);
    return text.replace(pos, from.size(), to);
}

void test_get_values_and_defaults() {
    fs::path dir = make_temp_dir("get");
    write_file(dir / "all.yml", kDocument);
    ConfigStore store(dir / "all.yml", make_schema());

    assert(std::get<std::int64_t>(store.get("a")) == 3);
    assert(std::get<std::string>(store.get("b")) == "y");
    assert(std::get<std::int64_t>(store.get("wazuh.manager.port")) == 1514);
    assert(std::get<std::string>(store.get("manager_name")) == "mgr");
    assert(std::get<std::string>(store.get("manager_password")).empty());
    // "banana" is not a bool: falls back to the default
    assert(std::get<bool>(store.get("enable_ufw")) == false);

    auto roles = std::get<std::vector<std::string>>(store.get("roles"));
    assert(roles.size() == 1 && roles[0] == "common");

    assert(throws_code(ErrorCode::UnknownOption, [&] { store.get("nope"); }));
    assert(!store.is_dirty());

    fs::remove_all(dir);
    std::cout << "test_get_values_and_defaults passed" << std::endl;
}

void test_set_is_minimal_diff() {
    fs::path dir = make_temp_dir("set");
    write_file(dir / "all.yml", kDocument);
    ConfigStore store(dir / "all.yml", make_schema());

    store.set("a", "5");
    assert(store.render() == replaced(kDocument, "a: 3 ", "a: 5 "));
    assert(store.is_dirty());

    store.set("manager_name", "new mgr");
    assert(store.render().find("manager_name: 'new mgr'\n") != std::string::npos);

    store.set("b", "x");
    assert(store.render().find("b: \"x\"\n") != std::string::npos);

    store.set("enable_ufw", "yes");
    assert(store.render().find("enable_ufw: true\n") != std::string::npos);
    assert(std::get<bool>(store.get("enable_ufw")) == true);

    store.set("wazuh.manager.port", "1515");
    assert(store.render().find("    port: 1515\n") != std::string::npos);

    store.set("roles", "ufw, common");
    assert(store.render().find("enable_ufw: true\nroles: [ufw, common]\n") != std::string::npos);
    assert(std::get<std::vector<std::string>>(store.get("roles")).size() == 2);

    store.set("manager_password", "yes");
    assert(store.render().find("manager_password: \"yes\"\n") != std::string::npos);
    assert(std::get<std::string>(store.get("manager_password")) == "yes");

    assert(store.render().find("# reef variables\n") == 0);

    fs::remove_all(dir);
    std::cout << "test_set_is_minimal_diff passed" << std::endl;
}

void test_invalid_set_leaves_document() {
    fs::path dir = make_temp_dir("invalid");
    write_file(dir / "all.yml", kDocument);
    ConfigStore store(dir / "all.yml", make_schema());

    assert(throws_code(ErrorCode::TypeMismatch, [&] { store.set("a", "five"); }));
    assert(throws_code(ErrorCode::ConstraintViolation, [&] { store.set("b", "z"); }));
    assert(throws_code(ErrorCode::UnknownOption, [&] { store.set("c", "1"); }));
    assert(store.render() == kDocument);
    assert(!store.is_dirty());

    fs::remove_all(dir);
    std::cout << "test_invalid_set_leaves_document passed" << std::endl;
}

void test_merge_is_atomic() {
    fs::path dir = make_temp_dir("merge");
    write_file(dir / "all.yml", kDocument);
    ConfigStore store(dir / "all.yml", make_schema());

    assert(throws_code(ErrorCode::ConstraintViolation, [&] { store.merge({{"a", "5"}, {"b", "z"}}); }));
    assert(std::get<std::int64_t>(store.get("a")) == 3);
    assert(std::get<std::string>(store.get("b")) == "y");
    assert(store.render() == kDocument);
    assert(!store.is_dirty());

    store.merge({{"a", "5"}, {"b", "x"}});
    assert(std::get<std::int64_t>(store.get("a")) == 5);
    assert(std::get<std::string>(store.get("b")) == "x");
    assert(store.is_dirty());
    assert(read_file(dir / "all.yml") == kDocument);

    fs::remove_all(dir);
    std::cout << "test_merge_is_atomic passed" << std::endl;
}

void test_flush_is_idempotent() {
    fs::path dir = make_temp_dir("flush");
    fs::path file = dir / "group_vars" / "all.yml";
    ConfigStore store(file, make_schema());

    store.set("wazuh.manager.port", "1600");
    store.flush();
    const std::string first = read_file(file);
    assert(first == "wazuh:\n  manager:\n    port: 1600\n");
    assert(!store.is_dirty());

    store.flush();
    assert(read_file(file) == first);

    ConfigStore reopened(file, make_schema());
    assert(std::get<std::int64_t>(reopened.get("wazuh.manager.port")) == 1600);

    fs::remove_all(dir);
    std::cout << "test_flush_is_idempotent passed" << std::endl;
}

void test_flush_failure_keeps_memory_and_disk() {
    fs::path dir = make_temp_dir("persist");
    fs::path file = dir / "all.yml";
    write_file(file, kDocument);
    ConfigStore store(file, make_schema());

    // A directory squatting on the temp file name makes the write fail
    fs::path squatter = file.string() + ".tmp." + std::to_string(::getpid());
    fs::create_directories(squatter);

    store.set("a", "7");
    const std::string edited = store.render();
    assert(throws_code(ErrorCode::PersistFailure, [&] { store.flush(); }));
    assert(store.render() == edited);
    assert(store.is_dirty());
    assert(read_file(file) == kDocument);

    assert(throws_code(ErrorCode::PersistFailure, [&] { store.commit({{"a", "8"}}); }));
    assert(std::get<std::int64_t>(store.get("a")) == 7);
    assert(store.is_dirty());
    assert(read_file(file) == kDocument);

    fs::remove_all(squatter);
    store.flush();
    assert(read_file(file) == edited);

    fs::remove_all(dir);
    std::cout << "test_flush_failure_keeps_memory_and_disk passed" << std::endl;
}

void test_commit_and_reload() {
    fs::path dir = make_temp_dir("commit");
    fs::path file = dir / "all.yml";
    write_file(file, kDocument);
    ConfigStore store(file, make_schema());

    store.commit({{"a", "9"}});
    assert(!store.is_dirty());
    assert(read_file(file) == replaced(kDocument, "a: 3 ", "a: 9 "));

    assert(throws_code(ErrorCode::ConstraintViolation, [&] { store.commit({{"b", "q"}}); }));
    assert(read_file(file) == replaced(kDocument, "a: 3 ", "a: 9 "));

    store.set("a", "10");
    store.reload();
    assert(std::get<std::int64_t>(store.get("a")) == 9);
    assert(!store.is_dirty());

    write_file(file, "a: [broken\n");
    assert(throws_code(ErrorCode::MalformedConfig, [&] { store.reload(); }));
    assert(std::get<std::int64_t>(store.get("a")) == 9);

    fs::remove_all(dir);
    std::cout << "test_commit_and_reload passed" << std::endl;
}

void test_snapshot_masks_secrets() {
    fs::path dir = make_temp_dir("snapshot");
    ConfigStore store(dir / "all.yml", make_schema());
    store.set("manager_password", "hunter2");

    auto snapshot = store.snapshot();
    assert(snapshot.size() == 7);
    assert(snapshot["manager_password"] == "******");
    assert(snapshot["a"] == "1");
    assert(snapshot["roles"] == "[common]");
    assert(snapshot["enable_ufw"] == "false");

    fs::remove_all(dir);
    std::cout << "test_snapshot_masks_secrets passed" << std::endl;
}

int main() {
    test_get_values_and_defaults();
    test_set_is_minimal_diff();
    test_invalid_set_leaves_document();
    test_merge_is_atomic();
    test_flush_is_idempotent();
    test_flush_failure_keeps_memory_and_disk();
    test_commit_and_reload();
    test_snapshot_masks_secrets();

    std::cout << "All ConfigStore tests passed!" << std::endl;
    return 0;
}
