#include "InventoryStore.hpp"
#include "ReefError.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

static fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("reef_inventory_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

void test_missing_file_is_empty_inventory() {
    fs::path dir = make_temp_dir("missing");
    InventoryStore store(dir / "inventory" / "hosts.ini");
    assert(store.render().empty());
    assert(!fs::exists(dir / "inventory" / "hosts.ini"));

    store.add_host("agents", "10.0.0.1", {{"ansible_user", "user1"}});
    assert(fs::exists(dir / "inventory" / "hosts.ini"));
    assert(read_file(dir / "inventory" / "hosts.ini") == "[agents]\n10.0.0.1 ansible_user=user1\n");

    fs::remove_all(dir);
    std::cout << "test_missing_file_is_empty_inventory passed" << std::endl;
}

void test_edit_batch_persists_once() {
    fs::path dir = make_temp_dir("batch");
    fs::path file = dir / "hosts.ini";
    write_file(file, "# managed by operators\n[web]\nweb1 a=1\n");

    InventoryStore store(file);
    store.edit([](Inventory& inv) {
        inv.add_host("web", "web2", {{"a", "2"}});
        inv.remove_host("web", "web1");
    });

    assert(read_file(file) == "# managed by operators\n[web]\nweb2 a=2\n");
    assert(store.snapshot().find_host("web", "web2") != nullptr);
    assert(!fs::exists(dir / ("hosts.ini.tmp")));

    fs::remove_all(dir);
    std::cout << "test_edit_batch_persists_once passed" << std::endl;
}

void test_failed_batch_leaves_state() {
    fs::path dir = make_temp_dir("rollback");
    fs::path file = dir / "hosts.ini";
    const std::string original = "[web]\nweb1 a=1\n";
    write_file(file, original);

    InventoryStore store(file);
    bool thrown = false;
    try {
        store.edit([](Inventory& inv) {
            inv.add_host("web", "web2");
            inv.remove_host("web", "missing");
        });
    } catch (const ReefError& e) {
        thrown = e.code() == ErrorCode::HostNotFound;
    }
    assert(thrown);
    assert(store.render() == original);
    assert(store.snapshot().find_host("web", "web2") == nullptr);
    assert(read_file(file) == original);

    fs::remove_all(dir);
    std::cout << "test_failed_batch_leaves_state passed" << std::endl;
}

void test_persist_failure_leaves_memory() {
    fs::path dir = make_temp_dir("persist");
    // Parent "directory" is a regular file, so the write cannot happen
    write_file(dir / "blocker", "not a directory");
    InventoryStore store(dir / "blocker" / "hosts.ini");

    bool thrown = false;
    try {
        store.add_host("web", "web1");
    } catch (const ReefError& e) {
        thrown = e.code() == ErrorCode::PersistFailure;
    }
    assert(thrown);
    assert(store.render().empty());

    fs::remove_all(dir);
    std::cout << "test_persist_failure_leaves_memory passed" << std::endl;
}

void test_reload_keeps_state_on_parse_error() {
    fs::path dir = make_temp_dir("reload");
    fs::path file = dir / "hosts.ini";
    write_file(file, "[web]\nweb1\n");
    InventoryStore store(file);

    write_file(file, "[web\n");
    bool thrown = false;
    try {
        store.reload();
    } catch (const ReefError& e) {
        thrown = e.code() == ErrorCode::MalformedInventory;
    }
    assert(thrown);
    assert(store.render() == "[web]\nweb1\n");

    write_file(file, "[db]\ndb1\n");
    store.reload();
    assert(store.snapshot().find_host("db", "db1") != nullptr);

    fs::remove_all(dir);
    std::cout << "test_reload_keeps_state_on_parse_error passed" << std::endl;
}

int main() {
    test_missing_file_is_empty_inventory();
    test_edit_batch_persists_once();
    test_failed_batch_leaves_state();
    test_persist_failure_leaves_memory();
    test_reload_keeps_state_on_parse_error();

    std::cout << "All InventoryStore tests passed!" << std::endl;
    return 0;
}
