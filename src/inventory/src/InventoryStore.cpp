#include "InventoryStore.hpp"
#include "AtomicFile.hpp"
#include "LogUtils.hpp"

InventoryStore::InventoryStore(std::filesystem::path path)
    : path_(std::move(path)) {
    reload();
}

void InventoryStore::reload() {
    auto text = AtomicFile::read(path_);
    Inventory loaded = Inventory::parse(text.value_or(""));

    std::lock_guard<std::mutex> lock(mutex_);
    inventory_ = std::move(loaded);
    LogUtils::debug("Loaded inventory {} ({} groups)", path_.string(), inventory_.groups().size());
}

void InventoryStore::edit(const Batch& batch) {
    std::lock_guard<std::mutex> lock(mutex_);

    Inventory working = inventory_;
    batch(working);

    AtomicFile::write(path_, working.render());
    inventory_ = std::move(working);
}

void InventoryStore::add_host(const std::string& group, const std::string& host, const HostVars& vars) {
    edit([&](Inventory& inv) { inv.add_host(group, host, vars); });
    LogUtils::info("Added host {} to group [{}]", host, group);
}

void InventoryStore::remove_host(const std::string& group, const std::string& host) {
    edit([&](Inventory& inv) { inv.remove_host(group, host); });
    LogUtils::info("Removed host {} from group [{}]", host, group);
}

void InventoryStore::update_host(const std::string& group, const std::string& host, const HostVars& vars) {
    edit([&](Inventory& inv) { inv.update_host(group, host, vars); });
    LogUtils::info("Updated host {} in group [{}]", host, group);
}

Inventory InventoryStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inventory_;
}

std::string InventoryStore::render() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inventory_.render();
}
