#pragma once

#include "Inventory.hpp"
#include <filesystem>
#include <functional>
#include <mutex>

// File-backed inventory; every mutation batch is persisted before it becomes visible
class InventoryStore {
public:
    using Batch = std::function<void(Inventory&)>;

    // Loads the file; a missing file is an empty inventory
    explicit InventoryStore(std::filesystem::path path);

    InventoryStore(const InventoryStore&) = delete;
    InventoryStore& operator=(const InventoryStore&) = delete;

    // Re-read from disk; on parse error the current state is kept
    void reload();

    // Apply `batch` to a copy, write it atomically, then publish it.
    // Any exception from the batch or the write leaves memory and disk unchanged.
    void edit(const Batch& batch);

    void add_host(const std::string& group, const std::string& host, const HostVars& vars = {});
    void remove_host(const std::string& group, const std::string& host);
    void update_host(const std::string& group, const std::string& host, const HostVars& vars);

    Inventory snapshot() const;
    std::string render() const;
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
    Inventory inventory_;
};
