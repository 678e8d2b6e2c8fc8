#pragma once

#include "ConfigDocument.hpp"
#include "SchemaRegistry.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Schema-validated variables backed by a comment-preserving YAML document.
// All methods are safe to call from multiple threads; writers are serialized.
class ConfigStore {
public:
    using Patch = std::map<std::string, std::string>;

    // Loads `path`; a missing file starts an empty document.
    // Throws ReefError(MalformedConfig) if the file cannot be parsed.
    ConfigStore(std::filesystem::path path, std::shared_ptr<const SchemaRegistry> schema);

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    // Document value, or the declared default when the key is absent, null or invalid.
    // Throws ReefError(UnknownOption) for undeclared keys.
    ConfigValue get(const std::string& key) const;

    // Validate `raw` and update that one key in memory
    void set(const std::string& key, const std::string& raw);

    // Validate every key first; any failure leaves the document as it was
    void merge(const Patch& patch);

    // Atomic write; on PersistFailure memory and disk are unchanged
    void flush();

    // merge + flush; a failed write rolls the merge back
    void commit(const Patch& patch);

    // Re-read the file and drop unflushed edits
    void reload();

    std::string render() const;
    bool is_dirty() const;

    // Effective value of every declared option, secrets masked
    std::map<std::string, std::string> snapshot() const;

    const SchemaRegistry& schema() const { return *schema_; }
    const std::filesystem::path& path() const { return path_; }

private:
    ConfigValue get_locked(const SchemaOption& option) const;
    void merge_locked(const Patch& patch);
    void flush_locked();

    std::filesystem::path path_;
    std::shared_ptr<const SchemaRegistry> schema_;
    mutable std::mutex mutex_;
    ConfigDocument document_;
    bool dirty_ = false;
};
