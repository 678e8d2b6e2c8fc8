#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

// Inline host variables, in file order
using HostVars = std::vector<std::pair<std::string, std::string>>;

struct HostEntry {
    std::string host;
    HostVars vars;
    std::string comment;   // inline "# ..." tail, verbatim

    std::optional<std::string> get(const std::string& name) const;
    void set(const std::string& name, const std::string& value);
};

enum class GroupKind {
    Hosts,     // [name]
    Vars,      // [name:vars]
    Children   // [name:children]
};

// One physical line inside a group
struct GroupLine {
    std::string raw;                 // authoritative text while not dirty
    std::optional<HostEntry> entry;  // unset for comment and blank lines
    bool dirty = false;

    std::string render(GroupKind kind) const;
};

struct HostGroup {
    std::string name;                // section name as written, e.g. "web" or "web:vars"
    GroupKind kind = GroupKind::Hosts;
    bool implicit = false;           // lines before the first header; no header line
    std::string header;
    std::vector<GroupLine> lines;

    const HostEntry* find(const std::string& host) const;
    std::vector<HostEntry> entries() const;
};

class Inventory {
public:
    static constexpr const char* kUngrouped = "ungrouped";

    // Throws ReefError(MalformedInventory)
    static Inventory parse(const std::string& text);

    std::string render() const;

    // Creates the group when missing. Throws ReefError(DuplicateHost)
    void add_host(const std::string& group, const std::string& host, const HostVars& vars = {});

    // Throws ReefError(HostNotFound)
    void remove_host(const std::string& group, const std::string& host);

    // Replaces or appends the given variables. Throws ReefError(HostNotFound)
    void update_host(const std::string& group, const std::string& host, const HostVars& vars);

    const HostGroup* find_group(const std::string& name) const;
    const HostEntry* find_host(const std::string& group, const std::string& host) const;
    std::vector<std::string> groups() const;

    // Every (group, host) pair of host groups, in document order
    std::vector<std::pair<std::string, HostEntry>> hosts() const;

private:
    HostGroup* find_group_mut(const std::string& name);
    HostGroup& host_group_for_edit(const std::string& name, bool create);

    std::vector<HostGroup> groups_;
    bool final_newline_ = false;
};
