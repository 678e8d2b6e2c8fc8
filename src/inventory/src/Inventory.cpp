#include "Inventory.hpp"
#include "ReefError.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace {

bool has_space(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

GroupKind kind_of(const std::string& section) {
    auto ends_with = [&](const std::string& suffix) {
        return section.size() > suffix.size() &&
               section.compare(section.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (ends_with(":vars")) return GroupKind::Vars;
    if (ends_with(":children")) return GroupKind::Children;
    return GroupKind::Hosts;
}

// Whitespace tokens up to the first token starting with '#'; the rest is the comment
std::vector<std::string> tokenize(const std::string& content, std::string& comment) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < content.size()) {
        while (i < content.size() && std::isspace(static_cast<unsigned char>(content[i]))) ++i;
        if (i >= content.size()) break;
        if (content[i] == '#') {
            comment = StringUtils::trimmed(content.substr(i));
            break;
        }
        size_t start = i;
        while (i < content.size() && !std::isspace(static_cast<unsigned char>(content[i]))) ++i;
        tokens.push_back(content.substr(start, i - start));
    }
    return tokens;
}

[[noreturn]] void malformed(size_t line_no, const std::string& why, const std::string& raw) {
    throw ReefError(ErrorCode::MalformedInventory,
                    "line " + std::to_string(line_no) + ": " + why + ": '" + raw + "'");
}

HostEntry parse_entry(const std::string& content, GroupKind kind, size_t line_no) {
    HostEntry entry;
    std::vector<std::string> tokens = tokenize(content, entry.comment);
    if (tokens.empty()) {
        malformed(line_no, "missing host", content);
    }

    switch (kind) {
        case GroupKind::Hosts: {
            entry.host = tokens[0];
            if (entry.host.find('=') != std::string::npos) {
                malformed(line_no, "expected host name before variables", content);
            }
            for (size_t i = 1; i < tokens.size(); ++i) {
                auto eq = tokens[i].find('=');
                if (eq == std::string::npos || eq == 0) {
                    malformed(line_no, "expected key=value", tokens[i]);
                }
                entry.vars.emplace_back(tokens[i].substr(0, eq), tokens[i].substr(eq + 1));
            }
            break;
        }
        case GroupKind::Vars: {
            std::string joined = StringUtils::join(tokens, " ");
            auto eq = joined.find('=');
            if (eq == std::string::npos) {
                malformed(line_no, "expected key=value", content);
            }
            std::string key = StringUtils::trimmed(joined.substr(0, eq));
            if (key.empty() || has_space(key)) {
                malformed(line_no, "invalid variable name", content);
            }
            entry.host = key;
            entry.vars.emplace_back(key, StringUtils::trimmed(joined.substr(eq + 1)));
            break;
        }
        case GroupKind::Children: {
            if (tokens.size() != 1) {
                malformed(line_no, "expected a single group name", content);
            }
            entry.host = tokens[0];
            break;
        }
    }
    return entry;
}

void check_token(const std::string& token, const std::string& what) {
    if (token.empty() || has_space(token) || token.front() == '#' || token.front() == '[') {
        throw ReefError(ErrorCode::MalformedInventory, "invalid " + what + " '" + token + "'", token);
    }
}

void check_vars(const HostVars& vars) {
    for (const auto& [key, value] : vars) {
        check_token(key, "variable name");
        if (key.find('=') != std::string::npos) {
            throw ReefError(ErrorCode::MalformedInventory, "invalid variable name '" + key + "'", key);
        }
        if (has_space(value)) {
            throw ReefError(ErrorCode::MalformedInventory,
                            "value of '" + key + "' contains whitespace", key);
        }
    }
}

}

std::optional<std::string> HostEntry::get(const std::string& name) const {
    for (const auto& [key, value] : vars) {
        if (key == name) return value;
    }
    return std::nullopt;
}

void HostEntry::set(const std::string& name, const std::string& value) {
    for (auto& kv : vars) {
        if (kv.first == name) {
            kv.second = value;
            return;
        }
    }
    vars.emplace_back(name, value);
}

std::string GroupLine::render(GroupKind kind) const {
    if (!dirty || !entry) {
        return raw;
    }

    std::string out = raw.substr(0, StringUtils::indent_width(raw));
    switch (kind) {
        case GroupKind::Hosts:
            out += entry->host;
            for (const auto& [key, value] : entry->vars) {
                out += " " + key + "=" + value;
            }
            break;
        case GroupKind::Vars:
            if (!entry->vars.empty()) {
                out += entry->vars.front().first + "=" + entry->vars.front().second;
            }
            break;
        case GroupKind::Children:
            out += entry->host;
            break;
    }
    if (!entry->comment.empty()) {
        out += " " + entry->comment;
    }
    return out;
}

const HostEntry* HostGroup::find(const std::string& host) const {
    for (const auto& line : lines) {
        if (line.entry && line.entry->host == host) {
            return &*line.entry;
        }
    }
    return nullptr;
}

std::vector<HostEntry> HostGroup::entries() const {
    std::vector<HostEntry> out;
    for (const auto& line : lines) {
        if (line.entry) out.push_back(*line.entry);
    }
    return out;
}

Inventory Inventory::parse(const std::string& text) {
    Inventory inv;

    std::vector<std::string> lines;
    if (!text.empty()) {
        lines = StringUtils::split(text, '\n');
        if (text.back() == '\n') {
            lines.pop_back();
            inv.final_newline_ = true;
        }
    }

    HostGroup preamble;
    preamble.name = kUngrouped;
    preamble.implicit = true;
    inv.groups_.push_back(std::move(preamble));

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& raw = lines[i];
        const std::string content = StringUtils::trimmed(raw);
        const size_t line_no = i + 1;

        if (content.empty() || content.front() == '#') {
            inv.groups_.back().lines.push_back(GroupLine{raw, std::nullopt, false});
            continue;
        }

        if (content.front() == '[') {
            if (content.back() != ']' || content.size() < 3) {
                malformed(line_no, "unterminated group header", raw);
            }
            std::string name = StringUtils::trimmed(content.substr(1, content.size() - 2));
            if (name.empty() || has_space(name)) {
                malformed(line_no, "invalid group name", raw);
            }
            if (inv.find_group(name)) {
                malformed(line_no, "duplicate group", raw);
            }
            HostGroup group;
            group.name = name;
            group.kind = kind_of(name);
            group.header = raw;
            inv.groups_.push_back(std::move(group));
            continue;
        }

        HostGroup& current = inv.groups_.back();
        GroupLine line;
        line.raw = raw;
        line.entry = parse_entry(content, current.kind, line_no);
        if (current.find(line.entry->host)) {
            malformed(line_no, "duplicate host '" + line.entry->host + "' in group " + current.name, raw);
        }
        current.lines.push_back(std::move(line));
    }

    return inv;
}

std::string Inventory::render() const {
    std::vector<std::string> out;
    for (const auto& group : groups_) {
        if (!group.implicit) {
            out.push_back(group.header);
        }
        for (const auto& line : group.lines) {
            out.push_back(line.render(group.kind));
        }
    }

    std::string text = StringUtils::join(out, "\n");
    if (final_newline_ && !out.empty()) {
        text += "\n";
    }
    return text;
}

const HostGroup* Inventory::find_group(const std::string& name) const {
    for (const auto& group : groups_) {
        if (group.name != name) continue;
        // The implicit group only counts once it holds hosts
        if (group.implicit && group.entries().empty()) continue;
        return &group;
    }
    return nullptr;
}

HostGroup* Inventory::find_group_mut(const std::string& name) {
    return const_cast<HostGroup*>(static_cast<const Inventory*>(this)->find_group(name));
}

const HostEntry* Inventory::find_host(const std::string& group, const std::string& host) const {
    const HostGroup* g = find_group(group);
    return g ? g->find(host) : nullptr;
}

std::vector<std::string> Inventory::groups() const {
    std::vector<std::string> names;
    for (const auto& group : groups_) {
        if (group.implicit && group.entries().empty()) continue;
        names.push_back(group.name);
    }
    return names;
}

std::vector<std::pair<std::string, HostEntry>> Inventory::hosts() const {
    std::vector<std::pair<std::string, HostEntry>> out;
    for (const auto& group : groups_) {
        if (group.kind != GroupKind::Hosts) continue;
        for (const auto& line : group.lines) {
            if (line.entry) out.emplace_back(group.name, *line.entry);
        }
    }
    return out;
}

HostGroup& Inventory::host_group_for_edit(const std::string& name, bool create) {
    if (HostGroup* existing = find_group_mut(name)) {
        if (existing->kind != GroupKind::Hosts) {
            throw ReefError(ErrorCode::MalformedInventory, "'" + name + "' is not a host group", name);
        }
        return *existing;
    }

    if (!create) {
        throw ReefError(ErrorCode::HostNotFound, "group '" + name + "' does not exist", name);
    }

    check_token(name, "group name");
    if (name.find(']') != std::string::npos || kind_of(name) != GroupKind::Hosts) {
        throw ReefError(ErrorCode::MalformedInventory, "invalid group name '" + name + "'", name);
    }

    // Separate the new section from existing content by one blank line
    std::optional<std::string> last_line;
    for (auto it = groups_.rbegin(); it != groups_.rend() && !last_line; ++it) {
        if (!it->lines.empty()) {
            last_line = it->lines.back().render(it->kind);
        } else if (!it->implicit) {
            last_line = it->header;
        }
    }
    if (!last_line) {
        final_newline_ = true;
    } else if (!StringUtils::trimmed(*last_line).empty()) {
        groups_.back().lines.push_back(GroupLine{"", std::nullopt, false});
    }

    HostGroup group;
    group.name = name;
    group.kind = GroupKind::Hosts;
    group.header = "[" + name + "]";
    groups_.push_back(std::move(group));
    return groups_.back();
}

void Inventory::add_host(const std::string& group, const std::string& host, const HostVars& vars) {
    check_token(host, "host name");
    if (host.find('=') != std::string::npos) {
        throw ReefError(ErrorCode::MalformedInventory, "invalid host name '" + host + "'", host);
    }
    check_vars(vars);

    if (const HostGroup* existing = find_group(group)) {
        if (existing->find(host)) {
            throw ReefError(ErrorCode::DuplicateHost,
                            "host '" + host + "' already in group '" + group + "'", host);
        }
    }

    HostGroup& g = host_group_for_edit(group, true);

    GroupLine line;
    line.entry = HostEntry{host, vars, ""};
    line.dirty = true;

    // Insert right after the last host line so trailing comments stay put
    auto insert_at = g.lines.begin();
    for (auto it = g.lines.begin(); it != g.lines.end(); ++it) {
        if (it->entry) insert_at = std::next(it);
    }
    g.lines.insert(insert_at, std::move(line));
}

void Inventory::remove_host(const std::string& group, const std::string& host) {
    HostGroup* g = find_group_mut(group);
    if (g && g->kind == GroupKind::Hosts) {
        auto it = std::find_if(g->lines.begin(), g->lines.end(), [&](const GroupLine& line) {
            return line.entry && line.entry->host == host;
        });
        if (it != g->lines.end()) {
            g->lines.erase(it);
            return;
        }
    }
    throw ReefError(ErrorCode::HostNotFound, "host '" + host + "' not found in group '" + group + "'", host);
}

void Inventory::update_host(const std::string& group, const std::string& host, const HostVars& vars) {
    check_vars(vars);

    HostGroup* g = find_group_mut(group);
    if (g && g->kind == GroupKind::Hosts) {
        for (auto& line : g->lines) {
            if (line.entry && line.entry->host == host) {
                for (const auto& [key, value] : vars) {
                    line.entry->set(key, value);
                }
                line.dirty = true;
                return;
            }
        }
    }
    throw ReefError(ErrorCode::HostNotFound, "host '" + host + "' not found in group '" + group + "'", host);
}
