#include "ConfigDocument.hpp"
#include "ReefError.hpp"
#include "StringUtils.hpp"
#include <set>

namespace {

constexpr size_t npos = std::string::npos;

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

// Blank lines, comments and document markers
bool is_trivia(const std::string& line) {
    const std::string t = StringUtils::trimmed(line);
    return t.empty() || t[0] == '#' || t == "---" || t == "...";
}

bool is_sequence_item(const std::string& line, size_t indent) {
    return line.size() > indent && line[indent] == '-' &&
           (line.size() == indent + 1 || is_blank(line[indent + 1]) || line[indent + 1] == '\r');
}

[[noreturn]] void malformed(size_t line_no, const std::string& why) {
    throw ReefError(ErrorCode::MalformedConfig, "line " + std::to_string(line_no) + ": " + why);
}

// Position just past the closing quote of the token opened at `pos`
size_t quoted_end(const std::string& s, size_t pos) {
    const char quote = s[pos];
    for (size_t i = pos + 1; i < s.size(); ++i) {
        if (quote == '"' && s[i] == '\\') {
            ++i;
            continue;
        }
        if (s[i] == quote) {
            if (quote == '\'' && i + 1 < s.size() && s[i + 1] == '\'') {
                ++i;
                continue;
            }
            return i + 1;
        }
    }
    return npos;
}

// Position just past the bracket closing the flow collection opened at `pos`
size_t flow_end(const std::string& s, size_t pos) {
    int depth = 0;
    for (size_t i = pos; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '"' || c == '\'') {
            size_t end = quoted_end(s, i);
            if (end == npos) return npos;
            i = end - 1;
        } else if (c == '[' || c == '{') {
            ++depth;
        } else if (c == ']' || c == '}') {
            if (--depth == 0) return i + 1;
        }
    }
    return npos;
}

size_t value_end(const std::string& line, size_t start, size_t line_no) {
    if (start >= line.size() || line[start] == '#' || line[start] == '\r') {
        return start;
    }
    if (line[start] == '"' || line[start] == '\'') {
        size_t end = quoted_end(line, start);
        if (end == npos) {
            // Quoted value continued on the next lines
            end = line.size();
            if (line[end - 1] == '\r') --end;
        }
        return end;
    }
    if (line[start] == '[' || line[start] == '{') {
        size_t end = flow_end(line, start);
        if (end == npos) malformed(line_no, "flow collections must close on the same line");
        return end;
    }

    size_t end = line.size();
    if (line[end - 1] == '\r') --end;
    for (size_t i = start + 1; i < end; ++i) {
        if (line[i] == '#' && is_blank(line[i - 1])) {
            end = i;
            break;
        }
    }
    while (end > start && is_blank(line[end - 1])) --end;
    return end;
}

template <typename Nodes>
auto find_named(Nodes& nodes, const std::string& name) -> decltype(&nodes.front()) {
    for (auto& node : nodes) {
        if (node.key == name) return &node;
    }
    return nullptr;
}

void render_node(const ConfigNode& node, std::vector<std::string>& out) {
    out.insert(out.end(), node.leading.begin(), node.leading.end());
    out.push_back(node.line());
    out.insert(out.end(), node.body.begin(), node.body.end());
    for (const auto& child : node.children) {
        render_node(child, out);
    }
}

std::vector<std::string> split_path(const std::string& key) {
    std::vector<std::string> parts = StringUtils::split(key, '.');
    for (const auto& part : parts) {
        if (part.empty()) {
            throw ReefError(ErrorCode::MalformedConfig, "'" + key + "' is not a valid key path", key);
        }
    }
    return parts;
}

class Parser {
public:
    explicit Parser(const std::vector<std::string>& lines) : lines_(lines) {}

    std::vector<ConfigNode> parse(std::vector<std::string>& trailer) {
        std::vector<ConfigNode> nodes;
        skip_trivia();
        if (pos_ < lines_.size()) {
            nodes = parse_mapping(StringUtils::indent_width(lines_[pos_]));
        }
        if (pos_ < lines_.size()) {
            malformed(pos_ + 1, "unexpected indentation");
        }
        trailer = std::move(pending_);
        return nodes;
    }

private:
    void skip_trivia() {
        while (pos_ < lines_.size() && is_trivia(lines_[pos_])) {
            pending_.push_back(lines_[pos_++]);
        }
    }

    size_t next_content() const {
        size_t j = pos_;
        while (j < lines_.size() && is_trivia(lines_[j])) ++j;
        return j;
    }

    std::vector<ConfigNode> parse_mapping(size_t indent) {
        std::vector<ConfigNode> nodes;
        std::set<std::string> seen;
        for (;;) {
            skip_trivia();
            if (pos_ >= lines_.size()) break;

            const std::string& line = lines_[pos_];
            size_t width = StringUtils::indent_width(line);
            if (width < indent) break;
            if (width > indent) malformed(pos_ + 1, "unexpected indentation");
            if (is_sequence_item(line, width)) malformed(pos_ + 1, "sequence item without a key");

            size_t line_no = pos_ + 1;
            ConfigNode node = parse_entry(width);
            if (!seen.insert(node.key).second) {
                malformed(line_no, "duplicate key '" + node.key + "'");
            }
            nodes.push_back(std::move(node));
        }
        return nodes;
    }

    ConfigNode parse_entry(size_t width) {
        ConfigNode node;
        node.leading = std::move(pending_);
        pending_.clear();

        const std::string& line = lines_[pos_];
        const size_t line_no = ++pos_;
        node.indent = line.substr(0, width);

        size_t key_end;
        if (line[width] == '"' || line[width] == '\'') {
            key_end = quoted_end(line, width);
            if (key_end == npos || key_end >= line.size() || line[key_end] != ':') {
                malformed(line_no, "expected ':' after quoted key");
            }
            node.key = line.substr(width + 1, key_end - width - 2);
        } else {
            key_end = width;
            for (;;) {
                key_end = line.find(':', key_end);
                if (key_end == npos) malformed(line_no, "expected 'key: value'");
                if (key_end + 1 == line.size() || is_blank(line[key_end + 1]) || line[key_end + 1] == '\r') break;
                ++key_end;
            }
            node.key = StringUtils::trimmed(line.substr(width, key_end - width));
            if (node.key.empty()) malformed(line_no, "empty key");
        }
        node.key_text = line.substr(width, key_end - width);

        size_t start = key_end + 1;
        while (start < line.size() && is_blank(line[start])) ++start;
        node.separator = line.substr(key_end, start - key_end);

        size_t end = value_end(line, start, line_no);
        node.value = line.substr(start, end - start);
        node.trailing = line.substr(end);

        if (!node.value.empty() && (node.value[0] == '|' || node.value[0] == '>')) {
            node.kind = NodeKind::BlockScalar;
            node.body = take_block(width, false);
        } else if (!node.value.empty()) {
            const bool open_quote = (node.value[0] == '"' || node.value[0] == '\'') &&
                                    quoted_end(node.value, 0) == npos;
            size_t next = next_content();
            if (next < lines_.size() && StringUtils::indent_width(lines_[next]) > width) {
                node.body = take_block(width, false);
                check_continuation(node, line_no);
            } else if (open_quote) {
                malformed(line_no, "unterminated quoted value");
            }
        } else if (node.value.empty()) {
            size_t next = next_content();
            if (next < lines_.size()) {
                size_t next_width = StringUtils::indent_width(lines_[next]);
                if (next_width >= width && is_sequence_item(lines_[next], next_width)) {
                    node.kind = NodeKind::Sequence;
                    node.body = take_block(width, true);
                } else if (next_width > width) {
                    node.kind = NodeKind::Mapping;
                    node.children = parse_mapping(next_width);
                }
            }
        }
        return node;
    }

    // A multi-line scalar must still read as a single value
    static void check_continuation(const ConfigNode& node, size_t line_no) {
        std::string text = "value: " + node.value + "\n";
        for (const auto& line : node.body) {
            text += line + "\n";
        }
        try {
            YAML::Node parsed = YAML::Load(text);
            if (!parsed["value"].IsScalar()) {
                malformed(line_no, "unexpected indentation");
            }
        } catch (const YAML::Exception& e) {
            malformed(line_no, std::string("invalid multi-line value: ") + e.what());
        }
    }

    // Lines indented deeper than `width` (or same-indent items); trivia after the last one is left for the next key
    std::vector<std::string> take_block(size_t width, bool same_indent_items) {
        size_t last = pos_;
        for (size_t j = pos_; j < lines_.size(); ++j) {
            const std::string& line = lines_[j];
            if (is_trivia(line)) continue;
            size_t w = StringUtils::indent_width(line);
            if (w > width || (same_indent_items && w == width && is_sequence_item(line, w))) {
                last = j + 1;
                continue;
            }
            break;
        }
        std::vector<std::string> body(lines_.begin() + pos_, lines_.begin() + last);
        pos_ = last;
        return body;
    }

    const std::vector<std::string>& lines_;
    size_t pos_ = 0;
    std::vector<std::string> pending_;
};

}

const ConfigNode* ConfigNode::child(const std::string& name) const {
    return find_named(children, name);
}

ConfigNode* ConfigNode::child(const std::string& name) {
    return find_named(children, name);
}

ConfigDocument ConfigDocument::parse(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }

    ConfigDocument doc;
    doc.final_newline_ = !text.empty() && text.back() == '\n';
    doc.crlf_ = !lines.empty() && !lines.front().empty() && lines.front().back() == '\r';

    Parser parser(lines);
    doc.nodes_ = parser.parse(doc.trailer_);
    return doc;
}

std::string ConfigDocument::render() const {
    std::vector<std::string> lines;
    for (const auto& node : nodes_) {
        render_node(node, lines);
    }
    lines.insert(lines.end(), trailer_.begin(), trailer_.end());

    std::string out = StringUtils::join(lines, "\n");
    if (final_newline_ && !lines.empty()) {
        out += '\n';
    }
    return out;
}

const ConfigNode* ConfigDocument::find(const std::string& key) const {
    const std::vector<ConfigNode>* level = &nodes_;
    const std::vector<std::string> parts = split_path(key);
    for (size_t i = 0; i < parts.size(); ++i) {
        const ConfigNode* node = find_named(*level, parts[i]);
        if (!node) return nullptr;
        if (i + 1 == parts.size()) return node;
        if (node->kind != NodeKind::Mapping) return nullptr;
        level = &node->children;
    }
    return nullptr;
}

std::optional<YAML::Node> ConfigDocument::get(const std::string& key) const {
    const ConfigNode* node = find(key);
    if (!node) {
        return std::nullopt;
    }

    // Re-root the node under a fixed key and let yaml-cpp decode it
    std::vector<std::string> below = node->body;
    for (const auto& child : node->children) {
        render_node(child, below);
    }
    std::string text = "value:";
    if (!node->value.empty()) {
        text += " " + node->value;
    }
    text += "\n";
    for (const auto& line : below) {
        text += line + "\n";
    }
    return YAML::Load(text)["value"];
}

ConfigNode& ConfigDocument::locate_or_create(const std::string& key) {
    const std::vector<std::string> parts = split_path(key);

    // Reject before touching anything
    const std::vector<ConfigNode>* cursor = &nodes_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        const ConfigNode* node = find_named(*cursor, parts[i]);
        if (!node) break;
        const bool empty_scalar = node->kind == NodeKind::Scalar && node->value.empty();
        if (node->kind != NodeKind::Mapping && !empty_scalar) {
            throw ReefError(ErrorCode::MalformedConfig,
                            "cannot set '" + key + "': '" + parts[i] + "' is not a mapping", key);
        }
        cursor = &node->children;
    }

    std::vector<ConfigNode>* level = &nodes_;
    const ConfigNode* parent = nullptr;
    for (size_t i = 0; i < parts.size(); ++i) {
        const bool leaf = i + 1 == parts.size();
        ConfigNode* node = find_named(*level, parts[i]);
        if (!node) {
            ConfigNode created;
            if (!level->empty()) {
                created.indent = level->front().indent;
            } else if (parent) {
                created.indent = parent->indent + "  ";
            }
            created.key = parts[i];
            created.key_text = parts[i];
            created.separator = leaf ? ": " : ":";
            created.trailing = crlf_ ? "\r" : "";
            created.kind = leaf ? NodeKind::Scalar : NodeKind::Mapping;

            if (level == &nodes_ && nodes_.empty()) {
                created.leading = std::move(trailer_);
                trailer_.clear();
                final_newline_ = true;
            }
            level->push_back(std::move(created));
            node = &level->back();
        }
        if (leaf) return *node;

        node->kind = NodeKind::Mapping;
        parent = node;
        level = &node->children;
    }
    throw ReefError(ErrorCode::MalformedConfig, "'" + key + "' is not a valid key path", key);
}

void ConfigDocument::set_scalar(const std::string& key, const std::string& token) {
    ConfigNode& node = locate_or_create(key);
    node.kind = NodeKind::Scalar;
    node.body.clear();
    node.children.clear();
    if (node.separator.size() == 1) {
        node.separator += ' ';
    }
    if (node.value.empty() && !node.trailing.empty() && node.trailing[0] == '#') {
        node.trailing.insert(0, " ");
    }
    node.value = token;
}

void ConfigDocument::set_sequence(const std::string& key, const std::vector<std::string>& item_tokens) {
    const ConfigNode* existing = find(key);
    if (existing && existing->kind == NodeKind::Sequence && !item_tokens.empty()) {
        std::string prefix;
        for (const auto& line : existing->body) {
            size_t w = StringUtils::indent_width(line);
            if (is_sequence_item(line, w)) {
                prefix = line.substr(0, w) + "- ";
                break;
            }
        }
        if (!prefix.empty()) {
            ConfigNode& node = locate_or_create(key);
            node.body.clear();
            for (const auto& item : item_tokens) {
                node.body.push_back(prefix + item + (crlf_ ? "\r" : ""));
            }
            return;
        }
    }
    set_scalar(key, "[" + StringUtils::join(item_tokens, ", ") + "]");
}
