#pragma once

#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

enum class NodeKind {
    Scalar,       // `key: value` or `key:` with no value, continuation lines in body
    Mapping,      // `key:` followed by more-indented keys
    Sequence,     // `key:` followed by `- item` lines, kept as raw lines
    BlockScalar   // `key: |` or `key: >`, kept as raw lines
};

// One `key: value` line and everything that belongs to it.
// Concatenating indent, key_text, separator, value and trailing gives the original line.
struct ConfigNode {
    std::vector<std::string> leading;   // comment and blank lines above the key
    std::string indent;
    std::string key_text;               // as written, possibly quoted
    std::string key;                    // unquoted
    std::string separator;              // ':' and the whitespace after it
    std::string value;                  // value token, empty if none
    std::string trailing;               // whitespace, inline comment, '\r'
    NodeKind kind = NodeKind::Scalar;
    std::vector<std::string> body;      // raw lines of a Sequence, BlockScalar or multi-line Scalar
    std::vector<ConfigNode> children;   // entries of a Mapping

    std::string line() const { return indent + key_text + separator + value + trailing; }
    const ConfigNode* child(const std::string& name) const;
    ConfigNode* child(const std::string& name);
};

// Block-style YAML mapping document that re-renders byte for byte.
// Only the node targeted by a mutation changes; comments, ordering and
// formatting elsewhere are kept.
class ConfigDocument {
public:
    // Throws ReefError(MalformedConfig) with the offending line number
    static ConfigDocument parse(const std::string& text);

    std::string render() const;

    // Dotted path lookup, e.g. "wazuh.manager.port"
    const ConfigNode* find(const std::string& key) const;

    // Decoded YAML value of `key`, nullopt if the key is absent.
    // Throws YAML::Exception when the stored text is not valid YAML.
    std::optional<YAML::Node> get(const std::string& key) const;

    // Replace the value token of `key`, or append the key under its section.
    // Missing intermediate mappings are created. Throws ReefError(MalformedConfig)
    // if a path component exists but is not a mapping; the document is then unchanged.
    void set_scalar(const std::string& key, const std::string& token);

    // Block sequences are rewritten in place with the same item prefix,
    // anything else gets a flow sequence token
    void set_sequence(const std::string& key, const std::vector<std::string>& item_tokens);

    const std::vector<ConfigNode>& nodes() const { return nodes_; }
    bool empty() const { return nodes_.empty() && trailer_.empty(); }

private:
    ConfigNode& locate_or_create(const std::string& key);

    std::vector<ConfigNode> nodes_;
    std::vector<std::string> trailer_;  // trivia after the last key
    bool final_newline_ = false;
    bool crlf_ = false;
};
