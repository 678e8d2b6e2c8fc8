#pragma once

#include "SchemaOption.hpp"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

// Declared configuration options. Immutable once constructed.
class SchemaRegistry {
public:
    // Throws SchemaDeclarationError on key collision, bad constraints or invalid defaults
    explicit SchemaRegistry(std::vector<SchemaOption> options);

    // Expects a top-level `variables:` sequence
    static SchemaRegistry from_yaml(const YAML::Node& root);
    static SchemaRegistry from_file(const std::string& path);

    // Throws ReefError(UnknownOption)
    const SchemaOption& resolve(const std::string& key) const;
    bool contains(const std::string& key) const;

    // Coerce and check a raw input. Throws ReefError(UnknownOption, TypeMismatch, ConstraintViolation)
    ConfigValue validate(const std::string& key, const std::string& raw) const;

    // Check an already typed value, e.g. one decoded from the document
    void check(const SchemaOption& option, const ConfigValue& value) const;

    // Display form with secrets masked
    std::string display(const std::string& key, const ConfigValue& value) const;

    const std::vector<SchemaOption>& options() const { return options_; }

    // Options grouped by category, categories in first-declared order
    std::vector<std::pair<std::string, std::vector<const SchemaOption*>>> categories() const;

private:
    std::vector<SchemaOption> options_;
    std::unordered_map<std::string, size_t> index_;
};

namespace YAML {

template<>
struct convert<SchemaOption> {
    static bool decode(const Node& node, SchemaOption& rhs);
};

}
