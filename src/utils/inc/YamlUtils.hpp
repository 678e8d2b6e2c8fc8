#pragma once

#include <set>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        if (!node.IsMap()) {
            throw std::runtime_error("Expected a mapping in " + context);
        }
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    template<typename T>
    inline void read_optional(const YAML::Node& node, const char* key, T& out) {
        if (node[key] && !node[key].IsNull()) {
            out = node[key].as<T>();
        }
    }

}
