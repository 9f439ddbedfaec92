#pragma once
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace oxp {

/**
 * @brief Reads an int from a YAML mapping.
 * @param n Mapping node (a config root or a patch descriptor).
 * @param key Key to look up.
 * @param defv Returned when the key is missing or not convertible.
 */
inline int as_int_flexible(const YAML::Node& n, const std::string& key, int defv) {
    if (!n || !n.IsMap() || !n[key]) return defv;
    try {
        return n[key].as<int>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

inline bool as_bool_flexible(const YAML::Node& n, const std::string& key, bool defv) {
    if (!n || !n.IsMap() || !n[key]) return defv;
    try {
        return n[key].as<bool>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

/**
 * @brief Reads a string from a YAML mapping.
 */
inline std::string as_str(const YAML::Node& n, const std::string& key, const std::string& defv = {}) {
    if (!n || !n.IsMap() || !n[key]) return defv;
    try {
        return n[key].as<std::string>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

// A scalar is read as a one-element list.
inline std::vector<std::string> as_str_list(const YAML::Node& n, const std::string& key) {
    std::vector<std::string> out;
    if (!n || !n.IsMap() || !n[key]) return out;
    const YAML::Node v = n[key];
    try {
        if (v.IsScalar()) {
            out.push_back(v.as<std::string>());
        } else if (v.IsSequence()) {
            for (const auto& item : v) {
                if (item.IsScalar()) out.push_back(item.as<std::string>());
            }
        }
    } catch (const YAML::Exception&) {
        out.clear();
    }
    return out;
}

} // namespace oxp
