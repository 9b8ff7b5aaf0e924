#pragma once
#include <string>
#include <yaml-cpp/yaml.h>

namespace t2t {

/**
 * @brief Read an int from a YAML mapping.
 * @param n mapping node (e.g. the root of a converter config).
 * @param key key to look up.
 * @param defv returned when the key is missing or not convertible.
 */
inline int as_int_flexible(const YAML::Node& n, const std::string& key, int defv) {
    if (!n || !n[key]) return defv;
    try {
        return n[key].as<int>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

/**
 * @brief Read a string from a YAML mapping; scalars of any type are accepted.
 */
inline std::string as_str(const YAML::Node& n, const std::string& key, const std::string& defv = {}) {
    if (!n || !n[key]) return defv;
    try {
        return n[key].as<std::string>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

} // namespace t2t
