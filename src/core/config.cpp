/*
 * kanboard C++ - Configuration Implementation
 */
#include <kanboard/core/config.hpp>
#include <kanboard/core/logger.hpp>
#include <kanboard/core/utils.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace kanboard {

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        last_error_ = "Cannot open config file: " + path;
        return false;
    }
    
    std::ostringstream content;
    content << file.rdbuf();
    return load_string(content.str());
}

bool Config::load_string(const std::string& content) {
    Json parsed = Json::parse(content, nullptr, false);
    if (parsed.is_discarded()) {
        last_error_ = "Config is not valid JSON";
        return false;
    }
    if (!parsed.is_object()) {
        last_error_ = "Config root must be a JSON object";
        return false;
    }
    data_ = parsed;
    last_error_.clear();
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::node_for_write(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    const Json* node = find(key);
    return node != nullptr && !node->is_null();
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* node = find(key);
    if (!node) return default_val;
    if (node->is_string()) return node->get<std::string>();
    if (node->is_number() || node->is_boolean()) return node->dump();
    return default_val;
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* node = find(key);
    if (!node) return default_val;
    if (node->is_number()) return node->get<int64_t>();
    if (node->is_string()) {
        const std::string s = node->get<std::string>();
        char* end = nullptr;
        long long v = strtoll(s.c_str(), &end, 10);
        if (end && *end == '\0' && !s.empty()) return static_cast<int64_t>(v);
        LOG_WARN("[Config] '%s' is not an integer: %s", key.c_str(), s.c_str());
    }
    return default_val;
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* node = find(key);
    if (!node) return default_val;
    if (node->is_boolean()) return node->get<bool>();
    if (node->is_number()) return node->get<int64_t>() != 0;
    if (node->is_string()) {
        const std::string s = to_lower(node->get<std::string>());
        if (s == "true" || s == "yes" || s == "1") return true;
        if (s == "false" || s == "no" || s == "0") return false;
    }
    return default_val;
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const Json* node = find(key);
    if (!node || !node->is_array()) return out;
    for (size_t i = 0; i < node->size(); ++i) {
        if ((*node)[i].is_string()) {
            out.push_back((*node)[i].get<std::string>());
        }
    }
    return out;
}

Json Config::get(const std::string& key) const {
    const Json* node = find(key);
    return node ? *node : Json();
}

void Config::set_string(const std::string& key, const std::string& value) {
    node_for_write(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    node_for_write(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    node_for_write(key) = value;
}

} // namespace kanboard
