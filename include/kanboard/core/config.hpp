/*
 * kanboard C++ - Configuration
 * 
 * JSON configuration file with dotted-key access:
 *   get_string("store.path", "boards.db") reads {"store": {"path": ...}}
 */
#ifndef kanboard_CORE_CONFIG_HPP
#define kanboard_CORE_CONFIG_HPP

#include <kanboard/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace kanboard {

class Config {
public:
    Config();
    explicit Config(const Json& data);
    
    // Load from a file / string. On failure the current data is kept.
    bool load_file(const std::string& path);
    bool load_string(const std::string& content);
    
    bool has(const std::string& key) const;
    
    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;
    std::vector<std::string> get_string_list(const std::string& key) const;
    
    // Raw node access (null when absent)
    Json get(const std::string& key) const;
    
    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);
    
    const Json& data() const { return data_; }
    const std::string& last_error() const { return last_error_; }

private:
    Json data_;
    std::string last_error_;
    
    const Json* find(const std::string& key) const;
    Json& node_for_write(const std::string& key);
};

} // namespace kanboard

#endif // kanboard_CORE_CONFIG_HPP
