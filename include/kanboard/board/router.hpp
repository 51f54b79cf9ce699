/*
 * kanboard C++ - Board/Instance Router
 * 
 * Maps an instance name (e.g. a project) to a board name and the board
 * name to its store key. Unmapped instances are boards of the same name.
 */
#ifndef kanboard_BOARD_ROUTER_HPP
#define kanboard_BOARD_ROUTER_HPP

#include <map>
#include <mutex>
#include <string>

namespace kanboard {

class Config;

class InstanceRouter {
public:
    InstanceRouter();
    
    // Reads router.default and the "instances" object
    void configure(const Config& config);
    
    void set_default(const std::string& board_name);
    std::string default_board() const;
    
    void alias(const std::string& instance, const std::string& board_name);
    
    // Empty instance = default board. Result is sanitized to [A-Za-z0-9_-].
    std::string resolve(const std::string& instance) const;
    
    // "board:<name>"
    static std::string store_key(const std::string& board_name);

private:
    mutable std::mutex mutex_;
    std::string default_board_;
    std::map<std::string, std::string> aliases_;
};

} // namespace kanboard

#endif // kanboard_BOARD_ROUTER_HPP
