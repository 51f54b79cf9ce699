/*
 * kanboard C++ - Board/Instance Router Implementation
 */
#include <kanboard/board/router.hpp>
#include <kanboard/core/config.hpp>
#include <kanboard/core/logger.hpp>
#include <kanboard/core/utils.hpp>

namespace kanboard {

InstanceRouter::InstanceRouter() : default_board_("default") {}

void InstanceRouter::configure(const Config& config) {
    set_default(config.get_string("router.default", "default"));

    Json instances = config.get("instances");
    if (instances.is_null()) return;
    if (!instances.is_object()) {
        LOG_WARN("[Router] 'instances' must be an object of instance -> board, ignoring");
        return;
    }
    for (Json::const_iterator it = instances.begin(); it != instances.end(); ++it) {
        if (!it.value().is_string()) {
            LOG_WARN("[Router] Instance '%s' does not map to a board name, ignoring", it.key().c_str());
            continue;
        }
        alias(it.key(), it.value().get<std::string>());
    }
}

void InstanceRouter::set_default(const std::string& board_name) {
    std::string name = sanitize_name(trim(board_name));
    std::lock_guard<std::mutex> lock(mutex_);
    default_board_ = name.empty() ? "default" : name;
}

std::string InstanceRouter::default_board() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_board_;
}

void InstanceRouter::alias(const std::string& instance, const std::string& board_name) {
    std::string target = sanitize_name(trim(board_name));
    if (trim(instance).empty() || target.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    aliases_[trim(instance)] = target;
    LOG_DEBUG("[Router] Instance '%s' -> board '%s'", instance.c_str(), target.c_str());
}

std::string InstanceRouter::resolve(const std::string& instance) const {
    std::string name = trim(instance);
    std::lock_guard<std::mutex> lock(mutex_);
    if (name.empty()) return default_board_;

    std::map<std::string, std::string>::const_iterator it = aliases_.find(name);
    if (it != aliases_.end()) return it->second;
    return sanitize_name(name);
}

std::string InstanceRouter::store_key(const std::string& board_name) {
    return "board:" + board_name;
}

} // namespace kanboard
