#ifndef kanboard_CORE_JSON_HPP
#define kanboard_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace kanboard {

typedef nlohmann::json Json;

} // namespace kanboard

#endif // kanboard_CORE_JSON_HPP
