/*
 * kanboard C++ - Tool Provider Implementation
 */
#include <kanboard/core/tool.hpp>

namespace kanboard {

Json ToolResult::to_json() const {
    Json out;
    if (success) {
        out = data.is_object() ? data : Json::object();
        if (!data.is_object() && !data.is_null()) out["result"] = data;
        out["success"] = true;
        return out;
    }
    out["success"] = false;
    out["code"] = code.empty() ? "ValidationError" : code;
    out["error"] = error;
    if (data.is_object()) {
        for (Json::const_iterator it = data.begin(); it != data.end(); ++it) {
            out[it.key()] = it.value();
        }
    }
    return out;
}

Json AgentTool::input_schema() const {
    Json schema;
    schema["type"] = "object";
    Json properties = Json::object();
    Json required = Json::array();
    for (size_t i = 0; i < params.size(); ++i) {
        Json prop;
        prop["type"] = params[i].type;
        prop["description"] = params[i].description;
        if (params[i].type == "array") prop["items"] = Json::object();
        properties[params[i].name] = prop;
        if (params[i].required) required.push_back(params[i].name);
    }
    schema["properties"] = properties;
    if (!required.empty()) schema["required"] = required;
    return schema;
}

std::vector<AgentTool> ToolProvider::get_agent_tools() const {
    std::vector<AgentTool> tools;
    
    const std::vector<std::string> action_list = actions();
    const std::string desc = description();
    
    for (size_t i = 0; i < action_list.size(); ++i) {
        AgentTool tool;
        tool.name = action_list[i];
        tool.description = desc + " - " + action_list[i] + " action";
        tool.params.push_back(ToolParamSchema("params", "object", "Action parameters", false));
        tools.push_back(tool);
    }
    
    return tools;
}

} // namespace kanboard
