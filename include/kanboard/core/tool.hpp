/*
 * kanboard C++ - Tool Provider
 * 
 * A ToolProvider exposes named actions taking JSON parameters and returning
 * a ToolResult. get_agent_tools() describes each action with its parameter
 * schema so transports (the stdio server) can list them.
 */
#ifndef kanboard_CORE_TOOL_HPP
#define kanboard_CORE_TOOL_HPP

#include <kanboard/core/json.hpp>
#include <kanboard/core/result.hpp>
#include <functional>
#include <string>
#include <vector>

namespace kanboard {

class Config;

// Result of one action
struct ToolResult {
    bool success;
    Json data;
    std::string error;
    std::string code;       // error kind ("NotFound", ...), empty on success
    
    ToolResult() : success(false) {}
    
    static ToolResult ok(const Json& data) {
        ToolResult r;
        r.success = true;
        r.data = data;
        return r;
    }
    
    static ToolResult fail(const std::string& err, const std::string& code = "ValidationError") {
        ToolResult r;
        r.success = false;
        r.error = err;
        r.code = code;
        return r;
    }
    
    template<typename T>
    static ToolResult fail(const Result<T>& failed) {
        return fail(failed.error, error_code_name(failed.code));
    }
    
    // {"success": true, ...data} or {"success": false, "code", "error"}
    Json to_json() const;
};

struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "number", "boolean", "array", "object"
    std::string description;
    bool required;
    
    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

typedef std::function<ToolResult(const Json&)> ToolExecutor;

struct AgentTool {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;
    ToolExecutor execute;
    
    AgentTool() {}
    AgentTool(const std::string& n, const std::string& d, ToolExecutor e)
        : name(n), description(d), execute(e) {}
    
    // JSON Schema object for the parameters
    Json input_schema() const;
};

class ToolProvider {
public:
    ToolProvider() : initialized_(false) {}
    virtual ~ToolProvider() {}
    
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    virtual const char* version() const = 0;
    
    virtual bool init(const Config& cfg) = 0;
    virtual void shutdown() = 0;
    bool is_initialized() const { return initialized_; }
    
    virtual const char* tool_id() const = 0;
    virtual std::vector<std::string> actions() const = 0;
    virtual ToolResult execute(const std::string& action, const Json& params) = 0;
    
    // Default: one generic tool per action with a free-form params object
    virtual std::vector<AgentTool> get_agent_tools() const;

protected:
    bool initialized_;
};

} // namespace kanboard

#endif // kanboard_CORE_TOOL_HPP
