/*
 * kanboard C++ - Stdio JSON-RPC Server Implementation
 */
#include <kanboard/core/stdio_server.hpp>
#include <kanboard/board/events.hpp>
#include <kanboard/core/logger.hpp>

#include <istream>
#include <ostream>

namespace kanboard {

namespace {

const char* PROTOCOL_VERSION = "2024-11-05";

} // anonymous namespace

StdioServer::StdioServer(ToolProvider& provider,
                         EventBroadcaster* events,
                         std::istream& in,
                         std::ostream& out)
    : provider_(provider)
    , events_(events)
    , in_(in)
    , out_(out)
    , running_(false)
    , subscription_(0) {
    std::vector<AgentTool> tools = provider_.get_agent_tools();
    for (size_t i = 0; i < tools.size(); ++i) {
        tools_[tools[i].name] = tools[i];
    }

    if (events_) {
        StdioServer* self = this;
        subscription_ = events_->subscribe("", [self](const BoardEvent& event) {
            self->notify("notifications/board", event.to_json());
        });
    }
}

StdioServer::~StdioServer() {
    if (events_ && subscription_ != 0) {
        events_->unsubscribe(subscription_);
    }
}

// ============================================================================
// Transport
// ============================================================================

size_t StdioServer::run() {
    running_.store(true);
    size_t handled = 0;
    std::string line;

    LOG_INFO("[Server] Serving %zu tools on stdio", tools_.size());

    while (running_.load() && std::getline(in_, line)) {
        if (line.empty() || line == "\r") continue;

        Json response = handle_line(line);
        if (!response.is_null()) {
            write(response);
        }
        handled++;
    }

    running_.store(false);
    LOG_INFO("[Server] Input closed after %zu requests", handled);
    return handled;
}

Json StdioServer::handle_line(const std::string& line) {
    Json request;
    try {
        request = Json::parse(line);
    } catch (const Json::parse_error& e) {
        LOG_WARN("[Server] Unparseable request: %s", e.what());
        return make_error(nullptr, rpc_error::PARSE_ERROR,
                          std::string("Parse error: ") + e.what());
    }
    return handle_request(request);
}

void StdioServer::write(const Json& message) {
    const std::string text = message.dump();
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << text << "\n";
    out_.flush();
}

void StdioServer::notify(const std::string& method, const Json& params) {
    Json message;
    message["jsonrpc"] = "2.0";
    message["method"] = method;
    message["params"] = params;
    write(message);
}

Json StdioServer::make_result(const Json& id, const Json& result) {
    Json response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json StdioServer::make_error(const Json& id, int code, const std::string& message,
                             const Json& data) {
    Json error;
    error["code"] = code;
    error["message"] = message;
    if (!data.is_null()) error["data"] = data;

    Json response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"] = error;
    return response;
}

// ============================================================================
// Dispatch
// ============================================================================

Json StdioServer::handle_request(const Json& request) {
    if (!request.is_object()) {
        return make_error(nullptr, rpc_error::INVALID_REQUEST, "Request must be an object");
    }

    const Json id = request.contains("id") ? request["id"] : Json();
    const bool is_notification = !request.contains("id");

    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        return make_error(id, rpc_error::INVALID_REQUEST, "Missing or invalid jsonrpc version");
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        return make_error(id, rpc_error::INVALID_REQUEST, "Missing or invalid method");
    }

    const std::string method = request["method"].get<std::string>();
    Json params = request.contains("params") ? request["params"] : Json::object();
    if (params.is_null()) params = Json::object();
    if (!params.is_object()) {
        return make_error(id, rpc_error::INVALID_PARAMS, "params must be an object");
    }

    LOG_DEBUG("[Server] %s", method.c_str());

    Json response;
    if (method == "initialize") {
        response = handle_initialize(id);
    } else if (method == "initialized" || method == "notifications/initialized") {
        return Json();
    } else if (method == "ping") {
        response = make_result(id, Json::object());
    } else if (method == "tools/list") {
        response = handle_tools_list(id);
    } else if (method == "tools/call") {
        response = handle_tools_call(params, id);
    } else if (method == "shutdown") {
        running_.store(false);
        response = make_result(id, Json::object());
    } else if (tools_.count(method)) {
        response = handle_action(method, params, id);
    } else {
        response = make_error(id, rpc_error::METHOD_NOT_FOUND, "Unknown method: " + method);
    }

    return is_notification ? Json() : response;
}

Json StdioServer::handle_initialize(const Json& id) {
    Json capabilities;
    capabilities["tools"] = {{"listChanged", false}};

    Json server_info;
    server_info["name"] = provider_.name();
    server_info["version"] = provider_.version();

    Json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;
    return make_result(id, result);
}

Json StdioServer::handle_tools_list(const Json& id) {
    Json tools = Json::array();
    for (std::map<std::string, AgentTool>::const_iterator it = tools_.begin();
         it != tools_.end(); ++it) {
        Json entry;
        entry["name"] = it->second.name;
        entry["description"] = it->second.description;
        entry["inputSchema"] = it->second.input_schema();
        tools.push_back(entry);
    }
    Json result;
    result["tools"] = tools;
    return make_result(id, result);
}

ToolResult StdioServer::call_tool(const AgentTool& tool, const Json& arguments) {
    if (tool.execute) return tool.execute(arguments);
    return provider_.execute(tool.name, arguments);
}

Json StdioServer::handle_tools_call(const Json& params, const Json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return make_error(id, rpc_error::INVALID_PARAMS, "Missing tool name");
    }

    const std::string name = params["name"].get<std::string>();
    Json arguments = params.contains("arguments") ? params["arguments"] : Json::object();
    if (arguments.is_null()) arguments = Json::object();

    std::map<std::string, AgentTool>::const_iterator it = tools_.find(name);
    if (it == tools_.end()) {
        return make_error(id, rpc_error::TOOL_NOT_FOUND, "Unknown tool: " + name);
    }

    try {
        ToolResult result = call_tool(it->second, arguments);
        Json payload = result.to_json();

        Json content = Json::array();
        Json text;
        text["type"] = "text";
        text["text"] = payload.dump();
        content.push_back(text);

        Json response;
        response["content"] = content;
        response["structuredContent"] = payload;
        response["isError"] = !result.success;
        return make_result(id, response);
    } catch (const std::exception& e) {
        LOG_ERROR("[Server] Tool %s threw: %s", name.c_str(), e.what());
        return make_error(id, rpc_error::TOOL_EXECUTION_ERROR,
                          std::string("Tool execution failed: ") + e.what());
    }
}

Json StdioServer::handle_action(const std::string& action, const Json& params, const Json& id) {
    try {
        ToolResult result = call_tool(tools_[action], params);
        if (result.success) {
            return make_result(id, result.to_json());
        }
        return make_error(id, rpc_error::TOOL_EXECUTION_ERROR, result.error, result.to_json());
    } catch (const std::exception& e) {
        LOG_ERROR("[Server] Action %s threw: %s", action.c_str(), e.what());
        return make_error(id, rpc_error::INTERNAL_ERROR,
                          std::string("Action failed: ") + e.what());
    }
}

} // namespace kanboard
