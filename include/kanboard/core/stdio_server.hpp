/*
 * kanboard C++ - Stdio JSON-RPC Server
 *
 * Line-delimited JSON-RPC 2.0 over a pair of streams (stdin/stdout in the
 * application). Implements the MCP methods initialize, tools/list,
 * tools/call, ping and shutdown, and accepts any tool action directly as a
 * method name. Board events are written as "notifications/board" messages.
 */
#ifndef kanboard_CORE_STDIO_SERVER_HPP
#define kanboard_CORE_STDIO_SERVER_HPP

#include <kanboard/core/tool.hpp>
#include <kanboard/core/json.hpp>
#include <atomic>
#include <iosfwd>
#include <map>
#include <mutex>
#include <string>
#include <cstdint>

namespace kanboard {

class EventBroadcaster;

namespace rpc_error {
    const int PARSE_ERROR = -32700;
    const int INVALID_REQUEST = -32600;
    const int METHOD_NOT_FOUND = -32601;
    const int INVALID_PARAMS = -32602;
    const int INTERNAL_ERROR = -32603;
    const int TOOL_NOT_FOUND = -32001;
    const int TOOL_EXECUTION_ERROR = -32002;
}

class StdioServer {
public:
    // events may be null (no notifications)
    StdioServer(ToolProvider& provider,
                EventBroadcaster* events,
                std::istream& in,
                std::ostream& out);
    ~StdioServer();

    // Serve until end of input or a "shutdown" request. Returns the number
    // of requests handled.
    size_t run();
    void stop() { running_.store(false); }
    bool is_running() const { return running_.load(); }

    // Null for notifications (requests without an id)
    Json handle_request(const Json& request);
    Json handle_line(const std::string& line);

    // Write one JSON-RPC notification
    void notify(const std::string& method, const Json& params);

    static Json make_result(const Json& id, const Json& result);
    static Json make_error(const Json& id, int code, const std::string& message,
                           const Json& data = Json());

private:
    ToolProvider& provider_;
    EventBroadcaster* events_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_;
    uint64_t subscription_;

    std::map<std::string, AgentTool> tools_;
    std::mutex out_mutex_;

    void write(const Json& message);

    Json handle_initialize(const Json& id);
    Json handle_tools_list(const Json& id);
    Json handle_tools_call(const Json& params, const Json& id);
    Json handle_action(const std::string& action, const Json& params, const Json& id);
    ToolResult call_tool(const AgentTool& tool, const Json& arguments);
};

} // namespace kanboard

#endif // kanboard_CORE_STDIO_SERVER_HPP
