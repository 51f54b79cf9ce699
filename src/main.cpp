/*
 * kanboard C++ - Kanban boards for humans and AI agents
 * 
 * Serves the board engine as JSON-RPC 2.0 (MCP) over stdin/stdout.
 * 
 * Usage:
 *   ./kanboard [--config kanboard.json] [--db boards.db] [--log-level debug]
 * 
 * Logs go to stderr; stdout carries only protocol messages.
 */
#include <kanboard/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = kanboard::Application::instance();
    
    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }
    
    int result = app.run();
    app.shutdown();
    
    return result;
}
