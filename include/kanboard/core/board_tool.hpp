/*
 * kanboard C++ - Board Tool
 * 
 * ToolProvider exposing the board engine as JSON actions.
 * 
 * Task actions:    add, move, reorder, edit, drop, block, comment,
 *                  comments, show, list, mine, search
 * Board actions:   board, column, clear, stats, sweep, archived
 * Management:      boards, active, create_board, delete_board,
 *                  archive_stale, github_issue
 * 
 * Every action accepts an optional "board" (instance name) and "actor"
 * ("human" or "ai", defaults to the configured actor).
 */
#ifndef kanboard_CORE_BOARD_TOOL_HPP
#define kanboard_CORE_BOARD_TOOL_HPP

#include <kanboard/core/tool.hpp>
#include <kanboard/board/engine.hpp>
#include <string>
#include <vector>

namespace kanboard {

class BoardTool : public ToolProvider {
public:
    explicit BoardTool(BoardEngine* engine);
    ~BoardTool() override;
    
    const char* name() const override { return "kanboard"; }
    const char* description() const override {
        return "Kanban boards shared by humans and AI agents";
    }
    const char* version() const override { return "1.0.0"; }
    
    bool init(const Config& cfg) override;
    void shutdown() override;
    
    const char* tool_id() const override { return "kanboard"; }
    std::vector<std::string> actions() const override;
    ToolResult execute(const std::string& action, const Json& params) override;
    
    std::vector<AgentTool> get_agent_tools() const override;

private:
    BoardEngine* engine_;
    Actor default_actor_;
    
    ToolResult do_add(const Json& params);
    ToolResult do_move(const Json& params);
    ToolResult do_reorder(const Json& params);
    ToolResult do_edit(const Json& params);
    ToolResult do_drop(const Json& params);
    ToolResult do_block(const Json& params);
    ToolResult do_comment(const Json& params);
    ToolResult do_comments(const Json& params);
    ToolResult do_show(const Json& params);
    ToolResult do_list(const Json& params);
    ToolResult do_mine(const Json& params);
    ToolResult do_search(const Json& params);
    ToolResult do_board(const Json& params);
    ToolResult do_column(const Json& params);
    ToolResult do_clear(const Json& params);
    ToolResult do_stats(const Json& params);
    ToolResult do_sweep(const Json& params);
    ToolResult do_archived(const Json& params);
    ToolResult do_boards(const Json& params);
    ToolResult do_active(const Json& params);
    ToolResult do_link_project(const Json& params);
    ToolResult do_create_board(const Json& params);
    ToolResult do_delete_board(const Json& params);
    ToolResult do_archive_stale(const Json& params);
    ToolResult do_github_issue(const Json& params);
    
    // Resolve "actor" (falls back to the configured actor)
    bool actor_of(const Json& params, const char* key, Actor& out, std::string& error) const;
};

} // namespace kanboard

#endif // kanboard_CORE_BOARD_TOOL_HPP
