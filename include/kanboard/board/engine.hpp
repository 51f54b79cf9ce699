/*
 * kanboard C++ - Board Engine
 *
 * The transition engine: task CRUD, column membership and ordering, WIP
 * limits and dependency gating, plus board management and archiving.
 *
 * Every mutation is read-modify-write against the BoardStore with a
 * compare-and-swap on Board::version (retried once, then ConflictOnWrite).
 * sweep() additionally runs under the board's LockManager key. A successful
 * mutation publishes exactly one event; failed or no-op calls publish none.
 *
 * All board arguments are instance names, resolved by the InstanceRouter.
 */
#ifndef kanboard_BOARD_ENGINE_HPP
#define kanboard_BOARD_ENGINE_HPP

#include <kanboard/board/model.hpp>
#include <kanboard/board/search.hpp>
#include <kanboard/core/result.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace kanboard {

class BoardStore;
class LockManager;
class EventBroadcaster;
class InstanceRouter;
class Config;

enum class WipPolicy {
    HARD = 0,       // reject with WipLimitExceeded
    WARN            // allow and report a warning
};

struct EngineOptions {
    std::vector<std::string> columns;           // full layout for new boards
    std::map<std::string, int> wip_limits;
    std::vector<std::string> gated_columns;     // empty = default gating
    WipPolicy wip_policy;
    Actor actor;                                // default current actor
    int64_t lock_timeout_ms;
    bool auto_create;
    int done_cap;                               // 0 = no automatic archiving
    int retention_days;
    int stale_days;
    std::string projects_root;                  // base for relative link_project folders

    EngineOptions();

    static EngineOptions from_config(const Config& config);
};

// A task together with the column that holds it
struct TaskView {
    Task task;
    std::string column;
    std::string warning;        // set when a WIP limit was exceeded in WARN mode

    Json to_json(bool with_comments = true) const;
};

struct TaskFilter {
    std::string column;         // case-insensitive
    std::string assignee;
    std::string priority;
    std::string label;
};

struct ColumnChange {
    std::string name;
    bool remove;
    int position;               // -1 = before Done
    int wip_limit;              // -1 = unchanged / unlimited for new columns

    ColumnChange() : remove(false), position(-1), wip_limit(-1) {}
};

struct MoveRequest {
    std::string task_id;
    std::string column;

    MoveRequest() {}
    MoveRequest(const std::string& id, const std::string& col) : task_id(id), column(col) {}
};

struct MoveOutcome {
    std::string task_id;
    std::string from;
    std::string to;
    bool success;
    ErrorCode code;
    std::string error;
    std::string warning;

    MoveOutcome() : success(false), code(ErrorCode::OK) {}
};

struct SweepReport {
    std::vector<MoveOutcome> outcomes;
    size_t moved;

    SweepReport() : moved(0) {}

    Json to_json() const;
};

struct ColumnStats {
    std::string name;
    size_t count;
    int wip_limit;              // 0 = unlimited
    bool gated;

    ColumnStats() : count(0), wip_limit(0), gated(false) {}
};

struct BoardStats {
    std::string board;
    size_t total;
    std::vector<ColumnStats> columns;
    std::map<std::string, size_t> by_priority;
    std::map<std::string, size_t> by_assignee;
    int64_t archived;

    BoardStats() : total(0), archived(0) {}

    Json to_json() const;
};

struct GithubIssueEvent {
    std::string action;             // "opened", "closed", ...
    int number;
    std::string title;
    std::string body;
    std::vector<std::string> labels;
    std::string repository;         // "owner/repo"
    std::string url;

    GithubIssueEvent() : number(0) {}
};

class BoardEngine {
public:
    BoardEngine(BoardStore* store,
                LockManager* locks,
                EventBroadcaster* events,
                InstanceRouter* router,
                const EngineOptions& options);

    const EngineOptions& options() const { return options_; }
    void set_wip_policy(WipPolicy policy);

    // ---- Boards ----
    Result<Board> board(const std::string& instance);
    Result<Board> create_board(const std::string& instance,
                               const std::vector<std::string>& columns,
                               const std::map<std::string, int>& wip_limits,
                               const std::string& project_root);
    Status delete_board(const std::string& instance);
    Result<std::vector<BoardMeta> > boards();
    Result<BoardMeta> active();

    // Point an existing board at a project directory. Relative folders are
    // resolved against projects_root; a missing directory is NotFound.
    Result<Board> link_project(const std::string& instance, const std::string& folder);

    // ---- Tasks ----
    Result<TaskView> add(const std::string& instance, const NewTask& spec, Actor created_by);
    Result<TaskView> move(const std::string& instance, const std::string& task_id,
                          const std::string& column);
    Result<TaskView> reorder(const std::string& instance, const std::string& task_id,
                             const std::string& column, const std::string& before_id);
    Result<TaskView> edit(const std::string& instance, const std::string& task_id,
                          const TaskPatch& patch);
    Result<TaskView> drop(const std::string& instance, const std::string& task_id);
    Result<TaskView> block(const std::string& instance, const std::string& task_id,
                           const std::string& blocked_by, bool remove);

    Result<Comment> comment(const std::string& instance, const std::string& task_id,
                            const std::string& content, Actor author);
    Result<std::vector<Comment> > comments(const std::string& instance, const std::string& task_id);
    Result<TaskView> show(const std::string& instance, const std::string& task_id);

    Result<std::vector<TaskView> > list(const std::string& instance, const TaskFilter& filter);
    Result<std::vector<TaskView> > mine(const std::string& instance);
    Result<TaskSearch> search(const std::string& instance, const std::string& query);

    // ---- Structure ----
    Result<Board> column(const std::string& instance, const ColumnChange& change);
    Result<int> clear(const std::string& instance);
    Result<BoardStats> stats(const std::string& instance);

    // All-or-nothing batch under the board lock. On failure the value still
    // carries the outcomes evaluated up to and including the failing move.
    Result<SweepReport> sweep(const std::string& instance, const std::vector<MoveRequest>& moves);

    // ---- Archive ----
    Result<std::vector<ArchivedTask> > archived(const std::string& instance);
    Result<int> archive_stale(int days);
    Result<int64_t> rotate_archive();

    // Created task id on "opened", moved task id on "closed", empty when ignored
    Result<std::string> github_issue(const GithubIssueEvent& event);

private:
    struct Mutation {
        std::string kind;
        Json payload;
        std::vector<ArchivedTask> archived;
        bool changed;
        int64_t now;

        Mutation() : changed(false), now(0) {}
    };

    typedef std::function<Status(Board&, Mutation&)> MutationFn;

    BoardStore* store_;
    LockManager* locks_;
    EventBroadcaster* events_;
    InstanceRouter* router_;
    EngineOptions options_;

    // Serializes store commits with their event publication
    std::mutex commit_mutex_;
    std::mutex options_mutex_;

    WipPolicy wip_policy();

    Board new_board(const std::string& name, int64_t now) const;
    Result<Board> open_board(const std::string& name);
    Result<Board> commit(const std::string& name, const MutationFn& fn);
    void publish(const std::string& name, const std::string& kind, const Json& payload);

    // Shared transition rules
    Status check_entry(const Board& board, const std::string& task_id,
                       const std::string& column, std::string& warning);
    Status apply_move(Board& board, const std::string& task_id,
                      const std::string& column, int64_t now,
                      MoveOutcome& outcome);
    void archive_done_overflow(Board& board, Mutation& m);

    Result<TaskView> view_of(const Result<Board>& board, const std::string& task_id,
                             const std::string& warning);
};

// Canonical column name, exact match first then case-insensitive; empty if unknown
std::string resolve_column(const Board& board, const std::string& name);

const char* wip_policy_name(WipPolicy policy);

} // namespace kanboard

#endif // kanboard_BOARD_ENGINE_HPP
