/*
 * kanboard C++ - Board Model
 *
 * Plain data for boards, columns, tasks and comments, plus the JSON
 * document form used by the stores and the tool surface.
 *
 * Column membership is stored once: a task's column is whichever
 * Column::task_ids contains its id.
 */
#ifndef kanboard_BOARD_MODEL_HPP
#define kanboard_BOARD_MODEL_HPP

#include <kanboard/core/json.hpp>
#include <kanboard/core/result.hpp>
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace kanboard {

// Fixed anchor columns
extern const char* const BACKLOG_COLUMN;
extern const char* const DONE_COLUMN;

enum class Priority {
    LOW = 0,
    MEDIUM,
    HIGH
};

enum class Assignee {
    UNASSIGNED = 0,
    HUMAN,
    AI
};

// Who performed an action (comment author, task creator)
enum class Actor {
    HUMAN = 0,
    AI
};

const char* priority_name(Priority p);
const char* assignee_name(Assignee a);
const char* actor_name(Actor a);

bool parse_priority(const std::string& s, Priority& out);
bool parse_assignee(const std::string& s, Assignee& out);
bool parse_actor(const std::string& s, Actor& out);

// Task ids (and ids referenced by blockedBy) must match [A-Za-z0-9_-]{1,64}
bool is_valid_task_id(const std::string& id);

struct Comment {
    std::string id;
    std::string task_id;
    Actor author;
    std::string content;
    int64_t created_at;         // unix ms

    Comment() : author(Actor::AI), created_at(0) {}
};

struct Task {
    std::string id;
    std::string title;
    std::string description;
    Priority priority;
    Assignee assignee;
    std::vector<std::string> labels;
    std::string context;                    // AI working memory
    std::vector<std::string> links;         // related files / URLs
    std::vector<std::string> blocked_by;
    int auto_pull_threshold;                // -1 = unset
    int auto_release_minutes;               // -1 = unset
    Actor created_by;
    std::vector<Comment> comments;
    int64_t created_at;
    int64_t updated_at;

    Task()
        : priority(Priority::MEDIUM)
        , assignee(Assignee::UNASSIGNED)
        , auto_pull_threshold(-1)
        , auto_release_minutes(-1)
        , created_by(Actor::AI)
        , created_at(0)
        , updated_at(0) {}
};

struct Column {
    std::string name;
    std::vector<std::string> task_ids;      // display order
    int wip_limit;                          // 0 = unlimited

    Column() : wip_limit(0) {}
    explicit Column(const std::string& n, int limit = 0) : name(n), wip_limit(limit) {}

    bool has_limit() const { return wip_limit > 0; }
};

struct Board {
    std::string name;
    std::string project_root;
    std::vector<Column> columns;
    std::map<std::string, Task> tasks;
    std::vector<std::string> gated_columns;
    bool custom_gating;                     // gated_columns set explicitly, not derived from the layout
    int64_t version;                        // store revision, 0 = never saved
    int64_t created_at;
    int64_t updated_at;

    Board() : custom_gating(false), version(0), created_at(0), updated_at(0) {}

    Column* find_column(const std::string& column_name);
    const Column* find_column(const std::string& column_name) const;
    int column_index(const std::string& column_name) const;

    Task* find_task(const std::string& task_id);
    const Task* find_task(const std::string& task_id) const;

    // Name of the column holding the task, empty if the task is absent
    std::string column_of(const std::string& task_id) const;

    bool is_gated(const std::string& column_name) const;

    // Call after the column layout changed. Default gating follows the
    // columns next to Done; explicit gating only loses removed columns.
    void refresh_gating();

    // Tasks in display order (column order, then position)
    std::vector<const Task*> ordered_tasks() const;

    // Every task sits in exactly one column and every listed id exists
    bool check_invariants(std::string& error) const;
};

// Archived task as kept by a store
struct ArchivedTask {
    Task task;
    std::string column;
    int64_t archived_at;

    ArchivedTask() : archived_at(0) {}
};

// Summary row for board listings
struct BoardMeta {
    std::string name;
    std::string project_root;
    size_t task_count;
    int64_t created_at;
    int64_t updated_at;

    BoardMeta() : task_count(0), created_at(0), updated_at(0) {}
};

// Default workflow: Backlog, Todo, In Progress, Review, Done
std::vector<std::string> default_column_names();

// Default gating: Done and the column right before it (unless that is Backlog)
std::vector<std::string> default_gated_columns(const std::vector<Column>& columns);

// Build an empty board. Backlog is forced first and Done last.
Board make_board(const std::string& name,
                 const std::vector<std::string>& column_names,
                 int64_t now_ms);

// ============================================================================
// Input structs for add / edit
// ============================================================================

struct NewTask {
    std::string title;
    std::string description;
    std::string column;                     // empty = Backlog
    Priority priority;
    Assignee assignee;
    std::vector<std::string> labels;
    std::string context;
    std::vector<std::string> links;
    std::vector<std::string> blocked_by;
    int auto_pull_threshold;
    int auto_release_minutes;

    NewTask()
        : priority(Priority::MEDIUM)
        , assignee(Assignee::UNASSIGNED)
        , auto_pull_threshold(-1)
        , auto_release_minutes(-1) {}
};

// Partial update. Only fields with their has_ flag set are applied.
struct TaskPatch {
    bool has_title;
    std::string title;
    bool has_description;
    std::string description;
    bool has_priority;
    Priority priority;
    bool has_assignee;
    Assignee assignee;
    bool has_labels;
    std::vector<std::string> labels;
    bool has_context;
    std::string context;
    bool has_links;
    std::vector<std::string> links;
    bool has_blocked_by;
    std::vector<std::string> blocked_by;
    bool has_auto_pull_threshold;
    int auto_pull_threshold;
    bool has_auto_release_minutes;
    int auto_release_minutes;

    TaskPatch()
        : has_title(false), has_description(false)
        , has_priority(false), priority(Priority::MEDIUM)
        , has_assignee(false), assignee(Assignee::UNASSIGNED)
        , has_labels(false), has_context(false), has_links(false)
        , has_blocked_by(false)
        , has_auto_pull_threshold(false), auto_pull_threshold(-1)
        , has_auto_release_minutes(false), auto_release_minutes(-1) {}

    bool empty() const {
        return !has_title && !has_description && !has_priority && !has_assignee &&
               !has_labels && !has_context && !has_links && !has_blocked_by &&
               !has_auto_pull_threshold && !has_auto_release_minutes;
    }
};

// Parse tool parameters. Keys not in the field list or in `passthrough`
// (e.g. "id", "board") are rejected with ValidationError.
Result<NewTask> parse_new_task(const Json& params, const std::vector<std::string>& passthrough);
Result<TaskPatch> parse_task_patch(const Json& params, const std::vector<std::string>& passthrough);

// Reject syntactically invalid ids; unknown ids are fine
Status validate_blocked_by(const std::vector<std::string>& ids);

// ============================================================================
// JSON
// ============================================================================

Json comment_to_json(const Comment& c);
Json task_to_json(const Task& t, const std::string& column, bool with_comments = true);
Json archived_to_json(const ArchivedTask& a);

// Storage document (columns hold ids, tasks listed separately)
Json board_to_document(const Board& b);
bool board_from_document(const Json& doc, Board& out, std::string& error);

bool task_from_json(const Json& j, Task& out, std::string& error);

// Client view: columns with their tasks embedded in display order
Json board_to_view(const Board& b);

Json board_meta_to_json(const BoardMeta& m);

} // namespace kanboard

#endif // kanboard_BOARD_MODEL_HPP
