/*
 * kanboard C++ - Board Tool Implementation
 *
 * Parameter parsing and JSON shaping around BoardEngine. Engine errors
 * come back as {"success": false, "code": "<Kind>", "error": "..."}.
 */
#include <kanboard/core/board_tool.hpp>
#include <kanboard/core/config.hpp>
#include <kanboard/core/logger.hpp>
#include <kanboard/core/utils.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace kanboard {

namespace {

std::string str_param(const Json& params, const char* key) {
    if (params.is_object() && params.contains(key) && params[key].is_string()) {
        return params[key].get<std::string>();
    }
    return "";
}

bool bool_param(const Json& params, const char* key, bool default_val) {
    if (!params.is_object() || !params.contains(key)) return default_val;
    const Json& v = params[key];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) {
        std::string s = to_lower(v.get<std::string>());
        return s == "true" || s == "1" || s == "yes";
    }
    if (v.is_number_integer()) return v.get<int>() != 0;
    return default_val;
}

// Integer or numeric string that fits an int; false when present but malformed
bool int_param(const Json& params, const char* key, int& out) {
    if (!params.is_object() || !params.contains(key) || params[key].is_null()) return true;
    const Json& v = params[key];
    long long n = 0;
    if (v.is_number_unsigned()) {
        if (v.get<unsigned long long>() > static_cast<unsigned long long>(INT_MAX)) return false;
        n = static_cast<long long>(v.get<unsigned long long>());
    } else if (v.is_number_integer()) {
        n = v.get<long long>();
    } else if (v.is_string()) {
        const std::string s = trim(v.get<std::string>());
        char* end = nullptr;
        errno = 0;
        n = strtoll(s.c_str(), &end, 10);
        if (s.empty() || *end != '\0' || errno == ERANGE) return false;
    } else {
        return false;
    }
    if (n < INT_MIN || n > INT_MAX) return false;
    out = static_cast<int>(n);
    return true;
}

std::string board_param(const Json& params) {
    return str_param(params, "board");
}

Json task_list_json(const std::vector<TaskView>& tasks) {
    Json arr = Json::array();
    for (size_t i = 0; i < tasks.size(); ++i) arr.push_back(tasks[i].to_json(false));
    Json data;
    data["count"] = tasks.size();
    data["tasks"] = arr;
    return data;
}

Json task_json(const TaskView& view) {
    Json data;
    data["task"] = view.to_json();
    return data;
}

std::vector<std::string> names_of(const Json& v) {
    std::vector<std::string> out;
    if (v.is_string()) {
        std::vector<std::string> parts = split(v.get<std::string>(), ',');
        for (size_t i = 0; i < parts.size(); ++i) {
            std::string p = trim(parts[i]);
            if (!p.empty()) out.push_back(p);
        }
    } else if (v.is_array()) {
        for (size_t i = 0; i < v.size(); ++i) {
            if (v[i].is_string()) out.push_back(v[i].get<std::string>());
        }
    }
    return out;
}

ToolResult missing(const char* param) {
    return ToolResult::fail(std::string("Missing required parameter: ") + param);
}

} // anonymous namespace

// ============================================================================
// Constructor / Plugin interface
// ============================================================================

BoardTool::BoardTool(BoardEngine* engine)
    : engine_(engine)
    , default_actor_(engine ? engine->options().actor : Actor::AI) {}

BoardTool::~BoardTool() {
    shutdown();
}

bool BoardTool::init(const Config& cfg) {
    if (!engine_) {
        LOG_ERROR("[BoardTool] No board engine attached");
        return false;
    }
    std::string actor = cfg.get_string("actor", actor_name(engine_->options().actor));
    if (!parse_actor(actor, default_actor_)) {
        LOG_WARN("[BoardTool] Unknown actor '%s', using ai", actor.c_str());
        default_actor_ = Actor::AI;
    }
    initialized_ = true;
    LOG_INFO("[BoardTool] Initialized (actor=%s, %zu actions)",
             actor_name(default_actor_), actions().size());
    return true;
}

void BoardTool::shutdown() {
    initialized_ = false;
}

bool BoardTool::actor_of(const Json& params, const char* key, Actor& out, std::string& error) const {
    std::string value = str_param(params, key);
    if (value.empty()) {
        out = default_actor_;
        return true;
    }
    if (!parse_actor(value, out)) {
        error = std::string(key) + " must be human or ai";
        return false;
    }
    return true;
}

std::vector<std::string> BoardTool::actions() const {
    std::vector<std::string> acts;
    acts.push_back("add");
    acts.push_back("move");
    acts.push_back("reorder");
    acts.push_back("edit");
    acts.push_back("drop");
    acts.push_back("block");
    acts.push_back("comment");
    acts.push_back("comments");
    acts.push_back("show");
    acts.push_back("list");
    acts.push_back("mine");
    acts.push_back("search");
    acts.push_back("board");
    acts.push_back("column");
    acts.push_back("clear");
    acts.push_back("stats");
    acts.push_back("sweep");
    acts.push_back("archived");
    acts.push_back("boards");
    acts.push_back("active");
    acts.push_back("create_board");
    acts.push_back("delete_board");
    acts.push_back("link_project");
    acts.push_back("archive_stale");
    acts.push_back("github_issue");
    return acts;
}

ToolResult BoardTool::execute(const std::string& action, const Json& params) {
    if (!initialized_) {
        return ToolResult::fail("Board tool not initialized", "StorageError");
    }
    if (!params.is_null() && !params.is_object()) {
        return ToolResult::fail("Parameters must be a JSON object");
    }
    const Json args = params.is_null() ? Json::object() : params;

    LOG_DEBUG("[BoardTool] %s %s", action.c_str(), args.dump().c_str());

    if (action == "add")           return do_add(args);
    if (action == "move")          return do_move(args);
    if (action == "reorder")       return do_reorder(args);
    if (action == "edit")          return do_edit(args);
    if (action == "drop")          return do_drop(args);
    if (action == "block")         return do_block(args);
    if (action == "comment")       return do_comment(args);
    if (action == "comments")      return do_comments(args);
    if (action == "show")          return do_show(args);
    if (action == "list")          return do_list(args);
    if (action == "mine")          return do_mine(args);
    if (action == "search")        return do_search(args);
    if (action == "board")         return do_board(args);
    if (action == "column")        return do_column(args);
    if (action == "clear")         return do_clear(args);
    if (action == "stats")         return do_stats(args);
    if (action == "sweep")         return do_sweep(args);
    if (action == "archived")      return do_archived(args);
    if (action == "boards")        return do_boards(args);
    if (action == "active")        return do_active(args);
    if (action == "link_project")  return do_link_project(args);
    if (action == "create_board")  return do_create_board(args);
    if (action == "delete_board")  return do_delete_board(args);
    if (action == "archive_stale") return do_archive_stale(args);
    if (action == "github_issue")  return do_github_issue(args);

    return ToolResult::fail("Unknown action: " + action, "NotFound");
}

// ============================================================================
// Task actions
// ============================================================================

ToolResult BoardTool::do_add(const Json& params) {
    std::vector<std::string> passthrough;
    passthrough.push_back("board");
    passthrough.push_back("actor");

    Result<NewTask> spec = parse_new_task(params, passthrough);
    if (!spec.success) return ToolResult::fail(spec);

    Actor actor;
    std::string error;
    if (!actor_of(params, "actor", actor, error)) return ToolResult::fail(error);

    Result<TaskView> added = engine_->add(board_param(params), spec.value, actor);
    if (!added.success) return ToolResult::fail(added);
    return ToolResult::ok(task_json(added.value));
}

ToolResult BoardTool::do_move(const Json& params) {
    std::string id = str_param(params, "id");
    std::string column = str_param(params, "column");
    if (id.empty()) return missing("id");
    if (column.empty()) return missing("column");

    Result<TaskView> moved = engine_->move(board_param(params), id, column);
    if (!moved.success) return ToolResult::fail(moved);
    return ToolResult::ok(task_json(moved.value));
}

ToolResult BoardTool::do_reorder(const Json& params) {
    std::string id = str_param(params, "id");
    std::string column = str_param(params, "column");
    if (id.empty()) return missing("id");
    if (column.empty()) return missing("column");

    Result<TaskView> reordered = engine_->reorder(board_param(params), id, column,
                                                  str_param(params, "beforeId"));
    if (!reordered.success) return ToolResult::fail(reordered);
    return ToolResult::ok(task_json(reordered.value));
}

ToolResult BoardTool::do_edit(const Json& params) {
    std::string id = str_param(params, "id");
    if (id.empty()) return missing("id");

    std::vector<std::string> passthrough;
    passthrough.push_back("id");
    passthrough.push_back("board");
    passthrough.push_back("actor");

    Result<TaskPatch> patch = parse_task_patch(params, passthrough);
    if (!patch.success) return ToolResult::fail(patch);

    Result<TaskView> edited = engine_->edit(board_param(params), id, patch.value);
    if (!edited.success) return ToolResult::fail(edited);
    return ToolResult::ok(task_json(edited.value));
}

ToolResult BoardTool::do_drop(const Json& params) {
    std::string id = str_param(params, "id");
    if (id.empty()) return missing("id");

    Result<TaskView> dropped = engine_->drop(board_param(params), id);
    if (!dropped.success) return ToolResult::fail(dropped);

    Json data = task_json(dropped.value);
    data["removed"] = true;
    return ToolResult::ok(data);
}

ToolResult BoardTool::do_block(const Json& params) {
    std::string id = str_param(params, "id");
    std::string blocked_by = str_param(params, "blockedBy");
    if (id.empty()) return missing("id");
    if (blocked_by.empty()) return missing("blockedBy");

    Result<TaskView> updated = engine_->block(board_param(params), id, blocked_by,
                                              bool_param(params, "remove", false));
    if (!updated.success) return ToolResult::fail(updated);
    return ToolResult::ok(task_json(updated.value));
}

ToolResult BoardTool::do_comment(const Json& params) {
    std::string id = str_param(params, "id");
    std::string content = str_param(params, "content");
    if (id.empty()) return missing("id");
    if (trim(content).empty()) return missing("content");

    Actor author;
    std::string error;
    const char* key = str_param(params, "author").empty() ? "actor" : "author";
    if (!actor_of(params, key, author, error)) return ToolResult::fail(error);

    Result<Comment> added = engine_->comment(board_param(params), id, content, author);
    if (!added.success) return ToolResult::fail(added);

    Json data;
    data["comment"] = comment_to_json(added.value);
    return ToolResult::ok(data);
}

ToolResult BoardTool::do_comments(const Json& params) {
    std::string id = str_param(params, "id");
    if (id.empty()) return missing("id");

    Result<std::vector<Comment> > all = engine_->comments(board_param(params), id);
    if (!all.success) return ToolResult::fail(all);

    Json arr = Json::array();
    for (size_t i = 0; i < all.value.size(); ++i) arr.push_back(comment_to_json(all.value[i]));
    Json data;
    data["taskId"] = id;
    data["count"] = all.value.size();
    data["comments"] = arr;
    return ToolResult::ok(data);
}

ToolResult BoardTool::do_show(const Json& params) {
    std::string id = str_param(params, "id");
    if (id.empty()) return missing("id");

    Result<TaskView> shown = engine_->show(board_param(params), id);
    if (!shown.success) return ToolResult::fail(shown);
    return ToolResult::ok(task_json(shown.value));
}

ToolResult BoardTool::do_list(const Json& params) {
    TaskFilter filter;
    filter.column = str_param(params, "column");
    filter.assignee = str_param(params, "assignee");
    filter.priority = str_param(params, "priority");
    filter.label = str_param(params, "label");

    Result<std::vector<TaskView> > tasks = engine_->list(board_param(params), filter);
    if (!tasks.success) return ToolResult::fail(tasks);
    return ToolResult::ok(task_list_json(tasks.value));
}

ToolResult BoardTool::do_mine(const Json& params) {
    Result<std::vector<TaskView> > tasks = engine_->mine(board_param(params));
    if (!tasks.success) return ToolResult::fail(tasks);
    return ToolResult::ok(task_list_json(tasks.value));
}

ToolResult BoardTool::do_search(const Json& params) {
    std::string query = str_param(params, "query");
    if (trim(query).empty()) return missing("query");

    Result<TaskSearch> found = engine_->search(board_param(params), query);
    if (!found.success) return ToolResult::fail(found);

    Json arr = Json::array();
    for (TaskSearch::const_iterator it = found.value.begin(); it != found.value.end(); ++it) {
        arr.push_back(task_to_json(*it, it.column(), false));
    }
    Json data;
    data["query"] = query;
    data["count"] = arr.size();
    data["tasks"] = arr;
    return ToolResult::ok(data);
}

// ============================================================================
// Board actions
// ============================================================================

ToolResult BoardTool::do_board(const Json& params) {
    Result<Board> b = engine_->board(board_param(params));
    if (!b.success) return ToolResult::fail(b);
    return ToolResult::ok(board_to_view(b.value));
}

ToolResult BoardTool::do_column(const Json& params) {
    ColumnChange change;
    change.name = str_param(params, "name");
    if (trim(change.name).empty()) return missing("name");
    change.remove = bool_param(params, "remove", false);
    if (!int_param(params, "position", change.position)) {
        return ToolResult::fail("position must be an integer");
    }
    if (!int_param(params, "wipLimit", change.wip_limit) || change.wip_limit < -1) {
        return ToolResult::fail("wipLimit must be zero or a positive integer");
    }

    Result<Board> updated = engine_->column(board_param(params), change);
    if (!updated.success) return ToolResult::fail(updated);

    Json data;
    data["board"] = board_to_view(updated.value);
    return ToolResult::ok(data);
}

ToolResult BoardTool::do_clear(const Json& params) {
    Result<int> cleared = engine_->clear(board_param(params));
    if (!cleared.success) return ToolResult::fail(cleared);

    Json data;
    data["archived"] = cleared.value;
    return ToolResult::ok(data);
}

ToolResult BoardTool::do_stats(const Json& params) {
    Result<BoardStats> s = engine_->stats(board_param(params));
    if (!s.success) return ToolResult::fail(s);
    return ToolResult::ok(s.value.to_json());
}

ToolResult BoardTool::do_sweep(const Json& params) {
    std::vector<MoveRequest> moves;

    if (params.contains("moves")) {
        const Json& list = params["moves"];
        if (!list.is_array()) return ToolResult::fail("moves must be an array of {id, column}");
        for (size_t i = 0; i < list.size(); ++i) {
            std::string id = str_param(list[i], "id");
            if (id.empty()) id = str_param(list[i], "taskId");
            std::string column = str_param(list[i], "column");
            if (id.empty() || column.empty()) {
                return ToolResult::fail("moves[" + std::to_string(i) + "] needs id and column");
            }
            moves.push_back(MoveRequest(id, column));
        }
    } else if (params.contains("taskIds")) {
        std::string column = str_param(params, "column");
        if (column.empty()) return missing("column");
        std::vector<std::string> ids = names_of(params["taskIds"]);
        for (size_t i = 0; i < ids.size(); ++i) moves.push_back(MoveRequest(ids[i], column));
    } else {
        return missing("moves");
    }

    Result<SweepReport> swept = engine_->sweep(board_param(params), moves);
    if (!swept.success) {
        ToolResult r = ToolResult::fail(swept);
        r.data = swept.value.to_json();
        r.data["rolledBack"] = true;
        return r;
    }
    return ToolResult::ok(swept.value.to_json());
}

ToolResult BoardTool::do_archived(const Json& params) {
    Result<std::vector<ArchivedTask> > tasks = engine_->archived(board_param(params));
    if (!tasks.success) return ToolResult::fail(tasks);

    Json arr = Json::array();
    for (size_t i = 0; i < tasks.value.size(); ++i) arr.push_back(archived_to_json(tasks.value[i]));
    Json data;
    data["count"] = tasks.value.size();
    data["tasks"] = arr;
    return ToolResult::ok(data);
}

// ============================================================================
// Management
// ============================================================================

ToolResult BoardTool::do_boards(const Json& params) {
    (void)params;
    Result<std::vector<BoardMeta> > all = engine_->boards();
    if (!all.success) return ToolResult::fail(all);

    Json arr = Json::array();
    for (size_t i = 0; i < all.value.size(); ++i) arr.push_back(board_meta_to_json(all.value[i]));
    Json data;
    data["count"] = all.value.size();
    data["boards"] = arr;
    return ToolResult::ok(data);
}

ToolResult BoardTool::do_active(const Json& params) {
    (void)params;
    Result<BoardMeta> meta = engine_->active();
    if (!meta.success) return ToolResult::fail(meta);

    Json data;
    data["board"] = board_meta_to_json(meta.value);
    return ToolResult::ok(data);
}

ToolResult BoardTool::do_create_board(const Json& params) {
    std::string board_name = str_param(params, "name");
    if (board_name.empty()) board_name = board_param(params);
    if (trim(board_name).empty()) return missing("name");

    std::vector<std::string> columns;
    if (params.contains("columns")) columns = names_of(params["columns"]);

    std::map<std::string, int> limits;
    if (params.contains("wipLimits")) {
        const Json& l = params["wipLimits"];
        if (!l.is_object()) return ToolResult::fail("wipLimits must be an object of column -> limit");
        for (Json::const_iterator it = l.begin(); it != l.end(); ++it) {
            if (!it.value().is_number_integer() || it.value().get<int>() < 0) {
                return ToolResult::fail("wipLimits." + it.key() + " must be a non-negative integer");
            }
            limits[it.key()] = it.value().get<int>();
        }
    }

    Result<Board> created = engine_->create_board(board_name, columns, limits,
                                                  str_param(params, "projectRoot"));
    if (!created.success) return ToolResult::fail(created);

    Json data;
    data["board"] = board_to_view(created.value);
    return ToolResult::ok(data);
}

ToolResult BoardTool::do_delete_board(const Json& params) {
    std::string board_name = str_param(params, "name");
    if (board_name.empty()) board_name = board_param(params);
    if (trim(board_name).empty()) return missing("name");

    Status removed = engine_->delete_board(board_name);
    if (!removed.success) return ToolResult::fail(removed);

    Json data;
    data["deleted"] = board_name;
    return ToolResult::ok(data);
}

ToolResult BoardTool::do_link_project(const Json& params) {
    std::string folder = str_param(params, "folder");
    if (trim(folder).empty()) return missing("folder");

    Result<Board> linked = engine_->link_project(board_param(params), folder);
    if (!linked.success) return ToolResult::fail(linked);

    Json data;
    data["board"] = linked.value.name;
    data["projectRoot"] = linked.value.project_root;
    return ToolResult::ok(data);
}

ToolResult BoardTool::do_archive_stale(const Json& params) {
    int days = 0;
    if (!int_param(params, "days", days) || days < 0) {
        return ToolResult::fail("days must be a positive integer");
    }

    Result<int> archived = engine_->archive_stale(days);
    if (!archived.success) return ToolResult::fail(archived);

    Json data;
    data["archived"] = archived.value;
    return ToolResult::ok(data);
}

ToolResult BoardTool::do_github_issue(const Json& params) {
    if (!params.contains("issue") || !params["issue"].is_object()) return missing("issue");
    if (!params.contains("repository") || !params["repository"].is_object()) return missing("repository");

    const Json& issue = params["issue"];
    GithubIssueEvent event;
    event.action = str_param(params, "action");
    event.repository = str_param(params["repository"], "full_name");
    event.title = str_param(issue, "title");
    event.body = str_param(issue, "body");
    event.url = str_param(issue, "html_url");
    if (!int_param(issue, "number", event.number)) return ToolResult::fail("issue.number must be an integer");

    if (issue.contains("labels") && issue["labels"].is_array()) {
        const Json& labels = issue["labels"];
        for (size_t i = 0; i < labels.size(); ++i) {
            std::string label = labels[i].is_string() ? labels[i].get<std::string>()
                                                      : str_param(labels[i], "name");
            if (!label.empty()) event.labels.push_back(label);
        }
    }

    Result<std::string> handled = engine_->github_issue(event);
    if (!handled.success) return ToolResult::fail(handled);

    Json data;
    data["processed"] = !handled.value.empty();
    if (!handled.value.empty()) data["taskId"] = handled.value;
    return ToolResult::ok(data);
}

// ============================================================================
// Agent Tool Definitions
// ============================================================================

std::vector<AgentTool> BoardTool::get_agent_tools() const {
    std::vector<AgentTool> tools;
    BoardTool* self = const_cast<BoardTool*>(this);

    const ToolParamSchema board_param_schema("board", "string",
        "Board instance name. Default: the default board", false);

    struct Spec {
        const char* action;
        const char* description;
    };
    const Spec specs[] = {
        { "add", "Create a task. Lands in Backlog unless column is given." },
        { "move", "Move a task to another column. Gated columns (by default Done and the stage "
                  "before it) require resolved dependencies; "
                  "limited columns enforce their WIP limit." },
        { "reorder", "Reposition a task before another task (or at the end) of a column." },
        { "edit", "Update task fields. Never changes the column." },
        { "drop", "Delete a task and remove it from every other task's blockedBy." },
        { "block", "Add or remove one blockedBy dependency." },
        { "comment", "Add a comment to a task." },
        { "comments", "List a task's comments." },
        { "show", "Show a task with its comments." },
        { "list", "List tasks, optionally filtered by column, assignee, priority or label." },
        { "mine", "Tasks assigned to ai that are not Done." },
        { "search", "Case-insensitive search over title, description and context." },
        { "board", "Full board snapshot: columns with their tasks." },
        { "column", "Add, update or remove a column. Removed columns move their tasks to Backlog." },
        { "clear", "Archive every task in Done." },
        { "stats", "Per-column counts and WIP status." },
        { "sweep", "Apply several moves atomically: all succeed or none do." },
        { "archived", "List archived tasks." },
        { "boards", "List boards, most recently updated first." },
        { "active", "The most recently updated board." },
        { "create_board", "Create a board with optional columns and WIP limits." },
        { "delete_board", "Delete a board and its archive. The default board cannot be deleted." },
        { "link_project", "Link a board to a project folder (relative to the configured projects root)." },
        { "archive_stale", "Archive Done tasks not updated for the given number of days (all boards)." },
        { "github_issue", "Handle a GitHub issue webhook payload (opened / closed)." }
    };

    for (size_t i = 0; i < sizeof(specs) / sizeof(specs[0]); ++i) {
        AgentTool tool;
        tool.name = specs[i].action;
        tool.description = specs[i].description;
        const std::string action = specs[i].action;

        if (action == "add") {
            tool.params.push_back(ToolParamSchema("title", "string", "Task title", true));
            tool.params.push_back(ToolParamSchema("description", "string", "Longer description"));
            tool.params.push_back(ToolParamSchema("column", "string", "Target column. Default: Backlog"));
            tool.params.push_back(ToolParamSchema("priority", "string", "low, medium or high. Default: medium"));
            tool.params.push_back(ToolParamSchema("assignee", "string", "human, ai or unassigned"));
            tool.params.push_back(ToolParamSchema("labels", "array", "Label strings"));
            tool.params.push_back(ToolParamSchema("context", "string", "Working notes for the assignee"));
            tool.params.push_back(ToolParamSchema("links", "array", "Related files or URLs"));
            tool.params.push_back(ToolParamSchema("blockedBy", "array", "Ids of tasks this one waits for"));
            tool.params.push_back(ToolParamSchema("autoPullThreshold", "number", "Automation hint"));
            tool.params.push_back(ToolParamSchema("autoReleaseMinutes", "number", "Automation hint"));
        } else if (action == "move") {
            tool.params.push_back(ToolParamSchema("id", "string", "Task id", true));
            tool.params.push_back(ToolParamSchema("column", "string", "Target column", true));
        } else if (action == "reorder") {
            tool.params.push_back(ToolParamSchema("id", "string", "Task id", true));
            tool.params.push_back(ToolParamSchema("column", "string", "Column to place the task in", true));
            tool.params.push_back(ToolParamSchema("beforeId", "string", "Insert before this task; end when omitted"));
        } else if (action == "edit") {
            tool.params.push_back(ToolParamSchema("id", "string", "Task id", true));
            tool.params.push_back(ToolParamSchema("title", "string", "New title"));
            tool.params.push_back(ToolParamSchema("description", "string", "New description"));
            tool.params.push_back(ToolParamSchema("priority", "string", "low, medium or high"));
            tool.params.push_back(ToolParamSchema("assignee", "string", "human, ai or unassigned"));
            tool.params.push_back(ToolParamSchema("labels", "array", "Replacement labels"));
            tool.params.push_back(ToolParamSchema("context", "string", "Replacement context"));
            tool.params.push_back(ToolParamSchema("links", "array", "Replacement links"));
            tool.params.push_back(ToolParamSchema("blockedBy", "array", "Replacement dependency ids"));
            tool.params.push_back(ToolParamSchema("autoPullThreshold", "number", "Automation hint"));
            tool.params.push_back(ToolParamSchema("autoReleaseMinutes", "number", "Automation hint"));
        } else if (action == "drop" || action == "comments" || action == "show") {
            tool.params.push_back(ToolParamSchema("id", "string", "Task id", true));
        } else if (action == "block") {
            tool.params.push_back(ToolParamSchema("id", "string", "Task id", true));
            tool.params.push_back(ToolParamSchema("blockedBy", "string", "Dependency task id", true));
            tool.params.push_back(ToolParamSchema("remove", "boolean", "Remove instead of add"));
        } else if (action == "comment") {
            tool.params.push_back(ToolParamSchema("id", "string", "Task id", true));
            tool.params.push_back(ToolParamSchema("content", "string", "Comment text", true));
            tool.params.push_back(ToolParamSchema("author", "string", "human or ai. Default: configured actor"));
        } else if (action == "list") {
            tool.params.push_back(ToolParamSchema("column", "string", "Column name (case-insensitive)"));
            tool.params.push_back(ToolParamSchema("assignee", "string", "human, ai or unassigned"));
            tool.params.push_back(ToolParamSchema("priority", "string", "low, medium or high"));
            tool.params.push_back(ToolParamSchema("label", "string", "Label to match"));
        } else if (action == "search") {
            tool.params.push_back(ToolParamSchema("query", "string", "Text to look for", true));
        } else if (action == "column") {
            tool.params.push_back(ToolParamSchema("name", "string", "Column name", true));
            tool.params.push_back(ToolParamSchema("remove", "boolean", "Remove the column"));
            tool.params.push_back(ToolParamSchema("position", "number", "Index to insert at (between Backlog and Done)"));
            tool.params.push_back(ToolParamSchema("wipLimit", "number", "WIP limit, 0 for unlimited"));
        } else if (action == "sweep") {
            tool.params.push_back(ToolParamSchema("moves", "array", "List of {id, column}"));
            tool.params.push_back(ToolParamSchema("taskIds", "array", "Alternative form: ids moved to one column"));
            tool.params.push_back(ToolParamSchema("column", "string", "Target column for taskIds"));
        } else if (action == "create_board") {
            tool.params.push_back(ToolParamSchema("name", "string", "Board name", true));
            tool.params.push_back(ToolParamSchema("columns", "array", "Column layout; Backlog and Done are always added"));
            tool.params.push_back(ToolParamSchema("wipLimits", "object", "Column -> WIP limit"));
            tool.params.push_back(ToolParamSchema("projectRoot", "string", "Linked project directory"));
        } else if (action == "delete_board") {
            tool.params.push_back(ToolParamSchema("name", "string", "Board name", true));
        } else if (action == "link_project") {
            tool.params.push_back(ToolParamSchema("folder", "string", "Project folder", true));
        } else if (action == "archive_stale") {
            tool.params.push_back(ToolParamSchema("days", "number", "Age threshold in days. Default: 7"));
        } else if (action == "github_issue") {
            tool.params.push_back(ToolParamSchema("action", "string", "Webhook action (opened, closed)", true));
            tool.params.push_back(ToolParamSchema("issue", "object", "Issue object with number and title", true));
            tool.params.push_back(ToolParamSchema("repository", "object", "Repository object with full_name", true));
        }

        if (action != "boards" && action != "active" && action != "archive_stale" &&
            action != "create_board" && action != "delete_board" && action != "github_issue") {
            tool.params.push_back(board_param_schema);
        }

        tool.execute = [self, action](const Json& params) -> ToolResult {
            return self->execute(action, params);
        };
        tools.push_back(tool);
    }

    return tools;
}

} // namespace kanboard
