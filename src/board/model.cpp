/*
 * kanboard C++ - Board Model Implementation
 */
#include <kanboard/board/model.hpp>
#include <kanboard/core/utils.hpp>

#include <algorithm>
#include <set>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace kanboard {

const char* const BACKLOG_COLUMN = "Backlog";
const char* const DONE_COLUMN = "Done";

// ============================================================================
// Enumerations
// ============================================================================

const char* priority_name(Priority p) {
    switch (p) {
        case Priority::LOW: return "low";
        case Priority::MEDIUM: return "medium";
        case Priority::HIGH: return "high";
        default: return "medium";
    }
}

const char* assignee_name(Assignee a) {
    switch (a) {
        case Assignee::HUMAN: return "human";
        case Assignee::AI: return "ai";
        default: return "unassigned";
    }
}

const char* actor_name(Actor a) {
    return a == Actor::HUMAN ? "human" : "ai";
}

bool parse_priority(const std::string& s, Priority& out) {
    std::string v = to_lower(trim(s));
    if (v == "low") { out = Priority::LOW; return true; }
    if (v == "medium") { out = Priority::MEDIUM; return true; }
    if (v == "high") { out = Priority::HIGH; return true; }
    return false;
}

bool parse_assignee(const std::string& s, Assignee& out) {
    std::string v = to_lower(trim(s));
    if (v == "human") { out = Assignee::HUMAN; return true; }
    if (v == "ai") { out = Assignee::AI; return true; }
    if (v == "unassigned" || v.empty()) { out = Assignee::UNASSIGNED; return true; }
    return false;
}

bool parse_actor(const std::string& s, Actor& out) {
    std::string v = to_lower(trim(s));
    if (v == "human") { out = Actor::HUMAN; return true; }
    if (v == "ai") { out = Actor::AI; return true; }
    return false;
}

bool is_valid_task_id(const std::string& id) {
    if (id.empty() || id.size() > 64) return false;
    for (size_t i = 0; i < id.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(id[i]);
        if (!isalnum(c) && c != '_' && c != '-') return false;
    }
    return true;
}

// ============================================================================
// Board
// ============================================================================

Column* Board::find_column(const std::string& column_name) {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name == column_name) return &columns[i];
    }
    return nullptr;
}

const Column* Board::find_column(const std::string& column_name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name == column_name) return &columns[i];
    }
    return nullptr;
}

int Board::column_index(const std::string& column_name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name == column_name) return static_cast<int>(i);
    }
    return -1;
}

Task* Board::find_task(const std::string& task_id) {
    std::map<std::string, Task>::iterator it = tasks.find(task_id);
    return it == tasks.end() ? nullptr : &it->second;
}

const Task* Board::find_task(const std::string& task_id) const {
    std::map<std::string, Task>::const_iterator it = tasks.find(task_id);
    return it == tasks.end() ? nullptr : &it->second;
}

std::string Board::column_of(const std::string& task_id) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        const std::vector<std::string>& ids = columns[i].task_ids;
        if (std::find(ids.begin(), ids.end(), task_id) != ids.end()) {
            return columns[i].name;
        }
    }
    return "";
}

bool Board::is_gated(const std::string& column_name) const {
    return std::find(gated_columns.begin(), gated_columns.end(), column_name) != gated_columns.end();
}

void Board::refresh_gating() {
    if (!custom_gating) {
        gated_columns = default_gated_columns(columns);
        return;
    }
    std::vector<std::string> kept;
    for (size_t i = 0; i < gated_columns.size(); ++i) {
        if (find_column(gated_columns[i])) kept.push_back(gated_columns[i]);
    }
    gated_columns = kept;
}

std::vector<const Task*> Board::ordered_tasks() const {
    std::vector<const Task*> out;
    out.reserve(tasks.size());
    for (size_t c = 0; c < columns.size(); ++c) {
        for (size_t i = 0; i < columns[c].task_ids.size(); ++i) {
            const Task* t = find_task(columns[c].task_ids[i]);
            if (t) out.push_back(t);
        }
    }
    return out;
}

bool Board::check_invariants(std::string& error) const {
    std::set<std::string> seen;
    std::set<std::string> column_names;
    for (size_t c = 0; c < columns.size(); ++c) {
        if (!column_names.insert(columns[c].name).second) {
            error = "Duplicate column: " + columns[c].name;
            return false;
        }
        for (size_t i = 0; i < columns[c].task_ids.size(); ++i) {
            const std::string& id = columns[c].task_ids[i];
            if (!seen.insert(id).second) {
                error = "Task " + id + " appears in more than one position";
                return false;
            }
            if (tasks.find(id) == tasks.end()) {
                error = "Column " + columns[c].name + " references unknown task " + id;
                return false;
            }
        }
    }
    if (seen.size() != tasks.size()) {
        error = "Some tasks are not in any column";
        return false;
    }
    if (!find_column(BACKLOG_COLUMN) || !find_column(DONE_COLUMN)) {
        error = "Backlog and Done columns are required";
        return false;
    }
    return true;
}

std::vector<std::string> default_column_names() {
    std::vector<std::string> names;
    names.push_back(BACKLOG_COLUMN);
    names.push_back("Todo");
    names.push_back("In Progress");
    names.push_back("Review");
    names.push_back(DONE_COLUMN);
    return names;
}

std::vector<std::string> default_gated_columns(const std::vector<Column>& columns) {
    std::vector<std::string> gated;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name != DONE_COLUMN) continue;
        if (i > 0 && columns[i - 1].name != BACKLOG_COLUMN) {
            gated.push_back(columns[i - 1].name);
        }
        gated.push_back(DONE_COLUMN);
        break;
    }
    return gated;
}

Board make_board(const std::string& name,
                 const std::vector<std::string>& column_names,
                 int64_t now_ms) {
    Board b;
    b.name = name;
    b.created_at = now_ms;
    b.updated_at = now_ms;

    b.columns.push_back(Column(BACKLOG_COLUMN));
    std::set<std::string> used;
    used.insert(BACKLOG_COLUMN);
    used.insert(DONE_COLUMN);
    for (size_t i = 0; i < column_names.size(); ++i) {
        std::string n = trim(column_names[i]);
        if (n.empty() || !used.insert(n).second) continue;
        b.columns.push_back(Column(n));
    }
    b.columns.push_back(Column(DONE_COLUMN));

    b.gated_columns = default_gated_columns(b.columns);
    return b;
}

// ============================================================================
// Parameter parsing
// ============================================================================

namespace {

bool is_known_key(const std::string& key, const char* const* fields, size_t count,
                  const std::vector<std::string>& passthrough) {
    for (size_t i = 0; i < count; ++i) {
        if (key == fields[i]) return true;
    }
    return std::find(passthrough.begin(), passthrough.end(), key) != passthrough.end();
}

Status reject_unknown_keys(const Json& params, const char* const* fields, size_t count,
                           const std::vector<std::string>& passthrough) {
    if (!params.is_object()) {
        return Status::fail(ErrorCode::VALIDATION, "Parameters must be a JSON object");
    }
    for (Json::const_iterator it = params.begin(); it != params.end(); ++it) {
        if (!is_known_key(it.key(), fields, count, passthrough)) {
            return Status::fail(ErrorCode::VALIDATION, "Unknown field: " + it.key());
        }
    }
    return ok_status();
}

// Accepts a JSON array of strings, or a comma separated string
bool read_string_list(const Json& v, std::vector<std::string>& out) {
    out.clear();
    if (v.is_null()) return true;
    if (v.is_string()) {
        std::vector<std::string> parts = split(v.get<std::string>(), ',');
        for (size_t i = 0; i < parts.size(); ++i) {
            std::string p = trim(parts[i]);
            if (!p.empty()) out.push_back(p);
        }
        return true;
    }
    if (!v.is_array()) return false;
    for (size_t i = 0; i < v.size(); ++i) {
        if (!v[i].is_string()) return false;
        out.push_back(v[i].get<std::string>());
    }
    return true;
}

// Accepts a number or a numeric string that fits an int; null leaves the value unset
bool read_int(const Json& v, int& out) {
    if (v.is_null()) {
        out = -1;
        return true;
    }
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
        if (s.empty() || !end || *end != '\0' || errno == ERANGE) return false;
    } else {
        return false;
    }
    if (n < INT_MIN || n > INT_MAX) return false;
    out = static_cast<int>(n);
    return true;
}

// Automation hints: a non-negative int, or null for unset
bool read_hint(const Json& v, int& out) {
    int n = -1;
    if (!read_int(v, n)) return false;
    if (!v.is_null() && n < 0) return false;
    out = n;
    return true;
}

void dedupe(std::vector<std::string>& values) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (size_t i = 0; i < values.size(); ++i) {
        if (seen.insert(values[i]).second) out.push_back(values[i]);
    }
    values.swap(out);
}

const char* const NEW_TASK_FIELDS[] = {
    "title", "description", "column", "priority", "assignee", "labels",
    "context", "links", "blockedBy", "autoPullThreshold", "autoReleaseMinutes"
};

const char* const PATCH_FIELDS[] = {
    "title", "description", "priority", "assignee", "labels",
    "context", "links", "blockedBy", "autoPullThreshold", "autoReleaseMinutes"
};

} // anonymous namespace

Status validate_blocked_by(const std::vector<std::string>& ids) {
    for (size_t i = 0; i < ids.size(); ++i) {
        if (!is_valid_task_id(ids[i])) {
            return Status::fail(ErrorCode::VALIDATION,
                                "Invalid blockedBy id: '" + ids[i] + "'");
        }
    }
    return ok_status();
}

Result<NewTask> parse_new_task(const Json& params, const std::vector<std::string>& passthrough) {
    Status keys = reject_unknown_keys(params, NEW_TASK_FIELDS,
                                      sizeof(NEW_TASK_FIELDS) / sizeof(NEW_TASK_FIELDS[0]),
                                      passthrough);
    if (!keys.success) return Result<NewTask>::fail(keys);

    NewTask t;
    if (!params.contains("title") || !params["title"].is_string() ||
        trim(params["title"].get<std::string>()).empty()) {
        return Result<NewTask>::fail(ErrorCode::VALIDATION, "Missing required parameter: title");
    }
    t.title = trim(params["title"].get<std::string>());

    if (params.contains("description")) {
        if (!params["description"].is_string()) {
            return Result<NewTask>::fail(ErrorCode::VALIDATION, "description must be a string");
        }
        t.description = params["description"].get<std::string>();
    }
    if (params.contains("column")) {
        if (!params["column"].is_string()) {
            return Result<NewTask>::fail(ErrorCode::VALIDATION, "column must be a string");
        }
        t.column = params["column"].get<std::string>();
    }
    if (params.contains("priority")) {
        if (!params["priority"].is_string() ||
            !parse_priority(params["priority"].get<std::string>(), t.priority)) {
            return Result<NewTask>::fail(ErrorCode::VALIDATION, "priority must be low, medium or high");
        }
    }
    if (params.contains("assignee")) {
        if (!params["assignee"].is_string() ||
            !parse_assignee(params["assignee"].get<std::string>(), t.assignee)) {
            return Result<NewTask>::fail(ErrorCode::VALIDATION, "assignee must be human, ai or unassigned");
        }
    }
    if (params.contains("labels") && !read_string_list(params["labels"], t.labels)) {
        return Result<NewTask>::fail(ErrorCode::VALIDATION, "labels must be a list of strings");
    }
    if (params.contains("context")) {
        if (!params["context"].is_string()) {
            return Result<NewTask>::fail(ErrorCode::VALIDATION, "context must be a string");
        }
        t.context = params["context"].get<std::string>();
    }
    if (params.contains("links") && !read_string_list(params["links"], t.links)) {
        return Result<NewTask>::fail(ErrorCode::VALIDATION, "links must be a list of strings");
    }
    if (params.contains("blockedBy") && !read_string_list(params["blockedBy"], t.blocked_by)) {
        return Result<NewTask>::fail(ErrorCode::VALIDATION, "blockedBy must be a list of task ids");
    }
    if (params.contains("autoPullThreshold") &&
        !read_hint(params["autoPullThreshold"], t.auto_pull_threshold)) {
        return Result<NewTask>::fail(ErrorCode::VALIDATION, "autoPullThreshold must be a non-negative integer");
    }
    if (params.contains("autoReleaseMinutes") &&
        !read_hint(params["autoReleaseMinutes"], t.auto_release_minutes)) {
        return Result<NewTask>::fail(ErrorCode::VALIDATION, "autoReleaseMinutes must be a non-negative integer");
    }

    dedupe(t.labels);
    dedupe(t.blocked_by);
    Status deps = validate_blocked_by(t.blocked_by);
    if (!deps.success) return Result<NewTask>::fail(deps);

    return Result<NewTask>::ok(t);
}

Result<TaskPatch> parse_task_patch(const Json& params, const std::vector<std::string>& passthrough) {
    Status keys = reject_unknown_keys(params, PATCH_FIELDS,
                                      sizeof(PATCH_FIELDS) / sizeof(PATCH_FIELDS[0]),
                                      passthrough);
    if (!keys.success) return Result<TaskPatch>::fail(keys);

    TaskPatch p;
    if (params.contains("title")) {
        if (!params["title"].is_string() || trim(params["title"].get<std::string>()).empty()) {
            return Result<TaskPatch>::fail(ErrorCode::VALIDATION, "title must be a non-empty string");
        }
        p.has_title = true;
        p.title = trim(params["title"].get<std::string>());
    }
    if (params.contains("description")) {
        if (!params["description"].is_string()) {
            return Result<TaskPatch>::fail(ErrorCode::VALIDATION, "description must be a string");
        }
        p.has_description = true;
        p.description = params["description"].get<std::string>();
    }
    if (params.contains("priority")) {
        if (!params["priority"].is_string() ||
            !parse_priority(params["priority"].get<std::string>(), p.priority)) {
            return Result<TaskPatch>::fail(ErrorCode::VALIDATION, "priority must be low, medium or high");
        }
        p.has_priority = true;
    }
    if (params.contains("assignee")) {
        if (!params["assignee"].is_string() ||
            !parse_assignee(params["assignee"].get<std::string>(), p.assignee)) {
            return Result<TaskPatch>::fail(ErrorCode::VALIDATION, "assignee must be human, ai or unassigned");
        }
        p.has_assignee = true;
    }
    if (params.contains("labels")) {
        if (!read_string_list(params["labels"], p.labels)) {
            return Result<TaskPatch>::fail(ErrorCode::VALIDATION, "labels must be a list of strings");
        }
        dedupe(p.labels);
        p.has_labels = true;
    }
    if (params.contains("context")) {
        if (!params["context"].is_string()) {
            return Result<TaskPatch>::fail(ErrorCode::VALIDATION, "context must be a string");
        }
        p.has_context = true;
        p.context = params["context"].get<std::string>();
    }
    if (params.contains("links")) {
        if (!read_string_list(params["links"], p.links)) {
            return Result<TaskPatch>::fail(ErrorCode::VALIDATION, "links must be a list of strings");
        }
        p.has_links = true;
    }
    if (params.contains("blockedBy")) {
        if (!read_string_list(params["blockedBy"], p.blocked_by)) {
            return Result<TaskPatch>::fail(ErrorCode::VALIDATION, "blockedBy must be a list of task ids");
        }
        dedupe(p.blocked_by);
        Status deps = validate_blocked_by(p.blocked_by);
        if (!deps.success) return Result<TaskPatch>::fail(deps);
        p.has_blocked_by = true;
    }
    if (params.contains("autoPullThreshold")) {
        if (!read_hint(params["autoPullThreshold"], p.auto_pull_threshold)) {
            return Result<TaskPatch>::fail(ErrorCode::VALIDATION, "autoPullThreshold must be a non-negative integer");
        }
        p.has_auto_pull_threshold = true;
    }
    if (params.contains("autoReleaseMinutes")) {
        if (!read_hint(params["autoReleaseMinutes"], p.auto_release_minutes)) {
            return Result<TaskPatch>::fail(ErrorCode::VALIDATION, "autoReleaseMinutes must be a non-negative integer");
        }
        p.has_auto_release_minutes = true;
    }

    return Result<TaskPatch>::ok(p);
}

// ============================================================================
// JSON
// ============================================================================

namespace {

Json string_array(const std::vector<std::string>& values) {
    Json arr = Json::array();
    for (size_t i = 0; i < values.size(); ++i) arr.push_back(values[i]);
    return arr;
}

int64_t read_time(const Json& j, const char* key) {
    if (!j.contains(key)) return 0;
    const Json& v = j[key];
    if (v.is_number_integer()) return v.get<int64_t>();
    int64_t ms = 0;
    if (v.is_string() && parse_timestamp_ms(v.get<std::string>(), ms)) return ms;
    return 0;
}

std::string read_string(const Json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return "";
}

} // anonymous namespace

Json comment_to_json(const Comment& c) {
    Json j;
    j["id"] = c.id;
    j["taskId"] = c.task_id;
    j["author"] = actor_name(c.author);
    j["content"] = c.content;
    j["createdAt"] = format_timestamp_ms(c.created_at);
    return j;
}

Json task_to_json(const Task& t, const std::string& column, bool with_comments) {
    Json j;
    j["id"] = t.id;
    j["title"] = t.title;
    j["description"] = t.description;
    j["column"] = column;
    j["priority"] = priority_name(t.priority);
    j["assignee"] = assignee_name(t.assignee);
    j["labels"] = string_array(t.labels);
    j["context"] = t.context;
    j["links"] = string_array(t.links);
    j["blockedBy"] = string_array(t.blocked_by);
    j["autoPullThreshold"] = t.auto_pull_threshold >= 0 ? Json(t.auto_pull_threshold) : Json();
    j["autoReleaseMinutes"] = t.auto_release_minutes >= 0 ? Json(t.auto_release_minutes) : Json();
    j["createdBy"] = actor_name(t.created_by);
    j["createdAt"] = format_timestamp_ms(t.created_at);
    j["updatedAt"] = format_timestamp_ms(t.updated_at);
    if (with_comments) {
        Json comments = Json::array();
        for (size_t i = 0; i < t.comments.size(); ++i) {
            comments.push_back(comment_to_json(t.comments[i]));
        }
        j["comments"] = comments;
    }
    return j;
}

Json archived_to_json(const ArchivedTask& a) {
    Json j = task_to_json(a.task, a.column);
    j["archivedAt"] = format_timestamp_ms(a.archived_at);
    return j;
}

bool task_from_json(const Json& j, Task& out, std::string& error) {
    if (!j.is_object()) {
        error = "Task entry is not an object";
        return false;
    }
    Task t;
    t.id = read_string(j, "id");
    if (!is_valid_task_id(t.id)) {
        error = "Task has an invalid id: '" + t.id + "'";
        return false;
    }
    t.title = read_string(j, "title");
    t.description = read_string(j, "description");
    t.context = read_string(j, "context");

    if (!parse_priority(read_string(j, "priority"), t.priority)) t.priority = Priority::MEDIUM;
    if (!parse_assignee(read_string(j, "assignee"), t.assignee)) t.assignee = Assignee::UNASSIGNED;
    if (!parse_actor(read_string(j, "createdBy"), t.created_by)) t.created_by = Actor::AI;

    if (j.contains("labels")) read_string_list(j["labels"], t.labels);
    if (j.contains("links")) read_string_list(j["links"], t.links);
    if (j.contains("blockedBy")) read_string_list(j["blockedBy"], t.blocked_by);
    if (j.contains("autoPullThreshold") && !read_int(j["autoPullThreshold"], t.auto_pull_threshold)) {
        t.auto_pull_threshold = -1;
    }
    if (j.contains("autoReleaseMinutes") && !read_int(j["autoReleaseMinutes"], t.auto_release_minutes)) {
        t.auto_release_minutes = -1;
    }

    t.created_at = read_time(j, "createdAt");
    t.updated_at = read_time(j, "updatedAt");

    if (j.contains("comments") && j["comments"].is_array()) {
        const Json& arr = j["comments"];
        for (size_t i = 0; i < arr.size(); ++i) {
            if (!arr[i].is_object()) continue;
            Comment c;
            c.id = read_string(arr[i], "id");
            c.task_id = t.id;
            if (!parse_actor(read_string(arr[i], "author"), c.author)) c.author = Actor::AI;
            c.content = read_string(arr[i], "content");
            c.created_at = read_time(arr[i], "createdAt");
            t.comments.push_back(c);
        }
    }

    out = t;
    return true;
}

Json board_to_document(const Board& b) {
    Json doc;
    doc["name"] = b.name;
    doc["projectRoot"] = b.project_root;
    doc["createdAt"] = b.created_at;
    doc["updatedAt"] = b.updated_at;
    doc["gatedColumns"] = string_array(b.gated_columns);
    doc["customGating"] = b.custom_gating;

    Json columns = Json::array();
    for (size_t i = 0; i < b.columns.size(); ++i) {
        Json col;
        col["name"] = b.columns[i].name;
        col["wipLimit"] = b.columns[i].wip_limit;
        col["taskIds"] = string_array(b.columns[i].task_ids);
        columns.push_back(col);
    }
    doc["columns"] = columns;

    Json tasks = Json::array();
    for (std::map<std::string, Task>::const_iterator it = b.tasks.begin(); it != b.tasks.end(); ++it) {
        Json t = task_to_json(it->second, "");
        t.erase("column");
        tasks.push_back(t);
    }
    doc["tasks"] = tasks;
    return doc;
}

bool board_from_document(const Json& doc, Board& out, std::string& error) {
    if (!doc.is_object()) {
        error = "Board document is not an object";
        return false;
    }
    Board b;
    b.name = read_string(doc, "name");
    b.project_root = read_string(doc, "projectRoot");
    b.created_at = read_time(doc, "createdAt");
    b.updated_at = read_time(doc, "updatedAt");

    if (!doc.contains("columns") || !doc["columns"].is_array()) {
        error = "Board document has no columns";
        return false;
    }
    const Json& columns = doc["columns"];
    for (size_t i = 0; i < columns.size(); ++i) {
        Column col;
        col.name = read_string(columns[i], "name");
        if (col.name.empty()) {
            error = "Column without a name";
            return false;
        }
        if (columns[i].contains("wipLimit") && columns[i]["wipLimit"].is_number_integer()) {
            col.wip_limit = std::max(0, columns[i]["wipLimit"].get<int>());
        }
        if (columns[i].contains("taskIds")) {
            read_string_list(columns[i]["taskIds"], col.task_ids);
        }
        b.columns.push_back(col);
    }

    if (doc.contains("tasks") && doc["tasks"].is_array()) {
        const Json& tasks = doc["tasks"];
        for (size_t i = 0; i < tasks.size(); ++i) {
            Task t;
            if (!task_from_json(tasks[i], t, error)) return false;
            b.tasks[t.id] = t;
        }
    }

    b.custom_gating = doc.contains("customGating") && doc["customGating"].is_boolean() &&
                      doc["customGating"].get<bool>();
    if (b.custom_gating && doc.contains("gatedColumns") && doc["gatedColumns"].is_array()) {
        read_string_list(doc["gatedColumns"], b.gated_columns);
    } else {
        b.gated_columns = default_gated_columns(b.columns);
    }

    if (!b.check_invariants(error)) return false;

    out = b;
    return true;
}

Json board_to_view(const Board& b) {
    Json view;
    view["name"] = b.name;
    if (!b.project_root.empty()) view["projectRoot"] = b.project_root;
    view["createdAt"] = format_timestamp_ms(b.created_at);
    view["updatedAt"] = format_timestamp_ms(b.updated_at);
    view["version"] = b.version;
    view["gatedColumns"] = string_array(b.gated_columns);

    Json columns = Json::array();
    size_t total = 0;
    for (size_t i = 0; i < b.columns.size(); ++i) {
        const Column& c = b.columns[i];
        Json col;
        col["name"] = c.name;
        col["wipLimit"] = c.has_limit() ? Json(c.wip_limit) : Json();
        Json tasks = Json::array();
        for (size_t k = 0; k < c.task_ids.size(); ++k) {
            const Task* t = b.find_task(c.task_ids[k]);
            if (t) tasks.push_back(task_to_json(*t, c.name, false));
        }
        total += c.task_ids.size();
        col["tasks"] = tasks;
        columns.push_back(col);
    }
    view["columns"] = columns;
    view["taskCount"] = total;
    return view;
}

Json board_meta_to_json(const BoardMeta& m) {
    Json j;
    j["name"] = m.name;
    if (!m.project_root.empty()) j["projectRoot"] = m.project_root;
    j["taskCount"] = m.task_count;
    j["createdAt"] = format_timestamp_ms(m.created_at);
    j["updatedAt"] = format_timestamp_ms(m.updated_at);
    return j;
}

} // namespace kanboard
