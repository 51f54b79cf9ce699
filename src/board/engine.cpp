/*
 * kanboard C++ - Board Engine Implementation
 */
#include <kanboard/board/engine.hpp>
#include <kanboard/board/dependency.hpp>
#include <kanboard/board/events.hpp>
#include <kanboard/board/lock_manager.hpp>
#include <kanboard/board/router.hpp>
#include <kanboard/store/store.hpp>
#include <kanboard/core/config.hpp>
#include <kanboard/core/logger.hpp>
#include <kanboard/core/utils.hpp>

#include <algorithm>
#include <memory>

namespace kanboard {

namespace {

const int64_t MS_PER_DAY = 24LL * 60 * 60 * 1000;

Json string_array(const std::vector<std::string>& values) {
    Json arr = Json::array();
    for (size_t i = 0; i < values.size(); ++i) arr.push_back(values[i]);
    return arr;
}

bool erase_id(std::vector<std::string>& ids, const std::string& id) {
    std::vector<std::string>::iterator it = std::find(ids.begin(), ids.end(), id);
    if (it == ids.end()) return false;
    ids.erase(it);
    return true;
}

bool is_anchor(const std::string& column) {
    return column == BACKLOG_COLUMN || column == DONE_COLUMN;
}

} // anonymous namespace

// ============================================================================
// Options and result types
// ============================================================================

const char* wip_policy_name(WipPolicy policy) {
    return policy == WipPolicy::WARN ? "warn" : "hard";
}

EngineOptions::EngineOptions()
    : columns(default_column_names())
    , wip_policy(WipPolicy::HARD)
    , actor(Actor::AI)
    , lock_timeout_ms(5000)
    , auto_create(true)
    , done_cap(50)
    , retention_days(30)
    , stale_days(7) {
    wip_limits["In Progress"] = 10;
}

EngineOptions EngineOptions::from_config(const Config& config) {
    EngineOptions opts;

    std::vector<std::string> columns = config.get_string_list("board.columns");
    if (!columns.empty()) opts.columns = columns;

    Json limits = config.get("board.wip_limits");
    if (limits.is_object()) {
        opts.wip_limits.clear();
        for (Json::const_iterator it = limits.begin(); it != limits.end(); ++it) {
            if (!it.value().is_number_integer() || it.value().get<int>() < 0) {
                LOG_WARN("[Engine] Ignoring WIP limit for '%s': not a non-negative integer",
                         it.key().c_str());
                continue;
            }
            opts.wip_limits[it.key()] = it.value().get<int>();
        }
    }

    opts.gated_columns = config.get_string_list("board.gated_columns");

    std::string policy = to_lower(config.get_string("board.wip_policy", "hard"));
    if (policy == "warn") {
        opts.wip_policy = WipPolicy::WARN;
    } else if (policy != "hard") {
        LOG_WARN("[Engine] Unknown board.wip_policy '%s', using hard", policy.c_str());
    }

    std::string actor = config.get_string("actor", "ai");
    if (!parse_actor(actor, opts.actor)) {
        LOG_WARN("[Engine] Unknown actor '%s', using ai", actor.c_str());
        opts.actor = Actor::AI;
    }

    opts.lock_timeout_ms = config.get_int("lock.timeout_ms", opts.lock_timeout_ms);
    opts.auto_create = config.get_bool("router.auto_create", opts.auto_create);
    opts.done_cap = static_cast<int>(config.get_int("archive.done_cap", opts.done_cap));
    opts.retention_days = static_cast<int>(config.get_int("archive.retention_days", opts.retention_days));
    opts.stale_days = static_cast<int>(config.get_int("archive.stale_days", opts.stale_days));
    opts.projects_root = config.get_string("projects_root", "");
    return opts;
}

Json TaskView::to_json(bool with_comments) const {
    Json j = task_to_json(task, column, with_comments);
    if (!warning.empty()) j["warning"] = warning;
    return j;
}

Json SweepReport::to_json() const {
    Json results = Json::array();
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const MoveOutcome& o = outcomes[i];
        Json r;
        r["taskId"] = o.task_id;
        r["from"] = o.from;
        r["to"] = o.to;
        r["success"] = o.success;
        if (!o.success) {
            r["code"] = error_code_name(o.code);
            r["error"] = o.error;
        }
        if (!o.warning.empty()) r["warning"] = o.warning;
        results.push_back(r);
    }
    Json j;
    j["moved"] = moved;
    j["results"] = results;
    return j;
}

Json BoardStats::to_json() const {
    Json cols = Json::array();
    Json wip = Json::array();
    for (size_t i = 0; i < columns.size(); ++i) {
        const ColumnStats& c = columns[i];
        Json col;
        col["name"] = c.name;
        col["count"] = c.count;
        col["wipLimit"] = c.wip_limit > 0 ? Json(c.wip_limit) : Json();
        col["gated"] = c.gated;
        cols.push_back(col);

        if (c.wip_limit > 0) {
            Json w;
            w["column"] = c.name;
            w["count"] = c.count;
            w["limit"] = c.wip_limit;
            w["available"] = c.count >= static_cast<size_t>(c.wip_limit)
                ? 0 : c.wip_limit - static_cast<int>(c.count);
            w["atLimit"] = c.count >= static_cast<size_t>(c.wip_limit);
            w["overLimit"] = c.count > static_cast<size_t>(c.wip_limit);
            wip.push_back(w);
        }
    }

    Json j;
    j["board"] = board;
    j["total"] = total;
    j["columns"] = cols;
    j["wip"] = wip;
    j["byPriority"] = by_priority;
    j["byAssignee"] = by_assignee;
    j["archived"] = archived;
    return j;
}

std::string resolve_column(const Board& board, const std::string& name) {
    std::string wanted = trim(name);
    if (board.find_column(wanted)) return wanted;
    std::string lowered = to_lower(wanted);
    for (size_t i = 0; i < board.columns.size(); ++i) {
        if (to_lower(board.columns[i].name) == lowered) return board.columns[i].name;
    }
    return "";
}

// ============================================================================
// Engine core
// ============================================================================

BoardEngine::BoardEngine(BoardStore* store,
                         LockManager* locks,
                         EventBroadcaster* events,
                         InstanceRouter* router,
                         const EngineOptions& options)
    : store_(store)
    , locks_(locks)
    , events_(events)
    , router_(router)
    , options_(options) {}

void BoardEngine::set_wip_policy(WipPolicy policy) {
    std::lock_guard<std::mutex> lock(options_mutex_);
    options_.wip_policy = policy;
}

WipPolicy BoardEngine::wip_policy() {
    std::lock_guard<std::mutex> lock(options_mutex_);
    return options_.wip_policy;
}

Board BoardEngine::new_board(const std::string& name, int64_t now) const {
    Board b = make_board(name, options_.columns, now);

    for (size_t i = 0; i < b.columns.size(); ++i) {
        std::map<std::string, int>::const_iterator it = options_.wip_limits.find(b.columns[i].name);
        if (it != options_.wip_limits.end()) b.columns[i].wip_limit = it->second;
    }

    if (!options_.gated_columns.empty()) {
        std::vector<std::string> gated;
        for (size_t i = 0; i < options_.gated_columns.size(); ++i) {
            if (b.find_column(options_.gated_columns[i])) gated.push_back(options_.gated_columns[i]);
        }
        if (!gated.empty()) {
            b.gated_columns = gated;
            b.custom_gating = true;
        }
    }
    return b;
}

void BoardEngine::publish(const std::string& name, const std::string& kind, const Json& payload) {
    if (events_) events_->publish(name, kind, payload);
}

Result<Board> BoardEngine::open_board(const std::string& name) {
    Result<Board> loaded = store_->load(InstanceRouter::store_key(name));
    if (loaded.success || loaded.code != ErrorCode::NOT_FOUND) return loaded;

    if (!options_.auto_create) {
        return Result<Board>::fail(ErrorCode::NOT_FOUND, "Board not found: " + name);
    }

    Board fresh = new_board(name, current_timestamp_ms());
    {
        std::lock_guard<std::mutex> lock(commit_mutex_);
        Result<int64_t> saved = store_->save(InstanceRouter::store_key(name), fresh, 0,
                                             std::vector<ArchivedTask>());
        if (saved.success) {
            fresh.version = saved.value;
            LOG_INFO("[Engine] Created board '%s'", name.c_str());
            Json payload;
            payload["name"] = name;
            publish(name, "board-created", payload);
            return Result<Board>::ok(fresh);
        }
        if (saved.code != ErrorCode::CONFLICT_ON_WRITE) return Result<Board>::fail(saved);
    }

    // Someone else created it first
    return store_->load(InstanceRouter::store_key(name));
}

Result<Board> BoardEngine::commit(const std::string& name, const MutationFn& fn) {
    const std::string key = InstanceRouter::store_key(name);

    for (int attempt = 0; attempt < 2; ++attempt) {
        Result<Board> loaded = open_board(name);
        if (!loaded.success) return loaded;

        Board working = loaded.value;
        Mutation m;
        m.now = current_timestamp_ms();
        m.payload = Json::object();

        Status applied = fn(working, m);
        if (!applied.success) return Result<Board>::fail(applied);
        if (!m.changed) return Result<Board>::ok(working);

        working.updated_at = m.now;
        archive_done_overflow(working, m);

        std::string broken;
        if (!working.check_invariants(broken)) {
            LOG_ERROR("[Engine] Refusing to save '%s': %s", name.c_str(), broken.c_str());
            return Result<Board>::fail(ErrorCode::VALIDATION, "Board invariant violated: " + broken);
        }

        {
            std::lock_guard<std::mutex> lock(commit_mutex_);
            Result<int64_t> saved = store_->save(key, working, working.version, m.archived);
            if (saved.success) {
                working.version = saved.value;
                publish(name, m.kind, m.payload);
                return Result<Board>::ok(working);
            }
            if (saved.code != ErrorCode::CONFLICT_ON_WRITE) return Result<Board>::fail(saved);
        }

        LOG_DEBUG("[Engine] Write conflict on '%s' (%s), attempt %d",
                  name.c_str(), m.kind.c_str(), attempt + 1);
    }

    LOG_WARN("[Engine] Giving up on '%s' after a repeated write conflict", name.c_str());
    return Result<Board>::fail(ErrorCode::CONFLICT_ON_WRITE,
                               "Board '" + name + "' was modified concurrently, retry the operation");
}

void BoardEngine::archive_done_overflow(Board& board, Mutation& m) {
    if (options_.done_cap <= 0) return;
    Column* done = board.find_column(DONE_COLUMN);
    if (!done || done->task_ids.size() <= static_cast<size_t>(options_.done_cap)) return;

    // Least recently updated first; position breaks ties
    std::vector<std::string> by_age = done->task_ids;
    std::stable_sort(by_age.begin(), by_age.end(),
                     [&board](const std::string& a, const std::string& b) {
                         return board.find_task(a)->updated_at < board.find_task(b)->updated_at;
                     });

    size_t overflow = done->task_ids.size() - static_cast<size_t>(options_.done_cap);
    Json ids = Json::array();
    for (size_t i = 0; i < overflow; ++i) {
        const std::string& id = by_age[i];
        ArchivedTask a;
        a.task = *board.find_task(id);
        a.column = DONE_COLUMN;
        a.archived_at = m.now;
        m.archived.push_back(a);
        erase_id(done->task_ids, id);
        board.tasks.erase(id);
        ids.push_back(id);
    }

    m.payload["autoArchived"] = ids;
    LOG_INFO("[Engine] Archived %zu overflow tasks from Done on '%s'", overflow, board.name.c_str());
}

Status BoardEngine::check_entry(const Board& board, const std::string& task_id,
                                const std::string& column, std::string& warning) {
    if (board.is_gated(column)) {
        std::vector<std::string> blocking = unresolved(board, task_id);
        if (!blocking.empty()) {
            return Status::fail(ErrorCode::DEPENDENCY_UNRESOLVED,
                                "Task " + task_id + " cannot enter '" + column +
                                "': blocked by " + join(blocking, ", "));
        }
    }

    const Column* col = board.find_column(column);
    if (col && col->has_limit() && board.column_of(task_id) != column &&
        col->task_ids.size() + 1 > static_cast<size_t>(col->wip_limit)) {
        std::string msg = "Column '" + column + "' is at its WIP limit (" +
                          std::to_string(col->task_ids.size()) + "/" +
                          std::to_string(col->wip_limit) + ")";
        if (wip_policy() == WipPolicy::HARD) {
            return Status::fail(ErrorCode::WIP_LIMIT_EXCEEDED, msg);
        }
        LOG_WARN("[Engine] %s, allowing %s", msg.c_str(), task_id.c_str());
        warning = msg;
    }
    return ok_status();
}

Status BoardEngine::apply_move(Board& board, const std::string& task_id,
                               const std::string& column, int64_t now,
                               MoveOutcome& outcome) {
    outcome = MoveOutcome();
    outcome.task_id = task_id;
    outcome.to = column;

    Status result = ok_status();
    Task* task = board.find_task(task_id);
    std::string target = resolve_column(board, column);

    if (!task) {
        result = Status::fail(ErrorCode::NOT_FOUND, "Task not found: " + task_id);
    } else if (target.empty()) {
        result = Status::fail(ErrorCode::NOT_FOUND, "Column not found: " + column);
    } else {
        outcome.from = board.column_of(task_id);
        outcome.to = target;
        if (outcome.from != target) {
            result = check_entry(board, task_id, target, outcome.warning);
            if (result.success) {
                erase_id(board.find_column(outcome.from)->task_ids, task_id);
                board.find_column(target)->task_ids.push_back(task_id);
                task->updated_at = now;
            }
        }
    }

    outcome.success = result.success;
    if (!result.success) {
        outcome.code = result.code;
        outcome.error = result.error;
    }
    return result;
}

Result<TaskView> BoardEngine::view_of(const Result<Board>& board, const std::string& task_id,
                                      const std::string& warning) {
    if (!board.success) return Result<TaskView>::fail(board);
    const Task* t = board.value.find_task(task_id);
    if (!t) return Result<TaskView>::fail(ErrorCode::NOT_FOUND, "Task not found: " + task_id);

    TaskView v;
    v.task = *t;
    v.column = board.value.column_of(task_id);
    v.warning = warning;
    return Result<TaskView>::ok(v);
}

// ============================================================================
// Boards
// ============================================================================

Result<Board> BoardEngine::board(const std::string& instance) {
    return open_board(router_->resolve(instance));
}

Result<Board> BoardEngine::create_board(const std::string& instance,
                                        const std::vector<std::string>& columns,
                                        const std::map<std::string, int>& wip_limits,
                                        const std::string& project_root) {
    const std::string name = router_->resolve(instance);

    Board fresh = new_board(name, current_timestamp_ms());
    if (!columns.empty()) {
        Board custom = make_board(name, columns, fresh.created_at);
        fresh.columns = custom.columns;
        fresh.gated_columns = custom.gated_columns;
        fresh.custom_gating = false;
    }
    if (!wip_limits.empty()) {
        for (size_t i = 0; i < fresh.columns.size(); ++i) {
            std::map<std::string, int>::const_iterator it = wip_limits.find(fresh.columns[i].name);
            fresh.columns[i].wip_limit = it == wip_limits.end() ? 0 : std::max(0, it->second);
        }
    } else if (!columns.empty()) {
        for (size_t i = 0; i < fresh.columns.size(); ++i) {
            std::map<std::string, int>::const_iterator it = options_.wip_limits.find(fresh.columns[i].name);
            if (it != options_.wip_limits.end()) fresh.columns[i].wip_limit = it->second;
        }
    }
    fresh.project_root = project_root;

    std::lock_guard<std::mutex> lock(commit_mutex_);
    Result<int64_t> saved = store_->save(InstanceRouter::store_key(name), fresh, 0,
                                         std::vector<ArchivedTask>());
    if (!saved.success) {
        if (saved.code == ErrorCode::CONFLICT_ON_WRITE) {
            return Result<Board>::fail(ErrorCode::VALIDATION, "Board already exists: " + name);
        }
        return Result<Board>::fail(saved);
    }
    fresh.version = saved.value;

    LOG_INFO("[Engine] Created board '%s' with %zu columns", name.c_str(), fresh.columns.size());
    Json payload;
    payload["name"] = name;
    payload["columns"] = Json::array();
    for (size_t i = 0; i < fresh.columns.size(); ++i) payload["columns"].push_back(fresh.columns[i].name);
    publish(name, "board-created", payload);
    return Result<Board>::ok(fresh);
}

Status BoardEngine::delete_board(const std::string& instance) {
    const std::string name = router_->resolve(instance);
    if (name == "default" || name == router_->default_board()) {
        return Status::fail(ErrorCode::VALIDATION, "Cannot delete the default board");
    }

    std::lock_guard<std::mutex> lock(commit_mutex_);
    Status removed = store_->remove(InstanceRouter::store_key(name));
    if (!removed.success) return removed;

    LOG_INFO("[Engine] Deleted board '%s'", name.c_str());
    Json payload;
    payload["name"] = name;
    publish(name, "board-deleted", payload);
    return ok_status();
}

Result<Board> BoardEngine::link_project(const std::string& instance, const std::string& folder) {
    const std::string relative = trim(folder);
    if (relative.empty()) {
        return Result<Board>::fail(ErrorCode::VALIDATION, "Project folder is required");
    }
    const std::string project_root = join_path(options_.projects_root, relative);
    if (!is_directory(project_root)) {
        return Result<Board>::fail(ErrorCode::NOT_FOUND, "Folder not found: " + relative);
    }

    const std::string name = router_->resolve(instance);
    return commit(name, [&](Board& b, Mutation& m) -> Status {
        if (b.project_root == project_root) return ok_status();
        b.project_root = project_root;

        m.changed = true;
        m.kind = "project-linked";
        m.payload["projectRoot"] = project_root;
        return ok_status();
    });
}

Result<std::vector<BoardMeta> > BoardEngine::boards() {
    return store_->list();
}

Result<BoardMeta> BoardEngine::active() {
    Result<std::vector<BoardMeta> > all = store_->list();
    if (!all.success) return Result<BoardMeta>::fail(all);
    if (all.value.empty()) return Result<BoardMeta>::fail(ErrorCode::NOT_FOUND, "No boards yet");
    return Result<BoardMeta>::ok(all.value.front());
}

// ============================================================================
// Tasks
// ============================================================================

Result<TaskView> BoardEngine::add(const std::string& instance, const NewTask& spec, Actor created_by) {
    const std::string title = trim(spec.title);
    if (title.empty()) {
        return Result<TaskView>::fail(ErrorCode::VALIDATION, "Task title must not be empty");
    }
    Status deps = validate_blocked_by(spec.blocked_by);
    if (!deps.success) return Result<TaskView>::fail(deps);

    const std::string name = router_->resolve(instance);
    std::string task_id;
    std::string warning;

    Result<Board> result = commit(name, [&](Board& b, Mutation& m) -> Status {
        warning.clear();
        std::string target = spec.column.empty() ? std::string(BACKLOG_COLUMN)
                                                 : resolve_column(b, spec.column);
        if (target.empty()) {
            LOG_DEBUG("[Engine] Unknown column '%s', adding to Backlog", spec.column.c_str());
            target = BACKLOG_COLUMN;
        }

        Task t;
        do {
            t.id = generate_short_id();
        } while (b.tasks.count(t.id));
        t.title = title;
        t.description = spec.description;
        t.priority = spec.priority;
        t.assignee = spec.assignee;
        t.labels = spec.labels;
        t.context = spec.context;
        t.links = spec.links;
        t.blocked_by = spec.blocked_by;
        t.auto_pull_threshold = spec.auto_pull_threshold;
        t.auto_release_minutes = spec.auto_release_minutes;
        t.created_by = created_by;
        t.created_at = m.now;
        t.updated_at = m.now;
        b.tasks[t.id] = t;

        Status entry = check_entry(b, t.id, target, warning);
        if (!entry.success) return entry;

        b.find_column(target)->task_ids.push_back(t.id);
        task_id = t.id;

        m.changed = true;
        m.kind = "task-created";
        m.payload["task"] = task_to_json(t, target, false);
        return ok_status();
    });

    Result<TaskView> view = view_of(result, task_id, warning);
    if (view.success) {
        LOG_INFO("[Engine] %s: added %s '%s' to %s", name.c_str(), task_id.c_str(),
                 title.c_str(), view.value.column.c_str());
    }
    return view;
}

Result<TaskView> BoardEngine::move(const std::string& instance, const std::string& task_id,
                                   const std::string& column) {
    const std::string name = router_->resolve(instance);
    MoveOutcome outcome;

    Result<Board> result = commit(name, [&](Board& b, Mutation& m) -> Status {
        Status moved = apply_move(b, task_id, column, m.now, outcome);
        if (!moved.success) return moved;
        if (outcome.from == outcome.to) return ok_status();

        m.changed = true;
        m.kind = "task-moved";
        m.payload["taskId"] = task_id;
        m.payload["from"] = outcome.from;
        m.payload["to"] = outcome.to;
        if (!outcome.warning.empty()) m.payload["warning"] = outcome.warning;
        return ok_status();
    });

    if (result.success && outcome.from != outcome.to) {
        LOG_INFO("[Engine] %s: moved %s %s -> %s", name.c_str(), task_id.c_str(),
                 outcome.from.c_str(), outcome.to.c_str());
    }
    return view_of(result, task_id, outcome.warning);
}

Result<TaskView> BoardEngine::reorder(const std::string& instance, const std::string& task_id,
                                      const std::string& column, const std::string& before_id) {
    const std::string name = router_->resolve(instance);
    std::string warning;

    Result<Board> result = commit(name, [&](Board& b, Mutation& m) -> Status {
        warning.clear();
        Task* task = b.find_task(task_id);
        if (!task) return Status::fail(ErrorCode::NOT_FOUND, "Task not found: " + task_id);

        std::string target = resolve_column(b, column);
        if (target.empty()) return Status::fail(ErrorCode::NOT_FOUND, "Column not found: " + column);

        std::string from = b.column_of(task_id);
        if (from == target && before_id == task_id) return ok_status();

        if (from != target) {
            Status entry = check_entry(b, task_id, target, warning);
            if (!entry.success) return entry;
        }

        Column* src = b.find_column(from);
        Column* dst = b.find_column(target);
        const std::vector<std::string> original = src->task_ids;

        erase_id(src->task_ids, task_id);
        std::vector<std::string>::iterator pos = dst->task_ids.end();
        if (!before_id.empty()) {
            std::vector<std::string>::iterator found =
                std::find(dst->task_ids.begin(), dst->task_ids.end(), before_id);
            if (found != dst->task_ids.end()) pos = found;
        }
        size_t index = static_cast<size_t>(pos - dst->task_ids.begin());
        dst->task_ids.insert(pos, task_id);

        if (from == target && src->task_ids == original) return ok_status();

        task->updated_at = m.now;
        m.changed = true;
        m.kind = "task-reordered";
        m.payload["taskId"] = task_id;
        m.payload["from"] = from;
        m.payload["to"] = target;
        m.payload["position"] = index;
        if (!before_id.empty()) m.payload["beforeId"] = before_id;
        if (!warning.empty()) m.payload["warning"] = warning;
        return ok_status();
    });

    return view_of(result, task_id, warning);
}

Result<TaskView> BoardEngine::edit(const std::string& instance, const std::string& task_id,
                                   const TaskPatch& patch) {
    if (patch.has_title && trim(patch.title).empty()) {
        return Result<TaskView>::fail(ErrorCode::VALIDATION, "Task title must not be empty");
    }
    if (patch.has_blocked_by) {
        Status deps = validate_blocked_by(patch.blocked_by);
        if (!deps.success) return Result<TaskView>::fail(deps);
    }

    const std::string name = router_->resolve(instance);

    Result<Board> result = commit(name, [&](Board& b, Mutation& m) -> Status {
        Task* t = b.find_task(task_id);
        if (!t) return Status::fail(ErrorCode::NOT_FOUND, "Task not found: " + task_id);
        if (patch.empty()) return ok_status();

        Json fields = Json::array();
        if (patch.has_title) { t->title = trim(patch.title); fields.push_back("title"); }
        if (patch.has_description) { t->description = patch.description; fields.push_back("description"); }
        if (patch.has_priority) { t->priority = patch.priority; fields.push_back("priority"); }
        if (patch.has_assignee) { t->assignee = patch.assignee; fields.push_back("assignee"); }
        if (patch.has_labels) { t->labels = patch.labels; fields.push_back("labels"); }
        if (patch.has_context) { t->context = patch.context; fields.push_back("context"); }
        if (patch.has_links) { t->links = patch.links; fields.push_back("links"); }
        if (patch.has_blocked_by) {
            t->blocked_by = patch.blocked_by;
            erase_id(t->blocked_by, task_id);     // self references are ignored
            fields.push_back("blockedBy");
        }
        if (patch.has_auto_pull_threshold) {
            t->auto_pull_threshold = patch.auto_pull_threshold;
            fields.push_back("autoPullThreshold");
        }
        if (patch.has_auto_release_minutes) {
            t->auto_release_minutes = patch.auto_release_minutes;
            fields.push_back("autoReleaseMinutes");
        }
        t->updated_at = m.now;

        m.changed = true;
        m.kind = "task-updated";
        m.payload["taskId"] = task_id;
        m.payload["fields"] = fields;
        return ok_status();
    });

    return view_of(result, task_id, "");
}

Result<TaskView> BoardEngine::drop(const std::string& instance, const std::string& task_id) {
    const std::string name = router_->resolve(instance);
    TaskView removed;

    Result<Board> result = commit(name, [&](Board& b, Mutation& m) -> Status {
        const Task* t = b.find_task(task_id);
        if (!t) return Status::fail(ErrorCode::NOT_FOUND, "Task not found: " + task_id);

        removed.task = *t;
        removed.column = b.column_of(task_id);
        erase_id(b.find_column(removed.column)->task_ids, task_id);
        b.tasks.erase(task_id);

        Json scrubbed = Json::array();
        for (std::map<std::string, Task>::iterator it = b.tasks.begin(); it != b.tasks.end(); ++it) {
            bool changed = false;
            while (erase_id(it->second.blocked_by, task_id)) changed = true;
            if (changed) scrubbed.push_back(it->first);
        }

        m.changed = true;
        m.kind = "task-deleted";
        m.payload["taskId"] = task_id;
        m.payload["column"] = removed.column;
        m.payload["unblocked"] = scrubbed;
        return ok_status();
    });

    if (!result.success) return Result<TaskView>::fail(result);
    LOG_INFO("[Engine] %s: dropped %s", name.c_str(), task_id.c_str());
    return Result<TaskView>::ok(removed);
}

Result<TaskView> BoardEngine::block(const std::string& instance, const std::string& task_id,
                                    const std::string& blocked_by, bool remove) {
    const std::string dep = trim(blocked_by);
    if (!is_valid_task_id(dep)) {
        return Result<TaskView>::fail(ErrorCode::VALIDATION, "Invalid blockedBy id: '" + dep + "'");
    }

    const std::string name = router_->resolve(instance);

    Result<Board> result = commit(name, [&](Board& b, Mutation& m) -> Status {
        Task* t = b.find_task(task_id);
        if (!t) return Status::fail(ErrorCode::NOT_FOUND, "Task not found: " + task_id);
        if (dep == task_id) return ok_status();

        bool present = std::find(t->blocked_by.begin(), t->blocked_by.end(), dep) != t->blocked_by.end();
        if (remove) {
            if (!present) return ok_status();
            erase_id(t->blocked_by, dep);
        } else {
            if (present) return ok_status();
            t->blocked_by.push_back(dep);
        }
        t->updated_at = m.now;

        m.changed = true;
        m.kind = "task-updated";
        m.payload["taskId"] = task_id;
        m.payload["fields"] = Json::array({"blockedBy"});
        m.payload[remove ? "unblockedBy" : "blockedBy"] = dep;
        return ok_status();
    });

    return view_of(result, task_id, "");
}

Result<Comment> BoardEngine::comment(const std::string& instance, const std::string& task_id,
                                     const std::string& content, Actor author) {
    if (trim(content).empty()) {
        return Result<Comment>::fail(ErrorCode::VALIDATION, "Comment content must not be empty");
    }

    const std::string name = router_->resolve(instance);
    Comment added;

    Result<Board> result = commit(name, [&](Board& b, Mutation& m) -> Status {
        Task* t = b.find_task(task_id);
        if (!t) return Status::fail(ErrorCode::NOT_FOUND, "Task not found: " + task_id);

        Comment c;
        c.id = generate_short_id();
        c.task_id = task_id;
        c.author = author;
        c.content = content;
        c.created_at = m.now;
        t->comments.push_back(c);
        t->updated_at = m.now;
        added = c;

        m.changed = true;
        m.kind = "comment-added";
        m.payload["taskId"] = task_id;
        m.payload["comment"] = comment_to_json(c);
        return ok_status();
    });

    if (!result.success) return Result<Comment>::fail(result);
    return Result<Comment>::ok(added);
}

Result<std::vector<Comment> > BoardEngine::comments(const std::string& instance,
                                                   const std::string& task_id) {
    Result<TaskView> v = show(instance, task_id);
    if (!v.success) return Result<std::vector<Comment> >::fail(v);
    return Result<std::vector<Comment> >::ok(v.value.task.comments);
}

Result<TaskView> BoardEngine::show(const std::string& instance, const std::string& task_id) {
    return view_of(board(instance), task_id, "");
}

Result<std::vector<TaskView> > BoardEngine::list(const std::string& instance, const TaskFilter& filter) {
    typedef Result<std::vector<TaskView> > ListResult;

    Assignee assignee = Assignee::UNASSIGNED;
    if (!filter.assignee.empty() && !parse_assignee(filter.assignee, assignee)) {
        return ListResult::fail(ErrorCode::VALIDATION, "Unknown assignee: " + filter.assignee);
    }
    Priority priority = Priority::MEDIUM;
    if (!filter.priority.empty() && !parse_priority(filter.priority, priority)) {
        return ListResult::fail(ErrorCode::VALIDATION, "Unknown priority: " + filter.priority);
    }

    Result<Board> b = board(instance);
    if (!b.success) return ListResult::fail(b);

    std::vector<TaskView> out;
    const std::string wanted_column = to_lower(trim(filter.column));
    for (size_t c = 0; c < b.value.columns.size(); ++c) {
        const Column& col = b.value.columns[c];
        if (!wanted_column.empty() && to_lower(col.name) != wanted_column) continue;

        for (size_t i = 0; i < col.task_ids.size(); ++i) {
            const Task* t = b.value.find_task(col.task_ids[i]);
            if (!t) continue;
            if (!filter.assignee.empty() && t->assignee != assignee) continue;
            if (!filter.priority.empty() && t->priority != priority) continue;
            if (!filter.label.empty() &&
                std::find(t->labels.begin(), t->labels.end(), filter.label) == t->labels.end()) {
                continue;
            }
            TaskView v;
            v.task = *t;
            v.column = col.name;
            out.push_back(v);
        }
    }
    return ListResult::ok(out);
}

Result<std::vector<TaskView> > BoardEngine::mine(const std::string& instance) {
    TaskFilter filter;
    filter.assignee = "ai";
    Result<std::vector<TaskView> > all = list(instance, filter);
    if (!all.success) return all;

    std::vector<TaskView> open;
    for (size_t i = 0; i < all.value.size(); ++i) {
        if (all.value[i].column != DONE_COLUMN) open.push_back(all.value[i]);
    }
    return Result<std::vector<TaskView> >::ok(open);
}

Result<TaskSearch> BoardEngine::search(const std::string& instance, const std::string& query) {
    Result<Board> b = board(instance);
    if (!b.success) return Result<TaskSearch>::fail(b);
    std::shared_ptr<const Board> snapshot = std::make_shared<const Board>(b.value);
    return Result<TaskSearch>::ok(TaskSearch(snapshot, trim(query)));
}

// ============================================================================
// Structure
// ============================================================================

Result<Board> BoardEngine::column(const std::string& instance, const ColumnChange& change) {
    const std::string column_name = trim(change.name);
    if (column_name.empty()) {
        return Result<Board>::fail(ErrorCode::VALIDATION, "Column name is required");
    }
    if (change.wip_limit < -1) {
        return Result<Board>::fail(ErrorCode::VALIDATION, "wipLimit must be zero or positive");
    }

    const std::string name = router_->resolve(instance);

    return commit(name, [&](Board& b, Mutation& m) -> Status {
        std::string existing = resolve_column(b, column_name);

        if (change.remove) {
            if (existing.empty()) {
                return Status::fail(ErrorCode::NOT_FOUND, "Column not found: " + column_name);
            }
            if (is_anchor(existing)) {
                return Status::fail(ErrorCode::VALIDATION, "Cannot remove the " + existing + " column");
            }
            Column* col = b.find_column(existing);
            std::vector<std::string> relocated = col->task_ids;
            Column* backlog = b.find_column(BACKLOG_COLUMN);
            backlog->task_ids.insert(backlog->task_ids.end(), relocated.begin(), relocated.end());
            b.columns.erase(b.columns.begin() + b.column_index(existing));
            b.refresh_gating();

            m.changed = true;
            m.kind = "column-removed";
            m.payload["column"] = existing;
            m.payload["relocated"] = string_array(relocated);
            return ok_status();
        }

        if (!existing.empty()) {
            if (change.wip_limit < 0 && change.position < 0) {
                return Status::fail(ErrorCode::VALIDATION, "Column already exists: " + existing);
            }
            if (change.position >= 0) {
                if (is_anchor(existing)) {
                    return Status::fail(ErrorCode::VALIDATION, "Cannot reposition the " + existing + " column");
                }
                Column moved = *b.find_column(existing);
                b.columns.erase(b.columns.begin() + b.column_index(existing));
                int done_index = b.column_index(DONE_COLUMN);
                int pos = std::max(1, std::min(change.position, done_index));
                b.columns.insert(b.columns.begin() + pos, moved);
                b.refresh_gating();
                m.payload["position"] = pos;
            }
            if (change.wip_limit >= 0) {
                b.find_column(existing)->wip_limit = change.wip_limit;
                m.payload["wipLimit"] = change.wip_limit > 0 ? Json(change.wip_limit) : Json();
            }
            m.changed = true;
            m.kind = "column-updated";
            m.payload["column"] = existing;
            return ok_status();
        }

        int done_index = b.column_index(DONE_COLUMN);
        int pos = change.position < 0 ? done_index : std::max(1, std::min(change.position, done_index));
        b.columns.insert(b.columns.begin() + pos, Column(column_name, std::max(0, change.wip_limit)));
        b.refresh_gating();

        m.changed = true;
        m.kind = "column-added";
        m.payload["column"] = column_name;
        m.payload["position"] = pos;
        if (change.wip_limit > 0) m.payload["wipLimit"] = change.wip_limit;
        return ok_status();
    });
}

Result<int> BoardEngine::clear(const std::string& instance) {
    const std::string name = router_->resolve(instance);
    int count = 0;

    Result<Board> result = commit(name, [&](Board& b, Mutation& m) -> Status {
        Column* done = b.find_column(DONE_COLUMN);
        count = static_cast<int>(done->task_ids.size());
        if (count == 0) return ok_status();

        for (size_t i = 0; i < done->task_ids.size(); ++i) {
            ArchivedTask a;
            a.task = *b.find_task(done->task_ids[i]);
            a.column = DONE_COLUMN;
            a.archived_at = m.now;
            m.archived.push_back(a);
            b.tasks.erase(done->task_ids[i]);
        }
        m.payload["taskIds"] = string_array(done->task_ids);
        m.payload["count"] = count;
        done->task_ids.clear();

        m.changed = true;
        m.kind = "board-cleared";
        return ok_status();
    });

    if (!result.success) return Result<int>::fail(result);
    if (count > 0) LOG_INFO("[Engine] %s: archived %d done tasks", name.c_str(), count);
    return Result<int>::ok(count);
}

Result<BoardStats> BoardEngine::stats(const std::string& instance) {
    Result<Board> b = board(instance);
    if (!b.success) return Result<BoardStats>::fail(b);

    BoardStats s;
    s.board = b.value.name;
    s.by_priority["low"] = 0;
    s.by_priority["medium"] = 0;
    s.by_priority["high"] = 0;
    s.by_assignee["human"] = 0;
    s.by_assignee["ai"] = 0;
    s.by_assignee["unassigned"] = 0;

    for (size_t c = 0; c < b.value.columns.size(); ++c) {
        const Column& col = b.value.columns[c];
        ColumnStats cs;
        cs.name = col.name;
        cs.count = col.task_ids.size();
        cs.wip_limit = col.wip_limit;
        cs.gated = b.value.is_gated(col.name);
        s.columns.push_back(cs);
        s.total += cs.count;

        for (size_t i = 0; i < col.task_ids.size(); ++i) {
            const Task* t = b.value.find_task(col.task_ids[i]);
            if (!t) continue;
            s.by_priority[priority_name(t->priority)]++;
            s.by_assignee[assignee_name(t->assignee)]++;
        }
    }

    Result<int64_t> archived_count = store_->archive_size(InstanceRouter::store_key(b.value.name));
    if (!archived_count.success) return Result<BoardStats>::fail(archived_count);
    s.archived = archived_count.value;
    return Result<BoardStats>::ok(s);
}

Result<SweepReport> BoardEngine::sweep(const std::string& instance, const std::vector<MoveRequest>& moves) {
    if (moves.empty()) {
        return Result<SweepReport>::fail(ErrorCode::VALIDATION, "Sweep needs at least one move");
    }

    const std::string name = router_->resolve(instance);
    SweepReport report;

    std::function<Status()> body = [&]() -> Status {
        Result<Board> result = commit(name, [&](Board& b, Mutation& m) -> Status {
            report = SweepReport();
            for (size_t i = 0; i < moves.size(); ++i) {
                MoveOutcome outcome;
                Status moved = apply_move(b, moves[i].task_id, moves[i].column, m.now, outcome);
                report.outcomes.push_back(outcome);
                if (!moved.success) {
                    return Status::fail(moved.code,
                                        "Move " + std::to_string(i + 1) + " of " +
                                        std::to_string(moves.size()) + " (" + moves[i].task_id +
                                        " -> " + moves[i].column + ") failed: " + moved.error);
                }
                if (outcome.from != outcome.to) report.moved++;
            }
            if (report.moved == 0) return ok_status();

            m.changed = true;
            m.kind = "batch-move";
            m.payload = report.to_json();
            return ok_status();
        });
        if (!result.success) return Status::fail(result);
        return ok_status();
    };

    Status done = locks_ ? locks_->with_lock(board_lock_key(name), options_.lock_timeout_ms, body)
                         : body();
    if (!done.success) {
        LOG_WARN("[Engine] %s: sweep rolled back: %s", name.c_str(), done.error.c_str());
        Result<SweepReport> failed = Result<SweepReport>::fail(done);
        failed.value = report;
        return failed;
    }

    LOG_INFO("[Engine] %s: sweep moved %zu of %zu tasks", name.c_str(), report.moved, moves.size());
    return Result<SweepReport>::ok(report);
}

// ============================================================================
// Archive
// ============================================================================

Result<std::vector<ArchivedTask> > BoardEngine::archived(const std::string& instance) {
    Result<Board> b = board(instance);
    if (!b.success) return Result<std::vector<ArchivedTask> >::fail(b);
    return store_->archived(InstanceRouter::store_key(b.value.name));
}

Result<int> BoardEngine::archive_stale(int days) {
    if (days <= 0) days = options_.stale_days;
    const int64_t cutoff = current_timestamp_ms() - static_cast<int64_t>(days) * MS_PER_DAY;

    Result<std::vector<BoardMeta> > all = store_->list();
    if (!all.success) return Result<int>::fail(all);

    int total = 0;
    for (size_t i = 0; i < all.value.size(); ++i) {
        const std::string& name = all.value[i].name;
        int archived_here = 0;

        Result<Board> result = commit(name, [&](Board& b, Mutation& m) -> Status {
            archived_here = 0;
            Column* done = b.find_column(DONE_COLUMN);
            std::vector<std::string> kept;
            Json ids = Json::array();
            for (size_t k = 0; k < done->task_ids.size(); ++k) {
                const Task* t = b.find_task(done->task_ids[k]);
                if (t->updated_at >= cutoff) {
                    kept.push_back(done->task_ids[k]);
                    continue;
                }
                ArchivedTask a;
                a.task = *t;
                a.column = DONE_COLUMN;
                a.archived_at = m.now;
                m.archived.push_back(a);
                ids.push_back(t->id);
                b.tasks.erase(done->task_ids[k]);
                archived_here++;
            }
            if (archived_here == 0) return ok_status();
            done->task_ids.swap(kept);

            m.changed = true;
            m.kind = "tasks-archived";
            m.payload["taskIds"] = ids;
            m.payload["olderThanDays"] = days;
            return ok_status();
        });

        if (!result.success) {
            LOG_WARN("[Engine] Stale archiving skipped board '%s': %s",
                     name.c_str(), result.error.c_str());
            continue;
        }
        total += archived_here;
    }

    if (total > 0) LOG_INFO("[Engine] Archived %d stale done tasks", total);
    return Result<int>::ok(total);
}

Result<int64_t> BoardEngine::rotate_archive() {
    const int64_t cutoff = current_timestamp_ms() -
                           static_cast<int64_t>(options_.retention_days) * MS_PER_DAY;
    return store_->rotate_archive(cutoff);
}

Result<std::string> BoardEngine::github_issue(const GithubIssueEvent& event) {
    if (event.repository.empty() || event.number <= 0) {
        return Result<std::string>::fail(ErrorCode::VALIDATION,
                                         "GitHub issue event needs repository and issue number");
    }

    std::string board_name = event.repository;
    size_t slash = board_name.find('/');
    if (slash != std::string::npos) board_name[slash] = '-';

    const std::string prefix = "#" + std::to_string(event.number) + ":";

    if (event.action == "opened") {
        NewTask spec;
        spec.title = prefix + " " + event.title;
        spec.description = event.body;
        spec.labels = event.labels;
        if (!event.url.empty()) spec.links.push_back(event.url);
        spec.column = BACKLOG_COLUMN;

        Result<TaskView> added = add(board_name, spec, Actor::HUMAN);
        if (!added.success) return Result<std::string>::fail(added);
        return Result<std::string>::ok(added.value.task.id);
    }

    if (event.action == "closed") {
        Result<Board> b = board(board_name);
        if (!b.success) return Result<std::string>::fail(b);

        std::vector<const Task*> tasks = b.value.ordered_tasks();
        for (size_t i = 0; i < tasks.size(); ++i) {
            if (!starts_with(tasks[i]->title, prefix)) continue;
            Result<TaskView> moved = move(board_name, tasks[i]->id, DONE_COLUMN);
            if (!moved.success) return Result<std::string>::fail(moved);
            return Result<std::string>::ok(tasks[i]->id);
        }
        LOG_DEBUG("[Engine] No task for issue %s on '%s'", prefix.c_str(), board_name.c_str());
    }

    return Result<std::string>::ok("");
}

} // namespace kanboard
