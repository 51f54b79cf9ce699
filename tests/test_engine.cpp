/*
 * kanboard C++ - Transition engine tests
 */
#include <catch2/catch.hpp>
#include "test_support.hpp"

using namespace kanboard;
using kanboard::testing::EngineFixture;

namespace {

// Fails the next `conflicts` saves of an existing board as if another
// writer got there first
class ConflictingStore : public BoardStore {
public:
    explicit ConflictingStore(BoardStore* inner) : conflicts(0), attempts(0), inner_(inner) {}

    int conflicts;
    int attempts;

    const char* backend() const override { return "conflicting"; }

    Result<Board> load(const std::string& key) override { return inner_->load(key); }

    Result<int64_t> save(const std::string& key, const Board& board, int64_t expected_version,
                         const std::vector<ArchivedTask>& archive_entries) override {
        if (expected_version > 0) {
            attempts++;
            if (conflicts > 0) {
                conflicts--;
                return Result<int64_t>::fail(ErrorCode::CONFLICT_ON_WRITE, "Injected conflict on " + key);
            }
        }
        return inner_->save(key, board, expected_version, archive_entries);
    }

    Status remove(const std::string& key) override { return inner_->remove(key); }
    Result<std::vector<BoardMeta> > list() override { return inner_->list(); }
    Result<std::vector<ArchivedTask> > archived(const std::string& key) override {
        return inner_->archived(key);
    }
    Result<int64_t> archive_size(const std::string& key) override { return inner_->archive_size(key); }
    Result<int64_t> rotate_archive(int64_t cutoff_ms) override { return inner_->rotate_archive(cutoff_ms); }
    Result<bool> try_acquire_lease(const std::string& key, const std::string& owner,
                                   int64_t now_ms, int64_t ttl_ms) override {
        return inner_->try_acquire_lease(key, owner, now_ms, ttl_ms);
    }
    Status release_lease(const std::string& key, const std::string& owner) override {
        return inner_->release_lease(key, owner);
    }

private:
    BoardStore* inner_;
};

} // anonymous namespace

TEST_CASE("WIP limits and dependency gating on the default workflow", "[engine]") {
    EngineFixture fx(1);
    BoardEngine& engine = *fx.engine;

    std::string a = fx.add("A");
    REQUIRE_FALSE(a.empty());
    CHECK(fx.column_of(a) == "Backlog");

    REQUIRE(engine.move("", a, "In Progress").success);

    std::string b = fx.add("B");
    Result<TaskView> blocked = engine.move("", b, "In Progress");
    CHECK_FALSE(blocked.success);
    CHECK(blocked.code == ErrorCode::WIP_LIMIT_EXCEEDED);
    CHECK(fx.column_of(b) == "Backlog");

    std::vector<std::string> deps;
    deps.push_back(a);
    std::string c = fx.add_blocked("C", deps);
    Result<TaskView> gated = engine.move("", c, "Review");
    CHECK_FALSE(gated.success);
    CHECK(gated.code == ErrorCode::DEPENDENCY_UNRESOLVED);
    CHECK(fx.column_of(c) == "Backlog");

    REQUIRE(engine.move("", a, "Done").success);
    Result<TaskView> now_ok = engine.move("", c, "Review");
    REQUIRE(now_ok.success);
    CHECK(now_ok.value.column == "Review");
}

TEST_CASE("Moves append to the target column and accept any letter case", "[engine]") {
    EngineFixture fx(5);
    std::string a = fx.add("A");
    std::string b = fx.add("B");

    REQUIRE(fx.engine->move("", b, "todo").success);
    REQUIRE(fx.engine->move("", a, "TODO").success);

    std::vector<std::string> todo = fx.ids_in("Todo");
    REQUIRE(todo.size() == 2);
    CHECK(todo[0] == b);
    CHECK(todo[1] == a);

    Result<TaskView> missing = fx.engine->move("", a, "Nowhere");
    CHECK(missing.code == ErrorCode::NOT_FOUND);
    Result<TaskView> ghost = fx.engine->move("", "nope", "Todo");
    CHECK(ghost.code == ErrorCode::NOT_FOUND);
}

TEST_CASE("A move into the current column is a silent no-op", "[engine]") {
    EngineFixture fx(1);
    std::string a = fx.add("A");
    REQUIRE(fx.engine->move("", a, "In Progress").success);

    uint64_t before = fx.events.published();
    Result<TaskView> again = fx.engine->move("", a, "In Progress");
    REQUIRE(again.success);
    CHECK(fx.events.published() == before);
}

TEST_CASE("WARN policy lets a move exceed the limit with a warning", "[engine]") {
    EngineFixture fx(1);
    fx.engine->set_wip_policy(WipPolicy::WARN);

    std::string a = fx.add("A");
    std::string b = fx.add("B");
    REQUIRE(fx.engine->move("", a, "In Progress").success);

    Result<TaskView> over = fx.engine->move("", b, "In Progress");
    REQUIRE(over.success);
    CHECK_FALSE(over.value.warning.empty());
    CHECK(fx.ids_in("In Progress").size() == 2);

    Result<BoardStats> stats = fx.engine->stats("");
    REQUIRE(stats.success);
    Json j = stats.value.to_json();
    REQUIRE(j["wip"].size() == 1);
    CHECK(j["wip"][0]["overLimit"] == true);
    CHECK(j["wip"][0]["available"] == 0);
}

TEST_CASE("Occupancy never exceeds a hard limit", "[engine]") {
    EngineFixture fx(3);
    std::vector<std::string> ids;
    for (int i = 0; i < 8; ++i) ids.push_back(fx.add("task " + std::to_string(i)));

    int accepted = 0;
    for (size_t i = 0; i < ids.size(); ++i) {
        Result<TaskView> r = fx.engine->move("", ids[i], "In Progress");
        if (r.success) {
            accepted++;
        } else {
            CHECK(r.code == ErrorCode::WIP_LIMIT_EXCEEDED);
        }
        CHECK(fx.ids_in("In Progress").size() <= 3);
    }
    CHECK(accepted == 3);
}

TEST_CASE("add honours the target column rules", "[engine]") {
    EngineFixture fx(1);

    NewTask first;
    first.title = "first";
    first.column = "In Progress";
    REQUIRE(fx.engine->add("", first, Actor::AI).success);

    NewTask second;
    second.title = "second";
    second.column = "in progress";
    Result<TaskView> full = fx.engine->add("", second, Actor::AI);
    CHECK(full.code == ErrorCode::WIP_LIMIT_EXCEEDED);

    NewTask stray;
    stray.title = "stray";
    stray.column = "Somewhere";
    Result<TaskView> fallback = fx.engine->add("", stray, Actor::HUMAN);
    REQUIRE(fallback.success);
    CHECK(fallback.value.column == "Backlog");
    CHECK(fallback.value.task.created_by == Actor::HUMAN);

    NewTask untitled;
    untitled.title = "  ";
    CHECK(fx.engine->add("", untitled, Actor::AI).code == ErrorCode::VALIDATION);

    NewTask bad_dep;
    bad_dep.title = "bad";
    bad_dep.blocked_by.push_back("not valid!");
    CHECK(fx.engine->add("", bad_dep, Actor::AI).code == ErrorCode::VALIDATION);
}

TEST_CASE("reorder positions tasks and round-trips", "[engine]") {
    EngineFixture fx(5);
    std::string a = fx.add("A");
    std::string b = fx.add("B");
    std::string c = fx.add("C");

    std::vector<std::string> original = fx.ids_in("Backlog");
    REQUIRE(original.size() == 3);

    REQUIRE(fx.engine->reorder("", c, "Backlog", a).success);
    std::vector<std::string> moved = fx.ids_in("Backlog");
    CHECK(moved[0] == c);
    CHECK(moved[1] == a);
    CHECK(moved[2] == b);

    // Back to the end restores the original order
    REQUIRE(fx.engine->reorder("", c, "Backlog", "").success);
    CHECK(fx.ids_in("Backlog") == original);

    SECTION("unknown beforeId falls back to the end") {
        REQUIRE(fx.engine->reorder("", a, "Todo", "not-there").success);
        REQUIRE(fx.engine->reorder("", b, "Todo", "not-there").success);
        std::vector<std::string> todo = fx.ids_in("Todo");
        REQUIRE(todo.size() == 2);
        CHECK(todo[0] == a);
        CHECK(todo[1] == b);
    }

    SECTION("reorder into a gated column checks dependencies") {
        REQUIRE(fx.engine->block("", a, b, false).success);
        Result<TaskView> r = fx.engine->reorder("", a, "Review", "");
        CHECK(r.code == ErrorCode::DEPENDENCY_UNRESOLVED);
    }

    SECTION("a reorder that changes nothing publishes nothing") {
        uint64_t before = fx.events.published();
        REQUIRE(fx.engine->reorder("", b, "Backlog", c).success);
        CHECK(fx.events.published() == before);
    }
}

TEST_CASE("edit updates fields but never the column", "[engine]") {
    EngineFixture fx(5);
    std::string a = fx.add("A");
    REQUIRE(fx.engine->move("", a, "Todo").success);

    TaskPatch patch;
    patch.has_priority = true;
    patch.priority = Priority::HIGH;
    patch.has_title = true;
    patch.title = "  Renamed ";
    patch.has_blocked_by = true;
    patch.blocked_by.push_back(a);
    patch.blocked_by.push_back("other");

    Result<TaskView> r = fx.engine->edit("", a, patch);
    REQUIRE(r.success);
    CHECK(r.value.column == "Todo");
    CHECK(r.value.task.title == "Renamed");
    CHECK(r.value.task.priority == Priority::HIGH);
    REQUIRE(r.value.task.blocked_by.size() == 1);
    CHECK(r.value.task.blocked_by[0] == "other");

    TaskPatch empty_title;
    empty_title.has_title = true;
    CHECK(fx.engine->edit("", a, empty_title).code == ErrorCode::VALIDATION);
    CHECK(fx.engine->edit("", "ghost", patch).code == ErrorCode::NOT_FOUND);
}

TEST_CASE("drop removes the task from every blockedBy", "[engine]") {
    EngineFixture fx(5);
    std::string a = fx.add("A");
    std::vector<std::string> deps;
    deps.push_back(a);
    std::string b = fx.add_blocked("B", deps);
    std::string c = fx.add_blocked("C", deps);

    Result<TaskView> dropped = fx.engine->drop("", a);
    REQUIRE(dropped.success);
    CHECK(dropped.value.task.id == a);
    CHECK(dropped.value.column == "Backlog");

    Result<Board> board = fx.engine->board("");
    REQUIRE(board.success);
    CHECK(board.value.find_task(a) == nullptr);
    CHECK(board.value.find_task(b)->blocked_by.empty());
    CHECK(board.value.find_task(c)->blocked_by.empty());

    CHECK(fx.engine->drop("", a).code == ErrorCode::NOT_FOUND);
}

TEST_CASE("block adds and removes one dependency", "[engine]") {
    EngineFixture fx(5);
    std::string a = fx.add("A");
    std::string b = fx.add("B");

    Result<TaskView> added = fx.engine->block("", b, a, false);
    REQUIRE(added.success);
    REQUIRE(added.value.task.blocked_by.size() == 1);

    // Adding twice and blocking on itself leave the list alone
    CHECK(fx.engine->block("", b, a, false).value.task.blocked_by.size() == 1);
    CHECK(fx.engine->block("", b, b, false).value.task.blocked_by.size() == 1);

    Result<TaskView> removed = fx.engine->block("", b, a, true);
    REQUIRE(removed.success);
    CHECK(removed.value.task.blocked_by.empty());

    CHECK(fx.engine->block("", b, "bad id", false).code == ErrorCode::VALIDATION);
}

TEST_CASE("Comments are appended in order", "[engine]") {
    EngineFixture fx(5);
    std::string a = fx.add("A");

    REQUIRE(fx.engine->comment("", a, "first", Actor::HUMAN).success);
    REQUIRE(fx.engine->comment("", a, "second", Actor::AI).success);
    CHECK(fx.engine->comment("", a, "   ", Actor::AI).code == ErrorCode::VALIDATION);
    CHECK(fx.engine->comment("", "ghost", "hi", Actor::AI).code == ErrorCode::NOT_FOUND);

    Result<std::vector<Comment> > list = fx.engine->comments("", a);
    REQUIRE(list.success);
    REQUIRE(list.value.size() == 2);
    CHECK(list.value[0].content == "first");
    CHECK(list.value[0].author == Actor::HUMAN);
    CHECK(list.value[1].author == Actor::AI);
}

TEST_CASE("list filters and mine", "[engine]") {
    EngineFixture fx(5);

    NewTask ai_task;
    ai_task.title = "for the agent";
    ai_task.assignee = Assignee::AI;
    ai_task.labels.push_back("backend");
    std::string a = fx.engine->add("", ai_task, Actor::HUMAN).value.task.id;

    NewTask done_task = ai_task;
    done_task.title = "finished";
    std::string d = fx.engine->add("", done_task, Actor::HUMAN).value.task.id;
    REQUIRE(fx.engine->move("", d, "Done").success);

    NewTask human_task;
    human_task.title = "for a person";
    human_task.assignee = Assignee::HUMAN;
    human_task.priority = Priority::HIGH;
    fx.engine->add("", human_task, Actor::HUMAN);

    TaskFilter by_label;
    by_label.label = "backend";
    CHECK(fx.engine->list("", by_label).value.size() == 2);

    TaskFilter by_priority;
    by_priority.priority = "high";
    CHECK(fx.engine->list("", by_priority).value.size() == 1);

    TaskFilter by_column;
    by_column.column = "done";
    CHECK(fx.engine->list("", by_column).value.size() == 1);

    TaskFilter bad;
    bad.assignee = "robot";
    CHECK(fx.engine->list("", bad).code == ErrorCode::VALIDATION);

    Result<std::vector<TaskView> > mine = fx.engine->mine("");
    REQUIRE(mine.success);
    REQUIRE(mine.value.size() == 1);
    CHECK(mine.value[0].task.id == a);
}

TEST_CASE("search is case-insensitive over title, description and context", "[engine]") {
    EngineFixture fx(5);

    NewTask t1;
    t1.title = "Fix Login page";
    fx.engine->add("", t1, Actor::AI);
    NewTask t2;
    t2.title = "Refactor";
    t2.context = "touches the LOGIN flow";
    fx.engine->add("", t2, Actor::AI);
    NewTask t3;
    t3.title = "Unrelated";
    t3.description = "nothing here";
    fx.engine->add("", t3, Actor::AI);

    Result<TaskSearch> found = fx.engine->search("", "login");
    REQUIRE(found.success);
    CHECK(found.value.count() == 2);

    size_t seen = 0;
    for (TaskSearch::const_iterator it = found.value.begin(); it != found.value.end(); ++it) {
        CHECK(it.column() == "Backlog");
        CHECK(it->title != "Unrelated");
        seen++;
    }
    CHECK(seen == 2);

    CHECK(fx.engine->search("", "zzz").value.count() == 0);
}

TEST_CASE("Column changes keep Backlog and Done anchored", "[engine]") {
    EngineFixture fx(5);
    std::string a = fx.add("A");
    REQUIRE(fx.engine->move("", a, "Todo").success);

    SECTION("add a limited column before Done") {
        ColumnChange add;
        add.name = "QA";
        add.wip_limit = 2;
        Result<Board> b = fx.engine->column("", add);
        REQUIRE(b.success);
        int qa = b.value.column_index("QA");
        CHECK(qa == b.value.column_index("Done") - 1);
        CHECK(b.value.find_column("QA")->wip_limit == 2);

        ColumnChange dup;
        dup.name = "qa";
        CHECK(fx.engine->column("", dup).code == ErrorCode::VALIDATION);
    }

    SECTION("positions are clamped between the anchors") {
        ColumnChange first;
        first.name = "Triage";
        first.position = 0;
        Result<Board> b = fx.engine->column("", first);
        REQUIRE(b.success);
        CHECK(b.value.columns[0].name == "Backlog");
        CHECK(b.value.columns[1].name == "Triage");

        ColumnChange last;
        last.name = "Shipping";
        last.position = 99;
        b = fx.engine->column("", last);
        REQUIRE(b.success);
        CHECK(b.value.columns.back().name == "Done");
    }

    SECTION("removing a column sends its tasks to Backlog") {
        ColumnChange remove;
        remove.name = "todo";
        remove.remove = true;
        Result<Board> b = fx.engine->column("", remove);
        REQUIRE(b.success);
        CHECK(b.value.find_column("Todo") == nullptr);
        CHECK(b.value.column_of(a) == "Backlog");
    }

    SECTION("anchors cannot be removed") {
        ColumnChange backlog;
        backlog.name = "Backlog";
        backlog.remove = true;
        CHECK(fx.engine->column("", backlog).code == ErrorCode::VALIDATION);

        ColumnChange done;
        done.name = "Done";
        done.remove = true;
        CHECK(fx.engine->column("", done).code == ErrorCode::VALIDATION);
    }

    SECTION("updating a limit") {
        ColumnChange update;
        update.name = "In Progress";
        update.wip_limit = 0;
        Result<Board> b = fx.engine->column("", update);
        REQUIRE(b.success);
        CHECK_FALSE(b.value.find_column("In Progress")->has_limit());
    }

    SECTION("a new last stage before Done becomes gated") {
        std::vector<std::string> deps;
        deps.push_back(a);
        std::string c = fx.add_blocked("C", deps);

        ColumnChange add;
        add.name = "QA";
        Result<Board> b = fx.engine->column("", add);
        REQUIRE(b.success);
        CHECK(b.value.is_gated("QA"));
        CHECK(b.value.is_gated("Done"));
        CHECK_FALSE(b.value.is_gated("Review"));

        CHECK(fx.engine->move("", c, "QA").code == ErrorCode::DEPENDENCY_UNRESOLVED);
        CHECK(fx.engine->move("", c, "Review").success);
    }

    SECTION("removing the gated stage gates the column before it") {
        std::vector<std::string> deps;
        deps.push_back(a);
        std::string c = fx.add_blocked("C", deps);

        ColumnChange remove;
        remove.name = "Review";
        remove.remove = true;
        Result<Board> b = fx.engine->column("", remove);
        REQUIRE(b.success);
        CHECK(b.value.is_gated("In Progress"));

        CHECK(fx.engine->move("", c, "In Progress").code == ErrorCode::DEPENDENCY_UNRESOLVED);
        CHECK(fx.column_of(c) == "Backlog");
    }

    SECTION("repositioning a column moves the gate with it") {
        ColumnChange reposition;
        reposition.name = "Todo";
        reposition.position = 3;
        Result<Board> b = fx.engine->column("", reposition);
        REQUIRE(b.success);
        REQUIRE(b.value.column_index("Todo") == b.value.column_index("Done") - 1);
        CHECK(b.value.is_gated("Todo"));
        CHECK_FALSE(b.value.is_gated("Review"));
    }
}

TEST_CASE("Configured gating survives column changes", "[engine]") {
    EngineFixture fx(5);
    fx.options.gated_columns.clear();
    fx.options.gated_columns.push_back("In Progress");
    fx.options.gated_columns.push_back("Done");
    BoardEngine custom(&fx.store, &fx.locks, &fx.events, &fx.router, fx.options);

    ColumnChange add;
    add.name = "QA";
    Result<Board> b = custom.column("", add);
    REQUIRE(b.success);
    CHECK(b.value.custom_gating);
    CHECK(b.value.is_gated("In Progress"));
    CHECK_FALSE(b.value.is_gated("QA"));

    ColumnChange remove;
    remove.name = "In Progress";
    remove.remove = true;
    b = custom.column("", remove);
    REQUIRE(b.success);
    REQUIRE(b.value.gated_columns.size() == 1);
    CHECK(b.value.is_gated("Done"));
}

TEST_CASE("clear archives Done and leaves dangling blockers resolved", "[engine]") {
    EngineFixture fx(5);
    std::string a = fx.add("A");
    std::string b = fx.add("B");
    std::vector<std::string> deps;
    deps.push_back(a);
    std::string c = fx.add_blocked("C", deps);

    REQUIRE(fx.engine->move("", a, "Done").success);
    REQUIRE(fx.engine->move("", b, "Done").success);

    Result<int> cleared = fx.engine->clear("");
    REQUIRE(cleared.success);
    CHECK(cleared.value == 2);
    CHECK(fx.ids_in("Done").empty());

    Result<std::vector<ArchivedTask> > archived = fx.engine->archived("");
    REQUIRE(archived.success);
    CHECK(archived.value.size() == 2);

    // C still names A, which no longer exists, so it may enter Review
    REQUIRE(fx.engine->move("", c, "Review").success);

    Result<int> again = fx.engine->clear("");
    REQUIRE(again.success);
    CHECK(again.value == 0);
}

TEST_CASE("Done is capped by archiving the oldest tasks", "[engine]") {
    EngineFixture fx(5);
    fx.options.done_cap = 2;
    BoardEngine capped(&fx.store, &fx.locks, &fx.events, &fx.router, fx.options);

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        NewTask t;
        t.title = "t" + std::to_string(i);
        t.column = "Done";
        Result<TaskView> r = capped.add("", t, Actor::AI);
        REQUIRE(r.success);
        ids.push_back(r.value.task.id);
        sleep_ms(2);
    }

    Result<Board> b = capped.board("");
    REQUIRE(b.success);
    CHECK(b.value.find_column("Done")->task_ids.size() == 2);
    CHECK(b.value.find_task(ids[0]) == nullptr);
    CHECK(capped.archived("").value.size() == 1);
}

TEST_CASE("stats counts tasks per column", "[engine]") {
    EngineFixture fx(1);
    std::string a = fx.add("A");
    fx.add("B");
    REQUIRE(fx.engine->move("", a, "In Progress").success);

    Result<BoardStats> stats = fx.engine->stats("");
    REQUIRE(stats.success);
    CHECK(stats.value.total == 2);
    CHECK(stats.value.by_priority["medium"] == 2);
    CHECK(stats.value.by_assignee["unassigned"] == 2);

    Json j = stats.value.to_json();
    REQUIRE(j["wip"].size() == 1);
    CHECK(j["wip"][0]["column"] == "In Progress");
    CHECK(j["wip"][0]["atLimit"] == true);
    CHECK(j["wip"][0]["overLimit"] == false);
}

TEST_CASE("Boards are isolated and managed by name", "[engine]") {
    EngineFixture fx(5);
    std::string a = fx.add("A", "alpha");
    fx.add("B", "beta");

    CHECK(fx.ids_in("Backlog", "alpha").size() == 1);
    CHECK(fx.ids_in("Backlog", "beta").size() == 1);
    CHECK(fx.engine->show("beta", a).code == ErrorCode::NOT_FOUND);

    std::vector<std::string> columns;
    columns.push_back("Doing");
    std::map<std::string, int> limits;
    limits["Doing"] = 2;
    Result<Board> created = fx.engine->create_board("gamma", columns, limits, "/src/gamma");
    REQUIRE(created.success);
    REQUIRE(created.value.columns.size() == 3);
    CHECK(created.value.find_column("Doing")->wip_limit == 2);
    CHECK(fx.engine->create_board("gamma", columns, limits, "").code == ErrorCode::VALIDATION);

    Result<std::vector<BoardMeta> > all = fx.engine->boards();
    REQUIRE(all.success);
    CHECK(all.value.size() == 3);

    REQUIRE(fx.engine->delete_board("gamma").success);
    CHECK(fx.engine->delete_board("gamma").code == ErrorCode::NOT_FOUND);
    CHECK(fx.engine->delete_board("default").code == ErrorCode::VALIDATION);
}

TEST_CASE("Boards are not created on access when auto-create is off", "[engine]") {
    EngineFixture fx(5);
    fx.options.auto_create = false;
    BoardEngine strict(&fx.store, &fx.locks, &fx.events, &fx.router, fx.options);

    CHECK(strict.board("missing").code == ErrorCode::NOT_FOUND);
    NewTask t;
    t.title = "orphan";
    CHECK(strict.add("missing", t, Actor::AI).code == ErrorCode::NOT_FOUND);
}

TEST_CASE("Stale Done tasks are archived across boards", "[engine]") {
    EngineFixture fx(5);
    std::string a = fx.add("A");
    std::string b = fx.add("B", "other");
    REQUIRE(fx.engine->move("", a, "Done").success);
    REQUIRE(fx.engine->move("other", b, "Done").success);

    // Nothing is a day old yet
    Result<int> none = fx.engine->archive_stale(1);
    REQUIRE(none.success);
    CHECK(none.value == 0);

    // Age the task in the stored document
    Result<Board> stored = fx.store.load(InstanceRouter::store_key("default"));
    REQUIRE(stored.success);
    Board aged = stored.value;
    aged.find_task(a)->updated_at -= 3LL * 24 * 60 * 60 * 1000;
    REQUIRE(fx.store.save(InstanceRouter::store_key("default"), aged, aged.version,
                          std::vector<ArchivedTask>()).success);

    Result<int> some = fx.engine->archive_stale(1);
    REQUIRE(some.success);
    CHECK(some.value == 1);
    CHECK(fx.ids_in("Done").empty());
    CHECK(fx.ids_in("Done", "other").size() == 1);
}

TEST_CASE("GitHub issues open and close tasks", "[engine]") {
    EngineFixture fx(5);

    GithubIssueEvent opened;
    opened.action = "opened";
    opened.number = 42;
    opened.title = "Crash on start";
    opened.repository = "acme/widgets";
    opened.labels.push_back("bug");
    opened.url = "https://github.com/acme/widgets/issues/42";

    Result<std::string> created = fx.engine->github_issue(opened);
    REQUIRE(created.success);
    REQUIRE_FALSE(created.value.empty());

    Result<TaskView> task = fx.engine->show("acme-widgets", created.value);
    REQUIRE(task.success);
    CHECK(task.value.task.title == "#42: Crash on start");
    CHECK(task.value.column == "Backlog");
    REQUIRE(task.value.task.links.size() == 1);

    GithubIssueEvent closed = opened;
    closed.action = "closed";
    Result<std::string> moved = fx.engine->github_issue(closed);
    REQUIRE(moved.success);
    CHECK(moved.value == created.value);
    CHECK(fx.column_of(created.value, "acme-widgets") == "Done");

    GithubIssueEvent labeled = opened;
    labeled.action = "labeled";
    Result<std::string> ignored = fx.engine->github_issue(labeled);
    REQUIRE(ignored.success);
    CHECK(ignored.value.empty());

    GithubIssueEvent invalid;
    invalid.action = "opened";
    CHECK(fx.engine->github_issue(invalid).code == ErrorCode::VALIDATION);
}

TEST_CASE("Failed mutations publish no events", "[engine]") {
    EngineFixture fx(1);
    std::string a = fx.add("A");
    std::string b = fx.add("B");
    REQUIRE(fx.engine->move("", a, "In Progress").success);

    uint64_t before = fx.events.published();
    CHECK_FALSE(fx.engine->move("", b, "In Progress").success);
    CHECK_FALSE(fx.engine->drop("", "ghost").success);
    CHECK(fx.events.published() == before);

    REQUIRE(fx.engine->move("", b, "Todo").success);
    CHECK(fx.events.published() == before + 1);
}

TEST_CASE("A write conflict is retried once before it surfaces", "[engine]") {
    EngineFixture fx(5);
    ConflictingStore store(&fx.store);
    BoardEngine engine(&store, &fx.locks, &fx.events, &fx.router, fx.options);

    NewTask spec;
    spec.title = "A";
    Result<TaskView> added = engine.add("", spec, Actor::HUMAN);
    REQUIRE(added.success);
    const std::string a = added.value.task.id;

    SECTION("one conflict is absorbed by the retry") {
        store.conflicts = 1;
        store.attempts = 0;
        uint64_t before = fx.events.published();

        Result<TaskView> moved = engine.move("", a, "Todo");
        REQUIRE(moved.success);
        CHECK(store.attempts == 2);
        CHECK(fx.column_of(a) == "Todo");
        CHECK(fx.events.published() == before + 1);
    }

    SECTION("a second conflict is reported and nothing changes") {
        store.conflicts = 2;
        store.attempts = 0;
        Result<Board> snapshot = engine.board("");
        REQUIRE(snapshot.success);
        uint64_t before = fx.events.published();

        Result<TaskView> moved = engine.move("", a, "Todo");
        CHECK_FALSE(moved.success);
        CHECK(moved.code == ErrorCode::CONFLICT_ON_WRITE);
        CHECK(store.attempts == 2);

        Result<Board> after = engine.board("");
        REQUIRE(after.success);
        CHECK(after.value.version == snapshot.value.version);
        CHECK(after.value.column_of(a) == "Backlog");
        CHECK(fx.events.published() == before);
    }
}

TEST_CASE("A board can be linked to a project folder", "[engine]") {
    EngineFixture fx(5);
    fx.options.projects_root = "/";
    BoardEngine engine(&fx.store, &fx.locks, &fx.events, &fx.router, fx.options);
    REQUIRE(engine.board("web").success);

    uint64_t before = fx.events.published();
    Result<Board> linked = engine.link_project("web", "tmp");
    REQUIRE(linked.success);
    CHECK(linked.value.project_root == "/tmp");
    CHECK(fx.events.published() == before + 1);

    SECTION("linking the same folder again changes nothing") {
        REQUIRE(engine.link_project("web", "/tmp").success);
        CHECK(fx.events.published() == before + 1);
    }

    SECTION("a missing folder is NotFound and keeps the old link") {
        Result<Board> missing = engine.link_project("web", "kanboard-no-such-project");
        CHECK(missing.code == ErrorCode::NOT_FOUND);
        CHECK(engine.board("web").value.project_root == "/tmp");
        CHECK(fx.events.published() == before + 1);
    }

    SECTION("the folder is required") {
        CHECK(engine.link_project("web", "  ").code == ErrorCode::VALIDATION);
    }

    SECTION("board listings show the link") {
        Result<std::vector<BoardMeta> > all = engine.boards();
        REQUIRE(all.success);
        REQUIRE(all.value.size() == 1);
        CHECK(all.value[0].project_root == "/tmp");
    }
}
