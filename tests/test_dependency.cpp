/*
 * kanboard C++ - Dependency resolution tests
 */
#include <catch2/catch.hpp>
#include <kanboard/board/dependency.hpp>

#include <random>

using namespace kanboard;

namespace {

Board board_with(const std::vector<std::pair<std::string, std::string> >& placement) {
    Board b = make_board("deps", default_column_names(), 0);
    for (size_t i = 0; i < placement.size(); ++i) {
        Task t;
        t.id = placement[i].first;
        t.title = placement[i].first;
        b.tasks[t.id] = t;
        b.find_column(placement[i].second)->task_ids.push_back(t.id);
    }
    return b;
}

} // anonymous namespace

TEST_CASE("A task without blockers is resolved", "[dependency]") {
    std::vector<std::pair<std::string, std::string> > placement;
    placement.push_back(std::make_pair("a", "Todo"));
    Board b = board_with(placement);

    CHECK(is_resolved(b, "a"));
    CHECK(unresolved(b, "a").empty());
}

TEST_CASE("Blockers outside Done keep a task unresolved", "[dependency]") {
    std::vector<std::pair<std::string, std::string> > placement;
    placement.push_back(std::make_pair("a", "In Progress"));
    placement.push_back(std::make_pair("b", "Done"));
    placement.push_back(std::make_pair("c", "Backlog"));
    Board b = board_with(placement);

    b.find_task("c")->blocked_by.push_back("a");
    b.find_task("c")->blocked_by.push_back("b");

    std::vector<std::string> blocking = unresolved(b, "c");
    REQUIRE(blocking.size() == 1);
    CHECK(blocking[0] == "a");
    CHECK_FALSE(is_resolved(b, "c"));

    b.find_column("In Progress")->task_ids.clear();
    b.find_column("Done")->task_ids.push_back("a");
    CHECK(is_resolved(b, "c"));
}

TEST_CASE("Dangling and self references count as resolved", "[dependency]") {
    std::vector<std::pair<std::string, std::string> > placement;
    placement.push_back(std::make_pair("a", "Todo"));
    Board b = board_with(placement);

    b.find_task("a")->blocked_by.push_back("a");
    b.find_task("a")->blocked_by.push_back("deleted-long-ago");
    CHECK(is_resolved(b, "a"));
}

TEST_CASE("Unknown tasks report nothing", "[dependency]") {
    Board b = board_with(std::vector<std::pair<std::string, std::string> >());
    CHECK(unresolved(b, "missing").empty());
}

TEST_CASE("Resolution matches a direct recomputation on random graphs", "[dependency]") {
    std::mt19937 rng(20240517);
    const std::vector<std::string> columns = default_column_names();

    for (int round = 0; round < 50; ++round) {
        std::vector<std::pair<std::string, std::string> > placement;
        const int task_count = 2 + static_cast<int>(rng() % 12);
        for (int i = 0; i < task_count; ++i) {
            placement.push_back(std::make_pair("t" + std::to_string(i),
                                               columns[rng() % columns.size()]));
        }
        Board b = board_with(placement);

        for (int i = 0; i < task_count; ++i) {
            Task* t = b.find_task("t" + std::to_string(i));
            const int edges = static_cast<int>(rng() % 4);
            for (int e = 0; e < edges; ++e) {
                // Some edges point at ids that never existed, some at the task itself
                t->blocked_by.push_back("t" + std::to_string(rng() % (task_count + 3)));
            }
        }

        for (int i = 0; i < task_count; ++i) {
            const std::string id = "t" + std::to_string(i);
            const Task* t = b.find_task(id);

            bool expected = true;
            for (size_t k = 0; k < t->blocked_by.size(); ++k) {
                const std::string& dep = t->blocked_by[k];
                if (dep == id || !b.find_task(dep)) continue;
                if (b.column_of(dep) != "Done") expected = false;
            }
            CHECK(is_resolved(b, id) == expected);
        }
    }
}
