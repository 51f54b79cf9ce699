/*
 * kanboard C++ - Shared test fixtures
 */
#ifndef kanboard_TESTS_TEST_SUPPORT_HPP
#define kanboard_TESTS_TEST_SUPPORT_HPP

#include <kanboard/board/engine.hpp>
#include <kanboard/board/events.hpp>
#include <kanboard/board/lock_manager.hpp>
#include <kanboard/board/router.hpp>
#include <kanboard/core/logger.hpp>
#include <kanboard/core/utils.hpp>
#include <kanboard/store/memory_store.hpp>

#include <memory>
#include <string>
#include <vector>

namespace kanboard {
namespace testing {

// Engine over an in-memory store with the five default columns and
// "In Progress" limited to one task
struct EngineFixture {
    InMemoryBoardStore store;
    InstanceRouter router;
    EventBroadcaster events;
    LockManager locks;
    EngineOptions options;
    std::unique_ptr<BoardEngine> engine;

    explicit EngineFixture(int in_progress_limit = 1)
        : events(256)
        , locks(&store, 30000) {
        Logger::instance().set_level(LogLevel::ERROR);
        options.wip_limits.clear();
        options.wip_limits["In Progress"] = in_progress_limit;
        options.done_cap = 0;
        options.lock_timeout_ms = 500;
        engine.reset(new BoardEngine(&store, &locks, &events, &router, options));
    }

    std::string add(const std::string& title, const std::string& board = "") {
        NewTask spec;
        spec.title = title;
        Result<TaskView> r = engine->add(board, spec, Actor::HUMAN);
        return r.success ? r.value.task.id : std::string();
    }

    std::string add_blocked(const std::string& title, const std::vector<std::string>& blockers) {
        NewTask spec;
        spec.title = title;
        spec.blocked_by = blockers;
        Result<TaskView> r = engine->add("", spec, Actor::AI);
        return r.success ? r.value.task.id : std::string();
    }

    std::string column_of(const std::string& id, const std::string& board = "") {
        Result<Board> b = engine->board(board);
        return b.success ? b.value.column_of(id) : std::string();
    }

    std::vector<std::string> ids_in(const std::string& column, const std::string& board = "") {
        Result<Board> b = engine->board(board);
        if (!b.success) return std::vector<std::string>();
        const Column* c = b.value.find_column(column);
        return c ? c->task_ids : std::vector<std::string>();
    }
};

} // namespace testing
} // namespace kanboard

#endif // kanboard_TESTS_TEST_SUPPORT_HPP
