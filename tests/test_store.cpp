/*
 * kanboard C++ - Board store tests (both backends)
 */
#include <catch2/catch.hpp>
#include <kanboard/core/logger.hpp>
#include <kanboard/store/memory_store.hpp>
#include <kanboard/store/sqlite_store.hpp>

#include <cstdio>

using namespace kanboard;

namespace {

struct MemoryBackend {
    InMemoryBoardStore store;
};

struct SqliteBackend {
    SqliteBoardStore store;
    SqliteBackend() {
        Logger::instance().set_level(LogLevel::ERROR);
        store.open(":memory:");
    }
};

Board sample_board(const std::string& name, int64_t updated_at) {
    Board b = make_board(name, default_column_names(), updated_at);
    Task t;
    t.id = "t1";
    t.title = "First";
    t.created_at = updated_at;
    t.updated_at = updated_at;
    b.tasks["t1"] = t;
    b.find_column("Todo")->task_ids.push_back("t1");
    return b;
}

ArchivedTask archived_entry(const std::string& id, int64_t at) {
    ArchivedTask a;
    a.task.id = id;
    a.task.title = "old " + id;
    a.column = DONE_COLUMN;
    a.archived_at = at;
    return a;
}

} // anonymous namespace

TEMPLATE_TEST_CASE("Saves are compare-and-swap on the version", "[store]",
                   MemoryBackend, SqliteBackend) {
    TestType backend;
    BoardStore& store = backend.store;
    const std::string key = "board:alpha";

    CHECK(store.load(key).code == ErrorCode::NOT_FOUND);

    Result<int64_t> created = store.save(key, sample_board("alpha", 1000), 0, std::vector<ArchivedTask>());
    REQUIRE(created.success);
    CHECK(created.value == 1);

    Result<int64_t> duplicate = store.save(key, sample_board("alpha", 1000), 0, std::vector<ArchivedTask>());
    CHECK(duplicate.code == ErrorCode::CONFLICT_ON_WRITE);

    Result<Board> loaded = store.load(key);
    REQUIRE(loaded.success);
    CHECK(loaded.value.version == 1);
    CHECK(loaded.value.column_of("t1") == "Todo");

    Board next = loaded.value;
    next.find_column("Todo")->task_ids.clear();
    next.find_column("Review")->task_ids.push_back("t1");
    Result<int64_t> updated = store.save(key, next, 1, std::vector<ArchivedTask>());
    REQUIRE(updated.success);
    CHECK(updated.value == 2);

    // A writer still holding version 1 loses
    Result<int64_t> stale = store.save(key, loaded.value, 1, std::vector<ArchivedTask>());
    CHECK(stale.code == ErrorCode::CONFLICT_ON_WRITE);
    CHECK(store.load(key).value.column_of("t1") == "Review");
}

TEMPLATE_TEST_CASE("Archive entries are written with the save", "[store]",
                   MemoryBackend, SqliteBackend) {
    TestType backend;
    BoardStore& store = backend.store;
    const std::string key = "board:alpha";

    std::vector<ArchivedTask> first;
    first.push_back(archived_entry("a", 1000));
    REQUIRE(store.save(key, sample_board("alpha", 1000), 0, first).success);

    std::vector<ArchivedTask> second;
    second.push_back(archived_entry("b", 5000));
    REQUIRE(store.save(key, sample_board("alpha", 5000), 1, second).success);

    // A failed save writes no archive rows
    std::vector<ArchivedTask> lost;
    lost.push_back(archived_entry("c", 6000));
    CHECK_FALSE(store.save(key, sample_board("alpha", 6000), 1, lost).success);

    Result<std::vector<ArchivedTask> > archived = store.archived(key);
    REQUIRE(archived.success);
    REQUIRE(archived.value.size() == 2);
    CHECK(archived.value[0].task.id == "b");
    CHECK(archived.value[1].task.id == "a");
    CHECK(store.archive_size(key).value == 2);

    Result<int64_t> rotated = store.rotate_archive(2000);
    REQUIRE(rotated.success);
    CHECK(rotated.value == 1);
    CHECK(store.archive_size(key).value == 1);
}

TEMPLATE_TEST_CASE("Boards are listed newest first and removed with their archive", "[store]",
                   MemoryBackend, SqliteBackend) {
    TestType backend;
    BoardStore& store = backend.store;

    REQUIRE(store.save("board:old", sample_board("old", 1000), 0, std::vector<ArchivedTask>()).success);
    std::vector<ArchivedTask> entries;
    entries.push_back(archived_entry("x", 1500));
    REQUIRE(store.save("board:new", sample_board("new", 9000), 0, entries).success);

    Result<std::vector<BoardMeta> > list = store.list();
    REQUIRE(list.success);
    REQUIRE(list.value.size() == 2);
    CHECK(list.value[0].name == "new");
    CHECK(list.value[0].task_count == 1);
    CHECK(list.value[1].name == "old");

    REQUIRE(store.remove("board:new").success);
    CHECK(store.load("board:new").code == ErrorCode::NOT_FOUND);
    CHECK(store.archive_size("board:new").value == 0);
    CHECK(store.remove("board:new").code == ErrorCode::NOT_FOUND);
    CHECK(store.list().value.size() == 1);
}

TEMPLATE_TEST_CASE("Removing a board frees its write lease only", "[store]",
                   MemoryBackend, SqliteBackend) {
    TestType backend;
    BoardStore& store = backend.store;
    const int64_t now = 10000;
    const int64_t ttl = 60000;

    REQUIRE(store.save("board:alpha", sample_board("alpha", 1000), 0, std::vector<ArchivedTask>()).success);
    REQUIRE(store.save("board:alpha_2", sample_board("alpha_2", 1000), 0, std::vector<ArchivedTask>()).success);
    REQUIRE(store.try_acquire_lease("board:alpha:write", "p1", now, ttl).value);
    REQUIRE(store.try_acquire_lease("board:alpha_2:write", "p1", now, ttl).value);

    REQUIRE(store.remove("board:alpha").success);

    Result<bool> freed = store.try_acquire_lease("board:alpha:write", "p2", now + 1, ttl);
    REQUIRE(freed.success);
    CHECK(freed.value);

    Result<bool> other = store.try_acquire_lease("board:alpha_2:write", "p2", now + 1, ttl);
    REQUIRE(other.success);
    CHECK_FALSE(other.value);
}

TEMPLATE_TEST_CASE("Leases exclude other owners until they expire", "[store]",
                   MemoryBackend, SqliteBackend) {
    TestType backend;
    BoardStore& store = backend.store;
    const std::string key = "board:alpha:write";

    CHECK(store.try_acquire_lease(key, "p1", 1000, 500).value);
    CHECK(store.try_acquire_lease(key, "p1", 1100, 500).value);
    CHECK_FALSE(store.try_acquire_lease(key, "p2", 1200, 500).value);

    // Expired leases can be taken over
    CHECK(store.try_acquire_lease(key, "p2", 1700, 500).value);
    CHECK_FALSE(store.try_acquire_lease(key, "p1", 1800, 500).value);

    // Only the owner releases
    REQUIRE(store.release_lease(key, "p1").success);
    CHECK_FALSE(store.try_acquire_lease(key, "p1", 1900, 500).value);
    REQUIRE(store.release_lease(key, "p2").success);
    CHECK(store.try_acquire_lease(key, "p1", 1900, 500).value);
}

TEST_CASE("SQLite boards survive reopening the database", "[store][sqlite]") {
    Logger::instance().set_level(LogLevel::ERROR);
    const std::string path = "kanboard_store_test.db";
    std::remove(path.c_str());

    {
        SqliteBoardStore store;
        REQUIRE(store.open(path));
        REQUIRE(store.save("board:alpha", sample_board("alpha", 1000), 0,
                           std::vector<ArchivedTask>()).success);
    }
    {
        SqliteBoardStore store;
        REQUIRE(store.open(path));
        Result<Board> loaded = store.load("board:alpha");
        REQUIRE(loaded.success);
        CHECK(loaded.value.name == "alpha");
        CHECK(loaded.value.version == 1);
        CHECK(loaded.value.find_task("t1") != nullptr);
    }

    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}
