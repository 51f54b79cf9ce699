/*
 * kanboard C++ - SQLite Board Store Implementation
 *
 * Board snapshots are stored as JSON documents. Versioned writes use
 * UPDATE ... WHERE version = ? and check sqlite3_changes().
 */
#include <kanboard/store/sqlite_store.hpp>
#include <kanboard/core/logger.hpp>
#include <kanboard/core/utils.hpp>

namespace kanboard {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

} // anonymous namespace

SqliteBoardStore::SqliteBoardStore() : db_(nullptr) {}

SqliteBoardStore::~SqliteBoardStore() {
    close();
}

bool SqliteBoardStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    if (db_path != ":memory:" && !create_parent_directory(db_path)) {
        LOG_ERROR("[BoardStore] Failed to create parent directory for '%s'", db_path.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[BoardStore] Failed to open database '%s': %s",
                  db_path.c_str(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // WAL lets readers in other processes proceed while one writes
    if (!exec_sql("PRAGMA journal_mode=WAL") ||
        !exec_sql("PRAGMA synchronous=NORMAL") ||
        !exec_sql("PRAGMA busy_timeout=5000")) {
        LOG_WARN("[BoardStore] Could not apply pragmas to '%s'", db_path.c_str());
    }

    if (!init_tables()) {
        LOG_ERROR("[BoardStore] Failed to initialize tables");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("[BoardStore] Database opened: %s", db_path.c_str());
    return true;
}

void SqliteBoardStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteBoardStore::exec_sql(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        LOG_ERROR("[BoardStore] SQL error: %s\n  Query: %s",
                  err_msg ? err_msg : "unknown", sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }

    return true;
}

bool SqliteBoardStore::init_tables() {
    bool ok = exec_sql(
        "CREATE TABLE IF NOT EXISTS boards ("
        "  key TEXT PRIMARY KEY,"
        "  name TEXT NOT NULL,"
        "  version INTEGER NOT NULL,"
        "  document TEXT NOT NULL,"
        "  project_root TEXT DEFAULT '',"
        "  task_count INTEGER DEFAULT 0,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ")"
    );
    if (!ok) return false;

    ok = exec_sql(
        "CREATE TABLE IF NOT EXISTS archive ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  board_key TEXT NOT NULL,"
        "  task_id TEXT NOT NULL,"
        "  column_name TEXT NOT NULL,"
        "  document TEXT NOT NULL,"
        "  archived_at INTEGER NOT NULL"
        ")"
    );
    if (!ok) return false;

    ok = exec_sql("CREATE INDEX IF NOT EXISTS idx_archive_board ON archive(board_key, archived_at)");
    if (!ok) return false;

    return exec_sql(
        "CREATE TABLE IF NOT EXISTS locks ("
        "  key TEXT PRIMARY KEY,"
        "  owner TEXT NOT NULL,"
        "  expires_at INTEGER NOT NULL"
        ")"
    );
}

template<typename T>
Result<T> SqliteBoardStore::storage_error(const char* what) {
    std::string msg = std::string(what) + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open");
    LOG_ERROR("[BoardStore] %s", msg.c_str());
    return Result<T>::fail(ErrorCode::STORAGE, msg);
}

void SqliteBoardStore::rollback() {
    if (!exec_sql("ROLLBACK")) {
        LOG_WARN("[BoardStore] Rollback failed, transaction may already be closed");
    }
}

// ============================================================================
// Boards
// ============================================================================

Result<Board> SqliteBoardStore::load(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return storage_error<Board>("load");

    const char* sql = "SELECT version, document FROM boards WHERE key = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return storage_error<Board>("load prepare failed");

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return Result<Board>::fail(ErrorCode::NOT_FOUND, "Board not found: " + key);
    }
    if (rc != SQLITE_ROW) {
        Result<Board> err = storage_error<Board>("load step failed");
        sqlite3_finalize(stmt);
        return err;
    }

    int64_t version = sqlite3_column_int64(stmt, 0);
    std::string document = column_text(stmt, 1);
    sqlite3_finalize(stmt);

    Json doc = Json::parse(document, nullptr, false);
    Board board;
    std::string error;
    if (doc.is_discarded() || !board_from_document(doc, board, error)) {
        if (error.empty()) error = "malformed JSON";
        LOG_ERROR("[BoardStore] Corrupt document for %s: %s", key.c_str(), error.c_str());
        return Result<Board>::fail(ErrorCode::STORAGE, "Corrupt board document " + key + ": " + error);
    }
    board.version = version;
    return Result<Board>::ok(board);
}

bool SqliteBoardStore::insert_archive_rows(const std::string& key,
                                           const std::vector<ArchivedTask>& entries) {
    if (entries.empty()) return true;

    const char* sql =
        "INSERT INTO archive (board_key, task_id, column_name, document, archived_at) "
        "VALUES (?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return false;

    for (size_t i = 0; i < entries.size(); ++i) {
        std::string document = task_to_json(entries[i].task, entries[i].column).dump();
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, entries[i].task.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, entries[i].column.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, document.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 5, entries[i].archived_at);

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            return false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }

    sqlite3_finalize(stmt);
    return true;
}

Result<int64_t> SqliteBoardStore::save(const std::string& key,
                                       const Board& board,
                                       int64_t expected_version,
                                       const std::vector<ArchivedTask>& archive_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return storage_error<int64_t>("save");

    std::string document = board_to_document(board).dump();
    int64_t new_version = expected_version + 1;

    if (!exec_sql("BEGIN IMMEDIATE")) return storage_error<int64_t>("save begin failed");

    const char* sql = expected_version == 0
        ? "INSERT INTO boards (name, version, document, project_root, task_count, created_at, updated_at, key) "
          "VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
        : "UPDATE boards SET name = ?, version = ?, document = ?, project_root = ?, "
          "task_count = ?, created_at = ?, updated_at = ? WHERE key = ? AND version = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        Result<int64_t> err = storage_error<int64_t>("save prepare failed");
        rollback();
        return err;
    }

    sqlite3_bind_text(stmt, 1, board.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, new_version);
    sqlite3_bind_text(stmt, 3, document.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, board.project_root.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, static_cast<int64_t>(board.tasks.size()));
    sqlite3_bind_int64(stmt, 6, board.created_at);
    sqlite3_bind_int64(stmt, 7, board.updated_at);
    sqlite3_bind_text(stmt, 8, key.c_str(), -1, SQLITE_TRANSIENT);
    if (expected_version != 0) {
        sqlite3_bind_int64(stmt, 9, expected_version);
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (expected_version == 0 && (rc & 0xff) == SQLITE_CONSTRAINT) {
        rollback();
        return Result<int64_t>::fail(ErrorCode::CONFLICT_ON_WRITE, "Board already exists: " + key);
    }
    if (rc != SQLITE_DONE) {
        Result<int64_t> err = storage_error<int64_t>("save step failed");
        rollback();
        return err;
    }
    if (expected_version != 0 && sqlite3_changes(db_) == 0) {
        rollback();
        return Result<int64_t>::fail(ErrorCode::CONFLICT_ON_WRITE,
                                     "Board " + key + " changed since it was read");
    }

    if (!insert_archive_rows(key, archive_entries)) {
        Result<int64_t> err = storage_error<int64_t>("archive insert failed");
        rollback();
        return err;
    }

    if (!exec_sql("COMMIT")) {
        Result<int64_t> err = storage_error<int64_t>("save commit failed");
        rollback();
        return err;
    }

    LOG_DEBUG("[BoardStore] Saved %s v%lld (%zu tasks, %zu archived)",
              key.c_str(), (long long)new_version, board.tasks.size(), archive_entries.size());
    return Result<int64_t>::ok(new_version);
}

Status SqliteBoardStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return storage_error<bool>("remove");

    if (!exec_sql("BEGIN IMMEDIATE")) return storage_error<bool>("remove begin failed");

    const char* statements[] = {
        "DELETE FROM boards WHERE key = ?",
        "DELETE FROM archive WHERE board_key = ?",
        "DELETE FROM locks WHERE key = ?1 OR substr(key, 1, length(?1) + 1) = ?1 || ':'"
    };

    int removed = 0;
    for (size_t i = 0; i < sizeof(statements) / sizeof(statements[0]); ++i) {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, statements[i], -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            Status err = storage_error<bool>("remove prepare failed");
            rollback();
            return err;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            Status err = storage_error<bool>("remove step failed");
            rollback();
            return err;
        }
        if (i == 0) removed = sqlite3_changes(db_);
    }

    if (removed == 0) {
        rollback();
        return Status::fail(ErrorCode::NOT_FOUND, "Board not found: " + key);
    }

    if (!exec_sql("COMMIT")) {
        Status err = storage_error<bool>("remove commit failed");
        rollback();
        return err;
    }

    LOG_INFO("[BoardStore] Removed %s", key.c_str());
    return ok_status();
}

Result<std::vector<BoardMeta> > SqliteBoardStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    typedef Result<std::vector<BoardMeta> > ListResult;
    if (!db_) return storage_error<std::vector<BoardMeta> >("list");

    const char* sql =
        "SELECT name, project_root, task_count, created_at, updated_at "
        "FROM boards ORDER BY updated_at DESC, name ASC";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return storage_error<std::vector<BoardMeta> >("list prepare failed");

    std::vector<BoardMeta> out;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        BoardMeta m;
        m.name = column_text(stmt, 0);
        m.project_root = column_text(stmt, 1);
        m.task_count = static_cast<size_t>(sqlite3_column_int64(stmt, 2));
        m.created_at = sqlite3_column_int64(stmt, 3);
        m.updated_at = sqlite3_column_int64(stmt, 4);
        out.push_back(m);
    }

    if (rc != SQLITE_DONE) {
        ListResult err = storage_error<std::vector<BoardMeta> >("list step failed");
        sqlite3_finalize(stmt);
        return err;
    }
    sqlite3_finalize(stmt);
    return ListResult::ok(out);
}

// ============================================================================
// Archive
// ============================================================================

Result<std::vector<ArchivedTask> > SqliteBoardStore::archived(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    typedef Result<std::vector<ArchivedTask> > ArchiveResult;
    if (!db_) return storage_error<std::vector<ArchivedTask> >("archived");

    const char* sql =
        "SELECT column_name, document, archived_at FROM archive "
        "WHERE board_key = ? ORDER BY archived_at DESC, id DESC";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return storage_error<std::vector<ArchivedTask> >("archived prepare failed");

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ArchivedTask> out;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ArchivedTask a;
        a.column = column_text(stmt, 0);
        a.archived_at = sqlite3_column_int64(stmt, 2);

        Json doc = Json::parse(column_text(stmt, 1), nullptr, false);
        std::string error;
        if (doc.is_discarded() || !task_from_json(doc, a.task, error)) {
            LOG_WARN("[BoardStore] Skipping unreadable archive row for %s: %s",
                     key.c_str(), error.empty() ? "malformed JSON" : error.c_str());
            continue;
        }
        out.push_back(a);
    }

    if (rc != SQLITE_DONE) {
        ArchiveResult err = storage_error<std::vector<ArchivedTask> >("archived step failed");
        sqlite3_finalize(stmt);
        return err;
    }
    sqlite3_finalize(stmt);
    return ArchiveResult::ok(out);
}

Result<int64_t> SqliteBoardStore::archive_size(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return storage_error<int64_t>("archive_size");

    const char* sql = "SELECT COUNT(*) FROM archive WHERE board_key = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return storage_error<int64_t>("archive_size prepare failed");

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int64_t count = 0;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    } else {
        Result<int64_t> err = storage_error<int64_t>("archive_size step failed");
        sqlite3_finalize(stmt);
        return err;
    }
    sqlite3_finalize(stmt);
    return Result<int64_t>::ok(count);
}

Result<int64_t> SqliteBoardStore::rotate_archive(int64_t cutoff_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return storage_error<int64_t>("rotate_archive");

    const char* sql = "DELETE FROM archive WHERE archived_at < ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return storage_error<int64_t>("rotate_archive prepare failed");

    sqlite3_bind_int64(stmt, 1, cutoff_ms);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) return storage_error<int64_t>("rotate_archive step failed");

    int64_t removed = sqlite3_changes(db_);
    if (removed > 0) {
        LOG_INFO("[BoardStore] Rotated %lld archived tasks", (long long)removed);
    }
    return Result<int64_t>::ok(removed);
}

// ============================================================================
// Leases
// ============================================================================

Result<bool> SqliteBoardStore::try_acquire_lease(const std::string& key,
                                                 const std::string& owner,
                                                 int64_t now_ms,
                                                 int64_t ttl_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return storage_error<bool>("try_acquire_lease");

    // Take over a free or expired row, or extend our own
    const char* sql =
        "INSERT INTO locks (key, owner, expires_at) VALUES (?, ?, ?) "
        "ON CONFLICT(key) DO UPDATE SET owner = excluded.owner, expires_at = excluded.expires_at "
        "WHERE locks.expires_at <= ? OR locks.owner = excluded.owner";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return storage_error<bool>("lease prepare failed");

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, now_ms + ttl_ms);
    sqlite3_bind_int64(stmt, 4, now_ms);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_BUSY) {
        return Result<bool>::ok(false);
    }
    if (rc != SQLITE_DONE) return storage_error<bool>("lease step failed");

    return Result<bool>::ok(sqlite3_changes(db_) > 0);
}

Status SqliteBoardStore::release_lease(const std::string& key, const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return storage_error<bool>("release_lease");

    const char* sql = "DELETE FROM locks WHERE key = ? AND owner = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) return storage_error<bool>("release prepare failed");

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, owner.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) return storage_error<bool>("release step failed");
    return ok_status();
}

} // namespace kanboard
