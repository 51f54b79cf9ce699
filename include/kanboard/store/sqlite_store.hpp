/*
 * kanboard C++ - SQLite Board Store
 * 
 * Tables:
 *   boards  - one row per board: key, name, version, JSON document
 *   archive - archived tasks (JSON) per board key
 *   locks   - lease rows (key, owner, expires_at)
 * 
 * One connection per store, guarded by a mutex. Several processes may
 * open the same file; WAL mode and busy_timeout handle contention.
 */
#ifndef kanboard_STORE_SQLITE_STORE_HPP
#define kanboard_STORE_SQLITE_STORE_HPP

#include <kanboard/store/store.hpp>
#include <sqlite3.h>
#include <mutex>
#include <string>

namespace kanboard {

class SqliteBoardStore : public BoardStore {
public:
    SqliteBoardStore();
    ~SqliteBoardStore() override;
    
    // ":memory:" opens a private in-memory database
    bool open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }
    
    const char* backend() const override { return "sqlite"; }
    
    Result<Board> load(const std::string& key) override;
    Result<int64_t> save(const std::string& key,
                         const Board& board,
                         int64_t expected_version,
                         const std::vector<ArchivedTask>& archive_entries) override;
    Status remove(const std::string& key) override;
    Result<std::vector<BoardMeta> > list() override;
    
    Result<std::vector<ArchivedTask> > archived(const std::string& key) override;
    Result<int64_t> archive_size(const std::string& key) override;
    Result<int64_t> rotate_archive(int64_t cutoff_ms) override;
    
    Result<bool> try_acquire_lease(const std::string& key,
                                   const std::string& owner,
                                   int64_t now_ms,
                                   int64_t ttl_ms) override;
    Status release_lease(const std::string& key, const std::string& owner) override;

private:
    sqlite3* db_;
    std::mutex mutex_;
    
    bool exec_sql(const std::string& sql);
    bool init_tables();
    bool insert_archive_rows(const std::string& key, const std::vector<ArchivedTask>& entries);
    void rollback();
    
    template<typename T>
    Result<T> storage_error(const char* what);
};

} // namespace kanboard

#endif // kanboard_STORE_SQLITE_STORE_HPP
