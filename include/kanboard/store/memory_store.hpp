/*
 * kanboard C++ - In-memory Board Store
 * 
 * Same semantics as the SQLite store, kept in process memory.
 * Used by tests and by store.backend = "memory".
 */
#ifndef kanboard_STORE_MEMORY_STORE_HPP
#define kanboard_STORE_MEMORY_STORE_HPP

#include <kanboard/store/store.hpp>
#include <map>
#include <mutex>

namespace kanboard {

class InMemoryBoardStore : public BoardStore {
public:
    InMemoryBoardStore() {}
    
    const char* backend() const override { return "memory"; }
    
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
    struct Lease {
        std::string owner;
        int64_t expires_at;
        Lease() : expires_at(0) {}
    };
    
    std::mutex mutex_;
    std::map<std::string, Board> boards_;
    std::map<std::string, std::vector<ArchivedTask> > archive_;
    std::map<std::string, Lease> leases_;
};

} // namespace kanboard

#endif // kanboard_STORE_MEMORY_STORE_HPP
