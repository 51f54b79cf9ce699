/*
 * kanboard C++ - Board Store
 * 
 * Opaque document store for whole-board snapshots, keyed by store key
 * ("board:<name>"). Writes are compare-and-swap on the snapshot version:
 *   save(key, board, 0)  creates the board, ConflictOnWrite if it exists
 *   save(key, board, n)  replaces version n, ConflictOnWrite otherwise
 * 
 * Each store also keeps a per-board archive and the lease rows used by
 * the LockManager for cross-process exclusion.
 */
#ifndef kanboard_STORE_STORE_HPP
#define kanboard_STORE_STORE_HPP

#include <kanboard/board/model.hpp>
#include <kanboard/core/result.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace kanboard {

class BoardStore {
public:
    virtual ~BoardStore() {}
    
    virtual const char* backend() const = 0;
    
    // Snapshot with Board::version set; NotFound when absent
    virtual Result<Board> load(const std::string& key) = 0;
    
    // Write a snapshot and append `archive_entries` to the board's archive
    // as one atomic unit. Returns the new version.
    virtual Result<int64_t> save(const std::string& key,
                                 const Board& board,
                                 int64_t expected_version,
                                 const std::vector<ArchivedTask>& archive_entries) = 0;
    
    // Removes the board, its archive and its lease rows ("<key>:..."); NotFound when absent
    virtual Status remove(const std::string& key) = 0;
    
    virtual Result<std::vector<BoardMeta> > list() = 0;
    
    // Newest first
    virtual Result<std::vector<ArchivedTask> > archived(const std::string& key) = 0;
    virtual Result<int64_t> archive_size(const std::string& key) = 0;
    
    // Drop archive entries older than cutoff on every board; returns the count
    virtual Result<int64_t> rotate_archive(int64_t cutoff_ms) = 0;
    
    // Lease rows. Acquire succeeds when the row is free, expired, or
    // already held by `owner` (which extends it).
    virtual Result<bool> try_acquire_lease(const std::string& key,
                                           const std::string& owner,
                                           int64_t now_ms,
                                           int64_t ttl_ms) = 0;
    virtual Status release_lease(const std::string& key, const std::string& owner) = 0;
};

} // namespace kanboard

#endif // kanboard_STORE_STORE_HPP
