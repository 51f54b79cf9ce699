/*
 * kanboard C++ - Lock Manager
 * 
 * Named mutual exclusion for operations that span several mutations.
 * Two levels:
 *   1. an in-process slot per key (mutex + condition variable)
 *   2. a lease row in the BoardStore so processes sharing one database
 *      exclude each other
 * 
 * with_lock() blocks up to timeout_ms for both, then fails with
 * LockTimeout. The callback runs while both are held.
 */
#ifndef kanboard_BOARD_LOCK_MANAGER_HPP
#define kanboard_BOARD_LOCK_MANAGER_HPP

#include <kanboard/core/result.hpp>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <cstdint>

namespace kanboard {

class BoardStore;

// "board:<name>:write"
std::string board_lock_key(const std::string& board_name);

class LockManager {
public:
    // store may be null (in-process locking only)
    LockManager(BoardStore* store, int64_t lease_ms);
    
    Status with_lock(const std::string& key,
                     int64_t timeout_ms,
                     const std::function<Status()>& fn);
    
    // Lease owner id for this manager ("<pid>-<uuid>")
    const std::string& owner() const { return owner_; }
    
    // True while some caller in this process holds `key`
    bool is_held(const std::string& key);

private:
    struct Slot {
        bool held;
        int users;
        std::condition_variable cv;
        Slot() : held(false), users(0) {}
    };
    
    BoardStore* store_;
    int64_t lease_ms_;
    std::string owner_;
    
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Slot> > slots_;
    
    bool acquire_local(const std::string& key, int64_t deadline_ms);
    void release_local(const std::string& key);
    Status acquire_lease(const std::string& key, int64_t deadline_ms);
    void release_lease(const std::string& key);
};

} // namespace kanboard

#endif // kanboard_BOARD_LOCK_MANAGER_HPP
