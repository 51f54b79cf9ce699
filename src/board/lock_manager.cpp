/*
 * kanboard C++ - Lock Manager Implementation
 */
#include <kanboard/board/lock_manager.hpp>
#include <kanboard/store/store.hpp>
#include <kanboard/core/logger.hpp>
#include <kanboard/core/utils.hpp>

#include <chrono>
#include <unistd.h>

namespace kanboard {

namespace {

const int LEASE_POLL_MS = 20;

} // anonymous namespace

std::string board_lock_key(const std::string& board_name) {
    return "board:" + board_name + ":write";
}

LockManager::LockManager(BoardStore* store, int64_t lease_ms)
    : store_(store)
    , lease_ms_(lease_ms > 0 ? lease_ms : 30000)
    , owner_(std::to_string(static_cast<long long>(getpid())) + "-" + generate_uuid()) {}

bool LockManager::is_held(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::shared_ptr<Slot> >::iterator it = slots_.find(key);
    return it != slots_.end() && it->second->held;
}

bool LockManager::acquire_local(const std::string& key, int64_t deadline_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    std::shared_ptr<Slot>& ref = slots_[key];
    if (!ref) ref = std::make_shared<Slot>();
    std::shared_ptr<Slot> slot = ref;
    slot->users++;

    while (slot->held) {
        int64_t remaining = deadline_ms - current_timestamp_ms();
        if (remaining <= 0 ||
            slot->cv.wait_for(lock, std::chrono::milliseconds(remaining)) == std::cv_status::timeout) {
            if (slot->held) {
                if (--slot->users == 0) slots_.erase(key);
                return false;
            }
        }
    }

    slot->held = true;
    return true;
}

void LockManager::release_local(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::shared_ptr<Slot> >::iterator it = slots_.find(key);
    if (it == slots_.end()) return;

    std::shared_ptr<Slot> slot = it->second;
    slot->held = false;
    if (--slot->users == 0) {
        slots_.erase(it);
    } else {
        slot->cv.notify_one();
    }
}

Status LockManager::acquire_lease(const std::string& key, int64_t deadline_ms) {
    if (!store_) return ok_status();

    for (;;) {
        Result<bool> got = store_->try_acquire_lease(key, owner_, current_timestamp_ms(), lease_ms_);
        if (!got.success) return Status::fail(got);
        if (got.value) return ok_status();

        if (current_timestamp_ms() >= deadline_ms) {
            return Status::fail(ErrorCode::LOCK_TIMEOUT,
                                "Lock " + key + " is held by another process");
        }
        sleep_ms(LEASE_POLL_MS);
    }
}

void LockManager::release_lease(const std::string& key) {
    if (!store_) return;
    Status released = store_->release_lease(key, owner_);
    if (!released.success) {
        // The lease expires on its own after lease_ms
        LOG_WARN("[LockManager] Failed to release lease %s: %s", key.c_str(), released.error.c_str());
    }
}

Status LockManager::with_lock(const std::string& key,
                              int64_t timeout_ms,
                              const std::function<Status()>& fn) {
    int64_t start = current_timestamp_ms();
    int64_t deadline = start + (timeout_ms > 0 ? timeout_ms : 0);

    if (!acquire_local(key, deadline)) {
        LOG_WARN("[LockManager] Timed out after %lldms waiting for %s",
                 (long long)timeout_ms, key.c_str());
        return Status::fail(ErrorCode::LOCK_TIMEOUT,
                            "Timed out waiting for lock " + key);
    }

    Status lease = acquire_lease(key, deadline);
    if (!lease.success) {
        release_local(key);
        LOG_WARN("[LockManager] %s", lease.error.c_str());
        return lease;
    }

    LOG_DEBUG("[LockManager] Acquired %s after %lldms",
              key.c_str(), (long long)(current_timestamp_ms() - start));

    Status result;
    try {
        result = fn();
    } catch (...) {
        release_lease(key);
        release_local(key);
        throw;
    }

    release_lease(key);
    release_local(key);
    return result;
}

} // namespace kanboard
