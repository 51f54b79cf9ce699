/*
 * kanboard C++ - In-memory Board Store Implementation
 */
#include <kanboard/store/memory_store.hpp>
#include <kanboard/core/logger.hpp>
#include <kanboard/core/utils.hpp>
#include <algorithm>

namespace kanboard {

namespace {

bool newer_first(const BoardMeta& a, const BoardMeta& b) {
    if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
    return a.name < b.name;
}

} // anonymous namespace

Result<Board> InMemoryBoardStore::load(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Board>::const_iterator it = boards_.find(key);
    if (it == boards_.end()) {
        return Result<Board>::fail(ErrorCode::NOT_FOUND, "Board not found: " + key);
    }
    return Result<Board>::ok(it->second);
}

Result<int64_t> InMemoryBoardStore::save(const std::string& key,
                                         const Board& board,
                                         int64_t expected_version,
                                         const std::vector<ArchivedTask>& archive_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Board>::iterator it = boards_.find(key);

    int64_t current = it == boards_.end() ? 0 : it->second.version;
    if (expected_version == 0 && it != boards_.end()) {
        return Result<int64_t>::fail(ErrorCode::CONFLICT_ON_WRITE, "Board already exists: " + key);
    }
    if (expected_version != 0 && (it == boards_.end() || current != expected_version)) {
        return Result<int64_t>::fail(ErrorCode::CONFLICT_ON_WRITE,
                                     "Board " + key + " changed since it was read");
    }

    Board stored = board;
    stored.version = current + 1;
    boards_[key] = stored;

    std::vector<ArchivedTask>& arch = archive_[key];
    arch.insert(arch.end(), archive_entries.begin(), archive_entries.end());

    LOG_DEBUG("[BoardStore] memory save %s -> v%lld", key.c_str(), (long long)stored.version);
    return Result<int64_t>::ok(stored.version);
}

Status InMemoryBoardStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (boards_.erase(key) == 0) {
        return Status::fail(ErrorCode::NOT_FOUND, "Board not found: " + key);
    }
    archive_.erase(key);
    const std::string prefix = key + ":";
    for (std::map<std::string, Lease>::iterator it = leases_.begin(); it != leases_.end();) {
        if (it->first == key || starts_with(it->first, prefix)) {
            it = leases_.erase(it);
        } else {
            ++it;
        }
    }
    return ok_status();
}

Result<std::vector<BoardMeta> > InMemoryBoardStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BoardMeta> out;
    for (std::map<std::string, Board>::const_iterator it = boards_.begin(); it != boards_.end(); ++it) {
        BoardMeta m;
        m.name = it->second.name;
        m.project_root = it->second.project_root;
        m.task_count = it->second.tasks.size();
        m.created_at = it->second.created_at;
        m.updated_at = it->second.updated_at;
        out.push_back(m);
    }
    std::sort(out.begin(), out.end(), newer_first);
    return Result<std::vector<BoardMeta> >::ok(out);
}

Result<std::vector<ArchivedTask> > InMemoryBoardStore::archived(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ArchivedTask> out;
    std::map<std::string, std::vector<ArchivedTask> >::const_iterator it = archive_.find(key);
    if (it != archive_.end()) {
        out.assign(it->second.rbegin(), it->second.rend());
    }
    return Result<std::vector<ArchivedTask> >::ok(out);
}

Result<int64_t> InMemoryBoardStore::archive_size(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::vector<ArchivedTask> >::const_iterator it = archive_.find(key);
    return Result<int64_t>::ok(it == archive_.end() ? 0 : static_cast<int64_t>(it->second.size()));
}

Result<int64_t> InMemoryBoardStore::rotate_archive(int64_t cutoff_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t removed = 0;
    for (std::map<std::string, std::vector<ArchivedTask> >::iterator it = archive_.begin();
         it != archive_.end(); ++it) {
        std::vector<ArchivedTask> kept;
        for (size_t i = 0; i < it->second.size(); ++i) {
            if (it->second[i].archived_at < cutoff_ms) {
                ++removed;
            } else {
                kept.push_back(it->second[i]);
            }
        }
        it->second.swap(kept);
    }
    return Result<int64_t>::ok(removed);
}

Result<bool> InMemoryBoardStore::try_acquire_lease(const std::string& key,
                                                   const std::string& owner,
                                                   int64_t now_ms,
                                                   int64_t ttl_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Lease>::iterator it = leases_.find(key);
    if (it != leases_.end() && it->second.owner != owner && it->second.expires_at > now_ms) {
        return Result<bool>::ok(false);
    }
    Lease l;
    l.owner = owner;
    l.expires_at = now_ms + ttl_ms;
    leases_[key] = l;
    return Result<bool>::ok(true);
}

Status InMemoryBoardStore::release_lease(const std::string& key, const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Lease>::iterator it = leases_.find(key);
    if (it != leases_.end() && it->second.owner == owner) {
        leases_.erase(it);
    }
    return ok_status();
}

} // namespace kanboard
