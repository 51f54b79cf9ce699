/*
 * kanboard C++ - Dependency resolution
 */
#include <kanboard/board/dependency.hpp>

namespace kanboard {

std::vector<std::string> unresolved(const Board& board, const std::string& task_id) {
    std::vector<std::string> blocking;
    const Task* task = board.find_task(task_id);
    if (!task) return blocking;

    for (size_t i = 0; i < task->blocked_by.size(); ++i) {
        const std::string& dep = task->blocked_by[i];
        if (dep == task_id) continue;
        if (!board.find_task(dep)) continue;    // dangling
        if (board.column_of(dep) != DONE_COLUMN) {
            blocking.push_back(dep);
        }
    }
    return blocking;
}

bool is_resolved(const Board& board, const std::string& task_id) {
    return unresolved(board, task_id).empty();
}

} // namespace kanboard
