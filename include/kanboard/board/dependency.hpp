/*
 * kanboard C++ - Dependency resolution
 * 
 * A task is resolved when every id in its blockedBy set is either absent
 * from the board (dangling) or sits in Done. Self references are ignored.
 * Always evaluated against the snapshot that the gated write commits.
 */
#ifndef kanboard_BOARD_DEPENDENCY_HPP
#define kanboard_BOARD_DEPENDENCY_HPP

#include <kanboard/board/model.hpp>
#include <string>
#include <vector>

namespace kanboard {

bool is_resolved(const Board& board, const std::string& task_id);

// Blocking ids in blockedBy order; empty when resolved or the task is unknown
std::vector<std::string> unresolved(const Board& board, const std::string& task_id);

} // namespace kanboard

#endif // kanboard_BOARD_DEPENDENCY_HPP
