#include <kanboard/core/result.hpp>

namespace kanboard {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::VALIDATION: return "ValidationError";
        case ErrorCode::DEPENDENCY_UNRESOLVED: return "DependencyUnresolved";
        case ErrorCode::WIP_LIMIT_EXCEEDED: return "WipLimitExceeded";
        case ErrorCode::LOCK_TIMEOUT: return "LockTimeout";
        case ErrorCode::CONFLICT_ON_WRITE: return "ConflictOnWrite";
        case ErrorCode::STORAGE: return "StorageError";
        default: return "Unknown";
    }
}

} // namespace kanboard
