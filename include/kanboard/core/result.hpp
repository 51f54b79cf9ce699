/*
 * kanboard C++ - Typed operation results
 * 
 * Every engine operation returns a Result<T>: either the value, or an
 * ErrorCode plus a human readable message. Errors are never thrown across
 * the engine boundary.
 */
#ifndef kanboard_CORE_RESULT_HPP
#define kanboard_CORE_RESULT_HPP

#include <string>

namespace kanboard {

enum class ErrorCode {
    OK = 0,
    NOT_FOUND,
    VALIDATION,
    DEPENDENCY_UNRESOLVED,
    WIP_LIMIT_EXCEEDED,
    LOCK_TIMEOUT,
    CONFLICT_ON_WRITE,
    STORAGE
};

// Stable wire name ("NotFound", "ValidationError", ...)
const char* error_code_name(ErrorCode code);

template<typename T>
struct Result {
    bool success;
    T value;
    ErrorCode code;
    std::string error;
    
    Result() : success(false), value(), code(ErrorCode::OK) {}
    
    static Result ok(const T& v) {
        Result r;
        r.success = true;
        r.value = v;
        return r;
    }
    
    static Result fail(ErrorCode c, const std::string& message) {
        Result r;
        r.success = false;
        r.code = c;
        r.error = message;
        return r;
    }
    
    // Re-type a failure from another operation
    template<typename U>
    static Result fail(const Result<U>& other) {
        return fail(other.code, other.error);
    }
};

// For operations that produce no value
typedef Result<bool> Status;

inline Status ok_status() { return Status::ok(true); }

} // namespace kanboard

#endif // kanboard_CORE_RESULT_HPP
