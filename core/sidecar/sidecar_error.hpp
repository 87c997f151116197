#pragma once

#include <string>
#include <utility>

namespace littera {
namespace sidecar {

// Failure categories surfaced by the sidecar and command layers.
// None of them are retried automatically; the caller decides.
enum class ErrorCode {
    NONE,
    LAUNCH_FAILED,           // executable missing or failed to start
    READ_FAILED,             // I/O error on the worker's stdout
    EXITED_BEFORE_READY,     // stdout closed before the readiness line
    MALFORMED_READY_SIGNAL,  // readiness line carried an unparseable port
    READY_TIMEOUT,           // configured readiness deadline elapsed
    NOT_READY,               // no active worker in the slot
    INVALID_WORK_DIR,        // path lacks the work marker directory
    LOCK_FAILED,             // slot mutex could not be acquired
    INIT_FAILED              // one-shot init subprocess failed
};

struct SidecarError {
    ErrorCode code = ErrorCode::NONE;
    std::string message;

    void set(ErrorCode c, std::string msg) {
        code = c;
        message = std::move(msg);
    }

    void clear() {
        code = ErrorCode::NONE;
        message.clear();
    }
};

inline const char *error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::LAUNCH_FAILED:
            return "LAUNCH_FAILED";
        case ErrorCode::READ_FAILED:
            return "READ_FAILED";
        case ErrorCode::EXITED_BEFORE_READY:
            return "EXITED_BEFORE_READY";
        case ErrorCode::MALFORMED_READY_SIGNAL:
            return "MALFORMED_READY_SIGNAL";
        case ErrorCode::READY_TIMEOUT:
            return "READY_TIMEOUT";
        case ErrorCode::NOT_READY:
            return "NOT_READY";
        case ErrorCode::INVALID_WORK_DIR:
            return "INVALID_WORK_DIR";
        case ErrorCode::LOCK_FAILED:
            return "LOCK_FAILED";
        case ErrorCode::INIT_FAILED:
            return "INIT_FAILED";
        default:
            return "UNKNOWN";
    }
}

}  // namespace sidecar
}  // namespace littera
