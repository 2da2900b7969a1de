/*
 * Scratchpad C++ - Filesystem operation results
 *
 * Every sandbox operation reports its outcome as an FsResult: a success flag,
 * an error kind and a human-readable message naming the affected path.
 */
#ifndef scratchpad_CORE_FS_RESULT_HPP
#define scratchpad_CORE_FS_RESULT_HPP

#include <string>

namespace scratchpad {

enum class FsErrorKind {
    None = 0,
    InvalidPath,     // empty or unparseable path argument
    PathTraversal,   // resolved path escapes the sandbox root
    NotFound,        // target missing where existence was required
    WrongType,       // file expected but directory found, or vice versa
    AlreadyExists,   // target present where absence was required
    IOFailure        // OS-level failure (permissions, disk full, ...)
};

const char* fs_error_kind_name(FsErrorKind kind);

struct FsResult {
    bool success;
    FsErrorKind kind;
    std::string message;

    FsResult() : success(false), kind(FsErrorKind::IOFailure) {}

    static FsResult ok(const std::string& message) {
        FsResult r;
        r.success = true;
        r.kind = FsErrorKind::None;
        r.message = message;
        return r;
    }

    static FsResult fail(FsErrorKind kind, const std::string& message) {
        FsResult r;
        r.success = false;
        r.kind = kind;
        r.message = message;
        return r;
    }
};

} // namespace scratchpad

#endif // scratchpad_CORE_FS_RESULT_HPP
