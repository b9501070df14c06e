#pragma once

#include <string>

namespace chix::exec {

enum class ErrorCode {
    kInvalidReference,
    kInvalidAttrPath,
    kInvalidStorePath,
    kInvalidPath,
    kUnsafeArgument,
    kInvalidExpression,
    kInvalidParams,
    kSpawnFailed,
    kTimeout,
    kCancelled
};

// Stable identifiers; callers branch on these, so never rename them.
inline const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kInvalidReference: return "InvalidReference";
        case ErrorCode::kInvalidAttrPath: return "InvalidAttrPath";
        case ErrorCode::kInvalidStorePath: return "InvalidStorePath";
        case ErrorCode::kInvalidPath: return "InvalidPath";
        case ErrorCode::kUnsafeArgument: return "UnsafeArgument";
        case ErrorCode::kInvalidExpression: return "InvalidExpression";
        case ErrorCode::kInvalidParams: return "InvalidParams";
        case ErrorCode::kSpawnFailed: return "SpawnFailed";
        case ErrorCode::kTimeout: return "Timeout";
        case ErrorCode::kCancelled: return "Cancelled";
    }
    return "Unknown";
}

struct Failure {
    ErrorCode code = ErrorCode::kInvalidParams;
    std::string message;
};

}  // namespace chix::exec
