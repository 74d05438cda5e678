#include "error/Error.hpp"

using namespace ferry;

Error::Error(const ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

std::string ferry::to_string(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::AmbiguousPath: return "AmbiguousPath";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::WildcardInDirectory: return "WildcardInDirectory";
        case ErrorCode::PatternConflict: return "PatternConflict";
        case ErrorCode::InvalidPathSeparator: return "InvalidPathSeparator";
        case ErrorCode::NameSpaceExhausted: return "NameSpaceExhausted";
        case ErrorCode::TransferFailed: return "TransferFailed";
        case ErrorCode::LockTimeout: return "LockTimeout";
    }
    return "Unknown";
}
