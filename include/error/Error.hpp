#pragma once

#include <stdexcept>
#include <string>

namespace ferry {

enum class ErrorCode {
    InvalidArgument,
    AmbiguousPath,
    NotFound,
    WildcardInDirectory,
    PatternConflict,
    InvalidPathSeparator,
    NameSpaceExhausted,
    TransferFailed,
    LockTimeout
};

std::string to_string(const ErrorCode& code);

// Resolution-phase and allocation failures. TransferFailed and LockTimeout are
// normally reported through results and warnings, not thrown out of a batch.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}
