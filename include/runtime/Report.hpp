#pragma once

#include "transfer/TransferResult.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace ferry::runtime {

enum class Status { Success, Warning, Failure };

std::string to_string(Status status);

// Process exit code: 0, 1 or 2.
int exitCode(Status status);

struct Report {
    Status status = Status::Success;
    std::string source;
    std::string destination;
    transfer::TransferMode mode = transfer::TransferMode::Copy;
    bool dryRun = false;

    std::string device;                 // empty for host-only runs
    std::string error;                  // resolution error, status is Failure
    std::optional<std::string> errorCode;

    std::size_t matched = 0;
    std::size_t transferred = 0;
    std::size_t failed = 0;
    std::size_t skippedFolders = 0;
    std::size_t renamed = 0;
    std::size_t cleanupDeleted = 0;
    std::size_t cleanupTimedOut = 0;

    std::vector<transfer::TransferResult> items;

    // Status from the counters, for runs that got past resolution.
    void settle();
};

void to_json(nlohmann::json& j, const Report& r);

}
