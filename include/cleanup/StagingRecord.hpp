#pragma once

#include "storage/Engine.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace ferry::cleanup {

using Clock = std::chrono::steady_clock;

// A file that must be deleted once nothing holds it open any more: a staged
// copy, or the original source of a cross-store move.
struct StagingRecord {
    std::shared_ptr<storage::Engine> engine;
    std::shared_ptr<storage::Handle> folder;
    std::string name;
    Clock::time_point enqueuedAt = Clock::now();
    Clock::time_point nextAttempt = enqueuedAt;
    std::string lastError;  // Set when the last delete threw instead of reporting a lock

    // Empty path, minimum timestamp: nothing else will be enqueued.
    static StagingRecord sentinel() {
        StagingRecord r;
        r.enqueuedAt = Clock::time_point::min();
        r.nextAttempt = Clock::time_point::max();
        return r;
    }

    [[nodiscard]] bool isSentinel() const { return name.empty() && enqueuedAt == Clock::time_point::min(); }

    [[nodiscard]] std::filesystem::path path() const {
        return folder ? folder->nativePath() / name : std::filesystem::path{};
    }
};

}
