#pragma once

#include "concurrency/AsyncService.hpp"
#include "cleanup/StagingRecord.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <cstddef>
#include <deque>

namespace ferry::cleanup {

struct CleanupStats {
    std::size_t deleted = 0;
    std::size_t timedOut = 0;
};

// Deletes staged and source files in the background once their store lets go
// of them. A record whose delete keeps failing is retried every interval and
// dropped with a LockTimeout warning once it is older than the timeout.
//
// Records move Pending -> Deleted, or Pending -> TimedOut. The worker exits
// when the sentinel is the only entry left.
class Coordinator final : public concurrency::AsyncService {
public:
    explicit Coordinator(const config::CleanupConfig& cfg);
    ~Coordinator() override;

    void enqueue(const std::shared_ptr<storage::Engine>& engine,
                 const std::shared_ptr<storage::Handle>& folder,
                 const std::string& name);

    void enqueue(StagingRecord record);

    // Enqueues the sentinel and blocks until every record is Deleted or TimedOut.
    // Starts the worker if nobody did. Later calls return the same stats.
    CleanupStats waitForCleanup();

    [[nodiscard]] std::size_t pending();

    [[nodiscard]] std::chrono::milliseconds retryInterval() const { return retryInterval_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

protected:
    void runLoop() override;

private:
    std::chrono::milliseconds retryInterval_;
    std::chrono::milliseconds timeout_;

    std::deque<StagingRecord> queue_;
    bool closed_ = false;
    bool finished_ = false;
    CleanupStats stats_;

    // Returns true when the record is settled (deleted or timed out).
    bool attempt(StagingRecord& record);
};

}
