#include "cleanup/Coordinator.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace std::chrono;

namespace ferry::cleanup {

Coordinator::Coordinator(const config::CleanupConfig& cfg)
    : AsyncService("CleanupCoordinator"),
      retryInterval_(cfg.retry_interval),
      timeout_(duration_cast<milliseconds>(cfg.timeout)) {
    if (retryInterval_ <= milliseconds::zero())
        throw std::invalid_argument("[CleanupCoordinator] Retry interval must be positive");
    if (timeout_ <= milliseconds::zero())
        throw std::invalid_argument("[CleanupCoordinator] Timeout must be positive");
}

Coordinator::~Coordinator() {
    stop();
}

void Coordinator::enqueue(const std::shared_ptr<storage::Engine>& engine,
                          const std::shared_ptr<storage::Handle>& folder,
                          const std::string& name) {
    StagingRecord record;
    record.engine = engine;
    record.folder = folder;
    record.name = name;
    record.enqueuedAt = record.nextAttempt = Clock::now();
    enqueue(std::move(record));
}

void Coordinator::enqueue(StagingRecord record) {
    if (!record.isSentinel() && (!record.engine || !record.folder || record.name.empty()))
        throw std::invalid_argument("[CleanupCoordinator] Record needs an engine, a folder and a name");

    {
        std::scoped_lock lock(mutex_);
        if (closed_) throw std::logic_error("[CleanupCoordinator] enqueue() after waitForCleanup()");
        if (record.isSentinel()) closed_ = true;
        else log::Registry::cleanup()->debug("[CleanupCoordinator] Pending delete of {}", record.path().string());
        queue_.push_back(std::move(record));
    }
    cv_.notify_all();
}

CleanupStats Coordinator::waitForCleanup() {
    {
        std::scoped_lock lock(mutex_);
        if (finished_) return stats_;
    }

    enqueue(StagingRecord::sentinel());
    start();
    join();

    std::scoped_lock lock(mutex_);
    finished_ = true;
    log::Registry::cleanup()->debug("[CleanupCoordinator] Done: {} deleted, {} timed out",
                                    stats_.deleted, stats_.timedOut);
    return stats_;
}

std::size_t Coordinator::pending() {
    std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::ranges::count_if(queue_, [](const StagingRecord& r) { return !r.isSentinel(); }));
}

void Coordinator::runLoop() {
    std::unique_lock lock(mutex_);

    while (!shouldStop()) {
        if (queue_.empty()) {
            cv_.wait(lock, [this] { return !queue_.empty() || shouldStop(); });
            continue;
        }

        if (queue_.size() == 1 && queue_.front().isSentinel()) {
            queue_.clear();
            break;
        }

        const auto due = std::ranges::min_element(queue_, {}, &StagingRecord::nextAttempt);
        if (due->nextAttempt > Clock::now()) {
            const auto wakeAt = due->nextAttempt;
            cv_.wait_until(lock, wakeAt, [this] { return shouldStop(); });
            continue;
        }

        auto record = std::move(*due);
        queue_.erase(due);

        lock.unlock();
        const bool settled = attempt(record);
        lock.lock();

        if (!settled) queue_.push_back(std::move(record));
    }
}

bool Coordinator::attempt(StagingRecord& record) {
    const auto now = Clock::now();
    const auto path = record.path().string();

    bool removed = false;
    try {
        removed = record.engine->remove(*record.folder, record.name);
        record.lastError.clear();
    } catch (const std::exception& e) {
        record.lastError = e.what();
        log::Registry::cleanup()->debug("[CleanupCoordinator] Delete of {} failed: {}", path, e.what());
    }

    if (removed) {
        log::Registry::cleanup()->debug("[CleanupCoordinator] Deleted {}", path);
        std::scoped_lock lock(mutex_);
        ++stats_.deleted;
        return true;
    }

    if (now - record.enqueuedAt >= timeout_) {
        if (record.lastError.empty())
            log::Registry::cleanup()->warn("[CleanupCoordinator] LockTimeout: {} still in use after {}s, leaving it",
                                           path, duration_cast<seconds>(timeout_).count());
        else
            log::Registry::cleanup()->warn("[CleanupCoordinator] LockTimeout: {} not deleted after {}s, leaving it: {}",
                                           path, duration_cast<seconds>(timeout_).count(), record.lastError);
        std::scoped_lock lock(mutex_);
        ++stats_.timedOut;
        return true;
    }

    record.nextAttempt = now + retryInterval_;
    log::Registry::cleanup()->trace("[CleanupCoordinator] {} is locked, retrying in {}ms", path, retryInterval_.count());
    return false;
}

}
