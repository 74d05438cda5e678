#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace ferry::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    void start();

    // Interrupts runLoop() and joins the worker.
    void stop();

    // Joins the worker without interrupting it; runLoop() must finish on its own.
    void join();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    // Guards subclass state; stop() flips interruptFlag_ under it and notifies cv_.
    std::mutex mutex_;
    std::condition_variable cv_;

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    virtual void runLoop() = 0;
};

}
