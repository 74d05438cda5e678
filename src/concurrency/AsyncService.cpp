#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

namespace ferry::concurrency {

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
}

void AsyncService::start() {
    if (isRunning() || worker_.joinable()) return;

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::ferry()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::ferry()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::ferry()->debug("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(mutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    cv_.notify_all();

    join();
    log::Registry::ferry()->debug("[{}] Service stopped.", serviceName_);
}

void AsyncService::join() {
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
    running_.store(false, std::memory_order_release);
}

}
