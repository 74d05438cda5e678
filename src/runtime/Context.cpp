#include "runtime/Context.hpp"
#include "storage/HostEngine.hpp"
#include "storage/DeviceEngine.hpp"
#include "resolve/PathClassifier.hpp"
#include "resolve/SourceResolver.hpp"
#include "transfer/StagingArea.hpp"
#include "transfer/Stager.hpp"
#include "log/Registry.hpp"

namespace ferry::runtime {

Context::Context(const config::Config& cfg, const device::Enumerator& enumerator,
                 std::optional<device::Device> device, const bool dryRun,
                 std::filesystem::path workingDir)
    : cfg_(cfg),
      host_(std::make_shared<storage::HostEngine>(std::move(workingDir))) {
    if (device) device_ = std::make_shared<storage::DeviceEngine>(std::move(*device));

    classifier_ = std::make_unique<resolve::PathClassifier>(enumerator, host_->workingDir());
    resolver_ = std::make_unique<resolve::SourceResolver>(*classifier_, *host_);
    staging_ = std::make_unique<transfer::StagingArea>(cfg_.transfer.staging_root);
    cleanup_ = std::make_unique<cleanup::Coordinator>(cfg_.cleanup);
    stager_ = std::make_unique<transfer::Stager>(host_, *staging_, *cleanup_, dryRun);

    cleanup_->start();
}

Context::~Context() {
    // Members are released in reverse order: the stager, then the coordinator
    // (after it drained), then the staging area, which wipes itself.
    if (cleanup_) {
        try {
            cleanup_->waitForCleanup();
        } catch (const std::exception& e) {
            if (const auto logger = spdlog::get("cleanup"))
                logger->error("[Context] Cleanup did not finish: {}", e.what());
            cleanup_->stop();
        }
    }
}

std::shared_ptr<storage::Engine> Context::engineFor(const bool isDevice) const {
    if (!isDevice) return host_;
    if (!device_) throw std::logic_error("[Context] Device location without a device");
    return device_;
}

cleanup::CleanupStats Context::waitForCleanup() {
    return cleanup_->waitForCleanup();
}

}
