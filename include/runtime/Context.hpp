#pragma once

#include "config/Config.hpp"
#include "device/Device.hpp"
#include "cleanup/Coordinator.hpp"

#include <filesystem>
#include <memory>
#include <optional>

namespace ferry::device {
class Enumerator;
}

namespace ferry::storage {
class Engine;
class HostEngine;
class DeviceEngine;
}

namespace ferry::resolve {
class PathClassifier;
class SourceResolver;
}

namespace ferry::transfer {
class StagingArea;
class Stager;
}

namespace ferry::runtime {

// Everything one run needs, built up front and torn down in reverse: pending
// cleanup is waited for, then the staging area is wiped, on every exit path.
class Context {
public:
    Context(const config::Config& cfg, const device::Enumerator& enumerator,
            std::optional<device::Device> device, bool dryRun = false,
            std::filesystem::path workingDir = {});
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    [[nodiscard]] const config::Config& config() const { return cfg_; }

    [[nodiscard]] const std::shared_ptr<storage::HostEngine>& host() const { return host_; }
    [[nodiscard]] const std::shared_ptr<storage::DeviceEngine>& device() const { return device_; }

    // HostEngine or DeviceEngine for a resolved location kind.
    [[nodiscard]] std::shared_ptr<storage::Engine> engineFor(bool isDevice) const;

    [[nodiscard]] resolve::SourceResolver& resolver() { return *resolver_; }
    [[nodiscard]] transfer::Stager& stager() { return *stager_; }
    [[nodiscard]] transfer::StagingArea& staging() { return *staging_; }
    [[nodiscard]] cleanup::Coordinator& cleanup() { return *cleanup_; }

    cleanup::CleanupStats waitForCleanup();

private:
    config::Config cfg_;
    std::shared_ptr<storage::HostEngine> host_;
    std::shared_ptr<storage::DeviceEngine> device_;
    std::unique_ptr<resolve::PathClassifier> classifier_;
    std::unique_ptr<resolve::SourceResolver> resolver_;
    std::unique_ptr<transfer::StagingArea> staging_;
    std::unique_ptr<cleanup::Coordinator> cleanup_;
    std::unique_ptr<transfer::Stager> stager_;
};

}
