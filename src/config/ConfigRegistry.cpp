#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace ferry::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    init(loadConfig(path));
}

void ConfigRegistry::init(const Config& config) {
    std::scoped_lock lock(mutex_);
    config_ = config;
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() {
    std::scoped_lock lock(mutex_);
    return initialized_;
}

void ConfigRegistry::ensureInitialized() {
    if (!isInitialized())
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace ferry::config
