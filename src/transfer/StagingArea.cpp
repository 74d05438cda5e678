#include "transfer/StagingArea.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace ferry::transfer {

StagingArea::StagingArea(const fs::path& root) {
    const auto base = root.empty() ? fs::temp_directory_path() : root;
    fs::create_directories(base);

    path_ = base / ("ferry-" + util::randomDigits(3));
    if (fs::exists(path_)) {
        log::Registry::transfer()->debug("[StagingArea] Wiping leftover {}", path_.string());
        fs::remove_all(path_);
    }

    fs::create_directory(path_);
    log::Registry::transfer()->debug("[StagingArea] Staging in {}", path_.string());
}

StagingArea::~StagingArea() {
    wipe();
}

fs::path StagingArea::newSlot() {
    auto slot = path_ / std::to_string(nextSlot_.fetch_add(1));
    fs::create_directory(slot);
    return slot;
}

void StagingArea::wipe() noexcept {
    if (path_.empty()) return;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        // spdlog::get() instead of the registry: this runs from a destructor
        if (const auto logger = spdlog::get("transfer"))
            logger->warn("[StagingArea] Could not remove {}: {}", path_.string(), ec.message());
        return;
    }

    path_.clear();
}

}
