#pragma once

#include <atomic>
#include <filesystem>

namespace ferry::transfer {

// Private working directory "ferry-NNN" under the staging root. Created empty,
// wiped again on destruction. Each staged file gets its own numbered slot so
// renames inside the area never collide.
class StagingArea {
public:
    // Empty root means the platform temp directory.
    explicit StagingArea(const std::filesystem::path& root = {});
    ~StagingArea();

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // Creates and returns a fresh empty slot directory.
    std::filesystem::path newSlot();

    // Removes the area and everything in it. Safe to call more than once.
    void wipe() noexcept;

private:
    std::filesystem::path path_;
    std::atomic<unsigned> nextSlot_{0};
};

}
