#pragma once

#include "device/Enumerator.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <vector>

namespace ferry::device {

// Finds devices mounted by gvfs (or any daemon that exposes one directory per
// device under a common root, named "<prefix><id>").
class MountEnumerator final : public Enumerator {
public:
    explicit MountEnumerator(const config::DevicesConfig& cfg);

    [[nodiscard]] std::vector<Device> list() const override;

    [[nodiscard]] const std::vector<std::filesystem::path>& roots() const { return roots_; }

    static std::filesystem::path defaultMountRoot();

    // "SAMSUNG_SAMSUNG_Android_R58M" -> "SAMSUNG SAMSUNG Android R58M"
    static std::string displayName(const std::string& entry, const std::string& prefix);

private:
    std::vector<std::filesystem::path> roots_;
    std::string prefix_;
};

}
