#pragma once

#include "model/Location.hpp"
#include "device/Device.hpp"
#include "device/Enumerator.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry::resolve {

// Decides whether a raw path names host storage or a device store.
//
// Device top-level folders match case-sensitively (the device namespace is
// case-sensitive); host subdirectories match case-insensitively. A relative
// path whose first segment hits both is Ambiguous. Top-level folder names are
// fetched once per device.
class PathClassifier {
public:
    PathClassifier(const device::Enumerator& enumerator, std::filesystem::path workingDir);

    [[nodiscard]] model::Location classify(const std::string& path, const std::optional<device::Device>& device);

    // True for "/x", "~", "~/x", "C:", "C:\x", ".", "./x", "..".
    static bool hasHostRoot(const std::string& path);

private:
    const device::Enumerator& enumerator_;
    std::filesystem::path workingDir_;

    std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> topLevelCache_;

    const std::vector<std::string>& topLevelFolders(const device::Device& device);
    [[nodiscard]] bool hostHasSubdirectory(const std::string& segment) const;
};

}
