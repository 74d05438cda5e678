#include "device/Enumerator.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace ferry::device {

std::vector<std::string> Enumerator::topLevelFolders(const Device& device) const {
    std::vector<std::string> folders;

    std::error_code ec;
    for (fs::directory_iterator it(device.mountPoint, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc)) folders.push_back(it->path().filename().string());
    }

    if (ec) log::Registry::device()->warn("[Enumerator] Could not list {}: {}", device.mountPoint.string(), ec.message());

    std::ranges::sort(folders);
    return folders;
}

}
