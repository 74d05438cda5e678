#include "device/MountEnumerator.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <system_error>

#include <boost/algorithm/string.hpp>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ferry::device {

MountEnumerator::MountEnumerator(const config::DevicesConfig& cfg)
    : roots_(cfg.mount_roots), prefix_(cfg.name_prefix) {
    if (roots_.empty()) roots_.push_back(defaultMountRoot());
}

fs::path MountEnumerator::defaultMountRoot() {
    return fs::path("/run/user") / std::to_string(::getuid()) / "gvfs";
}

std::string MountEnumerator::displayName(const std::string& entry, const std::string& prefix) {
    std::string name = boost::algorithm::starts_with(entry, prefix) ? entry.substr(prefix.size()) : entry;
    boost::algorithm::replace_all(name, "_", " ");
    boost::algorithm::trim(name);
    return name.empty() ? entry : name;
}

std::vector<Device> MountEnumerator::list() const {
    std::vector<Device> devices;

    for (const auto& root : roots_) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            log::Registry::device()->debug("[MountEnumerator] Mount root {} does not exist", root.string());
            continue;
        }

        for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
            const auto entry = it->path().filename().string();
            if (!prefix_.empty() && !boost::algorithm::starts_with(entry, prefix_)) continue;

            std::error_code typeEc;
            if (!it->is_directory(typeEc)) continue;

            devices.push_back({displayName(entry, prefix_), entry, it->path()});
            log::Registry::device()->debug("[MountEnumerator] Found device '{}' at {}",
                                           devices.back().name, it->path().string());
        }

        if (ec) log::Registry::device()->warn("[MountEnumerator] Could not list {}: {}", root.string(), ec.message());
    }

    std::ranges::sort(devices, {}, &Device::name);
    return devices;
}

}
