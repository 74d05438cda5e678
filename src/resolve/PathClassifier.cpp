#include "resolve/PathClassifier.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <boost/algorithm/string/predicate.hpp>

namespace fs = std::filesystem;

namespace ferry::resolve {

PathClassifier::PathClassifier(const device::Enumerator& enumerator, fs::path workingDir)
    : enumerator_(enumerator), workingDir_(std::move(workingDir)) {}

bool PathClassifier::hasHostRoot(const std::string& path) {
    if (path.empty()) return false;
    if (util::isSeparator(path.front()) || path.front() == '~' || path.front() == '.') return true;
    return path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':';
}

model::Location PathClassifier::classify(const std::string& path, const std::optional<device::Device>& device) {
    using model::LocationKind;

    if (!device || hasHostRoot(path)) return {LocationKind::Host, path};

    const auto first = util::firstSegment(path);
    if (first.empty()) return {LocationKind::Host, path};

    const auto& folders = topLevelFolders(*device);
    if (!std::ranges::binary_search(folders, first)) return {LocationKind::Host, path};

    if (hostHasSubdirectory(first)) {
        log::Registry::resolve()->debug("[PathClassifier] '{}' exists on '{}' and under {}",
                                        first, device->name, workingDir_.string());
        return {LocationKind::Ambiguous, path};
    }

    return {LocationKind::DeviceStore, path};
}

const std::vector<std::string>& PathClassifier::topLevelFolders(const device::Device& device) {
    std::scoped_lock lock(mutex_);

    auto it = topLevelCache_.find(device.id);
    if (it == topLevelCache_.end()) {
        it = topLevelCache_.emplace(device.id, enumerator_.topLevelFolders(device)).first;
        std::ranges::sort(it->second);
        log::Registry::resolve()->debug("[PathClassifier] '{}' has {} top-level folder(s)", device.name, it->second.size());
    }

    return it->second;
}

bool PathClassifier::hostHasSubdirectory(const std::string& segment) const {
    std::error_code ec;
    for (fs::directory_iterator it(workingDir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc) && boost::algorithm::iequals(it->path().filename().string(), segment))
            return true;
    }
    return false;
}

}
