#include "storage/DeviceEngine.hpp"
#include "util/files.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace ferry::storage {

DeviceEngine::DeviceEngine(device::Device device)
    : device_(std::move(device)) {}

std::shared_ptr<Handle> DeviceEngine::root() const {
    return std::make_shared<DeviceHandle>(device_.mountPoint, device_.name);
}

std::shared_ptr<Handle> DeviceEngine::getFolder(const std::string& path) const {
    std::shared_ptr<Handle> current = root();
    for (const auto& segment : util::splitSegments(path)) {
        current = current->resolveChild(segment);
        if (!current || !current->isFolder()) return nullptr;
    }
    return current;
}

std::shared_ptr<Handle> DeviceEngine::createFolder(const Handle& parent, const std::string& name) {
    const auto target = parent.nativePath() / name;
    fs::create_directory(target);
    log::Registry::storage()->debug("[DeviceEngine] Created folder {} on {}", name, device_.name);
    return std::make_shared<DeviceHandle>(target);
}

std::shared_ptr<Handle> DeviceEngine::copyInto(const Handle& folder, const Handle& item, const std::string& asName) {
    const auto target = folder.nativePath() / (asName.empty() ? item.name() : asName);
    util::copyFile(item.nativePath(), target);
    return std::make_shared<DeviceHandle>(target);
}

std::shared_ptr<Handle> DeviceEngine::moveInto(const Handle& folder, const Handle& item, const std::string& asName) {
    const auto target = folder.nativePath() / (asName.empty() ? item.name() : asName);
    util::moveFile(item.nativePath(), target);
    return std::make_shared<DeviceHandle>(target);
}

bool DeviceEngine::remove(const Handle& folder, const std::string& name) {
    const auto target = folder.nativePath() / name;
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(target, ec))) return true;
    if (util::isLocked(target)) return false;

    fs::remove(target);
    return true;
}

}
