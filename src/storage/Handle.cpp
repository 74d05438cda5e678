#include "storage/Handle.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace ferry::storage {

std::string to_string(const StorageType type) {
    switch (type) {
        case StorageType::Host: return "host";
        case StorageType::Device: return "device";
        default: return "unknown";
    }
}

PathHandle::PathHandle(fs::path path, std::string name)
    : path_(std::move(path)), name_(std::move(name)) {
    if (name_.empty()) name_ = path_.filename().string();
}

bool PathHandle::isFolder() const {
    std::error_code ec;
    return fs::is_directory(path_, ec);
}

std::vector<std::shared_ptr<Handle>> PathHandle::enumerateChildren() const {
    std::vector<std::shared_ptr<Handle>> children;
    for (const auto& entry : fs::directory_iterator(path_)) children.push_back(makeChild(entry.path()));

    std::ranges::sort(children, {}, [](const std::shared_ptr<Handle>& h) { return h->name(); });
    return children;
}

std::shared_ptr<Handle> HostHandle::resolveChild(const std::string& name) const {
    const auto child = path_ / name;
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(child, ec))) return nullptr;
    return makeChild(child);
}

std::shared_ptr<Handle> HostHandle::makeChild(const fs::path& path) const {
    return std::make_shared<HostHandle>(path);
}

std::shared_ptr<Handle> DeviceHandle::resolveChild(const std::string& name) const {
    std::error_code ec;
    for (fs::directory_iterator it(path_, ec), end; !ec && it != end; it.increment(ec))
        if (it->path().filename().string() == name) return makeChild(it->path());

    if (ec) log::Registry::storage()->debug("[DeviceHandle] Listing {} failed: {}", path_.string(), ec.message());
    return nullptr;
}

std::shared_ptr<Handle> DeviceHandle::makeChild(const fs::path& path) const {
    return std::make_shared<DeviceHandle>(path);
}

}
