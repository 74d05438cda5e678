#include "storage/HostEngine.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace ferry::storage {

HostEngine::HostEngine(fs::path workingDir)
    : workingDir_(workingDir.empty() ? fs::current_path() : std::move(workingDir)) {}

fs::path HostEngine::absolute(const std::string& path) const {
    const auto expanded = util::expandUser(path);
    auto abs = (expanded.is_absolute() ? expanded : workingDir_ / expanded).lexically_normal();

    // "dir/." normalizes to "dir/"; drop the empty filename so handles get a name.
    if (!abs.has_filename() && abs != abs.root_path()) abs = abs.parent_path();
    return abs;
}

bool HostEngine::exists(const std::string& path) const {
    std::error_code ec;
    return fs::exists(fs::symlink_status(absolute(path), ec));
}

bool HostEngine::isDirectory(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(absolute(path), ec);
}

void HostEngine::createDirectories(const std::string& path) const {
    const auto abs = absolute(path);
    fs::create_directories(abs);
    log::Registry::storage()->info("[HostEngine] Created directory {}", abs.string());
}

void HostEngine::move(const fs::path& from, const fs::path& to) const {
    util::moveFile(from, to);
}

void HostEngine::copy(const fs::path& from, const fs::path& to) const {
    util::copyFile(from, to);
}

void HostEngine::rename(const fs::path& from, const fs::path& to) const {
    if (fs::exists(fs::symlink_status(to)))
        throw fs::filesystem_error("target already exists", from, to,
                                   std::make_error_code(std::errc::file_exists));
    fs::rename(from, to);
}

bool HostEngine::removeFile(const fs::path& path) const {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(path, ec))) return true;
    if (util::isLocked(path)) return false;

    fs::remove(path);
    return true;
}

std::shared_ptr<Handle> HostEngine::getFolder(const std::string& path) const {
    const auto abs = absolute(path.empty() ? std::string(".") : path);
    std::error_code ec;
    if (!fs::is_directory(abs, ec)) return nullptr;
    return std::make_shared<HostHandle>(abs);
}

std::shared_ptr<Handle> HostEngine::createFolder(const Handle& parent, const std::string& name) {
    const auto target = parent.nativePath() / name;
    fs::create_directory(target);
    log::Registry::storage()->debug("[HostEngine] Created folder {}", target.string());
    return std::make_shared<HostHandle>(target);
}

std::shared_ptr<Handle> HostEngine::copyInto(const Handle& folder, const Handle& item, const std::string& asName) {
    const auto target = folder.nativePath() / (asName.empty() ? item.name() : asName);
    copy(item.nativePath(), target);
    return std::make_shared<HostHandle>(target);
}

std::shared_ptr<Handle> HostEngine::moveInto(const Handle& folder, const Handle& item, const std::string& asName) {
    const auto target = folder.nativePath() / (asName.empty() ? item.name() : asName);
    move(item.nativePath(), target);
    return std::make_shared<HostHandle>(target);
}

bool HostEngine::remove(const Handle& folder, const std::string& name) {
    return removeFile(folder.nativePath() / name);
}

}
