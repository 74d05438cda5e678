#pragma once

#include <filesystem>
#include <string>

namespace ferry::util {

// True while another open file description holds a flock on path. Filesystems
// without flock support (fuse mounts, gvfs) never report a lock.
bool isLocked(const std::filesystem::path& path);

// rename(2), falling back to copy + remove when source and target live on
// different filesystems. Never overwrites an existing target.
void moveFile(const std::filesystem::path& from, const std::filesystem::path& to);

// Plain copy that refuses to overwrite an existing target.
void copyFile(const std::filesystem::path& from, const std::filesystem::path& to);

// Leading "~" or "~/" becomes $HOME.
std::filesystem::path expandUser(const std::string& path);

std::string randomDigits(size_t length);

}
