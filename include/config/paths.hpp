#pragma once

#include <filesystem>

namespace ferry::paths {

// --config wins over $FERRY_CONFIG, which wins over the XDG location.
std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();

void setConfigPath(const std::filesystem::path& path);
void setLogPath(const std::filesystem::path& path);
void setLogPathForTesting();

}
