#include "config/paths.hpp"

#include <cstdlib>
#include <mutex>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::mutex pathsMutex;
fs::path configOverride;
fs::path logOverride;

fs::path envPath(const char* name) {
    if (const char* v = std::getenv(name); v && *v) return {v};
    return {};
}

fs::path homeDir() {
    if (auto home = envPath("HOME"); !home.empty()) return home;
    return fs::temp_directory_path();
}

}

namespace ferry::paths {

fs::path getConfigPath() {
    {
        std::scoped_lock lock(pathsMutex);
        if (!configOverride.empty()) return configOverride;
    }
    if (auto p = envPath("FERRY_CONFIG"); !p.empty()) return p;
    if (auto xdg = envPath("XDG_CONFIG_HOME"); !xdg.empty()) return xdg / "ferry" / "config.yaml";
    return homeDir() / ".config" / "ferry" / "config.yaml";
}

fs::path getLogPath() {
    {
        std::scoped_lock lock(pathsMutex);
        if (!logOverride.empty()) return logOverride;
    }
    if (auto xdg = envPath("XDG_STATE_HOME"); !xdg.empty()) return xdg / "ferry";
    return homeDir() / ".local" / "state" / "ferry";
}

void setConfigPath(const fs::path& path) {
    std::scoped_lock lock(pathsMutex);
    configOverride = path;
}

void setLogPath(const fs::path& path) {
    std::scoped_lock lock(pathsMutex);
    logOverride = path;
}

void setLogPathForTesting() {
    setLogPath(fs::temp_directory_path() / ("ferry_test_logs_" + std::to_string(::getpid())));
}

}
