#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ferry::config {

struct TransferConfig {
    std::filesystem::path staging_root{};   // empty: platform temp directory
    bool create_destination = false;
};

struct CleanupConfig {
    std::chrono::milliseconds retry_interval{500};
    std::chrono::seconds timeout{std::chrono::minutes(5)};
};

struct ResolveConfig {
    bool skip_ambiguity_check = false;
};

struct DevicesConfig {
    std::vector<std::filesystem::path> mount_roots{};   // empty: /run/user/<uid>/gvfs
    std::string name_prefix = "mtp:host=";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum ferry    = spdlog::level::info;   // Run start, summary, shutdown
    spdlog::level::level_enum resolve  = spdlog::level::info;   // Classification and resolution decisions
    spdlog::level::level_enum transfer = spdlog::level::info;   // One line per item
    spdlog::level::level_enum cleanup  = spdlog::level::info;   // Deletions, retries, timeouts
    spdlog::level::level_enum device   = spdlog::level::info;   // Attached devices and selection
    spdlog::level::level_enum storage  = spdlog::level::warn;   // Underlying I/O issues
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir{};   // empty: paths::getLogPath()
    LogLevelsConfig levels;
};

struct Config {
    TransferConfig transfer;
    CleanupConfig cleanup;
    ResolveConfig resolve;
    DevicesConfig devices;
    LoggingConfig logging;
};

// Missing file yields the defaults above.
Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const TransferConfig& c);
void to_json(nlohmann::json& j, const CleanupConfig& c);
void to_json(nlohmann::json& j, const ResolveConfig& c);
void to_json(nlohmann::json& j, const DevicesConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace ferry::config
