#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace ferry::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) return cfg;

    const YAML::Node root = YAML::LoadFile(path.string());

    if (const auto node = root["transfer"]) cfg.transfer = node.as<TransferConfig>();
    if (const auto node = root["cleanup"]) cfg.cleanup = node.as<CleanupConfig>();
    if (const auto node = root["resolve"]) cfg.resolve = node.as<ResolveConfig>();
    if (const auto node = root["devices"]) cfg.devices = node.as<DevicesConfig>();
    if (const auto node = root["logging"]) cfg.logging = node.as<LoggingConfig>();

    return cfg;
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"transfer", c.transfer},
        {"cleanup", c.cleanup},
        {"resolve", c.resolve},
        {"devices", c.devices},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const TransferConfig& c) {
    j = {
        {"staging_root", c.staging_root.string()},
        {"create_destination", c.create_destination}
    };
}

void to_json(nlohmann::json& j, const CleanupConfig& c) {
    j = {
        {"retry_interval_ms", c.retry_interval.count()},
        {"timeout_seconds", c.timeout.count()}
    };
}

void to_json(nlohmann::json& j, const ResolveConfig& c) {
    j = {{"skip_ambiguity_check", c.skip_ambiguity_check}};
}

void to_json(nlohmann::json& j, const DevicesConfig& c) {
    std::vector<std::string> roots;
    for (const auto& r : c.mount_roots) roots.push_back(r.string());
    j = {
        {"mount_roots", roots},
        {"name_prefix", c.name_prefix}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"ferry", levelName(c.ferry)},
        {"resolve", levelName(c.resolve)},
        {"transfer", levelName(c.transfer)},
        {"cleanup", levelName(c.cleanup)},
        {"device", levelName(c.device)},
        {"storage", levelName(c.storage)}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

}
