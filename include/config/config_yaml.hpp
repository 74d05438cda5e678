#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace YAML {

using namespace ferry::config;

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["staging_root"] = rhs.staging_root.string();
        node["create_destination"] = rhs.create_destination;
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.staging_root = node["staging_root"].as<std::string>("");
        rhs.create_destination = node["create_destination"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<CleanupConfig> {
    static Node encode(const CleanupConfig& rhs) {
        Node node;
        node["retry_interval_ms"] = rhs.retry_interval.count();
        node["timeout_seconds"] = rhs.timeout.count();
        return node;
    }

    static bool decode(const Node& node, CleanupConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.retry_interval = std::chrono::milliseconds(node["retry_interval_ms"].as<unsigned int>(500));
        rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<unsigned int>(300));
        if (rhs.retry_interval.count() == 0)
            throw std::runtime_error("[Config] cleanup.retry_interval_ms must be at least 1");
        if (rhs.timeout.count() == 0)
            throw std::runtime_error("[Config] cleanup.timeout_seconds must be at least 1");
        return true;
    }
};

template<>
struct convert<ResolveConfig> {
    static Node encode(const ResolveConfig& rhs) {
        Node node;
        node["skip_ambiguity_check"] = rhs.skip_ambiguity_check;
        return node;
    }

    static bool decode(const Node& node, ResolveConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.skip_ambiguity_check = node["skip_ambiguity_check"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<DevicesConfig> {
    static Node encode(const DevicesConfig& rhs) {
        Node node;
        node["mount_roots"] = Node(NodeType::Sequence);
        for (const auto& root : rhs.mount_roots) node["mount_roots"].push_back(root.string());
        node["name_prefix"] = rhs.name_prefix;
        return node;
    }

    static bool decode(const Node& node, DevicesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mount_roots.clear();
        if (const auto roots = node["mount_roots"]; roots && roots.IsSequence())
            for (const auto& r : roots) rhs.mount_roots.emplace_back(r.as<std::string>());
        rhs.name_prefix = node["name_prefix"].as<std::string>("mtp:host=");
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["ferry"]    = to_std_string(spdlog::level::to_string_view(rhs.ferry));
        node["resolve"]  = to_std_string(spdlog::level::to_string_view(rhs.resolve));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["cleanup"]  = to_std_string(spdlog::level::to_string_view(rhs.cleanup));
        node["device"]   = to_std_string(spdlog::level::to_string_view(rhs.device));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ferry = spdlog::level::from_str(node["ferry"].as<std::string>("info"));
        rhs.resolve = spdlog::level::from_str(node["resolve"].as<std::string>("info"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("info"));
        rhs.cleanup = spdlog::level::from_str(node["cleanup"].as<std::string>("info"));
        rhs.device = spdlog::level::from_str(node["device"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
