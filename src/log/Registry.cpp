#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"

#include <filesystem>
#include <stdexcept>

namespace ferry::log {

using config::ConfigRegistry;

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto cnf = ConfigRegistry::get().logging;

    log_dir_ = !logDir.empty() ? logDir : !cnf.log_dir.empty() ? cnf.log_dir : paths::getLogPath();
    main_log_path_ = log_dir_ / "ferry.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("ferry",    sub_levels.ferry);
    makeLogger("resolve",  sub_levels.resolve);
    makeLogger("transfer", sub_levels.transfer);
    makeLogger("cleanup",  sub_levels.cleanup);
    makeLogger("device",   sub_levels.device);
    makeLogger("storage",  sub_levels.storage);

    initialized_ = true;
    ferry()->debug("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
