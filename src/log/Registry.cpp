#include "log/Registry.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <stdexcept>

namespace fa::log {

Registry::Registry(const config::LoggingConfig& cfg) {
    const auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(cfg.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (!cfg.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cfg.log_dir)) fs::create_directories(cfg.log_dir);

        const auto logFile = cfg.log_dir / "fieldagent.log";
        const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile.string(), MAIN_MAX_BYTES, MAIN_MAX_FILES);
        rotatingSink->set_level(cfg.levels.file_log_level);
        rotatingSink->set_pattern(LOG_FORMAT);
        sinks.push_back(rotatingSink);
    }

    const auto& sub = cfg.levels.subsystem_levels;
    add("agent", sinks, sub.agent);
    add("sync", sinks, sub.sync);
    add("rpc", sinks, sub.rpc);
    add("timeline", sinks, sub.timeline);
    add("control", sinks, sub.control);
    add("tasks", sinks, sub.tasks);
    add("firmware", sinks, sub.firmware);
}

std::shared_ptr<Registry> Registry::silent() {
    std::shared_ptr<Registry> reg(new Registry());
    const std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::null_sink_mt>()};
    for (const auto* name : {"agent", "sync", "rpc", "timeline", "control", "tasks", "firmware"})
        reg->add(name, sinks, spdlog::level::off);
    return reg;
}

void Registry::add(const std::string& name, const std::vector<spdlog::sink_ptr>& sinks,
                   const spdlog::level::level_enum lvl) {
    const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    loggers_[name] = logger;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) const {
    const auto it = loggers_.find(name);
    if (it == loggers_.end()) throw std::runtime_error("[log::Registry] Logger not found: " + name);
    return it->second;
}

void Registry::flush() const {
    for (const auto& [_, logger] : loggers_) logger->flush();
}

}
