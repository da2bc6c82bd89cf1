#pragma once

#include "config/Config.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace fa::log {

// Owns one spdlog logger per subsystem. Loggers are not registered with spdlog's
// global registry; components reach them through the runtime::Context they are given.
class Registry {
public:
    explicit Registry(const config::LoggingConfig& cfg);

    // Every subsystem logs to a null sink. Used by tests and tools.
    static std::shared_ptr<Registry> silent();

    [[nodiscard]] std::shared_ptr<spdlog::logger> get(const std::string& name) const;

    [[nodiscard]] std::shared_ptr<spdlog::logger> agent() const    { return get("agent"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> sync() const     { return get("sync"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> rpc() const      { return get("rpc"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> timeline() const { return get("timeline"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> control() const  { return get("control"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> tasks() const    { return get("tasks"); }
    [[nodiscard]] std::shared_ptr<spdlog::logger> firmware() const { return get("firmware"); }

    void flush() const;

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr size_t MAIN_MAX_BYTES = 10 * 1024 * 1024; // 10 MiB
    static constexpr size_t MAIN_MAX_FILES = 5;

    Registry() = default;

    void add(const std::string& name, const std::vector<spdlog::sink_ptr>& sinks, spdlog::level::level_enum lvl);

    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
};

}
