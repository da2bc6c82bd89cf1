#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace fa::config {

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string url = "https://api.fieldagent.io/jsonrpc";
    std::chrono::seconds timeout = std::chrono::seconds(30);
};

struct DeviceConfig {
    std::string serial;            // empty => derived at startup
    std::string name;              // empty => serial
    std::string device_class;
    std::string company;
    std::string auth;              // inline token or "file:<path>"
    std::string auto_device_text;
};

struct DaemonConfig {
    std::chrono::milliseconds poll_interval = std::chrono::seconds(60);
    std::chrono::milliseconds poll_quantum = std::chrono::milliseconds(250);
    bool check_firmware = true;
    std::string control_host = "127.0.0.1";
    uint16_t control_port = 8888;
    std::chrono::milliseconds restart_grace = std::chrono::milliseconds(1000);
    std::filesystem::path conf;  // installed override, used in place of this file when present
};

struct TimelineEntryConfig {
    std::string name;
    std::optional<std::size_t> max_events;
};

struct TimelinesConfig {
    std::filesystem::path path = "/var/lib/fieldagent/timelines";
    std::vector<TimelineEntryConfig> entries;
};

struct SamplersConfig {
    std::filesystem::path path = "/var/lib/fieldagent/samplers";
    std::vector<std::string> names;
};

struct SettingsConfig {
    std::filesystem::path path = "/var/lib/fieldagent/settings";
};

struct FirmwareConfig {
    std::filesystem::path version_file = "/var/lib/fieldagent/firmware.yaml";
    std::filesystem::path install_path = "/var/lib/fieldagent/firmware";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum agent    = spdlog::level::info;   // startup, shutdown, lifecycle transitions
    spdlog::level::level_enum sync     = spdlog::level::info;
    spdlog::level::level_enum rpc      = spdlog::level::warn;
    spdlog::level::level_enum timeline = spdlog::level::warn;
    spdlog::level::level_enum control  = spdlog::level::info;
    spdlog::level::level_enum tasks    = spdlog::level::warn;
    spdlog::level::level_enum firmware = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty => console only
    LogLevelsConfig levels;
};

struct Config {
    ServerConfig server;
    DeviceConfig device;
    DaemonConfig daemon;
    TimelinesConfig timelines;
    SamplersConfig samplers;
    SettingsConfig settings;
    FirmwareConfig firmware;
    LoggingConfig logging;

    std::filesystem::path path;  // file this was loaded from, if any
};

Config loadConfig(const std::filesystem::path& path);

// Loads `path`, then the file named by its `daemon.conf` if that file exists.
// A relative `daemon.conf` is taken from the directory of `path`.
// The override is followed once; its own `daemon.conf` is not.
Config loadDaemonConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

}
