#pragma once

#include "config/Config.hpp"

#include <cmath>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fa::config;

template<>
struct convert<ServerConfig> {
    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.url = node["url"].as<std::string>(rhs.url);
        rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<unsigned int>(30));
        return true;
    }
};

template<>
struct convert<DeviceConfig> {
    static bool decode(const Node& node, DeviceConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.serial = node["serial"].as<std::string>("");
        rhs.name = node["name"].as<std::string>("");
        rhs.device_class = node["class"].as<std::string>("");
        rhs.company = node["company"].as<std::string>("");
        rhs.auth = node["auth"].as<std::string>("");
        rhs.auto_device_text = node["auto_device_text"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<DaemonConfig> {
    static bool decode(const Node& node, DaemonConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto pollSeconds = node["poll_seconds"].as<double>(60.0);
        if (pollSeconds < 0) return false;
        rhs.poll_interval = std::chrono::milliseconds(std::llround(pollSeconds * 1000.0));
        rhs.poll_quantum = std::chrono::milliseconds(node["poll_quantum_ms"].as<unsigned int>(250));
        rhs.check_firmware = node["check_firmware"].as<bool>(true);
        rhs.control_host = node["control_host"].as<std::string>("127.0.0.1");
        rhs.control_port = node["control_port"].as<uint16_t>(8888);
        rhs.restart_grace = std::chrono::milliseconds(node["restart_grace_ms"].as<unsigned int>(1000));
        rhs.conf = node["conf"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<TimelineEntryConfig> {
    static bool decode(const Node& node, TimelineEntryConfig& rhs) {
        if (!node.IsMap() || !node["name"]) return false;
        rhs.name = node["name"].as<std::string>();
        if (const auto max = node["max_events"]; max && !max.IsNull()) rhs.max_events = max.as<std::size_t>();
        return true;
    }
};

template<>
struct convert<TimelinesConfig> {
    static bool decode(const Node& node, TimelinesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = node["path"].as<std::string>(rhs.path.string());
        if (node["entries"]) rhs.entries = node["entries"].as<std::vector<TimelineEntryConfig>>();
        return true;
    }
};

template<>
struct convert<SamplersConfig> {
    static bool decode(const Node& node, SamplersConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = node["path"].as<std::string>(rhs.path.string());
        if (node["names"]) rhs.names = node["names"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<SettingsConfig> {
    static bool decode(const Node& node, SettingsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = node["path"].as<std::string>(rhs.path.string());
        return true;
    }
};

template<>
struct convert<FirmwareConfig> {
    static bool decode(const Node& node, FirmwareConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.version_file = node["version_file"].as<std::string>(rhs.version_file.string());
        rhs.install_path = node["install_path"].as<std::string>(rhs.install_path.string());
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.agent = spdlog::level::from_str(node["agent"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.rpc = spdlog::level::from_str(node["rpc"].as<std::string>("warn"));
        rhs.timeline = spdlog::level::from_str(node["timeline"].as<std::string>("warn"));
        rhs.control = spdlog::level::from_str(node["control"].as<std::string>("info"));
        rhs.tasks = spdlog::level::from_str(node["tasks"].as<std::string>("warn"));
        rhs.firmware = spdlog::level::from_str(node["firmware"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
