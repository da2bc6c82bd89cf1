#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <fmt/core.h>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace fa::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const char* key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw ConfigError(fmt::format("Invalid '{}' section in configuration", key));
}

Config fromNode(const YAML::Node& root) {
    Config cfg;
    if (!root.IsDefined() || root.IsNull()) throw ConfigError("Configuration is empty");
    if (!root.IsMap()) throw ConfigError("Configuration root must be a mapping");

    decodeSection(root, "server", cfg.server);
    decodeSection(root, "device", cfg.device);
    decodeSection(root, "daemon", cfg.daemon);
    decodeSection(root, "timelines", cfg.timelines);
    decodeSection(root, "samplers", cfg.samplers);
    decodeSection(root, "settings", cfg.settings);
    decodeSection(root, "firmware", cfg.firmware);
    decodeSection(root, "logging", cfg.logging);

    if (cfg.device.device_class.empty()) throw ConfigError("'device.class' is required");
    if (cfg.daemon.poll_quantum.count() == 0) throw ConfigError("'daemon.poll_quantum_ms' must be positive");

    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    try {
        auto cfg = fromNode(YAML::LoadFile(path.string()));
        cfg.path = path;
        return cfg;
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to load configuration '{}': {}", path.string(), e.what()));
    }
}

Config loadDaemonConfig(const std::filesystem::path& path) {
    auto cfg = loadConfig(path);
    if (cfg.daemon.conf.empty()) return cfg;

    const auto installed = cfg.daemon.conf.is_absolute() ? cfg.daemon.conf : path.parent_path() / cfg.daemon.conf;
    std::error_code ec;
    if (std::filesystem::equivalent(installed, path, ec) || !std::filesystem::is_regular_file(installed, ec))
        return cfg;
    return loadConfig(installed);
}

Config parseConfig(const std::string& yaml) {
    try {
        return fromNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to parse configuration: {}", e.what()));
    }
}

}
