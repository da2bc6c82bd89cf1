#include "firmware/Installer.hpp"
#include "crypto/encode.hpp"

#include <fmt/core.h>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace fa::firmware {

namespace {

void writeAtomically(const fs::path& target, const char* data, const size_t size) {
    if (target.has_parent_path()) fs::create_directories(target.parent_path());
    const auto tmp = fs::path(target.string() + ".tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error(fmt::format("Unable to open '{}' for writing", tmp.string()));
        out.write(data, static_cast<std::streamsize>(size));
        out.flush();
        if (!out) throw std::runtime_error(fmt::format("Failed writing '{}'", tmp.string()));
    }
    fs::rename(tmp, target);
}

}

int readVersion(const fs::path& versionFile) {
    if (!fs::exists(versionFile)) return 1;
    try {
        const auto root = YAML::LoadFile(versionFile.string());
        return root["version"].as<int>(1);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Invalid firmware version file '{}': {}", versionFile.string(), e.what()));
    }
}

void writeVersion(const fs::path& versionFile, const int version) {
    YAML::Emitter out;
    out << YAML::BeginMap << YAML::Key << "version" << YAML::Value << version << YAML::EndMap;
    const std::string doc = std::string(out.c_str()) + "\n";
    writeAtomically(versionFile, doc.data(), doc.size());
}

DirectoryInstaller::DirectoryInstaller(const runtime::Context& ctx) : ctx_(ctx) {}

fs::path DirectoryInstaller::install(const std::string& deviceClass, const int version, const std::string& payloadB64) {
    if (deviceClass.empty() || deviceClass.find('/') != std::string::npos || deviceClass.starts_with('.'))
        throw std::invalid_argument(fmt::format("Invalid device class '{}'", deviceClass));

    const auto& cfg = ctx_.conf().firmware;
    const auto payload = crypto::b64_decode(payloadB64);
    const auto dir = cfg.install_path / deviceClass / std::to_string(version);

    writeAtomically(dir / "firmware.bin", reinterpret_cast<const char*>(payload.data()), payload.size());
    writeVersion(cfg.version_file, version);

    ctx_.log->firmware()->info("[FirmwareInstaller] Installed firmware v{} for '{}' ({} bytes) in {}",
                               version, deviceClass, payload.size(), dir.string());
    return dir;
}

}
