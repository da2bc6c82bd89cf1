#pragma once

#include "runtime/Context.hpp"

#include <filesystem>
#include <string>

namespace fa::firmware {

class Installer {
public:
    virtual ~Installer() = default;

    // Installs a base64-encoded firmware payload and records `version` as current.
    // Returns the install location. Throws on any failure.
    virtual std::filesystem::path install(const std::string& deviceClass, int version,
                                          const std::string& payloadB64) = 0;
};

// Unpacks to <install_path>/<device class>/<version>/firmware.bin and rewrites the
// version file.
class DirectoryInstaller final : public Installer {
public:
    explicit DirectoryInstaller(const runtime::Context& ctx);

    std::filesystem::path install(const std::string& deviceClass, int version,
                                  const std::string& payloadB64) override;

private:
    runtime::Context ctx_;
};

// The version file is YAML: `version: N`. Missing file => 1.
int readVersion(const std::filesystem::path& versionFile);
void writeVersion(const std::filesystem::path& versionFile, int version);

}
