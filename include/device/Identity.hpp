#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <string>

namespace fa::device {

struct Identity {
    std::string serial;
    std::string name;
    std::string device_class;
    std::string company;
    std::string info;

    // Fills serial from `machineIdPath` (or a random id) and name from serial when unset.
    static Identity fromConfig(const config::DeviceConfig& cfg,
                               const std::filesystem::path& machineIdPath = "/etc/machine-id");
};

}
