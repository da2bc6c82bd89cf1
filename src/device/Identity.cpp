#include "device/Identity.hpp"
#include "crypto/encode.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

using namespace fa::device;

namespace {

std::string readMachineId(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) return {};
    std::string id;
    std::getline(in, id);
    std::erase_if(id, [](const unsigned char c) { return std::isspace(c); });
    return id;
}

}

Identity Identity::fromConfig(const config::DeviceConfig& cfg, const std::filesystem::path& machineIdPath) {
    Identity id;
    id.serial = cfg.serial;
    if (id.serial.empty()) id.serial = readMachineId(machineIdPath);
    if (id.serial.empty()) id.serial = crypto::random_token("0123456789abcdef", 32);

    id.name = cfg.name.empty() ? id.serial : cfg.name;
    id.device_class = cfg.device_class;
    id.company = cfg.company;
    id.info = cfg.auto_device_text;
    return id;
}
