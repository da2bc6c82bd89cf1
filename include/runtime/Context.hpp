#pragma once

#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <memory>

namespace fa::runtime {

// Handed to every component at construction in place of process-wide registries.
struct Context {
    std::shared_ptr<const config::Config> config;
    std::shared_ptr<log::Registry> log;

    [[nodiscard]] const config::Config& conf() const { return *config; }
};

}
