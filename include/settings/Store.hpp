#pragma once

#include "runtime/Context.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fa::settings {

class Store {
public:
    virtual ~Store() = default;

    // {setting name: contents} for every local settings document.
    [[nodiscard]] virtual nlohmann::json contentsMap() const = 0;

    // Applies {setting name: contents}; returns the names written. A setting that
    // cannot be written is skipped and left out of the result.
    virtual std::vector<std::string> update(const nlohmann::json& changed) = 0;
};

// One file per setting document under a directory.
class Manager final : public Store {
public:
    Manager(const runtime::Context& ctx, std::filesystem::path dir);

    static std::shared_ptr<Manager> fromConfig(const runtime::Context& ctx);

    [[nodiscard]] nlohmann::json contentsMap() const override;

    std::vector<std::string> update(const nlohmann::json& changed) override;

    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

private:
    runtime::Context ctx_;
    std::filesystem::path dir_;
    mutable std::mutex mutex_;
};

}
