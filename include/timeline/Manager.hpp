#pragma once

#include "runtime/Context.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fa::timeline {

class Timeline;

class Manager {
public:
    Manager(const runtime::Context& ctx, std::filesystem::path root);

    // One timeline per configured entry under <timelines.path>/<device class>.
    static std::shared_ptr<Manager> fromConfig(const runtime::Context& ctx);

    std::shared_ptr<Timeline> newTimeline(const std::string& name, std::optional<size_t> maxEvents = std::nullopt);

    // Throws UnknownTimeline.
    [[nodiscard]] std::shared_ptr<Timeline> get(const std::string& name) const;

    [[nodiscard]] std::vector<std::shared_ptr<Timeline>> all() const;

    [[nodiscard]] bool empty() const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    runtime::Context ctx_;
    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Timeline>> timelines_;
};

}
