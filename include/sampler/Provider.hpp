#pragma once

#include "runtime/Context.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fa::sampler {

class Provider {
public:
    virtual ~Provider() = default;

    [[nodiscard]] virtual std::vector<std::string> names() const = 0;

    // Freezes pending samples into a snapshot and returns it as a JSON array. An
    // existing snapshot (left by a failed upload) is returned unchanged. Empty array
    // when nothing is pending.
    virtual nlohmann::json snapshot(const std::string& name) = 0;

    virtual void removeSnapshot(const std::string& name) = 0;
};

// Samples are appended to <root>/<name>/samples.jsonl as [timestamp_ms, value]
// lines; a snapshot lives in <root>/<name>/snapshot.json until it is uploaded.
class Manager final : public Provider {
public:
    Manager(const runtime::Context& ctx, std::filesystem::path root, std::vector<std::string> names);

    static std::shared_ptr<Manager> fromConfig(const runtime::Context& ctx);

    [[nodiscard]] std::vector<std::string> names() const override { return names_; }

    void sample(const std::string& name, double value, std::optional<int64_t> timestamp = std::nullopt);

    nlohmann::json snapshot(const std::string& name) override;

    void removeSnapshot(const std::string& name) override;

    [[nodiscard]] std::filesystem::path snapshotPath(const std::string& name) const;
    [[nodiscard]] std::filesystem::path samplesPath(const std::string& name) const;

private:
    runtime::Context ctx_;
    std::filesystem::path root_;
    std::vector<std::string> names_;
    std::mutex mutex_;

    void requireKnown(const std::string& name) const;
};

}
