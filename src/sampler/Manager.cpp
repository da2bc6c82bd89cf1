#include "sampler/Provider.hpp"
#include "timeline/Event.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

using namespace fa::sampler;

Manager::Manager(const runtime::Context& ctx, fs::path root, std::vector<std::string> names)
    : ctx_(ctx), root_(std::move(root)), names_(std::move(names)) {
    for (const auto& name : names_) {
        if (name.empty() || name.find('/') != std::string::npos || name.starts_with('.'))
            throw std::invalid_argument(fmt::format("Invalid sampler name '{}'", name));
        fs::create_directories(root_ / name);
    }
}

std::shared_ptr<Manager> Manager::fromConfig(const runtime::Context& ctx) {
    const auto& cfg = ctx.conf().samplers;
    return std::make_shared<Manager>(ctx, cfg.path, cfg.names);
}

fs::path Manager::snapshotPath(const std::string& name) const { return root_ / name / "snapshot.json"; }
fs::path Manager::samplesPath(const std::string& name) const { return root_ / name / "samples.jsonl"; }

void Manager::requireKnown(const std::string& name) const {
    if (std::ranges::find(names_, name) == names_.end())
        throw std::invalid_argument(fmt::format("No sampler called '{}'", name));
}

void Manager::sample(const std::string& name, const double value, const std::optional<int64_t> timestamp) {
    requireKnown(name);
    const nlohmann::json line = nlohmann::json::array({timestamp.value_or(timeline::nowMillis()), value});

    std::scoped_lock lock(mutex_);
    std::ofstream out(samplesPath(name), std::ios::app);
    if (!out) throw std::runtime_error(fmt::format("Unable to append to '{}'", samplesPath(name).string()));
    out << line.dump() << '\n';
}

nlohmann::json Manager::snapshot(const std::string& name) {
    requireKnown(name);
    std::scoped_lock lock(mutex_);

    const auto snap = snapshotPath(name);
    if (fs::exists(snap)) {
        std::ifstream in(snap, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        auto existing = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (!existing.is_discarded() && existing.is_array()) return existing;

        ctx_.log->sync()->error("[SamplerManager] Discarding corrupt snapshot for '{}'", name);
        fs::remove(snap);
    }

    const auto pending = samplesPath(name);
    if (!fs::exists(pending)) return nlohmann::json::array();

    auto samples = nlohmann::json::array();
    {
        std::ifstream in(pending);
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            auto s = nlohmann::json::parse(line, nullptr, false);
            if (s.is_discarded()) {
                ctx_.log->sync()->warn("[SamplerManager] Skipping malformed sample line in '{}'", name);
                continue;
            }
            samples.push_back(std::move(s));
        }
    }

    if (!samples.empty()) {
        const auto tmp = fs::path(snap.string() + ".tmp");
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            out << samples.dump();
            out.flush();
            if (!out) throw std::runtime_error(fmt::format("Unable to write snapshot for '{}'", name));
        }
        fs::rename(tmp, snap);
    }
    fs::remove(pending);

    return samples;
}

void Manager::removeSnapshot(const std::string& name) {
    requireKnown(name);
    std::scoped_lock lock(mutex_);
    std::error_code ec;
    fs::remove(snapshotPath(name), ec);
    if (ec) ctx_.log->sync()->warn("[SamplerManager] Unable to remove snapshot for '{}': {}", name, ec.message());
}
