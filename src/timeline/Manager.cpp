#include "timeline/Manager.hpp"
#include "timeline/Timeline.hpp"

#include <fmt/core.h>

using namespace fa::timeline;

Manager::Manager(const runtime::Context& ctx, std::filesystem::path root)
    : ctx_(ctx), root_(std::move(root)) {}

std::shared_ptr<Manager> Manager::fromConfig(const runtime::Context& ctx) {
    const auto& cfg = ctx.conf();
    auto manager = std::make_shared<Manager>(ctx, cfg.timelines.path / cfg.device.device_class);
    for (const auto& entry : cfg.timelines.entries) manager->newTimeline(entry.name, entry.max_events);
    return manager;
}

std::shared_ptr<Timeline> Manager::newTimeline(const std::string& name, const std::optional<size_t> maxEvents) {
    if (name.empty() || name.find('/') != std::string::npos || name.starts_with('.'))
        throw std::invalid_argument(fmt::format("Invalid timeline name '{}'", name));

    auto timeline = std::make_shared<Timeline>(ctx_, root_ / name, name, maxEvents);
    {
        std::scoped_lock lock(mutex_);
        timelines_[name] = timeline;
    }
    ctx_.log->timeline()->debug("[TimelineManager] Registered timeline '{}' at {}", name, timeline->path().string());
    return timeline;
}

std::shared_ptr<Timeline> Manager::get(const std::string& name) const {
    std::scoped_lock lock(mutex_);
    const auto it = timelines_.find(name);
    if (it == timelines_.end()) throw UnknownTimeline(fmt::format("No timeline called '{}' exists", name));
    return it->second;
}

std::vector<std::shared_ptr<Timeline>> Manager::all() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::shared_ptr<Timeline>> out;
    out.reserve(timelines_.size());
    for (const auto& [_, timeline] : timelines_) out.push_back(timeline);
    return out;
}

bool Manager::empty() const {
    std::scoped_lock lock(mutex_);
    return timelines_.empty();
}
