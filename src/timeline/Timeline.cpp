#include "timeline/Timeline.hpp"

#include <algorithm>
#include <exception>
#include <fmt/core.h>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace fa::timeline {

namespace {

constexpr std::string_view kRecordExt = ".json";

bool isRecordFile(const fs::directory_entry& entry) {
    std::error_code ec;
    const auto filename = entry.path().filename().string();
    return entry.is_regular_file(ec) && !filename.starts_with('.') && entry.path().extension().string() == kRecordExt;
}

bool isSafeId(const std::string& id) {
    return !id.empty() && id.find('/') == std::string::npos && id != "." && id != ".." && !id.starts_with('.');
}

}

// PendingEvent

PendingEvent::PendingEvent(Timeline& timeline, Event event)
    : timeline_(&timeline), event_(std::move(event)), uncaught_(std::uncaught_exceptions()) {}

PendingEvent::PendingEvent(PendingEvent&& other) noexcept
    : timeline_(other.timeline_), event_(std::move(other.event_)), uncaught_(other.uncaught_), done_(other.done_) {
    other.done_ = true;
}

PendingEvent::~PendingEvent() {
    if (done_) return;
    if (std::uncaught_exceptions() > uncaught_) return; // unit of work failed, write nothing

    try {
        commit();
    } catch (const std::exception& e) {
        timeline_->context().log->timeline()->error("[Timeline] {}: failed to commit event {}: {}",
                                                    timeline_->name(), event_.id, e.what());
    }
}

PendingEvent& PendingEvent::attach(const fs::path& path, std::string name) {
    if (name.empty()) name = path.filename().string();
    event_.attachments.push_back({std::move(name), path});
    return *this;
}

void PendingEvent::commit() {
    if (done_) return;
    done_ = true;
    timeline_->commit(event_);
}

// Timeline

Timeline::Timeline(const runtime::Context& ctx, fs::path path, std::string name, const std::optional<size_t> maxEvents)
    : ctx_(ctx), path_(std::move(path)), name_(std::move(name)), maxEvents_(maxEvents) {
    fs::create_directories(path_);
}

PendingEvent Timeline::createEvent(const std::string_view type, const std::optional<int64_t> timestamp,
                                   const nlohmann::json& fields) {
    if (maxEvents_ && size() >= *maxEvents_)
        throw TimelineFull(fmt::format("Timeline '{}' has reached its maximum size ({})", name_, *maxEvents_));

    Event event;
    event.payload = makePayload(type, fields);
    event.timestamp = timestamp.value_or(nowMillis());
    event.id = makeEventId(type, event.timestamp);

    ctx_.log->timeline()->debug("[Timeline] {}: new event {}", name_, event.id);
    return {*this, std::move(event)};
}

Timeline& Timeline::addEvent(const std::string_view type, const std::optional<int64_t> timestamp,
                             const nlohmann::json& fields) {
    auto event = createEvent(type, timestamp, fields);
    event.commit();
    return *this;
}

void Timeline::commit(const Event& event) {
    const auto body = event.serialize().dump();
    const auto target = recordPath(event.id);
    const auto tmp = path_ / fmt::format(".{}.json.tmp", event.id);

    std::scoped_lock lock(writeMutex_);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error(fmt::format("Unable to open '{}' for writing", tmp.string()));
        out << body;
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error(fmt::format("Failed writing event {} to '{}'", event.id, tmp.string()));
        }
    }
    fs::rename(tmp, target);

    ctx_.log->timeline()->debug("[Timeline] {}: wrote {}", name_, target.filename().string());
}

std::vector<StoredEvent> Timeline::listEvents(const bool sorted) const {
    std::vector<StoredEvent> events;

    for (const auto& file : recordFiles()) {
        std::ifstream in(file, std::ios::binary);
        if (!in) continue; // cleared between listing and reading

        std::stringstream buffer;
        buffer << in.rdbuf();

        auto record = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (record.is_discarded() || !record.is_object()) {
            ctx_.log->timeline()->warn("[Timeline] {}: skipping unreadable record '{}'", name_, file.string());
            continue;
        }

        StoredEvent ev;
        try {
            ev.id = record.value("_id", file.stem().string());
            ev.timestamp = record.value("timestamp", int64_t{0});
            ev.event_type = record.value("event_type", "");
        } catch (const nlohmann::json::type_error& e) {
            ctx_.log->timeline()->warn("[Timeline] {}: skipping malformed record '{}': {}", name_, file.string(), e.what());
            continue;
        }
        ev.record = std::move(record);
        events.push_back(std::move(ev));
    }

    if (sorted) {
        std::ranges::sort(events, [](const StoredEvent& a, const StoredEvent& b) {
            if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
            return a.id < b.id;
        });
    }

    return events;
}

void Timeline::clear(const std::vector<std::string>& ids) {
    std::scoped_lock lock(writeMutex_);
    for (const auto& id : ids) {
        if (!isSafeId(id)) {
            ctx_.log->timeline()->warn("[Timeline] {}: refusing to clear suspicious event id '{}'", name_, id);
            continue;
        }
        std::error_code ec;
        fs::remove(recordPath(id), ec);
        if (ec) ctx_.log->timeline()->warn("[Timeline] {}: unable to remove {}: {}", name_, id, ec.message());
    }
}

void Timeline::clearAll() {
    std::scoped_lock lock(writeMutex_);
    for (const auto& file : recordFiles()) {
        std::error_code ec;
        fs::remove(file, ec);
    }
}

size_t Timeline::size() const {
    return recordFiles().size();
}

std::vector<fs::path> Timeline::recordFiles() const {
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator it(path_, ec), end; !ec && it != end; it.increment(ec))
        if (isRecordFile(*it)) files.push_back(it->path());
    return files;
}

fs::path Timeline::recordPath(const std::string& eventId) const {
    return path_ / (eventId + std::string(kRecordExt));
}

}
