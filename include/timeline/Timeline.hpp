#pragma once

#include "timeline/Event.hpp"
#include "runtime/Context.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fa::timeline {

class Timeline;

// Commit-on-success guard for a new event. Leaving scope normally writes the event;
// leaving by exception (or after abandon()) writes nothing.
class PendingEvent {
public:
    PendingEvent(Timeline& timeline, Event event);
    PendingEvent(PendingEvent&& other) noexcept;
    PendingEvent(const PendingEvent&) = delete;
    PendingEvent& operator=(const PendingEvent&) = delete;
    PendingEvent& operator=(PendingEvent&&) = delete;
    ~PendingEvent();

    PendingEvent& attach(const std::filesystem::path& path, std::string name = {});

    [[nodiscard]] const Event& event() const noexcept { return event_; }
    [[nodiscard]] const std::string& id() const noexcept { return event_.id; }

    void commit();
    void abandon() noexcept { done_ = true; }

    [[nodiscard]] bool done() const noexcept { return done_; }

private:
    Timeline* timeline_;
    Event event_;
    int uncaught_;
    bool done_{false};
};

class Timeline {
public:
    Timeline(const runtime::Context& ctx, std::filesystem::path path, std::string name,
             std::optional<size_t> maxEvents = std::nullopt);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::optional<size_t> maxEvents() const noexcept { return maxEvents_; }
    [[nodiscard]] const runtime::Context& context() const noexcept { return ctx_; }

    // Validates the type and the capacity; nothing is written until the returned
    // handle commits.
    PendingEvent createEvent(std::string_view type, std::optional<int64_t> timestamp = std::nullopt,
                             const nlohmann::json& fields = nlohmann::json::object());

    Timeline& addEvent(std::string_view type, std::optional<int64_t> timestamp = std::nullopt,
                       const nlohmann::json& fields = nlohmann::json::object());

    void commit(const Event& event);

    [[nodiscard]] std::vector<StoredEvent> listEvents(bool sorted = true) const;

    // Missing ids are ignored.
    void clear(const std::vector<std::string>& ids);

    void clearAll();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    runtime::Context ctx_;
    std::filesystem::path path_;
    std::string name_;
    std::optional<size_t> maxEvents_;
    mutable std::mutex writeMutex_;

    [[nodiscard]] std::vector<std::filesystem::path> recordFiles() const;
    [[nodiscard]] std::filesystem::path recordPath(const std::string& eventId) const;
};

}
