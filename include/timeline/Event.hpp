#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace fa::timeline {

struct UnknownEventKind : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct TimelineFull : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct UnknownTimeline : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct TextEvent {
    static constexpr std::string_view kType = "TEXT";

    std::string title;
    std::string text;
    std::string text_format = "TEXT";
};

struct ImageEvent {
    static constexpr std::string_view kType = "IMAGE";

    std::string title;
    std::string text;
    std::string image_format = "jpg";
};

using Payload = std::variant<TextEvent, ImageEvent>;

void to_json(nlohmann::json& j, const TextEvent& e);
void from_json(const nlohmann::json& j, TextEvent& e);
void to_json(nlohmann::json& j, const ImageEvent& e);
void from_json(const nlohmann::json& j, ImageEvent& e);

// Builds the payload variant registered under `type` from its fields.
// Throws UnknownEventKind when no variant carries that tag.
Payload makePayload(std::string_view type, const nlohmann::json& fields);

[[nodiscard]] bool isKnownEventType(std::string_view type);

struct Attachment {
    std::string name;
    std::filesystem::path path;
};

struct Event {
    std::string id;
    int64_t timestamp{0};
    Payload payload;
    std::vector<Attachment> attachments;

    [[nodiscard]] std::string_view type() const;

    // Payload fields plus timestamp, event_type and _id. Attachment files are read here.
    [[nodiscard]] nlohmann::json serialize() const;
};

// An event as read back from disk.
struct StoredEvent {
    std::string id;
    int64_t timestamp{0};
    std::string event_type;
    nlohmann::json record;
};

[[nodiscard]] std::string makeEventId(std::string_view type, int64_t timestamp);

[[nodiscard]] int64_t nowMillis();

}
