#include "timeline/Event.hpp"
#include "crypto/encode.hpp"

#include <array>
#include <chrono>
#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>

namespace fa::timeline {

namespace {

using PayloadFactory = Payload (*)(const nlohmann::json&);

template <typename T>
Payload construct(const nlohmann::json& fields) {
    return fields.get<T>();
}

constexpr std::array<std::pair<std::string_view, PayloadFactory>, 2> kRegistry{{
    {TextEvent::kType, &construct<TextEvent>},
    {ImageEvent::kType, &construct<ImageEvent>},
}};

std::vector<uint8_t> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error(fmt::format("Unable to read attachment '{}'", path.string()));
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

}

void to_json(nlohmann::json& j, const TextEvent& e) {
    j = {
        {"title", e.title},
        {"text", e.text},
        {"text_format", e.text_format}
    };
}

void from_json(const nlohmann::json& j, TextEvent& e) {
    e.title = j.value("title", "");
    e.text = j.value("text", "");
    e.text_format = j.value("text_format", "TEXT");
}

void to_json(nlohmann::json& j, const ImageEvent& e) {
    j = {
        {"title", e.title},
        {"text", e.text},
        {"image_format", e.image_format}
    };
}

void from_json(const nlohmann::json& j, ImageEvent& e) {
    e.title = j.value("title", "");
    e.text = j.value("text", "");
    e.image_format = j.value("image_format", "jpg");
}

Payload makePayload(const std::string_view type, const nlohmann::json& fields) {
    for (const auto& [tag, factory] : kRegistry)
        if (tag == type) return factory(fields.is_null() ? nlohmann::json::object() : fields);
    throw UnknownEventKind(fmt::format("No event type '{}'", type));
}

bool isKnownEventType(const std::string_view type) {
    for (const auto& entry : kRegistry)
        if (entry.first == type) return true;
    return false;
}

std::string_view Event::type() const {
    return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::kType; }, payload);
}

nlohmann::json Event::serialize() const {
    nlohmann::json j = std::visit([](const auto& p) { return nlohmann::json(p); }, payload);
    j["timestamp"] = timestamp;
    j["event_type"] = std::string(type());
    j["_id"] = id;

    if (!attachments.empty()) {
        auto arr = nlohmann::json::array();
        for (const auto& a : attachments) {
            arr.push_back({
                {"name", a.name},
                {"filename", a.path.filename().string()},
                {"data", crypto::b64_encode(readFile(a.path))}
            });
        }
        j["attachments"] = std::move(arr);
    }

    return j;
}

std::string makeEventId(const std::string_view type, const int64_t timestamp) {
    const auto token = crypto::random_uniform(std::numeric_limits<int32_t>::max());
    return fmt::format("{}_{}_{}", type, timestamp, token);
}

int64_t nowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}
