#include "rpc/Client.hpp"
#include "rpc/Transport.hpp"

#include <fmt/core.h>

namespace fa::rpc {

namespace {

nlohmann::json makeRequest(const std::string& id, const std::string& method, const nlohmann::json& params) {
    return {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params},
        {"id", id}
    };
}

}

std::string describeError(const nlohmann::json& error) {
    if (!error.is_object()) return error.dump();
    const auto message = error.value("message", std::string("remote error"));
    if (error.contains("code") && error["code"].is_number_integer())
        return fmt::format("{} (code {})", message, error["code"].get<int>());
    return message;
}

// Batch

Batch::Batch(Client& client) : client_(&client) {}

Batch::Batch(Batch&& other) noexcept
    : client_(other.client_),
      calls_(std::move(other.calls_)),
      index_(std::move(other.index_)),
      results_(std::move(other.results_)),
      transportError_(std::move(other.transportError_)),
      sent_(other.sent_) {
    other.sent_ = true;
}

Batch::~Batch() {
    if (sent_) return;
    try {
        send();
    } catch (const std::exception& e) {
        client_->context().log->rpc()->error("[rpc::Batch] Failed to send batch on scope exit: {}", e.what());
    }
}

Batch& Batch::callWithId(const std::string& callId, const std::string& method, nlohmann::json params) {
    if (sent_) throw std::logic_error(fmt::format("Batch already sent; cannot queue '{}'", callId));
    if (index_.contains(callId)) throw DuplicateCallId(fmt::format("Call id '{}' is already queued", callId));

    index_.emplace(callId, calls_.size());
    calls_.push_back({callId, method, std::move(params)});
    return *this;
}

void Batch::send() {
    if (sent_) return;
    sent_ = true;

    if (calls_.empty()) return;

    auto request = nlohmann::json::array();
    for (const auto& c : calls_) request.push_back(makeRequest(c.id, c.method, c.params));

    const auto log = client_->context().log->rpc();
    log->debug("[rpc::Batch] Sending {} call(s)", calls_.size());

    try {
        absorb(client_->exchange(request));
    } catch (const TransportFailure& e) {
        log->warn("[rpc::Batch] Round trip failed: {}", e.what());
        transportError_ = e.what();
    }
}

void Batch::absorb(const nlohmann::json& response) {
    if (response.is_object() && response.contains("error")) {
        transportError_ = "batch rejected: " + describeError(response["error"]);
        return;
    }

    const auto record = [this](const nlohmann::json& item) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) return;
        const auto id = item["id"].get<std::string>();
        if (!index_.contains(id)) return;

        Outcome outcome;
        if (item.contains("error") && !item["error"].is_null()) {
            outcome.error = describeError(item["error"]);
        } else {
            outcome.ok = true;
            if (item.contains("result")) outcome.value = item["result"];
        }
        results_[id] = std::move(outcome);
    };

    if (response.is_array()) for (const auto& item : response) record(item);
    else record(response);
}

const nlohmann::json& Batch::getResult(const std::string& callId) const {
    if (!index_.contains(callId)) throw UnknownCallId(fmt::format("No call with id '{}' was queued", callId));
    if (!sent_) throw CallFailed(callId, "batch has not been sent");
    if (transportError_) throw CallFailed(callId, *transportError_);

    const auto it = results_.find(callId);
    if (it == results_.end()) throw CallFailed(callId, "no response for call");
    if (!it->second.ok) throw CallFailed(callId, it->second.error);
    return it->second.value;
}

// Client

Client::Client(const runtime::Context& ctx, std::shared_ptr<Transport> transport)
    : ctx_(ctx), transport_(std::move(transport)) {
    if (!transport_) throw std::invalid_argument("rpc::Client requires a transport");
}

nlohmann::json Client::exchange(const nlohmann::json& request) {
    const auto body = transport_->post(request.dump());
    auto response = nlohmann::json::parse(body, nullptr, false);
    if (response.is_discarded()) throw TransportFailure("remote returned a response that is not JSON");
    return response;
}

nlohmann::json Client::call(const std::string& method, const nlohmann::json& params) {
    const auto response = exchange(makeRequest(method, method, params));
    if (!response.is_object()) throw TransportFailure(fmt::format("malformed response to '{}'", method));
    if (response.contains("error") && !response["error"].is_null())
        throw CallFailed(method, describeError(response["error"]));
    return response.contains("result") ? response["result"] : nlohmann::json();
}

}
