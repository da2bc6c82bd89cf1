#pragma once

#include "rpc/errors.hpp"
#include "runtime/Context.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace fa::rpc {

class Transport;
class Client;

// Calls queued under caller-chosen ids and sent in one round trip. send() may be
// called explicitly; otherwise the destructor sends. Either way the request goes
// out exactly once.
class Batch {
public:
    explicit Batch(Client& client);
    Batch(Batch&& other) noexcept;
    Batch(const Batch&) = delete;
    Batch& operator=(const Batch&) = delete;
    Batch& operator=(Batch&&) = delete;
    ~Batch();

    // Throws DuplicateCallId. No I/O.
    Batch& callWithId(const std::string& callId, const std::string& method,
                      nlohmann::json params = nlohmann::json::object());

    // Transport failures are recorded, not thrown; they surface through getResult().
    void send();

    // Throws UnknownCallId when the id was never queued, CallFailed when the call
    // errored, the batch has not been sent, or the round trip failed.
    [[nodiscard]] const nlohmann::json& getResult(const std::string& callId) const;

    [[nodiscard]] bool contains(const std::string& callId) const { return index_.contains(callId); }
    [[nodiscard]] bool sent() const noexcept { return sent_; }
    [[nodiscard]] size_t size() const noexcept { return calls_.size(); }
    [[nodiscard]] const std::optional<std::string>& transportError() const noexcept { return transportError_; }

private:
    struct Call {
        std::string id;
        std::string method;
        nlohmann::json params;
    };

    struct Outcome {
        bool ok{false};
        nlohmann::json value;
        std::string error;
    };

    Client* client_;
    std::vector<Call> calls_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_map<std::string, Outcome> results_;
    std::optional<std::string> transportError_;
    bool sent_{false};

    void absorb(const nlohmann::json& response);
};

class Client {
public:
    Client(const runtime::Context& ctx, std::shared_ptr<Transport> transport);

    // Single, non-batched call. Throws TransportFailure or CallFailed.
    nlohmann::json call(const std::string& method, const nlohmann::json& params = nlohmann::json::object());

    [[nodiscard]] Batch batch() { return Batch(*this); }

    // One JSON-RPC exchange of an already-built request document. Throws TransportFailure.
    nlohmann::json exchange(const nlohmann::json& request);

    [[nodiscard]] const runtime::Context& context() const noexcept { return ctx_; }

private:
    runtime::Context ctx_;
    std::shared_ptr<Transport> transport_;
};

// "message (code N)" for a JSON-RPC error object.
std::string describeError(const nlohmann::json& error);

}
