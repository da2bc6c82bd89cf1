#pragma once

#include <stdexcept>
#include <string>

namespace fa::rpc {

// The round trip itself failed: connection, HTTP status, or an unparseable reply.
struct TransportFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct UnknownCallId : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct DuplicateCallId : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class CallFailed : public std::runtime_error {
public:
    CallFailed(std::string callId, std::string detail)
        : std::runtime_error("call '" + callId + "' failed: " + detail),
          callId_(std::move(callId)), detail_(std::move(detail)) {}

    [[nodiscard]] const std::string& callId() const noexcept { return callId_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    std::string callId_;
    std::string detail_;
};

}
