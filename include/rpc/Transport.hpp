#pragma once

#include <chrono>
#include <string>

namespace fa::rpc {

class Transport {
public:
    virtual ~Transport() = default;

    // Performs one request/response exchange and returns the response body.
    // Throws TransportFailure.
    virtual std::string post(const std::string& body) = 0;
};

class CurlTransport final : public Transport {
public:
    CurlTransport(std::string url, std::chrono::seconds timeout);

    std::string post(const std::string& body) override;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

private:
    std::string url_;
    std::chrono::seconds timeout_;
};

}
