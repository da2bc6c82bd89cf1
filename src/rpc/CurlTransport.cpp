#include "rpc/Transport.hpp"
#include "rpc/curl.hpp"
#include "rpc/errors.hpp"

#include <fmt/core.h>
#include <mutex>

namespace fa::rpc {

void ensureCurlGlobalInit() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw std::runtime_error("curl_global_init failed");
    });
}

CurlTransport::CurlTransport(std::string url, const std::chrono::seconds timeout)
    : url_(std::move(url)), timeout_(timeout) {
    ensureCurlGlobalInit();
}

std::string CurlTransport::post(const std::string& body) {
    SList headers;
    headers.add("Content-Type: application/json");
    headers.add("Accept: application/json");

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    });

    if (resp.curl != CURLE_OK)
        throw TransportFailure(fmt::format("request to {} failed: {}", url_, resp.error));
    if (!resp.ok())
        throw TransportFailure(fmt::format("request to {} returned HTTP {}", url_, resp.http));

    return resp.body;
}

}
