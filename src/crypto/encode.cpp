#include "crypto/encode.hpp"

#include <sodium.h>
#include <stdexcept>

namespace fa::crypto {

void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

std::string b64_encode(const std::vector<uint8_t>& data) {
    ensure_sodium_init();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(encoded_len - 1); // drop the terminating NUL
    return result;
}

std::vector<uint8_t> b64_decode(const std::string_view b64) {
    ensure_sodium_init();
    std::vector<uint8_t> decoded(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.data(), b64.size(),
                          "\r\n", &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
        throw std::runtime_error("Invalid base64 payload");
    decoded.resize(out_len);
    return decoded;
}

uint32_t random_uniform(const uint32_t upper) {
    ensure_sodium_init();
    return randombytes_uniform(upper);
}

std::string random_token(const std::string_view alphabet, const size_t length) {
    if (alphabet.empty()) throw std::invalid_argument("alphabet must not be empty");
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i)
        out.push_back(alphabet[random_uniform(static_cast<uint32_t>(alphabet.size()))]);
    return out;
}

}
