#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fa::crypto {

void ensure_sodium_init();

std::string b64_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> b64_decode(std::string_view b64);

// Uniformly distributed in [0, upper).
uint32_t random_uniform(uint32_t upper);

// `length` characters drawn uniformly from `alphabet`.
std::string random_token(std::string_view alphabet, size_t length);

}
