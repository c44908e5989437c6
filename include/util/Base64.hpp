#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace shairmeta::util {

// Standard alphabet with '=' padding, no line breaks (OpenSSL EVP_EncodeBlock)
std::string base64_encode(const std::vector<uint8_t>& data);

}  // namespace shairmeta::util
