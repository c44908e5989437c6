#include "util/Base64.hpp"
#include <openssl/evp.h>
#include <limits>
#include <stdexcept>

namespace shairmeta::util {

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }
    // EVP_EncodeBlock takes an int length
    if (data.size() > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
        throw std::length_error("base64_encode: input too large");
    }

    // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock appends
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                  data.data(), static_cast<int>(data.size()));
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

}  // namespace shairmeta::util
