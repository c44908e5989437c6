#include "util/TextCodec.hpp"
#include <unicode/ustring.h>
#include <unicode/unistr.h>
#include <unicode/stringpiece.h>
#include <vector>
#include <limits>
#include <cstdint>

namespace shairmeta::util {

std::optional<std::string> decode_utf8(std::string_view bytes) {
    if (bytes.empty()) {
        return std::string();
    }
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        return std::nullopt;
    }

    // UTF-16 never needs more code units than the UTF-8 input has bytes
    std::vector<UChar> units(bytes.size());
    int32_t length = 0;
    UErrorCode status = U_ZERO_ERROR;
    u_strFromUTF8(units.data(), static_cast<int32_t>(units.size()), &length,
                  bytes.data(), static_cast<int32_t>(bytes.size()), &status);

    // U_STRING_NOT_TERMINATED_WARNING is expected: the buffer is exactly filled
    if (U_FAILURE(status)) {
        return std::nullopt;
    }
    return std::string(bytes);
}

std::string fold_case(std::string_view text) {
    if (text.empty()) {
        return std::string();
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    unicode_text.foldCase();

    std::string result;
    unicode_text.toUTF8String(result);
    return result;
}

std::string_view trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

}  // namespace shairmeta::util
