#pragma once

#include <string>
#include <string_view>
#include <optional>

namespace shairmeta::util {

/// Validate a payload as UTF-8 using ICU.
/// Returns the text unchanged when valid, std::nullopt on any ill-formed sequence.
std::optional<std::string> decode_utf8(std::string_view bytes);

/// Unicode case folding (ICU), for matching tokens regardless of case
std::string fold_case(std::string_view text);

/// Strip ASCII whitespace (space, tab, CR, LF) from both ends
std::string_view trim(std::string_view text);

}  // namespace shairmeta::util
