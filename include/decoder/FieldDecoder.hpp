#pragma once

#include "decoder/TopicTable.hpp"
#include "model/Instruction.hpp"
#include <string>
#include <string_view>
#include <optional>

namespace shairmeta::decoder {

/// Turns one feed delivery into a typed instruction.
///
/// Pure: no I/O, no logging, no shared state. The same (topic, payload) pair
/// always yields the same result, and every input yields exactly one of
/// Instruction, Ignored or DecodeError.
class FieldDecoder {
public:
    explicit FieldDecoder(std::string topic_prefix,
                          TopicTable table = TopicTable::shairport_defaults());

    // `topic` is the full topic name (<prefix>/<suffix>)
    [[nodiscard]] model::DecodeResult decode(std::string_view topic, std::string_view payload) const;

    [[nodiscard]] const std::string& topic_prefix() const { return topic_prefix_; }
    [[nodiscard]] const TopicTable& table() const { return table_; }

    // Finite decimal number; "a,b,c" forms yield the first element
    static std::optional<double> parse_volume(std::string_view payload);

private:
    // Suffix relative to the prefix, or nullopt if the topic is not under it
    std::optional<std::string_view> relative_topic(std::string_view topic) const;

    std::string topic_prefix_;
    TopicTable table_;
};

}  // namespace shairmeta::decoder
