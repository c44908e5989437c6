#pragma once

#include "model/Instruction.hpp"
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace shairmeta::decoder {

// Payload is UTF-8 text for one field; empty payload clears it
struct TextRule {
    model::TextField field;
};

// Payload is a decimal number (optionally the first of a comma-separated list)
struct VolumeRule {};

// Payload is raw image bytes; empty payload clears the artwork
struct ArtworkRule {};

// Payload is a play state token: playing, paused, stopped, loading
struct TransitionTokenRule {};

// The topic itself is the event; payload is ignored
struct FixedTransitionRule {
    model::PlayerState state;
};

using DecodeRule = std::variant<TextRule, VolumeRule, ArtworkRule, TransitionTokenRule, FixedTransitionRule>;

/// Suffix → decode rule. The suffix vocabulary is a contract with the publisher;
/// supporting another topic means one add_rule() call, nothing else.
class TopicTable {
public:
    TopicTable() = default;

    // Vocabulary published by Shairport Sync's MQTT backend
    static TopicTable shairport_defaults();

    // Replaces any existing rule for `suffix`
    void add_rule(std::string suffix, DecodeRule rule);
    bool remove_rule(std::string_view suffix);

    [[nodiscard]] const DecodeRule* find(std::string_view suffix) const;
    [[nodiscard]] size_t size() const { return rules_.size(); }

private:
    std::map<std::string, DecodeRule, std::less<>> rules_;
};

}  // namespace shairmeta::decoder
