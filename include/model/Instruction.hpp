#pragma once

#include "model/NowPlaying.hpp"
#include <string>
#include <variant>
#include <memory>

namespace shairmeta::model {

enum class TextField {
    Title,
    Artist,
    Album,
    Genre,
    ClientName,
};

std::string_view to_string(TextField field);

// Empty value clears the field
struct TextUpdate {
    TextField field;
    std::string value;

    bool operator==(const TextUpdate&) const = default;
};

struct VolumeUpdate {
    double value = 0.0;

    bool operator==(const VolumeUpdate&) const = default;
};

// Null artwork clears the image
struct ArtworkUpdate {
    std::shared_ptr<const Artwork> artwork;
};

struct PlaybackTransition {
    PlayerState state = PlayerState::Stopped;

    bool operator==(const PlaybackTransition&) const = default;
};

/// A validated instruction, ready for PlaybackStore::apply().
using Instruction = std::variant<TextUpdate, VolumeUpdate, ArtworkUpdate, PlaybackTransition>;

struct Ignored {
    std::string reason;
};

struct DecodeError {
    std::string topic;
    std::string message;
};

/// Outcome of decoding one feed delivery. Exactly one alternative is held.
using DecodeResult = std::variant<Instruction, Ignored, DecodeError>;

}  // namespace shairmeta::model
