#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <memory>
#include <optional>
#include <cstdint>

namespace shairmeta::model {

enum class PlayerState {
    Stopped,
    Loading,
    Playing,
    Paused,
};

/// Raw image bytes as published on the feed. Never edited once shared.
using Artwork = std::vector<uint8_t>;

/// The single "now playing" record.
///
/// Text fields distinguish two empty states:
/// - std::nullopt: the topic has not been seen since start (unknown)
/// - "": the publisher explicitly cleared the field
///
/// Artwork is held by shared pointer so copying the record stays O(field count)
/// and snapshots already handed out keep the previous image alive.
struct NowPlaying {
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<std::string> genre;
    std::optional<std::string> client_name;

    std::shared_ptr<const Artwork> artwork;
    std::optional<double> volume;

    PlayerState player_state = PlayerState::Stopped;

    // Number of instructions applied since start
    uint64_t seq = 0;
    std::chrono::system_clock::time_point updated_at{};

    [[nodiscard]] bool is_playing() const { return player_state == PlayerState::Playing; }

    bool operator==(const NowPlaying&) const = default;
};

// Lower-case wire token ("stopped", "loading", "playing", "paused")
std::string_view to_string(PlayerState state);

// Exact lower-case match of the tokens produced by to_string()
std::optional<PlayerState> player_state_from_token(std::string_view token);

}  // namespace shairmeta::model
