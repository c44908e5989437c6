#include "model/NowPlaying.hpp"
#include "model/Instruction.hpp"

namespace shairmeta::model {

std::string_view to_string(PlayerState state) {
    switch (state) {
        case PlayerState::Stopped: return "stopped";
        case PlayerState::Loading: return "loading";
        case PlayerState::Playing: return "playing";
        case PlayerState::Paused:  return "paused";
    }
    return "stopped";
}

std::optional<PlayerState> player_state_from_token(std::string_view token) {
    if (token == "stopped") return PlayerState::Stopped;
    if (token == "loading") return PlayerState::Loading;
    if (token == "playing") return PlayerState::Playing;
    if (token == "paused")  return PlayerState::Paused;
    return std::nullopt;
}

std::string_view to_string(TextField field) {
    switch (field) {
        case TextField::Title:      return "title";
        case TextField::Artist:     return "artist";
        case TextField::Album:      return "album";
        case TextField::Genre:      return "genre";
        case TextField::ClientName: return "client_name";
    }
    return "unknown";
}

}  // namespace shairmeta::model
