#pragma once

#include "http/HttpMessage.hpp"
#include "backend/PlaybackStore.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace shairmeta::http {

/// Routes requests to the store: GET /metadata and GET /health.
/// Stateless apart from the store pointer; safe to call from any worker.
class MetadataResponder {
public:
    explicit MetadataResponder(std::shared_ptr<const backend::PlaybackStore> store);

    [[nodiscard]] HttpResponse handle(const HttpRequest& request) const;

    // Exactly the fields title, artist, album, genre, artwork_base64,
    // is_playing, player_state, volume, client_name
    static nlohmann::json to_json(const model::NowPlaying& now_playing);

    static HttpResponse error_response(int status, const std::string& message);

private:
    std::shared_ptr<const backend::PlaybackStore> store_;
};

}  // namespace shairmeta::http
