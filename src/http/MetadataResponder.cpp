#include "http/MetadataResponder.hpp"
#include "util/Base64.hpp"

namespace shairmeta::http {

using json = nlohmann::json;

namespace {
    json optional_text(const std::optional<std::string>& value) {
        return value ? json(*value) : json(nullptr);
    }

    HttpResponse json_response(int status, const json& body) {
        HttpResponse response;
        response.status = status;
        // Replace rather than throw on strings that slipped past validation
        response.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
        return response;
    }
}

MetadataResponder::MetadataResponder(std::shared_ptr<const backend::PlaybackStore> store)
    : store_(std::move(store)) {}

json MetadataResponder::to_json(const model::NowPlaying& now_playing) {
    json j;
    j["title"] = optional_text(now_playing.title);
    j["artist"] = optional_text(now_playing.artist);
    j["album"] = optional_text(now_playing.album);
    j["genre"] = optional_text(now_playing.genre);
    j["artwork_base64"] = now_playing.artwork ? json(util::base64_encode(*now_playing.artwork))
                                              : json(nullptr);
    j["is_playing"] = now_playing.is_playing();
    j["player_state"] = std::string(model::to_string(now_playing.player_state));
    j["volume"] = now_playing.volume ? json(*now_playing.volume) : json(nullptr);
    j["client_name"] = optional_text(now_playing.client_name);
    return j;
}

HttpResponse MetadataResponder::error_response(int status, const std::string& message) {
    return json_response(status, json{{"error", message}});
}

HttpResponse MetadataResponder::handle(const HttpRequest& request) const {
    const bool known = request.path == "/metadata" || request.path == "/health";
    if (!known) {
        return error_response(404, "not found");
    }
    if (request.method != "GET") {
        auto response = error_response(405, "method not allowed");
        response.extra_headers["Allow"] = "GET";
        return response;
    }

    if (request.path == "/health") {
        if (!store_->is_alive()) {
            return error_response(503, "unavailable");
        }
        return json_response(200, json{{"status", "ok"}});
    }

    return json_response(200, to_json(*store_->snapshot()));
}

}  // namespace shairmeta::http
