#include "../framework/SimpleTest.hpp"
#include "http/HttpMessage.hpp"
#include "http/MetadataResponder.hpp"
#include <nlohmann/json.hpp>

using namespace shairmeta;
using namespace shairmeta::http;
using json = nlohmann::json;

namespace {
    HttpRequest get(const std::string& target) {
        HttpRequest request;
        std::string raw = "GET " + target + " HTTP/1.1\r\nHost: localhost\r\n\r\n";
        if (parse_request(raw, request) != ParseStatus::Complete) {
            throw test::AssertionFailure("could not build request for " + target);
        }
        return request;
    }

    std::shared_ptr<backend::PlaybackStore> make_store() {
        return std::make_shared<backend::PlaybackStore>();
    }
}

TEST_CASE(test_parse_simple_get) {
    HttpRequest request;
    auto status = parse_request("GET /metadata?pretty=1 HTTP/1.1\r\nHost: Example\r\nX-Thing:  v  \r\n\r\n", request);

    ASSERT_TRUE(status == ParseStatus::Complete);
    ASSERT_EQ(request.method, "GET");
    ASSERT_EQ(request.target, "/metadata?pretty=1");
    ASSERT_EQ(request.path, "/metadata");
    ASSERT_EQ(request.version, "HTTP/1.1");
    ASSERT_EQ(request.header("host"), "Example");
    ASSERT_EQ(request.header("X-THING"), "v");
    ASSERT_FALSE(request.header("accept").has_value());
}

TEST_CASE(test_parse_incomplete_and_bare_newlines) {
    HttpRequest request;
    ASSERT_TRUE(parse_request("GET /health HTTP/1.1\r\nHost: x\r\n", request) == ParseStatus::Incomplete);
    ASSERT_TRUE(parse_request("", request) == ParseStatus::Incomplete);
    ASSERT_TRUE(parse_request("GET /health HTTP/1.0\n\n", request) == ParseStatus::Complete);
    ASSERT_EQ(request.path, "/health");
}

TEST_CASE(test_parse_absolute_form_target) {
    HttpRequest request;
    ASSERT_TRUE(parse_request("GET http://host:5000/metadata HTTP/1.1\r\n\r\n", request) == ParseStatus::Complete);
    ASSERT_EQ(request.path, "/metadata");
}

TEST_CASE(test_parse_rejects_malformed_requests) {
    HttpRequest request;
    ASSERT_TRUE(parse_request("GET /metadata\r\n\r\n", request) == ParseStatus::Invalid);
    ASSERT_TRUE(parse_request("GET /metadata HTTP/2.0\r\n\r\n", request) == ParseStatus::Invalid);
    ASSERT_TRUE(parse_request("GET metadata HTTP/1.1\r\n\r\n", request) == ParseStatus::Invalid);
    ASSERT_TRUE(parse_request("GET /a b HTTP/1.1\r\n\r\n", request) == ParseStatus::Invalid);
    ASSERT_TRUE(parse_request("GET /metadata HTTP/1.1\r\nNoColonHere\r\n\r\n", request) == ParseStatus::Invalid);
    ASSERT_TRUE(parse_request("\r\n\r\n", request) == ParseStatus::Invalid);
}

TEST_CASE(test_parse_header_limit) {
    HttpRequest request;
    std::string huge = "GET /metadata HTTP/1.1\r\nX-Pad: " + std::string(kMaxHeaderBytes, 'a');
    ASSERT_TRUE(parse_request(huge, request) == ParseStatus::TooLarge);
    ASSERT_TRUE(parse_request(huge + "\r\n\r\n", request) == ParseStatus::TooLarge);
}

TEST_CASE(test_serialize_response) {
    HttpResponse response;
    response.status = 404;
    response.body = "{\"error\":\"not found\"}";

    auto wire = response.serialize();
    ASSERT_EQ(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    ASSERT_TRUE(wire.find("Content-Type: application/json\r\n") != std::string::npos);
    ASSERT_TRUE(wire.find("Content-Length: 21\r\n") != std::string::npos);
    ASSERT_TRUE(wire.find("Connection: close\r\n\r\n{\"error\"") != std::string::npos);
}

TEST_CASE(test_json_for_fresh_store) {
    model::NowPlaying empty;
    auto j = MetadataResponder::to_json(empty);

    ASSERT_EQ(j.size(), 9u);
    ASSERT_TRUE(j["title"].is_null());
    ASSERT_TRUE(j["artist"].is_null());
    ASSERT_TRUE(j["album"].is_null());
    ASSERT_TRUE(j["genre"].is_null());
    ASSERT_TRUE(j["artwork_base64"].is_null());
    ASSERT_TRUE(j["volume"].is_null());
    ASSERT_TRUE(j["client_name"].is_null());
    ASSERT_EQ(j["is_playing"], false);
    ASSERT_EQ(j["player_state"], "stopped");
}

TEST_CASE(test_json_for_populated_record) {
    model::NowPlaying record;
    record.title = "Song A";
    record.artist = "Artist B";
    record.genre = "";
    record.client_name = "Kitchen iPhone";
    record.volume = -15.5;
    record.artwork = std::make_shared<model::Artwork>(model::Artwork{'M', 'a', 'n'});
    record.player_state = model::PlayerState::Playing;

    auto j = MetadataResponder::to_json(record);
    ASSERT_EQ(j["title"], "Song A");
    ASSERT_EQ(j["artist"], "Artist B");
    ASSERT_TRUE(j["album"].is_null());
    ASSERT_EQ(j["genre"], "");
    ASSERT_EQ(j["client_name"], "Kitchen iPhone");
    ASSERT_NEAR(j["volume"].get<double>(), -15.5, 1e-9);
    ASSERT_EQ(j["artwork_base64"], "TWFu");
    ASSERT_EQ(j["is_playing"], true);
    ASSERT_EQ(j["player_state"], "playing");
}

TEST_CASE(test_metadata_route_reflects_store) {
    auto store = make_store();
    store->apply(model::TextUpdate{model::TextField::Title, "Song A"});
    store->apply(model::PlaybackTransition{model::PlayerState::Paused});
    MetadataResponder responder(store);

    auto response = responder.handle(get("/metadata"));
    ASSERT_EQ(response.status, 200);
    ASSERT_EQ(response.content_type, "application/json");

    auto body = json::parse(response.body);
    ASSERT_EQ(body["title"], "Song A");
    ASSERT_EQ(body["player_state"], "paused");
    ASSERT_EQ(body["is_playing"], false);
}

TEST_CASE(test_health_route) {
    MetadataResponder responder(make_store());
    auto response = responder.handle(get("/health?check=1"));
    ASSERT_EQ(response.status, 200);
    ASSERT_TRUE(json::parse(response.body) == json({{"status", "ok"}}));
}

TEST_CASE(test_unknown_path_and_wrong_method) {
    MetadataResponder responder(make_store());

    auto missing = responder.handle(get("/nowplaying"));
    ASSERT_EQ(missing.status, 404);
    ASSERT_TRUE(json::parse(missing.body) == json({{"error", "not found"}}));

    HttpRequest post;
    ASSERT_TRUE(parse_request("POST /metadata HTTP/1.1\r\n\r\n", post) == ParseStatus::Complete);
    auto rejected = responder.handle(post);
    ASSERT_EQ(rejected.status, 405);
    ASSERT_EQ(rejected.extra_headers["Allow"], "GET");
}

TEST_CASE(test_reason_phrases) {
    ASSERT_EQ(reason_phrase(200), "OK");
    ASSERT_EQ(reason_phrase(408), "Request Timeout");
    ASSERT_EQ(reason_phrase(503), "Service Unavailable");
}

int main() {
    return shairmeta::test::TestRunner::instance().run_all();
}
