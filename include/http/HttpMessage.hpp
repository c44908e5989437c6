#pragma once

#include <string>
#include <string_view>
#include <map>
#include <optional>

namespace shairmeta::http {

struct HttpRequest {
    std::string method;
    std::string target;   // As sent, including any query string
    std::string path;     // Target without the query string
    std::string version;
    std::map<std::string, std::string> headers;  // Names lower-cased

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::map<std::string, std::string> extra_headers;

    // Status line, headers (Content-Length, Connection: close) and body
    [[nodiscard]] std::string serialize() const;
};

enum class ParseStatus {
    Complete,
    Incomplete,  // Header block not terminated yet
    Invalid,
    TooLarge,
};

constexpr size_t kMaxHeaderBytes = 8192;

// Parse the request head (request line + headers) at the start of `raw`.
// The request body, if any, is not read: none of the routes take one.
ParseStatus parse_request(std::string_view raw, HttpRequest& out);

std::string_view reason_phrase(int status);

}  // namespace shairmeta::http
