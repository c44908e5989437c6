#include "http/HttpMessage.hpp"
#include "util/TextCodec.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace shairmeta::http {

namespace {
    std::string to_lower(std::string_view text) {
        std::string out(text);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    bool is_token(std::string_view text) {
        if (text.empty()) return false;
        return std::all_of(text.begin(), text.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' || c == '#' ||
                   c == '$' || c == '%' || c == '&' || c == '\'' || c == '*' || c == '+' ||
                   c == '^' || c == '`' || c == '|' || c == '~';
        });
    }

    // "/metadata?x=1" → "/metadata"; absolute-form targets lose scheme and authority
    std::string path_of(std::string_view target) {
        for (std::string_view scheme : {"http://", "https://"}) {
            if (target.substr(0, scheme.size()) == scheme) {
                auto slash = target.find('/', scheme.size());
                target = slash == std::string_view::npos ? std::string_view("/") : target.substr(slash);
                break;
            }
        }
        auto query = target.find_first_of("?#");
        return std::string(target.substr(0, query));
    }
}

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

ParseStatus parse_request(std::string_view raw, HttpRequest& out) {
    size_t head_end = raw.find("\r\n\r\n");
    size_t separator = 4;
    if (head_end == std::string_view::npos) {
        head_end = raw.find("\n\n");
        separator = 2;
    }
    if (head_end == std::string_view::npos) {
        return raw.size() > kMaxHeaderBytes ? ParseStatus::TooLarge : ParseStatus::Incomplete;
    }
    if (head_end + separator > kMaxHeaderBytes) {
        return ParseStatus::TooLarge;
    }

    std::string_view head = raw.substr(0, head_end);
    HttpRequest request;

    bool first_line = true;
    while (!head.empty()) {
        auto eol = head.find('\n');
        std::string_view line = head.substr(0, eol);
        head = eol == std::string_view::npos ? std::string_view() : head.substr(eol + 1);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        if (first_line) {
            first_line = false;
            auto sp1 = line.find(' ');
            auto sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
            if (sp1 == std::string_view::npos || sp2 == std::string_view::npos ||
                line.find(' ', sp2 + 1) != std::string_view::npos) {
                return ParseStatus::Invalid;
            }
            request.method = std::string(line.substr(0, sp1));
            request.target = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));
            request.version = std::string(line.substr(sp2 + 1));

            if (!is_token(request.method) || request.target.empty()) return ParseStatus::Invalid;
            if (request.version != "HTTP/1.1" && request.version != "HTTP/1.0") return ParseStatus::Invalid;
            if (request.target.front() != '/' && request.target.rfind("http", 0) != 0) return ParseStatus::Invalid;
            request.path = path_of(request.target);
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos || !is_token(line.substr(0, colon))) {
            return ParseStatus::Invalid;
        }
        request.headers[to_lower(line.substr(0, colon))] = std::string(util::trim(line.substr(colon + 1)));
    }

    if (first_line) return ParseStatus::Invalid;

    out = std::move(request);
    return ParseStatus::Complete;
}

std::string_view reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

std::string HttpResponse::serialize() const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << ' ' << reason_phrase(status) << "\r\n";
    out << "Content-Type: " << content_type << "\r\n";
    out << "Content-Length: " << body.size() << "\r\n";
    for (const auto& [name, value] : extra_headers) {
        out << name << ": " << value << "\r\n";
    }
    out << "Connection: close\r\n\r\n";
    out << body;
    return out.str();
}

}  // namespace shairmeta::http
