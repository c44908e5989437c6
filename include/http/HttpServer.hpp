#pragma once

#include "http/MetadataResponder.hpp"
#include "transport/Socket.hpp"
#include <string>
#include <memory>
#include <atomic>
#include <chrono>
#include <stop_token>

namespace shairmeta::http {

struct HttpSettings {
    std::string host = "0.0.0.0";
    uint16_t port = 5000;
    size_t workers = 4;
    size_t max_pending = 64;  // Connections waiting for a worker before 503
    std::chrono::milliseconds read_timeout{5000};
};

/// Accept loop plus a fixed worker pool. One request per connection.
class HttpServer {
public:
    HttpServer(HttpSettings settings, std::shared_ptr<const MetadataResponder> responder);

    // Bind the listening socket. Called by run() when not done already;
    // call it first to learn the port when settings.port is 0.
    void bind();
    [[nodiscard]] uint16_t bound_port() const;

    // Blocks until stop is requested. Connections already on a worker are
    // finished; those still waiting for one are closed unanswered.
    void run(std::stop_token stop_token);

    [[nodiscard]] uint64_t requests_served() const { return requests_served_.load(); }
    [[nodiscard]] uint64_t accept_failures() const { return accept_failures_.load(); }

private:
    void serve_connection(transport::Socket& client);
    static void send_response(transport::Socket& client, const HttpResponse& response);

    HttpSettings settings_;
    std::shared_ptr<const MetadataResponder> responder_;
    transport::Socket listener_;
    std::atomic<uint64_t> requests_served_{0};
    std::atomic<uint64_t> accept_failures_{0};

    static constexpr std::chrono::milliseconds kAcceptSlice{250};
};

}  // namespace shairmeta::http
