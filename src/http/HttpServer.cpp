#include "http/HttpServer.hpp"
#include "util/ConnectionPool.hpp"
#include "util/Logger.hpp"
#include <optional>
#include <stdexcept>
#include <thread>

namespace shairmeta::http {

HttpServer::HttpServer(HttpSettings settings, std::shared_ptr<const MetadataResponder> responder)
    : settings_(std::move(settings)), responder_(std::move(responder)) {}

void HttpServer::bind() {
    if (listener_.is_open()) return;
    listener_ = transport::Socket::listen_tcp(settings_.host, settings_.port);
    util::Logger::info("HTTP: Listening on " + settings_.host + ":" + std::to_string(listener_.local_port()));
}

uint16_t HttpServer::bound_port() const {
    if (!listener_.is_open()) {
        throw std::logic_error("HttpServer::bound_port() called before bind()");
    }
    return listener_.local_port();
}

void HttpServer::run(std::stop_token stop_token) {
    bind();

    {
        util::ConnectionPool pool(settings_.workers, settings_.max_pending);

        while (!stop_token.stop_requested()) {
            if (!listener_.wait_readable(kAcceptSlice)) continue;

            std::optional<transport::Socket> client;
            try {
                client = listener_.accept_connection();
            } catch (const std::exception& e) {
                // Out of descriptors or buffers: the connection stays in the backlog until we retry
                accept_failures_.fetch_add(1);
                util::Logger::warn("HTTP: " + std::string(e.what()) + ", retrying");
                std::this_thread::sleep_for(kAcceptSlice);
                continue;
            }
            if (!client) continue;

            // std::function needs a copyable callable
            auto connection = std::make_shared<transport::Socket>(std::move(*client));
            bool queued = pool.submit_job([this, connection]() {
                serve_connection(*connection);
            });
            if (!queued) {
                util::Logger::warn("HTTP: Worker queue full, rejecting " + connection->peer_name());
                try {
                    send_response(*connection, MetadataResponder::error_response(503, "server busy"));
                } catch (const std::exception& e) {
                    util::Logger::debug("HTTP: 503 not delivered: " + std::string(e.what()));
                }
            }
        }

        size_t dropped = pool.discard_pending();
        util::Logger::info("HTTP: Stopping, finishing " + std::to_string(pool.get_active_count()) +
                           " open connection(s), dropped " + std::to_string(dropped) + " queued");
    }

    listener_.close();
    util::Logger::info("HTTP: Server stopped");
}

void HttpServer::serve_connection(transport::Socket& client) {
    try {
        client.set_send_timeout(settings_.read_timeout);

        std::string raw;
        HttpRequest request;
        auto deadline = std::chrono::steady_clock::now() + settings_.read_timeout;

        while (true) {
            auto status = parse_request(raw, request);
            if (status == ParseStatus::Complete) break;
            if (status == ParseStatus::Invalid) {
                send_response(client, MetadataResponder::error_response(400, "bad request"));
                return;
            }
            if (status == ParseStatus::TooLarge) {
                send_response(client, MetadataResponder::error_response(431, "request header too large"));
                return;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining <= std::chrono::milliseconds(0) || !client.wait_readable(remaining)) {
                if (std::chrono::steady_clock::now() < deadline) continue;  // Interrupted by a signal
                send_response(client, MetadataResponder::error_response(408, "request timeout"));
                return;
            }

            char chunk[4096];
            size_t n = client.read_some(chunk, sizeof(chunk));
            if (n == 0) {
                util::Logger::debug("HTTP: Client closed before sending a full request");
                return;
            }
            raw.append(chunk, n);
        }

        auto response = responder_->handle(request);
        send_response(client, response);
        requests_served_.fetch_add(1);
        util::Logger::debug("HTTP: " + request.method + " " + request.target + " -> " +
                            std::to_string(response.status));
    } catch (const std::exception& e) {
        util::Logger::warn("HTTP: Connection error: " + std::string(e.what()));
    }
}

void HttpServer::send_response(transport::Socket& client, const HttpResponse& response) {
    client.send_all(response.serialize());
}

}  // namespace shairmeta::http
