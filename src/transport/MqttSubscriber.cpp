#include "transport/MqttSubscriber.hpp"
#include "events/Scheduler.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace shairmeta::transport {

using namespace std::chrono_literals;

MqttSubscriber::MqttSubscriber(MqttSettings settings, MessageHandler handler)
    : settings_(std::move(settings)), handler_(std::move(handler)) {}

void MqttSubscriber::run(std::stop_token stop_token) {
    auto backoff = settings_.backoff_initial;
    const std::string endpoint = settings_.host + ":" + std::to_string(settings_.port);

    while (!stop_token.stop_requested()) {
        try {
            util::Logger::info("MQTT: Connecting to " + endpoint);
            Socket sock = Socket::connect_tcp(settings_.host, settings_.port, settings_.connect_timeout);
            run_session(sock, stop_token, backoff);
        } catch (const std::exception& e) {
            util::Logger::warn("MQTT: " + std::string(e.what()));
        }

        if (connected_.exchange(false)) {
            util::Logger::warn("MQTT: Disconnected from " + endpoint);
        }
        if (stop_token.stop_requested()) break;

        util::Logger::info("MQTT: Reconnecting in " +
                           std::to_string(backoff.count()) + "ms");
        sleep_with_stop(backoff, stop_token);
        backoff = std::min(backoff * 2, settings_.backoff_max);
    }

    util::Logger::info("MQTT: Subscriber stopped");
}

void MqttSubscriber::run_session(Socket& sock, std::stop_token stop_token, std::chrono::milliseconds& backoff) {
    sock.set_send_timeout(settings_.connect_timeout);

    mqtt::ConnectOptions options;
    options.client_id = settings_.client_id;
    options.keepalive_seconds = settings_.keepalive_seconds;
    options.clean_session = true;
    options.username = settings_.username;
    options.password = settings_.password;
    auto connect = mqtt::encode_connect(options);
    sock.send_all(connect.data(), connect.size());

    // CONNACK must be the first packet back
    mqtt::Bytes buffer;
    mqtt::Packet packet;
    auto deadline = std::chrono::steady_clock::now() + settings_.connect_timeout;
    while (true) {
        if (stop_token.stop_requested()) return;
        if (std::chrono::steady_clock::now() >= deadline) {
            throw std::runtime_error("timed out waiting for CONNACK");
        }
        receive(sock, buffer, kPollSlice);
        auto status = mqtt::extract_packet(buffer, packet);
        if (status == mqtt::ExtractStatus::Malformed) {
            throw std::runtime_error("malformed packet while waiting for CONNACK");
        }
        if (status == mqtt::ExtractStatus::Complete) break;
    }

    auto return_code = mqtt::parse_connack(packet);
    if (!return_code) {
        throw std::runtime_error("expected CONNACK from broker");
    }
    if (*return_code != 0) {
        throw std::runtime_error("broker refused connection: " + std::string(mqtt::connack_reason(*return_code)));
    }

    connected_ = true;
    backoff = settings_.backoff_initial;
    last_received_ = std::chrono::steady_clock::now();
    util::Logger::info("MQTT: Connected to broker");

    auto subscribe = mqtt::encode_subscribe(kSubscribePacketId, settings_.topic_filter, 0);
    sock.send_all(subscribe.data(), subscribe.size());
    util::Logger::info("MQTT: Subscribing to " + settings_.topic_filter);

    const auto keepalive = std::chrono::milliseconds(settings_.keepalive_seconds * 1000);
    events::Scheduler scheduler;
    if (settings_.keepalive_seconds > 0) {
        scheduler.schedule("keepalive", keepalive / 2, [&sock]() {
            auto ping = mqtt::encode_pingreq();
            sock.send_all(ping.data(), ping.size());
        });
        scheduler.schedule("liveness", 1s, [this, keepalive]() {
            if (std::chrono::steady_clock::now() - last_received_ > keepalive * 3 / 2) {
                throw std::runtime_error("broker stopped responding (keepalive timeout)");
            }
        });
    }

    // Packets that arrived together with CONNACK
    while (mqtt::extract_packet(buffer, packet) == mqtt::ExtractStatus::Complete) {
        handle_packet(sock, packet);
    }

    while (!stop_token.stop_requested()) {
        auto timeout = std::min(kPollSlice, scheduler.time_until_next(kPollSlice));
        if (receive(sock, buffer, timeout)) {
            while (true) {
                auto status = mqtt::extract_packet(buffer, packet);
                if (status == mqtt::ExtractStatus::Incomplete) break;
                if (status == mqtt::ExtractStatus::Malformed) {
                    throw std::runtime_error("malformed packet from broker");
                }
                handle_packet(sock, packet);
            }
        }
        scheduler.process();
    }

    // Orderly shutdown; the broker drops the session either way
    try {
        auto disconnect = mqtt::encode_disconnect();
        sock.send_all(disconnect.data(), disconnect.size());
    } catch (const std::exception& e) {
        util::Logger::debug("MQTT: DISCONNECT not sent: " + std::string(e.what()));
    }
}

bool MqttSubscriber::receive(Socket& sock, mqtt::Bytes& buffer, std::chrono::milliseconds timeout) {
    if (!sock.wait_readable(timeout)) {
        return false;
    }

    char chunk[16384];
    size_t n = sock.read_some(chunk, sizeof(chunk));
    if (n == 0) {
        throw std::runtime_error("connection closed by broker");
    }
    buffer.insert(buffer.end(), chunk, chunk + n);
    last_received_ = std::chrono::steady_clock::now();
    return true;
}

void MqttSubscriber::handle_packet(Socket& sock, const mqtt::Packet& packet) {
    switch (packet.type) {
        case mqtt::PacketType::Publish: {
            auto msg = mqtt::parse_publish(packet);
            if (!msg) {
                util::Logger::warn("MQTT: Dropping malformed PUBLISH");
                return;
            }
            if (msg->qos == 1 && msg->packet_id) {
                auto ack = mqtt::encode_puback(*msg->packet_id);
                sock.send_all(ack.data(), ack.size());
            } else if (msg->qos == 2) {
                // Only QoS 0 is requested, so a compliant broker never sends this
                util::Logger::warn("MQTT: QoS 2 delivery on " + msg->topic + " is not acknowledged");
            }

            messages_received_.fetch_add(1);
            try {
                handler_(msg->topic, msg->payload);
            } catch (const std::exception& e) {
                util::Logger::error("MQTT: Handler failed for " + msg->topic + ": " + e.what());
            }
            return;
        }
        case mqtt::PacketType::Suback: {
            auto granted = mqtt::parse_suback(packet, kSubscribePacketId);
            if (!granted) {
                util::Logger::warn("MQTT: Unexpected SUBACK");
                return;
            }
            if (std::find(granted->begin(), granted->end(), 0x80) != granted->end()) {
                throw std::runtime_error("broker refused subscription to " + settings_.topic_filter);
            }
            util::Logger::info("MQTT: Subscribed to " + settings_.topic_filter);
            return;
        }
        case mqtt::PacketType::Pingresp:
            util::Logger::debug("MQTT: PINGRESP");
            return;
        default:
            util::Logger::debug("MQTT: Ignoring packet type " + std::to_string(static_cast<int>(packet.type)));
            return;
    }
}

void MqttSubscriber::sleep_with_stop(std::chrono::milliseconds duration, const std::stop_token& stop_token) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop_token.stop_requested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            kPollSlice, deadline - std::chrono::steady_clock::now()));
    }
}

}  // namespace shairmeta::transport
