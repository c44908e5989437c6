#pragma once

#include "transport/MqttCodec.hpp"
#include "transport/Socket.hpp"
#include <string>
#include <optional>
#include <functional>
#include <atomic>
#include <chrono>
#include <stop_token>

namespace shairmeta::transport {

struct MqttSettings {
    std::string host = "localhost";
    uint16_t port = 1883;
    std::string client_id;
    std::string topic_filter;  // e.g. "shairport-sync/#"
    uint16_t keepalive_seconds = 60;
    std::optional<std::string> username;
    std::optional<std::string> password;

    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{60000};
};

/// MQTT 3.1.1 subscriber: keeps one broker connection alive, reconnecting
/// with exponential backoff, and hands every PUBLISH to the message handler
/// on the thread that called run().
class MqttSubscriber {
public:
    using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

    MqttSubscriber(MqttSettings settings, MessageHandler handler);

    // Blocks until stop is requested
    void run(std::stop_token stop_token);

    [[nodiscard]] bool is_connected() const { return connected_.load(); }
    [[nodiscard]] uint64_t messages_received() const { return messages_received_.load(); }
    [[nodiscard]] const MqttSettings& settings() const { return settings_; }

private:
    // One connection from CONNECT to disconnect; returns on stop, throws on failure
    void run_session(Socket& sock, std::stop_token stop_token, std::chrono::milliseconds& backoff);

    // Wait up to `timeout` for data and append it to `buffer`.
    // Returns false on timeout/stop; throws when the broker closes the connection.
    bool receive(Socket& sock, mqtt::Bytes& buffer, std::chrono::milliseconds timeout);

    void handle_packet(Socket& sock, const mqtt::Packet& packet);

    // Sleep in short slices so a stop request is honored promptly
    static void sleep_with_stop(std::chrono::milliseconds duration, const std::stop_token& stop_token);

    MqttSettings settings_;
    MessageHandler handler_;

    std::atomic<bool> connected_{false};
    std::atomic<uint64_t> messages_received_{0};
    std::chrono::steady_clock::time_point last_received_{};

    static constexpr uint16_t kSubscribePacketId = 1;
    static constexpr std::chrono::milliseconds kPollSlice{250};
};

}  // namespace shairmeta::transport
