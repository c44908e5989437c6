#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>

namespace shairmeta::transport {

/// MQTT 3.1.1 packet encoding and decoding (the subset a subscriber needs).
/// Pure byte manipulation; the socket side lives in MqttSubscriber.
namespace mqtt {

enum class PacketType : uint8_t {
    Connect = 1,
    Connack = 2,
    Publish = 3,
    Puback = 4,
    Pubrec = 5,
    Pubrel = 6,
    Pubcomp = 7,
    Subscribe = 8,
    Suback = 9,
    Unsubscribe = 10,
    Unsuback = 11,
    Pingreq = 12,
    Pingresp = 13,
    Disconnect = 14,
};

using Bytes = std::vector<uint8_t>;

struct Packet {
    PacketType type;
    uint8_t flags = 0;  // Low nibble of the fixed header
    Bytes body;         // Variable header + payload
};

struct ConnectOptions {
    std::string client_id;
    uint16_t keepalive_seconds = 60;
    bool clean_session = true;
    std::optional<std::string> username;
    std::optional<std::string> password;
};

struct PublishMessage {
    std::string topic;
    uint8_t qos = 0;
    bool retain = false;
    bool dup = false;
    std::optional<uint16_t> packet_id;  // Present for QoS > 0
    std::string payload;                // Raw bytes
};

enum class ExtractStatus {
    Complete,
    Incomplete,  // Need more bytes
    Malformed,   // Stream cannot be resynchronized; drop the connection
};

// Remaining-length field (1 to 4 bytes, 7 bits each)
Bytes encode_remaining_length(uint32_t length);

// Maximum value the remaining-length field can carry
constexpr uint32_t kMaxRemainingLength = 268435455;

Bytes encode_connect(const ConnectOptions& options);
Bytes encode_subscribe(uint16_t packet_id, std::string_view topic_filter, uint8_t qos);
Bytes encode_puback(uint16_t packet_id);
Bytes encode_pingreq();
Bytes encode_disconnect();

// Take one complete packet off the front of `buffer`
ExtractStatus extract_packet(Bytes& buffer, Packet& out);

// Return code from CONNACK (0 = accepted), nullopt if malformed
std::optional<uint8_t> parse_connack(const Packet& packet);

// Granted QoS values from SUBACK (0x80 = failure), nullopt if malformed
std::optional<std::vector<uint8_t>> parse_suback(const Packet& packet, uint16_t expected_packet_id);

std::optional<PublishMessage> parse_publish(const Packet& packet);

// Human readable CONNACK return code
std::string_view connack_reason(uint8_t return_code);

}  // namespace mqtt

}  // namespace shairmeta::transport
