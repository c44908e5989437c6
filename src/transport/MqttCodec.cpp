#include "transport/MqttCodec.hpp"
#include <stdexcept>

namespace shairmeta::transport::mqtt {

namespace {
    void append_u16(Bytes& out, uint16_t value) {
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value & 0xFF));
    }

    void append_string(Bytes& out, std::string_view text) {
        if (text.size() > 0xFFFF) {
            throw std::length_error("MQTT string longer than 65535 bytes");
        }
        append_u16(out, static_cast<uint16_t>(text.size()));
        out.insert(out.end(), text.begin(), text.end());
    }

    uint16_t read_u16(const Bytes& in, size_t pos) {
        return static_cast<uint16_t>((in[pos] << 8) | in[pos + 1]);
    }

    Bytes finish(PacketType type, uint8_t flags, const Bytes& body) {
        Bytes packet;
        packet.push_back(static_cast<uint8_t>((static_cast<uint8_t>(type) << 4) | (flags & 0x0F)));
        auto length = encode_remaining_length(static_cast<uint32_t>(body.size()));
        packet.insert(packet.end(), length.begin(), length.end());
        packet.insert(packet.end(), body.begin(), body.end());
        return packet;
    }
}

Bytes encode_remaining_length(uint32_t length) {
    if (length > kMaxRemainingLength) {
        throw std::length_error("MQTT remaining length too large");
    }

    Bytes out;
    do {
        uint8_t byte = length % 128;
        length /= 128;
        if (length > 0) byte |= 0x80;
        out.push_back(byte);
    } while (length > 0);
    return out;
}

Bytes encode_connect(const ConnectOptions& options) {
    Bytes body;
    append_string(body, "MQTT");
    body.push_back(0x04);  // Protocol level 4 = 3.1.1

    // A password without a user name is not allowed in 3.1.1
    bool with_user = options.username.has_value();
    bool with_password = with_user && options.password.has_value();

    uint8_t flags = 0;
    if (options.clean_session) flags |= 0x02;
    if (with_password) flags |= 0x40;
    if (with_user) flags |= 0x80;
    body.push_back(flags);
    append_u16(body, options.keepalive_seconds);

    append_string(body, options.client_id);
    if (with_user) append_string(body, *options.username);
    if (with_password) append_string(body, *options.password);

    return finish(PacketType::Connect, 0, body);
}

Bytes encode_subscribe(uint16_t packet_id, std::string_view topic_filter, uint8_t qos) {
    Bytes body;
    append_u16(body, packet_id);
    append_string(body, topic_filter);
    body.push_back(qos & 0x03);
    // Reserved flags for SUBSCRIBE are 0b0010
    return finish(PacketType::Subscribe, 0x02, body);
}

Bytes encode_puback(uint16_t packet_id) {
    Bytes body;
    append_u16(body, packet_id);
    return finish(PacketType::Puback, 0, body);
}

Bytes encode_pingreq() {
    return finish(PacketType::Pingreq, 0, {});
}

Bytes encode_disconnect() {
    return finish(PacketType::Disconnect, 0, {});
}

ExtractStatus extract_packet(Bytes& buffer, Packet& out) {
    if (buffer.size() < 2) {
        return ExtractStatus::Incomplete;
    }

    uint8_t type = buffer[0] >> 4;
    if (type == 0 || type == 15) {
        return ExtractStatus::Malformed;
    }

    uint32_t length = 0;
    uint32_t multiplier = 1;
    size_t pos = 1;
    while (true) {
        if (pos >= buffer.size()) {
            return ExtractStatus::Incomplete;
        }
        uint8_t byte = buffer[pos++];
        length += (byte & 0x7F) * multiplier;
        if ((byte & 0x80) == 0) break;
        if (pos > 4) {
            return ExtractStatus::Malformed;  // More than 4 length bytes
        }
        multiplier *= 128;
    }

    if (buffer.size() - pos < length) {
        return ExtractStatus::Incomplete;
    }

    out.type = static_cast<PacketType>(type);
    out.flags = buffer[0] & 0x0F;
    out.body.assign(buffer.begin() + static_cast<std::ptrdiff_t>(pos),
                    buffer.begin() + static_cast<std::ptrdiff_t>(pos + length));
    buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(pos + length));
    return ExtractStatus::Complete;
}

std::optional<uint8_t> parse_connack(const Packet& packet) {
    if (packet.type != PacketType::Connack || packet.body.size() != 2) {
        return std::nullopt;
    }
    return packet.body[1];
}

std::optional<std::vector<uint8_t>> parse_suback(const Packet& packet, uint16_t expected_packet_id) {
    if (packet.type != PacketType::Suback || packet.body.size() < 3) {
        return std::nullopt;
    }
    if (read_u16(packet.body, 0) != expected_packet_id) {
        return std::nullopt;
    }
    return std::vector<uint8_t>(packet.body.begin() + 2, packet.body.end());
}

std::optional<PublishMessage> parse_publish(const Packet& packet) {
    if (packet.type != PacketType::Publish || packet.body.size() < 2) {
        return std::nullopt;
    }

    PublishMessage msg;
    msg.dup = (packet.flags & 0x08) != 0;
    msg.qos = (packet.flags >> 1) & 0x03;
    msg.retain = (packet.flags & 0x01) != 0;
    if (msg.qos == 3) {
        return std::nullopt;
    }

    size_t topic_len = read_u16(packet.body, 0);
    size_t pos = 2;
    if (packet.body.size() < pos + topic_len) {
        return std::nullopt;
    }
    msg.topic.assign(packet.body.begin() + 2, packet.body.begin() + static_cast<std::ptrdiff_t>(pos + topic_len));
    pos += topic_len;

    if (msg.qos > 0) {
        if (packet.body.size() < pos + 2) {
            return std::nullopt;
        }
        msg.packet_id = read_u16(packet.body, pos);
        pos += 2;
    }

    msg.payload.assign(packet.body.begin() + static_cast<std::ptrdiff_t>(pos), packet.body.end());
    return msg;
}

std::string_view connack_reason(uint8_t return_code) {
    switch (return_code) {
        case 0: return "connection accepted";
        case 1: return "unacceptable protocol version";
        case 2: return "identifier rejected";
        case 3: return "server unavailable";
        case 4: return "bad user name or password";
        case 5: return "not authorized";
        default: return "unknown return code";
    }
}

}  // namespace shairmeta::transport::mqtt
