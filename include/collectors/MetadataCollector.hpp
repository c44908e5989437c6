#pragma once

#include "backend/PlaybackStore.hpp"
#include "decoder/FieldDecoder.hpp"
#include "transport/MqttSubscriber.hpp"
#include <memory>
#include <string>
#include <atomic>
#include <stop_token>

namespace shairmeta::collectors {

/// Feed ingestion: every delivery from the broker is decoded and, when it
/// yields an instruction, applied to the store. Nothing else writes the store.
class MetadataCollector {
public:
    MetadataCollector(std::shared_ptr<backend::PlaybackStore> store,
                      decoder::FieldDecoder decoder,
                      transport::MqttSettings mqtt_settings);

    // Blocks on the broker connection until stop is requested
    void run(std::stop_token stop_token);

    // One delivery through decoder and store; also the subscriber's callback
    model::DecodeResult handle_delivery(const std::string& topic, const std::string& payload);

    [[nodiscard]] uint64_t applied_count() const { return applied_.load(); }
    [[nodiscard]] uint64_t ignored_count() const { return ignored_.load(); }
    [[nodiscard]] uint64_t error_count() const { return errors_.load(); }
    [[nodiscard]] const transport::MqttSubscriber& subscriber() const { return subscriber_; }

private:
    std::shared_ptr<backend::PlaybackStore> store_;
    decoder::FieldDecoder decoder_;
    transport::MqttSubscriber subscriber_;

    std::atomic<uint64_t> applied_{0};
    std::atomic<uint64_t> ignored_{0};
    std::atomic<uint64_t> errors_{0};
};

}  // namespace shairmeta::collectors
