#include "collectors/MetadataCollector.hpp"
#include "util/Logger.hpp"
#include <sstream>

namespace shairmeta::collectors {

namespace {
    template <class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    std::string describe(const model::Instruction& instruction) {
        return std::visit(overloaded{
            [](const model::TextUpdate& u) {
                return std::string(model::to_string(u.field)) + " = '" + u.value + "'";
            },
            [](const model::VolumeUpdate& u) {
                std::ostringstream out;
                out << "volume = " << u.value;
                return out.str();
            },
            [](const model::ArtworkUpdate& u) {
                return u.artwork ? "artwork (" + std::to_string(u.artwork->size()) + " bytes)"
                                 : std::string("artwork cleared");
            },
            [](const model::PlaybackTransition& u) {
                return "state -> " + std::string(model::to_string(u.state));
            },
        }, instruction);
    }
}

MetadataCollector::MetadataCollector(std::shared_ptr<backend::PlaybackStore> store,
                                     decoder::FieldDecoder decoder,
                                     transport::MqttSettings mqtt_settings)
    : store_(std::move(store)),
      decoder_(std::move(decoder)),
      subscriber_(std::move(mqtt_settings),
                  [this](const std::string& topic, const std::string& payload) {
                      handle_delivery(topic, payload);
                  }) {}

void MetadataCollector::run(std::stop_token stop_token) {
    util::Logger::info("MetadataCollector: Watching " + decoder_.topic_prefix() + "/ (" +
                       std::to_string(decoder_.table().size()) + " topics)");
    subscriber_.run(stop_token);
    util::Logger::info("MetadataCollector: Stopped after " + std::to_string(applied_.load()) +
                       " update(s)");
}

model::DecodeResult MetadataCollector::handle_delivery(const std::string& topic, const std::string& payload) {
    auto result = decoder_.decode(topic, payload);

    std::visit(overloaded{
        [this](const model::Instruction& instruction) {
            store_->apply(instruction);
            applied_.fetch_add(1);
            if (std::holds_alternative<model::PlaybackTransition>(instruction)) {
                util::Logger::info("MetadataCollector: " + describe(instruction));
            } else {
                util::Logger::debug("MetadataCollector: " + describe(instruction));
            }
        },
        [this](const model::Ignored& ignored) {
            ignored_.fetch_add(1);
            util::Logger::debug("MetadataCollector: Ignored: " + ignored.reason);
        },
        [this](const model::DecodeError& error) {
            errors_.fetch_add(1);
            util::Logger::warn("MetadataCollector: Bad payload on " + error.topic + ": " + error.message);
        },
    }, result);

    return result;
}

}  // namespace shairmeta::collectors
