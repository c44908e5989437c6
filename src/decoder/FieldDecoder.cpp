#include "decoder/FieldDecoder.hpp"
#include "util/TextCodec.hpp"
#include <charconv>
#include <cmath>
#include <memory>

namespace shairmeta::decoder {

namespace {
    template <class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    // Keep error messages readable when a publisher sends something large
    std::string excerpt(std::string_view payload) {
        constexpr size_t max_len = 32;
        if (payload.size() <= max_len) return std::string(payload);
        return std::string(payload.substr(0, max_len)) + "...";
    }

    model::DecodeResult error(std::string_view topic, std::string message) {
        return model::DecodeError{std::string(topic), std::move(message)};
    }
}

FieldDecoder::FieldDecoder(std::string topic_prefix, TopicTable table)
    : topic_prefix_(std::move(topic_prefix)), table_(std::move(table)) {
    while (!topic_prefix_.empty() && topic_prefix_.back() == '/') {
        topic_prefix_.pop_back();
    }
}

std::optional<std::string_view> FieldDecoder::relative_topic(std::string_view topic) const {
    if (topic_prefix_.empty()) {
        return topic;
    }
    if (topic.size() <= topic_prefix_.size() + 1) {
        return std::nullopt;
    }
    if (topic.compare(0, topic_prefix_.size(), topic_prefix_) != 0 || topic[topic_prefix_.size()] != '/') {
        return std::nullopt;
    }
    return topic.substr(topic_prefix_.size() + 1);
}

model::DecodeResult FieldDecoder::decode(std::string_view topic, std::string_view payload) const {
    auto suffix = relative_topic(topic);
    if (!suffix) {
        return model::Ignored{"topic outside prefix '" + topic_prefix_ + "'"};
    }

    const DecodeRule* rule = table_.find(*suffix);
    if (!rule) {
        return model::Ignored{"unrecognized topic '" + std::string(*suffix) + "'"};
    }

    return std::visit(overloaded{
        [&](const TextRule& r) -> model::DecodeResult {
            auto text = util::decode_utf8(payload);
            if (!text) {
                return error(topic, "payload is not valid UTF-8");
            }
            return model::Instruction{model::TextUpdate{r.field, std::move(*text)}};
        },
        [&](const VolumeRule&) -> model::DecodeResult {
            auto value = parse_volume(payload);
            if (!value) {
                return error(topic, "volume is not a number: '" + excerpt(payload) + "'");
            }
            return model::Instruction{model::VolumeUpdate{*value}};
        },
        [&](const ArtworkRule&) -> model::DecodeResult {
            if (payload.empty()) {
                return model::Instruction{model::ArtworkUpdate{nullptr}};
            }
            std::shared_ptr<const model::Artwork> artwork =
                std::make_shared<model::Artwork>(payload.begin(), payload.end());
            return model::Instruction{model::ArtworkUpdate{std::move(artwork)}};
        },
        [&](const TransitionTokenRule&) -> model::DecodeResult {
            auto token = util::decode_utf8(util::trim(payload));
            if (!token) {
                return error(topic, "play state is not valid UTF-8");
            }
            auto state = model::player_state_from_token(util::fold_case(*token));
            if (!state) {
                return error(topic, "unrecognized play state '" + excerpt(*token) + "'");
            }
            return model::Instruction{model::PlaybackTransition{*state}};
        },
        [&](const FixedTransitionRule& r) -> model::DecodeResult {
            return model::Instruction{model::PlaybackTransition{r.state}};
        },
    }, *rule);
}

std::optional<double> FieldDecoder::parse_volume(std::string_view payload) {
    auto text = util::trim(payload);

    // Shairport Sync publishes "airplay_volume,volume,lowest,highest"
    auto comma = text.find(',');
    if (comma != std::string_view::npos) {
        text = util::trim(text.substr(0, comma));
    }

    // from_chars rejects a leading '+'
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') return std::nullopt;
    }
    if (text.empty()) return std::nullopt;

    double value = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

}  // namespace shairmeta::decoder
