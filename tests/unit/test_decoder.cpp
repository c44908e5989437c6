#include "../framework/SimpleTest.hpp"
#include "decoder/FieldDecoder.hpp"
#include "decoder/TopicTable.hpp"

using namespace shairmeta::decoder;
using namespace shairmeta::model;

namespace {
    const Instruction& instruction_of(const DecodeResult& result) {
        if (!std::holds_alternative<Instruction>(result)) {
            throw shairmeta::test::AssertionFailure("expected an instruction");
        }
        return std::get<Instruction>(result);
    }

    bool is_error(const DecodeResult& result) {
        return std::holds_alternative<DecodeError>(result);
    }

    bool is_ignored(const DecodeResult& result) {
        return std::holds_alternative<Ignored>(result);
    }

    PlayerState transition_of(const DecodeResult& result) {
        return std::get<PlaybackTransition>(instruction_of(result)).state;
    }
}

TEST_CASE(test_title_decodes_to_text_update) {
    FieldDecoder decoder("shairport-sync");
    auto result = decoder.decode("shairport-sync/title", "Song A");

    auto update = std::get<TextUpdate>(instruction_of(result));
    ASSERT_TRUE(update.field == TextField::Title);
    ASSERT_EQ(update.value, "Song A");
}

TEST_CASE(test_every_text_topic_maps_to_its_field) {
    FieldDecoder decoder("shairport-sync");
    struct { const char* suffix; TextField field; } cases[] = {
        {"artist", TextField::Artist},
        {"album", TextField::Album},
        {"genre", TextField::Genre},
        {"client_name", TextField::ClientName},
        {"client", TextField::ClientName},
    };

    for (const auto& c : cases) {
        auto result = decoder.decode(std::string("shairport-sync/") + c.suffix, "x");
        ASSERT_TRUE(std::get<TextUpdate>(instruction_of(result)).field == c.field);
    }
}

TEST_CASE(test_empty_text_payload_is_explicit_clear) {
    FieldDecoder decoder("shairport-sync");
    auto update = std::get<TextUpdate>(instruction_of(decoder.decode("shairport-sync/artist", "")));
    ASSERT_TRUE(update.field == TextField::Artist);
    ASSERT_TRUE(update.value.empty());
}

TEST_CASE(test_text_keeps_unicode_and_whitespace) {
    FieldDecoder decoder("shairport-sync");
    auto update = std::get<TextUpdate>(instruction_of(
        decoder.decode("shairport-sync/title", "  Sigur R\xC3\xB3s \xE2\x80\x94 Hopp\xC3\xADpolla ")));
    ASSERT_EQ(update.value, "  Sigur R\xC3\xB3s \xE2\x80\x94 Hopp\xC3\xADpolla ");
}

TEST_CASE(test_invalid_utf8_text_is_decode_error) {
    FieldDecoder decoder("shairport-sync");
    auto result = decoder.decode("shairport-sync/title", std::string("bad \xC3\x28 bytes"));
    ASSERT_TRUE(is_error(result));
    ASSERT_EQ(std::get<DecodeError>(result).topic, "shairport-sync/title");
}

TEST_CASE(test_volume_parses_decimal) {
    FieldDecoder decoder("shairport-sync");
    auto update = std::get<VolumeUpdate>(instruction_of(decoder.decode("shairport-sync/volume", "-15.5")));
    ASSERT_NEAR(update.value, -15.5, 1e-9);
}

TEST_CASE(test_volume_rejects_non_numbers) {
    FieldDecoder decoder("shairport-sync");
    ASSERT_TRUE(is_error(decoder.decode("shairport-sync/volume", "loud")));
    ASSERT_TRUE(is_error(decoder.decode("shairport-sync/volume", "")));
    ASSERT_TRUE(is_error(decoder.decode("shairport-sync/volume", "12abc")));
    ASSERT_TRUE(is_error(decoder.decode("shairport-sync/volume", "nan")));
    ASSERT_TRUE(is_error(decoder.decode("shairport-sync/volume", "inf")));
}

TEST_CASE(test_volume_error_names_payload) {
    FieldDecoder decoder("shairport-sync");
    auto result = decoder.decode("shairport-sync/volume", "loud");
    ASSERT_TRUE(std::get<DecodeError>(result).message.find("loud") != std::string::npos);
}

TEST_CASE(test_parse_volume_forms) {
    ASSERT_NEAR(*FieldDecoder::parse_volume(" -30.0\n"), -30.0, 1e-9);
    ASSERT_NEAR(*FieldDecoder::parse_volume("+2.5"), 2.5, 1e-9);
    ASSERT_NEAR(*FieldDecoder::parse_volume("-144"), -144.0, 1e-9);
    ASSERT_NEAR(*FieldDecoder::parse_volume("-24.06,46.75,-96.30,0.00"), -24.06, 1e-9);
    ASSERT_FALSE(FieldDecoder::parse_volume("+-1").has_value());
    ASSERT_FALSE(FieldDecoder::parse_volume(",1").has_value());
    ASSERT_FALSE(FieldDecoder::parse_volume("1e999").has_value());
}

TEST_CASE(test_artwork_keeps_raw_bytes) {
    FieldDecoder decoder("shairport-sync");
    std::string jpeg("\xFF\xD8\xFF\xE0\x00\x10JFIF", 10);
    auto update = std::get<ArtworkUpdate>(instruction_of(decoder.decode("shairport-sync/cover", jpeg)));

    ASSERT_TRUE(update.artwork != nullptr);
    ASSERT_EQ(update.artwork->size(), 10u);
    ASSERT_EQ((*update.artwork)[0], 0xFF);
    ASSERT_EQ((*update.artwork)[4], 0x00);
}

TEST_CASE(test_empty_artwork_clears_image) {
    FieldDecoder decoder("shairport-sync");
    auto update = std::get<ArtworkUpdate>(instruction_of(decoder.decode("shairport-sync/artwork", "")));
    ASSERT_TRUE(update.artwork == nullptr);
}

TEST_CASE(test_fixed_transition_topics) {
    FieldDecoder decoder("shairport-sync");
    ASSERT_TRUE(transition_of(decoder.decode("shairport-sync/play_start", "")) == PlayerState::Playing);
    ASSERT_TRUE(transition_of(decoder.decode("shairport-sync/play_resume", "--")) == PlayerState::Playing);
    ASSERT_TRUE(transition_of(decoder.decode("shairport-sync/pause", "")) == PlayerState::Paused);
    ASSERT_TRUE(transition_of(decoder.decode("shairport-sync/play_end", "")) == PlayerState::Stopped);
    ASSERT_TRUE(transition_of(decoder.decode("shairport-sync/play_flush", "")) == PlayerState::Stopped);
    ASSERT_TRUE(transition_of(decoder.decode("shairport-sync/active_start", "")) == PlayerState::Loading);
    ASSERT_TRUE(transition_of(decoder.decode("shairport-sync/active_end", "")) == PlayerState::Stopped);
}

TEST_CASE(test_play_state_token_is_case_and_space_insensitive) {
    FieldDecoder decoder("shairport-sync");
    ASSERT_TRUE(transition_of(decoder.decode("shairport-sync/play_state", "playing")) == PlayerState::Playing);
    ASSERT_TRUE(transition_of(decoder.decode("shairport-sync/play_state", " PAUSED\n")) == PlayerState::Paused);
    ASSERT_TRUE(transition_of(decoder.decode("shairport-sync/play_state", "Loading")) == PlayerState::Loading);
    ASSERT_TRUE(is_error(decoder.decode("shairport-sync/play_state", "rewinding")));
}

TEST_CASE(test_unknown_suffix_is_ignored_not_error) {
    FieldDecoder decoder("shairport-sync");
    auto result = decoder.decode("shairport-sync/track_id", "abc");
    ASSERT_TRUE(is_ignored(result));
    ASSERT_TRUE(std::get<Ignored>(result).reason.find("track_id") != std::string::npos);
}

TEST_CASE(test_topic_outside_prefix_is_ignored) {
    FieldDecoder decoder("shairport-sync");
    ASSERT_TRUE(is_ignored(decoder.decode("other/title", "x")));
    ASSERT_TRUE(is_ignored(decoder.decode("shairport-syncX/title", "x")));
    ASSERT_TRUE(is_ignored(decoder.decode("shairport-sync", "x")));
    ASSERT_TRUE(is_ignored(decoder.decode("shairport-sync/", "x")));
}

TEST_CASE(test_prefix_trailing_slash_and_nesting) {
    FieldDecoder decoder("home/living-room/airplay/");
    ASSERT_EQ(decoder.topic_prefix(), "home/living-room/airplay");
    auto update = std::get<TextUpdate>(instruction_of(decoder.decode("home/living-room/airplay/album", "B")));
    ASSERT_EQ(update.value, "B");
}

TEST_CASE(test_decode_is_deterministic) {
    FieldDecoder decoder("shairport-sync");
    auto a = decoder.decode("shairport-sync/title", "Same");
    auto b = decoder.decode("shairport-sync/title", "Same");
    ASSERT_TRUE(std::get<TextUpdate>(instruction_of(a)) == std::get<TextUpdate>(instruction_of(b)));
}

TEST_CASE(test_custom_table_rules) {
    TopicTable table = TopicTable::shairport_defaults();
    ASSERT_TRUE(table.remove_rule("genre"));
    ASSERT_FALSE(table.remove_rule("genre"));
    table.add_rule("songalbum", TextRule{TextField::Album});
    table.add_rule("volume", TextRule{TextField::Title});

    FieldDecoder decoder("ss", table);
    ASSERT_TRUE(is_ignored(decoder.decode("ss/genre", "Jazz")));
    ASSERT_TRUE(std::get<TextUpdate>(instruction_of(decoder.decode("ss/songalbum", "A"))).field == TextField::Album);
    ASSERT_TRUE(std::holds_alternative<TextUpdate>(instruction_of(decoder.decode("ss/volume", "x"))));
}

TEST_CASE(test_default_table_contents) {
    auto table = TopicTable::shairport_defaults();
    ASSERT_TRUE(table.find("title") != nullptr);
    ASSERT_TRUE(std::holds_alternative<VolumeRule>(*table.find("volume")));
    ASSERT_TRUE(std::holds_alternative<ArtworkRule>(*table.find("cover")));
    ASSERT_TRUE(table.find("ssnc") == nullptr);
    ASSERT_EQ(table.size(), 17u);
}

int main() {
    return shairmeta::test::TestRunner::instance().run_all();
}
