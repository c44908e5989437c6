#include "decoder/TopicTable.hpp"

namespace shairmeta::decoder {

using model::PlayerState;
using model::TextField;

TopicTable TopicTable::shairport_defaults() {
    TopicTable table;

    table.add_rule("title", TextRule{TextField::Title});
    table.add_rule("artist", TextRule{TextField::Artist});
    table.add_rule("album", TextRule{TextField::Album});
    table.add_rule("genre", TextRule{TextField::Genre});
    table.add_rule("client_name", TextRule{TextField::ClientName});
    table.add_rule("client", TextRule{TextField::ClientName});

    table.add_rule("volume", VolumeRule{});

    table.add_rule("cover", ArtworkRule{});
    table.add_rule("artwork", ArtworkRule{});

    table.add_rule("play_state", TransitionTokenRule{});
    table.add_rule("play_start", FixedTransitionRule{PlayerState::Playing});
    table.add_rule("play_resume", FixedTransitionRule{PlayerState::Playing});
    table.add_rule("pause", FixedTransitionRule{PlayerState::Paused});
    table.add_rule("play_end", FixedTransitionRule{PlayerState::Stopped});
    table.add_rule("play_flush", FixedTransitionRule{PlayerState::Stopped});

    // A session opening is not playback yet
    table.add_rule("active_start", FixedTransitionRule{PlayerState::Loading});
    table.add_rule("active_end", FixedTransitionRule{PlayerState::Stopped});

    return table;
}

void TopicTable::add_rule(std::string suffix, DecodeRule rule) {
    rules_.insert_or_assign(std::move(suffix), rule);
}

bool TopicTable::remove_rule(std::string_view suffix) {
    auto it = rules_.find(suffix);
    if (it == rules_.end()) return false;
    rules_.erase(it);
    return true;
}

const DecodeRule* TopicTable::find(std::string_view suffix) const {
    auto it = rules_.find(suffix);
    if (it == rules_.end()) return nullptr;
    return &it->second;
}

}  // namespace shairmeta::decoder
