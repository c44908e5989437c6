#include "backend/PlaybackStore.hpp"
#include <chrono>
#include <variant>

namespace shairmeta::backend {

namespace {
    template <class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    std::optional<std::string>& text_slot(model::NowPlaying& record, model::TextField field) {
        switch (field) {
            case model::TextField::Title:      return record.title;
            case model::TextField::Artist:     return record.artist;
            case model::TextField::Album:      return record.album;
            case model::TextField::Genre:      return record.genre;
            case model::TextField::ClientName: return record.client_name;
        }
        return record.title;
    }
}

PlaybackStore::PlaybackStore()
    : current_(std::shared_ptr<const model::NowPlaying>(std::make_shared<model::NowPlaying>())) {
}

PlaybackStore::~PlaybackStore() = default;

void PlaybackStore::apply(const model::Instruction& instruction) {
    // Whole-field replacement only; nothing here reads another field
    update([&instruction](model::NowPlaying& record) {
        std::visit(overloaded{
            [&](const model::TextUpdate& u) {
                text_slot(record, u.field) = u.value;
            },
            [&](const model::VolumeUpdate& u) {
                record.volume = u.value;
            },
            [&](const model::ArtworkUpdate& u) {
                // Replace the pointer, never the bytes behind it
                record.artwork = u.artwork;
            },
            [&](const model::PlaybackTransition& u) {
                record.player_state = u.state;
            },
        }, instruction);
    });
}

void PlaybackStore::update(const std::function<void(model::NowPlaying&)>& updater) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    // Copy is O(field count): artwork is shared, not duplicated
    auto next = std::make_shared<model::NowPlaying>(*current_.load(std::memory_order_acquire));
    updater(*next);
    next->seq += 1;
    next->updated_at = std::chrono::system_clock::now();

    current_.store(std::shared_ptr<const model::NowPlaying>(std::move(next)), std::memory_order_release);
}

// LOCK-FREE READ PATH (with respect to writers)
// Called once per HTTP request from any number of worker threads.
std::shared_ptr<const model::NowPlaying> PlaybackStore::snapshot() const {
    return current_.load(std::memory_order_acquire);
}

}  // namespace shairmeta::backend
