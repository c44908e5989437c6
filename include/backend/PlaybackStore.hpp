#pragma once

#include "model/NowPlaying.hpp"
#include "model/Instruction.hpp"
#include <memory>
#include <functional>
#include <mutex>
#include <atomic>

namespace shairmeta::backend {

/// Owner of the single NowPlaying record.
///
/// THREAD SAFETY:
/// - apply() calls are serialized by write_mutex_ (one writer at a time)
/// - Each apply() builds a new immutable record and swaps it in atomically
/// - snapshot() is a single atomic load; readers never touch write_mutex_
/// - A snapshot already handed out is never modified, so it cannot tear
class PlaybackStore {
public:
    PlaybackStore();
    ~PlaybackStore();

    PlaybackStore(const PlaybackStore&) = delete;
    PlaybackStore& operator=(const PlaybackStore&) = delete;

    void apply(const model::Instruction& instruction);

    // Never null
    [[nodiscard]] std::shared_ptr<const model::NowPlaying> snapshot() const;

    // Feed connectivity does not matter here: a store that exists can always answer
    [[nodiscard]] bool is_alive() const { return true; }

private:
    void update(const std::function<void(model::NowPlaying&)>& updater);

    std::atomic<std::shared_ptr<const model::NowPlaying>> current_;
    std::mutex write_mutex_;
};

}  // namespace shairmeta::backend
