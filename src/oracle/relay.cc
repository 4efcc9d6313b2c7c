#include "relay.hh"
#include "core/logging.hh"
#include "game/registry.hh"
#include <exception>
#include <vector>

namespace mosaic {

OracleRelay::OracleRelay(GameSystem& system,
                         OracleCapability capability,
                         std::shared_ptr<KeyRecoveryService> service,
                         RelayConfig config)
    : system_(system)
    , capability_(std::move(capability))
    , service_(std::move(service))
    , config_(config) {
    if (config_.max_attempts == 0) {
        config_.max_attempts = 1;
    }
}

void OracleRelay::on_event(const GameEvent& event) {
    if (event.type != EventType::TILE_REVEAL_REQUESTED) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(PendingReveal{event.game_id, event.tile_index, 0});
    MOSAIC_LOG_DEBUG(log::oracle) << "Queued reveal of tile " << event.tile_index
                                  << " in game " << event.game_id.to_hex().substr(0, 16);
}

RelayStats OracleRelay::process_pending() {
    RelayStats stats;
    std::lock_guard<std::mutex> cap_lock(capability_mutex_);

    if (!capability_) {
        MOSAIC_LOG_WARN(log::oracle) << "No capability held, leaving " << pending_count()
                                     << " requests queued";
        return stats;
    }

    std::deque<PendingReveal> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queue_);
    }

    std::vector<PendingReveal> retry;
    for (auto& request : batch) {
        switch (handle(request, *capability_)) {
            case Outcome::FULFILLED: ++stats.fulfilled; break;
            case Outcome::SKIPPED: ++stats.skipped; break;
            case Outcome::DROPPED: ++stats.dropped; break;
            case Outcome::RETRY:
                ++stats.retried;
                retry.push_back(request);
                break;
        }
    }

    if (!retry.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.insert(queue_.end(), retry.begin(), retry.end());
    }

    MOSAIC_LOG_DEBUG(log::oracle) << "Processed " << batch.size() << " requests: "
                                  << stats.fulfilled << " fulfilled, " << stats.skipped
                                  << " skipped, " << stats.retried << " retried, "
                                  << stats.dropped << " dropped";
    return stats;
}

OracleRelay::Outcome OracleRelay::handle(PendingReveal& request,
                                         const OracleCapability& capability) {
    auto game = system_.find_game(request.game_id);
    if (!game) {
        MOSAIC_LOG_ERROR(log::oracle) << "Reveal request for unknown game "
                                      << request.game_id.to_hex().substr(0, 16);
        return Outcome::DROPPED;
    }

    auto state = game->tile_state(request.tile_index);
    if (!state) {
        MOSAIC_LOG_ERROR(log::oracle) << "Reveal request for invalid tile " << request.tile_index;
        return Outcome::DROPPED;
    }
    if (*state == TileState::REVEALED) {
        MOSAIC_LOG_DEBUG(log::oracle) << "Tile " << request.tile_index
                                      << " already revealed, skipping";
        return Outcome::SKIPPED;
    }

    KeyRecoveryRequest recovery;
    recovery.game_id = request.game_id;
    recovery.tile_index = request.tile_index;
    recovery.locked_secret = *game->locked_secret(request.tile_index);
    recovery.unlock_ref = *game->unlock_ref(request.tile_index);

    std::optional<bytes_t> key;
    try {
        key = service_->recover(recovery);
    } catch (const std::exception& e) {
        MOSAIC_LOG_WARN(log::oracle) << "Key recovery for tile " << request.tile_index
                                     << " threw: " << e.what();
    }

    if (!key) {
        ++request.attempts;
        if (request.attempts >= config_.max_attempts) {
            MOSAIC_LOG_ERROR(log::oracle) << "Giving up on tile " << request.tile_index
                                          << " of game " << request.game_id.to_hex().substr(0, 16)
                                          << " after " << request.attempts << " attempts";
            return Outcome::DROPPED;
        }
        return Outcome::RETRY;
    }

    bytes_t published = config_.hex_encode_keys ? to_bytes(bytes_to_hex(*key)) : std::move(*key);

    GameStatus status = game->fulfill_reveal(capability, request.tile_index, std::move(published));
    if (status != GameStatus::SUCCESS) {
        MOSAIC_LOG_ERROR(log::oracle) << "Fulfillment of tile " << request.tile_index
                                      << " rejected: " << game_status_string(status);
        return Outcome::DROPPED;
    }

    MOSAIC_LOG_INFO(log::oracle) << "Revealed tile " << request.tile_index << " of game "
                                 << request.game_id.to_hex().substr(0, 16);
    return Outcome::FULFILLED;
}

std::size_t OracleRelay::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool OracleRelay::holds_capability() const {
    std::lock_guard<std::mutex> lock(capability_mutex_);
    return capability_.has_value();
}

std::optional<OracleCapability> OracleRelay::release_capability() {
    std::lock_guard<std::mutex> lock(capability_mutex_);
    std::optional<OracleCapability> released = std::move(capability_);
    capability_.reset();
    if (released) {
        MOSAIC_LOG_INFO(log::oracle) << "Released oracle capability";
    }
    return released;
}

}  // namespace mosaic
