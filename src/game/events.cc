#include "events.hh"
#include "core/logging.hh"
#include <algorithm>

namespace mosaic {

// ============================================================================
// GameEvent Implementation
// ============================================================================

GameEvent GameEvent::game_created(const GameId& game, const Address& creator) {
    GameEvent event;
    event.type = EventType::GAME_CREATED;
    event.game_id = game;
    event.actor = creator;
    return event;
}

GameEvent GameEvent::reveal_requested(const GameId& game, tile_index_t tile,
                                      const Address& requester) {
    GameEvent event;
    event.type = EventType::TILE_REVEAL_REQUESTED;
    event.game_id = game;
    event.tile_index = tile;
    event.actor = requester;
    return event;
}

GameEvent GameEvent::tile_revealed(const GameId& game, tile_index_t tile, bytes_t key) {
    GameEvent event;
    event.type = EventType::TILE_REVEALED;
    event.game_id = game;
    event.tile_index = tile;
    event.key = std::move(key);
    return event;
}

GameEvent GameEvent::game_solved(const GameId& game, const Address& winner, amount_t payout) {
    GameEvent event;
    event.type = EventType::GAME_SOLVED;
    event.game_id = game;
    event.actor = winner;
    event.amount = payout;
    return event;
}

std::vector<std::uint8_t> GameEvent::serialize() const {
    ByteWriter writer;
    writer.put_u8(static_cast<std::uint8_t>(type));
    writer.put_hash(game_id.bytes);
    writer.put_u64(tile_index);
    writer.put_hash(actor.bytes);
    writer.put_bytes(key);
    writer.put_u64(amount);
    return writer.take();
}

std::optional<GameEvent> GameEvent::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);

    auto type_byte = reader.get_u8();
    if (!type_byte || *type_byte < static_cast<std::uint8_t>(EventType::GAME_CREATED) ||
        *type_byte > static_cast<std::uint8_t>(EventType::GAME_SOLVED)) {
        return std::nullopt;
    }

    auto game = reader.get_hash();
    auto tile = reader.get_u64();
    auto actor = reader.get_hash();
    auto key = reader.get_bytes();
    auto amount = reader.get_u64();
    if (!game || !tile || !actor || !key || !amount || !reader.at_end()) {
        return std::nullopt;
    }

    GameEvent event;
    event.type = static_cast<EventType>(*type_byte);
    event.game_id.bytes = *game;
    event.tile_index = *tile;
    event.actor.bytes = *actor;
    event.key = std::move(*key);
    event.amount = *amount;
    return event;
}

// ============================================================================
// EventBus Implementation
// ============================================================================

void EventBus::subscribe(std::shared_ptr<EventListener> listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void EventBus::unsubscribe(const std::shared_ptr<EventListener>& listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

void EventBus::publish(const std::vector<GameEvent>& events) {
    if (events.empty()) {
        return;
    }

    // Copy the listener list so handlers can subscribe or publish re-entrantly
    std::vector<std::shared_ptr<EventListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
        published_ += events.size();
    }

    for (const auto& event : events) {
        MOSAIC_LOG_TRACE(log::events) << event_type_string(event.type)
                                      << " game=" << event.game_id.to_hex().substr(0, 16)
                                      << " tile=" << event.tile_index;
        for (const auto& listener : listeners) {
            listener->on_event(event);
        }
    }
}

std::uint64_t EventBus::published_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

// ============================================================================
// EventRecorder Implementation
// ============================================================================

void EventRecorder::on_event(const GameEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<GameEvent> EventRecorder::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<GameEvent> EventRecorder::events_of(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GameEvent> result;
    for (const auto& event : events_) {
        if (event.type == type) {
            result.push_back(event);
        }
    }
    return result;
}

std::size_t EventRecorder::count(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        events_.begin(), events_.end(),
        [type](const GameEvent& e) { return e.type == type; }));
}

void EventRecorder::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

}  // namespace mosaic
