#pragma once

#include "core/types.hh"
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace mosaic {

// ============================================================================
// Game Events
// ============================================================================

enum class EventType : std::uint8_t {
    GAME_CREATED = 0x01,
    TILE_REVEAL_REQUESTED = 0x02,   // Trigger for the unlocking agent
    TILE_REVEALED = 0x03,
    GAME_SOLVED = 0x04,
};

[[nodiscard]] inline std::string_view event_type_string(EventType type) {
    switch (type) {
        case EventType::GAME_CREATED: return "game_created";
        case EventType::TILE_REVEAL_REQUESTED: return "tile_reveal_requested";
        case EventType::TILE_REVEALED: return "tile_revealed";
        case EventType::GAME_SOLVED: return "game_solved";
    }
    return "unknown";
}

// Field use by type:
//   GAME_CREATED           actor = creator
//   TILE_REVEAL_REQUESTED  tile_index, actor = requester
//   TILE_REVEALED          tile_index, key
//   GAME_SOLVED            actor = winner, amount = payout
struct GameEvent {
    EventType type = EventType::GAME_CREATED;
    GameId game_id;
    tile_index_t tile_index = 0;
    Address actor;
    bytes_t key;
    amount_t amount = 0;

    [[nodiscard]] static GameEvent game_created(const GameId& game, const Address& creator);
    [[nodiscard]] static GameEvent reveal_requested(const GameId& game, tile_index_t tile,
                                                    const Address& requester);
    [[nodiscard]] static GameEvent tile_revealed(const GameId& game, tile_index_t tile,
                                                 bytes_t key);
    [[nodiscard]] static GameEvent game_solved(const GameId& game, const Address& winner,
                                               amount_t payout);

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<GameEvent> deserialize(std::span<const std::uint8_t> data);

    bool operator==(const GameEvent&) const = default;
};

// ============================================================================
// Event Listener Interface
// ============================================================================

class EventListener {
public:
    virtual ~EventListener() = default;
    virtual void on_event(const GameEvent& event) = 0;
};

// ============================================================================
// Event Bus
// ============================================================================

// Fans events out to subscribers in publication order. Listeners are called
// without any game lock held and may call back into games.
class EventBus {
public:
    void subscribe(std::shared_ptr<EventListener> listener);
    void unsubscribe(const std::shared_ptr<EventListener>& listener);

    void publish(const std::vector<GameEvent>& events);

    [[nodiscard]] std::uint64_t published_count() const;

private:
    std::vector<std::shared_ptr<EventListener>> listeners_;
    std::uint64_t published_ = 0;
    mutable std::mutex mutex_;
};

// ============================================================================
// Event Recorder
// ============================================================================

// Keeps every event it sees; an in-process stand-in for an indexer.
class EventRecorder : public EventListener {
public:
    void on_event(const GameEvent& event) override;

    [[nodiscard]] std::vector<GameEvent> events() const;
    [[nodiscard]] std::vector<GameEvent> events_of(EventType type) const;
    [[nodiscard]] std::size_t count(EventType type) const;
    void clear();

private:
    std::vector<GameEvent> events_;
    mutable std::mutex mutex_;
};

}  // namespace mosaic
