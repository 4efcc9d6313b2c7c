#include <gtest/gtest.h>
#include "game/events.hh"
#include "test_util.hh"

namespace mosaic {
namespace {

GameId make_game_id(std::uint8_t fill) {
    GameId id;
    id.bytes.fill(fill);
    return id;
}

// Publishes a follow-up event the first time it sees a request
class ChainingListener : public EventListener {
public:
    explicit ChainingListener(EventBus& bus) : bus_(bus) {}

    void on_event(const GameEvent& event) override {
        if (event.type == EventType::TILE_REVEAL_REQUESTED && !chained_) {
            chained_ = true;
            bus_.publish({GameEvent::tile_revealed(event.game_id, event.tile_index,
                                                   to_bytes("key"))});
        }
    }

private:
    EventBus& bus_;
    bool chained_ = false;
};

class EventsTest : public ::testing::Test {
protected:
    void SetUp() override {
        recorder_ = std::make_shared<EventRecorder>();
        bus_.subscribe(recorder_);
        game_ = make_game_id(0x5A);
    }

    EventBus bus_;
    std::shared_ptr<EventRecorder> recorder_;
    GameId game_;
};

// ============================================================================
// GameEvent
// ============================================================================

TEST_F(EventsTest, FactoriesFillTheirFields) {
    Address who = test::make_address(0x01);

    auto requested = GameEvent::reveal_requested(game_, 7, who);
    EXPECT_EQ(requested.type, EventType::TILE_REVEAL_REQUESTED);
    EXPECT_EQ(requested.tile_index, 7);
    EXPECT_EQ(requested.actor, who);

    auto solved = GameEvent::game_solved(game_, who, 4000);
    EXPECT_EQ(solved.type, EventType::GAME_SOLVED);
    EXPECT_EQ(solved.amount, 4000);

    auto revealed = GameEvent::tile_revealed(game_, 3, to_bytes("k"));
    EXPECT_EQ(revealed.key, to_bytes("k"));
}

TEST_F(EventsTest, SerializationPreservesEvent) {
    auto event = GameEvent::tile_revealed(game_, 42, to_bytes("decrypted-key"));
    auto restored = GameEvent::deserialize(event.serialize());
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, event);
}

TEST_F(EventsTest, DeserializeRejectsUnknownType) {
    auto data = GameEvent::game_created(game_, test::make_address(0x01)).serialize();
    data[0] = 0x09;
    EXPECT_FALSE(GameEvent::deserialize(data).has_value());
    data[0] = 0x00;
    EXPECT_FALSE(GameEvent::deserialize(data).has_value());
}

TEST_F(EventsTest, DeserializeRejectsTruncatedOrTrailing) {
    auto data = GameEvent::game_created(game_, test::make_address(0x01)).serialize();

    std::vector<std::uint8_t> truncated(data.begin(), data.end() - 1);
    EXPECT_FALSE(GameEvent::deserialize(truncated).has_value());

    data.push_back(0x00);
    EXPECT_FALSE(GameEvent::deserialize(data).has_value());
}

TEST_F(EventsTest, TypeNames) {
    EXPECT_EQ(event_type_string(EventType::GAME_CREATED), "game_created");
    EXPECT_EQ(event_type_string(EventType::TILE_REVEAL_REQUESTED), "tile_reveal_requested");
    EXPECT_EQ(event_type_string(EventType::GAME_SOLVED), "game_solved");
}

// ============================================================================
// EventBus / EventRecorder
// ============================================================================

TEST_F(EventsTest, PublishDeliversInOrder) {
    bus_.publish({GameEvent::game_created(game_, test::make_address(0x01)),
                  GameEvent::reveal_requested(game_, 1, test::make_address(0x02))});

    auto events = recorder_->events();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].type, EventType::GAME_CREATED);
    EXPECT_EQ(events[1].type, EventType::TILE_REVEAL_REQUESTED);
    EXPECT_EQ(bus_.published_count(), 2);
}

TEST_F(EventsTest, EmptyPublishIsIgnored) {
    bus_.publish({});
    EXPECT_EQ(bus_.published_count(), 0);
    EXPECT_TRUE(recorder_->events().empty());
}

TEST_F(EventsTest, UnsubscribedListenerStopsReceiving) {
    bus_.publish({GameEvent::game_created(game_, test::make_address(0x01))});
    bus_.unsubscribe(recorder_);
    bus_.publish({GameEvent::game_created(game_, test::make_address(0x02))});

    EXPECT_EQ(recorder_->events().size(), 1);
    EXPECT_EQ(bus_.published_count(), 2);
}

TEST_F(EventsTest, NullListenerIgnored) {
    bus_.subscribe(nullptr);
    bus_.publish({GameEvent::game_created(game_, test::make_address(0x01))});
    EXPECT_EQ(recorder_->events().size(), 1);
}

TEST_F(EventsTest, ListenerMayPublishReentrantly) {
    bus_.subscribe(std::make_shared<ChainingListener>(bus_));

    bus_.publish({GameEvent::reveal_requested(game_, 5, test::make_address(0x03))});

    EXPECT_EQ(recorder_->count(EventType::TILE_REVEAL_REQUESTED), 1);
    EXPECT_EQ(recorder_->count(EventType::TILE_REVEALED), 1);
    EXPECT_EQ(bus_.published_count(), 2);
}

TEST_F(EventsTest, RecorderFiltersAndClears) {
    bus_.publish({GameEvent::reveal_requested(game_, 1, test::make_address(0x01)),
                  GameEvent::reveal_requested(game_, 2, test::make_address(0x01)),
                  GameEvent::game_solved(game_, test::make_address(0x01), 2000)});

    auto requests = recorder_->events_of(EventType::TILE_REVEAL_REQUESTED);
    ASSERT_EQ(requests.size(), 2);
    EXPECT_EQ(requests[1].tile_index, 2);
    EXPECT_EQ(recorder_->count(EventType::GAME_SOLVED), 1);

    recorder_->clear();
    EXPECT_TRUE(recorder_->events().empty());
}

}  // namespace
}  // namespace mosaic
