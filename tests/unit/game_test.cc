#include <gtest/gtest.h>
#include "game/registry.hh"
#include "test_util.hh"

namespace mosaic {
namespace {

using namespace std::chrono_literals;

// Checks a game's state from inside a listener, which only works if the
// game lock is not held while events are delivered.
class ObservingListener : public EventListener {
public:
    void on_event(const GameEvent& event) override {
        if (auto game = game_.lock()) {
            pools_seen.push_back(game->prize_pool());
            solved_seen.push_back(game->is_solved());
        }
        types.push_back(event.type);
    }

    void watch(const std::shared_ptr<Game>& game) { game_ = game; }

    std::vector<amount_t> pools_seen;
    std::vector<bool> solved_seen;
    std::vector<EventType> types;

private:
    std::weak_ptr<Game> game_;
};

class GameTest : public ::testing::Test {
protected:
    void SetUp() override { init(test::fast_config()); }

    void init(const GameConfig& config) {
        auto genesis = GameSystem::bootstrap(config);
        ASSERT_TRUE(genesis.has_value());
        system_ = std::move(genesis->system);
        capability_.emplace(std::move(genesis->capability));

        recorder_ = std::make_shared<EventRecorder>();
        system_->events()->subscribe(recorder_);

        auto created = system_->create_game(creator_, test::make_setup(config, "sui"));
        ASSERT_EQ(created.status, GameStatus::SUCCESS);
        game_ = created.game;
    }

    amount_t price() const { return system_->config().tile_price; }

    GameStatus request(const Address& who, tile_index_t index) {
        Coin payment = wallet_.coin(price());
        return game_->request_reveal(who, index, payment);
    }

    GameStatus commit(const Address& who, std::string_view answer, std::string_view salt,
                      timestamp_t now = timestamp_t{0}) {
        return game_->commit_guess(who, test::commit_for(system_->config(), answer, salt), now);
    }

    SolveResult solve(const Address& who, std::string_view answer, std::string_view salt,
                      timestamp_t now = timestamp_t{0}) {
        return game_->solve(who, to_bytes(answer), to_bytes(salt), to_bytes("unused"), now);
    }

    Address creator_ = test::make_address(0x01);
    Address player_a_ = test::make_address(0x0A);
    Address player_b_ = test::make_address(0x0B);
    Address player_c_ = test::make_address(0x0C);

    test::Wallet wallet_{test::make_address(0xFF)};
    std::unique_ptr<GameSystem> system_;
    std::optional<OracleCapability> capability_;
    std::shared_ptr<EventRecorder> recorder_;
    std::shared_ptr<Game> game_;
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(GameTest, CreatedGameStartsEmpty) {
    EXPECT_EQ(game_->tile_count(), DEFAULT_TILE_COUNT);
    EXPECT_FALSE(game_->is_solved());
    EXPECT_FALSE(game_->winner().has_value());
    EXPECT_EQ(game_->prize_pool(), 0);
    EXPECT_EQ(game_->revealed_count(), 0);
    EXPECT_EQ(game_->creator(), creator_);
    EXPECT_EQ(game_->manifest_handle(), "blob://manifest");
    EXPECT_EQ(game_->answer_digest(), sha3_256(to_bytes("sui")));
    EXPECT_EQ(game_->locked_secret(5), to_bytes("ciphertext-5"));
    EXPECT_EQ(game_->unlock_ref(5), "seal-id-5");
    EXPECT_EQ(recorder_->count(EventType::GAME_CREATED), 1);
}

TEST_F(GameTest, MismatchedSetupRejected) {
    auto setup = test::make_setup(system_->config(), "sui");
    setup.unlock_refs.pop_back();

    auto result = system_->create_game(creator_, std::move(setup));
    EXPECT_EQ(result.status, GameStatus::INVALID_PAYMENT);
    EXPECT_EQ(result.game, nullptr);
    EXPECT_EQ(system_->game_count(), 1);
}

TEST_F(GameTest, GamesGetDistinctIds) {
    auto second = system_->create_game(creator_, test::make_setup(system_->config(), "sui"));
    ASSERT_EQ(second.status, GameStatus::SUCCESS);

    EXPECT_NE(second.game->id(), game_->id());
    EXPECT_EQ(system_->game_count(), 2);
    EXPECT_EQ(system_->find_game(game_->id()), game_);
    EXPECT_EQ(system_->game_ids().size(), 2);
}

TEST_F(GameTest, OutOfRangeQueriesReturnNothing) {
    EXPECT_FALSE(game_->tile_state(DEFAULT_TILE_COUNT).has_value());
    EXPECT_FALSE(game_->revealed_key(DEFAULT_TILE_COUNT).has_value());
    EXPECT_FALSE(game_->locked_secret(DEFAULT_TILE_COUNT).has_value());
    EXPECT_FALSE(game_->unlock_ref(DEFAULT_TILE_COUNT).has_value());
}

// ============================================================================
// End-to-end flows
// ============================================================================

TEST_F(GameTest, PaidRequestThenFulfillRevealsTile) {
    EXPECT_EQ(request(player_a_, 0), GameStatus::SUCCESS);
    EXPECT_EQ(game_->prize_pool(), price());
    EXPECT_EQ(game_->tile_state(0), TileState::REQUESTED);
    EXPECT_FALSE(game_->revealed_key(0).has_value());

    auto requests = recorder_->events_of(EventType::TILE_REVEAL_REQUESTED);
    ASSERT_EQ(requests.size(), 1);
    EXPECT_EQ(requests[0].tile_index, 0);
    EXPECT_EQ(requests[0].actor, player_a_);

    EXPECT_EQ(game_->fulfill_reveal(*capability_, 0, to_bytes("k0")), GameStatus::SUCCESS);
    EXPECT_EQ(game_->revealed_key(0), to_bytes("k0"));

    // Second fulfillment is a no-op
    EXPECT_EQ(game_->fulfill_reveal(*capability_, 0, to_bytes("other")), GameStatus::SUCCESS);
    EXPECT_EQ(game_->revealed_key(0), to_bytes("k0"));
    EXPECT_EQ(recorder_->count(EventType::TILE_REVEALED), 1);
}

TEST_F(GameTest, CorrectCommitAndSolveWinsWholePool) {
    for (tile_index_t i = 0; i < 4; ++i) {
        ASSERT_EQ(request(player_a_, i), GameStatus::SUCCESS);
    }
    ASSERT_EQ(game_->prize_pool(), 4 * price());

    ASSERT_EQ(commit(player_b_, "sui", "salt1"), GameStatus::SUCCESS);
    auto result = solve(player_b_, "sui", "salt1");

    EXPECT_EQ(result.status, GameStatus::SUCCESS);
    EXPECT_EQ(result.payout.value(), 4 * price());
    EXPECT_TRUE(game_->is_solved());
    EXPECT_EQ(game_->winner(), player_b_);
    EXPECT_EQ(game_->prize_pool(), 0);

    auto solved = recorder_->events_of(EventType::GAME_SOLVED);
    ASSERT_EQ(solved.size(), 1);
    EXPECT_EQ(solved[0].actor, player_b_);
    EXPECT_EQ(solved[0].amount, 4 * price());
}

TEST_F(GameTest, CommitmentThatDoesNotOpenIsConsumed) {
    ASSERT_EQ(request(player_a_, 0), GameStatus::SUCCESS);
    ASSERT_EQ(commit(player_c_, "sui", "salt1"), GameStatus::SUCCESS);

    auto result = solve(player_c_, "moon", "salt1");
    EXPECT_EQ(result.status, GameStatus::INCORRECT_ANSWER);
    EXPECT_TRUE(result.payout.is_zero());
    EXPECT_FALSE(game_->has_commitment(player_c_));
    EXPECT_FALSE(game_->is_solved());
    EXPECT_EQ(game_->prize_pool(), price());
}

TEST_F(GameTest, TileIndexPastEndAlwaysRejected) {
    EXPECT_EQ(request(player_a_, DEFAULT_TILE_COUNT), GameStatus::INVALID_TILE_INDEX);
    EXPECT_EQ(request(player_a_, 1'000'000), GameStatus::INVALID_TILE_INDEX);
    EXPECT_EQ(game_->fulfill_reveal(*capability_, DEFAULT_TILE_COUNT, to_bytes("k")),
              GameStatus::INVALID_TILE_INDEX);
    EXPECT_EQ(game_->prize_pool(), 0);
}

// ============================================================================
// Tile reveals
// ============================================================================

TEST_F(GameTest, WrongPaymentLeavesCoinAndPool) {
    Coin short_coin = wallet_.coin(price() - 1);
    EXPECT_EQ(game_->request_reveal(player_a_, 0, short_coin), GameStatus::INVALID_PAYMENT);
    EXPECT_EQ(short_coin.value(), price() - 1);

    Coin long_coin = wallet_.coin(price() + 1);
    EXPECT_EQ(game_->request_reveal(player_a_, 0, long_coin), GameStatus::INVALID_PAYMENT);
    EXPECT_EQ(long_coin.value(), price() + 1);

    EXPECT_EQ(game_->prize_pool(), 0);
    EXPECT_EQ(game_->tile_state(0), TileState::LOCKED);
    EXPECT_EQ(recorder_->count(EventType::TILE_REVEAL_REQUESTED), 0);
}

TEST_F(GameTest, RevealedTileRejectsFurtherRequests) {
    ASSERT_EQ(game_->fulfill_reveal(*capability_, 9, to_bytes("k9")), GameStatus::SUCCESS);

    Coin payment = wallet_.coin(price());
    EXPECT_EQ(game_->request_reveal(player_a_, 9, payment), GameStatus::TILE_ALREADY_REVEALED);
    EXPECT_EQ(payment.value(), price());
}

TEST_F(GameTest, RequestsRejectedAfterSolve) {
    ASSERT_EQ(commit(player_b_, "sui", "salt1"), GameStatus::SUCCESS);
    ASSERT_EQ(solve(player_b_, "sui", "salt1").status, GameStatus::SUCCESS);

    Coin payment = wallet_.coin(price());
    EXPECT_EQ(game_->request_reveal(player_a_, 0, payment), GameStatus::ALREADY_SOLVED);
    EXPECT_EQ(payment.value(), price());
    EXPECT_EQ(game_->prize_pool(), 0);
}

TEST_F(GameTest, FulfillmentStillAllowedAfterSolve) {
    ASSERT_EQ(request(player_a_, 2), GameStatus::SUCCESS);
    ASSERT_EQ(commit(player_b_, "sui", "salt1"), GameStatus::SUCCESS);
    ASSERT_EQ(solve(player_b_, "sui", "salt1").status, GameStatus::SUCCESS);

    EXPECT_EQ(game_->fulfill_reveal(*capability_, 2, to_bytes("k2")), GameStatus::SUCCESS);
    EXPECT_EQ(game_->revealed_key(2), to_bytes("k2"));
}

TEST_F(GameTest, RevealedCountTracksFulfillments) {
    for (tile_index_t i = 0; i < 10; ++i) {
        ASSERT_EQ(game_->fulfill_reveal(*capability_, i, to_bytes("k")), GameStatus::SUCCESS);
    }
    EXPECT_EQ(game_->revealed_count(), 10);
}

// ============================================================================
// Commit / solve
// ============================================================================

TEST_F(GameTest, SolveWithoutCommitmentRejected) {
    auto result = solve(player_a_, "sui", "salt1");
    EXPECT_EQ(result.status, GameStatus::NO_COMMITMENT_FOUND);
    EXPECT_FALSE(game_->is_solved());
}

TEST_F(GameTest, CommitmentIsSingleUse) {
    ASSERT_EQ(commit(player_a_, "moon", "s"), GameStatus::SUCCESS);
    EXPECT_EQ(solve(player_a_, "moon", "s").status, GameStatus::INCORRECT_ANSWER);
    EXPECT_EQ(solve(player_a_, "moon", "s").status, GameStatus::NO_COMMITMENT_FOUND);
}

TEST_F(GameTest, CorrectAnswerWithWrongCommitmentRejected) {
    // Commitment opens, but to a different answer than the one revealed
    ASSERT_EQ(commit(player_a_, "moon", "s"), GameStatus::SUCCESS);
    EXPECT_EQ(solve(player_a_, "sui", "s").status, GameStatus::INCORRECT_ANSWER);
    EXPECT_FALSE(game_->is_solved());
}

TEST_F(GameTest, RecommitOverwritesEarlierCommitment) {
    ASSERT_EQ(commit(player_a_, "moon", "s1"), GameStatus::SUCCESS);
    ASSERT_EQ(commit(player_a_, "sui", "s2"), GameStatus::SUCCESS);

    EXPECT_EQ(solve(player_a_, "moon", "s1").status, GameStatus::INCORRECT_ANSWER);
    EXPECT_FALSE(game_->has_commitment(player_a_));
}

TEST_F(GameTest, CommitmentsArePerPlayer) {
    ASSERT_EQ(commit(player_a_, "sui", "a"), GameStatus::SUCCESS);
    EXPECT_EQ(solve(player_b_, "sui", "a").status, GameStatus::NO_COMMITMENT_FOUND);
    EXPECT_TRUE(game_->has_commitment(player_a_));
}

TEST_F(GameTest, SecondSolveAfterWinRejected) {
    ASSERT_EQ(request(player_a_, 0), GameStatus::SUCCESS);
    ASSERT_EQ(commit(player_a_, "sui", "a"), GameStatus::SUCCESS);
    ASSERT_EQ(commit(player_b_, "sui", "b"), GameStatus::SUCCESS);

    ASSERT_EQ(solve(player_a_, "sui", "a").status, GameStatus::SUCCESS);

    auto late = solve(player_b_, "sui", "b");
    EXPECT_EQ(late.status, GameStatus::ALREADY_SOLVED);
    EXPECT_TRUE(late.payout.is_zero());
    EXPECT_EQ(game_->winner(), player_a_);
    EXPECT_EQ(game_->prize_pool(), 0);
    EXPECT_EQ(commit(player_b_, "sui", "c"), GameStatus::ALREADY_SOLVED);
}

TEST_F(GameTest, GameSaltDoesNotAffectCorrectness) {
    // The answer digest is unsalted; whatever game salt is supplied, the
    // right answer wins and nothing else does.
    ASSERT_EQ(commit(player_a_, "sui", "a"), GameStatus::SUCCESS);
    auto result = game_->solve(player_a_, to_bytes("sui"), to_bytes("a"),
                               to_bytes("some-unrelated-game-salt"), timestamp_t{0});
    EXPECT_EQ(result.status, GameStatus::SUCCESS);
}

TEST_F(GameTest, AnswerDigestIsRecoverableOffline) {
    // Anyone can test guesses against the public digest without a commitment
    const hash_t& published = game_->answer_digest();
    std::vector<std::string> dictionary = {"moon", "sun", "sui", "star"};

    std::optional<std::string> found;
    for (const auto& guess : dictionary) {
        if (sha3_256(to_bytes(guess)) == published) {
            found = guess;
        }
    }
    EXPECT_EQ(found, "sui");
}

// ============================================================================
// Freshness policy
// ============================================================================

class GameFreshnessTest : public GameTest {
protected:
    void SetUp() override {
        GameConfig config = test::fast_config();
        config.enforce_reveal_delay = true;
        config.min_reveal_delay = 2s;
        config.max_commitment_age = 60s;
        init(config);
    }
};

TEST_F(GameFreshnessTest, RevealBeforeDelayKeepsCommitment) {
    ASSERT_EQ(commit(player_a_, "sui", "a", timestamp_t{10s}), GameStatus::SUCCESS);

    EXPECT_EQ(solve(player_a_, "sui", "a", timestamp_t{11s}).status,
              GameStatus::COMMITMENT_TOO_FRESH);
    EXPECT_TRUE(game_->has_commitment(player_a_));

    EXPECT_EQ(solve(player_a_, "sui", "a", timestamp_t{12s}).status, GameStatus::SUCCESS);
}

TEST_F(GameFreshnessTest, StaleCommitmentKeptButRejected) {
    ASSERT_EQ(commit(player_a_, "sui", "a", timestamp_t{0}), GameStatus::SUCCESS);

    EXPECT_EQ(solve(player_a_, "sui", "a", timestamp_t{61s}).status,
              GameStatus::COMMITMENT_STALE);
    EXPECT_TRUE(game_->has_commitment(player_a_));

    // A fresh commitment replaces the stale one
    ASSERT_EQ(commit(player_a_, "sui", "a", timestamp_t{70s}), GameStatus::SUCCESS);
    EXPECT_EQ(solve(player_a_, "sui", "a", timestamp_t{75s}).status, GameStatus::SUCCESS);
}

TEST(GameConfigTest, DefaultEnforcesRevealDelay) {
    GameConfig config;
    EXPECT_TRUE(config.enforce_reveal_delay);
    EXPECT_GT(config.min_reveal_delay.count(), 0);
    EXPECT_TRUE(config.validate().empty());
}

TEST(GameConfigTest, InvalidConfigRefusesBootstrap) {
    GameConfig config;
    config.tile_count = 0;
    EXPECT_FALSE(config.validate().empty());
    EXPECT_FALSE(GameSystem::bootstrap(config).has_value());
}

// ============================================================================
// Event delivery
// ============================================================================

TEST_F(GameTest, ListenersRunWithoutGameLockHeld) {
    auto observer = std::make_shared<ObservingListener>();
    observer->watch(game_);
    system_->events()->subscribe(observer);

    ASSERT_EQ(request(player_a_, 0), GameStatus::SUCCESS);
    ASSERT_EQ(commit(player_b_, "sui", "b"), GameStatus::SUCCESS);
    ASSERT_EQ(solve(player_b_, "sui", "b").status, GameStatus::SUCCESS);

    ASSERT_EQ(observer->types.size(), 2);
    EXPECT_EQ(observer->types[0], EventType::TILE_REVEAL_REQUESTED);
    EXPECT_EQ(observer->pools_seen[0], price());
    EXPECT_EQ(observer->types[1], EventType::GAME_SOLVED);
    EXPECT_TRUE(observer->solved_seen[1]);
    EXPECT_EQ(observer->pools_seen[1], 0);
}

TEST_F(GameTest, RejectedOperationsEmitNothing) {
    recorder_->clear();
    EXPECT_EQ(request(player_a_, DEFAULT_TILE_COUNT), GameStatus::INVALID_TILE_INDEX);
    EXPECT_EQ(solve(player_a_, "sui", "a").status, GameStatus::NO_COMMITMENT_FOUND);
    EXPECT_TRUE(recorder_->events().empty());
}

}  // namespace
}  // namespace mosaic
