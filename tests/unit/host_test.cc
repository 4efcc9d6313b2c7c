#include <gtest/gtest.h>
#include "host/executor.hh"
#include "crypto/signature.hh"
#include "test_util.hh"

namespace mosaic {
namespace {

using namespace std::chrono_literals;

constexpr amount_t FUNDS = 100'000;

class HostTest : public ::testing::Test {
protected:
    void SetUp() override {
        creator_ = MLDSAKeyPair::generate();
        player_ = MLDSAKeyPair::generate();
        oracle_ = MLDSAKeyPair::generate();
        ASSERT_TRUE(creator_ && player_ && oracle_);

        GameConfig config = test::fast_config(8);
        config.enforce_reveal_delay = true;
        config.min_reveal_delay = 2s;
        config_ = config;

        auto genesis = GameSystem::bootstrap(config);
        ASSERT_TRUE(genesis.has_value());
        host_ = std::make_unique<GameHost>(std::move(*genesis), oracle_->address(),
                                           [this] { return now_; });

        ASSERT_TRUE(host_->accounts().credit(player_->address(), FUNDS));
    }

    SignedCall sign(const MLDSAKeyPair& keys, CallKind kind, const GameId& game,
                    std::vector<std::uint8_t> args) {
        nonce_t nonce = host_->accounts().nonce(keys.address());
        auto call = sign_call(keys, kind, game, std::move(args), nonce);
        EXPECT_TRUE(call.has_value());
        return call ? *call : SignedCall{};
    }

    ExecutionReceipt run(const MLDSAKeyPair& keys, CallKind kind, const GameId& game,
                         std::vector<std::uint8_t> args) {
        return host_->execute(sign(keys, kind, game, std::move(args)));
    }

    GameId create_game() {
        auto receipt = run(*creator_, CallKind::CREATE_GAME, GameId{},
                           test::make_setup(config_, "sui").serialize());
        EXPECT_EQ(receipt.status, GameStatus::SUCCESS);
        EXPECT_TRUE(receipt.created.has_value());
        return receipt.created.value_or(GameId{});
    }

    ExecutionReceipt request(const GameId& game, tile_index_t tile, amount_t payment) {
        return run(*player_, CallKind::REQUEST_REVEAL, game,
                   RequestRevealArgs{tile, payment}.serialize());
    }

    ExecutionReceipt commit(const GameId& game, std::string_view answer, std::string_view salt) {
        return run(*player_, CallKind::COMMIT_GUESS, game,
                   CommitGuessArgs{test::commit_for(config_, answer, salt)}.serialize());
    }

    ExecutionReceipt solve(const GameId& game, std::string_view answer, std::string_view salt) {
        return run(*player_, CallKind::SOLVE, game,
                   SolveArgs{to_bytes(answer), to_bytes(salt), to_bytes("game-salt")}.serialize());
    }

    std::optional<MLDSAKeyPair> creator_;
    std::optional<MLDSAKeyPair> player_;
    std::optional<MLDSAKeyPair> oracle_;
    GameConfig config_;
    timestamp_t now_{100s};
    std::unique_ptr<GameHost> host_;
};

// ============================================================================
// Full game through signed calls
// ============================================================================

TEST_F(HostTest, FullGameMovesValueToWinner) {
    GameId game_id = create_game();
    auto game = host_->system().find_game(game_id);
    ASSERT_NE(game, nullptr);
    EXPECT_EQ(game->creator(), creator_->address());

    amount_t price = config_.tile_price;
    EXPECT_TRUE(request(game_id, 0, price).ok());
    EXPECT_TRUE(request(game_id, 1, price).ok());
    EXPECT_EQ(host_->accounts().balance(player_->address()), FUNDS - 2 * price);
    EXPECT_EQ(game->prize_pool(), 2 * price);

    auto fulfilled = run(*oracle_, CallKind::FULFILL_REVEAL, game_id,
                         FulfillRevealArgs{0, to_bytes("k0")}.serialize());
    EXPECT_TRUE(fulfilled.ok());
    EXPECT_EQ(game->revealed_key(0), to_bytes("k0"));

    ASSERT_TRUE(commit(game_id, "sui", "salt1").ok());
    now_ += 5s;
    auto solved = solve(game_id, "sui", "salt1");

    EXPECT_TRUE(solved.ok());
    EXPECT_EQ(solved.payout, 2 * price);
    EXPECT_EQ(host_->accounts().balance(player_->address()), FUNDS);
    EXPECT_EQ(game->winner(), player_->address());
    EXPECT_EQ(game->prize_pool(), 0);
}

TEST_F(HostTest, InjectedClockDrivesRevealDelay) {
    GameId game_id = create_game();
    ASSERT_TRUE(commit(game_id, "sui", "salt1").ok());

    now_ += 1s;
    EXPECT_EQ(solve(game_id, "sui", "salt1").status, GameStatus::COMMITMENT_TOO_FRESH);

    host_->set_clock([] { return timestamp_t{1000s}; });
    EXPECT_TRUE(solve(game_id, "sui", "salt1").ok());
}

TEST_F(HostTest, WrongAnswerPaysNothing) {
    GameId game_id = create_game();
    ASSERT_TRUE(request(game_id, 0, config_.tile_price).ok());
    ASSERT_TRUE(commit(game_id, "moon", "salt1").ok());
    now_ += 5s;

    auto receipt = solve(game_id, "moon", "salt1");
    EXPECT_EQ(receipt.status, GameStatus::INCORRECT_ANSWER);
    EXPECT_EQ(receipt.payout, 0);
    EXPECT_EQ(host_->accounts().balance(player_->address()), FUNDS - config_.tile_price);
}

// ============================================================================
// Payments
// ============================================================================

TEST_F(HostTest, RejectedRequestRefundsPayment) {
    GameId game_id = create_game();

    EXPECT_EQ(request(game_id, 0, config_.tile_price + 1).status, GameStatus::INVALID_PAYMENT);
    EXPECT_EQ(request(game_id, 8, config_.tile_price).status, GameStatus::INVALID_TILE_INDEX);
    EXPECT_EQ(host_->accounts().balance(player_->address()), FUNDS);
}

TEST_F(HostTest, InsufficientBalanceRejected) {
    GameId game_id = create_game();
    EXPECT_EQ(request(game_id, 0, FUNDS + 1).status, GameStatus::INSUFFICIENT_BALANCE);
    EXPECT_EQ(host_->accounts().balance(player_->address()), FUNDS);
}

TEST_F(HostTest, SolvedGameRejectsRequestBeforeCharging) {
    GameId game_id = create_game();
    ASSERT_TRUE(commit(game_id, "sui", "salt1").ok());
    now_ += 5s;
    ASSERT_TRUE(solve(game_id, "sui", "salt1").ok());

    EXPECT_EQ(request(game_id, 0, FUNDS + 1).status, GameStatus::ALREADY_SOLVED);
    EXPECT_EQ(request(game_id, 0, config_.tile_price).status, GameStatus::ALREADY_SOLVED);
    EXPECT_EQ(host_->accounts().balance(player_->address()), FUNDS);
    EXPECT_EQ(host_->system().find_game(game_id)->prize_pool(), 0);
}

TEST_F(HostTest, UnknownGameRejected) {
    GameId missing;
    missing.bytes.fill(0xEE);
    EXPECT_EQ(request(missing, 0, config_.tile_price).status, GameStatus::GAME_NOT_FOUND);
    EXPECT_EQ(host_->accounts().balance(player_->address()), FUNDS);
}

// ============================================================================
// Signatures and nonces
// ============================================================================

TEST_F(HostTest, TamperedCallRejectedWithoutConsumingNonce) {
    GameId game_id = create_game();
    SignedCall call = sign(*player_, CallKind::REQUEST_REVEAL, game_id,
                           RequestRevealArgs{0, config_.tile_price}.serialize());
    call.args = RequestRevealArgs{1, config_.tile_price}.serialize();

    EXPECT_EQ(host_->execute(call).status, GameStatus::INVALID_SIGNATURE);
    EXPECT_EQ(host_->accounts().nonce(player_->address()), 0);
    EXPECT_EQ(host_->accounts().balance(player_->address()), FUNDS);
}

TEST_F(HostTest, ReplayedCallRejected) {
    GameId game_id = create_game();
    SignedCall call = sign(*player_, CallKind::REQUEST_REVEAL, game_id,
                           RequestRevealArgs{0, config_.tile_price}.serialize());

    EXPECT_TRUE(host_->execute(call).ok());
    EXPECT_EQ(host_->execute(call).status, GameStatus::INVALID_NONCE);
    EXPECT_EQ(host_->accounts().balance(player_->address()), FUNDS - config_.tile_price);
}

TEST_F(HostTest, FutureNonceRejected) {
    GameId game_id = create_game();
    auto call = sign_call(*player_, CallKind::COMMIT_GUESS, game_id,
                          CommitGuessArgs{}.serialize(), 5);
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(host_->execute(*call).status, GameStatus::INVALID_NONCE);
}

TEST_F(HostTest, MalformedArgsConsumeNonce) {
    GameId game_id = create_game();
    auto receipt = run(*player_, CallKind::REQUEST_REVEAL, game_id, {0x01, 0x02, 0x03});
    EXPECT_EQ(receipt.status, GameStatus::MALFORMED_CALL);
    EXPECT_EQ(host_->accounts().nonce(player_->address()), 1);
}

TEST_F(HostTest, ReceiptCarriesCallHash) {
    SignedCall call = sign(*creator_, CallKind::CREATE_GAME, GameId{},
                           test::make_setup(config_, "sui").serialize());
    auto receipt = host_->execute(call);
    EXPECT_EQ(receipt.call_hash, call.signing_hash());
    EXPECT_EQ(receipt.sender, creator_->address());
    EXPECT_EQ(receipt.kind, CallKind::CREATE_GAME);
}

TEST_F(HostTest, SerializedCallExecutes) {
    GameId game_id = create_game();
    SignedCall call = sign(*player_, CallKind::REQUEST_REVEAL, game_id,
                           RequestRevealArgs{3, config_.tile_price}.serialize());

    auto decoded = SignedCall::deserialize(call.serialize());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->signing_hash(), call.signing_hash());
    EXPECT_TRUE(host_->execute(*decoded).ok());
}

// ============================================================================
// Oracle capability
// ============================================================================

TEST_F(HostTest, FulfillWithoutCapabilityUnauthorized) {
    GameId game_id = create_game();
    auto receipt = run(*player_, CallKind::FULFILL_REVEAL, game_id,
                       FulfillRevealArgs{0, to_bytes("forged")}.serialize());
    EXPECT_EQ(receipt.status, GameStatus::UNAUTHORIZED);
    EXPECT_FALSE(host_->system().find_game(game_id)->revealed_key(0).has_value());
}

TEST_F(HostTest, CapabilityTransferMovesAuthority) {
    GameId game_id = create_game();
    EXPECT_EQ(host_->capability_owner(), oracle_->address());

    auto moved = run(*oracle_, CallKind::TRANSFER_CAPABILITY, GameId{},
                     TransferCapabilityArgs{player_->address()}.serialize());
    ASSERT_TRUE(moved.ok());
    EXPECT_EQ(host_->capability_owner(), player_->address());

    auto old_owner = run(*oracle_, CallKind::FULFILL_REVEAL, game_id,
                         FulfillRevealArgs{0, to_bytes("k0")}.serialize());
    EXPECT_EQ(old_owner.status, GameStatus::UNAUTHORIZED);

    auto new_owner = run(*player_, CallKind::FULFILL_REVEAL, game_id,
                         FulfillRevealArgs{0, to_bytes("k0")}.serialize());
    EXPECT_TRUE(new_owner.ok());
}

TEST_F(HostTest, CapabilityTransferValidation) {
    auto to_zero = run(*oracle_, CallKind::TRANSFER_CAPABILITY, GameId{},
                       TransferCapabilityArgs{Address{}}.serialize());
    EXPECT_EQ(to_zero.status, GameStatus::MALFORMED_CALL);

    auto not_holder = run(*player_, CallKind::TRANSFER_CAPABILITY, GameId{},
                          TransferCapabilityArgs{creator_->address()}.serialize());
    EXPECT_EQ(not_holder.status, GameStatus::UNAUTHORIZED);

    auto to_self = run(*oracle_, CallKind::TRANSFER_CAPABILITY, GameId{},
                       TransferCapabilityArgs{oracle_->address()}.serialize());
    EXPECT_TRUE(to_self.ok());
    EXPECT_EQ(host_->capability_owner(), oracle_->address());
}

}  // namespace
}  // namespace mosaic
