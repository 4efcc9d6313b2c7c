#pragma once

#include "core/types.hh"
#include "game/capability.hh"
#include "game/commitment.hh"
#include "game/config.hh"
#include "game/escrow.hh"
#include "game/events.hh"
#include "game/settlement.hh"
#include "game/tile_ledger.hh"
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace mosaic {

class GameSystem;

// ============================================================================
// Game Snapshot - persisted form of a Game
// ============================================================================

struct TileSnapshot {
    bytes_t locked_secret;
    std::string unlock_ref;
    TileState state = TileState::LOCKED;
    std::optional<bytes_t> revealed_key;
    std::uint32_t request_count = 0;

    bool operator==(const TileSnapshot&) const = default;
};

struct CommitmentSnapshot {
    Address player;
    HashCommitment commitment;

    bool operator==(const CommitmentSnapshot&) const = default;
};

struct GameSnapshot {
    static constexpr std::uint8_t VERSION = 1;

    GameId id;
    Address creator;
    hash_t answer_digest{};
    std::string manifest_handle;
    hash_t capability_id{};
    amount_t prize_pool = 0;
    SettlementState settlement;
    std::vector<TileSnapshot> tiles;
    std::vector<CommitmentSnapshot> commitments;   // Sorted by player address

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<GameSnapshot> deserialize(std::span<const std::uint8_t> data);

    // Checks the cross-field rules a live game maintains (solved implies a
    // winner and an empty pool, keys present exactly on revealed tiles)
    [[nodiscard]] bool is_consistent() const;

    // Checks the snapshot against the policy it is restored under: one tile
    // per configured tile, and an unsolved pool holding exactly one tile
    // price per paid request.
    [[nodiscard]] bool fits(const GameConfig& config) const;

    bool operator==(const GameSnapshot&) const = default;
};

// ============================================================================
// Game - one picture puzzle and its prize pool
// ============================================================================

struct SolveResult {
    GameStatus status = GameStatus::SUCCESS;
    Coin payout;   // Non-zero only on SUCCESS
};

// Every entry point runs as a whole under the game's mutex and either
// applies fully or rejects without changing state. Events produced by an
// entry point are published on the bus after the lock is released.
class Game {
public:
    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    // Rebuild a persisted game; nullptr if the snapshot is inconsistent or
    // does not fit `config`
    [[nodiscard]] static std::shared_ptr<Game> restore(const GameSnapshot& snapshot,
                                                       const GameConfig& config,
                                                       std::shared_ptr<EventBus> bus = nullptr);

    // ------------------------------------------------------------------------
    // Tile reveals
    // ------------------------------------------------------------------------

    // Pay exactly the tile price to ask the unlocking agent for a tile key.
    // On success the payment is emptied into the pool; on rejection it is
    // left untouched.
    [[nodiscard]] GameStatus request_reveal(const Address& requester,
                                            tile_index_t index,
                                            Coin& payment);

    // Publish a decrypted tile key. Only the capability this game is bound to
    // is accepted. Publishing to an already revealed tile succeeds without
    // changing anything. Allowed after the game is solved.
    [[nodiscard]] GameStatus fulfill_reveal(const OracleCapability& capability,
                                            tile_index_t index,
                                            bytes_t key);

    // ------------------------------------------------------------------------
    // Commit / reveal of the answer
    // ------------------------------------------------------------------------

    // Record H(answer || player_salt) for the caller, replacing any earlier one
    [[nodiscard]] GameStatus commit_guess(const Address& caller,
                                          const hash_t& commitment_digest,
                                          timestamp_t now);

    // Open the caller's commitment and, if the answer is right, pay out the
    // whole pool. A commitment that passes the freshness check is consumed
    // whether or not the answer turns out right.
    //
    // The correctness check is H(answer) == answer_digest. `game_salt` is
    // accepted but not used, so an unsalted digest of a guessable answer can
    // be brute-forced offline.
    [[nodiscard]] SolveResult solve(const Address& caller,
                                    std::span<const std::uint8_t> answer,
                                    std::span<const std::uint8_t> player_salt,
                                    std::span<const std::uint8_t> game_salt,
                                    timestamp_t now);

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    [[nodiscard]] const GameId& id() const { return id_; }
    [[nodiscard]] const Address& creator() const { return creator_; }
    [[nodiscard]] const hash_t& answer_digest() const { return answer_digest_; }
    [[nodiscard]] const std::string& manifest_handle() const { return manifest_handle_; }
    [[nodiscard]] const GameConfig& config() const { return config_; }

    [[nodiscard]] std::uint32_t tile_count() const;
    [[nodiscard]] bool is_solved() const;
    [[nodiscard]] std::optional<Address> winner() const;
    [[nodiscard]] amount_t prize_pool() const;
    [[nodiscard]] std::uint32_t revealed_count() const;

    // nullopt for an out-of-range index
    [[nodiscard]] std::optional<TileState> tile_state(tile_index_t index) const;
    [[nodiscard]] std::optional<bytes_t> revealed_key(tile_index_t index) const;
    [[nodiscard]] std::optional<bytes_t> locked_secret(tile_index_t index) const;
    [[nodiscard]] std::optional<std::string> unlock_ref(tile_index_t index) const;

    [[nodiscard]] bool has_commitment(const Address& player) const;
    [[nodiscard]] std::optional<HashCommitment> commitment(const Address& player) const;

    [[nodiscard]] GameSnapshot snapshot() const;

private:
    Game(const GameId& id,
         const Address& creator,
         const hash_t& answer_digest,
         std::string manifest_handle,
         const hash_t& capability_id,
         TileRevealLedger ledger,
         const GameConfig& config,
         std::shared_ptr<EventBus> bus);

    void publish(const std::vector<GameEvent>& events) const;

    const GameId id_;
    const Address creator_;
    const hash_t answer_digest_;
    const std::string manifest_handle_;
    const hash_t capability_id_;
    const GameConfig config_;

    TileRevealLedger ledger_;
    CommitmentBook commitments_;
    SettlementState settlement_;

    std::shared_ptr<EventBus> bus_;
    mutable std::mutex mutex_;

    friend class GameSystem;
};

}  // namespace mosaic
