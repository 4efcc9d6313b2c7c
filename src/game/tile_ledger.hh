#pragma once

#include "core/types.hh"
#include "game/escrow.hh"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mosaic {

// ============================================================================
// Tile State
// ============================================================================

enum class TileState : std::uint8_t {
    LOCKED = 0,      // No reveal requested yet
    REQUESTED = 1,   // Paid for, waiting on the unlocking agent
    REVEALED = 2,    // Decrypted key published (terminal)
};

[[nodiscard]] inline std::string_view tile_state_string(TileState state) {
    switch (state) {
        case TileState::LOCKED: return "locked";
        case TileState::REQUESTED: return "requested";
        case TileState::REVEALED: return "revealed";
    }
    return "unknown";
}

// ============================================================================
// Tile Slot
// ============================================================================

class TileSlot {
public:
    TileSlot(bytes_t locked_secret, std::string unlock_ref);

    [[nodiscard]] TileState state() const { return state_; }
    [[nodiscard]] bool is_revealed() const { return state_ == TileState::REVEALED; }
    [[nodiscard]] const std::optional<bytes_t>& revealed_key() const { return revealed_key_; }
    [[nodiscard]] const bytes_t& locked_secret() const { return locked_secret_; }
    [[nodiscard]] const std::string& unlock_ref() const { return unlock_ref_; }
    [[nodiscard]] std::uint32_t request_count() const { return request_count_; }

    // LOCKED -> REQUESTED; further requests only bump the counter
    void mark_requested();

    // The only way into REVEALED. Returns false, leaving the slot untouched,
    // if a key was already published.
    bool reveal(bytes_t key);

private:
    bytes_t locked_secret_;
    std::string unlock_ref_;
    TileState state_ = TileState::LOCKED;
    std::optional<bytes_t> revealed_key_;
    std::uint32_t request_count_ = 0;

    friend class Game;  // snapshot restore
};

// ============================================================================
// Tile Reveal Ledger
// ============================================================================

// Per-tile reveal state plus the escrowed prize pool. Not synchronized; the
// owning Game serializes access.
class TileRevealLedger {
public:
    // nullopt unless both vectors hold exactly `tile_count` entries
    [[nodiscard]] static std::optional<TileRevealLedger> create(
        std::uint32_t tile_count,
        std::vector<bytes_t> locked_secrets,
        std::vector<std::string> unlock_refs);

    [[nodiscard]] std::uint32_t tile_count() const {
        return static_cast<std::uint32_t>(slots_.size());
    }
    [[nodiscard]] bool valid_index(tile_index_t index) const { return index < slots_.size(); }

    // Precondition: valid_index(index)
    [[nodiscard]] const TileSlot& slot(tile_index_t index) const { return slots_[index]; }

    // Checks price, index and reveal state, in that order. On success the
    // whole payment moves into the pool; on rejection `payment` is untouched.
    [[nodiscard]] GameStatus accept_request(tile_index_t index, Coin& payment, amount_t tile_price);

    // Returns true if the slot moved to REVEALED. Precondition: valid_index(index)
    bool publish_key(tile_index_t index, bytes_t key);

    [[nodiscard]] std::uint32_t revealed_count() const;

    [[nodiscard]] const PrizePool& pool() const { return pool_; }
    [[nodiscard]] PrizePool& pool() { return pool_; }

private:
    TileRevealLedger() = default;

    std::vector<TileSlot> slots_;
    PrizePool pool_;

    friend class Game;  // snapshot restore
};

}  // namespace mosaic
