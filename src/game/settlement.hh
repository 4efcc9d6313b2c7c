#pragma once

#include "core/types.hh"
#include "game/escrow.hh"
#include <optional>

namespace mosaic {

// ============================================================================
// Settlement State
// ============================================================================

// Once `solved` is set it never clears, and `winner` and `payout` are fixed.
struct SettlementState {
    bool solved = false;
    std::optional<Address> winner;
    amount_t payout = 0;
    timestamp_t settled_at{0};

    bool operator==(const SettlementState&) const = default;
};

// ============================================================================
// Settlement Engine
// ============================================================================

class SettlementEngine {
public:
    // Mark the game solved by `winner` and drain the pool into one coin for
    // them. Returns nullopt, changing nothing, if the game is already solved.
    [[nodiscard]] static std::optional<Coin> settle(SettlementState& state,
                                                    PrizePool& pool,
                                                    const Address& winner,
                                                    timestamp_t now);
};

}  // namespace mosaic
