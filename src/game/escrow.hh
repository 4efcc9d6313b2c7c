#pragma once

#include "core/types.hh"
#include <optional>

namespace mosaic {

class AccountLedger;
class Game;

// ============================================================================
// Coin - move-only unit of value
// ============================================================================

// Value can only be created by the account ledger and only moves between
// holders, never copies. A moved-from coin is worth zero.
class Coin {
public:
    Coin() = default;
    ~Coin() = default;

    Coin(const Coin&) = delete;
    Coin& operator=(const Coin&) = delete;
    Coin(Coin&& other) noexcept;
    Coin& operator=(Coin&& other) noexcept;

    [[nodiscard]] amount_t value() const { return value_; }
    [[nodiscard]] bool is_zero() const { return value_ == 0; }

    // Split off `amount` into a new coin; nullopt if this coin holds less
    [[nodiscard]] std::optional<Coin> split(amount_t amount);

    // Absorb the whole of `other`
    void join(Coin&& other);

private:
    explicit Coin(amount_t value) : value_(value) {}

    amount_t value_ = 0;

    friend class AccountLedger;
    friend class PrizePool;
};

// ============================================================================
// Prize Pool - escrow balance owned by a game
// ============================================================================

class PrizePool {
public:
    PrizePool() = default;

    PrizePool(const PrizePool&) = delete;
    PrizePool& operator=(const PrizePool&) = delete;
    PrizePool(PrizePool&&) noexcept = default;
    PrizePool& operator=(PrizePool&&) noexcept = default;

    [[nodiscard]] amount_t value() const { return balance_.value(); }

    // Merge a payment into the pool; the coin is left empty
    void deposit(Coin& payment);

    // Drain the exact current balance
    [[nodiscard]] Coin withdraw_all();

private:
    // Only a game restoring its own persisted state may recreate a balance
    [[nodiscard]] static PrizePool from_snapshot(amount_t amount);

    Coin balance_;

    friend class Game;
};

}  // namespace mosaic
