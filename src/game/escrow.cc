#include "escrow.hh"
#include <limits>
#include <stdexcept>

namespace mosaic {

// ============================================================================
// Coin Implementation
// ============================================================================

Coin::Coin(Coin&& other) noexcept : value_(other.value_) {
    other.value_ = 0;
}

Coin& Coin::operator=(Coin&& other) noexcept {
    if (this != &other) {
        value_ = other.value_;
        other.value_ = 0;
    }
    return *this;
}

std::optional<Coin> Coin::split(amount_t amount) {
    if (amount > value_) {
        return std::nullopt;
    }
    value_ -= amount;
    return Coin(amount);
}

void Coin::join(Coin&& other) {
    if (&other == this) {
        return;
    }
    if (other.value_ > std::numeric_limits<amount_t>::max() - value_) {
        throw std::overflow_error("Coin value overflow");
    }
    value_ += other.value_;
    other.value_ = 0;
}

// ============================================================================
// PrizePool Implementation
// ============================================================================

void PrizePool::deposit(Coin& payment) {
    balance_.join(std::move(payment));
}

Coin PrizePool::withdraw_all() {
    return std::move(balance_);
}

PrizePool PrizePool::from_snapshot(amount_t amount) {
    PrizePool pool;
    pool.balance_ = Coin(amount);
    return pool;
}

}  // namespace mosaic
