#pragma once

#include "core/types.hh"
#include "game/escrow.hh"
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace mosaic {

// ============================================================================
// Account State
// ============================================================================

struct Account {
    amount_t balance = 0;
    nonce_t nonce = 0;   // Next nonce the account must sign with

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<Account> deserialize(
        std::span<const std::uint8_t> data);

    static constexpr std::size_t SERIALIZED_SIZE = sizeof(amount_t) + sizeof(nonce_t);

    bool operator==(const Account&) const = default;
};

// ============================================================================
// Account Ledger - balances and replay nonces per address
// ============================================================================

// The only place coins enter or leave circulation. Coins withdrawn from an
// account carry value until deposited into another account or a prize pool.
class AccountLedger {
public:
    AccountLedger() = default;

    AccountLedger(const AccountLedger&) = delete;
    AccountLedger& operator=(const AccountLedger&) = delete;

    // Genesis funding. Returns false if the balance would overflow.
    bool credit(const Address& addr, amount_t amount);

    // Take `amount` out of the account as a coin; nullopt if the balance is short
    [[nodiscard]] std::optional<Coin> withdraw(const Address& addr, amount_t amount);

    // Put a coin's whole value into the account; the coin is left empty.
    // Returns false, leaving the coin intact, if the balance would overflow.
    [[nodiscard]] bool deposit(const Address& addr, Coin& coin);

    enum class TransferResult {
        SUCCESS,
        INSUFFICIENT_BALANCE,
        SENDER_NOT_FOUND,
    };
    TransferResult transfer(const Address& from, const Address& to, amount_t amount);

    // Atomically check that `nonce` is the account's next nonce and advance it
    [[nodiscard]] bool consume_nonce(const Address& addr, nonce_t nonce);

    [[nodiscard]] amount_t balance(const Address& addr) const;
    [[nodiscard]] nonce_t nonce(const Address& addr) const;
    [[nodiscard]] std::optional<Account> get_account(const Address& addr) const;

    [[nodiscard]] std::size_t account_count() const;

    // Sum of all balances; coins in flight or held in pools are not counted
    [[nodiscard]] amount_t total_balance() const;

private:
    std::unordered_map<Address, Account> accounts_;
    mutable std::mutex mutex_;
};

}  // namespace mosaic
