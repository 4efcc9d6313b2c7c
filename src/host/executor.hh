#pragma once

#include "core/types.hh"
#include "game/capability.hh"
#include "game/registry.hh"
#include "host/call.hh"
#include "state/accounts.hh"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace mosaic {

// ============================================================================
// Execution Receipt
// ============================================================================

struct ExecutionReceipt {
    GameStatus status = GameStatus::SUCCESS;
    CallKind kind = CallKind::CREATE_GAME;
    hash_t call_hash{};              // SignedCall::signing_hash()
    Address sender;
    std::optional<GameId> created;   // CREATE_GAME only
    amount_t payout = 0;             // SOLVE only

    [[nodiscard]] bool ok() const { return status == GameStatus::SUCCESS; }
};

// ============================================================================
// Game Host - signed transaction boundary around a GameSystem
// ============================================================================

// Executes signed calls one at a time. Each call moves value between the
// account ledger and game pools, and the oracle capability is held in a
// vault on behalf of its owner's address.
class GameHost {
public:
    using Clock = std::function<timestamp_t()>;

    GameHost(GameSystem::Genesis genesis, const Address& capability_owner,
             Clock clock = system_now);

    GameHost(const GameHost&) = delete;
    GameHost& operator=(const GameHost&) = delete;

    // Order of checks: signature, nonce, argument decoding, then the call.
    // A call that fails the signature check does not consume a nonce.
    ExecutionReceipt execute(const SignedCall& call);

    [[nodiscard]] AccountLedger& accounts() { return accounts_; }
    [[nodiscard]] const AccountLedger& accounts() const { return accounts_; }
    [[nodiscard]] GameSystem& system() { return *system_; }

    [[nodiscard]] std::optional<Address> capability_owner() const;

    void set_clock(Clock clock);

private:
    GameStatus create_game(const SignedCall& call, const Address& sender,
                           ExecutionReceipt& receipt);
    GameStatus request_reveal(const SignedCall& call, const Address& sender);
    GameStatus commit_guess(const SignedCall& call, const Address& sender, timestamp_t now);
    GameStatus solve(const SignedCall& call, const Address& sender, timestamp_t now,
                     ExecutionReceipt& receipt);
    GameStatus fulfill_reveal(const SignedCall& call, const Address& sender);
    GameStatus transfer_capability(const SignedCall& call, const Address& sender);

    std::unique_ptr<GameSystem> system_;
    AccountLedger accounts_;
    std::unordered_map<Address, OracleCapability> vault_;
    Clock clock_;
    mutable std::mutex mutex_;
};

}  // namespace mosaic
