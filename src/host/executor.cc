#include "executor.hh"
#include "core/logging.hh"

namespace mosaic {

GameHost::GameHost(GameSystem::Genesis genesis, const Address& capability_owner, Clock clock)
    : system_(std::move(genesis.system))
    , clock_(std::move(clock)) {
    vault_.emplace(capability_owner, std::move(genesis.capability));
    MOSAIC_LOG_INFO(log::host) << "Oracle capability held for "
                               << capability_owner.to_hex().substr(0, 16);
}

ExecutionReceipt GameHost::execute(const SignedCall& call) {
    std::lock_guard<std::mutex> lock(mutex_);

    ExecutionReceipt receipt;
    receipt.kind = call.kind;
    receipt.call_hash = call.signing_hash();
    receipt.sender = call.sender_address();

    if (!call.verify_signature()) {
        MOSAIC_LOG_WARN(log::host) << "Rejected " << call_kind_string(call.kind)
                                   << ": bad signature";
        receipt.status = GameStatus::INVALID_SIGNATURE;
        return receipt;
    }

    if (!accounts_.consume_nonce(receipt.sender, call.nonce)) {
        receipt.status = GameStatus::INVALID_NONCE;
        return receipt;
    }

    timestamp_t now = clock_();

    switch (call.kind) {
        case CallKind::CREATE_GAME:
            receipt.status = create_game(call, receipt.sender, receipt);
            break;
        case CallKind::REQUEST_REVEAL:
            receipt.status = request_reveal(call, receipt.sender);
            break;
        case CallKind::COMMIT_GUESS:
            receipt.status = commit_guess(call, receipt.sender, now);
            break;
        case CallKind::SOLVE:
            receipt.status = solve(call, receipt.sender, now, receipt);
            break;
        case CallKind::FULFILL_REVEAL:
            receipt.status = fulfill_reveal(call, receipt.sender);
            break;
        case CallKind::TRANSFER_CAPABILITY:
            receipt.status = transfer_capability(call, receipt.sender);
            break;
        default:
            receipt.status = GameStatus::MALFORMED_CALL;
            break;
    }

    MOSAIC_LOG_DEBUG(log::host) << call_kind_string(call.kind) << " from "
                                << receipt.sender.to_hex().substr(0, 16) << " nonce "
                                << call.nonce << ": " << game_status_string(receipt.status);
    return receipt;
}

GameStatus GameHost::create_game(const SignedCall& call, const Address& sender,
                                 ExecutionReceipt& receipt) {
    auto setup = GameSetup::deserialize(call.args);
    if (!setup) {
        return GameStatus::MALFORMED_CALL;
    }

    auto result = system_->create_game(sender, std::move(*setup));
    if (result.status == GameStatus::SUCCESS) {
        receipt.created = result.game->id();
    }
    return result.status;
}

GameStatus GameHost::request_reveal(const SignedCall& call, const Address& sender) {
    auto args = RequestRevealArgs::deserialize(call.args);
    if (!args) {
        return GameStatus::MALFORMED_CALL;
    }

    auto game = system_->find_game(call.game_id);
    if (!game) {
        return GameStatus::GAME_NOT_FOUND;
    }

    // Calls run one at a time under mutex_, so the game cannot be solved
    // between this check and the request below
    if (game->is_solved()) {
        return GameStatus::ALREADY_SOLVED;
    }

    auto payment = accounts_.withdraw(sender, args->payment);
    if (!payment) {
        return GameStatus::INSUFFICIENT_BALANCE;
    }

    GameStatus status = game->request_reveal(sender, args->tile_index, *payment);

    // A rejected request leaves the coin intact; hand it back
    if (!accounts_.deposit(sender, *payment)) {
        MOSAIC_LOG_ERROR(log::host) << "Could not refund " << payment->value() << " to "
                                    << sender.to_hex().substr(0, 16);
    }
    return status;
}

GameStatus GameHost::commit_guess(const SignedCall& call, const Address& sender,
                                  timestamp_t now) {
    auto args = CommitGuessArgs::deserialize(call.args);
    if (!args) {
        return GameStatus::MALFORMED_CALL;
    }

    auto game = system_->find_game(call.game_id);
    if (!game) {
        return GameStatus::GAME_NOT_FOUND;
    }
    return game->commit_guess(sender, args->digest, now);
}

GameStatus GameHost::solve(const SignedCall& call, const Address& sender, timestamp_t now,
                           ExecutionReceipt& receipt) {
    auto args = SolveArgs::deserialize(call.args);
    if (!args) {
        return GameStatus::MALFORMED_CALL;
    }

    auto game = system_->find_game(call.game_id);
    if (!game) {
        return GameStatus::GAME_NOT_FOUND;
    }

    SolveResult result = game->solve(sender, args->answer, args->player_salt,
                                     args->game_salt, now);
    receipt.payout = result.payout.value();
    if (!accounts_.deposit(sender, result.payout)) {
        MOSAIC_LOG_ERROR(log::host) << "Payout of " << result.payout.value()
                                    << " does not fit the balance of "
                                    << sender.to_hex().substr(0, 16);
    }
    return result.status;
}

GameStatus GameHost::fulfill_reveal(const SignedCall& call, const Address& sender) {
    auto args = FulfillRevealArgs::deserialize(call.args);
    if (!args) {
        return GameStatus::MALFORMED_CALL;
    }

    auto it = vault_.find(sender);
    if (it == vault_.end()) {
        MOSAIC_LOG_WARN(log::host) << "fulfill_reveal from " << sender.to_hex().substr(0, 16)
                                   << " who holds no capability";
        return GameStatus::UNAUTHORIZED;
    }

    auto game = system_->find_game(call.game_id);
    if (!game) {
        return GameStatus::GAME_NOT_FOUND;
    }
    return game->fulfill_reveal(it->second, args->tile_index, std::move(args->key));
}

GameStatus GameHost::transfer_capability(const SignedCall& call, const Address& sender) {
    auto args = TransferCapabilityArgs::deserialize(call.args);
    if (!args || args->recipient.is_zero()) {
        return GameStatus::MALFORMED_CALL;
    }

    auto it = vault_.find(sender);
    if (it == vault_.end()) {
        return GameStatus::UNAUTHORIZED;
    }
    if (args->recipient == sender) {
        return GameStatus::SUCCESS;
    }

    OracleCapability capability = std::move(it->second);
    vault_.erase(it);
    vault_.emplace(args->recipient, std::move(capability));

    MOSAIC_LOG_INFO(log::host) << "Oracle capability moved from "
                               << sender.to_hex().substr(0, 16) << " to "
                               << args->recipient.to_hex().substr(0, 16);
    return GameStatus::SUCCESS;
}

std::optional<Address> GameHost::capability_owner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (vault_.empty()) {
        return std::nullopt;
    }
    return vault_.begin()->first;
}

void GameHost::set_clock(Clock clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = std::move(clock);
}

}  // namespace mosaic
