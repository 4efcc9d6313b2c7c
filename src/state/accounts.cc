#include "accounts.hh"
#include "core/logging.hh"
#include <limits>

namespace mosaic {

// ============================================================================
// Account Implementation
// ============================================================================

std::vector<std::uint8_t> Account::serialize() const {
    std::vector<std::uint8_t> result(SERIALIZED_SIZE);
    std::uint8_t* ptr = result.data();

    encode_u64(ptr, balance);
    ptr += sizeof(amount_t);

    encode_u64(ptr, nonce);

    return result;
}

std::optional<Account> Account::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < SERIALIZED_SIZE) {
        return std::nullopt;
    }

    Account account;
    const std::uint8_t* ptr = data.data();

    account.balance = decode_u64(ptr);
    ptr += sizeof(amount_t);

    account.nonce = decode_u64(ptr);

    return account;
}

// ============================================================================
// AccountLedger Implementation
// ============================================================================

bool AccountLedger::credit(const Address& addr, amount_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& account = accounts_[addr];
    if (amount > std::numeric_limits<amount_t>::max() - account.balance) {
        MOSAIC_LOG_WARN(log::state) << "Credit of " << amount << " would overflow "
                                    << addr.to_hex().substr(0, 16);
        return false;
    }
    account.balance += amount;
    MOSAIC_LOG_TRACE(log::state) << "Credited " << amount << " to " << addr.to_hex().substr(0, 16);
    return true;
}

std::optional<Coin> AccountLedger::withdraw(const Address& addr, amount_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = accounts_.find(addr);
    if (it == accounts_.end() || it->second.balance < amount) {
        MOSAIC_LOG_DEBUG(log::state) << "Withdraw failed: insufficient balance "
                                     << (it == accounts_.end() ? 0 : it->second.balance)
                                     << " < " << amount;
        return std::nullopt;
    }

    it->second.balance -= amount;
    return Coin(amount);
}

bool AccountLedger::deposit(const Address& addr, Coin& coin) {
    if (coin.is_zero()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& account = accounts_[addr];
    if (coin.value_ > std::numeric_limits<amount_t>::max() - account.balance) {
        MOSAIC_LOG_ERROR(log::state) << "Deposit of " << coin.value_ << " would overflow "
                                     << addr.to_hex().substr(0, 16);
        return false;
    }
    account.balance += coin.value_;
    coin.value_ = 0;
    return true;
}

AccountLedger::TransferResult AccountLedger::transfer(
    const Address& from,
    const Address& to,
    amount_t amount) {

    std::lock_guard<std::mutex> lock(mutex_);

    auto from_it = accounts_.find(from);
    if (from_it == accounts_.end()) {
        MOSAIC_LOG_DEBUG(log::state) << "Transfer failed: sender not found";
        return TransferResult::SENDER_NOT_FOUND;
    }

    if (from_it->second.balance < amount) {
        MOSAIC_LOG_DEBUG(log::state) << "Transfer failed: insufficient balance "
                                     << from_it->second.balance << " < " << amount;
        return TransferResult::INSUFFICIENT_BALANCE;
    }

    from_it->second.balance -= amount;
    accounts_[to].balance += amount;

    MOSAIC_LOG_TRACE(log::state) << "Transfer: " << amount << " units";
    return TransferResult::SUCCESS;
}

bool AccountLedger::consume_nonce(const Address& addr, nonce_t nonce) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& account = accounts_[addr];
    if (account.nonce != nonce) {
        MOSAIC_LOG_DEBUG(log::state) << "Nonce mismatch for " << addr.to_hex().substr(0, 16)
                                     << ": expected " << account.nonce << ", got " << nonce;
        return false;
    }
    ++account.nonce;
    return true;
}

amount_t AccountLedger::balance(const Address& addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(addr);
    return it == accounts_.end() ? 0 : it->second.balance;
}

nonce_t AccountLedger::nonce(const Address& addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(addr);
    return it == accounts_.end() ? 0 : it->second.nonce;
}

std::optional<Account> AccountLedger::get_account(const Address& addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(addr);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t AccountLedger::account_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

amount_t AccountLedger::total_balance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    amount_t total = 0;
    for (const auto& [addr, account] : accounts_) {
        total += account.balance;
    }
    return total;
}

}  // namespace mosaic
