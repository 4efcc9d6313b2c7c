#include "commitment.hh"
#include <algorithm>

namespace mosaic {

// ============================================================================
// HashCommitment Implementation
// ============================================================================

hash_t commitment_digest(HashAlgorithm algorithm,
                         std::span<const std::uint8_t> answer,
                         std::span<const std::uint8_t> salt) {
    return digest_concat(algorithm, answer, salt);
}

bool HashCommitment::opens_to(HashAlgorithm algorithm,
                              std::span<const std::uint8_t> answer,
                              std::span<const std::uint8_t> salt) const {
    return commitment_digest(algorithm, answer, salt) == digest;
}

CommitmentAge classify_commitment_age(const HashCommitment& commitment,
                                      timestamp_t now,
                                      const GameConfig& config) {
    timestamp_t elapsed = now > commitment.committed_at
        ? now - commitment.committed_at
        : timestamp_t{0};

    if (config.enforce_reveal_delay && elapsed < config.min_reveal_delay) {
        return CommitmentAge::TOO_FRESH;
    }
    if (config.max_commitment_age.count() > 0 && elapsed > config.max_commitment_age) {
        return CommitmentAge::STALE;
    }
    return CommitmentAge::READY;
}

// ============================================================================
// CommitmentBook Implementation
// ============================================================================

void CommitmentBook::put(const Address& player, const HashCommitment& commitment) {
    pending_[player] = commitment;
}

std::optional<HashCommitment> CommitmentBook::find(const Address& player) const {
    auto it = pending_.find(player);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CommitmentBook::remove(const Address& player) {
    pending_.erase(player);
}

bool CommitmentBook::contains(const Address& player) const {
    return pending_.find(player) != pending_.end();
}

std::vector<std::pair<Address, HashCommitment>> CommitmentBook::sorted_entries() const {
    std::vector<std::pair<Address, HashCommitment>> entries(pending_.begin(), pending_.end());
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return entries;
}

}  // namespace mosaic
