#pragma once

#include "core/types.hh"
#include "crypto/hash.hh"
#include "game/config.hh"
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace mosaic {

// ============================================================================
// Hash Commitment
// ============================================================================

// Proof that a claim was fixed before it was revealed. By convention the
// digest is H(answer || player_salt) with no separator between the parts.
struct HashCommitment {
    hash_t digest{};
    timestamp_t committed_at{0};

    // Recompute H(answer || salt) and compare with the committed digest
    [[nodiscard]] bool opens_to(HashAlgorithm algorithm,
                                std::span<const std::uint8_t> answer,
                                std::span<const std::uint8_t> salt) const;

    bool operator==(const HashCommitment&) const = default;
};

// Digest a player commits to before revealing `answer`
[[nodiscard]] hash_t commitment_digest(HashAlgorithm algorithm,
                                       std::span<const std::uint8_t> answer,
                                       std::span<const std::uint8_t> salt);

// ============================================================================
// Freshness
// ============================================================================

enum class CommitmentAge : std::uint8_t {
    READY = 0,
    TOO_FRESH = 1,
    STALE = 2,
};

// Pure comparison against the supplied clock reading. A clock that reads
// earlier than the commitment counts as zero elapsed time.
[[nodiscard]] CommitmentAge classify_commitment_age(const HashCommitment& commitment,
                                                    timestamp_t now,
                                                    const GameConfig& config);

// ============================================================================
// Commitment Book - pending commitments keyed by player
// ============================================================================

// Not synchronized; owned by a Game and accessed under its lock.
class CommitmentBook {
public:
    // Store a commitment, replacing any earlier one from the same player
    void put(const Address& player, const HashCommitment& commitment);

    [[nodiscard]] std::optional<HashCommitment> find(const Address& player) const;

    // Drop the player's commitment, if any
    void remove(const Address& player);

    [[nodiscard]] bool contains(const Address& player) const;
    [[nodiscard]] std::size_t size() const { return pending_.size(); }

    // All entries sorted by address, for deterministic snapshots
    [[nodiscard]] std::vector<std::pair<Address, HashCommitment>> sorted_entries() const;

private:
    std::unordered_map<Address, HashCommitment> pending_;
};

}  // namespace mosaic
