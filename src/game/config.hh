#pragma once

#include "core/types.hh"
#include "crypto/hash.hh"
#include <string>

namespace mosaic {

// ============================================================================
// Game Configuration
// ============================================================================

// Economic and protocol policy for every game created by one GameSystem.
struct GameConfig {
    std::uint32_t tile_count = DEFAULT_TILE_COUNT;
    amount_t tile_price = DEFAULT_TILE_PRICE;

    // Minimum time between a player's commit and their reveal. Blocks a
    // commit and reveal from landing in the same ordering batch.
    bool enforce_reveal_delay = true;
    timestamp_t min_reveal_delay{DEFAULT_MIN_REVEAL_DELAY_US};

    // Zero means commitments never go stale
    timestamp_t max_commitment_age{0};

    HashAlgorithm hash_algorithm = HashAlgorithm::SHA3_256;

    // Empty when valid, otherwise a description of the first problem
    [[nodiscard]] std::string validate() const;

    // Settings of the deployed reference game: Keccak-256 digests (as
    // produced by ethers.keccak256) and no reveal delay.
    [[nodiscard]] static GameConfig reference();
};

}  // namespace mosaic
