#include "config.hh"

namespace mosaic {

std::string GameConfig::validate() const {
    if (tile_count == 0) {
        return "tile_count must be positive";
    }
    if (tile_count > MAX_TILE_COUNT) {
        return "tile_count exceeds " + std::to_string(MAX_TILE_COUNT);
    }
    if (tile_price == 0) {
        return "tile_price must be positive";
    }
    if (min_reveal_delay.count() < 0 || max_commitment_age.count() < 0) {
        return "delays must not be negative";
    }
    if (max_commitment_age.count() > 0 && enforce_reveal_delay &&
        max_commitment_age <= min_reveal_delay) {
        return "max_commitment_age must exceed min_reveal_delay";
    }
    return {};
}

GameConfig GameConfig::reference() {
    GameConfig config;
    config.enforce_reveal_delay = false;
    config.min_reveal_delay = timestamp_t{0};
    config.hash_algorithm = HashAlgorithm::KECCAK_256;
    return config;
}

}  // namespace mosaic
