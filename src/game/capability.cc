#include "capability.hh"

namespace mosaic {

bool OracleCapability::authorizes(const hash_t& capability_id) const {
    // Constant-time comparison
    std::uint8_t diff = 0;
    for (std::size_t i = 0; i < HASH_SIZE; ++i) {
        diff |= static_cast<std::uint8_t>(id_[i] ^ capability_id[i]);
    }
    return diff == 0;
}

}  // namespace mosaic
