#pragma once

#include "core/types.hh"

namespace mosaic {

class GameSystem;

// ============================================================================
// Oracle Capability
// ============================================================================

// Sole credential for publishing decrypted tile keys. Minted exactly once by
// GameSystem::bootstrap; it cannot be constructed or copied elsewhere, so
// ownership changes only by moving the object. The id binds the capability
// to the system that minted it.
class OracleCapability {
public:
    ~OracleCapability() = default;

    OracleCapability(const OracleCapability&) = delete;
    OracleCapability& operator=(const OracleCapability&) = delete;
    OracleCapability(OracleCapability&& other) noexcept = default;
    OracleCapability& operator=(OracleCapability&& other) noexcept = default;

    [[nodiscard]] const hash_t& id() const { return id_; }

    // True if this is the credential a game bound to `capability_id` accepts
    [[nodiscard]] bool authorizes(const hash_t& capability_id) const;

private:
    explicit OracleCapability(const hash_t& id) : id_(id) {}

    hash_t id_;

    friend class GameSystem;
};

}  // namespace mosaic
