#pragma once

#include "core/types.hh"
#include "game/capability.hh"
#include "game/events.hh"
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mosaic {

class GameSystem;

// ============================================================================
// Key Recovery Service Interface
// ============================================================================

struct KeyRecoveryRequest {
    GameId game_id;
    tile_index_t tile_index = 0;
    bytes_t locked_secret;
    std::string unlock_ref;
};

// Recovers a tile's decryption key from its locked secret, e.g. through a
// threshold key server network. Returns nullopt when recovery fails.
class KeyRecoveryService {
public:
    virtual ~KeyRecoveryService() = default;
    [[nodiscard]] virtual std::optional<bytes_t> recover(const KeyRecoveryRequest& request) = 0;
};

// ============================================================================
// Oracle Relay - the unlocking agent
// ============================================================================

struct RelayConfig {
    std::uint32_t max_attempts = 3;
    bool hex_encode_keys = true;   // Publish lowercase hex text of the recovered key
};

struct RelayStats {
    std::size_t fulfilled = 0;
    std::size_t skipped = 0;    // Tile was already revealed
    std::size_t retried = 0;    // Failed, queued again
    std::size_t dropped = 0;    // Gave up or request was unusable
};

// Queues TILE_REVEAL_REQUESTED events and answers them with the oracle
// capability it holds. Work happens only in process_pending(), never inside
// the event callback.
class OracleRelay : public EventListener {
public:
    OracleRelay(GameSystem& system,
                OracleCapability capability,
                std::shared_ptr<KeyRecoveryService> service,
                RelayConfig config = {});

    void on_event(const GameEvent& event) override;

    // Work through the requests queued before this call
    RelayStats process_pending();

    [[nodiscard]] std::size_t pending_count() const;

    [[nodiscard]] bool holds_capability() const;

    // Hand the capability to a new owner; the relay stops fulfilling
    [[nodiscard]] std::optional<OracleCapability> release_capability();

private:
    struct PendingReveal {
        GameId game_id;
        tile_index_t tile_index = 0;
        std::uint32_t attempts = 0;
    };

    enum class Outcome { FULFILLED, SKIPPED, RETRY, DROPPED };

    Outcome handle(PendingReveal& request, const OracleCapability& capability);

    GameSystem& system_;
    std::optional<OracleCapability> capability_;
    std::shared_ptr<KeyRecoveryService> service_;
    RelayConfig config_;

    std::deque<PendingReveal> queue_;
    mutable std::mutex mutex_;               // Guards queue_
    mutable std::mutex capability_mutex_;    // Held for a whole processing pass
};

}  // namespace mosaic
