#pragma once

#include "core/types.hh"
#include "game/capability.hh"
#include "game/config.hh"
#include "game/events.hh"
#include "game/game.hh"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mosaic {

// ============================================================================
// Game Setup
// ============================================================================

// Creator-supplied material for a new game
struct GameSetup {
    hash_t answer_digest{};                  // H(answer), unsalted
    std::string manifest_handle;             // Opaque pointer to the image manifest
    std::vector<bytes_t> locked_secrets;     // One ciphertext per tile
    std::vector<std::string> unlock_refs;    // One unlock-condition handle per tile

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<GameSetup> deserialize(std::span<const std::uint8_t> data);
};

struct CreateGameResult {
    GameStatus status = GameStatus::SUCCESS;
    std::shared_ptr<Game> game;   // Set only on SUCCESS
};

// ============================================================================
// Game System - owns every game and the oracle capability binding
// ============================================================================

class GameSystem {
public:
    struct Genesis {
        std::unique_ptr<GameSystem> system;
        OracleCapability capability;
    };

    // Create a system and mint its one oracle capability. Returns nullopt if
    // the config is invalid or its hash algorithm is not available.
    [[nodiscard]] static std::optional<Genesis> bootstrap(const GameConfig& config);

    GameSystem(const GameSystem&) = delete;
    GameSystem& operator=(const GameSystem&) = delete;

    // Vectors in `setup` must hold exactly config().tile_count entries, else
    // INVALID_PAYMENT.
    [[nodiscard]] CreateGameResult create_game(const Address& creator, GameSetup setup);

    // Register a persisted game that this system does not hold. UNAUTHORIZED
    // if it was bound to another system's capability, MALFORMED_CALL if the
    // snapshot is inconsistent or does not fit config(), GAME_ALREADY_EXISTS
    // if its id is already registered.
    [[nodiscard]] CreateGameResult restore_game(const GameSnapshot& snapshot);

    [[nodiscard]] std::shared_ptr<Game> find_game(const GameId& id) const;
    [[nodiscard]] std::vector<GameId> game_ids() const;
    [[nodiscard]] std::size_t game_count() const;

    [[nodiscard]] const GameConfig& config() const { return config_; }
    [[nodiscard]] const hash_t& system_id() const { return system_id_; }
    [[nodiscard]] const std::shared_ptr<EventBus>& events() const { return bus_; }

private:
    GameSystem(const GameConfig& config, const hash_t& system_id, const hash_t& capability_id);

    [[nodiscard]] GameId derive_game_id(const Address& creator);

    const GameConfig config_;
    const hash_t system_id_;
    const hash_t capability_id_;
    std::shared_ptr<EventBus> bus_;

    std::unordered_map<GameId, std::shared_ptr<Game>> games_;
    std::uint64_t created_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace mosaic
