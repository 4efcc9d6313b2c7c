#include "registry.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include <algorithm>
#include <array>

namespace mosaic {

// ============================================================================
// GameSetup Implementation
// ============================================================================

std::vector<std::uint8_t> GameSetup::serialize() const {
    ByteWriter writer;
    writer.put_hash(answer_digest);
    writer.put_string(manifest_handle);
    writer.put_u32(static_cast<std::uint32_t>(locked_secrets.size()));
    for (const auto& secret : locked_secrets) {
        writer.put_bytes(secret);
    }
    writer.put_u32(static_cast<std::uint32_t>(unlock_refs.size()));
    for (const auto& ref : unlock_refs) {
        writer.put_string(ref);
    }
    return writer.take();
}

std::optional<GameSetup> GameSetup::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    GameSetup setup;

    auto answer = reader.get_hash();
    auto manifest = reader.get_string();
    if (!answer || !manifest) {
        return std::nullopt;
    }
    setup.answer_digest = *answer;
    setup.manifest_handle = std::move(*manifest);

    auto secret_count = reader.get_u32();
    if (!secret_count || *secret_count > MAX_TILE_COUNT) {
        return std::nullopt;
    }
    setup.locked_secrets.reserve(*secret_count);
    for (std::uint32_t i = 0; i < *secret_count; ++i) {
        auto secret = reader.get_bytes();
        if (!secret) {
            return std::nullopt;
        }
        setup.locked_secrets.push_back(std::move(*secret));
    }

    auto ref_count = reader.get_u32();
    if (!ref_count || *ref_count > MAX_TILE_COUNT) {
        return std::nullopt;
    }
    setup.unlock_refs.reserve(*ref_count);
    for (std::uint32_t i = 0; i < *ref_count; ++i) {
        auto ref = reader.get_string();
        if (!ref) {
            return std::nullopt;
        }
        setup.unlock_refs.push_back(std::move(*ref));
    }

    if (!reader.at_end()) {
        return std::nullopt;
    }
    return setup;
}

// ============================================================================
// GameSystem Implementation
// ============================================================================

GameSystem::GameSystem(const GameConfig& config,
                       const hash_t& system_id,
                       const hash_t& capability_id)
    : config_(config)
    , system_id_(system_id)
    , capability_id_(capability_id)
    , bus_(std::make_shared<EventBus>()) {}

std::optional<GameSystem::Genesis> GameSystem::bootstrap(const GameConfig& config) {
    std::string problem = config.validate();
    if (!problem.empty()) {
        MOSAIC_LOG_ERROR(log::game) << "Invalid game config: " << problem;
        return std::nullopt;
    }
    if (!hash_algorithm_available(config.hash_algorithm)) {
        MOSAIC_LOG_ERROR(log::game) << "Hash algorithm "
                                    << hash_algorithm_name(config.hash_algorithm)
                                    << " is not provided by the crypto backend";
        return std::nullopt;
    }

    hash_t system_id = random_hash();
    hash_t capability_id = random_hash();

    MOSAIC_LOG_INFO(log::game) << "Bootstrapped game system "
                               << bytes_to_hex(system_id).substr(0, 16) << " ("
                               << config.tile_count << " tiles at " << config.tile_price
                               << ", " << hash_algorithm_name(config.hash_algorithm) << ")";

    return Genesis{
        std::unique_ptr<GameSystem>(new GameSystem(config, system_id, capability_id)),
        OracleCapability(capability_id),
    };
}

GameId GameSystem::derive_game_id(const Address& creator) {
    std::array<std::uint8_t, 8> counter;
    encode_u64(counter.data(), created_++);

    GameId id;
    id.bytes = digest_concat(HashAlgorithm::SHA3_256,
                             std::span<const std::uint8_t>(system_id_),
                             std::span<const std::uint8_t>(creator.bytes),
                             std::span<const std::uint8_t>(counter));
    return id;
}

CreateGameResult GameSystem::create_game(const Address& creator, GameSetup setup) {
    auto ledger = TileRevealLedger::create(config_.tile_count,
                                           std::move(setup.locked_secrets),
                                           std::move(setup.unlock_refs));
    if (!ledger) {
        MOSAIC_LOG_WARN(log::game) << "Game from " << creator.to_hex().substr(0, 16)
                                   << " rejected: tile vectors must hold "
                                   << config_.tile_count << " entries";
        return {GameStatus::INVALID_PAYMENT, nullptr};
    }

    std::shared_ptr<Game> game;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        GameId id = derive_game_id(creator);
        game.reset(new Game(id, creator, setup.answer_digest, std::move(setup.manifest_handle),
                            capability_id_, std::move(*ledger), config_, bus_));
        games_.emplace(id, game);
    }

    MOSAIC_LOG_INFO(log::game) << "Created game " << game->id().to_hex().substr(0, 16)
                               << " for " << creator.to_hex().substr(0, 16);
    MOSAIC_LOG_WARN(log::game) << "Game " << game->id().to_hex().substr(0, 16)
                               << " checks answers against an unsalted digest; a guessable"
                               << " answer can be recovered offline";

    bus_->publish({GameEvent::game_created(game->id(), creator)});
    return {GameStatus::SUCCESS, std::move(game)};
}

CreateGameResult GameSystem::restore_game(const GameSnapshot& snapshot) {
    if (snapshot.capability_id != capability_id_) {
        MOSAIC_LOG_WARN(log::game) << "Snapshot of game " << snapshot.id.to_hex().substr(0, 16)
                                   << " is bound to another oracle capability";
        return {GameStatus::UNAUTHORIZED, nullptr};
    }

    auto game = Game::restore(snapshot, config_, bus_);
    if (!game) {
        return {GameStatus::MALFORMED_CALL, nullptr};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!games_.emplace(snapshot.id, game).second) {
        MOSAIC_LOG_WARN(log::game) << "Refusing to restore game "
                                   << snapshot.id.to_hex().substr(0, 16)
                                   << " over the registered one";
        return {GameStatus::GAME_ALREADY_EXISTS, nullptr};
    }
    return {GameStatus::SUCCESS, std::move(game)};
}

std::shared_ptr<Game> GameSystem::find_game(const GameId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = games_.find(id);
    if (it == games_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<GameId> GameSystem::game_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GameId> ids;
    ids.reserve(games_.size());
    for (const auto& [id, game] : games_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::size_t GameSystem::game_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return games_.size();
}

}  // namespace mosaic
