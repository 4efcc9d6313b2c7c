#include "game.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include <algorithm>
#include <limits>

namespace mosaic {

namespace {

std::string short_hex(const hash_t& h) {
    return bytes_to_hex(h).substr(0, 16);
}

}  // namespace

// ============================================================================
// GameSnapshot Implementation
// ============================================================================

std::vector<std::uint8_t> GameSnapshot::serialize() const {
    ByteWriter writer;
    writer.put_u8(VERSION);
    writer.put_hash(id.bytes);
    writer.put_hash(creator.bytes);
    writer.put_hash(answer_digest);
    writer.put_string(manifest_handle);
    writer.put_hash(capability_id);
    writer.put_u64(prize_pool);

    writer.put_u8(settlement.solved ? 1 : 0);
    writer.put_u8(settlement.winner.has_value() ? 1 : 0);
    if (settlement.winner) {
        writer.put_hash(settlement.winner->bytes);
    }
    writer.put_u64(settlement.payout);
    writer.put_u64(static_cast<std::uint64_t>(settlement.settled_at.count()));

    writer.put_u32(static_cast<std::uint32_t>(tiles.size()));
    for (const auto& tile : tiles) {
        writer.put_bytes(tile.locked_secret);
        writer.put_string(tile.unlock_ref);
        writer.put_u8(static_cast<std::uint8_t>(tile.state));
        writer.put_u8(tile.revealed_key.has_value() ? 1 : 0);
        if (tile.revealed_key) {
            writer.put_bytes(*tile.revealed_key);
        }
        writer.put_u32(tile.request_count);
    }

    writer.put_u32(static_cast<std::uint32_t>(commitments.size()));
    for (const auto& entry : commitments) {
        writer.put_hash(entry.player.bytes);
        writer.put_hash(entry.commitment.digest);
        writer.put_u64(static_cast<std::uint64_t>(entry.commitment.committed_at.count()));
    }

    return writer.take();
}

std::optional<GameSnapshot> GameSnapshot::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);

    auto version = reader.get_u8();
    if (!version || *version != VERSION) {
        return std::nullopt;
    }

    GameSnapshot snap;

    auto id = reader.get_hash();
    auto creator = reader.get_hash();
    auto answer = reader.get_hash();
    auto manifest = reader.get_string();
    auto capability = reader.get_hash();
    auto pool = reader.get_u64();
    if (!id || !creator || !answer || !manifest || !capability || !pool) {
        return std::nullopt;
    }
    snap.id.bytes = *id;
    snap.creator.bytes = *creator;
    snap.answer_digest = *answer;
    snap.manifest_handle = std::move(*manifest);
    snap.capability_id = *capability;
    snap.prize_pool = *pool;

    auto solved = reader.get_u8();
    auto has_winner = reader.get_u8();
    if (!solved || !has_winner || *solved > 1 || *has_winner > 1) {
        return std::nullopt;
    }
    snap.settlement.solved = (*solved == 1);
    if (*has_winner == 1) {
        auto winner = reader.get_hash();
        if (!winner) {
            return std::nullopt;
        }
        snap.settlement.winner = Address{*winner};
    }
    auto payout = reader.get_u64();
    auto settled_at = reader.get_u64();
    if (!payout || !settled_at) {
        return std::nullopt;
    }
    snap.settlement.payout = *payout;
    snap.settlement.settled_at = timestamp_t{static_cast<timestamp_t::rep>(*settled_at)};

    auto tile_count = reader.get_u32();
    if (!tile_count || *tile_count == 0 || *tile_count > MAX_TILE_COUNT) {
        return std::nullopt;
    }
    snap.tiles.reserve(*tile_count);
    for (std::uint32_t i = 0; i < *tile_count; ++i) {
        TileSnapshot tile;
        auto secret = reader.get_bytes();
        auto ref = reader.get_string();
        auto state = reader.get_u8();
        auto has_key = reader.get_u8();
        if (!secret || !ref || !state || !has_key ||
            *state > static_cast<std::uint8_t>(TileState::REVEALED) || *has_key > 1) {
            return std::nullopt;
        }
        tile.locked_secret = std::move(*secret);
        tile.unlock_ref = std::move(*ref);
        tile.state = static_cast<TileState>(*state);
        if (*has_key == 1) {
            auto key = reader.get_bytes();
            if (!key) {
                return std::nullopt;
            }
            tile.revealed_key = std::move(*key);
        }
        auto requests = reader.get_u32();
        if (!requests) {
            return std::nullopt;
        }
        tile.request_count = *requests;
        snap.tiles.push_back(std::move(tile));
    }

    auto commit_count = reader.get_u32();
    if (!commit_count || *commit_count > reader.remaining() / (2 * HASH_SIZE + 8)) {
        return std::nullopt;
    }
    snap.commitments.reserve(*commit_count);
    for (std::uint32_t i = 0; i < *commit_count; ++i) {
        auto player = reader.get_hash();
        auto digest = reader.get_hash();
        auto committed_at = reader.get_u64();
        if (!player || !digest || !committed_at) {
            return std::nullopt;
        }
        CommitmentSnapshot entry;
        entry.player.bytes = *player;
        entry.commitment.digest = *digest;
        entry.commitment.committed_at = timestamp_t{static_cast<timestamp_t::rep>(*committed_at)};
        snap.commitments.push_back(entry);
    }

    if (!reader.at_end() || !snap.is_consistent()) {
        return std::nullopt;
    }
    return snap;
}

bool GameSnapshot::is_consistent() const {
    if (tiles.empty() || tiles.size() > MAX_TILE_COUNT) {
        return false;
    }

    for (const auto& tile : tiles) {
        bool revealed = (tile.state == TileState::REVEALED);
        if (revealed != tile.revealed_key.has_value()) {
            return false;
        }
        if (tile.state == TileState::LOCKED && tile.request_count != 0) {
            return false;
        }
        if (tile.state == TileState::REQUESTED && tile.request_count == 0) {
            return false;
        }
    }

    if (settlement.solved) {
        if (!settlement.winner || prize_pool != 0) {
            return false;
        }
    } else if (settlement.winner || settlement.payout != 0) {
        return false;
    }

    for (std::size_t i = 1; i < commitments.size(); ++i) {
        if (!(commitments[i - 1].player < commitments[i].player)) {
            return false;
        }
    }
    return true;
}

bool GameSnapshot::fits(const GameConfig& config) const {
    if (tiles.size() != config.tile_count) {
        return false;
    }
    if (settlement.solved) {
        return prize_pool == 0;
    }

    amount_t expected = 0;
    for (const auto& tile : tiles) {
        if (tile.request_count > 0 &&
            config.tile_price > (std::numeric_limits<amount_t>::max() - expected) /
                                    tile.request_count) {
            return false;
        }
        expected += config.tile_price * tile.request_count;
    }
    return prize_pool == expected;
}

// ============================================================================
// Game Implementation
// ============================================================================

Game::Game(const GameId& id,
           const Address& creator,
           const hash_t& answer_digest,
           std::string manifest_handle,
           const hash_t& capability_id,
           TileRevealLedger ledger,
           const GameConfig& config,
           std::shared_ptr<EventBus> bus)
    : id_(id)
    , creator_(creator)
    , answer_digest_(answer_digest)
    , manifest_handle_(std::move(manifest_handle))
    , capability_id_(capability_id)
    , config_(config)
    , ledger_(std::move(ledger))
    , bus_(std::move(bus)) {}

std::shared_ptr<Game> Game::restore(const GameSnapshot& snapshot,
                                    const GameConfig& config,
                                    std::shared_ptr<EventBus> bus) {
    if (!snapshot.is_consistent()) {
        MOSAIC_LOG_ERROR(log::game) << "Refusing to restore inconsistent snapshot of game "
                                    << short_hex(snapshot.id.bytes);
        return nullptr;
    }
    if (!snapshot.fits(config)) {
        MOSAIC_LOG_ERROR(log::game) << "Snapshot of game " << short_hex(snapshot.id.bytes)
                                    << " does not match the configured tile count and price";
        return nullptr;
    }

    TileRevealLedger ledger;
    ledger.slots_.reserve(snapshot.tiles.size());
    for (const auto& tile : snapshot.tiles) {
        TileSlot slot(tile.locked_secret, tile.unlock_ref);
        slot.state_ = tile.state;
        slot.revealed_key_ = tile.revealed_key;
        slot.request_count_ = tile.request_count;
        ledger.slots_.push_back(std::move(slot));
    }
    ledger.pool_ = PrizePool::from_snapshot(snapshot.prize_pool);

    std::shared_ptr<Game> game(new Game(snapshot.id, snapshot.creator, snapshot.answer_digest,
                                        snapshot.manifest_handle, snapshot.capability_id,
                                        std::move(ledger), config, std::move(bus)));
    for (const auto& entry : snapshot.commitments) {
        game->commitments_.put(entry.player, entry.commitment);
    }
    game->settlement_ = snapshot.settlement;

    MOSAIC_LOG_INFO(log::game) << "Restored game " << short_hex(snapshot.id.bytes)
                               << " (" << snapshot.tiles.size() << " tiles, pool "
                               << snapshot.prize_pool << ")";
    return game;
}

void Game::publish(const std::vector<GameEvent>& events) const {
    if (bus_) {
        bus_->publish(events);
    }
}

// ----------------------------------------------------------------------------
// Tile reveals
// ----------------------------------------------------------------------------

GameStatus Game::request_reveal(const Address& requester, tile_index_t index, Coin& payment) {
    std::vector<GameEvent> events;
    GameStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (settlement_.solved) {
            status = GameStatus::ALREADY_SOLVED;
        } else {
            status = ledger_.accept_request(index, payment, config_.tile_price);
        }
        if (status == GameStatus::SUCCESS) {
            events.push_back(GameEvent::reveal_requested(id_, index, requester));
        }
    }

    if (status == GameStatus::SUCCESS) {
        MOSAIC_LOG_DEBUG(log::ledger) << "Tile " << index << " of game " << short_hex(id_.bytes)
                                      << " requested by " << short_hex(requester.bytes);
    } else {
        MOSAIC_LOG_DEBUG(log::ledger) << "Reveal request for tile " << index << " rejected: "
                                      << game_status_string(status);
    }

    publish(events);
    return status;
}

GameStatus Game::fulfill_reveal(const OracleCapability& capability,
                                tile_index_t index,
                                bytes_t key) {
    if (!capability.authorizes(capability_id_)) {
        MOSAIC_LOG_WARN(log::ledger) << "Unauthorized fulfillment attempt on game "
                                     << short_hex(id_.bytes);
        return GameStatus::UNAUTHORIZED;
    }

    std::vector<GameEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ledger_.valid_index(index)) {
            return GameStatus::INVALID_TILE_INDEX;
        }
        if (ledger_.publish_key(index, key)) {
            events.push_back(GameEvent::tile_revealed(id_, index, std::move(key)));
        }
    }

    if (events.empty()) {
        MOSAIC_LOG_DEBUG(log::ledger) << "Tile " << index << " already revealed, ignoring key";
    } else {
        MOSAIC_LOG_INFO(log::ledger) << "Tile " << index << " of game " << short_hex(id_.bytes)
                                     << " revealed";
    }

    publish(events);
    return GameStatus::SUCCESS;
}

// ----------------------------------------------------------------------------
// Commit / reveal
// ----------------------------------------------------------------------------

GameStatus Game::commit_guess(const Address& caller,
                              const hash_t& commitment_digest,
                              timestamp_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (settlement_.solved) {
        return GameStatus::ALREADY_SOLVED;
    }

    commitments_.put(caller, HashCommitment{commitment_digest, now});
    MOSAIC_LOG_DEBUG(log::commit) << "Commitment " << short_hex(commitment_digest)
                                  << " stored for " << short_hex(caller.bytes);
    return GameStatus::SUCCESS;
}

SolveResult Game::solve(const Address& caller,
                        std::span<const std::uint8_t> answer,
                        std::span<const std::uint8_t> player_salt,
                        std::span<const std::uint8_t> /*game_salt*/,
                        timestamp_t now) {
    std::vector<GameEvent> events;
    SolveResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (settlement_.solved) {
            result.status = GameStatus::ALREADY_SOLVED;
            return result;
        }

        auto pending = commitments_.find(caller);
        if (!pending) {
            result.status = GameStatus::NO_COMMITMENT_FOUND;
            return result;
        }

        switch (classify_commitment_age(*pending, now, config_)) {
            case CommitmentAge::TOO_FRESH:
                MOSAIC_LOG_DEBUG(log::commit) << "Reveal from " << short_hex(caller.bytes)
                                              << " before the minimum delay";
                result.status = GameStatus::COMMITMENT_TOO_FRESH;
                return result;
            case CommitmentAge::STALE:
                MOSAIC_LOG_DEBUG(log::commit) << "Commitment from " << short_hex(caller.bytes)
                                              << " is stale";
                result.status = GameStatus::COMMITMENT_STALE;
                return result;
            case CommitmentAge::READY:
                break;
        }

        // Single-use from here on, whatever the outcome
        commitments_.remove(caller);

        if (!pending->opens_to(config_.hash_algorithm, answer, player_salt)) {
            MOSAIC_LOG_DEBUG(log::commit) << "Commitment from " << short_hex(caller.bytes)
                                          << " does not open to the revealed answer";
            result.status = GameStatus::INCORRECT_ANSWER;
            return result;
        }

        if (digest(config_.hash_algorithm, answer) != answer_digest_) {
            MOSAIC_LOG_DEBUG(log::commit) << "Wrong answer from " << short_hex(caller.bytes);
            result.status = GameStatus::INCORRECT_ANSWER;
            return result;
        }

        auto payout = SettlementEngine::settle(settlement_, ledger_.pool(), caller, now);
        if (!payout) {
            result.status = GameStatus::ALREADY_SOLVED;
            return result;
        }
        result.payout = std::move(*payout);
        events.push_back(GameEvent::game_solved(id_, caller, result.payout.value()));
    }

    MOSAIC_LOG_INFO(log::game) << "Game " << short_hex(id_.bytes) << " solved by "
                               << short_hex(caller.bytes);
    publish(events);
    return result;
}

// ----------------------------------------------------------------------------
// Queries
// ----------------------------------------------------------------------------

std::uint32_t Game::tile_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.tile_count();
}

bool Game::is_solved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settlement_.solved;
}

std::optional<Address> Game::winner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settlement_.winner;
}

amount_t Game::prize_pool() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.pool().value();
}

std::uint32_t Game::revealed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.revealed_count();
}

std::optional<TileState> Game::tile_state(tile_index_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ledger_.valid_index(index)) {
        return std::nullopt;
    }
    return ledger_.slot(index).state();
}

std::optional<bytes_t> Game::revealed_key(tile_index_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ledger_.valid_index(index)) {
        return std::nullopt;
    }
    return ledger_.slot(index).revealed_key();
}

std::optional<bytes_t> Game::locked_secret(tile_index_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ledger_.valid_index(index)) {
        return std::nullopt;
    }
    return ledger_.slot(index).locked_secret();
}

std::optional<std::string> Game::unlock_ref(tile_index_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ledger_.valid_index(index)) {
        return std::nullopt;
    }
    return ledger_.slot(index).unlock_ref();
}

bool Game::has_commitment(const Address& player) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commitments_.contains(player);
}

std::optional<HashCommitment> Game::commitment(const Address& player) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commitments_.find(player);
}

GameSnapshot Game::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    GameSnapshot snap;
    snap.id = id_;
    snap.creator = creator_;
    snap.answer_digest = answer_digest_;
    snap.manifest_handle = manifest_handle_;
    snap.capability_id = capability_id_;
    snap.prize_pool = ledger_.pool().value();
    snap.settlement = settlement_;

    snap.tiles.reserve(ledger_.tile_count());
    for (const auto& slot : ledger_.slots_) {
        TileSnapshot tile;
        tile.locked_secret = slot.locked_secret();
        tile.unlock_ref = slot.unlock_ref();
        tile.state = slot.state();
        tile.revealed_key = slot.revealed_key();
        tile.request_count = slot.request_count();
        snap.tiles.push_back(std::move(tile));
    }

    for (const auto& [player, commitment] : commitments_.sorted_entries()) {
        snap.commitments.push_back(CommitmentSnapshot{player, commitment});
    }
    return snap;
}

}  // namespace mosaic
