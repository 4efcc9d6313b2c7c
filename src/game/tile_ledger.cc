#include "tile_ledger.hh"
#include "core/logging.hh"
#include <algorithm>

namespace mosaic {

// ============================================================================
// TileSlot Implementation
// ============================================================================

TileSlot::TileSlot(bytes_t locked_secret, std::string unlock_ref)
    : locked_secret_(std::move(locked_secret))
    , unlock_ref_(std::move(unlock_ref)) {}

void TileSlot::mark_requested() {
    if (state_ == TileState::LOCKED) {
        state_ = TileState::REQUESTED;
    }
    ++request_count_;
}

bool TileSlot::reveal(bytes_t key) {
    if (state_ == TileState::REVEALED) {
        return false;
    }
    revealed_key_ = std::move(key);
    state_ = TileState::REVEALED;
    return true;
}

// ============================================================================
// TileRevealLedger Implementation
// ============================================================================

std::optional<TileRevealLedger> TileRevealLedger::create(
    std::uint32_t tile_count,
    std::vector<bytes_t> locked_secrets,
    std::vector<std::string> unlock_refs) {

    if (locked_secrets.size() != tile_count || unlock_refs.size() != tile_count) {
        MOSAIC_LOG_DEBUG(log::ledger) << "Rejected tile vectors: " << locked_secrets.size()
                                      << " secrets, " << unlock_refs.size()
                                      << " refs, expected " << tile_count;
        return std::nullopt;
    }

    TileRevealLedger ledger;
    ledger.slots_.reserve(tile_count);
    for (std::uint32_t i = 0; i < tile_count; ++i) {
        ledger.slots_.emplace_back(std::move(locked_secrets[i]), std::move(unlock_refs[i]));
    }
    return ledger;
}

GameStatus TileRevealLedger::accept_request(tile_index_t index, Coin& payment,
                                            amount_t tile_price) {
    if (payment.value() != tile_price) {
        MOSAIC_LOG_DEBUG(log::ledger) << "Reveal payment " << payment.value()
                                      << " != price " << tile_price;
        return GameStatus::INVALID_PAYMENT;
    }
    if (!valid_index(index)) {
        MOSAIC_LOG_DEBUG(log::ledger) << "Tile index " << index << " out of range";
        return GameStatus::INVALID_TILE_INDEX;
    }

    auto& slot = slots_[index];
    if (slot.is_revealed()) {
        return GameStatus::TILE_ALREADY_REVEALED;
    }

    pool_.deposit(payment);
    slot.mark_requested();
    return GameStatus::SUCCESS;
}

bool TileRevealLedger::publish_key(tile_index_t index, bytes_t key) {
    return slots_[index].reveal(std::move(key));
}

std::uint32_t TileRevealLedger::revealed_count() const {
    return static_cast<std::uint32_t>(std::count_if(
        slots_.begin(), slots_.end(),
        [](const TileSlot& s) { return s.is_revealed(); }));
}

}  // namespace mosaic
