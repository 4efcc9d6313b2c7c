#include "settlement.hh"
#include "core/logging.hh"

namespace mosaic {

std::optional<Coin> SettlementEngine::settle(SettlementState& state,
                                             PrizePool& pool,
                                             const Address& winner,
                                             timestamp_t now) {
    if (state.solved) {
        MOSAIC_LOG_WARN(log::settlement) << "Settlement refused: already won by "
                                         << state.winner->to_hex().substr(0, 16);
        return std::nullopt;
    }

    Coin payout = pool.withdraw_all();

    state.solved = true;
    state.winner = winner;
    state.payout = payout.value();
    state.settled_at = now;

    MOSAIC_LOG_INFO(log::settlement) << "Paid " << payout.value() << " to "
                                     << winner.to_hex().substr(0, 16);
    return payout;
}

}  // namespace mosaic
