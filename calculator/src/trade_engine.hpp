#pragma once

#include "pool_state.hpp"

// Consequence of moving a pool between two states, seen from the trader's wallet.
// Positive wallet deltas are received by the trader, negative ones are paid in.
struct TradeResult {
    double price_delta;
    double base_wallet_delta;
    double quote_wallet_delta;
    double base_fee_collected;
    double quote_fee_collected;
};

class TradeEngine {
public:
    // Fee is charged on the input side only and reported separately from the
    // gross wallet deltas. Throws std::invalid_argument if fee_fraction is outside [0, 1).
    static TradeResult compute_trade(const PoolState& initial,
                                     const PoolState& final_state,
                                     double fee_fraction);
};
