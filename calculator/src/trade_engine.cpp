#include "trade_engine.hpp"
#include <cmath>
#include <stdexcept>

TradeResult TradeEngine::compute_trade(const PoolState& initial,
                                       const PoolState& final_state,
                                       double fee_fraction) {
    if (!(fee_fraction >= 0.0 && fee_fraction < 1.0)) {
        throw std::invalid_argument("Fee fraction must be in [0, 1)");
    }
    
    TradeResult result;
    result.price_delta = final_state.price() - initial.price();
    
    // What leaves the pool enters the wallet. An unchanged pool yields -0.0.
    double base_gross = -(final_state.base_reserves() - initial.base_reserves());
    double quote_gross = -(final_state.quote_reserves() - initial.quote_reserves());
    
    result.base_fee_collected = 0.0;
    result.quote_fee_collected = 0.0;
    
    if (base_gross < 0.0) {
        // Selling base into the pool
        result.base_fee_collected = -base_gross * fee_fraction;
    } else if (quote_gross < 0.0) {
        // Buying base with quote
        result.quote_fee_collected = -quote_gross * fee_fraction;
    }
    
    result.base_wallet_delta = base_gross;
    result.quote_wallet_delta = quote_gross;
    
    return result;
}
