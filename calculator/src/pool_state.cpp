#include "pool_state.hpp"
#include <cmath>
#include <stdexcept>

PoolState::PoolState(double liquidity, double price)
    : liquidity_(liquidity)
    , price_(price)
{
    if (!std::isfinite(liquidity) || liquidity <= 0.0) {
        throw std::invalid_argument("Liquidity must be positive");
    }
    if (!std::isfinite(price) || price <= 0.0) {
        throw std::invalid_argument("Price must be positive");
    }
}

double PoolState::base_reserves() const {
    return liquidity_ / std::sqrt(price_);
}

double PoolState::quote_reserves() const {
    return liquidity_ * std::sqrt(price_);
}

double PoolState::invariant() const {
    return liquidity_ * liquidity_;
}

bool PoolState::operator==(const PoolState& other) const {
    return liquidity_ == other.liquidity_ && price_ == other.price_;
}

PoolState make_pool_state(double liquidity, double price) {
    return PoolState(liquidity, price);
}
