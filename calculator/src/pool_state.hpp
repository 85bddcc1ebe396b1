#pragma once

// Constant product pool snapshot: x * y = k = L^2, with P = y / x
class PoolState {
public:
    // Throws std::invalid_argument unless liquidity and price are positive and finite
    PoolState(double liquidity, double price);
    
    double liquidity() const { return liquidity_; }
    double price() const { return price_; }
    
    // x = L / sqrt(P)
    double base_reserves() const;
    
    // y = L * sqrt(P)
    double quote_reserves() const;
    
    // k = L^2
    double invariant() const;
    
    bool operator==(const PoolState& other) const;
    bool operator!=(const PoolState& other) const { return !(*this == other); }
    
private:
    double liquidity_;
    double price_;
};

PoolState make_pool_state(double liquidity, double price);
