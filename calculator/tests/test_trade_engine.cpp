#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/trade_engine.hpp"
#include "../src/number_format.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

using Catch::Approx;

TEST_CASE("Trade deltas and fees", "[trade_engine]") {
    PoolState initial(1000.0, 1.0);
    
    SECTION("Price up: trader buys base with quote") {
        PoolState final_state(1000.0, 1.21);
        auto result = TradeEngine::compute_trade(initial, final_state, 0.003);
        
        REQUIRE(result.base_wallet_delta > 0.0);
        REQUIRE(result.quote_wallet_delta < 0.0);
        REQUIRE(result.quote_fee_collected > 0.0);
        REQUIRE(result.base_fee_collected == 0.0);
        
        // x: 1000 -> 1000/1.1, y: 1000 -> 1100
        REQUIRE(result.price_delta == Approx(0.21));
        REQUIRE(result.base_wallet_delta == Approx(1000.0 - 1000.0 / 1.1));
        REQUIRE(result.quote_wallet_delta == Approx(-100.0));
        REQUIRE(result.quote_fee_collected == Approx(0.3));
    }
    
    SECTION("Price down: trader sells base for quote") {
        PoolState final_state(1000.0, 0.81);
        auto result = TradeEngine::compute_trade(initial, final_state, 0.003);
        
        REQUIRE(result.base_wallet_delta < 0.0);
        REQUIRE(result.quote_wallet_delta > 0.0);
        REQUIRE(result.base_fee_collected > 0.0);
        REQUIRE(result.quote_fee_collected == 0.0);
        
        // x: 1000 -> 1000/0.9, y: 1000 -> 900
        REQUIRE(result.price_delta == Approx(-0.19));
        REQUIRE(result.base_wallet_delta == Approx(1000.0 - 1000.0 / 0.9));
        REQUIRE(result.quote_wallet_delta == Approx(100.0));
        REQUIRE(result.base_fee_collected == Approx((1000.0 / 0.9 - 1000.0) * 0.003));
    }
    
    SECTION("Wallet deltas stay gross of the fee") {
        PoolState final_state(1000.0, 1.21);
        auto no_fee = TradeEngine::compute_trade(initial, final_state, 0.0);
        auto with_fee = TradeEngine::compute_trade(initial, final_state, 0.25);
        
        REQUIRE(with_fee.base_wallet_delta == no_fee.base_wallet_delta);
        REQUIRE(with_fee.quote_wallet_delta == no_fee.quote_wallet_delta);
        REQUIRE(no_fee.quote_fee_collected == 0.0);
        REQUIRE(with_fee.quote_fee_collected == Approx(25.0));
    }
    
    SECTION("Unchanged pool is a no-op") {
        auto result = TradeEngine::compute_trade(initial, initial, 0.003);
        
        REQUIRE(result.price_delta == 0.0);
        REQUIRE(result.base_wallet_delta == 0.0);
        REQUIRE(result.quote_wallet_delta == 0.0);
        REQUIRE(result.base_fee_collected == 0.0);
        REQUIRE(result.quote_fee_collected == 0.0);
    }
    
    SECTION("No-op wallet deltas are the negated zero pool deltas") {
        auto result = TradeEngine::compute_trade(initial, initial, 0.003);
        
        REQUIRE(std::signbit(result.base_wallet_delta));
        REQUIRE(std::signbit(result.quote_wallet_delta));
        REQUIRE(format_number(result.base_wallet_delta) == "-0.000000");
        REQUIRE(format_number(result.quote_wallet_delta) == "-0.000000");
        REQUIRE(format_number(result.price_delta) == "0.000000");
    }
}

TEST_CASE("Fee exclusivity and sign consistency", "[trade_engine]") {
    PoolState initial(500.0, 2.0);
    const double final_prices[] = {0.002, 0.5, 1.9, 1.999, 2.001, 2.1, 8.0, 4000.0};
    
    for (double p : final_prices) {
        PoolState final_state(500.0, p);
        auto result = TradeEngine::compute_trade(initial, final_state, 0.01);
        
        if (result.base_fee_collected > 0.0) {
            REQUIRE(result.quote_fee_collected == 0.0);
        }
        if (result.quote_fee_collected > 0.0) {
            REQUIRE(result.base_fee_collected == 0.0);
        }
        
        if (p > initial.price()) {
            REQUIRE(result.base_wallet_delta > 0.0);
            REQUIRE(result.quote_wallet_delta < 0.0);
            REQUIRE(result.quote_fee_collected > 0.0);
        } else {
            REQUIRE(result.base_wallet_delta < 0.0);
            REQUIRE(result.quote_wallet_delta > 0.0);
            REQUIRE(result.base_fee_collected > 0.0);
        }
    }
}

TEST_CASE("Fee fraction must be in [0, 1)", "[trade_engine]") {
    PoolState initial(1000.0, 1.0);
    PoolState final_state(1000.0, 1.21);
    
    REQUIRE_NOTHROW(TradeEngine::compute_trade(initial, final_state, 0.0));
    REQUIRE_NOTHROW(TradeEngine::compute_trade(initial, final_state, 0.999));
    
    REQUIRE_THROWS_AS(TradeEngine::compute_trade(initial, final_state, 1.0),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(TradeEngine::compute_trade(initial, final_state, -0.001),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(TradeEngine::compute_trade(initial, final_state,
                                                 std::numeric_limits<double>::quiet_NaN()),
                      std::invalid_argument);
}
