// DataSwap - Constant-product pricing tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <dataswap/errors.hpp>
#include <dataswap/math.hpp>
#include <dataswap/pricing.hpp>

#include "test_support.hpp"

#include <functional>

using namespace dataswap;
using namespace dataswap::pricing;
using dataswap::test::amt;
using Catch::Approx;

namespace {

ErrorCode code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    FAIL("expected dataswap::Error");
    return ErrorCode::InvalidRequest;
}

}  // namespace

TEST_CASE("Swap quote against 1000:4000 at 30 bps", "[pricing]") {
    SwapQuote q = quote_swap(amt("1000"), amt("4000"), amt("100"), 30);

    SECTION("Fee is taken from the input") {
        REQUIRE(q.effective_in == amt("99.7"));
        REQUIRE(q.fee == amt("0.3"));
    }

    SECTION("Output follows x * y = k, rounded down") {
        REQUIRE(q.amount_out == amt("362.644357552059652632"));
        REQUIRE(x18::to_double(q.amount_out) == Approx(362.6).margin(0.1));
    }

    SECTION("Prices and impact") {
        REQUIRE(q.spot_price == amt("4"));
        REQUIRE(q.execution_price == amt("3.626443575520596526"));
        REQUIRE(x18::to_double(q.price_impact_pct) == Approx(9.3389).margin(0.001));
    }
}

TEST_CASE("Swap quote bounds", "[pricing]") {
    Amount reserve_in = amt("1000");
    Amount reserve_out = amt("4000");

    SECTION("Output stays strictly below the reserve") {
        for (const char* in : {"0.001", "1", "1000", "1000000", "1000000000"}) {
            SwapQuote q = quote_swap(reserve_in, reserve_out, amt(in), 30);
            REQUIRE(q.amount_out > 0);
            REQUIRE(q.amount_out < reserve_out);
        }
    }

    SECTION("Larger input never yields less output") {
        Amount previous = 0;
        for (Amount in = amt("0.5"); in <= amt("5000"); in += amt("37.25")) {
            SwapQuote q = quote_swap(reserve_in, reserve_out, in, 30);
            REQUIRE(q.amount_out >= previous);
            previous = q.amount_out;
        }
    }

    SECTION("Zero fee is exact constant product") {
        SwapQuote q = quote_swap(amt("100"), amt("100"), amt("100"), 0);
        REQUIRE(q.amount_out == amt("50"));
        REQUIRE(q.fee == 0);
    }

    SECTION("Reserves never shrink in product") {
        SwapQuote q = quote_swap(reserve_in, reserve_out, amt("123.456"), 30);
        REQUIRE(math::product_not_decreased(reserve_in, reserve_out,
                                            reserve_in + amt("123.456"),
                                            reserve_out - q.amount_out));
    }
}

TEST_CASE("Swap quote rejections", "[pricing]") {
    REQUIRE(code_of([] { quote_swap(amt("1000"), amt("4000"), 0, 30); }) ==
            ErrorCode::InsufficientAmount);
    REQUIRE(code_of([] { quote_swap(0, amt("4000"), amt("1"), 30); }) ==
            ErrorCode::InsufficientLiquidity);
    REQUIRE(code_of([] { quote_swap(amt("1000"), 0, amt("1"), 30); }) ==
            ErrorCode::InsufficientLiquidity);
    REQUIRE(code_of([] { quote_swap(amt("1000"), amt("4000"), amt("1"), 10000); }) ==
            ErrorCode::InvalidFee);
    // 1 raw unit of input rounds to nothing after the fee
    REQUIRE(code_of([] { quote_swap(amt("1000"), amt("4000"), 1, 30); }) ==
            ErrorCode::InsufficientAmount);
}

TEST_CASE("Liquidity add quotes", "[pricing]") {
    SECTION("First deposit mints the geometric mean") {
        LiquidityQuote q = quote_liquidity_add(0, 0, 0, amt("1000"), amt("4000"));
        REQUIRE(q.minted_units == amt("2000"));
        REQUIRE(q.consumed_a == amt("1000"));
        REQUIRE(q.consumed_b == amt("4000"));
        REQUIRE(q.refund_a == 0);
        REQUIRE(q.refund_b == 0);
    }

    SECTION("Deposit at the pool ratio") {
        LiquidityQuote q = quote_liquidity_add(amt("1000"), amt("4000"), amt("2000"),
                                               amt("10"), amt("40"));
        REQUIRE(q.minted_units == amt("20"));
        REQUIRE(q.consumed_a == amt("10"));
        REQUIRE(q.consumed_b == amt("40"));
    }

    SECTION("Excess within tolerance is refunded") {
        // 0.5% extra B with the default 1% tolerance
        LiquidityQuote q = quote_liquidity_add(amt("1000"), amt("4000"), amt("2000"),
                                               amt("10"), amt("40.2"));
        REQUIRE(q.minted_units == amt("20"));
        REQUIRE(q.consumed_b == amt("40"));
        REQUIRE(q.refund_b == amt("0.2"));
        REQUIRE(q.refund_a == 0);
    }

    SECTION("Over-supplied A is trimmed") {
        LiquidityQuote q = quote_liquidity_add(amt("1000"), amt("4000"), amt("2000"),
                                               amt("10.05"), amt("40"));
        REQUIRE(q.consumed_a == amt("10"));
        REQUIRE(q.refund_a == amt("0.05"));
        REQUIRE(q.minted_units == amt("20"));
    }

    SECTION("Ratio outside tolerance is rejected") {
        REQUIRE(code_of([] {
            quote_liquidity_add(amt("1000"), amt("4000"), amt("2000"), amt("10"), amt("80"));
        }) == ErrorCode::InvalidLiquidityAmount);
    }

    SECTION("Tolerance is configurable") {
        LiquidityQuote q = quote_liquidity_add(amt("1000"), amt("4000"), amt("2000"),
                                               amt("10"), amt("80"), 5000);
        REQUIRE(q.minted_units == amt("20"));
        REQUIRE(q.refund_b == amt("40"));
    }

    SECTION("Non-positive amounts") {
        REQUIRE(code_of([] { quote_liquidity_add(0, 0, 0, 0, amt("1")); }) ==
                ErrorCode::InsufficientAmount);
        REQUIRE(code_of([] {
            quote_liquidity_add(amt("1000"), amt("4000"), amt("2000"), amt("1"), -amt("1"));
        }) == ErrorCode::InsufficientAmount);
    }
}

TEST_CASE("Liquidity remove quotes", "[pricing]") {
    SECTION("Quarter of the units pays a quarter of the reserves") {
        RemovalQuote q = quote_liquidity_remove(amt("1000"), amt("4000"), amt("2000"), amt("500"));
        REQUIRE(q.amount_a == amt("250"));
        REQUIRE(q.amount_b == amt("1000"));
    }

    SECTION("Burning everything drains the pool exactly") {
        RemovalQuote q = quote_liquidity_remove(amt("1000.1"), amt("3999.9"), amt("2000"),
                                                amt("2000"));
        REQUIRE(q.amount_a == amt("1000.1"));
        REQUIRE(q.amount_b == amt("3999.9"));
    }

    SECTION("Invalid unit counts") {
        REQUIRE(code_of([] {
            quote_liquidity_remove(amt("1000"), amt("4000"), amt("2000"), amt("2000.000000000000000001"));
        }) == ErrorCode::InvalidLiquidityAmount);
        REQUIRE(code_of([] { quote_liquidity_remove(amt("1000"), amt("4000"), amt("2000"), 0); }) ==
                ErrorCode::InvalidLiquidityAmount);
    }

    SECTION("Add then remove at the same ratio round-trips") {
        Amount ra = amt("1000"), rb = amt("4000"), total = amt("2000");
        LiquidityQuote add = quote_liquidity_add(ra, rb, total, amt("33.333"), amt("133.332"));
        RemovalQuote out = quote_liquidity_remove(ra + add.consumed_a, rb + add.consumed_b,
                                                  total + add.minted_units, add.minted_units);
        REQUIRE(out.amount_a <= add.consumed_a);
        REQUIRE(out.amount_b <= add.consumed_b);
        REQUIRE(add.consumed_a - out.amount_a <= 2);
        REQUIRE(add.consumed_b - out.amount_b <= 4);
    }
}

TEST_CASE("Slippage tolerance to minimum output", "[pricing]") {
    REQUIRE(min_amount_out(amt("362.6"), 0) == amt("362.6"));
    REQUIRE(min_amount_out(amt("100"), 50) == amt("99.5"));
    REQUIRE(min_amount_out(amt("100"), 5000) == amt("50"));
    REQUIRE_THROWS_AS(min_amount_out(amt("100"), 5001), Error);
}
