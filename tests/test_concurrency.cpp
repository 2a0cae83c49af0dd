// DataSwap - Concurrent swaps on a shared pool

#include <catch2/catch_test_macros.hpp>
#include <dataswap/errors.hpp>
#include <dataswap/math.hpp>
#include <dataswap/pricing.hpp>

#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace dataswap;
using dataswap::test::amt;
using dataswap::test::ExchangeFixture;

TEST_CASE("Concurrent swaps serialize on one pool", "[concurrency]") {
    ExchangeFixture fx;
    fx.seed();

    constexpr int kThreads = 8;
    constexpr int kSwapsPerThread = 25;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            // Alternate directions so reserves stay balanced
            bool forward = i % 2 == 0;
            for (int n = 0; n < kSwapsPerThread; ++n) {
                try {
                    fx.exchange.swap(forward ? "DATA" : "USDC", forward ? "USDC" : "DATA",
                                     forward ? amt("1.5") : amt("6"), 0,
                                     "trader-" + std::to_string(i));
                } catch (const Error&) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(failures.load() == 0);

    auto trades = fx.exchange.recent_trades(500);
    REQUIRE(trades.size() == static_cast<size_t>(kThreads * kSwapsPerThread));
    std::reverse(trades.begin(), trades.end());

    // Replaying in ledger (lock-grant) order reproduces every output and the
    // final reserves exactly, with k never shrinking along the way.
    Amount data = amt("1000");
    Amount usdc = amt("4000");
    for (const auto& t : trades) {
        bool data_in = t.token_in == "DATA";
        Amount reserve_in = data_in ? data : usdc;
        Amount reserve_out = data_in ? usdc : data;
        SwapQuote q = pricing::quote_swap(reserve_in, reserve_out, t.amount_in, 30);
        REQUIRE(q.amount_out == t.amount_out);
        REQUIRE(math::product_not_decreased(reserve_in, reserve_out,
                                            reserve_in + t.amount_in,
                                            reserve_out - q.amount_out));
        (data_in ? data : usdc) += t.amount_in;
        (data_in ? usdc : data) -= q.amount_out;
    }

    PoolInfo info = fx.exchange.pool_info("DATA", "USDC");
    REQUIRE(info.reserve_a == data);
    REQUIRE(info.reserve_b == usdc);
    REQUIRE(info.version == static_cast<uint64_t>(1 + kThreads * kSwapsPerThread));
}

TEST_CASE("Concurrent deposits and withdrawals keep units consistent", "[concurrency]") {
    ExchangeFixture fx;
    fx.seed();

    constexpr int kProviders = 6;
    std::vector<std::thread> threads;
    for (int i = 0; i < kProviders; ++i) {
        threads.emplace_back([&, i] {
            std::string provider = "lp-" + std::to_string(i);
            for (int n = 0; n < 10; ++n) {
                auto added = fx.exchange.add_liquidity("DATA", "USDC", amt("10"), amt("40"), provider);
                fx.exchange.remove_liquidity("DATA", "USDC", added.minted_units, provider);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    PoolInfo info = fx.exchange.pool_info("DATA", "USDC");
    REQUIRE(info.total_units == amt("2000"));
    for (int i = 0; i < kProviders; ++i) {
        REQUIRE(fx.exchange.positions("lp-" + std::to_string(i)).empty());
    }
    REQUIRE(info.reserve_a >= amt("1000"));
    REQUIRE(info.reserve_b >= amt("4000"));
}
