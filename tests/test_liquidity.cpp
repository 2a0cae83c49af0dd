// DataSwap - Liquidity provision tests

#include <catch2/catch_test_macros.hpp>
#include <dataswap/errors.hpp>
#include <dataswap/math.hpp>

#include "test_support.hpp"

#include <functional>

using namespace dataswap;
using dataswap::test::amt;
using dataswap::test::ExchangeFixture;

namespace {

ErrorCode code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    return ErrorCode::InvalidRequest;
}

// Memory backend whose liquidity commits can be made to fail
class FailingCommitBackend : public MemoryBackend {
public:
    uint64_t commit_liquidity_event(const Pool& pool, const LiquidityEvent& event) override {
        if (fail_commits) throw Error(ErrorCode::StorageError, "write rejected");
        return MemoryBackend::commit_liquidity_event(pool, event);
    }

    bool fail_commits = false;
};

}  // namespace

TEST_CASE("First deposit seeds the pool", "[liquidity]") {
    ExchangeFixture fx;
    AddLiquidityResult r = fx.seed();

    REQUIRE(r.pair_id == "DATA/USDC");
    REQUIRE(r.minted_units == amt("2000"));
    REQUIRE(r.consumed_a == amt("1000"));
    REQUIRE(r.consumed_b == amt("4000"));
    REQUIRE(r.position_units == amt("2000"));

    PoolInfo info = fx.exchange.pool_info("DATA", "USDC");
    REQUIRE(info.reserve_a == amt("1000"));
    REQUIRE(info.reserve_b == amt("4000"));
    REQUIRE(info.total_units == amt("2000"));
    REQUIRE(info.price == amt("4"));

    auto positions = fx.exchange.positions("alice");
    REQUIRE(positions.size() == 1);
    REQUIRE(positions[0].units == amt("2000"));
}

TEST_CASE("Deposits in either token order", "[liquidity]") {
    ExchangeFixture fx;
    fx.seed();

    // Same pool, caller lists USDC first
    AddLiquidityResult r =
        fx.exchange.add_liquidity("USDC", "DATA", amt("400"), amt("100"), "bob");
    REQUIRE(r.minted_units == amt("200"));
    REQUIRE(r.consumed_a == amt("400"));
    REQUIRE(r.consumed_b == amt("100"));

    PoolInfo info = fx.exchange.pool_info("DATA", "USDC");
    REQUIRE(info.reserve_a == amt("1100"));
    REQUIRE(info.reserve_b == amt("4400"));
    REQUIRE(info.total_units == amt("2200"));
    REQUIRE(fx.exchange.list_pools().size() == 1);
}

TEST_CASE("Off-ratio deposits", "[liquidity]") {
    ExchangeFixture fx;
    fx.seed();

    SECTION("Small excess is refunded, not absorbed") {
        AddLiquidityResult r =
            fx.exchange.add_liquidity("DATA", "USDC", amt("10"), amt("40.3"), "bob");
        REQUIRE(r.consumed_b == amt("40"));
        REQUIRE(r.refund_b == amt("0.3"));
        REQUIRE(fx.exchange.pool_info("DATA", "USDC").reserve_b == amt("4040"));
    }

    SECTION("Large deviation is rejected with no state change") {
        REQUIRE(code_of([&] {
                    fx.exchange.add_liquidity("DATA", "USDC", amt("10"), amt("10"), "bob");
                }) == ErrorCode::InvalidLiquidityAmount);
        REQUIRE(fx.exchange.pool_info("DATA", "USDC").version == 1);
        REQUIRE(fx.exchange.positions("bob").empty());
    }

    SECTION("Zero amounts") {
        REQUIRE(code_of([&] {
                    fx.exchange.add_liquidity("DATA", "USDC", 0, amt("10"), "bob");
                }) == ErrorCode::InsufficientAmount);
    }
}

TEST_CASE("Withdrawals", "[liquidity]") {
    ExchangeFixture fx;
    fx.seed();

    SECTION("Burning a quarter pays a quarter") {
        RemoveLiquidityResult r =
            fx.exchange.remove_liquidity("DATA", "USDC", amt("500"), "alice");
        REQUIRE(r.amount_a == amt("250"));
        REQUIRE(r.amount_b == amt("1000"));
        REQUIRE(r.position_units == amt("1500"));

        PoolInfo info = fx.exchange.pool_info("DATA", "USDC");
        REQUIRE(info.reserve_a == amt("750"));
        REQUIRE(info.reserve_b == amt("3000"));
        REQUIRE(info.total_units == amt("1500"));
    }

    SECTION("Amounts come back in caller order") {
        RemoveLiquidityResult r =
            fx.exchange.remove_liquidity("USDC", "DATA", amt("500"), "alice");
        REQUIRE(r.amount_a == amt("1000"));
        REQUIRE(r.amount_b == amt("250"));
    }

    SECTION("Cannot burn units the provider does not hold") {
        REQUIRE(code_of([&] {
                    fx.exchange.remove_liquidity("DATA", "USDC", amt("1"), "mallory");
                }) == ErrorCode::InsufficientPosition);
        REQUIRE(code_of([&] {
                    fx.exchange.remove_liquidity("DATA", "USDC", amt("2000.5"), "alice");
                }) == ErrorCode::InsufficientPosition);
        REQUIRE(fx.exchange.pool_info("DATA", "USDC").total_units == amt("2000"));
    }

    SECTION("Never-seeded pair") {
        REQUIRE(code_of([&] {
                    fx.exchange.remove_liquidity("DATA", "ETH", amt("1"), "alice");
                }) == ErrorCode::PoolNotFound);
    }

    SECTION("Draining and re-seeding") {
        fx.exchange.remove_liquidity("DATA", "USDC", amt("2000"), "alice");
        PoolInfo drained = fx.exchange.pool_info("DATA", "USDC");
        REQUIRE(drained.reserve_a == 0);
        REQUIRE(drained.reserve_b == 0);
        REQUIRE(drained.total_units == 0);
        REQUIRE(fx.exchange.positions("alice").empty());

        AddLiquidityResult r =
            fx.exchange.add_liquidity("DATA", "USDC", amt("10"), amt("90"), "carol");
        REQUIRE(r.minted_units == amt("30"));
        REQUIRE(fx.exchange.pool_info("DATA", "USDC").price == amt("9"));
    }
}

TEST_CASE("Fees accrue to liquidity providers", "[liquidity]") {
    ExchangeFixture fx;
    fx.seed();

    RemovalQuote before = fx.exchange.liquidity_value("DATA", "USDC", amt("2000"));
    fx.exchange.swap("DATA", "USDC", amt("100"), 0, "bob");
    fx.exchange.swap("USDC", "DATA", amt("362.644357552059652632"), 0, "bob");
    RemovalQuote after = fx.exchange.liquidity_value("DATA", "USDC", amt("2000"));

    // Round trip leaves both fees behind
    REQUIRE(after.amount_a > before.amount_a);
    REQUIRE(after.amount_b == before.amount_b);
    REQUIRE(fx.exchange.pool_info("DATA", "USDC").total_units == amt("2000"));
}

TEST_CASE("Add then remove round-trips", "[liquidity]") {
    ExchangeFixture fx;
    fx.seed();
    fx.exchange.swap("DATA", "USDC", amt("37"), 0, "bob");

    PoolInfo info = fx.exchange.pool_info("DATA", "USDC");
    Amount amount_a = amt("12.5");
    Amount amount_b = math::mul_div(amount_a, info.reserve_b, info.reserve_a);

    AddLiquidityResult added =
        fx.exchange.add_liquidity("DATA", "USDC", amount_a, amount_b, "dave");
    RemoveLiquidityResult removed =
        fx.exchange.remove_liquidity("DATA", "USDC", added.minted_units, "dave");

    REQUIRE(removed.amount_a <= added.consumed_a);
    REQUIRE(removed.amount_b <= added.consumed_b);
    REQUIRE(added.consumed_a - removed.amount_a <= 10);
    REQUIRE(added.consumed_b - removed.amount_b <= 10);
    REQUIRE(removed.position_units == 0);
}

TEST_CASE("Liquidity events are recorded", "[liquidity]") {
    ExchangeFixture fx;
    fx.seed();
    fx.exchange.remove_liquidity("DATA", "USDC", amt("100"), "alice");

    auto events = fx.exchange.liquidity_history("alice", 10);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].action == LiquidityAction::Remove);
    REQUIRE(events[0].units == amt("100"));
    REQUIRE(events[1].action == LiquidityAction::Add);
    REQUIRE(events[1].amount_b == amt("4000"));
    REQUIRE(fx.exchange.get_stats().liquidity_deposits == 1);
    REQUIRE(fx.exchange.get_stats().liquidity_withdrawals == 1);
}

TEST_CASE("Deposits that would overflow a reserve are rejected", "[liquidity]") {
    ExchangeFixture fx;
    Amount big = amt("100000000000000000000");
    fx.exchange.add_liquidity("DATA", "USDC", big, big, "alice");

    REQUIRE(code_of([&] { fx.exchange.add_liquidity("DATA", "USDC", big, big, "bob"); }) ==
            ErrorCode::InvalidAmount);

    auto pool = fx.exchange.pool_info("DATA", "USDC");
    REQUIRE(pool.reserve_a == big);
    REQUIRE(pool.reserve_b == big);
    REQUIRE(pool.version == 1);
    REQUIRE(fx.exchange.positions("bob").empty());
}

TEST_CASE("A failed liquidity commit credits nothing", "[liquidity]") {
    auto backend = std::make_shared<FailingCommitBackend>();
    auto positions = std::make_shared<MemoryPositionLedger>();
    Exchange exchange(Config{}, backend, std::make_shared<NullSettlement>(), positions);
    auto seeded = exchange.add_liquidity("DATA", "USDC", amt("1000"), amt("4000"), "alice");

    backend->fail_commits = true;
    REQUIRE(code_of([&] {
                exchange.add_liquidity("DATA", "USDC", amt("100"), amt("400"), "bob");
            }) == ErrorCode::StorageError);
    REQUIRE(exchange.positions("bob").empty());
    REQUIRE(exchange.pool_info("DATA", "USDC").reserve_a == amt("1000"));

    REQUIRE(code_of([&] {
                exchange.remove_liquidity("DATA", "USDC", seeded.minted_units, "alice");
            }) == ErrorCode::StorageError);
    REQUIRE(exchange.positions("alice").size() == 1);
    REQUIRE(exchange.positions("alice")[0].units == seeded.minted_units);
    REQUIRE(backend->fetch_pool("DATA/USDC")->reserve_a == amt("1000"));
    REQUIRE(backend->fetch_liquidity_events("", 10).size() == 1);
}
