// DataSwap - Settlement tests

#include <catch2/catch_test_macros.hpp>
#include <dataswap/errors.hpp>
#include <dataswap/settlement.hpp>

#include "test_support.hpp"

#include <vector>

using namespace dataswap;
using dataswap::test::amt;

namespace {

// Records requests; optionally fails every call
class RecordingSettlement : public Settlement {
public:
    std::string settle(const SettlementRequest& request) override {
        if (fail) {
            throw Error(ErrorCode::SettlementFailed, "custodian rejected transfer");
        }
        requests.push_back(request);
        return "rec-" + std::to_string(requests.size());
    }

    bool fail = false;
    std::vector<SettlementRequest> requests;
};

struct RecordingFixture {
    std::shared_ptr<RecordingSettlement> settlement = std::make_shared<RecordingSettlement>();
    Exchange exchange{Config{}, std::make_shared<MemoryBackend>(), settlement,
                      std::make_shared<MemoryPositionLedger>()};
};

}  // namespace

TEST_CASE("Null settlement issues distinct references", "[settlement]") {
    NullSettlement settlement;
    SettlementRequest request;
    request.kind = SettlementKind::AddLiquidity;

    std::string first = settlement.settle(request);
    std::string second = settlement.settle(request);
    REQUIRE(first == "local-add_liquidity-1");
    REQUIRE(second == "local-add_liquidity-2");
}

TEST_CASE("Settlement legs follow the direction of value", "[settlement]") {
    RecordingFixture fx;
    fx.exchange.add_liquidity("USDC", "DATA", amt("4000"), amt("1000"), "alice");

    REQUIRE(fx.settlement->requests.size() == 1);
    const auto& add = fx.settlement->requests[0];
    REQUIRE(add.kind == SettlementKind::AddLiquidity);
    REQUIRE(add.pair_id == "DATA/USDC");
    REQUIRE(add.account == "alice");
    REQUIRE(add.legs.size() == 2);
    REQUIRE(add.legs[0].token == "DATA");
    REQUIRE(add.legs[0].amount == amt("1000"));
    REQUIRE(add.legs[1].amount == amt("4000"));

    Trade t = fx.exchange.swap("DATA", "USDC", amt("100"), 0, "bob");
    REQUIRE(t.settlement_ref == "rec-2");
    const auto& swap = fx.settlement->requests[1];
    REQUIRE(swap.kind == SettlementKind::Swap);
    REQUIRE(swap.account == "bob");
    REQUIRE(swap.legs[0].token == "DATA");
    REQUIRE(swap.legs[0].amount == amt("100"));
    REQUIRE(swap.legs[1].token == "USDC");
    REQUIRE(swap.legs[1].amount == -amt("362.644357552059652632"));

    fx.exchange.remove_liquidity("DATA", "USDC", amt("200"), "alice");
    const auto& remove = fx.settlement->requests[2];
    REQUIRE(remove.kind == SettlementKind::RemoveLiquidity);
    for (const auto& leg : remove.legs) {
        REQUIRE(leg.amount < 0);
    }
}

TEST_CASE("Failed settlement leaves no trace", "[settlement]") {
    RecordingFixture fx;
    fx.exchange.add_liquidity("DATA", "USDC", amt("1000"), amt("4000"), "alice");
    PoolInfo before = fx.exchange.pool_info("DATA", "USDC");

    fx.settlement->fail = true;

    try {
        fx.exchange.swap("DATA", "USDC", amt("100"), 0, "bob");
        FAIL("swap should not settle");
    } catch (const Error& e) {
        REQUIRE(e.code() == ErrorCode::SettlementFailed);
    }
    REQUIRE_THROWS_AS(fx.exchange.add_liquidity("DATA", "USDC", amt("10"), amt("40"), "carol"),
                      Error);
    REQUIRE_THROWS_AS(fx.exchange.remove_liquidity("DATA", "USDC", amt("10"), "alice"), Error);

    PoolInfo after = fx.exchange.pool_info("DATA", "USDC");
    REQUIRE(after.reserve_a == before.reserve_a);
    REQUIRE(after.reserve_b == before.reserve_b);
    REQUIRE(after.total_units == before.total_units);
    REQUIRE(after.version == before.version);
    REQUIRE(fx.exchange.recent_trades(10).empty());
    REQUIRE(fx.exchange.positions("carol").empty());
    REQUIRE(fx.exchange.positions("alice")[0].units == amt("2000"));

    fx.settlement->fail = false;
    REQUIRE(fx.exchange.swap("DATA", "USDC", amt("100"), 0, "bob").amount_out ==
            amt("362.644357552059652632"));
}

TEST_CASE("Unreachable HTTP settlement fails the request", "[settlement]") {
    HttpSettlement settlement("http://127.0.0.1:1/", 500);
    REQUIRE(settlement.base_url() == "http://127.0.0.1:1");

    SettlementRequest request;
    request.pair_id = "DATA/USDC";
    request.account = "bob";
    request.legs = {{"DATA", amt("1")}, {"USDC", -amt("3")}};

    try {
        settlement.settle(request);
        FAIL("expected SettlementFailed");
    } catch (const Error& e) {
        REQUIRE(e.code() == ErrorCode::SettlementFailed);
    }
}

TEST_CASE("Settlement factory", "[settlement]") {
    SettlementConfig config;
    REQUIRE(std::dynamic_pointer_cast<NullSettlement>(make_settlement(config)) != nullptr);

    config.type = "http";
    config.url = "http://settle.internal";
    REQUIRE(std::dynamic_pointer_cast<HttpSettlement>(make_settlement(config)) != nullptr);

    config.type = "carrier-pigeon";
    try {
        make_settlement(config);
        FAIL("expected InvalidConfig");
    } catch (const Error& e) {
        REQUIRE(e.code() == ErrorCode::InvalidConfig);
    }
}
