// DataSwap - Configuration tests

#include <catch2/catch_test_macros.hpp>
#include <dataswap/config.hpp>
#include <dataswap/errors.hpp>

#include <filesystem>
#include <fstream>
#include <functional>

using namespace dataswap;

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

TEST_CASE("Defaults are valid", "[config]") {
    Config config;
    REQUIRE(config.engine.fee_bps == 30);
    REQUIRE(config.engine.ratio_tolerance_bps == 100);
    REQUIRE(config.engine.lock_timeout_ms == 5000);
    REQUIRE(config.store.backend == "memory");
    REQUIRE(config.settlement.type == "null");
    REQUIRE(config.log.level == "info");
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("TOML sections are parsed", "[config]") {
    auto config = Config::from_toml(R"(
# engine tuning
[engine]
fee_bps = 25            # 0.25%
ratio_tolerance_bps = 50
lock_timeout_ms = 250
max_trade_limit = 100

[store]
backend = "sqlite"
path = "/var/lib/dataswap/pools.db"

[settlement]
type = "http"
url = "http://custody.local:8080"
timeout_ms = 3000
api_key = "k#1"

[log]
level = "debug"
pattern = "%v"

[unknown]
ignored = true
)");

    REQUIRE(config.engine.fee_bps == 25);
    REQUIRE(config.engine.ratio_tolerance_bps == 50);
    REQUIRE(config.engine.lock_timeout_ms == 250);
    REQUIRE(config.engine.max_trade_limit == 100);
    REQUIRE(config.store.backend == "sqlite");
    REQUIRE(config.store.path == "/var/lib/dataswap/pools.db");
    REQUIRE(config.settlement.type == "http");
    REQUIRE(config.settlement.url == "http://custody.local:8080");
    REQUIRE(config.settlement.timeout_ms == 3000);
    REQUIRE(config.settlement.api_key == std::optional<std::string>("k#1"));
    REQUIRE(config.log.level == "debug");
    REQUIRE(config.log.pattern == "%v");
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Malformed TOML is rejected", "[config]") {
    REQUIRE(code_of([] { Config::from_toml("[engine\nfee_bps = 1"); }) == ErrorCode::InvalidConfig);
    REQUIRE(code_of([] { Config::from_toml("[engine]\nfee_bps 30"); }) == ErrorCode::InvalidConfig);
    REQUIRE(code_of([] { Config::from_toml("[engine]\nfee_bps = thirty"); }) ==
            ErrorCode::InvalidConfig);
    REQUIRE(code_of([] { Config::from_toml("[engine]\nfee_bps = 10001"); }) ==
            ErrorCode::InvalidConfig);
    REQUIRE(code_of([] { Config::from_file("/nonexistent/dataswap.toml"); }) ==
            ErrorCode::InvalidConfig);
}

TEST_CASE("Validation catches inconsistent settings", "[config]") {
    Config config;

    SECTION("Fee of 100%") {
        config.with_fee_bps(10000);
    }
    SECTION("Non-positive lock timeout") {
        config.with_lock_timeout_ms(0);
    }
    SECTION("Unknown backend") {
        config.store.backend = "redis";
    }
    SECTION("HTTP settlement without url") {
        config.settlement.type = "http";
    }
    SECTION("Unknown log level") {
        config.with_log_level("verbose");
    }
    SECTION("Default limit above max") {
        config.engine.default_trade_limit = 1000;
    }

    REQUIRE(code_of([&] { config.validate(); }) == ErrorCode::InvalidConfig);
}

TEST_CASE("Builder chains", "[config]") {
    Config config;
    config.with_fee_bps(5)
        .with_ratio_tolerance_bps(0)
        .with_sqlite_store(":memory:")
        .with_http_settlement("http://localhost:9000", 1000)
        .with_log_level("warn");

    REQUIRE(config.engine.fee_bps == 5);
    REQUIRE(config.engine.ratio_tolerance_bps == 0);
    REQUIRE(config.store.backend == "sqlite");
    REQUIRE(config.store.path == ":memory:");
    REQUIRE(config.settlement.url == "http://localhost:9000");
    REQUIRE(config.settlement.timeout_ms == 1000);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config loads from a file", "[config]") {
    auto path = std::filesystem::temp_directory_path() / "dataswap-config-test.toml";
    {
        std::ofstream out(path);
        out << "[engine]\nfee_bps = 1\n";
    }
    Config config = Config::from_file(path.string());
    std::filesystem::remove(path);
    REQUIRE(config.engine.fee_bps == 1);
}
