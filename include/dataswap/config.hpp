#ifndef DATASWAP_CONFIG_HPP
#define DATASWAP_CONFIG_HPP

#include "dataswap/pricing.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dataswap {

// =============================================================================
// Configuration
// =============================================================================

struct EngineConfig {
    uint32_t fee_bps = pricing::DEFAULT_FEE_BPS;
    uint32_t ratio_tolerance_bps = pricing::DEFAULT_RATIO_TOLERANCE_BPS;
    int lock_timeout_ms = 5000;
    uint32_t max_slippage_bps = pricing::MAX_SLIPPAGE_BPS;
    size_t default_trade_limit = 20;
    size_t max_trade_limit = 500;
};

struct StoreConfig {
    std::string backend = "memory";  // "memory" or "sqlite"
    std::string path = "dataswap.db";
};

struct SettlementConfig {
    std::string type = "null";       // "null" or "http"
    std::string url;
    int timeout_ms = 10000;
    std::optional<std::string> api_key;
};

struct LogConfig {
    std::string level = "info";
    std::string pattern;             // Empty keeps the spdlog default
};

class Config {
public:
    EngineConfig engine;
    StoreConfig store;
    SettlementConfig settlement;
    LogConfig log;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Throws Error(InvalidConfig) on out-of-range values
    void validate() const;

    // Builder methods
    Config& with_fee_bps(uint32_t bps) {
        engine.fee_bps = bps;
        return *this;
    }

    Config& with_ratio_tolerance_bps(uint32_t bps) {
        engine.ratio_tolerance_bps = bps;
        return *this;
    }

    Config& with_lock_timeout_ms(int ms) {
        engine.lock_timeout_ms = ms;
        return *this;
    }

    Config& with_sqlite_store(std::string_view path) {
        store.backend = "sqlite";
        store.path = std::string(path);
        return *this;
    }

    Config& with_http_settlement(std::string_view url, int timeout_ms = 10000) {
        settlement.type = "http";
        settlement.url = std::string(url);
        settlement.timeout_ms = timeout_ms;
        return *this;
    }

    Config& with_log_level(std::string_view level) {
        log.level = std::string(level);
        return *this;
    }
};

} // namespace dataswap

#endif // DATASWAP_CONFIG_HPP
