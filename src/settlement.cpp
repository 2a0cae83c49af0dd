// =============================================================================
// settlement.cpp - Null and HTTP settlement
// =============================================================================

#include "dataswap/settlement.hpp"
#include "dataswap/errors.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dataswap {

using json = nlohmann::json;

const char* to_string(SettlementKind kind) {
    switch (kind) {
        case SettlementKind::Swap: return "swap";
        case SettlementKind::AddLiquidity: return "add_liquidity";
        case SettlementKind::RemoveLiquidity: return "remove_liquidity";
    }
    return "unknown";
}

// =============================================================================
// NullSettlement
// =============================================================================

std::string NullSettlement::settle(const SettlementRequest& request) {
    uint64_t ref = next_ref_.fetch_add(1, std::memory_order_relaxed);
    return std::string("local-") + to_string(request.kind) + "-" + std::to_string(ref);
}

// =============================================================================
// HttpSettlement
// =============================================================================

HttpSettlement::HttpSettlement(std::string base_url, int timeout_ms,
                               std::optional<std::string> api_key)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms), api_key_(std::move(api_key)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string HttpSettlement::settle(const SettlementRequest& request) {
    json legs = json::array();
    for (const auto& leg : request.legs) {
        legs.push_back({
            {"token", leg.token},
            {"amount", x18::to_string(leg.amount)},
        });
    }
    json body = {
        {"kind", to_string(request.kind)},
        {"pair", request.pair_id},
        {"account", request.account},
        {"legs", legs},
    };

    cpr::Header headers{{"Content-Type", "application/json"}};
    if (api_key_) {
        headers["X-API-KEY"] = *api_key_;
        headers["X-TIMESTAMP"] = std::to_string(now_ms());
    }

    auto response = cpr::Post(
        cpr::Url{base_url_ + "/settle"},
        headers,
        cpr::Body{body.dump()},
        cpr::Timeout{timeout_ms_});

    if (response.status_code == 0) {
        throw Error(ErrorCode::SettlementFailed,
                    "settlement unreachable: " + response.error.message);
    }
    if (response.status_code != 200 && response.status_code != 201) {
        throw Error(ErrorCode::SettlementFailed,
                    "HTTP " + std::to_string(response.status_code) + ": " + response.text);
    }

    try {
        auto reply = json::parse(response.text);
        std::string reference = reply.at("reference").get<std::string>();
        if (reference.empty()) {
            throw Error(ErrorCode::SettlementFailed, "settlement returned an empty reference");
        }
        return reference;
    } catch (const json::exception& e) {
        throw Error(ErrorCode::SettlementFailed,
                    std::string("malformed settlement reply: ") + e.what());
    }
}

std::shared_ptr<Settlement> make_settlement(const SettlementConfig& config) {
    if (config.type == "null") {
        return std::make_shared<NullSettlement>();
    }
    if (config.type == "http") {
        spdlog::info("using http settlement at {}", config.url);
        return std::make_shared<HttpSettlement>(config.url, config.timeout_ms, config.api_key);
    }
    throw Error(ErrorCode::InvalidConfig, "unknown settlement type: " + config.type);
}

} // namespace dataswap
