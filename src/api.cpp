// =============================================================================
// api.cpp - JSON request dispatch
// =============================================================================

#include "dataswap/api.hpp"
#include "dataswap/errors.hpp"
#include "dataswap/pricing.hpp"

#include <spdlog/spdlog.h>

namespace dataswap {

namespace {

std::string amount_str(Amount v) { return x18::to_string(v); }

const json& require(const json& params, const char* name) {
    if (!params.is_object() || !params.contains(name) || params.at(name).is_null()) {
        throw Error(ErrorCode::InvalidRequest, std::string("missing parameter '") + name + "'");
    }
    return params.at(name);
}

std::string string_param(const json& params, const char* name) {
    const json& v = require(params, name);
    if (!v.is_string()) {
        throw Error(ErrorCode::InvalidRequest, std::string("parameter '") + name + "' must be a string");
    }
    return v.get<std::string>();
}

// Decimal strings, or JSON integers; floats are refused
Amount amount_param(const json& params, const char* name) {
    const json& v = require(params, name);
    if (v.is_string()) return x18::from_string(v.get<std::string>());
    if (v.is_number_unsigned()) return x18::from_string(std::to_string(v.get<uint64_t>()));
    if (v.is_number_integer()) {
        throw Error(ErrorCode::InvalidAmount, std::string("parameter '") + name + "' is negative");
    }
    throw Error(ErrorCode::InvalidAmount,
                std::string("parameter '") + name + "' must be a decimal string");
}

uint32_t bps_param(const json& params, const char* name) {
    const json& v = require(params, name);
    if (!v.is_number_unsigned() || v.get<uint64_t>() > BPS_DENOMINATOR) {
        throw Error(ErrorCode::InvalidRequest,
                    std::string("parameter '") + name + "' must be an integer in 0..10000");
    }
    return static_cast<uint32_t>(v.get<uint64_t>());
}

json error_body(const std::string& code, const std::string& message, bool retryable = false) {
    return json{{"code", code}, {"message", message}, {"retryable", retryable}};
}

} // anonymous namespace

// =============================================================================
// Encoding
// =============================================================================

void to_json(json& j, const QuoteResult& q) {
    j = json{
        {"tokenIn", q.token_in},
        {"tokenOut", q.token_out},
        {"amountIn", amount_str(q.amount_in)},
        {"amountOut", amount_str(q.amount_out)},
        {"fee", amount_str(q.fee)},
        {"priceImpactPct", amount_str(q.price_impact_pct)},
        {"executionPrice", amount_str(q.execution_price)},
        {"reserveIn", amount_str(q.reserve_in)},
        {"reserveOut", amount_str(q.reserve_out)},
        {"poolVersion", q.pool_version},
    };
}

void to_json(json& j, const Trade& t) {
    j = json{
        {"id", t.id},
        {"pair", t.pair_id},
        {"tokenIn", t.token_in},
        {"tokenOut", t.token_out},
        {"amountIn", amount_str(t.amount_in)},
        {"amountOut", amount_str(t.amount_out)},
        {"fee", amount_str(t.fee)},
        {"price", amount_str(t.price)},
        {"priceImpactPct", amount_str(t.price_impact_pct)},
        {"trader", t.trader},
        {"settlementRef", t.settlement_ref},
        {"executedAt", t.timestamp},
    };
    if (!t.request_id.empty()) j["requestId"] = t.request_id;
}

void to_json(json& j, const LiquidityEvent& e) {
    j = json{
        {"id", e.id},
        {"pair", e.pair_id},
        {"action", to_string(e.action)},
        {"provider", e.provider},
        {"amountA", amount_str(e.amount_a)},
        {"amountB", amount_str(e.amount_b)},
        {"units", amount_str(e.units)},
        {"settlementRef", e.settlement_ref},
        {"timestamp", e.timestamp},
    };
}

void to_json(json& j, const LiquidityPosition& p) {
    j = json{
        {"pair", p.key.id()},
        {"tokenA", p.key.token_a},
        {"tokenB", p.key.token_b},
        {"provider", p.provider},
        {"units", amount_str(p.units)},
    };
}

void to_json(json& j, const AddLiquidityResult& r) {
    j = json{
        {"pair", r.pair_id},
        {"mintedUnits", amount_str(r.minted_units)},
        {"consumedA", amount_str(r.consumed_a)},
        {"consumedB", amount_str(r.consumed_b)},
        {"refundA", amount_str(r.refund_a)},
        {"refundB", amount_str(r.refund_b)},
        {"positionUnits", amount_str(r.position_units)},
        {"settlementRef", r.settlement_ref},
    };
}

void to_json(json& j, const RemoveLiquidityResult& r) {
    j = json{
        {"pair", r.pair_id},
        {"amountA", amount_str(r.amount_a)},
        {"amountB", amount_str(r.amount_b)},
        {"burnedUnits", amount_str(r.burned_units)},
        {"positionUnits", amount_str(r.position_units)},
        {"settlementRef", r.settlement_ref},
    };
}

void to_json(json& j, const PoolInfo& p) {
    j = json{
        {"pair", p.pair_id},
        {"tokenA", p.token_a},
        {"tokenB", p.token_b},
        {"reserveA", amount_str(p.reserve_a)},
        {"reserveB", amount_str(p.reserve_b)},
        {"totalLiquidityUnits", amount_str(p.total_units)},
        {"price", amount_str(p.price)},
        {"version", p.version},
        {"updatedAt", p.updated_at},
    };
}

void to_json(json& j, const MarketStats& s) {
    json volume = json::object();
    for (const auto& [token, amount] : s.volume_by_token) {
        volume[token] = amount_str(amount);
    }
    j = json{
        {"totalTrades", s.total_trades},
        {"windowTrades", s.window_trades},
        {"windowMs", s.window_ms},
        {"volumeByToken", volume},
        {"totalPools", s.total_pools},
    };
}

void to_json(json& j, const Exchange::Stats& s) {
    j = json{
        {"totalPools", s.total_pools},
        {"totalSwaps", s.total_swaps},
        {"slippageRejections", s.slippage_rejections},
        {"replayedSwaps", s.replayed_swaps},
        {"liquidityDeposits", s.liquidity_deposits},
        {"liquidityWithdrawals", s.liquidity_withdrawals},
        {"abortedMutations", s.aborted_mutations},
        {"lockTimeouts", s.lock_timeouts},
    };
}

// =============================================================================
// RequestHandler
// =============================================================================

RequestHandler::RequestHandler(Exchange& exchange) : exchange_(exchange) {}

json RequestHandler::handle(const json& request) {
    json response;
    response["id"] = request.is_object() && request.contains("id") ? request["id"] : json(nullptr);

    try {
        if (!request.is_object()) {
            throw Error(ErrorCode::InvalidRequest, "request must be a JSON object");
        }
        std::string op = string_param(request, "op");
        json params = request.contains("params") ? request["params"] : json::object();
        if (!params.is_object()) {
            throw Error(ErrorCode::InvalidRequest, "params must be an object");
        }
        response["result"] = dispatch(op, params);
        response["ok"] = true;
    } catch (const Error& e) {
        response["ok"] = false;
        if (is_user_error(e.code())) {
            response["error"] = error_body(to_string(e.code()), e.what(), is_retryable(e.code()));
        } else {
            spdlog::error("request failed: {}: {}", to_string(e.code()), e.what());
            response["error"] = error_body("InternalError", "internal error");
        }
    } catch (const json::exception& e) {
        response["ok"] = false;
        response["error"] = error_body(to_string(ErrorCode::InvalidRequest), e.what());
    } catch (const std::exception& e) {
        spdlog::error("request failed: {}", e.what());
        response["ok"] = false;
        response["error"] = error_body("InternalError", "internal error");
    }
    return response;
}

std::string RequestHandler::handle_line(const std::string& line) {
    json request;
    try {
        request = json::parse(line);
    } catch (const json::parse_error& e) {
        json response = {
            {"id", nullptr},
            {"ok", false},
            {"error", error_body(to_string(ErrorCode::InvalidRequest),
                                 std::string("malformed JSON: ") + e.what())},
        };
        return response.dump();
    }
    return handle(request).dump();
}

json RequestHandler::dispatch(const std::string& op, const json& params) {
    if (op == "quote") return quote(params);
    if (op == "swap") return swap(params);
    if (op == "addLiquidity") return add_liquidity(params);
    if (op == "removeLiquidity") return remove_liquidity(params);
    if (op == "poolInfo") return pool_info(params);
    if (op == "listPools") return exchange_.list_pools();
    if (op == "recentTrades") return recent_trades(params);
    if (op == "tradesForPool") return trades_for_pool(params);
    if (op == "tradesForTrader") return trades_for_trader(params);
    if (op == "tradesForToken") return trades_for_token(params);
    if (op == "positions") return exchange_.positions(string_param(params, "provider"));
    if (op == "liquidityValue") return liquidity_value(params);
    if (op == "liquidityHistory") return liquidity_history(params);
    if (op == "marketStats") return market_stats(params);
    if (op == "stats") return exchange_.get_stats();
    throw Error(ErrorCode::InvalidRequest, "unknown op: " + op);
}

size_t RequestHandler::limit_param(const json& params, size_t fallback) const {
    if (!params.contains("limit")) return fallback;
    const json& v = params.at("limit");
    if (!v.is_number_unsigned() || v.get<uint64_t>() == 0) {
        throw Error(ErrorCode::InvalidRequest, "limit must be a positive integer");
    }
    return static_cast<size_t>(v.get<uint64_t>());
}

// =============================================================================
// Operations
// =============================================================================

json RequestHandler::quote(const json& params) {
    return exchange_.quote(string_param(params, "tokenIn"), string_param(params, "tokenOut"),
                           amount_param(params, "amountIn"));
}

json RequestHandler::swap(const json& params) {
    SwapRequest request;
    request.token_in = string_param(params, "tokenIn");
    request.token_out = string_param(params, "tokenOut");
    request.amount_in = amount_param(params, "amountIn");
    request.trader = string_param(params, "trader");
    if (params.contains("requestId")) request.request_id = string_param(params, "requestId");

    if (params.contains("minAmountOut")) {
        request.min_amount_out = amount_param(params, "minAmountOut");
    } else if (params.contains("quotedAmountOut") && params.contains("slippageBps")) {
        uint32_t slippage = bps_param(params, "slippageBps");
        if (slippage > exchange_.config().engine.max_slippage_bps) {
            throw Error(ErrorCode::InvalidRequest,
                        "slippageBps exceeds " +
                        std::to_string(exchange_.config().engine.max_slippage_bps));
        }
        request.min_amount_out =
            pricing::min_amount_out(amount_param(params, "quotedAmountOut"), slippage);
    } else {
        throw Error(ErrorCode::InvalidRequest,
                    "swap needs minAmountOut or quotedAmountOut with slippageBps");
    }
    return exchange_.swap(request);
}

json RequestHandler::add_liquidity(const json& params) {
    return exchange_.add_liquidity(string_param(params, "tokenA"), string_param(params, "tokenB"),
                                   amount_param(params, "amountA"), amount_param(params, "amountB"),
                                   string_param(params, "provider"));
}

json RequestHandler::remove_liquidity(const json& params) {
    return exchange_.remove_liquidity(string_param(params, "tokenA"), string_param(params, "tokenB"),
                                      amount_param(params, "units"),
                                      string_param(params, "provider"));
}

json RequestHandler::pool_info(const json& params) {
    return exchange_.pool_info(string_param(params, "tokenA"), string_param(params, "tokenB"));
}

json RequestHandler::recent_trades(const json& params) {
    return exchange_.recent_trades(
        limit_param(params, exchange_.config().engine.default_trade_limit));
}

json RequestHandler::trades_for_pool(const json& params) {
    return exchange_.trades_for_pool(string_param(params, "tokenA"), string_param(params, "tokenB"),
                                     limit_param(params, TradeLedger::DEFAULT_QUERY_LIMIT));
}

json RequestHandler::trades_for_trader(const json& params) {
    return exchange_.trades_for_trader(string_param(params, "trader"),
                                       limit_param(params, TradeLedger::DEFAULT_QUERY_LIMIT));
}

json RequestHandler::trades_for_token(const json& params) {
    return exchange_.trades_for_token(string_param(params, "token"),
                                      limit_param(params, TradeLedger::DEFAULT_QUERY_LIMIT));
}

json RequestHandler::liquidity_value(const json& params) {
    RemovalQuote q = exchange_.liquidity_value(string_param(params, "tokenA"),
                                               string_param(params, "tokenB"),
                                               amount_param(params, "units"));
    return json{{"amountA", amount_str(q.amount_a)}, {"amountB", amount_str(q.amount_b)}};
}

json RequestHandler::liquidity_history(const json& params) {
    return exchange_.liquidity_history(string_param(params, "provider"),
                                       limit_param(params, TradeLedger::DEFAULT_QUERY_LIMIT));
}

json RequestHandler::market_stats(const json& params) {
    int64_t hours = 24;
    if (params.contains("windowHours")) {
        const json& v = params.at("windowHours");
        if (!v.is_number_unsigned() || v.get<uint64_t>() == 0 || v.get<uint64_t>() > 24 * 365) {
            throw Error(ErrorCode::InvalidRequest, "windowHours must be in 1..8760");
        }
        hours = static_cast<int64_t>(v.get<uint64_t>());
    }
    return exchange_.market_stats(hours * 60 * 60 * 1000);
}

} // namespace dataswap
