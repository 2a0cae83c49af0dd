#ifndef DATASWAP_API_HPP
#define DATASWAP_API_HPP

#include "dataswap/exchange.hpp"
#include "dataswap/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace dataswap {

using json = nlohmann::json;

// =============================================================================
// JSON encoding (amounts as decimal strings)
// =============================================================================

void to_json(json& j, const QuoteResult& q);
void to_json(json& j, const Trade& t);
void to_json(json& j, const LiquidityEvent& e);
void to_json(json& j, const LiquidityPosition& p);
void to_json(json& j, const AddLiquidityResult& r);
void to_json(json& j, const RemoveLiquidityResult& r);
void to_json(json& j, const PoolInfo& p);
void to_json(json& j, const MarketStats& s);
void to_json(json& j, const Exchange::Stats& s);

// =============================================================================
// RequestHandler - transport-agnostic request dispatch
// =============================================================================
//
//   request:  {"id": ..., "op": "swap", "params": {...}}
//   success:  {"id": ..., "ok": true,  "result": ...}
//   failure:  {"id": ..., "ok": false,
//              "error": {"code": "...", "message": "...", "retryable": bool}}
//
// Internal failures are reported as "InternalError" without detail.

class RequestHandler {
public:
    explicit RequestHandler(Exchange& exchange);

    json handle(const json& request);

    // Parses one line; malformed JSON yields an InvalidRequest response
    std::string handle_line(const std::string& line);

private:
    json dispatch(const std::string& op, const json& params);

    json quote(const json& params);
    json swap(const json& params);
    json add_liquidity(const json& params);
    json remove_liquidity(const json& params);
    json pool_info(const json& params);
    json recent_trades(const json& params);
    json trades_for_pool(const json& params);
    json trades_for_trader(const json& params);
    json trades_for_token(const json& params);
    json liquidity_value(const json& params);
    json liquidity_history(const json& params);
    json market_stats(const json& params);

    size_t limit_param(const json& params, size_t fallback) const;

    Exchange& exchange_;
};

} // namespace dataswap

#endif // DATASWAP_API_HPP
