// =============================================================================
// trade_ledger.cpp - Trade and liquidity history
// =============================================================================

#include "dataswap/trade_ledger.hpp"
#include "dataswap/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace dataswap {

TradeLedger::TradeLedger(std::shared_ptr<Backend> backend, size_t max_limit)
    : backend_(std::move(backend)), max_limit_(max_limit), listener_(&null_listener_) {
    if (!backend_) {
        throw Error(ErrorCode::InvalidConfig, "trade ledger requires a backend");
    }
}

size_t TradeLedger::clamp(size_t limit) const {
    return std::min(limit, max_limit_);
}

void TradeLedger::set_listener(TradeListener* listener) {
    listener_.store(listener ? listener : &null_listener_);
}

// =============================================================================
// Append
// =============================================================================

Trade TradeLedger::record(const Trade& trade) {
    Trade stored = trade;
    if (stored.timestamp == 0) stored.timestamp = now_ms();
    stored.id = backend_->append_trade(stored);
    publish(stored);
    return stored;
}

Trade TradeLedger::commit(const Pool& pool, const Trade& trade) {
    Trade stored = trade;
    if (stored.timestamp == 0) stored.timestamp = pool.updated_at;
    stored.id = backend_->commit_trade(pool, stored);
    return stored;
}

LiquidityEvent TradeLedger::commit(const Pool& pool, const LiquidityEvent& event) {
    LiquidityEvent stored = event;
    if (stored.timestamp == 0) stored.timestamp = pool.updated_at;
    stored.id = backend_->commit_liquidity_event(pool, stored);
    return stored;
}

void TradeLedger::publish(const Trade& trade) {
    spdlog::debug("recorded trade #{} {} {} -> {} {}", trade.id,
                  x18::to_string(trade.amount_in), trade.token_in,
                  x18::to_string(trade.amount_out), trade.token_out);
    listener_.load()->on_trade(trade);
}

void TradeLedger::publish(const LiquidityEvent& event) {
    listener_.load()->on_liquidity(event);
}

// =============================================================================
// Queries
// =============================================================================

std::vector<Trade> TradeLedger::recent_trades(size_t limit) const {
    return backend_->fetch_trades(TradeFilter{}, clamp(limit));
}

std::vector<Trade> TradeLedger::trades_for_pool(const PairKey& key, size_t limit) const {
    TradeFilter filter;
    filter.pair_id = key.id();
    return backend_->fetch_trades(filter, clamp(limit));
}

std::vector<Trade> TradeLedger::trades_for_trader(const std::string& trader, size_t limit) const {
    TradeFilter filter;
    filter.trader = trader;
    return backend_->fetch_trades(filter, clamp(limit));
}

std::vector<Trade> TradeLedger::trades_for_token(const std::string& token, size_t limit) const {
    TradeFilter filter;
    filter.token = token;
    return backend_->fetch_trades(filter, clamp(limit));
}

std::optional<Trade> TradeLedger::find_trade(const PairKey& key, const std::string& trader,
                                             const std::string& request_id) const {
    if (request_id.empty()) return std::nullopt;
    TradeFilter filter;
    filter.pair_id = key.id();
    filter.trader = trader;
    filter.request_id = request_id;
    auto found = backend_->fetch_trades(filter, 1);
    if (found.empty()) return std::nullopt;
    return found.front();
}

std::vector<LiquidityEvent> TradeLedger::liquidity_history(const std::string& provider,
                                                           size_t limit) const {
    return backend_->fetch_liquidity_events(provider, clamp(limit));
}

MarketStats TradeLedger::market_stats(int64_t window_ms) const {
    MarketStats stats = backend_->trade_stats(now_ms() - window_ms);
    stats.window_ms = window_ms;
    return stats;
}

} // namespace dataswap
