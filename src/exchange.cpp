// =============================================================================
// exchange.cpp - Wiring and read-side views
// =============================================================================

#include "dataswap/exchange.hpp"
#include "dataswap/errors.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <limits>

namespace dataswap {

namespace {

PoolInfo to_info(const Pool& pool, const std::string& token_a) {
    bool swapped = token_a != pool.key.token_a;
    PoolInfo info;
    info.pair_id = pool.key.id();
    info.token_a = swapped ? pool.key.token_b : pool.key.token_a;
    info.token_b = swapped ? pool.key.token_a : pool.key.token_b;
    info.reserve_a = swapped ? pool.reserve_b : pool.reserve_a;
    info.reserve_b = swapped ? pool.reserve_a : pool.reserve_b;
    info.total_units = pool.total_units;
    if (info.reserve_a > 0 && info.reserve_b > 0) {
        Pool oriented = pool;
        oriented.reserve_a = info.reserve_a;
        oriented.reserve_b = info.reserve_b;
        info.price = oriented.price_a_in_b();
    }
    info.version = pool.version;
    info.updated_at = pool.updated_at;
    return info;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Exchange::Exchange(const Config& config)
    : Exchange(config, make_backend(config.store), make_settlement(config.settlement),
               std::make_shared<MemoryPositionLedger>()) {
    restore_positions();
}

Exchange::Exchange(const Config& config,
                   std::shared_ptr<Backend> backend,
                   std::shared_ptr<Settlement> settlement,
                   std::shared_ptr<PositionLedger> positions)
    : config_(config),
      backend_(std::move(backend)),
      settlement_(std::move(settlement)),
      positions_(std::move(positions)) {
    config_.validate();
    if (!backend_ || !settlement_ || !positions_) {
        throw Error(ErrorCode::InvalidConfig, "exchange requires backend, settlement and positions");
    }

    store_ = std::make_unique<PoolStore>(
        backend_, std::chrono::milliseconds(config_.engine.lock_timeout_ms));
    ledger_ = std::make_unique<TradeLedger>(backend_, config_.engine.max_trade_limit);
    swaps_ = std::make_unique<SwapExecutor>(*store_, *ledger_, *settlement_,
                                            config_.engine.fee_bps);
    liquidity_ = std::make_unique<LiquidityManager>(*store_, *positions_, *ledger_, *settlement_,
                                                    config_.engine.ratio_tolerance_bps);

    spdlog::info("exchange ready: fee {} bps, ratio tolerance {} bps, store {}",
                 config_.engine.fee_bps, config_.engine.ratio_tolerance_bps, backend_->name());
}

Exchange::~Exchange() = default;

// Positions live in memory; rebuild them from the durable event history
void Exchange::restore_positions() {
    auto events = backend_->fetch_liquidity_events("", std::numeric_limits<size_t>::max() / 2);
    for (auto it = events.rbegin(); it != events.rend(); ++it) {
        PairKey key = PairKey::of(it->pair_id.substr(0, it->pair_id.find('/')),
                                  it->pair_id.substr(it->pair_id.find('/') + 1));
        if (it->action == LiquidityAction::Add) {
            positions_->credit(key, it->provider, it->units);
        } else {
            positions_->debit(key, it->provider, it->units);
        }
    }
    if (!events.empty()) {
        spdlog::info("restored positions from {} liquidity events", events.size());
    }
}

// =============================================================================
// Operations
// =============================================================================

QuoteResult Exchange::quote(const std::string& token_in, const std::string& token_out,
                            Amount amount_in) const {
    return swaps_->get_quote(token_in, token_out, amount_in);
}

Trade Exchange::swap(const SwapRequest& request) {
    return swaps_->execute_swap(request);
}

Trade Exchange::swap(const std::string& token_in, const std::string& token_out,
                     Amount amount_in, Amount min_amount_out, const std::string& trader) {
    return swaps_->execute_swap(token_in, token_out, amount_in, min_amount_out, trader);
}

AddLiquidityResult Exchange::add_liquidity(const std::string& token_a, const std::string& token_b,
                                           Amount amount_a, Amount amount_b,
                                           const std::string& provider) {
    return liquidity_->add_liquidity(token_a, token_b, amount_a, amount_b, provider);
}

RemoveLiquidityResult Exchange::remove_liquidity(const std::string& token_a,
                                                 const std::string& token_b,
                                                 Amount units, const std::string& provider) {
    return liquidity_->remove_liquidity(token_a, token_b, units, provider);
}

RemovalQuote Exchange::liquidity_value(const std::string& token_a, const std::string& token_b,
                                       Amount units) const {
    return liquidity_->liquidity_value(token_a, token_b, units);
}

std::vector<LiquidityPosition> Exchange::positions(const std::string& provider) const {
    return positions_->positions_of(provider);
}

std::vector<LiquidityEvent> Exchange::liquidity_history(const std::string& provider,
                                                        size_t limit) const {
    return ledger_->liquidity_history(provider, limit);
}

// =============================================================================
// Queries
// =============================================================================

PoolInfo Exchange::pool_info(const std::string& token_a, const std::string& token_b) const {
    PairKey key = PairKey::of(token_a, token_b);
    return to_info(store_->get_pool(key), token_a);
}

std::vector<PoolInfo> Exchange::list_pools() const {
    std::vector<PoolInfo> result;
    for (const auto& pool : store_->list_pools()) {
        result.push_back(to_info(pool, pool.key.token_a));
    }
    return result;
}

std::vector<Trade> Exchange::recent_trades(size_t limit) const {
    return ledger_->recent_trades(limit);
}

std::vector<Trade> Exchange::trades_for_pool(const std::string& token_a,
                                             const std::string& token_b, size_t limit) const {
    return ledger_->trades_for_pool(PairKey::of(token_a, token_b), limit);
}

std::vector<Trade> Exchange::trades_for_trader(const std::string& trader, size_t limit) const {
    return ledger_->trades_for_trader(trader, limit);
}

std::vector<Trade> Exchange::trades_for_token(const std::string& token, size_t limit) const {
    return ledger_->trades_for_token(token, limit);
}

MarketStats Exchange::market_stats(int64_t window_ms) const {
    MarketStats stats = ledger_->market_stats(window_ms);
    stats.total_pools = store_->pool_count();
    return stats;
}

void Exchange::set_trade_listener(TradeListener* listener) {
    ledger_->set_listener(listener);
}

Exchange::Stats Exchange::get_stats() const {
    auto store = store_->get_stats();
    auto swaps = swaps_->get_stats();
    auto liquidity = liquidity_->get_stats();
    return Stats{
        store_->pool_count(),
        swaps.executed,
        swaps.slippage_rejections,
        swaps.replays,
        liquidity.deposits,
        liquidity.withdrawals,
        store.aborted,
        store.lock_timeouts,
    };
}

} // namespace dataswap
