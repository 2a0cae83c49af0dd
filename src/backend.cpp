// =============================================================================
// backend.cpp - Trade filtering, in-memory backend, backend factory
// =============================================================================

#include "dataswap/backend.hpp"
#include "dataswap/errors.hpp"
#include "dataswap/math.hpp"
#include "dataswap/sqlite_backend.hpp"

namespace dataswap {

bool TradeFilter::matches(const Trade& t) const {
    if (pair_id && t.pair_id != *pair_id) return false;
    if (trader && t.trader != *trader) return false;
    if (token && t.token_in != *token && t.token_out != *token) return false;
    if (request_id && t.request_id != *request_id) return false;
    if (since && t.timestamp < *since) return false;
    return true;
}

// =============================================================================
// MemoryBackend
// =============================================================================

std::optional<Pool> MemoryBackend::fetch_pool(const std::string& pair_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(pair_id);
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

std::vector<Pool> MemoryBackend::fetch_pools() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Pool> result;
    result.reserve(pools_.size());
    for (const auto& [id, pool] : pools_) {
        result.push_back(pool);
    }
    return result;
}

void MemoryBackend::store_pool(const Pool& pool) {
    std::lock_guard<std::mutex> lock(mutex_);
    pools_[pool.key.id()] = pool;
}

uint64_t MemoryBackend::push_trade(const Trade& trade) {
    trades_.push_back(trade);
    trades_.back().id = trades_.size();
    return trades_.back().id;
}

uint64_t MemoryBackend::push_event(const LiquidityEvent& event) {
    events_.push_back(event);
    events_.back().id = events_.size();
    return events_.back().id;
}

uint64_t MemoryBackend::append_trade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    return push_trade(trade);
}

std::vector<Trade> MemoryBackend::fetch_trades(const TradeFilter& filter, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Trade> result;
    for (auto it = trades_.rbegin(); it != trades_.rend() && result.size() < limit; ++it) {
        if (filter.matches(*it)) result.push_back(*it);
    }
    return result;
}

MarketStats MemoryBackend::trade_stats(int64_t since) {
    std::lock_guard<std::mutex> lock(mutex_);
    MarketStats stats;
    stats.total_trades = trades_.size();

    std::map<std::string, Amount> volume;
    for (auto it = trades_.rbegin(); it != trades_.rend(); ++it) {
        if (it->timestamp < since) continue;
        ++stats.window_trades;
        Amount& v = volume[it->token_in];
        v = math::saturating_add(v, it->amount_in);
    }
    stats.volume_by_token.assign(volume.begin(), volume.end());
    return stats;
}

std::vector<LiquidityEvent> MemoryBackend::fetch_liquidity_events(const std::string& provider,
                                                                  size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LiquidityEvent> result;
    for (auto it = events_.rbegin(); it != events_.rend() && result.size() < limit; ++it) {
        if (provider.empty() || it->provider == provider) result.push_back(*it);
    }
    return result;
}

// =============================================================================
// Factory
// =============================================================================

// One lock covers both writes
uint64_t MemoryBackend::commit_trade(const Pool& pool, const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    pools_[pool.key.id()] = pool;
    return push_trade(trade);
}

uint64_t MemoryBackend::commit_liquidity_event(const Pool& pool, const LiquidityEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    pools_[pool.key.id()] = pool;
    return push_event(event);
}

std::shared_ptr<Backend> make_backend(const StoreConfig& config) {
    if (config.backend == "memory") {
        return std::make_shared<MemoryBackend>();
    }
    if (config.backend == "sqlite") {
        return std::make_shared<SqliteBackend>(config.path);
    }
    throw Error(ErrorCode::InvalidConfig, "unknown store backend: " + config.backend);
}

} // namespace dataswap
