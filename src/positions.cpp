#include "dataswap/positions.hpp"
#include "dataswap/errors.hpp"

#include <mutex>

namespace dataswap {

Amount MemoryPositionLedger::units_of(const PairKey& key, const std::string& provider) const {
    std::shared_lock lock(mutex_);
    auto it = units_.find({provider, key});
    return it == units_.end() ? 0 : it->second;
}

void MemoryPositionLedger::credit(const PairKey& key, const std::string& provider, Amount units) {
    if (units <= 0) {
        throw Error(ErrorCode::InvalidLiquidityAmount, "credit must be positive");
    }
    std::unique_lock lock(mutex_);
    units_[{provider, key}] += units;
}

void MemoryPositionLedger::debit(const PairKey& key, const std::string& provider, Amount units) {
    if (units <= 0) {
        throw Error(ErrorCode::InvalidLiquidityAmount, "debit must be positive");
    }
    std::unique_lock lock(mutex_);
    auto it = units_.find({provider, key});
    Amount held = it == units_.end() ? 0 : it->second;
    if (held < units) {
        throw Error(ErrorCode::InsufficientPosition,
                    provider + " holds " + x18::to_string(held) + " units of " + key.id() +
                    ", requested " + x18::to_string(units));
    }
    it->second -= units;
    if (it->second == 0) units_.erase(it);
}

std::vector<LiquidityPosition> MemoryPositionLedger::positions_of(const std::string& provider) const {
    std::shared_lock lock(mutex_);
    std::vector<LiquidityPosition> result;
    for (auto it = units_.lower_bound({provider, PairKey{}});
         it != units_.end() && it->first.first == provider; ++it) {
        result.push_back(LiquidityPosition{it->first.second, provider, it->second});
    }
    return result;
}

} // namespace dataswap
