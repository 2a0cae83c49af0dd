#ifndef DATASWAP_POSITIONS_HPP
#define DATASWAP_POSITIONS_HPP

#include "dataswap/types.hpp"

#include <map>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace dataswap {

// =============================================================================
// PositionLedger - which provider owns how many liquidity units
// =============================================================================
//
// Called by LiquidityManager while it holds the pool lock, so per-pool
// check-then-debit sequences are already serialized.

class PositionLedger {
public:
    virtual ~PositionLedger() = default;

    virtual Amount units_of(const PairKey& key, const std::string& provider) const = 0;
    virtual void credit(const PairKey& key, const std::string& provider, Amount units) = 0;
    // Throws Error(InsufficientPosition) when the provider holds fewer units
    virtual void debit(const PairKey& key, const std::string& provider, Amount units) = 0;
    virtual std::vector<LiquidityPosition> positions_of(const std::string& provider) const = 0;
};

class MemoryPositionLedger : public PositionLedger {
public:
    Amount units_of(const PairKey& key, const std::string& provider) const override;
    void credit(const PairKey& key, const std::string& provider, Amount units) override;
    void debit(const PairKey& key, const std::string& provider, Amount units) override;
    std::vector<LiquidityPosition> positions_of(const std::string& provider) const override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::pair<std::string, PairKey>, Amount> units_;  // (provider, pair)
};

} // namespace dataswap

#endif // DATASWAP_POSITIONS_HPP
