#ifndef DATASWAP_SETTLEMENT_HPP
#define DATASWAP_SETTLEMENT_HPP

#include "dataswap/config.hpp"
#include "dataswap/types.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dataswap {

// =============================================================================
// Settlement - moves value for a computed pool mutation
// =============================================================================
//
// The engine decides what moves; custody is the settlement layer's concern.
// settle() runs under the pool lock, before the new state is persisted. Any
// failure must be reported as Error(SettlementFailed) and aborts the mutation.

enum class SettlementKind : uint8_t {
    Swap = 0,
    AddLiquidity = 1,
    RemoveLiquidity = 2,
};

const char* to_string(SettlementKind kind);

struct TransferLeg {
    std::string token;
    Amount amount;  // > 0: account pays the pool; < 0: pool pays the account
};

struct SettlementRequest {
    SettlementKind kind = SettlementKind::Swap;
    std::string pair_id;
    std::string account;
    std::vector<TransferLeg> legs;
};

class Settlement {
public:
    virtual ~Settlement() = default;

    // Returns the settlement reference recorded with the trade or event
    virtual std::string settle(const SettlementRequest& request) = 0;
};

// In-process settlement: accepts everything, issues sequential references
class NullSettlement : public Settlement {
public:
    std::string settle(const SettlementRequest& request) override;

private:
    std::atomic<uint64_t> next_ref_{1};
};

// POSTs each request as JSON to <base_url>/settle and expects
// {"reference": "..."} back.
class HttpSettlement : public Settlement {
public:
    HttpSettlement(std::string base_url, int timeout_ms,
                   std::optional<std::string> api_key = std::nullopt);

    std::string settle(const SettlementRequest& request) override;

    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
    int timeout_ms_;
    std::optional<std::string> api_key_;
};

// Select by SettlementConfig::type ("null" or "http")
std::shared_ptr<Settlement> make_settlement(const SettlementConfig& config);

} // namespace dataswap

#endif // DATASWAP_SETTLEMENT_HPP
