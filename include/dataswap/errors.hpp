#ifndef DATASWAP_ERRORS_HPP
#define DATASWAP_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dataswap {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    InsufficientLiquidity  = -1,
    SlippageExceeded       = -2,
    InvalidLiquidityAmount = -3,
    InsufficientAmount     = -4,
    InsufficientPosition   = -5,
    PoolNotFound           = -6,
    InvariantViolation     = -7,
    InvalidPair            = -8,
    InvalidAmount          = -9,
    InvalidFee             = -10,
    LockTimeout            = -11,
    SettlementFailed       = -12,
    StorageError           = -13,
    InvalidConfig          = -14,
    InvalidRequest         = -15,
};

const char* to_string(ErrorCode code);

// Errors caused by the request itself, safe to report verbatim to callers.
bool is_user_error(ErrorCode code);

// Retrying the same request later may succeed.
bool is_retryable(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace dataswap

#endif // DATASWAP_ERRORS_HPP
