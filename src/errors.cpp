#include "dataswap/errors.hpp"

namespace dataswap {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InsufficientLiquidity:  return "InsufficientLiquidity";
        case ErrorCode::SlippageExceeded:       return "SlippageExceeded";
        case ErrorCode::InvalidLiquidityAmount: return "InvalidLiquidityAmount";
        case ErrorCode::InsufficientAmount:     return "InsufficientAmount";
        case ErrorCode::InsufficientPosition:   return "InsufficientPosition";
        case ErrorCode::PoolNotFound:           return "PoolNotFound";
        case ErrorCode::InvariantViolation:     return "InvariantViolation";
        case ErrorCode::InvalidPair:            return "InvalidPair";
        case ErrorCode::InvalidAmount:          return "InvalidAmount";
        case ErrorCode::InvalidFee:             return "InvalidFee";
        case ErrorCode::LockTimeout:            return "LockTimeout";
        case ErrorCode::SettlementFailed:       return "SettlementFailed";
        case ErrorCode::StorageError:           return "StorageError";
        case ErrorCode::InvalidConfig:          return "InvalidConfig";
        case ErrorCode::InvalidRequest:         return "InvalidRequest";
    }
    return "Unknown";
}

bool is_user_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvariantViolation:
        case ErrorCode::StorageError:
        case ErrorCode::InvalidConfig:
            return false;
        default:
            return true;
    }
}

bool is_retryable(ErrorCode code) {
    return code == ErrorCode::LockTimeout ||
           code == ErrorCode::SlippageExceeded ||
           code == ErrorCode::SettlementFailed;
}

} // namespace dataswap
