// =============================================================================
// error.cpp - Error names and taxonomy
// =============================================================================

#include "clamm/error.hpp"

namespace clamm {

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::POOL_NOT_INITIALIZED: return "POOL_NOT_INITIALIZED";
        case errors::POOL_ALREADY_INITIALIZED: return "POOL_ALREADY_INITIALIZED";
        case errors::INVALID_TICK_RANGE: return "INVALID_TICK_RANGE";
        case errors::INVALID_TICK: return "INVALID_TICK";
        case errors::INVALID_SQRT_RATIO: return "INVALID_SQRT_RATIO";
        case errors::INVALID_SQRT_RATIO_LIMIT: return "INVALID_SQRT_RATIO_LIMIT";
        case errors::SQRT_RATIO_LIMIT_WRONG_DIRECTION: return "SQRT_RATIO_LIMIT_WRONG_DIRECTION";
        case errors::TOKENS_MUST_BE_SORTED: return "TOKENS_MUST_BE_SORTED";
        case errors::INVALID_TICK_SPACING: return "INVALID_TICK_SPACING";
        case errors::EXTENSION_NOT_REGISTERED: return "EXTENSION_NOT_REGISTERED";
        case errors::EXTENSION_ALREADY_REGISTERED: return "EXTENSION_ALREADY_REGISTERED";
        case errors::INVALID_EXTENSION: return "INVALID_EXTENSION";
        case errors::AMOUNT_OVERFLOW: return "AMOUNT_OVERFLOW";
        case errors::DELTA_OVERFLOW: return "DELTA_OVERFLOW";
        case errors::MAX_LIQUIDITY_PER_TICK_EXCEEDED: return "MAX_LIQUIDITY_PER_TICK_EXCEEDED";
        case errors::AMOUNT_BEFORE_FEE_OVERFLOW: return "AMOUNT_BEFORE_FEE_OVERFLOW";
        case errors::LIQUIDITY_OVERFLOW: return "LIQUIDITY_OVERFLOW";
        case errors::FEES_OVERFLOW: return "FEES_OVERFLOW";
        case errors::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case errors::DIVISION_BY_ZERO: return "DIVISION_BY_ZERO";
        case errors::DEBTS_NOT_ZEROED: return "DEBTS_NOT_ZEROED";
        case errors::MUST_COLLECT_FEES_BEFORE_WITHDRAWING_ALL_LIQUIDITY:
            return "MUST_COLLECT_FEES_BEFORE_WITHDRAWING_ALL_LIQUIDITY";
        case errors::SAVED_BALANCE_OVERFLOW: return "SAVED_BALANCE_OVERFLOW";
        case errors::INSUFFICIENT_SAVED_BALANCE: return "INSUFFICIENT_SAVED_BALANCE";
        case errors::INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case errors::OPERATION_ABORTED: return "OPERATION_ABORTED";
        case errors::LOCK_DEPTH_EXCEEDED: return "LOCK_DEPTH_EXCEEDED";
        case errors::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case errors::NOT_LOCKED: return "NOT_LOCKED";
        case errors::UNAUTHORIZED: return "UNAUTHORIZED";
        case errors::INSUFFICIENT_ALLOWANCE: return "INSUFFICIENT_ALLOWANCE";
        default: return "UNKNOWN_ERROR";
    }
}

// Codes are grouped by range: -1..-19 validation, -20..-29 arithmetic,
// -30..-39 invariant, -40 and below access
ErrorKind error_kind(int32_t code) {
    if (code <= -40) return ErrorKind::Access;
    if (code <= -30) return ErrorKind::Invariant;
    if (code <= -20) return ErrorKind::Arithmetic;
    return ErrorKind::Validation;
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Arithmetic: return "arithmetic";
        case ErrorKind::Invariant: return "invariant";
        case ErrorKind::Access: return "access";
    }
    return "unknown";
}

CoreError::CoreError(int32_t code)
    : std::runtime_error(std::string("clamm: ") + error_name(code))
    , code_(code) {}

CoreError::CoreError(int32_t code, const std::string& detail)
    : std::runtime_error(std::string("clamm: ") + error_name(code) + " (" + detail + ")")
    , code_(code) {}

} // namespace clamm
