#pragma once

#include <stdexcept>
#include <string>

namespace thisthat {

enum class ErrorCode {
    VALIDATION,           // Bad input shape or range, rejected before any mutation
    INSUFFICIENT_FUNDS,   // Debit would exceed available credits
    MARKET_NOT_OPEN,      // Closed, expired, resolved or unknown market
    NOT_FOUND,            // Unknown user, bet or hold
    TRANSIENT_STORE,      // Store busy/locked, safe to retry
    SERVICE_UNAVAILABLE,  // External collaborator timed out or failed
    STORE                 // Non-transient store failure
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION: return "VALIDATION_ERROR";
        case ErrorCode::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case ErrorCode::MARKET_NOT_OPEN: return "MARKET_NOT_OPEN";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::TRANSIENT_STORE: return "TRANSIENT_STORE_ERROR";
        case ErrorCode::SERVICE_UNAVAILABLE: return "SERVICE_UNAVAILABLE";
        case ErrorCode::STORE: return "STORE_ERROR";
    }
    return "UNKNOWN";
}

/**
 * Base of every typed failure the core reports to its callers.
 */
class CoreError : public std::runtime_error {
public:
    CoreError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {
    }

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class ValidationError : public CoreError {
public:
    explicit ValidationError(const std::string& message)
        : CoreError(ErrorCode::VALIDATION, message) {}
};

class InsufficientFunds : public CoreError {
public:
    explicit InsufficientFunds(const std::string& message)
        : CoreError(ErrorCode::INSUFFICIENT_FUNDS, message) {}
};

class MarketNotOpen : public CoreError {
public:
    explicit MarketNotOpen(const std::string& message)
        : CoreError(ErrorCode::MARKET_NOT_OPEN, message) {}
};

class NotFound : public CoreError {
public:
    explicit NotFound(const std::string& message)
        : CoreError(ErrorCode::NOT_FOUND, message) {}
};

class TransientStoreError : public CoreError {
public:
    explicit TransientStoreError(const std::string& message)
        : CoreError(ErrorCode::TRANSIENT_STORE, message) {}
};

class ServiceUnavailable : public CoreError {
public:
    explicit ServiceUnavailable(const std::string& message)
        : CoreError(ErrorCode::SERVICE_UNAVAILABLE, message) {}
};

class StoreError : public CoreError {
public:
    explicit StoreError(const std::string& message)
        : CoreError(ErrorCode::STORE, message) {}
};

} // namespace thisthat
