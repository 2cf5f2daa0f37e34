#pragma once
// ============================================================================
// VIGIL - Error Taxonomy
// ============================================================================
// Transient errors are survivable: the next tick retries naturally
// Configuration errors are fatal at session start
// ============================================================================

#include <stdexcept>
#include <string>

namespace vigil {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Network or exchange hiccup, recovered by the next scheduled attempt
class TransientError : public Error {
public:
    using Error::Error;
};

/// Market data request failed (network, HTTP status, empty or malformed payload)
class TransientFetchError : public TransientError {
public:
    using TransientError::TransientError;
};

/// place_order / close_position / get_mark_price / get_account_state failed
class TransientExchangeError : public TransientError {
public:
    using TransientError::TransientError;
};

/// External call exceeded its deadline; handled exactly like a failure
class TimeoutError : public TransientError {
public:
    using TransientError::TransientError;
};

/// Invalid risk parameters or session configuration
class ConfigurationError : public Error {
public:
    using Error::Error;
};

}  // namespace vigil
