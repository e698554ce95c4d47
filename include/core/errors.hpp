#ifndef LEDGER_ERRORS_HPP
#define LEDGER_ERRORS_HPP

#include <stdexcept>
#include <string>
#include "core/ledger_types.hpp"

enum class ErrorKind {
    Validation,
    NotFound,
    InsufficientFunds,
    InvalidState,
    NotAuthorized,
    Store,
    Gateway
};

// e.g. "ValidationError"
const char* errorKindName(ErrorKind kind);

/**
 * Base of every failure the wallet ledger and escrow engine report.
 * retryable() tells the caller whether the same request may succeed later
 * without being changed.
 */
class LedgerError : public std::runtime_error {
public:
    LedgerError(ErrorKind kind, const std::string& message, bool retryable = false);

    ErrorKind kind() const { return kind_; }
    bool retryable() const { return retryable_; }

private:
    ErrorKind kind_;
    bool retryable_;
};

class ValidationError : public LedgerError {
public:
    explicit ValidationError(const std::string& message)
        : LedgerError(ErrorKind::Validation, message) {}
};

class NotFoundError : public LedgerError {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerError(ErrorKind::NotFound, message) {}
};

class InsufficientFundsError : public LedgerError {
public:
    InsufficientFundsError(Amount available, Amount requested);

    Amount available() const { return available_; }
    Amount requested() const { return requested_; }

private:
    Amount available_;
    Amount requested_;
};

class InvalidStateError : public LedgerError {
public:
    InvalidStateError(EscrowStatus current, EscrowStatus required);

    EscrowStatus current() const { return current_; }
    EscrowStatus required() const { return required_; }

private:
    EscrowStatus current_;
    EscrowStatus required_;
};

class NotAuthorizedError : public LedgerError {
public:
    explicit NotAuthorizedError(const std::string& message)
        : LedgerError(ErrorKind::NotAuthorized, message) {}
};

/**
 * The unit of work aborted (lock timeout, persistence failure, broken
 * store-level invariant). Nothing it touched was committed.
 */
class StoreError : public LedgerError {
public:
    explicit StoreError(const std::string& message, bool retryable = true)
        : LedgerError(ErrorKind::Store, message, retryable) {}
};

class GatewayError : public LedgerError {
public:
    explicit GatewayError(const std::string& message)
        : LedgerError(ErrorKind::Gateway, message) {}
};

#endif // LEDGER_ERRORS_HPP
