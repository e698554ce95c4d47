#include "core/errors.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:        return "ValidationError";
        case ErrorKind::NotFound:          return "NotFoundError";
        case ErrorKind::InsufficientFunds: return "InsufficientFundsError";
        case ErrorKind::InvalidState:      return "InvalidStateError";
        case ErrorKind::NotAuthorized:     return "NotAuthorizedError";
        case ErrorKind::Store:             return "StoreError";
        case ErrorKind::Gateway:           return "GatewayError";
    }
    return "LedgerError";
}

LedgerError::LedgerError(ErrorKind kind, const std::string& message, bool retryable)
    : std::runtime_error(message)
    , kind_(kind)
    , retryable_(retryable)
{
}

InsufficientFundsError::InsufficientFundsError(Amount available, Amount requested)
    : LedgerError(ErrorKind::InsufficientFunds,
                  "Insufficient funds: available=" + std::to_string(available)
                  + " requested=" + std::to_string(requested))
    , available_(available)
    , requested_(requested)
{
}

InvalidStateError::InvalidStateError(EscrowStatus current, EscrowStatus required)
    : LedgerError(ErrorKind::InvalidState,
                  "Escrow is " + toString(current) + ", operation requires " + toString(required))
    , current_(current)
    , required_(required)
{
}
