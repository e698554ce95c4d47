#ifndef LEDGER_UTILS_HPP
#define LEDGER_UTILS_HPP

#include <string>
#include "core/ledger_types.hpp"

namespace LedgerUtils {
    // "<prefix>_" + 16 random hex chars
    std::string makeId(const std::string& prefix);

    TimestampMs nowMs();

    // round-half-up of amount * feeBps / 10000
    Amount computePlatformFee(Amount amount, int feeBps);

    // throws ValidationError unless 0 < amount <= kMaxAmount
    void requirePositiveAmount(Amount amount, const std::string& field);

    // Returns an empty string if the wallet satisfies its balance invariants,
    // otherwise a description of the first violation.
    std::string checkWalletInvariants(const Wallet& wallet);

    PageInfo makePageInfo(size_t page, size_t limit, size_t total);

    // items to skip for a 1-based page; saturates instead of wrapping
    size_t pageOffset(size_t page, size_t limit);
}

#endif // LEDGER_UTILS_HPP
