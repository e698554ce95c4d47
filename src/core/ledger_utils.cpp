// src/core/ledger_utils.cpp

#include "core/ledger_utils.hpp"
#include "core/errors.hpp"
#include <openssl/rand.h>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>

std::string LedgerUtils::makeId(const std::string& prefix) {
    unsigned char raw[8];
    if (!RAND_bytes(raw, sizeof(raw))) {
        throw StoreError("Failed to generate identifier", false);
    }
    std::ostringstream ss;
    ss << prefix << "_";
    for (unsigned char b : raw) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)b;
    }
    return ss.str();
}

TimestampMs LedgerUtils::nowMs() {
    return (TimestampMs)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

Amount LedgerUtils::computePlatformFee(Amount amount, int feeBps) {
    // amount <= kMaxAmount and feeBps <= 10000 keep this inside int64
    return (amount * feeBps + 5000) / 10000;
}

void LedgerUtils::requirePositiveAmount(Amount amount, const std::string& field) {
    if (amount <= 0) {
        throw ValidationError(field + " must be greater than zero");
    }
    if (amount > kMaxAmount) {
        throw ValidationError(field + " exceeds the maximum of " + std::to_string(kMaxAmount));
    }
}

std::string LedgerUtils::checkWalletInvariants(const Wallet& wallet) {
    if (wallet.balance < 0) {
        return "negative balance";
    }
    if (wallet.reservedBalance < 0) {
        return "negative reserved balance";
    }
    Amount sum = 0;
    for (const auto& r : wallet.escrowReserves) {
        if (r.amount <= 0) return "non-positive reserve for escrow " + r.escrowId;
        sum += r.amount;
    }
    if (sum != wallet.reservedBalance) {
        return "reserved balance does not match escrow reserves";
    }
    if (wallet.balance < wallet.reservedBalance) {
        return "reserved balance exceeds balance";
    }
    if (!wallet.paymentMethods.empty()) {
        int defaults = 0;
        for (const auto& m : wallet.paymentMethods) {
            if (m.isDefault) ++defaults;
        }
        if (defaults != 1) return "payment methods must have exactly one default";
    }
    return "";
}

PageInfo LedgerUtils::makePageInfo(size_t page, size_t limit, size_t total) {
    PageInfo info;
    info.page  = page;
    info.limit = limit;
    info.total = total;
    info.pages = (limit == 0) ? 0 : total / limit + (total % limit != 0 ? 1 : 0);
    return info;
}

size_t LedgerUtils::pageOffset(size_t page, size_t limit) {
    if (page <= 1 || limit == 0) return 0;
    if (page - 1 > SIZE_MAX / limit) return SIZE_MAX;
    return (page - 1) * limit;
}
