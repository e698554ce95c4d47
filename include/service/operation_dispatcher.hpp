#ifndef OPERATION_DISPATCHER_HPP
#define OPERATION_DISPATCHER_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors.hpp"
#include "engine/escrow_engine.hpp"
#include "ledger/wallet_ledger.hpp"

/**
 * Named JSON operations over the wallet ledger and escrow engine.
 *
 * dispatch("escrow.approve", {"escrowId": ..., "clientId": ...}) returns
 * {"success": true, ...} or {"success": false, "error": {...}}. Errors never
 * escape as exceptions.
 */
class OperationDispatcher {
public:
    OperationDispatcher(WalletLedger& wallets, EscrowEngine& escrows);

    nlohmann::json dispatch(const std::string& op, const nlohmann::json& args);

    /**
     * Runs a JSON array of {"op": ..., "args": {...}} on a pool of `workers`
     * threads. The result array is in request order.
     */
    nlohmann::json runBatch(const nlohmann::json& requests, size_t workers);

    std::vector<std::string> operations() const;

    // {"kind", "message", "retryable"} plus the error's structured fields
    static nlohmann::json errorToJson(const LedgerError& err);

private:
    typedef std::function<nlohmann::json(const nlohmann::json&)> Handler;

    void registerWalletOps();
    void registerEscrowOps();

    WalletLedger& wallets_;
    EscrowEngine& escrows_;
    std::map<std::string, Handler> handlers_;
};

#endif // OPERATION_DISPATCHER_HPP
