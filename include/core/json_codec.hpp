#ifndef JSON_CODEC_HPP
#define JSON_CODEC_HPP

#include <nlohmann/json.hpp>
#include "core/ledger_types.hpp"

/**
 * nlohmann::json conversions for the ledger entities. Used by the durable
 * store document and by the operation dispatcher output.
 *
 * Unset timestamps (0) and empty optional strings are omitted on output and
 * default when missing on input.
 */

void to_json(nlohmann::json& j, const EscrowReserve& r);
void from_json(const nlohmann::json& j, EscrowReserve& r);

void to_json(nlohmann::json& j, const PaymentMethod& m);
void from_json(const nlohmann::json& j, PaymentMethod& m);

void to_json(nlohmann::json& j, const Wallet& w);
void from_json(const nlohmann::json& j, Wallet& w);

void to_json(nlohmann::json& j, const Escrow& e);
void from_json(const nlohmann::json& j, Escrow& e);

void to_json(nlohmann::json& j, const Transaction& t);
void from_json(const nlohmann::json& j, Transaction& t);

void to_json(nlohmann::json& j, const PageInfo& p);

#endif // JSON_CODEC_HPP
