// SPDX-License-Identifier: MIT
#ifndef TRACKER_LEDGER_TRANSACTION_HPP
#define TRACKER_LEDGER_TRANSACTION_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "core/date.hpp"

namespace tracker {
namespace ledger {

/**
 * @enum TransactionType
 * @brief Kind of cash or security event recorded in the ledger
 */
enum class TransactionType {
    BUY,
    SELL,
    DEPOSIT,
    WITHDRAWAL,
    DIVIDEND,         ///< price holds the total cash amount received
    SPLIT,            ///< quantity holds the net new shares added
    CAPITAL_INCREASE, ///< bonus shares, quantity holds the net new shares
    RIGHTS_ISSUE      ///< paid subscription, quantity at price
};

enum class AssetType {
    STOCK,
    FUND
};

std::string to_string(TransactionType type);
std::string to_string(AssetType type);

/// Parse the lower-case wire name ("buy", "capital_increase", ...).
TransactionType parse_transaction_type(const std::string& name);
AssetType parse_asset_type(const std::string& name);

/**
 * @struct Transaction
 * @brief One immutable ledger event
 */
struct Transaction {
    int id = 0;
    TransactionType type = TransactionType::BUY;
    std::optional<std::string> symbol;
    double quantity = 0.0;
    std::optional<double> price;
    Date date;
    std::string currency = "TRY";
    AssetType asset_type = AssetType::STOCK;
    std::string note;

    /**
     * @brief Check the per-type field requirements
     * @throws std::invalid_argument describing the first violated rule
     */
    void validate() const;

    /// Change in share quantity of `symbol` caused by this event.
    double share_delta() const;

    /// Change in the cash balance caused by this event.
    double cash_delta() const;

    bool is_cash_only() const;

    nlohmann::json to_json() const;
    static Transaction from_json(const nlohmann::json& j);
};

} // namespace ledger
} // namespace tracker

#endif // TRACKER_LEDGER_TRANSACTION_HPP
