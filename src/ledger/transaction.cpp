// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of Transaction
// ============================================================================

#include "ledger/transaction.hpp"

#include <sstream>
#include <stdexcept>

namespace tracker {
namespace ledger {

// ============================================================================
// Names
// ============================================================================

std::string to_string(TransactionType type) {
    switch (type) {
    case TransactionType::BUY: return "buy";
    case TransactionType::SELL: return "sell";
    case TransactionType::DEPOSIT: return "deposit";
    case TransactionType::WITHDRAWAL: return "withdrawal";
    case TransactionType::DIVIDEND: return "dividend";
    case TransactionType::SPLIT: return "split";
    case TransactionType::CAPITAL_INCREASE: return "capital_increase";
    case TransactionType::RIGHTS_ISSUE: return "rights_issue";
    }
    return "unknown";
}

std::string to_string(AssetType type) {
    return type == AssetType::FUND ? "FUND" : "STOCK";
}

TransactionType parse_transaction_type(const std::string& name) {
    if (name == "buy") return TransactionType::BUY;
    if (name == "sell") return TransactionType::SELL;
    if (name == "deposit") return TransactionType::DEPOSIT;
    if (name == "withdrawal") return TransactionType::WITHDRAWAL;
    if (name == "dividend") return TransactionType::DIVIDEND;
    if (name == "split") return TransactionType::SPLIT;
    if (name == "capital_increase") return TransactionType::CAPITAL_INCREASE;
    if (name == "rights_issue") return TransactionType::RIGHTS_ISSUE;
    throw std::invalid_argument("Unknown transaction type: '" + name + "'");
}

AssetType parse_asset_type(const std::string& name) {
    if (name == "STOCK" || name == "stock") return AssetType::STOCK;
    if (name == "FUND" || name == "fund") return AssetType::FUND;
    throw std::invalid_argument("Unknown asset type: '" + name + "'");
}

// ============================================================================
// Validation
// ============================================================================

namespace {

std::string describe(const Transaction& tx) {
    std::ostringstream os;
    os << to_string(tx.type) << " on " << tx.date;
    if (tx.symbol) os << " for " << *tx.symbol;
    return os.str();
}

bool has_symbol(const Transaction& tx) {
    return tx.symbol.has_value() && !tx.symbol->empty();
}

} // namespace

void Transaction::validate() const {
    switch (type) {
    case TransactionType::BUY:
    case TransactionType::SELL:
        if (!has_symbol(*this)) {
            throw std::invalid_argument(describe(*this) + ": symbol is required");
        }
        if (!(quantity > 0.0)) {
            throw std::invalid_argument(describe(*this) + ": quantity must be > 0, got " +
                                        std::to_string(quantity));
        }
        if (type == TransactionType::BUY && !(price && *price > 0.0)) {
            throw std::invalid_argument(describe(*this) + ": price must be > 0");
        }
        break;
    case TransactionType::DEPOSIT:
    case TransactionType::WITHDRAWAL:
        if (has_symbol(*this)) {
            throw std::invalid_argument(describe(*this) + ": cash movements carry no symbol");
        }
        if (!(quantity > 0.0)) {
            throw std::invalid_argument(describe(*this) + ": amount must be > 0, got " +
                                        std::to_string(quantity));
        }
        break;
    case TransactionType::DIVIDEND:
        if (price && *price < 0.0) {
            throw std::invalid_argument(describe(*this) + ": dividend amount must be >= 0");
        }
        break;
    case TransactionType::SPLIT:
    case TransactionType::CAPITAL_INCREASE:
        if (!has_symbol(*this)) {
            throw std::invalid_argument(describe(*this) + ": symbol is required");
        }
        if (quantity < 0.0) {
            throw std::invalid_argument(describe(*this) + ": new share count must be >= 0");
        }
        break;
    case TransactionType::RIGHTS_ISSUE:
        if (!has_symbol(*this)) {
            throw std::invalid_argument(describe(*this) + ": symbol is required");
        }
        if (!(quantity > 0.0) || !(price && *price > 0.0)) {
            throw std::invalid_argument(describe(*this) + ": quantity and price must be > 0");
        }
        break;
    }
}

// ============================================================================
// Effects
// ============================================================================

double Transaction::share_delta() const {
    switch (type) {
    case TransactionType::BUY:
    case TransactionType::SPLIT:
    case TransactionType::CAPITAL_INCREASE:
    case TransactionType::RIGHTS_ISSUE:
        return quantity;
    case TransactionType::SELL:
        return -quantity;
    default:
        return 0.0;
    }
}

double Transaction::cash_delta() const {
    const double px = price.value_or(0.0);
    switch (type) {
    case TransactionType::DEPOSIT: return quantity;
    case TransactionType::WITHDRAWAL: return -quantity;
    case TransactionType::BUY: return -quantity * px;
    case TransactionType::SELL: return quantity * px;
    case TransactionType::DIVIDEND: return px;
    case TransactionType::RIGHTS_ISSUE: return -quantity * px;
    default: return 0.0;
    }
}

bool Transaction::is_cash_only() const {
    return type == TransactionType::DEPOSIT || type == TransactionType::WITHDRAWAL ||
           type == TransactionType::DIVIDEND;
}

// ============================================================================
// JSON
// ============================================================================

nlohmann::json Transaction::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["type"] = to_string(type);
    j["symbol"] = symbol ? nlohmann::json(*symbol) : nlohmann::json(nullptr);
    j["quantity"] = quantity;
    j["price"] = price ? nlohmann::json(*price) : nlohmann::json(nullptr);
    j["date"] = date.to_string();
    j["currency"] = currency;
    j["asset_type"] = to_string(asset_type);
    if (!note.empty()) j["note"] = note;
    return j;
}

Transaction Transaction::from_json(const nlohmann::json& j) {
    if (!j.contains("type") || !j.contains("date")) {
        throw std::invalid_argument("Transaction requires 'type' and 'date': " + j.dump());
    }
    Transaction tx;
    tx.id = j.value("id", 0);
    tx.type = parse_transaction_type(j.at("type").get<std::string>());
    if (j.contains("symbol") && !j.at("symbol").is_null()) {
        tx.symbol = j.at("symbol").get<std::string>();
    }
    tx.quantity = j.value("quantity", 0.0);
    if (j.contains("price") && !j.at("price").is_null()) {
        tx.price = j.at("price").get<double>();
    }
    tx.date = Date::from_string(j.at("date").get<std::string>());
    tx.currency = j.value("currency", std::string("TRY"));
    tx.asset_type = parse_asset_type(j.value("asset_type", std::string("STOCK")));
    tx.note = j.value("note", std::string());
    return tx;
}

} // namespace ledger
} // namespace tracker
