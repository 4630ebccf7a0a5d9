// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of Ledger
// ============================================================================

#include "ledger/ledger.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace tracker {
namespace ledger {

Ledger::Ledger(const std::vector<Transaction>& transactions) {
    for (const auto& tx : transactions) {
        append(tx);
    }
}

Transaction Ledger::append(Transaction tx) {
    tx.validate();
    if (tx.id == 0) {
        tx.id = next_id_;
    } else if (std::any_of(transactions_.begin(), transactions_.end(),
                           [&](const Transaction& t) { return t.id == tx.id; })) {
        throw std::invalid_argument("Duplicate transaction id " + std::to_string(tx.id) +
                                    " (" + to_string(tx.type) + " on " + tx.date.to_string() + ")");
    }
    next_id_ = std::max(next_id_, tx.id) + 1;

    auto pos = std::upper_bound(transactions_.begin(), transactions_.end(), tx.date,
                                [](const Date& d, const Transaction& t) { return d < t.date; });
    transactions_.insert(pos, tx);
    return tx;
}

// ============================================================================
// Filtered views
// ============================================================================

std::vector<Transaction> Ledger::for_symbol(const std::string& symbol) const {
    std::vector<Transaction> out;
    for (const auto& tx : transactions_) {
        if (tx.symbol && *tx.symbol == symbol) out.push_back(tx);
    }
    return out;
}

std::vector<Transaction> Ledger::between(const Date& start, const Date& end) const {
    std::vector<Transaction> out;
    for (const auto& tx : transactions_) {
        if (tx.date >= start && tx.date <= end) out.push_back(tx);
    }
    return out;
}

std::vector<Transaction> Ledger::up_to(const Date& date) const {
    std::vector<Transaction> out;
    for (const auto& tx : transactions_) {
        if (tx.date > date) break;
        out.push_back(tx);
    }
    return out;
}

std::vector<Transaction> Ledger::before(const Date& date) const {
    std::vector<Transaction> out;
    for (const auto& tx : transactions_) {
        if (tx.date >= date) break;
        out.push_back(tx);
    }
    return out;
}

std::vector<std::string> Ledger::symbols() const {
    std::set<std::string> seen;
    for (const auto& tx : transactions_) {
        if (tx.symbol && !tx.symbol->empty()) seen.insert(*tx.symbol);
    }
    return std::vector<std::string>(seen.begin(), seen.end());
}

std::optional<Date> Ledger::first_date() const {
    if (transactions_.empty()) return std::nullopt;
    return transactions_.front().date;
}

std::optional<Date> Ledger::last_date() const {
    if (transactions_.empty()) return std::nullopt;
    return transactions_.back().date;
}

std::optional<Transaction> Ledger::first_buy(const std::string& symbol) const {
    for (const auto& tx : transactions_) {
        if (tx.type == TransactionType::BUY && tx.symbol && *tx.symbol == symbol) return tx;
    }
    return std::nullopt;
}

// ============================================================================
// JSON
// ============================================================================

nlohmann::json Ledger::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& tx : transactions_) {
        arr.push_back(tx.to_json());
    }
    return nlohmann::json{{"transactions", arr}};
}

Ledger Ledger::from_json(const nlohmann::json& j) {
    const nlohmann::json& arr = j.is_object() ? j.at("transactions") : j;
    if (!arr.is_array()) {
        throw std::invalid_argument("Ledger document must be an array of transactions");
    }
    Ledger ledger;
    for (const auto& item : arr) {
        ledger.append(Transaction::from_json(item));
    }
    return ledger;
}

} // namespace ledger
} // namespace tracker
