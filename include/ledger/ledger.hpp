// SPDX-License-Identifier: MIT
#ifndef TRACKER_LEDGER_LEDGER_HPP
#define TRACKER_LEDGER_LEDGER_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "ledger/transaction.hpp"

namespace tracker {
namespace ledger {

/**
 * @class Ledger
 * @brief Append-only, date-ordered list of transactions
 *
 * Transactions on the same date keep their insertion order. Every
 * transaction is validated on entry.
 */
class Ledger {
public:
    Ledger() = default;
    explicit Ledger(const std::vector<Transaction>& transactions);

    /**
     * @brief Validate and insert a transaction after any existing ones on the same date
     * @return The stored copy (id assigned when the input id is 0)
     * @throws std::invalid_argument if the transaction is malformed or its
     *         explicit id is already taken
     */
    Transaction append(Transaction tx);

    const std::vector<Transaction>& transactions() const { return transactions_; }
    size_t size() const { return transactions_.size(); }
    bool empty() const { return transactions_.empty(); }

    // -- Filtered views
    std::vector<Transaction> for_symbol(const std::string& symbol) const;
    std::vector<Transaction> between(const Date& start, const Date& end) const; ///< inclusive
    std::vector<Transaction> up_to(const Date& date) const;                     ///< inclusive
    std::vector<Transaction> before(const Date& date) const;                    ///< exclusive

    /// Sorted distinct symbols referenced by the ledger.
    std::vector<std::string> symbols() const;

    std::optional<Date> first_date() const;
    std::optional<Date> last_date() const;

    /// Earliest buy of @p symbol, if any.
    std::optional<Transaction> first_buy(const std::string& symbol) const;

    nlohmann::json to_json() const;

    /// Accepts either an array of transactions or {"transactions": [...]}.
    static Ledger from_json(const nlohmann::json& j);

private:
    std::vector<Transaction> transactions_;
    int next_id_ = 1;
};

} // namespace ledger
} // namespace tracker

#endif // TRACKER_LEDGER_LEDGER_HPP
