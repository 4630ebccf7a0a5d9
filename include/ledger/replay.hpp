// SPDX-License-Identifier: MIT
#ifndef TRACKER_LEDGER_REPLAY_HPP
#define TRACKER_LEDGER_REPLAY_HPP

#include <map>
#include <string>
#include <vector>

#include "ledger/ledger.hpp"

namespace tracker {
namespace ledger {

/// Quantity below or at which a position no longer counts as held.
constexpr double HOLDING_EPSILON = 1e-3;

/// symbol -> quantity at a point in time
using HoldingSnapshot = std::map<std::string, double>;

/**
 * @class HoldingsBook
 * @brief Running share quantities and cash balance built by replaying transactions
 *
 * Oversells are not rejected: the quantity goes negative and is reported by
 * negative_symbols().
 */
class HoldingsBook {
public:
    HoldingsBook() = default;

    void apply(const Transaction& tx);
    void apply_all(const std::vector<Transaction>& transactions);

    // -- State queries
    double quantity(const std::string& symbol) const;
    double cash() const { return cash_; }

    /// Every symbol touched so far, including flat and negative ones.
    const HoldingSnapshot& positions() const { return positions_; }

    /// Symbols whose quantity exceeds @p epsilon.
    HoldingSnapshot held(double epsilon = HOLDING_EPSILON) const;

    /// Symbols whose quantity is below -epsilon.
    std::vector<std::string> negative_symbols(double epsilon = HOLDING_EPSILON) const;

    void reset();
    void print_summary() const;

private:
    HoldingSnapshot positions_;
    double cash_ = 0.0;
};

/// Replayed quantities of every symbol as of @p date (inclusive).
HoldingSnapshot holdings_as_of(const Ledger& ledger, const Date& date);

/// Cash balance as of @p date (inclusive).
double cash_balance_as_of(const Ledger& ledger, const Date& date);

/// Symbols held above @p epsilon as of @p date (inclusive).
HoldingSnapshot current_holdings(const Ledger& ledger, const Date& as_of,
                                 double epsilon = HOLDING_EPSILON);

/// Symbols held above @p epsilon after the whole ledger.
HoldingSnapshot current_holdings(const Ledger& ledger, double epsilon = HOLDING_EPSILON);

/// Quantity of @p symbol held strictly before @p date.
double holdings_before(const Ledger& ledger, const std::string& symbol, const Date& date);

} // namespace ledger
} // namespace tracker

#endif // TRACKER_LEDGER_REPLAY_HPP
