// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of ledger replay
// ============================================================================

#include "ledger/replay.hpp"

#include <iomanip>
#include <iostream>

namespace tracker {
namespace ledger {

// ============================================================================
// HoldingsBook
// ============================================================================

void HoldingsBook::apply(const Transaction& tx) {
    cash_ += tx.cash_delta();
    if (tx.symbol && !tx.is_cash_only()) {
        positions_[*tx.symbol] += tx.share_delta();
    }
}

void HoldingsBook::apply_all(const std::vector<Transaction>& transactions) {
    for (const auto& tx : transactions) {
        apply(tx);
    }
}

double HoldingsBook::quantity(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    return it == positions_.end() ? 0.0 : it->second;
}

HoldingSnapshot HoldingsBook::held(double epsilon) const {
    HoldingSnapshot out;
    for (const auto& kv : positions_) {
        if (kv.second > epsilon) out.insert(kv);
    }
    return out;
}

std::vector<std::string> HoldingsBook::negative_symbols(double epsilon) const {
    std::vector<std::string> out;
    for (const auto& kv : positions_) {
        if (kv.second < -epsilon) out.push_back(kv.first);
    }
    return out;
}

void HoldingsBook::reset() {
    positions_.clear();
    cash_ = 0.0;
}

void HoldingsBook::print_summary() const {
    std::cout << "Holdings summary\n";
    std::cout << "  Cash: " << std::fixed << std::setprecision(2) << cash_ << "\n";
    for (const auto& kv : positions_) {
        std::cout << "  " << std::setw(10) << kv.first << "  " << std::setprecision(4)
                  << kv.second << "\n";
    }
}

// ============================================================================
// Point-in-time queries
// ============================================================================

HoldingSnapshot holdings_as_of(const Ledger& ledger, const Date& date) {
    HoldingsBook book;
    book.apply_all(ledger.up_to(date));
    return book.positions();
}

double cash_balance_as_of(const Ledger& ledger, const Date& date) {
    HoldingsBook book;
    book.apply_all(ledger.up_to(date));
    return book.cash();
}

HoldingSnapshot current_holdings(const Ledger& ledger, const Date& as_of, double epsilon) {
    HoldingsBook book;
    book.apply_all(ledger.up_to(as_of));
    return book.held(epsilon);
}

HoldingSnapshot current_holdings(const Ledger& ledger, double epsilon) {
    HoldingsBook book;
    book.apply_all(ledger.transactions());
    return book.held(epsilon);
}

double holdings_before(const Ledger& ledger, const std::string& symbol, const Date& date) {
    HoldingsBook book;
    book.apply_all(ledger.before(date));
    return book.quantity(symbol);
}

} // namespace ledger
} // namespace tracker
