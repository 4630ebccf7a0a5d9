// SPDX-License-Identifier: MIT
/**
 * @file test_helpers.hpp
 * @brief Transaction builders shared by the unit tests
 */

#ifndef TRACKER_TESTS_TEST_HELPERS_HPP
#define TRACKER_TESTS_TEST_HELPERS_HPP

#include <string>

#include "core/date.hpp"
#include "ledger/transaction.hpp"

namespace tracker {
namespace testing {

inline Date d(const std::string& iso) { return Date::from_string(iso); }

inline ledger::Transaction make_tx(ledger::TransactionType type, const std::string& symbol,
                                   double quantity, double price, const std::string& date) {
    ledger::Transaction tx;
    tx.type = type;
    if (!symbol.empty()) tx.symbol = symbol;
    tx.quantity = quantity;
    tx.price = price;
    tx.date = d(date);
    return tx;
}

inline ledger::Transaction buy(const std::string& symbol, double qty, double price, const std::string& date) {
    return make_tx(ledger::TransactionType::BUY, symbol, qty, price, date);
}

inline ledger::Transaction sell(const std::string& symbol, double qty, double price, const std::string& date) {
    return make_tx(ledger::TransactionType::SELL, symbol, qty, price, date);
}

inline ledger::Transaction split(const std::string& symbol, double new_shares, const std::string& date) {
    return make_tx(ledger::TransactionType::SPLIT, symbol, new_shares, 0.0, date);
}

inline ledger::Transaction dividend(const std::string& symbol, double amount, const std::string& date) {
    return make_tx(ledger::TransactionType::DIVIDEND, symbol, 0.0, amount, date);
}

inline ledger::Transaction deposit(double amount, const std::string& date) {
    ledger::Transaction tx;
    tx.type = ledger::TransactionType::DEPOSIT;
    tx.quantity = amount;
    tx.date = d(date);
    return tx;
}

inline ledger::Transaction withdrawal(double amount, const std::string& date) {
    ledger::Transaction tx = deposit(amount, date);
    tx.type = ledger::TransactionType::WITHDRAWAL;
    return tx;
}

} // namespace testing
} // namespace tracker

#endif // TRACKER_TESTS_TEST_HELPERS_HPP
