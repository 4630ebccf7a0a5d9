// SPDX-License-Identifier: MIT
/**
 * @file test_transaction.cpp
 * @brief Unit tests for Transaction validation, effects and JSON
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <stdexcept>
#include "core/date.hpp"
#include "ledger/ledger.hpp"
#include "ledger/transaction.hpp"
#include "test_helpers.hpp"

using namespace tracker;
using namespace tracker::ledger;
using tracker::testing::buy;
using tracker::testing::d;
using tracker::testing::deposit;
using tracker::testing::dividend;
using tracker::testing::make_tx;
using tracker::testing::sell;
using Catch::Matchers::WithinAbs;

TEST_CASE("Date parsing and arithmetic", "[Date]") {
    SECTION("ISO round trip") {
        Date date = Date::from_string("2024-02-29");
        REQUIRE(date.year() == 2024);
        REQUIRE(date.month() == 2);
        REQUIRE(date.day() == 29);
        REQUIRE(date.to_string() == "2024-02-29");
    }

    SECTION("Invalid dates throw") {
        REQUIRE_THROWS_AS(Date::from_string("2023-02-29"), std::invalid_argument);
        REQUIRE_THROWS_AS(Date::from_string("2023/01/01"), std::invalid_argument);
        REQUIRE_FALSE(Date::is_valid("2023-13-01"));
        REQUIRE(Date::is_valid("2023-12-31"));
    }

    SECTION("Day arithmetic crosses month and year ends") {
        REQUIRE(d("2023-12-31").add_days(1) == d("2024-01-01"));
        REQUIRE(d("2024-03-01").add_days(-1) == d("2024-02-29"));
        REQUIRE(d("2023-01-01").days_until(d("2024-01-01")) == 365);
        REQUIRE(Date().to_string() == "1970-01-01");
    }
}

TEST_CASE("Transaction validation", "[Transaction]") {
    SECTION("Valid buy and sell") {
        REQUIRE_NOTHROW(buy("THYAO", 10, 100, "2024-01-01").validate());
        REQUIRE_NOTHROW(sell("THYAO", 5, 110, "2024-01-02").validate());
    }

    SECTION("Buy requires symbol, positive quantity and price") {
        REQUIRE_THROWS_AS(buy("", 10, 100, "2024-01-01").validate(), std::invalid_argument);
        REQUIRE_THROWS_AS(buy("THYAO", 0, 100, "2024-01-01").validate(), std::invalid_argument);
        REQUIRE_THROWS_AS(buy("THYAO", 10, 0, "2024-01-01").validate(), std::invalid_argument);

        Transaction no_price = buy("THYAO", 10, 100, "2024-01-01");
        no_price.price.reset();
        REQUIRE_THROWS_AS(no_price.validate(), std::invalid_argument);
    }

    SECTION("Sell requires positive quantity") {
        REQUIRE_THROWS_AS(sell("THYAO", -1, 100, "2024-01-01").validate(), std::invalid_argument);
    }

    SECTION("Cash movements carry no symbol") {
        REQUIRE_NOTHROW(deposit(1000, "2024-01-01").validate());
        Transaction with_symbol = deposit(1000, "2024-01-01");
        with_symbol.symbol = "THYAO";
        REQUIRE_THROWS_AS(with_symbol.validate(), std::invalid_argument);
        REQUIRE_THROWS_AS(deposit(0, "2024-01-01").validate(), std::invalid_argument);
    }

    SECTION("Rights issue requires quantity and price") {
        REQUIRE_NOTHROW(make_tx(TransactionType::RIGHTS_ISSUE, "THYAO", 5, 10, "2024-01-01").validate());
        REQUIRE_THROWS_AS(make_tx(TransactionType::RIGHTS_ISSUE, "THYAO", 5, 0, "2024-01-01").validate(),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(make_tx(TransactionType::CAPITAL_INCREASE, "", 5, 0, "2024-01-01").validate(),
                          std::invalid_argument);
    }

    SECTION("Ledger rejects invalid transactions") {
        Ledger ledger;
        REQUIRE_THROWS_AS(ledger.append(buy("THYAO", 10, -5, "2024-01-01")), std::invalid_argument);
        REQUIRE(ledger.empty());
    }
}

TEST_CASE("Transaction share and cash effects", "[Transaction]") {
    REQUIRE_THAT(buy("A", 10, 100, "2024-01-01").cash_delta(), WithinAbs(-1000.0, 1e-9));
    REQUIRE_THAT(sell("A", 4, 120, "2024-01-01").cash_delta(), WithinAbs(480.0, 1e-9));
    REQUIRE_THAT(dividend("A", 250, "2024-01-01").cash_delta(), WithinAbs(250.0, 1e-9));
    REQUIRE_THAT(deposit(500, "2024-01-01").cash_delta(), WithinAbs(500.0, 1e-9));
    REQUIRE_THAT(make_tx(TransactionType::RIGHTS_ISSUE, "A", 5, 10, "2024-01-01").cash_delta(),
                 WithinAbs(-50.0, 1e-9));

    REQUIRE_THAT(buy("A", 10, 100, "2024-01-01").share_delta(), WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(sell("A", 4, 120, "2024-01-01").share_delta(), WithinAbs(-4.0, 1e-9));
    REQUIRE_THAT(dividend("A", 250, "2024-01-01").share_delta(), WithinAbs(0.0, 1e-9));
    REQUIRE(dividend("A", 250, "2024-01-01").is_cash_only());
}

TEST_CASE("Transaction JSON", "[Transaction]") {
    SECTION("Defaults are applied") {
        nlohmann::json j = {{"type", "buy"}, {"symbol", "THYAO"}, {"quantity", 10},
                            {"price", 100.5}, {"date", "2024-01-05"}};
        Transaction tx = Transaction::from_json(j);
        REQUIRE(tx.type == TransactionType::BUY);
        REQUIRE(tx.symbol.value() == "THYAO");
        REQUIRE(tx.currency == "TRY");
        REQUIRE(tx.asset_type == AssetType::STOCK);
        REQUIRE(tx.date == d("2024-01-05"));
    }

    SECTION("Unknown type throws") {
        nlohmann::json j = {{"type", "swap"}, {"date", "2024-01-05"}};
        REQUIRE_THROWS_AS(Transaction::from_json(j), std::invalid_argument);
    }

    SECTION("Serialized form names the type in lower case") {
        nlohmann::json out = make_tx(TransactionType::CAPITAL_INCREASE, "A", 5, 0, "2024-01-01").to_json();
        REQUIRE(out["type"] == "capital_increase");
        REQUIRE(out["asset_type"] == "STOCK");
    }
}

TEST_CASE("Ledger ordering and views", "[Ledger]") {
    Ledger ledger;
    ledger.append(buy("B", 1, 10, "2024-01-03"));
    ledger.append(buy("A", 1, 10, "2024-01-01"));
    ledger.append(sell("A", 1, 12, "2024-01-03"));
    ledger.append(deposit(100, "2024-01-02"));

    SECTION("Sorted by date, same-date ties keep insertion order") {
        const auto& txs = ledger.transactions();
        REQUIRE(txs.size() == 4);
        REQUIRE(txs[0].date == d("2024-01-01"));
        REQUIRE(txs[1].type == TransactionType::DEPOSIT);
        REQUIRE(txs[2].symbol.value() == "B");
        REQUIRE(txs[3].type == TransactionType::SELL);
    }

    SECTION("Ids are assigned in append order") {
        REQUIRE(ledger.transactions()[2].id == 1);
        REQUIRE(ledger.transactions()[0].id == 2);
    }

    SECTION("Filtered views") {
        REQUIRE(ledger.for_symbol("A").size() == 2);
        REQUIRE(ledger.between(d("2024-01-02"), d("2024-01-03")).size() == 3);
        REQUIRE(ledger.up_to(d("2024-01-02")).size() == 2);
        REQUIRE(ledger.before(d("2024-01-03")).size() == 2);
        REQUIRE(ledger.symbols() == std::vector<std::string>{"A", "B"});
        REQUIRE(ledger.first_date().value() == d("2024-01-01"));
        REQUIRE(ledger.last_date().value() == d("2024-01-03"));
        REQUIRE(ledger.first_buy("B")->date == d("2024-01-03"));
        REQUIRE_FALSE(ledger.first_buy("C").has_value());
    }

    SECTION("Explicit ids must be unique") {
        Transaction again = deposit(50, "2024-01-05");
        again.id = 3;
        REQUIRE_THROWS_AS(ledger.append(again), std::invalid_argument);
        REQUIRE(ledger.size() == 4);

        again.id = 0;
        REQUIRE(ledger.append(again).id == 5);

        nlohmann::json doc = ledger.to_json();
        doc["transactions"].push_back(doc["transactions"][0]);
        REQUIRE_THROWS_AS(Ledger::from_json(doc), std::invalid_argument);
    }

    SECTION("JSON document round trip keeps order") {
        Ledger copy = Ledger::from_json(ledger.to_json());
        REQUIRE(copy.size() == ledger.size());
        REQUIRE(copy.transactions()[3].type == TransactionType::SELL);
    }
}
