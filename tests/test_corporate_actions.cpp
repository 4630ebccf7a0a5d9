// SPDX-License-Identifier: MIT
/**
 * @file test_corporate_actions.cpp
 * @brief Unit tests for split adjustment and percentage corporate actions
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "corporate/corporate_actions.hpp"
#include "ledger/ledger.hpp"
#include "ledger/replay.hpp"
#include "test_helpers.hpp"

using namespace tracker;
using namespace tracker::corporate;
using namespace tracker::testing;
using Catch::Matchers::WithinAbs;

namespace {

PriceSeries split_fixture() {
    PriceSeries series("SPLT");
    series.add(PriceBar{d("2023-12-29"), 100, 102, 98, 100, 1000});
    series.add(PriceBar{d("2024-01-01"), 50, 51, 49, 50, 2000});
    series.add(PriceBar{d("2024-01-02"), 51, 52, 50, 51, 2100});
    return series;
}

} // namespace

TEST_CASE("Split adjustment divides earlier bars", "[CorporateActions]") {
    PriceSeries adjusted = adjust_for_split(split_fixture(), "SPLT", d("2024-01-01"), 2.0);

    SECTION("Bars before the split date") {
        const PriceBar& bar = adjusted.bars()[0];
        REQUIRE_THAT(bar.open, WithinAbs(50.0, 1e-12));
        REQUIRE_THAT(bar.high, WithinAbs(51.0, 1e-12));
        REQUIRE_THAT(bar.low, WithinAbs(49.0, 1e-12));
        REQUIRE_THAT(bar.close, WithinAbs(50.0, 1e-12));
        REQUIRE_THAT(bar.volume, WithinAbs(2000.0, 1e-12));
    }

    SECTION("Bars on and after the split date are untouched") {
        REQUIRE_THAT(adjusted.bars()[1].close, WithinAbs(50.0, 1e-12));
        REQUIRE_THAT(adjusted.bars()[2].close, WithinAbs(51.0, 1e-12));
        REQUIRE_THAT(adjusted.bars()[2].volume, WithinAbs(2100.0, 1e-12));
    }

    SECTION("Other symbols and bad ratios") {
        PriceSeries other = adjust_for_split(split_fixture(), "OTHER", d("2024-01-01"), 2.0);
        REQUIRE_THAT(other.bars()[0].close, WithinAbs(100.0, 1e-12));
        REQUIRE_THROWS_AS(adjust_for_split(split_fixture(), "SPLT", d("2024-01-01"), 0.0),
                          std::invalid_argument);
    }
}

TEST_CASE("Split registry", "[CorporateActions]") {
    SplitRegistry registry;
    registry.add({"SPLT", d("2024-01-01"), 2.0});
    registry.add({"SPLT", d("2023-06-01"), 5.0});
    registry.add({"CCOLA", d("2024-08-01"), 11.0});

    REQUIRE(registry.size() == 3);
    auto events = registry.for_symbol("SPLT");
    REQUIRE(events.size() == 2);
    REQUIRE(events.front().date == d("2023-06-01"));

    SECTION("Applies every split of the series' symbol") {
        PriceSeries adjusted = registry.apply(split_fixture());
        // The 2023 split predates every bar
        REQUIRE_THAT(adjusted.bars()[0].close, WithinAbs(50.0, 1e-12));
        REQUIRE_THAT(adjusted.bars()[1].close, WithinAbs(50.0, 1e-12));
    }

    SECTION("JSON round trip") {
        SplitRegistry copy = SplitRegistry::from_json(registry.to_json());
        REQUIRE(copy.size() == 3);
        REQUIRE(copy.for_symbol("CCOLA").front().ratio == 11.0);
        REQUIRE_THROWS_AS(SplitRegistry::from_json(nlohmann::json::object()), std::invalid_argument);
        REQUIRE_THROWS_AS(registry.add({"", d("2024-01-01"), 2.0}), std::invalid_argument);
    }
}

TEST_CASE("Percentage corporate actions", "[CorporateActions]") {
    ledger::Ledger ledger;
    ledger.append(buy("EREGL", 200, 40, "2024-01-02"));
    ledger.append(buy("EREGL", 100, 45, "2024-03-01"));

    SECTION("Dividend uses shares held strictly before the event") {
        auto result = dividend_from_percentage(ledger, "EREGL", d("2024-03-01"), 50.0);
        REQUIRE(result.success);
        REQUIRE_THAT(result.shares_held, WithinAbs(200.0, 1e-9));
        REQUIRE(result.transaction.type == ledger::TransactionType::DIVIDEND);
        REQUIRE_THAT(result.transaction.price.value(), WithinAbs(100.0, 1e-9));
        REQUIRE(result.transaction.quantity == 0.0);
        REQUIRE_NOTHROW(result.transaction.validate());
    }

    SECTION("Split percentage becomes net new shares") {
        REQUIRE_THAT(split_ratio_from_percentage(100.0), WithinAbs(2.0, 1e-12));

        auto result = split_from_percentage(ledger, "EREGL", d("2024-04-01"), 100.0);
        REQUIRE(result.success);
        REQUIRE(result.transaction.type == ledger::TransactionType::SPLIT);
        REQUIRE_THAT(result.transaction.quantity, WithinAbs(300.0, 1e-9));
        REQUIRE(result.transaction.note == "Stock Split (2-for-1)");

        ledger.append(result.transaction);
        REQUIRE_THAT(ledger::current_holdings(ledger).at("EREGL"), WithinAbs(600.0, 1e-9));
    }

    SECTION("No shares held is a structured failure") {
        auto result = split_from_percentage(ledger, "EREGL", d("2024-01-02"), 10.0);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message == "No shares of EREGL held before 2024-01-02");
        REQUIRE(dividend_from_percentage(ledger, "GARAN", d("2024-05-01"), 10.0).success == false);
    }
}
