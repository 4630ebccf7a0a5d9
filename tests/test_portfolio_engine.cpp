// SPDX-License-Identifier: MIT
/**
 * @file test_portfolio_engine.cpp
 * @brief End-to-end tests of the PortfolioEngine facade
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <chrono>
#include <memory>
#include "engine/portfolio_engine.hpp"
#include "test_helpers.hpp"

using namespace tracker;
using namespace tracker::engine;
using namespace tracker::testing;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace {

using TimePoint = std::chrono::steady_clock::time_point;

std::function<TimePoint()> fixed_clock(const std::shared_ptr<TimePoint>& now) {
    return [now] { return *now; };
}

// deposit 10000 on 01-01, buy 50 THYAO@100 on 01-05, THYAO climbs to 120 by 01-10
struct ThyaoFixture {
    ledger::Ledger history{{deposit(10000, "2024-01-01"), buy("THYAO", 50, 100, "2024-01-05")}};
    InMemoryPriceProvider prices;
    std::shared_ptr<TimePoint> now = std::make_shared<TimePoint>();
    TtlCache<DashboardMetrics> dashboard_cache{30s, fixed_clock(now)};
    TtlCache<data::SectorInfo> sector_cache{std::chrono::hours(24)};

    ThyaoFixture() {
        const double closes[] = {100, 104, 108, 112, 116, 120};
        for (int i = 0; i < 6; ++i) {
            prices.add_close("THYAO", d("2024-01-05").add_days(i), closes[i]);
        }
    }

    PortfolioEngine make_engine(EngineConfig config = EngineConfig()) {
        return PortfolioEngine(history, prices, nullptr, nullptr, dashboard_cache, sector_cache, config);
    }
};

} // namespace

TEST_CASE("Reference scenario through the engine", "[PortfolioEngine]") {
    ThyaoFixture f;
    PortfolioEngine engine = f.make_engine();
    const Date as_of = d("2024-01-10");

    SECTION("Holdings and cash") {
        auto held = engine.holdings(as_of);
        REQUIRE(held.size() == 1);
        REQUIRE_THAT(held.at("THYAO"), WithinAbs(50.0, 1e-12));
        REQUIRE_THAT(engine.cash_balance(as_of), WithinAbs(5000.0, 1e-9));
        REQUIRE(engine.negative_positions(as_of).empty());
        REQUIRE(engine.holdings(d("2024-01-04")).empty());
    }

    SECTION("Position performance") {
        auto positions = engine.positions(as_of);
        REQUIRE(positions.size() == 1);
        const auto& p = positions.front();
        REQUIRE(p.success);
        REQUIRE_THAT(p.cost_basis, WithinAbs(5000.0, 1e-9));
        REQUIRE_THAT(p.average_purchase_price, WithinAbs(100.0, 1e-9));
        REQUIRE_THAT(p.current_value, WithinAbs(6000.0, 1e-9));
        REQUIRE_THAT(p.return_amount, WithinAbs(1000.0, 1e-9));
        REQUIRE_THAT(p.return_percentage, WithinAbs(20.0, 1e-9));
        REQUIRE(p.days_held == 5);
    }

    SECTION("Timeline starts at the first priced day") {
        auto timeline = engine.timeline(d("2024-01-01"), as_of);
        REQUIRE(timeline.success);
        REQUIRE(timeline.points.size() == 6);
        REQUIRE(timeline.points.front().date == d("2024-01-05"));
        REQUIRE_THAT(timeline.points.front().value, WithinAbs(5000.0, 1e-9));
        REQUIRE_THAT(timeline.points.back().value, WithinAbs(6000.0, 1e-9));
        REQUIRE_THAT(timeline.points.back().cash_balance, WithinAbs(5000.0, 1e-9));
        REQUIRE_THAT(timeline.symbols.at("THYAO").cumulative_performance.back(), WithinAbs(0.2, 1e-12));
    }

    SECTION("Risk report scores the held symbol") {
        RiskReport report = engine.risk_report(as_of);
        REQUIRE(report.success);
        REQUIRE(report.bundles.size() == 1);
        REQUIRE(report.skipped.empty());
        REQUIRE(report.bundles.front().symbol == "THYAO");
        REQUIRE(report.bundles.front().profile.observations == 6);
        REQUIRE(report.insights.success);
        REQUIRE(report.insights.total_stocks == 1);

        nlohmann::json j = report.to_json();
        REQUIRE(j["risk_metrics"].contains("THYAO"));
        REQUIRE_THAT(j["risk_metrics"]["THYAO"]["current_performance"].get<double>(), WithinAbs(20.0, 1e-9));
    }

    SECTION("Sectors fall back without a lookup") {
        auto sectors = engine.sector_analysis(as_of);
        REQUIRE(sectors.success);
        REQUIRE(sectors.resolved.at("THYAO").source == "fallback");
        REQUIRE_THAT(sectors.sectors.at("Unknown").value, WithinAbs(6000.0, 1e-9));
        REQUIRE(sectors.diversification_score == 0);
    }

    SECTION("Dashboard") {
        DashboardMetrics m = engine.dashboard(as_of);
        REQUIRE(m.success);
        REQUIRE(m.as_of == "2024-01-10");
        REQUIRE(m.health.score == 10 + 40 + 20);
        REQUIRE(m.top_performers.size() == 1);
        REQUIRE_THAT(m.top_performers.front().performance_30d, WithinAbs(20.0, 1e-9));
        REQUIRE_THAT(m.top_performers.front().gain_loss_30d, WithinAbs(1000.0, 1e-9));
        REQUIRE(m.worst_performers.empty());
        REQUIRE(m.concentration.is_concentrated);
        REQUIRE_THAT(m.concentration.max_position_weight, WithinAbs(100.0, 1e-9));
    }

    SECTION("Full report document") {
        nlohmann::json j = engine.report(as_of, d("2024-01-01"), as_of);
        REQUIRE(j["as_of"] == "2024-01-10");
        REQUIRE(j["base_currency"] == "TRY");
        REQUIRE(j["holdings"]["THYAO"] == 50.0);
        REQUIRE(j["cash_balance"] == 5000.0);
        REQUIRE(j["positions"].size() == 1);
        for (const char* key : {"timeline", "risk", "sectors", "dashboard"}) {
            REQUIRE(j.contains(key));
        }
    }
}

TEST_CASE("Dashboard cache", "[PortfolioEngine]") {
    ThyaoFixture f;
    PortfolioEngine engine = f.make_engine();
    const Date as_of = d("2024-01-10");

    DashboardMetrics first = engine.dashboard(as_of);
    REQUIRE(first.success);
    REQUIRE(f.dashboard_cache.size() == 1);

    // A late correction to the last close is not visible while the entry is fresh
    f.prices.add_close("THYAO", as_of, 90.0);
    *f.now += 29s;
    DashboardMetrics cached = engine.dashboard(as_of);
    REQUIRE_THAT(cached.top_performers.front().current_price, WithinAbs(120.0, 1e-9));

    *f.now += 1s;
    DashboardMetrics fresh = engine.dashboard(as_of);
    REQUIRE(fresh.top_performers.empty());
    REQUIRE(fresh.worst_performers.size() == 1);
    REQUIRE_THAT(fresh.worst_performers.front().current_price, WithinAbs(90.0, 1e-9));

    SECTION("Failures are not cached") {
        DashboardMetrics empty = engine.dashboard(d("2023-12-31"));
        REQUIRE_FALSE(empty.success);
        REQUIRE(empty.message == "No stocks currently held in portfolio");
        REQUIRE(f.dashboard_cache.size() == 1);
    }
}

TEST_CASE("Risk report skips symbols it cannot score", "[PortfolioEngine]") {
    ThyaoFixture f;
    f.history.append(buy("NOPRC", 10, 20, "2024-01-06"));
    f.history.append(buy("SHORT", 10, 20, "2024-01-06"));
    f.prices.add_close("SHORT", d("2024-01-09"), 21.0);
    f.prices.add_close("SHORT", d("2024-01-10"), 22.0);

    PortfolioEngine engine = f.make_engine();
    RiskReport report = engine.risk_report(d("2024-01-10"));
    REQUIRE(report.success);
    REQUIRE(report.bundles.size() == 1);
    REQUIRE(report.skipped == std::vector<std::string>{"NOPRC", "SHORT"});

    SECTION("A stricter minimum leaves nothing to score") {
        EngineConfig config;
        config.risk.min_observations = 20;
        RiskReport strict = f.make_engine(config).risk_report(d("2024-01-10"));
        REQUIRE_FALSE(strict.success);
        REQUIRE(strict.message == "Insufficient data for risk analysis");
        REQUIRE(strict.skipped.size() == 3);
    }
}

TEST_CASE("Risk metrics follow the configured return source", "[PortfolioEngine]") {
    ThyaoFixture f;
    const Date as_of = d("2024-01-10");

    RiskReport from_cost = f.make_engine().risk_report(as_of);

    EngineConfig config;
    config.risk.return_source = analytics::ReturnSource::MARKET;
    RiskReport from_market = f.make_engine(config).risk_report(as_of);

    REQUIRE(from_cost.success);
    REQUIRE(from_market.success);
    const auto& cost_profile = from_cost.bundles.front().profile;
    const auto& market_profile = from_market.bundles.front().profile;

    // The cost-based series opens with a flat 100 -> 100 step, the market one starts at 100 -> 104
    REQUIRE(cost_profile.observations == 6);
    REQUIRE(market_profile.observations == 5);
    REQUIRE(market_profile.volatility < cost_profile.volatility);
    REQUIRE_THAT(market_profile.var_95, !WithinAbs(cost_profile.var_95, 1e-9));

    // Growth figures come from the position, not the series
    REQUIRE_THAT(market_profile.annualized_return, WithinAbs(cost_profile.annualized_return, 1e-9));
}

TEST_CASE("Percentage corporate events reach the engine through the ledger", "[PortfolioEngine]") {
    ThyaoFixture f;
    std::vector<corporate::PercentageEvent> events = {
        {"THYAO", d("2024-01-08"), corporate::PercentageEvent::Kind::DIVIDEND, 10.0},
        {"NOPE", d("2024-01-09"), corporate::PercentageEvent::Kind::DIVIDEND, 5.0},
        {"THYAO", d("2024-01-07"), corporate::PercentageEvent::Kind::SPLIT, 100.0},
    };

    auto results = corporate::apply_percentage_events(f.history, events);
    REQUIRE(results.size() == 3);

    // Date order: the bonus issue lands first, so the dividend counts 100 shares
    REQUIRE(results[0].success);
    REQUIRE(results[0].transaction.type == ledger::TransactionType::SPLIT);
    REQUIRE_THAT(results[0].transaction.quantity, WithinAbs(50.0, 1e-12));
    REQUIRE(results[1].success);
    REQUIRE_THAT(results[1].shares_held, WithinAbs(100.0, 1e-12));
    REQUIRE_THAT(*results[1].transaction.price, WithinAbs(10.0, 1e-12));
    REQUIRE_FALSE(results[2].success);
    REQUIRE(results[2].message == "No shares of NOPE held before 2024-01-09");
    REQUIRE(f.history.size() == 4);

    PortfolioEngine engine = f.make_engine();
    const Date as_of = d("2024-01-10");
    REQUIRE_THAT(engine.holdings(as_of).at("THYAO"), WithinAbs(100.0, 1e-12));
    REQUIRE_THAT(engine.cash_balance(as_of), WithinAbs(5010.0, 1e-9));

    auto positions = engine.positions(as_of);
    REQUIRE(positions.size() == 1);
    REQUIRE_THAT(positions.front().cost_basis, WithinAbs(5000.0, 1e-9));
    REQUIRE_THAT(positions.front().average_purchase_price, WithinAbs(50.0, 1e-9));
}

TEST_CASE("Timeline failures", "[PortfolioEngine]") {
    ThyaoFixture f;
    PortfolioEngine engine = f.make_engine();

    SECTION("End before start") {
        auto t = engine.timeline(d("2024-01-10"), d("2024-01-01"));
        REQUIRE_FALSE(t.success);
        REQUIRE_THAT(t.message, Catch::Matchers::ContainsSubstring("precedes"));
    }

    SECTION("No price data in range") {
        auto t = engine.timeline(d("2023-06-01"), d("2023-06-30"));
        REQUIRE_FALSE(t.success);
        REQUIRE(t.message == "No price data between 2023-06-01 and 2023-06-30");
    }

    SECTION("Cash-only ledger") {
        ledger::Ledger cash_only({deposit(500, "2024-01-01")});
        PortfolioEngine e(cash_only, f.prices, nullptr, nullptr, f.dashboard_cache, f.sector_cache);
        auto t = e.timeline(d("2024-01-01"), d("2024-01-10"));
        REQUIRE_FALSE(t.success);
        REQUIRE(t.message == "No securities in ledger");
    }
}

TEST_CASE("Registered splits adjust prices read by the engine", "[PortfolioEngine]") {
    // CCOLA 1:11 on 2024-08-01 ships in the default registry
    ledger::Ledger history({buy("CCOLA", 10, 550, "2024-07-01"), split("CCOLA", 100, "2024-08-01")});
    InMemoryPriceProvider prices;
    prices.add_close("CCOLA", d("2024-07-01"), 550.0);
    prices.add_close("CCOLA", d("2024-07-31"), 550.0);
    prices.add_close("CCOLA", d("2024-08-01"), 50.0);
    prices.add_close("CCOLA", d("2024-08-02"), 52.0);

    TtlCache<DashboardMetrics> dashboard_cache(30s);
    TtlCache<data::SectorInfo> sector_cache(std::chrono::hours(24));

    SECTION("Default registry") {
        PortfolioEngine engine(history, prices, nullptr, nullptr, dashboard_cache, sector_cache);
        PriceSeries adjusted = engine.adjusted_series("CCOLA", d("2024-07-01"), d("2024-08-02"));
        REQUIRE_THAT(adjusted.asof(d("2024-07-31"))->close, WithinAbs(50.0, 1e-9));
        REQUIRE_THAT(adjusted.asof(d("2024-08-02"))->close, WithinAbs(52.0, 1e-9));
        REQUIRE_THAT(engine.latest_price("CCOLA", d("2024-07-31")).value(), WithinAbs(50.0, 1e-9));

        auto positions = engine.positions(d("2024-08-02"));
        REQUIRE(positions.size() == 1);
        REQUIRE_THAT(positions.front().quantity, WithinAbs(110.0, 1e-9));
        REQUIRE_THAT(positions.front().cost_basis, WithinAbs(5500.0, 1e-9));
        REQUIRE_THAT(positions.front().average_purchase_price, WithinAbs(50.0, 1e-9));
        REQUIRE_THAT(positions.front().return_percentage, WithinAbs(4.0, 1e-9));
    }

    SECTION("Empty registry leaves raw prices") {
        EngineConfig config;
        config.corporate_actions = corporate::SplitRegistry();
        PortfolioEngine engine(history, prices, nullptr, nullptr, dashboard_cache, sector_cache, config);
        REQUIRE_THAT(engine.latest_price("CCOLA", d("2024-07-31")).value(), WithinAbs(550.0, 1e-9));
    }
}
