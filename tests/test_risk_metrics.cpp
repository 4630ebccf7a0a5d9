// SPDX-License-Identifier: MIT
/**
 * @file test_risk_metrics.cpp
 * @brief Unit tests for return series and risk metrics
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <Eigen/Dense>
#include "analytics/return_series.hpp"
#include "analytics/risk_metrics.hpp"

using namespace tracker::analytics;
using Catch::Matchers::WithinAbs;

namespace {

Eigen::VectorXd vec(std::initializer_list<double> values) {
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double x : values) v(i++) = x;
    return v;
}

} // namespace

TEST_CASE("Return series", "[Returns]") {
    SECTION("Market returns are day over day") {
        Eigen::VectorXd r = market_returns({100, 110, 99});
        REQUIRE(r.size() == 2);
        REQUIRE_THAT(r(0), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(r(1), WithinAbs(-0.10, 1e-12));
        REQUIRE(market_returns({100}).size() == 0);
    }

    SECTION("Cost basis returns start from the average cost") {
        Eigen::VectorXd r = cost_basis_returns({110, 121}, 100.0);
        REQUIRE(r.size() == 2);
        REQUIRE_THAT(r(0), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(r(1), WithinAbs(0.10, 1e-12));
    }

    SECTION("Non-positive references are skipped") {
        REQUIRE(cost_basis_returns({110, 121}, 0.0).size() == 1);
        REQUIRE(market_returns({0, 10, 20}).size() == 1);
    }
}

TEST_CASE("Volatility uses the population standard deviation", "[RiskMetrics]") {
    RiskMetrics metrics(vec({0.01, -0.02, 0.03, 0.0, 0.01}));
    const double expected = std::sqrt(2.64e-4) * std::sqrt(252.0) * 100.0;
    REQUIRE_THAT(metrics.volatility(), WithinAbs(expected, 1e-9));

    RiskMetrics flat(vec({0.01, 0.01, 0.01}));
    REQUIRE_THAT(flat.volatility(), WithinAbs(0.0, 1e-12));
}

TEST_CASE("Drawdown", "[RiskMetrics]") {
    SECTION("Monotone growth has no drawdown") {
        RiskMetrics metrics(vec({0.01, 0.02, 0.01, 0.03, 0.01}));
        REQUIRE(metrics.max_drawdown() == 0.0);
        for (double dd : metrics.drawdown_series()) {
            REQUIRE(dd <= 0.0);
        }
    }

    SECTION("A first-day loss counts against the initial wealth") {
        RiskMetrics metrics(vec({-0.10, 0.05, 0.02}));
        REQUIRE_THAT(metrics.max_drawdown(), WithinAbs(-10.0, 1e-9));
        DrawdownInfo info = metrics.max_drawdown_info();
        REQUIRE(info.peak_index == 0);
        REQUIRE(info.trough_index == 1);
    }

    SECTION("Peak to trough after a rally") {
        RiskMetrics metrics(vec({0.10, 0.10, -0.20, -0.05, 0.30}));
        auto wealth = metrics.wealth_index();
        REQUIRE(wealth.size() == 6);
        const double expected = (1.21 * 0.8 * 0.95 / 1.21 - 1.0) * 100.0;
        REQUIRE_THAT(metrics.max_drawdown(), WithinAbs(expected, 1e-9));
        REQUIRE(metrics.max_drawdown_info().peak_index == 2);
        REQUIRE(metrics.max_drawdown_info().trough_index == 4);
    }
}

TEST_CASE("Value at risk interpolates the lower tail", "[RiskMetrics]") {
    RiskMetrics metrics(vec({0.01, -0.02, 0.03, 0.0, 0.01}));
    // sorted: -0.02, 0, 0.01, 0.01, 0.03; position 0.05 * 4 = 0.2
    REQUIRE_THAT(metrics.value_at_risk(0.95), WithinAbs(-1.6, 1e-9));
    REQUIRE_THROWS_AS(metrics.value_at_risk(1.0), std::invalid_argument);
}

TEST_CASE("Compound annual growth", "[RiskMetrics]") {
    REQUIRE_THAT(compound_annual_growth(6000, 5000, 365), WithinAbs(20.0, 1e-9));
    REQUIRE(compound_annual_growth(6000, 0, 365) == 0.0);
    REQUIRE(compound_annual_growth(6000, 5000, 0) == 0.0);
    REQUIRE(compound_annual_growth(0, 5000, 30) == 0.0);
}

TEST_CASE("Risk profile pipeline step", "[RiskMetrics]") {
    const Eigen::VectorXd returns = vec({0.01, -0.02, 0.03, 0.0, 0.01});

    SECTION("Insufficient data is a structured failure") {
        RiskProfile profile = risk_metrics(vec({0.01, 0.02, 0.03, 0.04}));
        REQUIRE_FALSE(profile.success);
        REQUIRE(profile.message.rfind("Insufficient data", 0) == 0);
        REQUIRE(profile.observations == 4);
    }

    SECTION("Growth inputs drive the annual return and Sharpe ratio") {
        RiskProfile profile = risk_metrics(returns, GrowthInputs{5000.0, 6000.0, 365});
        REQUIRE(profile.success);
        REQUIRE_THAT(profile.annualized_return, WithinAbs(20.0, 1e-9));
        REQUIRE_THAT(profile.sharpe_ratio, WithinAbs(20.0 / profile.volatility, 1e-12));
        REQUIRE(profile.max_drawdown <= 0.0);
        REQUIRE_THAT(profile.var_95, WithinAbs(-1.6, 1e-9));
        REQUIRE_FALSE(profile.sortino_ratio.has_value());
    }

    SECTION("Without growth inputs the series is annualized geometrically") {
        RiskProfile profile = risk_metrics(returns);
        RiskMetrics metrics(returns);
        REQUIRE_THAT(profile.annualized_return, WithinAbs(metrics.annualized_return(), 1e-12));
    }

    SECTION("Sortino on request") {
        RiskSettings settings;
        settings.compute_sortino = true;
        RiskProfile profile = risk_metrics(returns, GrowthInputs{5000.0, 6000.0, 365}, settings);
        REQUIRE(profile.sortino_ratio.has_value());
        RiskMetrics metrics(returns);
        REQUIRE_THAT(*profile.sortino_ratio, WithinAbs(20.0 / metrics.downside_deviation(), 1e-12));
    }

    SECTION("Configurable sample size") {
        RiskSettings settings;
        settings.min_observations = 10;
        REQUIRE_FALSE(risk_metrics(returns, std::nullopt, settings).success);
    }

    SECTION("Settings validation") {
        REQUIRE_THROWS_AS(RiskSettings::from_json({{"min_observations", 0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(RiskSettings::from_json({{"var_confidence", 1.5}}), std::invalid_argument);
        RiskSettings parsed = RiskSettings::from_json({{"include_sortino", true}, {"lookback_days", 180}});
        REQUIRE(parsed.compute_sortino);
        REQUIRE(parsed.lookback_days == 180);
        REQUIRE(parsed.min_observations == 5);
    }

    REQUIRE_THROWS_AS(RiskMetrics(Eigen::VectorXd()), std::invalid_argument);
}
