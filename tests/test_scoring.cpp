// SPDX-License-Identifier: MIT
/**
 * @file test_scoring.cpp
 * @brief Unit tests for risk scores, performance grades and portfolio insights
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <nlohmann/json.hpp>
#include "scoring/portfolio_insights.hpp"
#include "scoring/risk_score.hpp"
#include "scoring/scoring_tables.hpp"

using namespace tracker::scoring;
using Catch::Matchers::WithinAbs;

namespace {

// Components: vol 0, sharpe 5, drawdown 0, sortino -5, beta 8, momentum 3, return -5
RiskScoreInputs moderate_inputs() {
    RiskScoreInputs in;
    in.volatility = 45.0;
    in.sharpe_ratio = 0.3;
    in.max_drawdown = -30.0;
    in.annual_return = -5.0;
    return in;
}

ScoringBundle bundle(const std::string &symbol, double value, double annual_return,
                     double volatility, double sharpe, SignalAction action, int risk_score) {
    ScoringBundle b;
    b.symbol = symbol;
    b.position.symbol = symbol;
    b.position.current_value = value;
    b.profile.success = true;
    b.profile.annualized_return = annual_return;
    b.profile.volatility = volatility;
    b.profile.sharpe_ratio = sharpe;
    b.signal.action = action;
    b.risk.score = risk_score;
    return b;
}

} // namespace

TEST_CASE("Band tables", "[ScoringTables]") {
    const ScoringTables t = ScoringTables::defaults();

    SECTION("Above-thresholds are exclusive") {
        REQUIRE(t.risk_sharpe.score(1.6) == 20);
        REQUIRE(t.risk_sharpe.score(1.5) == 15);
        REQUIRE(t.risk_sharpe.score(-0.5) == -15);
    }

    SECTION("Below-thresholds are exclusive") {
        REQUIRE(t.risk_volatility.score(14.9) == 20);
        REQUIRE(t.risk_volatility.score(15.0) == 15);
        REQUIRE(t.risk_volatility.score(70.0) == -20);
    }

    SECTION("Beta bands are inclusive and ordered") {
        REQUIRE(t.risk_beta.score(0.8) == 8);
        REQUIRE(t.risk_beta.score(1.2) == 8);
        REQUIRE(t.risk_beta.score(1.3) == 5);
        REQUIRE(t.risk_beta.score(0.5) == 3);
        REQUIRE(t.risk_beta.score(2.0) == -5);
    }
}

TEST_CASE("Scoring tables from JSON", "[ScoringTables]") {
    SECTION("Overrides replace only the named tables") {
        nlohmann::json j = {
            {"risk_base_score", 40},
            {"risk_volatility", {{"bands", {{{"max", 20}, {"points", 30}}}}, {"fallback", -30}}}};
        ScoringTables t = ScoringTables::from_json(j);
        REQUIRE(t.risk_base_score == 40);
        REQUIRE(t.risk_volatility.score(10.0) == 30);
        REQUIRE(t.risk_volatility.score(20.0) == -30);
        REQUIRE(t.risk_sharpe.score(1.2) == 15);
        REQUIRE(t.grade_cutoffs.size() == ScoringTables::defaults().grade_cutoffs.size());
    }

    SECTION("Unbounded edges are written as null") {
        nlohmann::json j = ScoringTables::defaults().to_json();
        REQUIRE(j["risk_sharpe"]["bands"][0]["max"].is_null());
        REQUIRE(j["risk_volatility"]["bands"][0]["min"].is_null());

        ScoringTables back = ScoringTables::from_json(j);
        REQUIRE(back.risk_sharpe.score(2.0) == 20);
        REQUIRE(back.risk_beta.score(1.0) == 8);
    }

    SECTION("Malformed tables are rejected") {
        nlohmann::json inverted = {{"risk_sharpe", {{"bands", {{{"min", 2}, {"max", 1}, {"points", 5}}}}}}};
        REQUIRE_THROWS_AS(ScoringTables::from_json(inverted), std::invalid_argument);

        nlohmann::json no_bands = {{"grade_return", {{"fallback", 0}}}};
        REQUIRE_THROWS_AS(ScoringTables::from_json(no_bands), std::invalid_argument);
    }
}

TEST_CASE("Risk score", "[RiskScore]") {
    SECTION("Strong metrics clamp at 100") {
        RiskScoreInputs in;
        in.volatility = 20.0;
        in.sharpe_ratio = 1.2;
        in.max_drawdown = -8.0;
        in.annual_return = 18.0;
        RiskScore s = calculate_risk_score(in);
        REQUIRE(s.score == 100);
        REQUIRE(s.category == "VERY_LOW");
        REQUIRE(s.components.at("volatility") == 15);
        REQUIRE(s.components.at("annual_return") == 12);
    }

    SECTION("Weak metrics clamp at 0") {
        RiskScoreInputs in;
        in.volatility = 80.0;
        in.sharpe_ratio = -1.0;
        in.max_drawdown = -60.0;
        in.annual_return = -20.0;
        RiskScore s = calculate_risk_score(in);
        REQUIRE(s.score == 0);
        REQUIRE(s.category == "VERY_HIGH");
        REQUIRE(s.description == "High risk investment");
    }

    SECTION("Absent metrics score as neutral values") {
        RiskScore s = calculate_risk_score(moderate_inputs());
        REQUIRE(s.score == 56);
        REQUIRE(s.category == "MODERATE");
        REQUIRE(s.components.at("sortino_ratio") == -5);
        REQUIRE(s.components.at("beta") == 8);
        REQUIRE(s.components.at("momentum_6m") == 3);
    }

    SECTION("Supplied optional metrics are scored") {
        RiskScoreInputs in = moderate_inputs();
        in.sortino_ratio = 1.2;
        in.beta = 1.5;
        in.momentum_6m = 20.0;
        RiskScore s = calculate_risk_score(in);
        REQUIRE(s.components.at("sortino_ratio") == 8);
        REQUIRE(s.components.at("beta") == -5);
        REQUIRE(s.components.at("momentum_6m") == 9);
        REQUIRE(s.score == 56 + 13 - 13 + 6);
    }

    SECTION("Category boundaries are inclusive") {
        ScoringTables t = ScoringTables::defaults();
        t.risk_base_score = 59;
        REQUIRE(calculate_risk_score(moderate_inputs(), t).score == 65);
        REQUIRE(calculate_risk_score(moderate_inputs(), t).category == "LOW");
        t.risk_base_score = 58;
        REQUIRE(calculate_risk_score(moderate_inputs(), t).category == "MODERATE");
    }

    SECTION("Tables without categories are rejected") {
        ScoringTables t = ScoringTables::defaults();
        t.risk_categories.clear();
        REQUIRE_THROWS_AS(calculate_risk_score(moderate_inputs(), t), std::invalid_argument);
    }
}

TEST_CASE("Performance grade", "[RiskScore]") {
    SECTION("Top marks in every bucket") {
        GradeInputs in;
        in.annual_return = 35.0;
        in.sharpe_ratio = 2.5;
        in.volatility = 10.0;
        in.max_drawdown = -5.0;
        in.sortino_ratio = 2.0;
        PerformanceGrade g = grade_performance(in);
        REQUIRE(g.total_score == 100);
        REQUIRE(g.grade == "A+");
        REQUIRE_THAT(g.grade_points, WithinAbs(4.3, 1e-12));
        REQUIRE(g.investment_tier == "TIER_1_PREMIUM");
        REQUIRE(g.risk_quality == "Moderate");
        REQUIRE(g.overall_assessment == "Excellent returns with moderate risk");
    }

    SECTION("Middling metrics") {
        GradeInputs in;
        in.annual_return = 12.0;
        in.sharpe_ratio = 0.8;
        in.volatility = 30.0;
        in.max_drawdown = -15.0;
        in.sortino_ratio = 0.7;
        in.risk_score = 72;
        PerformanceGrade g = grade_performance(in);
        REQUIRE(g.total_score == 20 + 14 + 14 + 8 + 5);
        REQUIRE(g.grade == "B-");
        REQUIRE(g.return_quality == "Good");
        REQUIRE(g.risk_quality == "Low");
    }

    SECTION("Nothing earned is an F") {
        GradeInputs in;
        in.annual_return = -20.0;
        in.sharpe_ratio = -1.0;
        in.volatility = 80.0;
        in.max_drawdown = -60.0;
        in.sortino_ratio = -1.0;
        in.risk_score = 30;
        PerformanceGrade g = grade_performance(in);
        REQUIRE(g.total_score == 0);
        REQUIRE(g.grade == "F");
        REQUIRE(g.recommendation == "Sell immediately");
        REQUIRE(g.overall_assessment == "Poor returns with high risk");
    }
}

TEST_CASE("Portfolio grade and strategy", "[PortfolioInsights]") {
    SECTION("Grade thresholds") {
        REQUIRE(grade_portfolio(20, 25, 1.0).grade == "A");
        REQUIRE(grade_portfolio(20, 35, 0.2).grade == "B+");
        REQUIRE(grade_portfolio(12, 45, 1.0).grade == "B");
        REQUIRE(grade_portfolio(3, 10, 1.0).grade == "C");
        REQUIRE(grade_portfolio(-1, 10, 1.0).grade == "D");
    }

    SECTION("Strategy precedence") {
        PortfolioStrategy s = select_strategy(1, 0, 0, 0, 12, 20);
        REQUIRE(s.strategy == "AGGRESSIVE_GROWTH");
        REQUIRE(s.description == "Focus on 1 strong performers. Consider increasing positions.");

        REQUIRE(select_strategy(1, 3, 1, 0, 5, 20).strategy == "MODERATE_GROWTH");
        REQUIRE(select_strategy(0, 0, 2, 1, 5, 20).strategy == "PORTFOLIO_CLEANUP");
        REQUIRE(select_strategy(0, 0, 3, 0, 5, 60).strategy == "RISK_REDUCTION");
        REQUIRE(select_strategy(0, 1, 3, 0, 5, 20).strategy == "BALANCED_HOLD");
    }
}

TEST_CASE("Portfolio insights", "[PortfolioInsights]") {
    SECTION("Value-weighted aggregation") {
        std::vector<ScoringBundle> bundles = {
            bundle("AAA", 6000.0, 20.0, 20.0, 1.0, SignalAction::BUY_MORE, 70),
            bundle("BBB", 4000.0, -10.0, 50.0, -0.5, SignalAction::CONSIDER_SELL, 30)};

        PortfolioInsights insights = portfolio_insights(bundles);
        REQUIRE(insights.success);
        REQUIRE_THAT(insights.total_value, WithinAbs(10000.0, 1e-9));
        REQUIRE_THAT(insights.weighted_annual_return, WithinAbs(8.0, 1e-9));
        REQUIRE_THAT(insights.weighted_volatility, WithinAbs(32.0, 1e-9));
        REQUIRE_THAT(insights.average_sharpe, WithinAbs(0.25, 1e-12));
        REQUIRE(insights.grade.grade == "B");
        REQUIRE(insights.buy_more == std::vector<std::string>{"AAA"});
        REQUIRE(insights.consider_sells == std::vector<std::string>{"BBB"});
        REQUIRE(insights.strategy.strategy == "MODERATE_GROWTH");

        REQUIRE(insights.high_risk_stocks == std::vector<std::string>{"BBB"});
        REQUIRE_THAT(insights.high_risk_exposure_percent, WithinAbs(40.0, 1e-9));
        REQUIRE(insights.risk_level == "MEDIUM");

        nlohmann::json j = insights.to_json();
        REQUIRE(j["portfolio_summary"]["portfolio_grade"]["grade"] == "B");
        REQUIRE(j["action_summary"]["total_stocks"] == 2);
    }

    SECTION("Reduce-position signals count as sells") {
        std::vector<ScoringBundle> bundles = {
            bundle("CCC", 1000.0, -5.0, 30.0, -0.2, SignalAction::REDUCE_POSITION, 20)};
        PortfolioInsights insights = portfolio_insights(bundles);
        REQUIRE(insights.consider_sells.size() == 1);
        REQUIRE(insights.risk_level == "HIGH");
        REQUIRE(insights.strategy.strategy == "PORTFOLIO_CLEANUP");
    }

    SECTION("Nothing to aggregate") {
        PortfolioInsights insights = portfolio_insights({});
        REQUIRE_FALSE(insights.success);
        REQUIRE(insights.message == "No scored positions");
        REQUIRE(insights.to_json()["success"] == false);
    }
}

TEST_CASE("Scoring a position", "[PortfolioInsights]") {
    tracker::analytics::PositionPerformance position;
    position.success = true;
    position.symbol = "THYAO";
    position.quantity = 10.0;
    position.average_purchase_price = 100.0;
    position.cost_basis = 1000.0;
    position.current_price = 112.0;
    position.current_value = 1120.0;
    position.return_percentage = 12.0;
    position.days_held = 30;

    SECTION("Steady gains produce a full bundle") {
        ScoringBundle b = score_position(position, {102, 104, 106, 108, 110, 112});
        REQUIRE(b.profile.success);
        REQUIRE(b.profile.observations == 6);
        REQUIRE_THAT(b.profile.max_drawdown, WithinAbs(0.0, 1e-12));
        REQUIRE(b.risk.score >= 0);
        REQUIRE(b.risk.score <= 100);
        REQUIRE(b.signal.base_action == SignalAction::HOLD);
        REQUIRE(b.signal.audit_trail.front().rule == "performance");
        REQUIRE_FALSE(b.recommendation.size.empty());

        nlohmann::json j = b.to_json();
        REQUIRE(j["symbol"] == "THYAO");
        REQUIRE(j["user_avg_price"] == 100.0);
        REQUIRE(j.contains("investment_signal"));
        REQUIRE_FALSE(j.contains("sortino_ratio"));
    }

    SECTION("Sortino is reported when enabled") {
        tracker::analytics::RiskSettings settings;
        settings.compute_sortino = true;
        ScoringBundle b = score_position(position, {102, 104, 106, 108, 110, 112}, settings);
        REQUIRE(b.profile.sortino_ratio.has_value());
        REQUIRE(b.to_json().contains("sortino_ratio"));
    }

    SECTION("Too little history") {
        ScoringBundle b = score_position(position, {105, 112});
        REQUIRE_FALSE(b.profile.success);
    }

    SECTION("No cost basis") {
        position.average_purchase_price = 0.0;
        ScoringBundle b = score_position(position, {102, 104, 106, 108, 110, 112});
        REQUIRE_FALSE(b.profile.success);
        REQUIRE(b.profile.message == "No cost basis for THYAO");
    }
}
