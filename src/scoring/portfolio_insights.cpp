// SPDX-License-Identifier: MIT
/**
 * @file portfolio_insights.cpp
 * @brief Implementation of portfolio-level insights
 */

#include "scoring/portfolio_insights.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

#include "analytics/return_series.hpp"

namespace tracker
{
    namespace scoring
    {
        nlohmann::json ScoringBundle::to_json() const
        {
            nlohmann::json j;
            j["symbol"] = symbol;
            j["volatility"] = profile.volatility;
            j["annualized_return"] = profile.annualized_return;
            j["sharpe_ratio"] = profile.sharpe_ratio;
            j["max_drawdown"] = profile.max_drawdown;
            j["var_95"] = profile.var_95;
            if (profile.sortino_ratio)
            {
                j["sortino_ratio"] = *profile.sortino_ratio;
            }
            j["current_performance"] = position.return_percentage;
            j["days_held"] = position.days_held;
            j["cost_basis"] = position.cost_basis;
            j["current_value"] = position.current_value;
            j["user_avg_price"] = position.average_purchase_price;
            j["risk_score"] = risk.score;
            j["risk_category"] = risk.category;
            j["risk_description"] = risk.description;
            j["investment_signal"] = signal.to_json();
            j["performance_grade"] = grade.to_json();
            j["position_recommendation"] = recommendation.to_json();
            return j;
        }

        ScoringBundle score_position(const analytics::PositionPerformance &position,
                                     const std::vector<double> &prices,
                                     const analytics::RiskSettings &settings,
                                     const ScoringTables &tables)
        {
            ScoringBundle bundle;
            bundle.symbol = position.symbol;
            bundle.position = position;

            if (position.average_purchase_price <= 0.0)
            {
                bundle.profile.message = "No cost basis for " + position.symbol;
                return bundle;
            }

            const Eigen::VectorXd returns =
                settings.return_source == analytics::ReturnSource::MARKET
                    ? analytics::market_returns(prices)
                    : analytics::cost_basis_returns(prices, position.average_purchase_price);

            analytics::GrowthInputs growth;
            growth.cost_basis = position.cost_basis;
            growth.current_value = position.current_value;
            growth.days_held = position.days_held;

            bundle.profile = analytics::risk_metrics(returns, growth, settings);
            if (!bundle.profile.success)
            {
                return bundle;
            }

            const auto &profile = bundle.profile;

            RiskScoreInputs risk_inputs;
            risk_inputs.volatility = profile.volatility;
            risk_inputs.sharpe_ratio = profile.sharpe_ratio;
            risk_inputs.max_drawdown = profile.max_drawdown;
            risk_inputs.annual_return = profile.annualized_return;
            risk_inputs.sortino_ratio = profile.sortino_ratio;
            bundle.risk = calculate_risk_score(risk_inputs, tables);

            GradeInputs grade_inputs;
            grade_inputs.annual_return = profile.annualized_return;
            grade_inputs.volatility = profile.volatility;
            grade_inputs.sharpe_ratio = profile.sharpe_ratio;
            grade_inputs.sortino_ratio = profile.sortino_ratio.value_or(0.0);
            grade_inputs.max_drawdown = profile.max_drawdown;
            grade_inputs.risk_score = bundle.risk.score;
            bundle.grade = grade_performance(grade_inputs, tables);

            SignalInputs signal_inputs;
            signal_inputs.performance = position.return_percentage;
            signal_inputs.volatility = profile.volatility;
            signal_inputs.sharpe_ratio = profile.sharpe_ratio;
            signal_inputs.max_drawdown = profile.max_drawdown;
            signal_inputs.annual_return = profile.annualized_return;
            signal_inputs.days_held = std::max(position.days_held, 1);
            signal_inputs.risk_score = bundle.risk.score;
            signal_inputs.grade_points = bundle.grade.grade_points;
            bundle.signal = investment_signal(signal_inputs);

            bundle.recommendation = recommend_position_size(bundle.risk.score, position.return_percentage);
            return bundle;
        }

        PortfolioGrade grade_portfolio(double weighted_return, double weighted_volatility, double average_sharpe)
        {
            if (weighted_return > 15 && weighted_volatility < 30 && average_sharpe > 0.5)
                return {"A", "Excellent portfolio performance"};
            if (weighted_return > 10 && weighted_volatility < 40)
                return {"B+", "Good portfolio performance"};
            if (weighted_return > 5)
                return {"B", "Fair portfolio performance"};
            if (weighted_return > 0)
                return {"C", "Below average performance"};
            return {"D", "Poor portfolio performance"};
        }

        PortfolioStrategy select_strategy(size_t strong_buys, size_t buy_more, size_t holds,
                                          size_t consider_sells, double weighted_return,
                                          double weighted_volatility)
        {
            const double total = static_cast<double>(strong_buys + buy_more + holds + consider_sells);

            if (strong_buys > 0 && weighted_return > 10)
                return {"AGGRESSIVE_GROWTH",
                        "Focus on " + std::to_string(strong_buys) + " strong performers. Consider increasing positions."};
            if (static_cast<double>(buy_more) > total * 0.4)
                return {"MODERATE_GROWTH",
                        "Good opportunity to increase positions in " + std::to_string(buy_more) + " stocks."};
            if (static_cast<double>(consider_sells) > total * 0.3)
                return {"PORTFOLIO_CLEANUP",
                        "Consider reducing or selling " + std::to_string(consider_sells) + " underperforming stocks."};
            if (weighted_volatility > 50)
                return {"RISK_REDUCTION", "High portfolio volatility. Focus on stability and risk management."};
            return {"BALANCED_HOLD", "Maintain current positions and monitor performance."};
        }

        PortfolioInsights portfolio_insights(const std::vector<ScoringBundle> &bundles)
        {
            PortfolioInsights insights;
            if (bundles.empty())
            {
                insights.message = "No scored positions";
                return insights;
            }

            double return_sum = 0.0;
            double volatility_sum = 0.0;
            double sharpe_sum = 0.0;
            for (const auto &bundle : bundles)
            {
                const double value = bundle.position.current_value;
                insights.total_value += value;
                return_sum += bundle.profile.annualized_return * value;
                volatility_sum += bundle.profile.volatility * value;
                sharpe_sum += bundle.profile.sharpe_ratio;

                switch (bundle.signal.action)
                {
                case SignalAction::STRONG_BUY:
                    insights.strong_buys.push_back(bundle.symbol);
                    break;
                case SignalAction::BUY_MORE:
                    insights.buy_more.push_back(bundle.symbol);
                    break;
                case SignalAction::HOLD:
                    insights.holds.push_back(bundle.symbol);
                    break;
                case SignalAction::CONSIDER_SELL:
                case SignalAction::REDUCE_POSITION:
                    insights.consider_sells.push_back(bundle.symbol);
                    break;
                default:
                    break;
                }
            }

            if (insights.total_value > 0.0)
            {
                insights.weighted_annual_return = return_sum / insights.total_value;
                insights.weighted_volatility = volatility_sum / insights.total_value;
            }
            insights.average_sharpe = sharpe_sum / static_cast<double>(bundles.size());
            insights.total_stocks = static_cast<int>(bundles.size());
            insights.grade = grade_portfolio(insights.weighted_annual_return, insights.weighted_volatility,
                                             insights.average_sharpe);
            insights.strategy = select_strategy(insights.strong_buys.size(), insights.buy_more.size(),
                                                insights.holds.size(), insights.consider_sells.size(),
                                                insights.weighted_annual_return, insights.weighted_volatility);

            double high_risk_value = 0.0;
            for (const auto &bundle : bundles)
            {
                if (bundle.risk.score < 40)
                {
                    insights.high_risk_stocks.push_back(bundle.symbol);
                    high_risk_value += bundle.position.current_value;
                }
            }
            insights.high_risk_exposure_percent =
                insights.total_value > 0.0 ? high_risk_value / insights.total_value * 100.0 : 0.0;
            if (insights.high_risk_exposure_percent > 40)
                insights.risk_level = "HIGH";
            else if (insights.high_risk_exposure_percent > 20)
                insights.risk_level = "MEDIUM";
            else
                insights.risk_level = "LOW";

            insights.success = true;
            insights.message = "OK";
            return insights;
        }

        nlohmann::json PortfolioInsights::to_json() const
        {
            nlohmann::json j;
            j["success"] = success;
            if (!success)
            {
                j["message"] = message;
                return j;
            }
            j["portfolio_summary"] = {
                {"total_value", total_value},
                {"weighted_annual_return", weighted_annual_return},
                {"weighted_volatility", weighted_volatility},
                {"average_sharpe_ratio", average_sharpe},
                {"portfolio_grade", {{"grade", grade.grade}, {"description", grade.description}}}};
            j["action_summary"] = {
                {"strong_buys", strong_buys},
                {"buy_more", buy_more},
                {"holds", holds},
                {"consider_sells", consider_sells},
                {"strong_buy_count", strong_buys.size()},
                {"total_stocks", total_stocks}};
            j["risk_analysis"] = {
                {"high_risk_stocks", high_risk_stocks},
                {"high_risk_exposure_percent", high_risk_exposure_percent},
                {"risk_level", risk_level}};
            j["strategy_recommendation"] = {{"strategy", strategy.strategy}, {"description", strategy.description}};
            return j;
        }

        void PortfolioInsights::print_summary() const
        {
            std::cout << "\n=== Portfolio Insights ===\n";
            if (!success)
            {
                std::cout << message << "\n";
                return;
            }
            std::cout << std::fixed << std::setprecision(2);
            std::cout << "Total value:            " << total_value << "\n";
            std::cout << "Weighted annual return: " << weighted_annual_return << "%\n";
            std::cout << "Weighted volatility:    " << weighted_volatility << "%\n";
            std::cout << "Average Sharpe:         " << average_sharpe << "\n";
            std::cout << "Grade:                  " << grade.grade << " (" << grade.description << ")\n";
            std::cout << "Risk level:             " << risk_level << "\n";
            std::cout << "Strategy:               " << strategy.strategy << "\n";
            std::cout << "==========================\n";
        }

    } // namespace scoring
} // namespace tracker
