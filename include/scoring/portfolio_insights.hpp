// SPDX-License-Identifier: MIT
/**
 * @file portfolio_insights.hpp
 * @brief Per-symbol scoring bundle and the portfolio-level summary built from it.
 */

#ifndef TRACKER_SCORING_PORTFOLIO_INSIGHTS_HPP
#define TRACKER_SCORING_PORTFOLIO_INSIGHTS_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "analytics/position_performance.hpp"
#include "analytics/risk_metrics.hpp"
#include "scoring/investment_signal.hpp"
#include "scoring/risk_score.hpp"

namespace tracker
{
    namespace scoring
    {
        /**
         * @struct ScoringBundle
         * @brief Everything the pipeline derives for one held symbol.
         */
        struct ScoringBundle
        {
            std::string symbol;
            analytics::RiskProfile profile;
            analytics::PositionPerformance position;
            RiskScore risk;
            PerformanceGrade grade;
            InvestmentSignal signal;
            PositionRecommendation recommendation;

            nlohmann::json to_json() const;
        };

        /**
         * @brief Run the risk, grade and signal pipeline for one held position.
         *
         * Returns are measured against the position's average cost. The bundle's
         * profile carries success = false when the position has no cost, or when
         * @p prices yield fewer returns than settings.min_observations.
         *
         * @param position Performance of the position as of the scoring date
         * @param prices Split-adjusted closes over the lookback window, oldest first
         * @param settings Risk settings (sample size, annualization, Sortino)
         * @param tables Scoring bands
         */
        ScoringBundle score_position(const analytics::PositionPerformance &position,
                                     const std::vector<double> &prices,
                                     const analytics::RiskSettings &settings = analytics::RiskSettings(),
                                     const ScoringTables &tables = ScoringTables::defaults());

        struct PortfolioGrade
        {
            std::string grade;
            std::string description;
        };

        struct PortfolioStrategy
        {
            std::string strategy;
            std::string description;
        };

        /**
         * @struct PortfolioInsights
         * @brief Value-weighted view over all scored symbols.
         */
        struct PortfolioInsights
        {
            bool success = false;
            std::string message;

            double total_value = 0.0;
            double weighted_annual_return = 0.0;
            double weighted_volatility = 0.0;
            double average_sharpe = 0.0;
            PortfolioGrade grade;

            std::vector<std::string> strong_buys;
            std::vector<std::string> buy_more;
            std::vector<std::string> holds;
            std::vector<std::string> consider_sells; ///< CONSIDER_SELL and REDUCE_POSITION
            int total_stocks = 0;

            std::vector<std::string> high_risk_stocks; ///< risk score below 40
            double high_risk_exposure_percent = 0.0;
            std::string risk_level;                    ///< HIGH, MEDIUM or LOW

            PortfolioStrategy strategy;

            nlohmann::json to_json() const;
            void print_summary() const;
        };

        PortfolioGrade grade_portfolio(double weighted_return, double weighted_volatility, double average_sharpe);

        PortfolioStrategy select_strategy(size_t strong_buys, size_t buy_more, size_t holds,
                                          size_t consider_sells, double weighted_return,
                                          double weighted_volatility);

        /// Fails with success = false when @p bundles is empty.
        PortfolioInsights portfolio_insights(const std::vector<ScoringBundle> &bundles);

    } // namespace scoring
} // namespace tracker

#endif // TRACKER_SCORING_PORTFOLIO_INSIGHTS_HPP
