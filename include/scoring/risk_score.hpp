// SPDX-License-Identifier: MIT
/**
 * @file risk_score.hpp
 * @brief 0-100 risk score and letter grade derived from a risk profile.
 */

#ifndef TRACKER_SCORING_RISK_SCORE_HPP
#define TRACKER_SCORING_RISK_SCORE_HPP

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "scoring/scoring_tables.hpp"

namespace tracker
{
    namespace scoring
    {
        /**
         * @struct RiskScoreInputs
         * @brief Metrics the risk score is built from (percent where applicable).
         *
         * Absent optional metrics score as sortino 0, beta 1 and momentum 0.
         */
        struct RiskScoreInputs
        {
            double volatility = 0.0;
            double sharpe_ratio = 0.0;
            double max_drawdown = 0.0;
            double annual_return = 0.0;
            std::optional<double> sortino_ratio;
            std::optional<double> beta;
            std::optional<double> momentum_6m;
        };

        /**
         * @struct RiskScore
         * @brief Clamped score, its bucket and the points of each component.
         */
        struct RiskScore
        {
            int score = 0;
            std::string category;
            std::string description;
            std::map<std::string, int> components;

            nlohmann::json to_json() const;
        };

        /// Higher is safer; clamped to [0, 100].
        RiskScore calculate_risk_score(const RiskScoreInputs &inputs,
                                       const ScoringTables &tables = ScoringTables::defaults());

        /**
         * @struct GradeInputs
         * @brief Metrics the performance grade is built from.
         */
        struct GradeInputs
        {
            double annual_return = 0.0;
            double volatility = 0.0;
            double sharpe_ratio = 0.0;
            double sortino_ratio = 0.0;
            double max_drawdown = 0.0;
            int risk_score = 50;
        };

        /**
         * @struct PerformanceGrade
         * @brief Weighted score out of 100 and the grade it maps to.
         */
        struct PerformanceGrade
        {
            std::string grade;
            double grade_points = 0.0;
            std::string description;
            std::string investment_tier;
            std::string recommendation;
            int total_score = 0;
            std::map<std::string, int> components;
            std::string risk_quality;   ///< Low, Moderate or High
            std::string return_quality; ///< Excellent, Good, Fair or Poor
            std::string overall_assessment;

            nlohmann::json to_json() const;
        };

        PerformanceGrade grade_performance(const GradeInputs &inputs,
                                           const ScoringTables &tables = ScoringTables::defaults());

    } // namespace scoring
} // namespace tracker

#endif // TRACKER_SCORING_RISK_SCORE_HPP
