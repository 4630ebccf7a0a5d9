// SPDX-License-Identifier: MIT
/**
 * @file risk_score.cpp
 * @brief Implementation of the risk score and performance grade
 */

#include "scoring/risk_score.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace tracker
{
    namespace scoring
    {
        // ============================================================================
        // Risk score
        // ============================================================================

        nlohmann::json RiskScore::to_json() const
        {
            nlohmann::json j;
            j["risk_score"] = score;
            j["risk_category"] = category;
            j["risk_description"] = description;
            j["component_scores"] = components;
            return j;
        }

        RiskScore calculate_risk_score(const RiskScoreInputs &inputs, const ScoringTables &tables)
        {
            RiskScore result;
            result.components["volatility"] = tables.risk_volatility.score(inputs.volatility);
            result.components["sharpe_ratio"] = tables.risk_sharpe.score(inputs.sharpe_ratio);
            result.components["max_drawdown"] = tables.risk_drawdown.score(inputs.max_drawdown);
            result.components["sortino_ratio"] = tables.risk_sortino.score(inputs.sortino_ratio.value_or(0.0));
            result.components["beta"] = tables.risk_beta.score(inputs.beta.value_or(1.0));
            result.components["momentum_6m"] = tables.risk_momentum.score(inputs.momentum_6m.value_or(0.0));
            result.components["annual_return"] = tables.risk_annual_return.score(inputs.annual_return);

            int total = tables.risk_base_score;
            for (const auto &kv : result.components)
            {
                total += kv.second;
            }
            result.score = std::max(0, std::min(100, total));

            if (tables.risk_categories.empty())
            {
                throw std::invalid_argument("Scoring tables define no risk categories");
            }
            const RiskCategory *bucket = &tables.risk_categories.back();
            for (const auto &category : tables.risk_categories)
            {
                if (result.score >= category.min_score)
                {
                    bucket = &category;
                    break;
                }
            }
            result.category = bucket->category;
            result.description = bucket->description;
            return result;
        }

        // ============================================================================
        // Performance grade
        // ============================================================================

        nlohmann::json PerformanceGrade::to_json() const
        {
            nlohmann::json j;
            j["grade"] = grade;
            j["grade_points"] = grade_points;
            j["description"] = description;
            j["investment_tier"] = investment_tier;
            j["recommendation"] = recommendation;
            j["total_score"] = total_score;
            j["component_scores"] = components;
            j["risk_quality"] = risk_quality;
            j["return_quality"] = return_quality;
            j["overall_assessment"] = overall_assessment;
            return j;
        }

        PerformanceGrade grade_performance(const GradeInputs &inputs, const ScoringTables &tables)
        {
            PerformanceGrade result;
            result.components["return"] = tables.grade_return.score(inputs.annual_return);
            result.components["sharpe"] = tables.grade_sharpe.score(inputs.sharpe_ratio);
            result.components["volatility"] = tables.grade_volatility.score(inputs.volatility);
            result.components["drawdown"] = tables.grade_drawdown.score(inputs.max_drawdown);
            result.components["sortino"] = tables.grade_sortino.score(inputs.sortino_ratio);

            for (const auto &kv : result.components)
            {
                result.total_score += kv.second;
            }

            if (tables.grade_cutoffs.empty())
            {
                throw std::invalid_argument("Scoring tables define no grade cutoffs");
            }
            const GradeCutoff *cutoff = &tables.grade_cutoffs.back();
            for (const auto &candidate : tables.grade_cutoffs)
            {
                if (result.total_score >= candidate.min_score)
                {
                    cutoff = &candidate;
                    break;
                }
            }
            result.grade = cutoff->grade;
            result.grade_points = cutoff->grade_points;
            result.description = cutoff->description;
            result.investment_tier = cutoff->tier;
            result.recommendation = cutoff->recommendation;

            if (inputs.risk_score >= 70)
                result.risk_quality = "Low";
            else if (inputs.risk_score >= 50)
                result.risk_quality = "Moderate";
            else
                result.risk_quality = "High";

            if (inputs.annual_return > 20)
                result.return_quality = "Excellent";
            else if (inputs.annual_return > 10)
                result.return_quality = "Good";
            else if (inputs.annual_return > 0)
                result.return_quality = "Fair";
            else
                result.return_quality = "Poor";

            std::string risk_lower = result.risk_quality;
            std::transform(risk_lower.begin(), risk_lower.end(), risk_lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            result.overall_assessment = result.return_quality + " returns with " + risk_lower + " risk";
            return result;
        }

    } // namespace scoring
} // namespace tracker
