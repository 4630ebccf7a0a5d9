// SPDX-License-Identifier: MIT
/**
 * @file scoring_tables.hpp
 * @brief Threshold band tables used by risk scoring and performance grading.
 *
 * Every table is plain data so that configuration can replace it.
 */

#ifndef TRACKER_SCORING_SCORING_TABLES_HPP
#define TRACKER_SCORING_SCORING_TABLES_HPP

#include <limits>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace tracker
{
    namespace scoring
    {
        /**
         * @struct ScoreBand
         * @brief Interval of a metric that is worth a fixed number of points.
         */
        struct ScoreBand
        {
            double lower = -std::numeric_limits<double>::infinity();
            double upper = std::numeric_limits<double>::infinity();
            bool lower_inclusive = false;
            bool upper_inclusive = false;
            int points = 0;

            bool contains(double value) const;

            nlohmann::json to_json() const;
            static ScoreBand from_json(const nlohmann::json &j);
        };

        /**
         * @class BandTable
         * @brief Ordered bands; the first band containing the value wins.
         */
        class BandTable
        {
        public:
            BandTable() = default;
            BandTable(std::vector<ScoreBand> bands, int fallback);

            /// value > threshold, thresholds checked in the given order
            static BandTable above(const std::vector<std::pair<double, int>> &thresholds, int fallback);

            /// value < threshold, thresholds checked in the given order
            static BandTable below(const std::vector<std::pair<double, int>> &thresholds, int fallback);

            int score(double value) const;

            const std::vector<ScoreBand> &bands() const { return bands_; }
            int fallback() const { return fallback_; }

            /// {"bands": [...], "fallback": n}
            nlohmann::json to_json() const;
            static BandTable from_json(const nlohmann::json &j);

        private:
            std::vector<ScoreBand> bands_;
            int fallback_ = 0;
        };

        /**
         * @struct RiskCategory
         * @brief Label of a risk score range starting at min_score.
         */
        struct RiskCategory
        {
            int min_score = 0;
            std::string category;
            std::string description;
        };

        /**
         * @struct GradeCutoff
         * @brief Letter grade awarded from min_score upwards.
         */
        struct GradeCutoff
        {
            int min_score = 0;
            std::string grade;
            double grade_points = 0.0;
            std::string description;
            std::string tier;
            std::string recommendation;
        };

        /**
         * @struct ScoringTables
         * @brief All band tables of the scoring pipeline.
         */
        struct ScoringTables
        {
            int risk_base_score = 50;
            BandTable risk_volatility;
            BandTable risk_sharpe;
            BandTable risk_drawdown;
            BandTable risk_sortino;
            BandTable risk_beta;
            BandTable risk_momentum;
            BandTable risk_annual_return;
            std::vector<RiskCategory> risk_categories; ///< Descending min_score, last is the floor

            BandTable grade_return;
            BandTable grade_sharpe;
            BandTable grade_volatility;
            BandTable grade_drawdown;
            BandTable grade_sortino;
            std::vector<GradeCutoff> grade_cutoffs;    ///< Descending min_score, last is the floor

            static ScoringTables defaults();

            /**
             * @brief Defaults with any table named in @p j replaced.
             *
             * Keys: risk_base_score, risk_volatility, risk_sharpe, risk_drawdown,
             * risk_sortino, risk_beta, risk_momentum, risk_annual_return,
             * grade_return, grade_sharpe, grade_volatility, grade_drawdown,
             * grade_sortino.
             */
            static ScoringTables from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
        };

    } // namespace scoring
} // namespace tracker

#endif // TRACKER_SCORING_SCORING_TABLES_HPP
