// SPDX-License-Identifier: MIT
/**
 * @file scoring_tables.cpp
 * @brief Default band tables and their JSON form
 */

#include "scoring/scoring_tables.hpp"

#include <cmath>
#include <stdexcept>

namespace tracker
{
    namespace scoring
    {
        namespace
        {
            const double INF = std::numeric_limits<double>::infinity();

            nlohmann::json bound_to_json(double value)
            {
                if (std::isinf(value))
                {
                    return nullptr;
                }
                return value;
            }

            double bound_from_json(const nlohmann::json &j, const char *key, double unbounded)
            {
                if (!j.contains(key) || j.at(key).is_null())
                {
                    return unbounded;
                }
                return j.at(key).get<double>();
            }
        } // namespace

        // ============================================================================
        // ScoreBand
        // ============================================================================

        bool ScoreBand::contains(double value) const
        {
            const bool above_lower = lower_inclusive ? value >= lower : value > lower;
            const bool below_upper = upper_inclusive ? value <= upper : value < upper;
            return above_lower && below_upper;
        }

        nlohmann::json ScoreBand::to_json() const
        {
            nlohmann::json j;
            j["min"] = bound_to_json(lower);
            j["max"] = bound_to_json(upper);
            j["min_inclusive"] = lower_inclusive;
            j["max_inclusive"] = upper_inclusive;
            j["points"] = points;
            return j;
        }

        ScoreBand ScoreBand::from_json(const nlohmann::json &j)
        {
            ScoreBand band;
            band.lower = bound_from_json(j, "min", -INF);
            band.upper = bound_from_json(j, "max", INF);
            band.lower_inclusive = j.value("min_inclusive", false);
            band.upper_inclusive = j.value("max_inclusive", false);
            band.points = j.at("points").get<int>();
            if (band.upper < band.lower)
            {
                throw std::invalid_argument("Score band has max below min: " + j.dump());
            }
            return band;
        }

        // ============================================================================
        // BandTable
        // ============================================================================

        BandTable::BandTable(std::vector<ScoreBand> bands, int fallback)
            : bands_(std::move(bands)), fallback_(fallback)
        {
        }

        BandTable BandTable::above(const std::vector<std::pair<double, int>> &thresholds, int fallback)
        {
            std::vector<ScoreBand> bands;
            for (const auto &t : thresholds)
            {
                ScoreBand band;
                band.lower = t.first;
                band.points = t.second;
                bands.push_back(band);
            }
            return BandTable(bands, fallback);
        }

        BandTable BandTable::below(const std::vector<std::pair<double, int>> &thresholds, int fallback)
        {
            std::vector<ScoreBand> bands;
            for (const auto &t : thresholds)
            {
                ScoreBand band;
                band.upper = t.first;
                band.points = t.second;
                bands.push_back(band);
            }
            return BandTable(bands, fallback);
        }

        int BandTable::score(double value) const
        {
            for (const auto &band : bands_)
            {
                if (band.contains(value))
                {
                    return band.points;
                }
            }
            return fallback_;
        }

        nlohmann::json BandTable::to_json() const
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &band : bands_)
            {
                arr.push_back(band.to_json());
            }
            return nlohmann::json{{"bands", arr}, {"fallback", fallback_}};
        }

        BandTable BandTable::from_json(const nlohmann::json &j)
        {
            if (!j.contains("bands") || !j.at("bands").is_array())
            {
                throw std::invalid_argument("Band table requires a 'bands' array: " + j.dump());
            }
            std::vector<ScoreBand> bands;
            for (const auto &item : j.at("bands"))
            {
                bands.push_back(ScoreBand::from_json(item));
            }
            return BandTable(bands, j.value("fallback", 0));
        }

        // ============================================================================
        // ScoringTables
        // ============================================================================

        ScoringTables ScoringTables::defaults()
        {
            ScoringTables t;

            // -- Risk score adjustments around the base of 50
            t.risk_base_score = 50;
            t.risk_volatility = BandTable::below({{15, 20}, {25, 15}, {35, 10}, {50, 0}, {70, -10}}, -20);
            t.risk_sharpe = BandTable::above({{1.5, 20}, {1.0, 15}, {0.5, 10}, {0.0, 5}, {-0.5, -5}}, -15);
            t.risk_drawdown = BandTable::above({{-5, 20}, {-10, 15}, {-20, 10}, {-35, 0}, {-50, -10}}, -20);
            t.risk_sortino = BandTable::above({{1.0, 8}, {0.5, 5}, {0.0, 2}}, -5);
            t.risk_beta = BandTable({ScoreBand{0.8, 1.2, true, true, 8},
                                     ScoreBand{0.6, 1.4, true, true, 5},
                                     ScoreBand{-INF, 0.6, false, false, 3}},
                                    -5);
            t.risk_momentum = BandTable::above({{15, 9}, {5, 6}, {-5, 3}, {-15, -3}}, -9);
            t.risk_annual_return = BandTable::above({{25, 15}, {15, 12}, {10, 8}, {5, 5}, {0, 2}, {-10, -5}}, -15);
            t.risk_categories = {
                {80, "VERY_LOW", "Excellent risk-reward profile"},
                {65, "LOW", "Good risk-reward profile"},
                {50, "MODERATE", "Balanced risk-reward profile"},
                {35, "HIGH", "Higher risk investment"},
                {0, "VERY_HIGH", "High risk investment"},
            };

            // -- Performance grade, weighted out of 100
            t.grade_return = BandTable::above({{30, 35}, {20, 30}, {15, 25}, {10, 20}, {5, 15}, {0, 10}, {-10, 5}}, 0);
            t.grade_sharpe = BandTable::above({{2.0, 25}, {1.5, 22}, {1.0, 18}, {0.5, 14}, {0.0, 10}, {-0.5, 5}}, 0);
            t.grade_volatility = BandTable::below({{15, 20}, {25, 17}, {35, 14}, {50, 10}, {70, 6}}, 0);
            t.grade_drawdown = BandTable::above({{-10, 10}, {-20, 8}, {-35, 5}, {-50, 2}}, 0);
            t.grade_sortino = BandTable::above({{1.5, 10}, {1.0, 8}, {0.5, 5}, {0.0, 3}}, 0);
            t.grade_cutoffs = {
                {90, "A+", 4.3, "Outstanding: Exceptional returns with minimal risk", "TIER_1_PREMIUM", "Core holding - maximize position"},
                {85, "A", 4.0, "Excellent: Strong returns with low risk", "TIER_1", "Core holding - large position"},
                {80, "A-", 3.7, "Very Good: Solid returns with manageable risk", "TIER_2", "Strong buy - significant position"},
                {75, "B+", 3.3, "Good: Positive returns with moderate risk", "TIER_2", "Buy - moderate position"},
                {65, "B", 3.0, "Fair: Decent returns with acceptable risk", "TIER_3", "Hold - maintain position"},
                {55, "B-", 2.7, "Below Average: Mixed performance", "TIER_3", "Monitor closely"},
                {45, "C+", 2.3, "Weak: Underperforming with elevated risk", "TIER_4", "Consider reducing position"},
                {35, "C", 2.0, "Poor: Negative returns with high risk", "TIER_4", "Reduce position significantly"},
                {25, "D", 1.0, "Very Poor: Large losses with very high risk", "TIER_5", "Consider selling"},
                {0, "F", 0.0, "Failing: Severe losses with extreme risk", "TIER_5", "Sell immediately"},
            };
            return t;
        }

        ScoringTables ScoringTables::from_json(const nlohmann::json &j)
        {
            ScoringTables t = defaults();
            t.risk_base_score = j.value("risk_base_score", t.risk_base_score);

            const std::vector<std::pair<const char *, BandTable ScoringTables::*>> tables = {
                {"risk_volatility", &ScoringTables::risk_volatility},
                {"risk_sharpe", &ScoringTables::risk_sharpe},
                {"risk_drawdown", &ScoringTables::risk_drawdown},
                {"risk_sortino", &ScoringTables::risk_sortino},
                {"risk_beta", &ScoringTables::risk_beta},
                {"risk_momentum", &ScoringTables::risk_momentum},
                {"risk_annual_return", &ScoringTables::risk_annual_return},
                {"grade_return", &ScoringTables::grade_return},
                {"grade_sharpe", &ScoringTables::grade_sharpe},
                {"grade_volatility", &ScoringTables::grade_volatility},
                {"grade_drawdown", &ScoringTables::grade_drawdown},
                {"grade_sortino", &ScoringTables::grade_sortino},
            };

            for (const auto &entry : tables)
            {
                if (j.contains(entry.first))
                {
                    t.*(entry.second) = BandTable::from_json(j.at(entry.first));
                }
            }
            return t;
        }

        nlohmann::json ScoringTables::to_json() const
        {
            nlohmann::json j;
            j["risk_base_score"] = risk_base_score;
            j["risk_volatility"] = risk_volatility.to_json();
            j["risk_sharpe"] = risk_sharpe.to_json();
            j["risk_drawdown"] = risk_drawdown.to_json();
            j["risk_sortino"] = risk_sortino.to_json();
            j["risk_beta"] = risk_beta.to_json();
            j["risk_momentum"] = risk_momentum.to_json();
            j["risk_annual_return"] = risk_annual_return.to_json();
            j["grade_return"] = grade_return.to_json();
            j["grade_sharpe"] = grade_sharpe.to_json();
            j["grade_volatility"] = grade_volatility.to_json();
            j["grade_drawdown"] = grade_drawdown.to_json();
            j["grade_sortino"] = grade_sortino.to_json();
            return j;
        }

    } // namespace scoring
} // namespace tracker
