// SPDX-License-Identifier: MIT
/**
 * @file dashboard.hpp
 * @brief Portfolio health, 30-day movers and concentration
 */

#ifndef TRACKER_ENGINE_DASHBOARD_HPP
#define TRACKER_ENGINE_DASHBOARD_HPP

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace tracker
{
    namespace engine
    {
        /**
         * @struct StockSnapshot
         * @brief One held symbol as seen by the dashboard
         */
        struct StockSnapshot
        {
            std::string symbol;
            double quantity = 0.0;
            double current_price = 0.0;
            double position_value = 0.0;
            double performance_30d = 0.0;   ///< Percent over the last 30 days
            double gain_loss_30d = 0.0;     ///< Price change * quantity
            double user_return = 0.0;       ///< Percent against cost basis
            int days_held = 0;
            double annualized_return = 0.0;

            nlohmann::json to_json() const;
        };

        struct PortfolioHealth
        {
            int score = 0;                   ///< 0..100
            int num_holdings = 0;
            int positive_performers = 0;     ///< user_return > 0
            int positive_30d_performers = 0; ///< performance_30d > 0
            int total_performers = 0;
            double total_value = 0.0;

            nlohmann::json to_json() const;
        };

        struct ConcentrationRisk
        {
            bool is_concentrated = false;    ///< Top 3 above half the portfolio
            double top_3_percentage = 0.0;
            double max_position_weight = 0.0;
            std::vector<std::pair<std::string, double>> positions; ///< Symbol, weight percent

            nlohmann::json to_json() const;
        };

        /**
         * @struct DashboardMetrics
         * @brief Aggregate served by the dashboard cache
         */
        struct DashboardMetrics
        {
            bool success = false;
            std::string message;
            std::string as_of;

            PortfolioHealth health;
            std::vector<StockSnapshot> top_performers;   ///< Up to 5, best first
            std::vector<StockSnapshot> worst_performers; ///< Up to 5, worst first
            ConcentrationRisk concentration;

            nlohmann::json to_json() const;
            void print_summary() const;
        };

        /// (last - first) / first * 100, 0 with fewer than two closes or a non-positive first close.
        double window_performance(const std::vector<double> &closes);

        /**
         * @brief Build the dashboard from per-symbol snapshots
         *
         * Ordering is deterministic: gainers by (performance, value, symbol)
         * descending, losers by performance ascending then value descending
         * then symbol.
         *
         * @param snapshots Priced holdings
         * @param num_holdings Symbols currently held, priced or not
         */
        DashboardMetrics build_dashboard(const std::vector<StockSnapshot> &snapshots, int num_holdings);

    } // namespace engine
} // namespace tracker

#endif // TRACKER_ENGINE_DASHBOARD_HPP
