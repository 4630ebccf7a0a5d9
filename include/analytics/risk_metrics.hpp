// SPDX-License-Identifier: MIT
/**
 * @file risk_metrics.hpp
 * @brief Risk and performance metrics for a per-symbol return series.
 *
 * Volatility, drawdown and value at risk are reported in percent. All
 * annualized values default to 252 trading days per year.
 */

#ifndef TRACKER_ANALYTICS_RISK_METRICS_HPP
#define TRACKER_ANALYTICS_RISK_METRICS_HPP

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tracker
{
    namespace analytics
    {
        /**
         * @struct DrawdownInfo
         * @brief Location of the worst peak-to-trough decline.
         *
         * Indices refer to the wealth index, where index 0 is the 1.0 seed and
         * index i is the wealth after return i-1.
         */
        struct DrawdownInfo
        {
            double depth = 0.0;   ///< Worst drawdown in percent (<= 0)
            int peak_index = 0;   ///< Index of the peak before the drawdown
            int trough_index = 0; ///< Index of the trough
        };

        /**
         * @struct GrowthInputs
         * @brief Position figures used for compound annual growth.
         */
        struct GrowthInputs
        {
            double cost_basis = 0.0;
            double current_value = 0.0;
            int days_held = 0;
        };

        /**
         * @brief Where the return series of a held symbol starts from.
         *
         * COST_BASIS measures the first return from the investor's average
         * cost, MARKET uses day-over-day closes only.
         */
        enum class ReturnSource
        {
            COST_BASIS,
            MARKET
        };

        std::string to_string(ReturnSource source);
        ReturnSource parse_return_source(const std::string &name);

        /**
         * @struct RiskSettings
         * @brief Tunables of the risk pipeline.
         */
        struct RiskSettings
        {
            int min_observations = 5;        ///< Below this the profile is not computed
            int trading_days_per_year = 252;
            double var_confidence = 0.95;
            bool compute_sortino = false;    ///< Adds sortino_ratio to profiles
            int lookback_days = 365;         ///< Calendar days of history per symbol
            ReturnSource return_source = ReturnSource::COST_BASIS;

            static RiskSettings from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct RiskProfile
         * @brief Derived risk figures of one symbol.
         */
        struct RiskProfile
        {
            bool success = false;
            std::string message;
            int observations = 0;

            double volatility = 0.0;        ///< Annualized, percent
            double annualized_return = 0.0; ///< Percent
            double sharpe_ratio = 0.0;
            double max_drawdown = 0.0;      ///< Percent, <= 0
            double var_95 = 0.0;            ///< 5th percentile daily return, percent
            std::optional<double> sortino_ratio;

            nlohmann::json to_json() const;
            void print_summary() const;
        };

        /**
         * @class RiskMetrics
         * @brief Statistics over a simple-return series.
         *
         * Usage:
         * @code
         *   RiskMetrics metrics(returns);
         *   double vol = metrics.volatility();
         *   double mdd = metrics.max_drawdown();
         * @endcode
         *
         * Thread safety: instances are immutable after construction.
         */
        class RiskMetrics
        {
        public:
            /**
             * @param returns Daily simple returns (fractions).
             * @param trading_days_per_year Annualization factor.
             * @throws std::invalid_argument If returns are empty or the factor is not positive.
             */
            explicit RiskMetrics(const Eigen::VectorXd &returns, int trading_days_per_year = 252);

            /// Population standard deviation * sqrt(days) * 100.
            double volatility() const;

            /// Root mean square of negative returns, annualized, percent.
            double downside_deviation() const;

            /// Geometric annualization of the series, percent.
            double annualized_return() const;

            /// Cumulative product of (1 + r) seeded at 1.0; size n + 1.
            std::vector<double> wealth_index() const;

            /// (wealth / running peak - 1) * 100 per wealth index point.
            std::vector<double> drawdown_series() const;

            double max_drawdown() const;
            DrawdownInfo max_drawdown_info() const;

            /**
             * @brief Historical quantile of returns * 100 at 1 - confidence.
             * @throws std::invalid_argument if confidence is outside (0, 1).
             */
            double value_at_risk(double confidence = 0.95) const;

            /// annual_return / downside_deviation, 0 without downside.
            double sortino_ratio(double annual_return) const;

            size_t size() const { return static_cast<size_t>(returns_.size()); }

        private:
            Eigen::VectorXd returns_;
            int trading_days_per_year_;
        };

        /**
         * @brief ((current / cost)^(365 / days) - 1) * 100.
         *
         * Returns 0 unless cost, current and days are all positive and the
         * result is finite.
         */
        double compound_annual_growth(double current_value, double cost_basis, int days_held);

        /**
         * @brief Build a RiskProfile from a return series.
         *
         * With @p growth the annualized return is the compound annual growth of
         * the position, otherwise the geometric annualization of the series.
         * Fewer than settings.min_observations returns yields success = false.
         */
        RiskProfile risk_metrics(const Eigen::VectorXd &returns,
                                 const std::optional<GrowthInputs> &growth = std::nullopt,
                                 const RiskSettings &settings = RiskSettings());

    } // namespace analytics
} // namespace tracker

#endif // TRACKER_ANALYTICS_RISK_METRICS_HPP
