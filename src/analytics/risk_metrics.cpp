// SPDX-License-Identifier: MIT
/**
 * @file risk_metrics.cpp
 * @brief Implementation of RiskMetrics and the risk_metrics() pipeline step.
 */

#include "analytics/risk_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace tracker
{
    namespace analytics
    {

        // ===================================================================
        // RiskSettings
        // ===================================================================

        std::string to_string(ReturnSource source)
        {
            return source == ReturnSource::MARKET ? "market" : "cost_basis";
        }

        ReturnSource parse_return_source(const std::string &name)
        {
            if (name == "cost_basis")
                return ReturnSource::COST_BASIS;
            if (name == "market")
                return ReturnSource::MARKET;
            throw std::invalid_argument("Unknown return source: " + name + " (expected cost_basis or market)");
        }

        RiskSettings RiskSettings::from_json(const nlohmann::json &j)
        {
            RiskSettings settings;
            settings.min_observations = j.value("min_observations", 5);
            settings.trading_days_per_year = j.value("trading_days_per_year", 252);
            settings.var_confidence = j.value("var_confidence", 0.95);
            settings.compute_sortino = j.value("include_sortino", false);
            settings.lookback_days = j.value("lookback_days", 365);
            settings.return_source = parse_return_source(j.value("return_source", std::string("cost_basis")));

            if (settings.min_observations < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'min_observations', got: " + std::to_string(settings.min_observations));
            }
            if (settings.trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(settings.trading_days_per_year));
            }
            if (settings.var_confidence <= 0.0 || settings.var_confidence >= 1.0)
            {
                throw std::invalid_argument(
                    "Confidence level must be in (0, 1), got: " + std::to_string(settings.var_confidence));
            }
            if (settings.lookback_days <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'lookback_days', got: " + std::to_string(settings.lookback_days));
            }
            return settings;
        }

        nlohmann::json RiskSettings::to_json() const
        {
            nlohmann::json j;
            j["min_observations"] = min_observations;
            j["trading_days_per_year"] = trading_days_per_year;
            j["var_confidence"] = var_confidence;
            j["include_sortino"] = compute_sortino;
            j["lookback_days"] = lookback_days;
            j["return_source"] = to_string(return_source);
            return j;
        }

        // ===================================================================
        // RiskProfile
        // ===================================================================

        nlohmann::json RiskProfile::to_json() const
        {
            nlohmann::json j;
            j["success"] = success;
            j["message"] = message;
            j["observations"] = observations;
            j["volatility"] = volatility;
            j["annual_return"] = annualized_return;
            j["sharpe_ratio"] = sharpe_ratio;
            j["max_drawdown"] = max_drawdown;
            j["var_95"] = var_95;
            if (sortino_ratio)
            {
                j["sortino_ratio"] = *sortino_ratio;
            }
            return j;
        }

        void RiskProfile::print_summary() const
        {
            if (!success)
            {
                std::cout << "  Risk profile unavailable: " << message << "\n";
                return;
            }
            std::cout << std::fixed << std::setprecision(2);
            std::cout << "  Volatility:        " << volatility << "%\n";
            std::cout << "  Annual return:     " << annualized_return << "%\n";
            std::cout << "  Sharpe ratio:      " << sharpe_ratio << "\n";
            std::cout << "  Max drawdown:      " << max_drawdown << "%\n";
            std::cout << "  VaR (95%):         " << var_95 << "%\n";
            if (sortino_ratio)
            {
                std::cout << "  Sortino ratio:     " << *sortino_ratio << "\n";
            }
        }

        // ===================================================================
        // RiskMetrics
        // ===================================================================

        RiskMetrics::RiskMetrics(const Eigen::VectorXd &returns, int trading_days_per_year)
            : returns_(returns), trading_days_per_year_(trading_days_per_year)
        {
            if (returns_.size() == 0)
            {
                throw std::invalid_argument("Return series cannot be empty");
            }
            if (trading_days_per_year_ <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year_));
            }
        }

        double RiskMetrics::volatility() const
        {
            const double n = static_cast<double>(returns_.size());
            const double mean = returns_.mean();
            const double variance = (returns_.array() - mean).square().sum() / n;
            return std::sqrt(variance) * std::sqrt(static_cast<double>(trading_days_per_year_)) * 100.0;
        }

        double RiskMetrics::downside_deviation() const
        {
            const double n = static_cast<double>(returns_.size());
            const double sum_sq = returns_.array().min(0.0).square().sum();
            return std::sqrt(sum_sq / n) * std::sqrt(static_cast<double>(trading_days_per_year_)) * 100.0;
        }

        double RiskMetrics::annualized_return() const
        {
            const double growth = (1.0 + returns_.array()).prod();
            const double years = static_cast<double>(returns_.size()) / static_cast<double>(trading_days_per_year_);
            if (growth <= 0.0 || years <= 0.0)
            {
                return 0.0;
            }
            const double value = (std::pow(growth, 1.0 / years) - 1.0) * 100.0;
            return std::isfinite(value) ? value : 0.0;
        }

        std::vector<double> RiskMetrics::wealth_index() const
        {
            std::vector<double> wealth;
            wealth.reserve(returns_.size() + 1);
            wealth.push_back(1.0);
            for (Eigen::Index i = 0; i < returns_.size(); ++i)
            {
                wealth.push_back(wealth.back() * (1.0 + returns_(i)));
            }
            return wealth;
        }

        std::vector<double> RiskMetrics::drawdown_series() const
        {
            const std::vector<double> wealth = wealth_index();
            std::vector<double> drawdowns(wealth.size(), 0.0);

            double peak = wealth.front();
            for (size_t i = 0; i < wealth.size(); ++i)
            {
                peak = std::max(peak, wealth[i]);
                drawdowns[i] = peak > 0.0 ? (wealth[i] / peak - 1.0) * 100.0 : 0.0;
            }
            return drawdowns;
        }

        double RiskMetrics::max_drawdown() const
        {
            return max_drawdown_info().depth;
        }

        DrawdownInfo RiskMetrics::max_drawdown_info() const
        {
            const std::vector<double> wealth = wealth_index();

            DrawdownInfo info;
            double peak = wealth.front();
            int peak_idx = 0;
            for (size_t i = 0; i < wealth.size(); ++i)
            {
                if (wealth[i] > peak)
                {
                    peak = wealth[i];
                    peak_idx = static_cast<int>(i);
                }
                double dd = peak > 0.0 ? (wealth[i] / peak - 1.0) * 100.0 : 0.0;
                if (dd < info.depth)
                {
                    info.depth = dd;
                    info.peak_index = peak_idx;
                    info.trough_index = static_cast<int>(i);
                }
            }
            return info;
        }

        double RiskMetrics::value_at_risk(double confidence) const
        {
            if (confidence <= 0.0 || confidence >= 1.0)
            {
                throw std::invalid_argument(
                    "Confidence level must be in (0, 1), got: " + std::to_string(confidence));
            }

            std::vector<double> sorted_returns(returns_.data(), returns_.data() + returns_.size());
            std::sort(sorted_returns.begin(), sorted_returns.end());
            const int n = static_cast<int>(sorted_returns.size());

            double index = (1.0 - confidence) * static_cast<double>(n - 1);
            int lower = static_cast<int>(std::floor(index));
            int upper = static_cast<int>(std::ceil(index));

            double quantile;
            if (lower == upper || upper >= n)
            {
                quantile = sorted_returns[lower];
            }
            else
            {
                double frac = index - static_cast<double>(lower);
                quantile = sorted_returns[lower] * (1.0 - frac) + sorted_returns[upper] * frac;
            }

            return quantile * 100.0;
        }

        double RiskMetrics::sortino_ratio(double annual_return) const
        {
            const double dd = downside_deviation();
            if (dd <= 0.0)
            {
                return 0.0;
            }
            return annual_return / dd;
        }

        // ===================================================================
        // Pipeline step
        // ===================================================================

        double compound_annual_growth(double current_value, double cost_basis, int days_held)
        {
            if (cost_basis <= 0.0 || current_value <= 0.0 || days_held <= 0)
            {
                return 0.0;
            }
            const double value = (std::pow(current_value / cost_basis, 365.0 / days_held) - 1.0) * 100.0;
            return std::isfinite(value) ? value : 0.0;
        }

        RiskProfile risk_metrics(const Eigen::VectorXd &returns,
                                 const std::optional<GrowthInputs> &growth,
                                 const RiskSettings &settings)
        {
            RiskProfile profile;
            profile.observations = static_cast<int>(returns.size());

            if (returns.size() < settings.min_observations)
            {
                profile.success = false;
                profile.message = "Insufficient data: " + std::to_string(returns.size()) +
                                  " returns, need at least " + std::to_string(settings.min_observations);
                return profile;
            }

            RiskMetrics metrics(returns, settings.trading_days_per_year);

            profile.volatility = metrics.volatility();
            if (growth)
            {
                profile.annualized_return = compound_annual_growth(growth->current_value,
                                                                   growth->cost_basis,
                                                                   growth->days_held);
            }
            else
            {
                profile.annualized_return = metrics.annualized_return();
            }
            profile.sharpe_ratio = profile.volatility > 0.0 ? profile.annualized_return / profile.volatility : 0.0;
            profile.max_drawdown = metrics.max_drawdown();
            profile.var_95 = metrics.value_at_risk(settings.var_confidence);
            if (settings.compute_sortino)
            {
                profile.sortino_ratio = metrics.sortino_ratio(profile.annualized_return);
            }

            profile.success = true;
            profile.message = "OK";
            return profile;
        }

    } // namespace analytics
} // namespace tracker
