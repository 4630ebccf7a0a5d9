// SPDX-License-Identifier: MIT
/**
 * @file dashboard.cpp
 * @brief Implementation of the dashboard aggregate
 */

#include "engine/dashboard.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace tracker
{
    namespace engine
    {
        namespace
        {
            constexpr size_t MOVERS_SHOWN = 5;
            constexpr size_t CONCENTRATION_TOP = 3;
        } // namespace

        nlohmann::json StockSnapshot::to_json() const
        {
            return {{"symbol", symbol},
                    {"quantity", quantity},
                    {"current_price", current_price},
                    {"position_value", position_value},
                    {"performance_30d", performance_30d},
                    {"gain_loss_30d", gain_loss_30d},
                    {"user_return", user_return},
                    {"days_held", days_held},
                    {"annualized_return", annualized_return}};
        }

        nlohmann::json PortfolioHealth::to_json() const
        {
            return {{"score", score},
                    {"num_holdings", num_holdings},
                    {"positive_performers", positive_performers},
                    {"positive_30d_performers", positive_30d_performers},
                    {"total_performers", total_performers},
                    {"total_value", total_value}};
        }

        nlohmann::json ConcentrationRisk::to_json() const
        {
            nlohmann::json list = nlohmann::json::array();
            for (const auto &position : positions)
            {
                list.push_back({{"symbol", position.first}, {"weight", position.second}});
            }
            return {{"is_concentrated", is_concentrated},
                    {"top_3_percentage", top_3_percentage},
                    {"max_position_weight", max_position_weight},
                    {"positions", list}};
        }

        nlohmann::json DashboardMetrics::to_json() const
        {
            nlohmann::json j;
            j["success"] = success;
            if (!success)
            {
                j["message"] = message;
                return j;
            }

            nlohmann::json top = nlohmann::json::array();
            for (const auto &s : top_performers)
                top.push_back(s.to_json());
            nlohmann::json worst = nlohmann::json::array();
            for (const auto &s : worst_performers)
                worst.push_back(s.to_json());

            j["as_of"] = as_of;
            j["portfolio_health"] = health.to_json();
            j["top_performers"] = top;
            j["worst_performers"] = worst;
            j["concentration_risk"] = concentration.to_json();
            return j;
        }

        void DashboardMetrics::print_summary() const
        {
            std::cout << "\n=== Dashboard (" << as_of << ") ===\n";
            if (!success)
            {
                std::cout << message << "\n";
                return;
            }
            std::cout << std::fixed << std::setprecision(2);
            std::cout << "Health score:  " << health.score << "/100\n";
            std::cout << "Total value:   " << health.total_value << "\n";
            std::cout << "Top 3 share:   " << concentration.top_3_percentage << "%"
                      << (concentration.is_concentrated ? " (concentrated)" : "") << "\n";
            for (const auto &s : top_performers)
            {
                std::cout << "  + " << std::left << std::setw(10) << s.symbol << std::right
                          << std::setw(8) << s.performance_30d << "%\n";
            }
            for (const auto &s : worst_performers)
            {
                std::cout << "  - " << std::left << std::setw(10) << s.symbol << std::right
                          << std::setw(8) << s.performance_30d << "%\n";
            }
        }

        double window_performance(const std::vector<double> &closes)
        {
            if (closes.size() < 2 || closes.front() <= 0.0)
            {
                return 0.0;
            }
            return (closes.back() - closes.front()) / closes.front() * 100.0;
        }

        DashboardMetrics build_dashboard(const std::vector<StockSnapshot> &snapshots, int num_holdings)
        {
            DashboardMetrics metrics;
            if (num_holdings <= 0)
            {
                metrics.message = "No stocks currently held in portfolio";
                return metrics;
            }

            double total_value = 0.0;
            int positive_return = 0;
            int positive_30d = 0;
            for (const auto &s : snapshots)
            {
                total_value += s.position_value;
                if (s.user_return > 0.0)
                    ++positive_return;
                if (s.performance_30d > 0.0)
                    ++positive_30d;
            }

            // Health: diversification (max 40) + performance (max 40) + momentum (max 20)
            const double total = static_cast<double>(snapshots.size());
            const double diversification = std::min(num_holdings * 10, 40);
            const double performance = snapshots.empty() ? 0.0 : positive_return / total * 40.0;
            const double momentum = snapshots.empty() ? 0.0 : positive_30d / total * 20.0;

            auto &health = metrics.health;
            health.score = std::min(static_cast<int>(std::round(diversification + performance + momentum)), 100);
            health.num_holdings = num_holdings;
            health.positive_performers = positive_return;
            health.positive_30d_performers = positive_30d;
            health.total_performers = static_cast<int>(snapshots.size());
            health.total_value = total_value;

            std::vector<StockSnapshot> gainers;
            std::vector<StockSnapshot> losers;
            for (const auto &s : snapshots)
            {
                (s.performance_30d >= 0.0 ? gainers : losers).push_back(s);
            }
            std::sort(gainers.begin(), gainers.end(), [](const StockSnapshot &a, const StockSnapshot &b)
            {
                if (a.performance_30d != b.performance_30d)
                    return a.performance_30d > b.performance_30d;
                if (a.position_value != b.position_value)
                    return a.position_value > b.position_value;
                return a.symbol > b.symbol;
            });
            std::sort(losers.begin(), losers.end(), [](const StockSnapshot &a, const StockSnapshot &b)
            {
                if (a.performance_30d != b.performance_30d)
                    return a.performance_30d < b.performance_30d;
                if (a.position_value != b.position_value)
                    return a.position_value > b.position_value;
                return a.symbol < b.symbol;
            });
            gainers.resize(std::min(gainers.size(), MOVERS_SHOWN));
            losers.resize(std::min(losers.size(), MOVERS_SHOWN));
            metrics.top_performers = std::move(gainers);
            metrics.worst_performers = std::move(losers);

            if (total_value > 0.0 && !snapshots.empty())
            {
                std::vector<StockSnapshot> by_value = snapshots;
                std::sort(by_value.begin(), by_value.end(), [](const StockSnapshot &a, const StockSnapshot &b)
                {
                    if (a.position_value != b.position_value)
                        return a.position_value > b.position_value;
                    return a.symbol > b.symbol;
                });
                by_value.resize(std::min(by_value.size(), CONCENTRATION_TOP));

                double top_value = 0.0;
                for (const auto &s : by_value)
                {
                    top_value += s.position_value;
                    metrics.concentration.positions.emplace_back(s.symbol, s.position_value / total_value * 100.0);
                }
                metrics.concentration.is_concentrated = top_value / total_value > 0.5;
                metrics.concentration.top_3_percentage = top_value / total_value * 100.0;
                metrics.concentration.max_position_weight = by_value.front().position_value / total_value * 100.0;
            }

            metrics.success = true;
            metrics.message = "OK";
            return metrics;
        }

    } // namespace engine
} // namespace tracker
