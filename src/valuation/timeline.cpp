// SPDX-License-Identifier: MIT
/**
 * @file timeline.cpp
 * @brief Implementation of the daily valuation timeline
 */

#include "valuation/timeline.hpp"
#include "ledger/replay.hpp"

#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace tracker
{
    namespace valuation
    {
        // ============================================================================
        // ValuationPoint
        // ============================================================================

        double ValuationPoint::breakdown_total() const
        {
            double total = 0.0;
            for (const auto &kv : breakdown)
            {
                total += kv.second;
            }
            return total;
        }

        nlohmann::json ValuationPoint::to_json() const
        {
            nlohmann::json j;
            j["date"] = date.to_string();
            j["value"] = value;
            j["secondary_value"] = secondary_value;
            j["cash_balance"] = cash_balance;
            j["breakdown"] = breakdown;
            return j;
        }

        TimelineOptions TimelineOptions::from_json(const nlohmann::json &j)
        {
            TimelineOptions options;
            options.base_currency = j.value("base_currency", std::string("TRY"));
            options.secondary_currency = j.value("secondary_currency", std::string("EUR"));
            return options;
        }

        // ============================================================================
        // Portfolio timeline
        // ============================================================================

        std::vector<ValuationPoint> portfolio_timeline(const ledger::Ledger &ledger,
                                                       const PriceTable &prices,
                                                       const FxRateProvider *fx,
                                                       const Date &start,
                                                       const Date &end,
                                                       const TimelineOptions &options)
        {
            if (end < start)
            {
                throw std::invalid_argument("Timeline end " + end.to_string() +
                                            " is before start " + start.to_string());
            }

            const auto &transactions = ledger.transactions();
            size_t next = 0;

            ledger::HoldingsBook book;
            while (next < transactions.size() && transactions[next].date < start)
            {
                book.apply(transactions[next++]);
            }

            std::vector<ValuationPoint> points;
            for (Date day = start; day <= end; day = day.add_days(1))
            {
                while (next < transactions.size() && transactions[next].date == day)
                {
                    book.apply(transactions[next++]);
                }

                if (!prices.has_data_asof(day))
                {
                    continue;
                }

                ValuationPoint point;
                point.date = day;
                point.cash_balance = book.cash();
                for (const auto &position : book.positions())
                {
                    if (position.second <= 0.0)
                    {
                        continue;
                    }
                    auto close = prices.asof(position.first, day);
                    if (!close)
                    {
                        continue;
                    }
                    point.breakdown[position.first] = position.second * *close;
                }
                point.value = point.breakdown_total();

                if (fx != nullptr)
                {
                    auto rate = fx->rate_asof(options.secondary_currency, options.base_currency, day);
                    point.secondary_value = (rate && *rate > 0.0) ? point.value / *rate : 0.0;
                }

                points.push_back(std::move(point));
            }
            return points;
        }

        // ============================================================================
        // Per-symbol series
        // ============================================================================

        nlohmann::json SymbolTimeline::to_json() const
        {
            return nlohmann::json{{"daily_returns", daily_returns},
                                  {"cumulative_performance", cumulative_performance}};
        }

        std::map<std::string, SymbolTimeline> symbol_performance_timeline(
            const PriceTable &prices,
            const std::vector<ValuationPoint> &points,
            const std::map<std::string, double> &average_costs)
        {
            std::map<std::string, SymbolTimeline> out;

            for (const auto &kv : average_costs)
            {
                const std::string &symbol = kv.first;
                const double average_cost = kv.second;

                SymbolTimeline series;
                std::optional<double> prev;
                double last_cumulative = 0.0;
                bool any_nonzero = false;

                for (const auto &point : points)
                {
                    auto close = prices.asof(symbol, point.date);
                    if (!close)
                    {
                        series.daily_returns.push_back(0.0);
                        series.cumulative_performance.push_back(last_cumulative);
                        continue;
                    }

                    double daily = (prev && *prev > 0.0) ? (*close - *prev) / *prev : 0.0;
                    double cumulative = average_cost > 0.0 ? (*close - average_cost) / average_cost : 0.0;

                    series.daily_returns.push_back(daily);
                    series.cumulative_performance.push_back(cumulative);
                    last_cumulative = cumulative;
                    any_nonzero = any_nonzero || cumulative != 0.0;
                    prev = close;
                }

                if (any_nonzero)
                {
                    out.emplace(symbol, std::move(series));
                }
            }
            return out;
        }

        // ============================================================================
        // TimelineResult
        // ============================================================================

        nlohmann::json TimelineResult::to_json() const
        {
            nlohmann::json j;
            j["success"] = success;
            j["message"] = message;
            j["start"] = start.to_string();
            j["end"] = end.to_string();

            nlohmann::json values = nlohmann::json::array();
            for (const auto &point : points)
            {
                values.push_back(point.to_json());
            }
            j["daily_values"] = values;

            nlohmann::json symbol_series = nlohmann::json::object();
            for (const auto &kv : symbols)
            {
                symbol_series[kv.first] = kv.second.to_json();
            }
            j["symbols"] = symbol_series;
            return j;
        }

        void TimelineResult::print_summary() const
        {
            std::cout << "\n=== Valuation Timeline ===\n";
            if (!success)
            {
                std::cout << "Unavailable: " << message << "\n";
                return;
            }
            std::cout << "Range: " << start << " to " << end << " (" << points.size() << " valued days)\n";
            if (!points.empty())
            {
                std::cout << std::fixed << std::setprecision(2);
                std::cout << "First value: " << points.front().value << "\n";
                std::cout << "Last value:  " << points.back().value << "\n";
            }
            std::cout << "==========================\n";
        }

    } // namespace valuation
} // namespace tracker
