// SPDX-License-Identifier: MIT
/**
 * @file timeline.hpp
 * @brief Daily valuation of the replayed portfolio over a calendar range.
 */

#ifndef TRACKER_VALUATION_TIMELINE_HPP
#define TRACKER_VALUATION_TIMELINE_HPP

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/date.hpp"
#include "data/price_provider.hpp"
#include "data/price_table.hpp"
#include "ledger/ledger.hpp"

namespace tracker
{
    namespace valuation
    {
        /**
         * @struct ValuationPoint
         * @brief Portfolio value on one calendar day.
         *
         * value is the sum of the breakdown (securities only); cash is reported
         * beside it.
         */
        struct ValuationPoint
        {
            Date date;
            double value = 0.0;           ///< Base currency
            double secondary_value = 0.0; ///< value / FX rate, 0 without a rate
            double cash_balance = 0.0;    ///< Base currency
            std::map<std::string, double> breakdown;

            double breakdown_total() const;
            nlohmann::json to_json() const;
        };

        /**
         * @struct TimelineOptions
         * @brief Currencies of a valuation run.
         */
        struct TimelineOptions
        {
            std::string base_currency = "TRY";
            std::string secondary_currency = "EUR";

            static TimelineOptions from_json(const nlohmann::json &j);
        };

        /**
         * @brief Value the ledger on every calendar day in [start, end].
         *
         * Holdings and cash start from a replay of everything before @p start.
         * Each day first applies that day's transactions, then values every
         * symbol with quantity > 0 at its close as of the day. Days on which the
         * table has no row at or before the day are skipped. @p fx may be null,
         * in which case secondary values are 0.
         *
         * @throws std::invalid_argument if end < start
         */
        std::vector<ValuationPoint> portfolio_timeline(const ledger::Ledger &ledger,
                                                       const PriceTable &prices,
                                                       const FxRateProvider *fx,
                                                       const Date &start,
                                                       const Date &end,
                                                       const TimelineOptions &options = TimelineOptions());

        /**
         * @struct SymbolTimeline
         * @brief Per-symbol series aligned with the emitted valuation days.
         */
        struct SymbolTimeline
        {
            std::vector<double> daily_returns;          ///< Close over previous close - 1
            std::vector<double> cumulative_performance; ///< Close over average cost - 1

            nlohmann::json to_json() const;
        };

        /**
         * @brief Daily returns and performance against average cost per symbol.
         *
         * Days without a close repeat the previous cumulative figure and record a
         * zero return. Symbols whose cumulative performance is zero on every day
         * are dropped.
         */
        std::map<std::string, SymbolTimeline> symbol_performance_timeline(
            const PriceTable &prices,
            const std::vector<ValuationPoint> &points,
            const std::map<std::string, double> &average_costs);

        /**
         * @struct TimelineResult
         * @brief Valuation curve plus per-symbol series for reporting.
         */
        struct TimelineResult
        {
            bool success = false;
            std::string message;
            Date start;
            Date end;
            std::vector<ValuationPoint> points;
            std::map<std::string, SymbolTimeline> symbols;

            nlohmann::json to_json() const;
            void print_summary() const;
        };

    } // namespace valuation
} // namespace tracker

#endif // TRACKER_VALUATION_TIMELINE_HPP
