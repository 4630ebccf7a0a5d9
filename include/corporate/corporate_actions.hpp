// SPDX-License-Identifier: MIT
/**
 * @file corporate_actions.hpp
 * @brief Split adjustment of price history and percentage-based corporate events.
 */

#ifndef TRACKER_CORPORATE_CORPORATE_ACTIONS_HPP
#define TRACKER_CORPORATE_CORPORATE_ACTIONS_HPP

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/date.hpp"
#include "data/price_series.hpp"
#include "ledger/ledger.hpp"

namespace tracker
{
    namespace corporate
    {
        /**
         * @struct SplitEvent
         * @brief A known split: every bar before @p date is rescaled by @p ratio.
         */
        struct SplitEvent
        {
            std::string symbol;
            Date date;
            double ratio = 1.0; ///< New shares per old share (11.0 for 1:11)

            nlohmann::json to_json() const;
            static SplitEvent from_json(const nlohmann::json &j);
        };

        /**
         * @brief Rescale a series for a split.
         *
         * Bars strictly before @p split_date have open/high/low/close divided by
         * @p ratio and volume multiplied by it. Bars on or after the split date
         * and series of other symbols are returned unchanged.
         *
         * @throws std::invalid_argument if ratio <= 0
         */
        PriceSeries adjust_for_split(const PriceSeries &series,
                                     const std::string &symbol,
                                     const Date &split_date,
                                     double ratio);

        /**
         * @class SplitRegistry
         * @brief Known splits applied to every series the engine loads.
         */
        class SplitRegistry
        {
        public:
            SplitRegistry() = default;
            explicit SplitRegistry(const std::vector<SplitEvent> &events);

            /// @throws std::invalid_argument if ratio <= 0 or the symbol is empty
            void add(const SplitEvent &event);

            /// Events for @p symbol ordered by date.
            std::vector<SplitEvent> for_symbol(const std::string &symbol) const;

            /// Apply every registered split of the series' symbol.
            PriceSeries apply(const PriceSeries &series) const;

            size_t size() const;
            bool empty() const { return events_.empty(); }

            nlohmann::json to_json() const;

            /// Array of {"symbol", "date", "ratio"} objects.
            static SplitRegistry from_json(const nlohmann::json &j);

        private:
            std::map<std::string, std::vector<SplitEvent>> events_;
        };

        /**
         * @struct CorporateActionResult
         * @brief Ledger transaction synthesised from a percentage event.
         */
        struct CorporateActionResult
        {
            bool success = false;
            std::string message;
            ledger::Transaction transaction;
            double shares_held = 0.0; ///< Holdings strictly before the event date

            nlohmann::json to_json() const;
        };

        /// 1 + pct/100
        double split_ratio_from_percentage(double percentage);

        /**
         * @brief Cash dividend of @p percentage of the shares held before @p date.
         *
         * The resulting transaction carries the total amount in its price.
         */
        CorporateActionResult dividend_from_percentage(const ledger::Ledger &ledger,
                                                       const std::string &symbol,
                                                       const Date &date,
                                                       double percentage);

        /**
         * @brief Bonus issue / split of @p percentage new shares per held share.
         *
         * The resulting split transaction carries held * (ratio - 1) new shares.
         */
        CorporateActionResult split_from_percentage(const ledger::Ledger &ledger,
                                                    const std::string &symbol,
                                                    const Date &date,
                                                    double percentage);

        /**
         * @struct PercentageEvent
         * @brief A dividend or bonus issue announced as a percentage of holdings.
         */
        struct PercentageEvent
        {
            enum class Kind
            {
                DIVIDEND,
                SPLIT
            };

            std::string symbol;
            Date date;
            Kind kind = Kind::DIVIDEND;
            double percentage = 0.0;

            nlohmann::json to_json() const;

            /**
             * @brief Parse {"symbol", "date", "type": "dividend"|"split", "percentage"}
             * @throws std::invalid_argument on an unknown type or negative percentage
             */
            static PercentageEvent from_json(const nlohmann::json &j);
        };

        /**
         * @brief Convert percentage events into ledger transactions and append them.
         *
         * Events are processed in date order so that a later event sees the shares
         * added by an earlier split. Events whose symbol is not held are reported
         * with success = false and leave the ledger untouched.
         *
         * @return One result per event, in date order.
         */
        std::vector<CorporateActionResult> apply_percentage_events(ledger::Ledger &ledger,
                                                                   std::vector<PercentageEvent> events);

    } // namespace corporate
} // namespace tracker

#endif // TRACKER_CORPORATE_CORPORATE_ACTIONS_HPP
