// SPDX-License-Identifier: MIT
/**
 * @file portfolio_engine.hpp
 * @brief Facade composing ledger replay, valuation, risk and scoring
 *
 * The engine owns no data. It reads the injected ledger and providers on
 * every call and keeps state only in the injected caches.
 */

#ifndef TRACKER_ENGINE_PORTFOLIO_ENGINE_HPP
#define TRACKER_ENGINE_PORTFOLIO_ENGINE_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "analytics/position_performance.hpp"
#include "analytics/sector_analysis.hpp"
#include "core/cache.hpp"
#include "core/date.hpp"
#include "core/worker_pool.hpp"
#include "data/data_loader.hpp"
#include "data/price_provider.hpp"
#include "data/sector_mapper.hpp"
#include "engine/dashboard.hpp"
#include "ledger/ledger.hpp"
#include "ledger/replay.hpp"
#include "scoring/portfolio_insights.hpp"
#include "valuation/timeline.hpp"

namespace tracker
{
    namespace engine
    {
        /**
         * @struct RiskReport
         * @brief Scored positions and the portfolio insights built from them
         */
        struct RiskReport
        {
            bool success = false;
            std::string message;
            std::string as_of;
            std::vector<scoring::ScoringBundle> bundles; ///< Sorted by symbol
            std::vector<std::string> skipped;            ///< Held symbols that could not be scored
            scoring::PortfolioInsights insights;

            nlohmann::json to_json() const;
            void print_summary() const;
        };

        /**
         * @class PortfolioEngine
         * @brief Exposes holdings, positions, timeline, risk, sectors and dashboard
         *
         * Every price series read through the provider is adjusted with the
         * configured split registry before use.
         */
        class PortfolioEngine
        {
        public:
            /**
             * @brief Constructor
             * @param ledger Transaction ledger
             * @param prices Price-series provider
             * @param fx FX provider for the secondary currency, may be null
             * @param sectors Sector source, may be null (every symbol falls back)
             * @param dashboard_cache Cache serving dashboard aggregates
             * @param sector_cache Cache of successful sector lookups
             * @param config Engine configuration
             */
            PortfolioEngine(const ledger::Ledger &ledger,
                            const PriceProvider &prices,
                            const FxRateProvider *fx,
                            const data::SectorLookup *sectors,
                            Cache<DashboardMetrics> &dashboard_cache,
                            Cache<data::SectorInfo> &sector_cache,
                            EngineConfig config = EngineConfig());

            const EngineConfig &config() const { return config_; }

            /// Symbols held above the configured epsilon as of @p as_of.
            ledger::HoldingSnapshot holdings(const Date &as_of) const;

            double cash_balance(const Date &as_of) const;

            /// Held symbols with a negative replayed quantity (oversold).
            std::vector<std::string> negative_positions(const Date &as_of) const;

            /// Split-adjusted bars of @p symbol over [start, end].
            PriceSeries adjusted_series(const std::string &symbol, const Date &start, const Date &end) const;

            /// Last split-adjusted close on or before @p as_of.
            std::optional<double> latest_price(const std::string &symbol, const Date &as_of) const;

            /// Performance of every held symbol, sorted by symbol.
            std::vector<analytics::PositionPerformance> positions(const Date &as_of) const;

            /**
             * @brief Daily valuation over [start, end] with per-symbol series
             *
             * Fails (success = false) when end precedes start or no day in
             * the range has price data.
             */
            valuation::TimelineResult timeline(const Date &start, const Date &end) const;

            /// Risk profile and scoring bundle of every held symbol plus insights.
            RiskReport risk_report(const Date &as_of) const;

            analytics::SectorAnalysis sector_analysis(const Date &as_of) const;

            /// Served from the dashboard cache while fresh.
            DashboardMetrics dashboard(const Date &as_of) const;

            /// All artifacts in one document.
            nlohmann::json report(const Date &as_of, const Date &start, const Date &end) const;

        private:
            /// Earliest date any computation as of @p as_of may need prices for.
            Date history_start(const Date &as_of) const;

            /// Split-adjusted closes of several symbols aligned on one calendar.
            PriceTable adjusted_table(const std::vector<std::string> &symbols,
                                      const Date &start, const Date &end) const;

            void log(const std::string &message) const;

            const ledger::Ledger &ledger_;
            const PriceProvider &prices_;
            const FxRateProvider *fx_;
            const data::SectorLookup *sectors_;
            Cache<DashboardMetrics> &dashboard_cache_;
            Cache<data::SectorInfo> &sector_cache_;
            EngineConfig config_;
            WorkerPool pool_;
        };

    } // namespace engine
} // namespace tracker

#endif // TRACKER_ENGINE_PORTFOLIO_ENGINE_HPP
