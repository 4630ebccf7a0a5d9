// SPDX-License-Identifier: MIT
/**
 * @file portfolio_engine.cpp
 * @brief Implementation of the PortfolioEngine facade
 */

#include "engine/portfolio_engine.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include "ledger/cost_basis.hpp"

namespace tracker
{
    namespace engine
    {
        namespace
        {
            constexpr long DASHBOARD_WINDOW_DAYS = 30;

            /// Sector source used when none is configured.
            class NoSectorLookup : public data::SectorLookup
            {
            public:
                std::optional<data::SectorInfo> lookup(const std::string &) const override
                {
                    return std::nullopt;
                }
            };
        } // namespace

        // ============================================================================
        // RiskReport
        // ============================================================================

        nlohmann::json RiskReport::to_json() const
        {
            nlohmann::json j;
            j["success"] = success;
            j["message"] = message;
            j["as_of"] = as_of;

            nlohmann::json metrics = nlohmann::json::object();
            for (const auto &bundle : bundles)
            {
                metrics[bundle.symbol] = bundle.to_json();
            }
            j["risk_metrics"] = metrics;
            j["skipped"] = skipped;
            j["portfolio_insights"] = insights.to_json();
            return j;
        }

        void RiskReport::print_summary() const
        {
            std::cout << "\n=== Risk Report (" << as_of << ") ===\n";
            if (!success)
            {
                std::cout << message << "\n";
                return;
            }
            std::cout << std::fixed << std::setprecision(2);
            std::cout << std::left << std::setw(10) << "Symbol" << std::right
                      << std::setw(10) << "Vol %" << std::setw(10) << "Ann %"
                      << std::setw(9) << "Sharpe" << std::setw(7) << "Risk"
                      << std::setw(7) << "Grade" << "  Signal\n";
            for (const auto &bundle : bundles)
            {
                std::cout << std::left << std::setw(10) << bundle.symbol << std::right
                          << std::setw(10) << bundle.profile.volatility
                          << std::setw(10) << bundle.profile.annualized_return
                          << std::setw(9) << bundle.profile.sharpe_ratio
                          << std::setw(7) << bundle.risk.score
                          << std::setw(7) << bundle.grade.grade
                          << "  " << scoring::to_string(bundle.signal.action) << "\n";
            }
            if (!skipped.empty())
            {
                std::cout << "Skipped: " << skipped.size() << " symbol(s)\n";
            }
            insights.print_summary();
        }

        // ============================================================================
        // PortfolioEngine
        // ============================================================================

        PortfolioEngine::PortfolioEngine(const ledger::Ledger &ledger,
                                         const PriceProvider &prices,
                                         const FxRateProvider *fx,
                                         const data::SectorLookup *sectors,
                                         Cache<DashboardMetrics> &dashboard_cache,
                                         Cache<data::SectorInfo> &sector_cache,
                                         EngineConfig config)
            : ledger_(ledger),
              prices_(prices),
              fx_(fx),
              sectors_(sectors),
              dashboard_cache_(dashboard_cache),
              sector_cache_(sector_cache),
              config_(std::move(config)),
              pool_(config_.engine.workers)
        {
        }

        ledger::HoldingSnapshot PortfolioEngine::holdings(const Date &as_of) const
        {
            return ledger::current_holdings(ledger_, as_of, config_.engine.holding_epsilon);
        }

        double PortfolioEngine::cash_balance(const Date &as_of) const
        {
            return ledger::cash_balance_as_of(ledger_, as_of);
        }

        std::vector<std::string> PortfolioEngine::negative_positions(const Date &as_of) const
        {
            ledger::HoldingsBook book;
            book.apply_all(ledger_.up_to(as_of));
            return book.negative_symbols(config_.engine.holding_epsilon);
        }

        PriceSeries PortfolioEngine::adjusted_series(const std::string &symbol,
                                                     const Date &start,
                                                     const Date &end) const
        {
            return config_.corporate_actions.apply(prices_.get_series(symbol, start, end));
        }

        std::optional<double> PortfolioEngine::latest_price(const std::string &symbol, const Date &as_of) const
        {
            auto bar = adjusted_series(symbol, history_start(as_of), as_of).asof(as_of);
            if (!bar)
            {
                return std::nullopt;
            }
            return bar->close;
        }

        std::vector<analytics::PositionPerformance> PortfolioEngine::positions(const Date &as_of) const
        {
            std::vector<analytics::PositionPerformance> out;
            for (const auto &holding : holdings(as_of))
            {
                out.push_back(analytics::position_performance(ledger_, holding.first,
                                                              latest_price(holding.first, as_of),
                                                              as_of, config_.engine.holding_epsilon));
            }
            return out;
        }

        valuation::TimelineResult PortfolioEngine::timeline(const Date &start, const Date &end) const
        {
            valuation::TimelineResult result;
            result.start = start;
            result.end = end;

            if (end < start)
            {
                result.message = "End date " + end.to_string() + " precedes start date " + start.to_string();
                return result;
            }

            const auto symbols = ledger_.symbols();
            if (symbols.empty())
            {
                result.message = "No securities in ledger";
                return result;
            }

            const PriceTable table = adjusted_table(symbols, history_start(start), end);
            result.points = valuation::portfolio_timeline(ledger_, table, fx_, start, end, config_.valuation);
            if (result.points.empty())
            {
                result.message = "No price data between " + start.to_string() + " and " + end.to_string();
                return result;
            }

            std::map<std::string, double> average_costs;
            for (const auto &holding : holdings(end))
            {
                average_costs[holding.first] =
                    ledger::cost_basis_fifo(ledger_, holding.first, holding.second, end).average_unit_cost;
            }
            result.symbols = valuation::symbol_performance_timeline(table, result.points, average_costs);

            result.success = true;
            result.message = "OK";
            return result;
        }

        RiskReport PortfolioEngine::risk_report(const Date &as_of) const
        {
            RiskReport report;
            report.as_of = as_of.to_string();

            const auto held = holdings(as_of);
            if (held.empty())
            {
                report.message = "No stocks currently held in portfolio";
                return report;
            }

            const Date window_start = as_of.add_days(-config_.risk.lookback_days);
            for (const auto &holding : held)
            {
                const std::string &symbol = holding.first;

                auto position = analytics::position_performance(ledger_, symbol, latest_price(symbol, as_of),
                                                                as_of, config_.engine.holding_epsilon);
                if (!position.success)
                {
                    log("Skipping " + symbol + ": " + position.message);
                    report.skipped.push_back(symbol);
                    continue;
                }

                const auto closes = adjusted_series(symbol, window_start, as_of).closes();
                auto bundle = scoring::score_position(position, closes, config_.risk, config_.scoring);
                if (!bundle.profile.success)
                {
                    log("Skipping " + symbol + ": " + bundle.profile.message);
                    report.skipped.push_back(symbol);
                    continue;
                }
                report.bundles.push_back(std::move(bundle));
            }

            if (report.bundles.empty())
            {
                report.message = "Insufficient data for risk analysis";
                return report;
            }

            report.insights = scoring::portfolio_insights(report.bundles);
            report.success = true;
            report.message = "OK";
            return report;
        }

        analytics::SectorAnalysis PortfolioEngine::sector_analysis(const Date &as_of) const
        {
            std::map<std::string, double> values;
            for (const auto &holding : holdings(as_of))
            {
                values[holding.first] = holding.second * latest_price(holding.first, as_of).value_or(0.0);
            }

            NoSectorLookup none;
            const data::SectorLookup &lookup = sectors_ != nullptr ? *sectors_ : none;
            return analytics::analyze_sectors(values, lookup, sector_cache_, pool_, config_.engine.verbose);
        }

        DashboardMetrics PortfolioEngine::dashboard(const Date &as_of) const
        {
            const std::string key = "dashboard_metrics:" + as_of.to_string();
            if (auto cached = dashboard_cache_.get(key))
            {
                return *cached;
            }

            const auto held = holdings(as_of);
            const Date window_start = as_of.add_days(-DASHBOARD_WINDOW_DAYS);

            std::vector<StockSnapshot> snapshots;
            for (const auto &holding : held)
            {
                const std::string &symbol = holding.first;
                auto price = latest_price(symbol, as_of);
                if (!price || *price <= 0.0)
                {
                    log("Could not get current price for " + symbol + ", skipping from dashboard");
                    continue;
                }

                StockSnapshot snapshot;
                snapshot.symbol = symbol;
                snapshot.quantity = holding.second;
                snapshot.current_price = *price;
                snapshot.position_value = holding.second * *price;

                const auto window = adjusted_series(symbol, window_start, as_of).closes();
                snapshot.performance_30d = window_performance(window);
                if (window.size() >= 2)
                {
                    snapshot.gain_loss_30d = (window.back() - window.front()) * holding.second;
                }

                auto position = analytics::position_performance(ledger_, symbol, price, as_of,
                                                                config_.engine.holding_epsilon);
                if (position.success)
                {
                    snapshot.user_return = position.return_percentage;
                    snapshot.days_held = position.days_held;
                    snapshot.annualized_return = position.annualized_return;
                }
                else
                {
                    // Without a performance record the position still counts toward value only
                    snapshot.performance_30d = 0.0;
                    snapshot.gain_loss_30d = 0.0;
                }
                snapshots.push_back(snapshot);
            }

            DashboardMetrics metrics = build_dashboard(snapshots, static_cast<int>(held.size()));
            metrics.as_of = as_of.to_string();
            if (metrics.success)
            {
                dashboard_cache_.set(key, metrics);
            }
            return metrics;
        }

        nlohmann::json PortfolioEngine::report(const Date &as_of, const Date &start, const Date &end) const
        {
            nlohmann::json j;
            j["as_of"] = as_of.to_string();
            j["base_currency"] = config_.valuation.base_currency;

            nlohmann::json held = nlohmann::json::object();
            for (const auto &holding : holdings(as_of))
            {
                held[holding.first] = holding.second;
            }
            j["holdings"] = held;
            j["cash_balance"] = cash_balance(as_of);
            j["negative_positions"] = negative_positions(as_of);

            nlohmann::json position_list = nlohmann::json::array();
            for (const auto &position : positions(as_of))
            {
                position_list.push_back(position.to_json());
            }
            j["positions"] = position_list;

            j["timeline"] = timeline(start, end).to_json();
            j["risk"] = risk_report(as_of).to_json();
            j["sectors"] = sector_analysis(as_of).to_json();
            j["dashboard"] = dashboard(as_of).to_json();
            return j;
        }

        Date PortfolioEngine::history_start(const Date &as_of) const
        {
            Date earliest = as_of;
            if (auto first = ledger_.first_date())
            {
                earliest = std::min(earliest, *first);
            }
            return earliest.add_days(-config_.risk.lookback_days);
        }

        PriceTable PortfolioEngine::adjusted_table(const std::vector<std::string> &symbols,
                                                   const Date &start, const Date &end) const
        {
            std::vector<PriceSeries> series;
            series.reserve(symbols.size());
            for (const auto &symbol : symbols)
            {
                auto adjusted = adjusted_series(symbol, start, end);
                if (adjusted.empty())
                {
                    log("No price data for " + symbol);
                    continue;
                }
                series.push_back(std::move(adjusted));
            }
            return PriceTable::from_series(series);
        }

        void PortfolioEngine::log(const std::string &message) const
        {
            if (config_.engine.verbose)
            {
                std::cerr << message << std::endl;
            }
        }

    } // namespace engine
} // namespace tracker
