// SPDX-License-Identifier: MIT
/**
 * @file sector_analysis.cpp
 * @brief Implementation of sector allocation
 */

#include "analytics/sector_analysis.hpp"

#include <iomanip>
#include <iostream>

namespace tracker
{
    namespace analytics
    {
        nlohmann::json SectorAllocation::to_json() const
        {
            nlohmann::json stock_list = nlohmann::json::array();
            for (const auto &stock : stocks)
            {
                stock_list.push_back({{"symbol", stock.symbol},
                                      {"value", stock.value},
                                      {"percentage", stock.percentage}});
            }
            return {{"value", value},
                    {"percentage", percentage},
                    {"stocks", stock_list},
                    {"industries", industries}};
        }

        nlohmann::json SectorAnalysis::to_json() const
        {
            nlohmann::json j;
            j["success"] = success;
            if (!success)
            {
                j["message"] = message;
                return j;
            }

            nlohmann::json allocation = nlohmann::json::object();
            for (const auto &entry : sectors)
            {
                allocation[entry.first] = entry.second.to_json();
            }
            nlohmann::json sources = nlohmann::json::object();
            for (const auto &entry : resolved)
            {
                sources[entry.first] = entry.second.to_json();
            }

            j["sector_allocation"] = allocation;
            j["symbols"] = sources;
            j["total_portfolio_value"] = total_value;
            j["diversification_score"] = diversification_score;
            j["num_sectors"] = num_sectors;
            j["num_stocks"] = num_stocks;
            return j;
        }

        void SectorAnalysis::print_summary() const
        {
            std::cout << "\n=== Sector Analysis ===\n";
            if (!success)
            {
                std::cout << message << "\n";
                return;
            }
            std::cout << std::fixed << std::setprecision(2);
            for (const auto &entry : sectors)
            {
                std::cout << std::left << std::setw(28) << entry.first << std::right
                          << std::setw(14) << entry.second.value
                          << std::setw(9) << entry.second.percentage << "%\n";
            }
            std::cout << "Diversification score: " << diversification_score
                      << " (" << num_sectors << " sectors, " << num_stocks << " stocks)\n";
            std::cout << "=======================\n";
        }

        int diversification_score(size_t sector_count)
        {
            if (sector_count <= 1)
                return 0;
            if (sector_count <= 3)
                return 40;
            if (sector_count <= 5)
                return 70;
            return 90;
        }

        SectorAnalysis analyze_sectors(const std::map<std::string, double> &position_values,
                                       const data::SectorLookup &lookup,
                                       Cache<data::SectorInfo> &cache,
                                       const WorkerPool &pool,
                                       bool verbose)
        {
            SectorAnalysis analysis;
            if (position_values.empty())
            {
                analysis.message = "No stocks currently held in portfolio";
                return analysis;
            }

            std::vector<std::string> symbols;
            symbols.reserve(position_values.size());
            for (const auto &entry : position_values)
            {
                symbols.push_back(entry.first);
            }

            auto outcomes = pool.map(symbols, [&](const std::string &symbol)
            {
                if (auto cached = cache.get(symbol))
                {
                    cached->source = "cache";
                    return *cached;
                }

                auto found = lookup.lookup(symbol);
                if (!found)
                {
                    data::SectorInfo fallback;
                    fallback.source = "fallback";
                    return fallback;
                }
                if (found->source.empty())
                {
                    found->source = "mapping";
                }
                return *found;
            });

            // Merge only after every lookup has finished
            for (size_t i = 0; i < symbols.size(); ++i)
            {
                const std::string &symbol = symbols[i];
                data::SectorInfo info;
                if (outcomes[i].success)
                {
                    info = outcomes[i].value;
                    if (info.source != "fallback" && info.source != "cache")
                    {
                        cache.set(symbol, info);
                    }
                }
                else
                {
                    info.source = "error";
                    if (verbose)
                    {
                        std::cerr << "Warning: sector lookup failed for " << symbol
                                  << ": " << outcomes[i].message << std::endl;
                    }
                }
                if (verbose && info.source == "fallback")
                {
                    std::cerr << "Warning: no sector data for " << symbol << std::endl;
                }

                const double value = position_values.at(symbol);
                auto &allocation = analysis.sectors[info.sector];
                allocation.value += value;
                allocation.stocks.push_back({symbol, value, 0.0});
                allocation.industries[info.industry] += value;
                analysis.total_value += value;
                analysis.resolved[symbol] = info;
            }

            if (analysis.total_value > 0.0)
            {
                for (auto &entry : analysis.sectors)
                {
                    auto &allocation = entry.second;
                    allocation.percentage = allocation.value / analysis.total_value * 100.0;
                    for (auto &stock : allocation.stocks)
                    {
                        stock.percentage = stock.value / analysis.total_value * 100.0;
                    }
                }
            }

            analysis.num_sectors = static_cast<int>(analysis.sectors.size());
            analysis.num_stocks = static_cast<int>(position_values.size());
            analysis.diversification_score = diversification_score(analysis.sectors.size());
            analysis.success = true;
            analysis.message = "OK";
            return analysis;
        }

    } // namespace analytics
} // namespace tracker
