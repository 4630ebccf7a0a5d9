// SPDX-License-Identifier: MIT
/**
 * @file sector_analysis.hpp
 * @brief Sector allocation and diversification of current holdings
 */

#ifndef TRACKER_ANALYTICS_SECTOR_ANALYSIS_HPP
#define TRACKER_ANALYTICS_SECTOR_ANALYSIS_HPP

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/cache.hpp"
#include "core/worker_pool.hpp"
#include "data/sector_mapper.hpp"

namespace tracker
{
    namespace analytics
    {
        struct SectorStock
        {
            std::string symbol;
            double value = 0.0;
            double percentage = 0.0; ///< Share of the whole portfolio
        };

        /**
         * @struct SectorAllocation
         * @brief Holdings grouped under one sector
         */
        struct SectorAllocation
        {
            double value = 0.0;
            double percentage = 0.0;
            std::vector<SectorStock> stocks;
            std::map<std::string, double> industries; ///< Industry -> value

            nlohmann::json to_json() const;
        };

        /**
         * @struct SectorAnalysis
         * @brief Allocation per sector with a coarse diversification score
         */
        struct SectorAnalysis
        {
            bool success = false;
            std::string message;

            std::map<std::string, SectorAllocation> sectors;
            std::map<std::string, data::SectorInfo> resolved; ///< Symbol -> info with source
            double total_value = 0.0;
            int diversification_score = 0;
            int num_sectors = 0;
            int num_stocks = 0;

            nlohmann::json to_json() const;
            void print_summary() const;
        };

        /// 0, 40, 70 or 90 for at most 1, 3, 5 or more sectors.
        int diversification_score(size_t sector_count);

        /**
         * @brief Resolve sectors on the worker pool and aggregate position values
         *
         * Each symbol is read from @p cache first ("cache"). On a miss the lookup
         * runs on @p pool: a found entry is stored in the cache, a missing entry
         * becomes "Unknown" with source "fallback" and a lookup that throws becomes
         * "Unknown" with source "error". Neither failure is cached.
         *
         * @param position_values Symbol -> position value in base currency
         * @param lookup Sector source
         * @param cache Cache of successful lookups
         * @param pool Worker pool running the lookups
         * @param verbose Report failed lookups on std::cerr
         */
        SectorAnalysis analyze_sectors(const std::map<std::string, double> &position_values,
                                       const data::SectorLookup &lookup,
                                       Cache<data::SectorInfo> &cache,
                                       const WorkerPool &pool,
                                       bool verbose = false);

    } // namespace analytics
} // namespace tracker

#endif // TRACKER_ANALYTICS_SECTOR_ANALYSIS_HPP
