// SPDX-License-Identifier: MIT
/**
 * @file data_loader.hpp
 * @brief Configuration and input file loading
 *
 * Provides the engine configuration structures and loaders for the
 * JSON configuration, the JSON transaction ledger and long-format
 * price CSV files.
 */

#ifndef TRACKER_DATA_DATA_LOADER_HPP
#define TRACKER_DATA_DATA_LOADER_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "analytics/risk_metrics.hpp"
#include "corporate/corporate_actions.hpp"
#include "data/price_series.hpp"
#include "ledger/ledger.hpp"
#include "scoring/scoring_tables.hpp"
#include "valuation/timeline.hpp"

namespace tracker
{
    /**
     * @struct DataConfig
     * @brief Input files and the analysis window
     */
    struct DataConfig
    {
        std::string ledger_file;         ///< JSON transaction ledger
        std::string prices_file;         ///< Long-format price CSV
        std::string start_date;          ///< Timeline start, first transaction if empty
        std::string end_date;            ///< Timeline end, as_of if empty
        std::string as_of;               ///< Valuation date, last price date if empty

        static DataConfig from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;
    };

    /**
     * @struct EngineSettings
     * @brief Behaviour of the engine facade
     */
    struct EngineSettings
    {
        bool verbose = false;                  ///< Diagnostics on std::cerr
        size_t workers = 2;                    ///< Sector lookup workers
        double holding_epsilon = 1e-3;         ///< Quantity at or below which a position is flat

        static EngineSettings from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;
    };

    struct CacheConfig
    {
        int dashboard_ttl_seconds = 30;

        static CacheConfig from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;
    };

    struct SectorConfig
    {
        std::string mapping_file;        ///< CSV or JSON sector mapping, none if empty

        static SectorConfig from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;
    };

    /**
     * @struct EngineConfig
     * @brief Complete engine configuration
     *
     * Every section and field is optional; missing values keep their defaults.
     * The split registry defaults to the known CCOLA 1:11 split of 2024-08-01
     * unless a "corporate_actions" section is present. Percentage dividends
     * and bonus issues are listed under "corporate_actions.events".
     */
    struct EngineConfig
    {
        DataConfig data;
        EngineSettings engine;
        valuation::TimelineOptions valuation;
        analytics::RiskSettings risk;
        scoring::ScoringTables scoring = scoring::ScoringTables::defaults();
        corporate::SplitRegistry corporate_actions = default_splits();
        std::vector<corporate::PercentageEvent> corporate_events; ///< Applied to the ledger at load
        CacheConfig cache;
        SectorConfig sectors;

        static corporate::SplitRegistry default_splits();

        /**
         * @brief Build from a parsed JSON document
         * @throws std::invalid_argument on out-of-range values
         */
        static EngineConfig from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;
    };

    /**
     * @class ConfigLoader
     * @brief Reads JSON documents and the engine configuration
     */
    class ConfigLoader
    {
    public:
        /**
         * @brief Load a JSON file
         * @param filepath Path to the file
         * @return Parsed document
         * @throws std::runtime_error if the file cannot be opened or parsed
         */
        static nlohmann::json load_json(const std::string &filepath);

        /**
         * @brief Load the engine configuration
         * @param config_path Path to config JSON file
         * @return EngineConfig with defaults for everything the file omits
         */
        static EngineConfig load_config(const std::string &config_path);
    };

    /**
     * @class DataLoader
     * @brief Loads ledgers and price history from files
     *
     * Price CSV (long format, header required, extra columns ignored):
     * date,symbol,close[,open,high,low,volume]
     * 2024-01-02,THYAO,100.5
     */
    class DataLoader
    {
    public:
        /**
         * @brief Load price series from a long-format CSV file
         *
         * Rows with an invalid date or a non-numeric close are skipped.
         * A "ticker" column is accepted for "symbol" and "price" for "close".
         *
         * @param filepath Path to CSV file
         * @param symbols Optional list of symbols to keep (all if empty)
         * @return One series per symbol, sorted by symbol
         * @throws std::runtime_error if the file cannot be read or has no usable rows
         */
        static std::vector<PriceSeries> load_price_csv(const std::string &filepath,
                                                       const std::vector<std::string> &symbols = {});

        /**
         * @brief Load a transaction ledger from JSON
         * @throws std::runtime_error on unreadable files
         * @throws std::invalid_argument on malformed transactions
         */
        static ledger::Ledger load_ledger(const std::string &filepath);

        /**
         * @brief Write a JSON document with indentation
         * @throws std::runtime_error if the file cannot be written
         */
        static void save_json(const nlohmann::json &document, const std::string &filepath);

        /// Long format: date,symbol,open,high,low,close,volume, one row per bar.
        static void save_price_csv(const std::vector<PriceSeries> &series, const std::string &filepath);

        // Helpers shared with the sector mapping reader

        static std::vector<std::string> parse_csv_line(const std::string &line, char delimiter = ',');
        static bool is_valid_date_format(const std::string &date);
        static std::string trim(const std::string &str);

        /// NaN if the text is not a number.
        static double safe_stod(const std::string &str);
    };

} // namespace tracker

#endif // TRACKER_DATA_DATA_LOADER_HPP
