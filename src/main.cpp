// SPDX-License-Identifier: MIT
/**
 * @file main.cpp
 * @brief Main entry point for the Portfolio Tracker
 *
 * Command-line application that loads a configuration, a transaction
 * ledger and price history, then values the portfolio, scores its
 * positions and writes a JSON report.
 */

#include "core/cache.hpp"
#include "core/date.hpp"
#include "corporate/corporate_actions.hpp"
#include "data/data_loader.hpp"
#include "data/price_provider.hpp"
#include "data/sector_mapper.hpp"
#include "engine/portfolio_engine.hpp"
#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace tracker;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Portfolio Tracker v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file\n"
              << "  --ledger PATH         Transaction ledger JSON (overrides data.ledger_file)\n"
              << "  --prices PATH         Long-format price CSV (overrides data.prices_file)\n"
              << "  --sectors PATH        Sector mapping CSV or JSON (overrides sectors.mapping_file)\n"
              << "  --as-of DATE          Valuation date YYYY-MM-DD (default: last price date)\n"
              << "  --start DATE          Timeline start (default: first transaction)\n"
              << "  --end DATE            Timeline end (default: as-of date)\n"
              << "  --output PATH         Write the JSON report to PATH\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config config/engine_config.json --output report.json\n"
              << "  " << program_name << " --ledger data/ledger.json --prices data/prices.csv --as-of 2024-06-28\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Portfolio Tracker v1.0.0                                \n"
              << "       Ledger Replay, Valuation and Risk Scoring               \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string ledger_path;
    std::string prices_path;
    std::string sectors_path;
    std::string as_of;
    std::string start;
    std::string end;
    std::string output_path;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--ledger" && i + 1 < argc)
            {
                args.ledger_path = argv[++i];
            }
            else if (arg == "--prices" && i + 1 < argc)
            {
                args.prices_path = argv[++i];
            }
            else if (arg == "--sectors" && i + 1 < argc)
            {
                args.sectors_path = argv[++i];
            }
            else if (arg == "--as-of" && i + 1 < argc)
            {
                args.as_of = argv[++i];
            }
            else if (arg == "--start" && i + 1 < argc)
            {
                args.start = argv[++i];
            }
            else if (arg == "--end" && i + 1 < argc)
            {
                args.end = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && (!config_path.empty() || (!ledger_path.empty() && !prices_path.empty()));
    }
};

namespace
{
    bool ends_with(const std::string &value, const std::string &suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    /// Latest bar date across all loaded series.
    Date last_price_date(const std::vector<PriceSeries> &series)
    {
        Date last;
        for (const auto &s : series)
        {
            if (!s.empty() && s.back().date > last)
            {
                last = s.back().date;
            }
        }
        return last;
    }
} // namespace

/**
 * @brief Run the full pipeline
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration..." << std::endl;

        EngineConfig config;
        if (!args.config_path.empty())
        {
            config = ConfigLoader::load_config(args.config_path);
        }
        if (!args.ledger_path.empty())
            config.data.ledger_file = args.ledger_path;
        if (!args.prices_path.empty())
            config.data.prices_file = args.prices_path;
        if (!args.sectors_path.empty())
            config.sectors.mapping_file = args.sectors_path;
        if (args.verbose)
            config.engine.verbose = true;

        if (config.data.ledger_file.empty() || config.data.prices_file.empty())
        {
            throw std::invalid_argument("A ledger file and a prices file are required");
        }

        if (config.engine.verbose)
        {
            std::cout << "  - Ledger: " << config.data.ledger_file << "\n";
            std::cout << "  - Prices: " << config.data.prices_file << "\n";
            std::cout << "  - Currencies: " << config.valuation.base_currency
                      << " / " << config.valuation.secondary_currency << "\n";
            std::cout << "  - Known splits: " << config.corporate_actions.size() << "\n";
        }

        // ====================================================================
        // 2. Load Ledger and Prices
        // ====================================================================
        std::cout << "[2/5] Loading ledger and price history..." << std::endl;

        auto ledger = DataLoader::load_ledger(config.data.ledger_file);
        auto series = DataLoader::load_price_csv(config.data.prices_file);

        std::cout << "  - Loaded " << ledger.size() << " transactions, "
                  << series.size() << " price series" << std::endl;

        if (!config.corporate_events.empty())
        {
            auto applied = corporate::apply_percentage_events(ledger, config.corporate_events);
            for (const auto &result : applied)
            {
                if (result.success)
                {
                    std::cout << "  - " << result.transaction.date << " " << *result.transaction.symbol
                              << ": " << result.message << std::endl;
                }
                else
                {
                    std::cerr << "Warning: " << result.message << std::endl;
                }
            }
        }

        InMemoryPriceProvider prices(series);
        SeriesFxRateProvider fx(prices);

        std::unique_ptr<data::MappedSectorLookup> sectors;
        if (!config.sectors.mapping_file.empty())
        {
            const auto &path = config.sectors.mapping_file;
            auto mapping = ends_with(path, ".json")
                               ? data::SectorMapping::from_json(ConfigLoader::load_json(path))
                               : data::SectorMapping::from_csv(path);
            std::cout << "  - Sector mapping: " << mapping.size() << " symbols" << std::endl;
            sectors = std::make_unique<data::MappedSectorLookup>(std::move(mapping));
        }

        // ====================================================================
        // 3. Resolve Dates
        // ====================================================================
        std::cout << "[3/5] Resolving analysis window..." << std::endl;

        const std::string as_of_text = !args.as_of.empty() ? args.as_of : config.data.as_of;
        const Date as_of = as_of_text.empty() ? last_price_date(series) : Date::from_string(as_of_text);

        const std::string start_text = !args.start.empty() ? args.start : config.data.start_date;
        const std::string end_text = !args.end.empty() ? args.end : config.data.end_date;
        const Date start = !start_text.empty() ? Date::from_string(start_text)
                                               : ledger.first_date().value_or(as_of);
        const Date end = !end_text.empty() ? Date::from_string(end_text) : as_of;

        std::cout << "  - As of " << as_of << ", timeline " << start << " to " << end << std::endl;

        // ====================================================================
        // 4. Run Engine
        // ====================================================================
        std::cout << "[4/5] Valuing and scoring portfolio..." << std::endl;

        TtlCache<engine::DashboardMetrics> dashboard_cache(
            std::chrono::seconds(config.cache.dashboard_ttl_seconds));
        TtlCache<data::SectorInfo> sector_cache(std::chrono::hours(24));

        engine::PortfolioEngine engine(ledger, prices, &fx, sectors.get(),
                                       dashboard_cache, sector_cache, config);

        auto holdings = engine.holdings(as_of);
        std::cout << "\n  Current holdings (" << holdings.size() << "):\n";
        std::cout << std::fixed << std::setprecision(4);
        for (const auto &holding : holdings)
        {
            std::cout << "    " << std::left << std::setw(10) << holding.first << std::right
                      << std::setw(14) << holding.second << "\n";
        }
        std::cout << std::setprecision(2);
        std::cout << "  Cash balance: " << engine.cash_balance(as_of) << " "
                  << config.valuation.base_currency << "\n";

        for (const auto &symbol : engine.negative_positions(as_of))
        {
            std::cerr << "Warning: negative quantity for " << symbol << " (oversold)" << std::endl;
        }

        auto timeline = engine.timeline(start, end);
        timeline.print_summary();

        auto risk = engine.risk_report(as_of);
        risk.print_summary();

        auto sector_result = engine.sector_analysis(as_of);
        sector_result.print_summary();

        auto dashboard = engine.dashboard(as_of);
        dashboard.print_summary();

        // ====================================================================
        // 5. Export Report
        // ====================================================================
        if (!args.output_path.empty())
        {
            std::cout << "\n[5/5] Writing report..." << std::endl;
            DataLoader::save_json(engine.report(as_of, start, end), args.output_path);
            std::cout << "  Report written to: " << args.output_path << "\n";
        }
        else
        {
            std::cout << "\n[5/5] Skipping report export (use --output to enable)\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
