// SPDX-License-Identifier: MIT
/**
 * @file data_loader.cpp
 * @brief Implementation of configuration structures, ConfigLoader and DataLoader
 */

#include "data/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <stdexcept>

#include "core/date.hpp"

namespace tracker
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.ledger_file = j.value("ledger_file", "");
        config.prices_file = j.value("prices_file", "");
        config.start_date = j.value("start_date", "");
        config.end_date = j.value("end_date", "");
        config.as_of = j.value("as_of", "");

        for (const auto *date : {&config.start_date, &config.end_date, &config.as_of})
        {
            if (!date->empty() && !Date::is_valid(*date))
            {
                throw std::invalid_argument("Invalid date in data section: " + *date);
            }
        }
        return config;
    }

    nlohmann::json DataConfig::to_json() const
    {
        return {{"ledger_file", ledger_file},
                {"prices_file", prices_file},
                {"start_date", start_date},
                {"end_date", end_date},
                {"as_of", as_of}};
    }

    EngineSettings EngineSettings::from_json(const nlohmann::json &j)
    {
        EngineSettings settings;
        settings.verbose = j.value("verbose", false);
        const int workers = j.value("workers", 2);
        settings.holding_epsilon = j.value("holding_epsilon", 1e-3);

        if (workers <= 0)
        {
            throw std::invalid_argument("Expected positive value for parameter 'workers', got: " +
                                        std::to_string(workers));
        }
        if (settings.holding_epsilon < 0.0)
        {
            throw std::invalid_argument("Expected non-negative value for parameter 'holding_epsilon', got: " +
                                        std::to_string(settings.holding_epsilon));
        }
        settings.workers = static_cast<size_t>(workers);
        return settings;
    }

    nlohmann::json EngineSettings::to_json() const
    {
        return {{"verbose", verbose}, {"workers", workers}, {"holding_epsilon", holding_epsilon}};
    }

    CacheConfig CacheConfig::from_json(const nlohmann::json &j)
    {
        CacheConfig config;
        config.dashboard_ttl_seconds = j.value("dashboard_ttl_seconds", 30);
        if (config.dashboard_ttl_seconds <= 0)
        {
            throw std::invalid_argument("Expected positive value for parameter 'dashboard_ttl_seconds', got: " +
                                        std::to_string(config.dashboard_ttl_seconds));
        }
        return config;
    }

    nlohmann::json CacheConfig::to_json() const
    {
        return {{"dashboard_ttl_seconds", dashboard_ttl_seconds}};
    }

    SectorConfig SectorConfig::from_json(const nlohmann::json &j)
    {
        SectorConfig config;
        config.mapping_file = j.value("mapping_file", "");
        return config;
    }

    nlohmann::json SectorConfig::to_json() const
    {
        return {{"mapping_file", mapping_file}};
    }

    corporate::SplitRegistry EngineConfig::default_splits()
    {
        corporate::SplitRegistry registry;
        registry.add({"CCOLA", Date(2024, 8, 1), 11.0});
        return registry;
    }

    EngineConfig EngineConfig::from_json(const nlohmann::json &j)
    {
        EngineConfig config;

        if (j.contains("data"))
        {
            config.data = DataConfig::from_json(j["data"]);
        }

        if (j.contains("engine"))
        {
            config.engine = EngineSettings::from_json(j["engine"]);
        }

        if (j.contains("valuation"))
        {
            config.valuation = valuation::TimelineOptions::from_json(j["valuation"]);
        }

        if (j.contains("risk"))
        {
            config.risk = analytics::RiskSettings::from_json(j["risk"]);
        }

        if (j.contains("scoring"))
        {
            config.scoring = scoring::ScoringTables::from_json(j["scoring"]);
        }

        if (j.contains("corporate_actions"))
        {
            const auto &actions = j["corporate_actions"];
            config.corporate_actions = corporate::SplitRegistry::from_json(
                actions.is_object() ? actions.value("splits", nlohmann::json::array()) : actions);
            if (actions.is_object() && actions.contains("events"))
            {
                for (const auto &item : actions["events"])
                {
                    config.corporate_events.push_back(corporate::PercentageEvent::from_json(item));
                }
            }
        }

        if (j.contains("cache"))
        {
            config.cache = CacheConfig::from_json(j["cache"]);
        }

        if (j.contains("sectors"))
        {
            config.sectors = SectorConfig::from_json(j["sectors"]);
        }

        return config;
    }

    nlohmann::json EngineConfig::to_json() const
    {
        nlohmann::json j;
        j["data"] = data.to_json();
        j["engine"] = engine.to_json();
        j["valuation"] = {{"base_currency", valuation.base_currency},
                          {"secondary_currency", valuation.secondary_currency}};
        j["risk"] = risk.to_json();
        j["scoring"] = scoring.to_json();
        nlohmann::json events = nlohmann::json::array();
        for (const auto &event : corporate_events)
        {
            events.push_back(event.to_json());
        }
        j["corporate_actions"] = {{"splits", corporate_actions.to_json()}, {"events", events}};
        j["cache"] = cache.to_json();
        j["sectors"] = sectors.to_json();
        return j;
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json ConfigLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    EngineConfig ConfigLoader::load_config(const std::string &config_path)
    {
        return EngineConfig::from_json(load_json(config_path));
    }

    // ===========================
    // Price CSV - Long Format
    // ===========================

    std::vector<PriceSeries> DataLoader::load_price_csv(const std::string &filepath,
                                                        const std::vector<std::string> &symbols)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        // Column positions by header name
        std::map<std::string, size_t> columns;
        auto header = parse_csv_line(line);
        for (size_t i = 0; i < header.size(); ++i)
        {
            std::string name = trim(header[i]);
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (name == "ticker")
                name = "symbol";
            if (name == "price")
                name = "close";
            columns.emplace(name, i);
        }

        if (!columns.count("date") || !columns.count("symbol") || !columns.count("close"))
        {
            throw std::runtime_error("CSV must have 'date', 'symbol' and 'close' columns: " + filepath);
        }

        auto field = [](const std::vector<std::string> &fields, const std::map<std::string, size_t> &cols,
                        const std::string &name) -> std::string
        {
            auto it = cols.find(name);
            if (it == cols.end() || it->second >= fields.size())
                return "";
            return fields[it->second];
        };

        std::map<std::string, PriceSeries> by_symbol;
        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);
            const std::string date = trim(field(fields, columns, "date"));
            const std::string symbol = trim(field(fields, columns, "symbol"));
            const double close = safe_stod(field(fields, columns, "close"));

            if (!is_valid_date_format(date) || !Date::is_valid(date) || symbol.empty() || std::isnan(close))
                continue;

            if (!symbols.empty() && std::find(symbols.begin(), symbols.end(), symbol) == symbols.end())
                continue;

            PriceBar bar;
            bar.date = Date::from_string(date);
            bar.close = close;
            const double open = safe_stod(field(fields, columns, "open"));
            const double high = safe_stod(field(fields, columns, "high"));
            const double low = safe_stod(field(fields, columns, "low"));
            const double volume = safe_stod(field(fields, columns, "volume"));
            bar.open = std::isnan(open) ? close : open;
            bar.high = std::isnan(high) ? close : high;
            bar.low = std::isnan(low) ? close : low;
            bar.volume = std::isnan(volume) ? 0.0 : volume;

            auto it = by_symbol.find(symbol);
            if (it == by_symbol.end())
            {
                it = by_symbol.emplace(symbol, PriceSeries(symbol)).first;
            }
            it->second.add(bar);
        }

        if (by_symbol.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        std::vector<PriceSeries> result;
        result.reserve(by_symbol.size());
        for (auto &entry : by_symbol)
        {
            result.push_back(std::move(entry.second));
        }
        return result;
    }

    ledger::Ledger DataLoader::load_ledger(const std::string &filepath)
    {
        return ledger::Ledger::from_json(ConfigLoader::load_json(filepath));
    }

    void DataLoader::save_json(const nlohmann::json &document, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }
        file << std::setw(2) << document << "\n";
    }

    void DataLoader::save_price_csv(const std::vector<PriceSeries> &series, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date,symbol,open,high,low,close,volume\n";
        file << std::fixed << std::setprecision(4);
        for (const auto &s : series)
        {
            for (const auto &bar : s.bars())
            {
                file << bar.date.to_string() << "," << s.symbol() << ","
                     << bar.open << "," << bar.high << "," << bar.low << ","
                     << bar.close << "," << std::setprecision(0) << bar.volume
                     << std::setprecision(4) << "\n";
            }
        }
    }

    // =======================
    // Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line, char delimiter)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == delimiter && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    bool DataLoader::is_valid_date_format(const std::string &date)
    {
        // YYYY-MM-DD
        if (date.length() != 10)
            return false;
        if (date[4] != '-' || date[7] != '-')
            return false;

        for (size_t i = 0; i < date.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }

        return true;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        const std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try
        {
            size_t consumed = 0;
            const double value = std::stod(trimmed, &consumed);
            return consumed == trimmed.size() ? value : std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::logic_error &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

} // namespace tracker
