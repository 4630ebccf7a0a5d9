// SPDX-License-Identifier: MIT
/**
 * @file sector_mapper.cpp
 * @brief Implementation of SectorMapping and MappedSectorLookup
 */

#include "data/sector_mapper.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace tracker {
namespace data {

// Trim helpers (left/right)
static inline std::string ltrim(std::string s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

static inline std::string rtrim(std::string s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    return s;
}

static inline std::string trim(std::string s)
{
    return ltrim(rtrim(std::move(s)));
}

nlohmann::json SectorInfo::to_json() const
{
    return nlohmann::json{{"sector", sector}, {"industry", industry}, {"source", source}};
}

SectorMapping::SectorMapping(const std::vector<std::string>& symbols,
                             const std::vector<std::string>& sectors,
                             const std::vector<std::string>& industries)
{
    if (symbols.size() != sectors.size())
    {
        throw std::invalid_argument("SectorMapping: symbols and sectors size mismatch");
    }
    if (!industries.empty() && industries.size() != symbols.size())
    {
        throw std::invalid_argument("SectorMapping: symbols and industries size mismatch");
    }

    for (size_t i = 0; i < symbols.size(); ++i)
    {
        const std::string symbol = trim(symbols[i]);
        const std::string sector = trim(sectors[i]);
        if (symbol.empty())
        {
            throw std::invalid_argument("SectorMapping: empty symbol at index " + std::to_string(i));
        }
        if (sector.empty())
        {
            throw std::invalid_argument("SectorMapping: empty sector name for symbol '" + symbol + "'");
        }

        SectorInfo info;
        info.sector = sector;
        info.source = "mapping";
        if (!industries.empty() && !trim(industries[i]).empty())
        {
            info.industry = trim(industries[i]);
        }

        if (by_symbol_.find(symbol) == by_symbol_.end())
        {
            symbols_.push_back(symbol);
        }
        by_symbol_[symbol] = info;
    }
}

SectorMapping SectorMapping::from_csv(const std::string& filepath, char delimiter)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("SectorMapping::from_csv: could not open file: " + filepath);
    }

    std::string line;
    std::vector<std::string> symbols;
    std::vector<std::string> sectors;
    std::vector<std::string> industries;

    // Header row
    if (!std::getline(file, line))
    {
        throw std::runtime_error("SectorMapping::from_csv: empty file: " + filepath);
    }

    while (std::getline(file, line))
    {
        if (line.empty())
            continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string item;
        while (std::getline(ss, item, delimiter))
        {
            fields.push_back(trim(item));
        }

        if (fields.size() < 2 || fields[0].empty() || fields[1].empty())
        {
            continue;
        }

        symbols.push_back(fields[0]);
        sectors.push_back(fields[1]);
        industries.push_back(fields.size() > 2 ? fields[2] : std::string());
    }

    if (symbols.empty())
    {
        throw std::runtime_error("SectorMapping::from_csv: no valid mappings found in: " + filepath);
    }

    return SectorMapping(symbols, sectors, industries);
}

SectorMapping SectorMapping::from_json(const nlohmann::json& j)
{
    if (!j.contains("assets") || !j.contains("sectors"))
    {
        throw std::invalid_argument("SectorMapping::from_json: JSON must contain 'assets' and 'sectors' arrays");
    }

    auto symbols = j.at("assets").get<std::vector<std::string>>();
    auto sectors = j.at("sectors").get<std::vector<std::string>>();
    auto industries = j.value("industries", std::vector<std::string>{});

    return SectorMapping(symbols, sectors, industries);
}

std::vector<std::string> SectorMapping::get_sectors() const
{
    std::set<std::string> unique;
    for (const auto& p : by_symbol_)
    {
        unique.insert(p.second.sector);
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

std::vector<std::string> SectorMapping::get_symbols_in_sector(const std::string& sector) const
{
    std::vector<std::string> out;
    for (const auto& symbol : symbols_)
    {
        if (by_symbol_.at(symbol).sector == sector)
        {
            out.push_back(symbol);
        }
    }
    return out;
}

bool SectorMapping::contains(const std::string& symbol) const
{
    return by_symbol_.find(symbol) != by_symbol_.end();
}

const SectorInfo& SectorMapping::get(const std::string& symbol) const
{
    auto it = by_symbol_.find(symbol);
    if (it == by_symbol_.end())
    {
        throw std::out_of_range("SectorMapping: symbol not found: " + symbol);
    }
    return it->second;
}

nlohmann::json SectorMapping::to_json() const
{
    std::vector<std::string> sectors;
    std::vector<std::string> industries;
    for (const auto& symbol : symbols_)
    {
        const SectorInfo& info = by_symbol_.at(symbol);
        sectors.push_back(info.sector);
        industries.push_back(info.industry);
    }
    return nlohmann::json{{"assets", symbols_}, {"sectors", sectors}, {"industries", industries}};
}

std::optional<SectorInfo> MappedSectorLookup::lookup(const std::string& symbol) const
{
    if (!mapping_.contains(symbol))
    {
        return std::nullopt;
    }
    return mapping_.get(symbol);
}

} // namespace data
} // namespace tracker
