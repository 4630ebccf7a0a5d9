// SPDX-License-Identifier: MIT
/**
 * @file generate_sample_data.cpp
 * @brief Generate a sample ledger, price history and sector mapping for the tracker
 */

#include "core/date.hpp"
#include "data/data_loader.hpp"
#include "ledger/ledger.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <stdexcept>

using namespace tracker;

namespace {

struct SampleAsset {
    std::string symbol;
    std::string sector;
    std::string industry;
    double start_price;
    double volatility_scale;
};

bool is_weekday(const Date& date) {
    // 1970-01-01 was a Thursday
    const long dow = ((date.serial() + 4) % 7 + 7) % 7;
    return dow != 0 && dow != 6;
}

ledger::Transaction make(ledger::TransactionType type, const std::string& symbol,
                         double quantity, double price, const Date& date, const std::string& note = "") {
    ledger::Transaction tx;
    tx.type = type;
    if (!symbol.empty()) tx.symbol = symbol;
    tx.quantity = quantity;
    tx.price = price;
    tx.date = date;
    tx.note = note;
    return tx;
}

double close_on(const PriceSeries& series, const Date& date) {
    auto bar = series.asof(date);
    if (!bar) {
        throw std::runtime_error("No generated price for " + series.symbol() + " on " + date.to_string());
    }
    return std::round(bar->close * 100.0) / 100.0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "\n=== Sample Data Generator ===\n" << std::endl;

    std::vector<SampleAsset> assets = {
        {"THYAO", "Industrials", "Airlines", 260.0, 1.2},
        {"GARAN", "Financial Services", "Banks", 65.0, 1.1},
        {"ASELS", "Industrials", "Aerospace & Defense", 48.0, 1.0},
        {"BIMAS", "Consumer Defensive", "Discount Stores", 300.0, 0.8},
        {"CCOLA", "Consumer Defensive", "Beverages", 480.0, 0.9},
        {"TUPRS", "Energy", "Oil & Gas Refining", 140.0, 1.0}
    };

    std::string output_dir = "data";
    std::string start_date = "2024-01-02";
    std::string end_date = "2024-09-30";
    double base_volatility = 0.02;  // 2% daily volatility
    double base_drift = 0.0006;
    unsigned int seed = 42;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output-dir" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--volatility" && i + 1 < argc) {
            base_volatility = std::stod(argv[++i]);
        } else if (arg == "--drift" && i + 1 < argc) {
            base_drift = std::stod(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output-dir DIR   Directory for prices.csv, ledger.json, sectors.csv (default: data)\n"
                      << "  --volatility VAL   Base daily volatility (default: 0.02)\n"
                      << "  --drift VAL        Base daily drift (default: 0.0006)\n"
                      << "  --seed N           Random seed (default: 42)\n"
                      << "  --help             Show this help\n";
            return 0;
        }
    }

    try {
        const Date first = Date::from_string(start_date);
        const Date last = Date::from_string(end_date);
        const Date ccola_split(2024, 8, 1);

        std::cout << "Generating prices for " << assets.size() << " symbols and EURTRY..." << std::endl;
        std::cout << "Time period: " << start_date << " to " << end_date << std::endl;

        // Geometric random walk over weekdays
        std::mt19937 gen(seed);
        std::vector<PriceSeries> series;
        for (const auto& asset : assets) {
            std::normal_distribution<double> dist(base_drift, base_volatility * asset.volatility_scale);
            std::uniform_real_distribution<double> volume(5e4, 5e5);
            PriceSeries s(asset.symbol);
            double close = asset.start_price;
            for (Date day = first; day <= last; day = day.add_days(1)) {
                if (!is_weekday(day)) continue;
                if (asset.symbol == "CCOLA" && day == ccola_split) {
                    close /= 11.0;  // 1:11 bonus issue, raw prices drop on the split date
                }
                const double open = close;
                close = close * (1.0 + dist(gen));
                PriceBar bar;
                bar.date = day;
                bar.open = open;
                bar.close = close;
                bar.high = std::max(open, close) * 1.01;
                bar.low = std::min(open, close) * 0.99;
                bar.volume = std::round(volume(gen));
                s.add(bar);
            }
            series.push_back(s);
        }

        std::normal_distribution<double> fx_dist(0.0003, 0.004);
        PriceSeries eurtry("EURTRY");
        double rate = 33.0;
        for (Date day = first; day <= last; day = day.add_days(1)) {
            if (!is_weekday(day)) continue;
            rate *= 1.0 + fx_dist(gen);
            eurtry.add({day, rate, rate, rate, rate, 0.0});
        }
        series.push_back(eurtry);

        auto price = [&](const std::string& symbol, const std::string& date) {
            for (const auto& s : series) {
                if (s.symbol() == symbol) return close_on(s, Date::from_string(date));
            }
            throw std::runtime_error("Unknown symbol: " + symbol);
        };

        using ledger::TransactionType;
        ledger::Ledger book;
        book.append(make(TransactionType::DEPOSIT, "", 250000.0, 0.0, Date(2024, 1, 2), "Initial funding"));
        book.append(make(TransactionType::BUY, "THYAO", 200, price("THYAO", "2024-01-03"), Date(2024, 1, 3)));
        book.append(make(TransactionType::BUY, "GARAN", 800, price("GARAN", "2024-01-10"), Date(2024, 1, 10)));
        book.append(make(TransactionType::BUY, "ASELS", 600, price("ASELS", "2024-02-01"), Date(2024, 2, 1)));
        book.append(make(TransactionType::BUY, "CCOLA", 30, price("CCOLA", "2024-03-01"), Date(2024, 3, 1)));
        book.append(make(TransactionType::BUY, "BIMAS", 50, price("BIMAS", "2024-04-02"), Date(2024, 4, 2)));
        book.append(make(TransactionType::DIVIDEND, "GARAN", 0.0, 1200.0, Date(2024, 5, 15), "Cash dividend"));
        book.append(make(TransactionType::BUY, "THYAO", 100, price("THYAO", "2024-05-20"), Date(2024, 5, 20)));
        book.append(make(TransactionType::SELL, "THYAO", 120, price("THYAO", "2024-06-14"), Date(2024, 6, 14)));
        book.append(make(TransactionType::BUY, "TUPRS", 150, price("TUPRS", "2024-07-01"), Date(2024, 7, 1)));
        book.append(make(TransactionType::SPLIT, "CCOLA", 300, 0.0, ccola_split, "1:11 bonus issue"));
        book.append(make(TransactionType::WITHDRAWAL, "", 10000.0, 0.0, Date(2024, 8, 15)));
        book.append(make(TransactionType::SELL, "BIMAS", 50, price("BIMAS", "2024-09-02"), Date(2024, 9, 2)));

        const std::string prices_path = output_dir + "/prices.csv";
        const std::string ledger_path = output_dir + "/ledger.json";
        const std::string sectors_path = output_dir + "/sectors.csv";

        std::cout << "Saving to " << output_dir << "/..." << std::endl;
        DataLoader::save_price_csv(series, prices_path);
        DataLoader::save_json(book.to_json(), ledger_path);

        std::ofstream sectors(sectors_path);
        if (!sectors.is_open()) {
            throw std::runtime_error("Could not open file for writing: " + sectors_path);
        }
        sectors << "symbol,sector,industry\n";
        for (const auto& asset : assets) {
            // TUPRS stays unmapped to exercise the Unknown fallback
            if (asset.symbol == "TUPRS") continue;
            sectors << asset.symbol << "," << asset.sector << "," << asset.industry << "\n";
        }

        std::cout << "\n=== Generated Data Summary ===\n";
        std::cout << std::string(44, '-') << "\n";
        std::cout << std::setw(8) << "Symbol" << std::setw(8) << "Bars"
                  << std::setw(14) << "First close" << std::setw(14) << "Last close" << "\n";
        std::cout << std::string(44, '-') << "\n";
        for (const auto& s : series) {
            std::cout << std::setw(8) << s.symbol() << std::setw(8) << s.size()
                      << std::setw(14) << std::fixed << std::setprecision(2) << s.front().close
                      << std::setw(14) << s.back().close << "\n";
        }
        std::cout << std::string(44, '-') << "\n";
        std::cout << "Transactions: " << book.size() << "\n";

        std::cout << "\nData generation complete!\n" << std::endl;
        std::cout << "You can now run:\n";
        std::cout << "  ./build/portfolio_tracker --config config/engine_config.json --verbose\n";
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
