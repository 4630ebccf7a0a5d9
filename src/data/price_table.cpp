// SPDX-License-Identifier: MIT
/**
 * @file price_table.cpp
 * @brief Implementation of PriceTable
 */

#include "data/price_table.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

namespace tracker
{

    // ============================================================================
    // Constructors
    // ============================================================================

    PriceTable::PriceTable(const Eigen::MatrixXd &closes,
                           const std::vector<Date> &dates,
                           const std::vector<std::string> &symbols)
        : closes_(closes), dates_(dates), symbols_(symbols)
    {
        if (closes_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument("Close matrix rows must match dates vector size");
        }
        if (closes_.cols() != static_cast<Eigen::Index>(symbols_.size()))
        {
            throw std::invalid_argument("Close matrix columns must match symbols vector size");
        }
        if (!std::is_sorted(dates_.begin(), dates_.end()))
        {
            throw std::invalid_argument("Price table dates must be in ascending order");
        }

        build_index_maps();
    }

    PriceTable PriceTable::from_series(const std::vector<PriceSeries> &series)
    {
        std::set<Date> all_dates;
        for (const auto &s : series)
        {
            for (const auto &bar : s.bars())
            {
                all_dates.insert(bar.date);
            }
        }

        std::vector<Date> dates(all_dates.begin(), all_dates.end());
        std::map<Date, size_t> row_of;
        for (size_t i = 0; i < dates.size(); ++i)
        {
            row_of[dates[i]] = i;
        }

        std::vector<std::string> symbols;
        symbols.reserve(series.size());
        Eigen::MatrixXd closes = Eigen::MatrixXd::Constant(
            dates.size(), series.size(), std::numeric_limits<double>::quiet_NaN());

        for (size_t j = 0; j < series.size(); ++j)
        {
            symbols.push_back(series[j].symbol());
            for (const auto &bar : series[j].bars())
            {
                closes(row_of[bar.date], j) = bar.close;
            }
        }

        return PriceTable(closes, dates, symbols);
    }

    // ============================================================================
    // Data Access Methods
    // ============================================================================

    std::optional<double> PriceTable::asof(const std::string &symbol, const Date &date) const
    {
        int col = find_symbol_index(symbol);
        if (col < 0)
        {
            return std::nullopt;
        }

        for (int row = last_row_asof(date); row >= 0; --row)
        {
            double value = closes_(row, col);
            if (!std::isnan(value))
            {
                return value;
            }
        }
        return std::nullopt;
    }

    bool PriceTable::has_data_asof(const Date &date) const
    {
        return last_row_asof(date) >= 0;
    }

    // =========================
    // Private Helper Methods
    // =========================

    int PriceTable::find_symbol_index(const std::string &symbol) const
    {
        auto it = symbol_index_.find(symbol);
        if (it != symbol_index_.end())
        {
            return static_cast<int>(it->second);
        }
        return -1;
    }

    int PriceTable::last_row_asof(const Date &date) const
    {
        auto it = std::upper_bound(dates_.begin(), dates_.end(), date);
        return static_cast<int>(std::distance(dates_.begin(), it)) - 1;
    }

    void PriceTable::build_index_maps()
    {
        symbol_index_.clear();
        for (size_t i = 0; i < symbols_.size(); ++i)
        {
            symbol_index_[symbols_[i]] = i;
        }
    }

} // namespace tracker
