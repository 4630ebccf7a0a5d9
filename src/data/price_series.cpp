// SPDX-License-Identifier: MIT
/**
 * @file price_series.cpp
 * @brief Implementation of PriceSeries
 */

#include "data/price_series.hpp"
#include <algorithm>

namespace tracker
{
    namespace
    {
        bool bar_before(const PriceBar &a, const PriceBar &b)
        {
            return a.date < b.date;
        }
    } // namespace

    PriceSeries::PriceSeries(std::string symbol, std::vector<PriceBar> bars)
        : symbol_(std::move(symbol)), bars_(std::move(bars))
    {
        std::stable_sort(bars_.begin(), bars_.end(), bar_before);
    }

    void PriceSeries::add(const PriceBar &bar)
    {
        auto it = std::lower_bound(bars_.begin(), bars_.end(), bar, bar_before);
        if (it != bars_.end() && it->date == bar.date)
        {
            *it = bar;
            return;
        }
        bars_.insert(it, bar);
    }

    std::optional<PriceBar> PriceSeries::asof(const Date &date) const
    {
        auto it = std::upper_bound(bars_.begin(), bars_.end(), date,
                                   [](const Date &d, const PriceBar &b)
                                   { return d < b.date; });
        if (it == bars_.begin())
        {
            return std::nullopt;
        }
        return *(it - 1);
    }

    PriceSeries PriceSeries::between(const Date &start, const Date &end) const
    {
        PriceSeries out(symbol_);
        for (const auto &bar : bars_)
        {
            if (bar.date >= start && bar.date <= end)
            {
                out.bars_.push_back(bar);
            }
        }
        return out;
    }

    std::vector<double> PriceSeries::closes() const
    {
        std::vector<double> out;
        out.reserve(bars_.size());
        for (const auto &bar : bars_)
        {
            out.push_back(bar.close);
        }
        return out;
    }

} // namespace tracker
