// SPDX-License-Identifier: MIT
/**
 * @file price_provider.cpp
 * @brief Implementation of the in-memory price and FX providers
 */

#include "data/price_provider.hpp"

namespace tracker
{
    PriceTable PriceProvider::get_prices(const std::vector<std::string> &symbols,
                                         const Date &start, const Date &end) const
    {
        std::vector<PriceSeries> series;
        series.reserve(symbols.size());
        for (const auto &symbol : symbols)
        {
            PriceSeries s = get_series(symbol, start, end);
            if (s.symbol().empty())
            {
                s = PriceSeries(symbol, s.bars());
            }
            series.push_back(s);
        }
        return PriceTable::from_series(series);
    }

    // ============================================================================
    // InMemoryPriceProvider
    // ============================================================================

    InMemoryPriceProvider::InMemoryPriceProvider(const std::vector<PriceSeries> &series)
    {
        for (const auto &s : series)
        {
            add_series(s);
        }
    }

    void InMemoryPriceProvider::add_series(const PriceSeries &series)
    {
        auto it = series_.find(series.symbol());
        if (it == series_.end())
        {
            series_.emplace(series.symbol(), series);
            return;
        }
        for (const auto &bar : series.bars())
        {
            it->second.add(bar);
        }
    }

    void InMemoryPriceProvider::add_bar(const std::string &symbol, const PriceBar &bar)
    {
        auto it = series_.find(symbol);
        if (it == series_.end())
        {
            it = series_.emplace(symbol, PriceSeries(symbol)).first;
        }
        it->second.add(bar);
    }

    void InMemoryPriceProvider::add_close(const std::string &symbol, const Date &date, double close)
    {
        add_bar(symbol, PriceBar{date, close, close, close, close, 0.0});
    }

    PriceSeries InMemoryPriceProvider::get_series(const std::string &symbol,
                                                  const Date &start, const Date &end) const
    {
        auto it = series_.find(symbol);
        if (it == series_.end())
        {
            return PriceSeries(symbol);
        }
        return it->second.between(start, end);
    }

    std::vector<std::string> InMemoryPriceProvider::symbols() const
    {
        std::vector<std::string> out;
        out.reserve(series_.size());
        for (const auto &kv : series_)
        {
            out.push_back(kv.first);
        }
        return out;
    }

    // ============================================================================
    // SeriesFxRateProvider
    // ============================================================================

    SeriesFxRateProvider::SeriesFxRateProvider(const PriceProvider &prices, Date history_start)
        : prices_(prices), history_start_(history_start)
    {
    }

    std::optional<double> SeriesFxRateProvider::rate_asof(const std::string &base,
                                                          const std::string &quote,
                                                          const Date &date) const
    {
        if (base == quote)
        {
            return 1.0;
        }

        auto direct = prices_.get_series(base + quote, history_start_, date).asof(date);
        if (direct && direct->close > 0.0)
        {
            return direct->close;
        }

        auto inverse = prices_.get_series(quote + base, history_start_, date).asof(date);
        if (inverse && inverse->close > 0.0)
        {
            return 1.0 / inverse->close;
        }
        return std::nullopt;
    }

    std::optional<double> SeriesFxRateProvider::latest_rate(const std::string &base,
                                                            const std::string &quote) const
    {
        if (base == quote)
        {
            return 1.0;
        }

        const Date far_future(9999, 12, 31);
        PriceSeries direct = prices_.get_series(base + quote, history_start_, far_future);
        if (!direct.empty() && direct.back().close > 0.0)
        {
            return direct.back().close;
        }

        PriceSeries inverse = prices_.get_series(quote + base, history_start_, far_future);
        if (!inverse.empty() && inverse.back().close > 0.0)
        {
            return 1.0 / inverse.back().close;
        }
        return std::nullopt;
    }

} // namespace tracker
