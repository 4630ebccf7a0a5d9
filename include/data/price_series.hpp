// SPDX-License-Identifier: MIT
/**
 * @file price_series.hpp
 * @brief Per-symbol daily OHLCV bars.
 */

#ifndef TRACKER_DATA_PRICE_SERIES_HPP
#define TRACKER_DATA_PRICE_SERIES_HPP

#include <optional>
#include <string>
#include <vector>

#include "core/date.hpp"

namespace tracker
{
    /**
     * @struct PriceBar
     * @brief One trading day of a symbol.
     */
    struct PriceBar
    {
        Date date;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0;
    };

    /**
     * @class PriceSeries
     * @brief Date-ordered bars for a single symbol.
     *
     * An empty series means the provider had no data for the symbol.
     */
    class PriceSeries
    {
    public:
        PriceSeries() = default;
        explicit PriceSeries(std::string symbol) : symbol_(std::move(symbol)) {}
        PriceSeries(std::string symbol, std::vector<PriceBar> bars);

        const std::string &symbol() const { return symbol_; }
        const std::vector<PriceBar> &bars() const { return bars_; }
        std::vector<PriceBar> &bars() { return bars_; }

        size_t size() const { return bars_.size(); }
        bool empty() const { return bars_.empty(); }

        /// Insert keeping date order; a bar on an existing date replaces it.
        void add(const PriceBar &bar);

        /// Last bar on or before @p date.
        std::optional<PriceBar> asof(const Date &date) const;

        /// Bars with start <= date <= end.
        PriceSeries between(const Date &start, const Date &end) const;

        std::vector<double> closes() const;

        const PriceBar &front() const { return bars_.front(); }
        const PriceBar &back() const { return bars_.back(); }

    private:
        std::string symbol_;
        std::vector<PriceBar> bars_;
    };

} // namespace tracker

#endif // TRACKER_DATA_PRICE_SERIES_HPP
