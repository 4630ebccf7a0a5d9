// SPDX-License-Identifier: MIT
/**
 * @file price_provider.hpp
 * @brief Price-series and FX-rate lookup interfaces with in-memory implementations.
 */

#ifndef TRACKER_DATA_PRICE_PROVIDER_HPP
#define TRACKER_DATA_PRICE_PROVIDER_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/date.hpp"
#include "data/price_series.hpp"
#include "data/price_table.hpp"

namespace tracker
{
    /**
     * @class PriceProvider
     * @brief Source of daily bars per symbol.
     *
     * A symbol the provider knows nothing about yields an empty series; it
     * never throws for missing data.
     */
    class PriceProvider
    {
    public:
        virtual ~PriceProvider() = default;

        /// Bars of @p symbol with start <= date <= end.
        virtual PriceSeries get_series(const std::string &symbol,
                                       const Date &start, const Date &end) const = 0;

        /// Aligned closes of several symbols over [start, end].
        virtual PriceTable get_prices(const std::vector<std::string> &symbols,
                                      const Date &start, const Date &end) const;
    };

    /**
     * @class InMemoryPriceProvider
     * @brief PriceProvider over series held in memory (loaded from CSV or built in tests).
     */
    class InMemoryPriceProvider : public PriceProvider
    {
    public:
        InMemoryPriceProvider() = default;
        explicit InMemoryPriceProvider(const std::vector<PriceSeries> &series);

        void add_series(const PriceSeries &series);
        void add_bar(const std::string &symbol, const PriceBar &bar);

        /// Convenience for close-only data: open/high/low equal the close.
        void add_close(const std::string &symbol, const Date &date, double close);

        PriceSeries get_series(const std::string &symbol,
                               const Date &start, const Date &end) const override;

        std::vector<std::string> symbols() const;

    private:
        std::map<std::string, PriceSeries> series_;
    };

    /**
     * @class FxRateProvider
     * @brief Currency conversion rates quoted as units of @p quote per one @p base.
     */
    class FxRateProvider
    {
    public:
        virtual ~FxRateProvider() = default;

        virtual std::optional<double> latest_rate(const std::string &base,
                                                  const std::string &quote) const = 0;

        virtual std::optional<double> rate_asof(const std::string &base,
                                                const std::string &quote,
                                                const Date &date) const = 0;
    };

    /**
     * @class SeriesFxRateProvider
     * @brief FX rates read from pair series of a PriceProvider (e.g. "EURTRY").
     *
     * When only the inverse pair exists its reciprocal is used. Non-positive
     * rates are treated as missing.
     */
    class SeriesFxRateProvider : public FxRateProvider
    {
    public:
        /**
         * @param prices Provider holding the pair series; must outlive this object.
         * @param history_start Earliest date searched for a rate.
         */
        explicit SeriesFxRateProvider(const PriceProvider &prices,
                                      Date history_start = Date(2000, 1, 1));

        std::optional<double> latest_rate(const std::string &base,
                                          const std::string &quote) const override;

        std::optional<double> rate_asof(const std::string &base,
                                        const std::string &quote,
                                        const Date &date) const override;

    private:
        const PriceProvider &prices_;
        Date history_start_;
    };

} // namespace tracker

#endif // TRACKER_DATA_PRICE_PROVIDER_HPP
