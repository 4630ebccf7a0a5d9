// SPDX-License-Identifier: MIT
/*
 * @file price_table.hpp
 * @brief Aligned close-price matrix for several symbols.
 *
 * Stores closes as an Eigen matrix (dates x symbols) over the union of the
 * trading dates of its inputs. Missing data is NaN; lookups are "as of" a
 * date, so gaps resolve to the last known close.
 */

#ifndef TRACKER_DATA_PRICE_TABLE_HPP
#define TRACKER_DATA_PRICE_TABLE_HPP

#include <Eigen/Dense>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/date.hpp"
#include "data/price_series.hpp"

namespace tracker
{
    /**
     * @class PriceTable
     * @brief Multi-symbol close prices indexed by date.
     *
     * @note Rows are dates in ascending order, columns are symbols.
     * @note Missing data is represented as NaN values.
     */
    class PriceTable
    {
    public:
        PriceTable() = default;

        /**
         * @brief Constructor with data.
         * @param closes Close matrix (dates x symbols).
         * @param dates Ascending row dates.
         * @param symbols Column symbols.
         * @throws std::invalid_argument on dimension mismatch or unsorted dates.
         */
        PriceTable(const Eigen::MatrixXd &closes,
                   const std::vector<Date> &dates,
                   const std::vector<std::string> &symbols);

        /**
         * @brief Align several series on the union of their dates.
         *
         * Empty series still get a (fully NaN) column so that callers can ask
         * about them without special-casing.
         */
        static PriceTable from_series(const std::vector<PriceSeries> &series);

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        const Eigen::MatrixXd &closes() const { return closes_; }
        const std::vector<Date> &dates() const { return dates_; }
        const std::vector<std::string> &symbols() const { return symbols_; }

        size_t num_dates() const { return closes_.rows(); }
        size_t num_symbols() const { return closes_.cols(); }
        bool empty() const { return dates_.empty(); }

        /**
         * @brief Last known close of @p symbol on or before @p date.
         * @return nullopt if the symbol is unknown or has no close yet.
         */
        std::optional<double> asof(const std::string &symbol, const Date &date) const;

        /// True if at least one row is dated on or before @p date.
        bool has_data_asof(const Date &date) const;

    private:
        int find_symbol_index(const std::string &symbol) const;

        /// Index of the last row dated on or before @p date, -1 if none.
        int last_row_asof(const Date &date) const;

        void build_index_maps();

        Eigen::MatrixXd closes_;                     ///< Close matrix (dates x symbols)
        std::vector<Date> dates_;                    ///< Ascending row dates
        std::vector<std::string> symbols_;           ///< Column symbols
        std::map<std::string, size_t> symbol_index_; ///< Symbol to column map
    };

} // namespace tracker

#endif // TRACKER_DATA_PRICE_TABLE_HPP
