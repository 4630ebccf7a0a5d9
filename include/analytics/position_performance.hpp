// SPDX-License-Identifier: MIT
/**
 * @file position_performance.hpp
 * @brief Return of a held position since its first purchase.
 */

#ifndef TRACKER_ANALYTICS_POSITION_PERFORMANCE_HPP
#define TRACKER_ANALYTICS_POSITION_PERFORMANCE_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "core/date.hpp"
#include "ledger/ledger.hpp"
#include "ledger/replay.hpp"

namespace tracker
{
    namespace analytics
    {
        /**
         * @struct PositionPerformance
         * @brief Unrealized result of one symbol measured against its FIFO cost.
         */
        struct PositionPerformance
        {
            bool success = false;
            std::string message;
            std::string symbol;

            double quantity = 0.0;
            double cost_basis = 0.0;             ///< FIFO cost of the held quantity
            double average_purchase_price = 0.0;
            double current_price = 0.0;
            double current_value = 0.0;
            double return_amount = 0.0;
            double return_percentage = 0.0;      ///< 0 when cost_basis is not positive
            std::optional<Date> first_purchase_date;
            int days_held = 0;                   ///< as_of - first buy, 0 without a buy
            double annualized_return = 0.0;      ///< compound annual growth, percent

            nlohmann::json to_json() const;
        };

        /**
         * @brief Compute the position figures of @p symbol as of @p as_of.
         *
         * Fails with "Stock not currently held" when the replayed quantity is at
         * or below @p epsilon, and with "Could not fetch current price" when no
         * positive price is supplied.
         */
        PositionPerformance position_performance(const ledger::Ledger &ledger,
                                                 const std::string &symbol,
                                                 const std::optional<double> &current_price,
                                                 const Date &as_of,
                                                 double epsilon = ledger::HOLDING_EPSILON);

    } // namespace analytics
} // namespace tracker

#endif // TRACKER_ANALYTICS_POSITION_PERFORMANCE_HPP
