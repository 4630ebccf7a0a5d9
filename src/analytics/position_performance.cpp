// SPDX-License-Identifier: MIT
/**
 * @file position_performance.cpp
 * @brief Implementation of position_performance()
 */

#include "analytics/position_performance.hpp"
#include "analytics/risk_metrics.hpp"
#include "ledger/cost_basis.hpp"

namespace tracker
{
    namespace analytics
    {
        nlohmann::json PositionPerformance::to_json() const
        {
            nlohmann::json j;
            j["success"] = success;
            j["symbol"] = symbol;
            if (!success)
            {
                j["message"] = message;
                return j;
            }
            j["quantity"] = quantity;
            j["cost_basis"] = cost_basis;
            j["average_purchase_price"] = average_purchase_price;
            j["current_price"] = current_price;
            j["current_value"] = current_value;
            j["return_amount"] = return_amount;
            j["return_percentage"] = return_percentage;
            j["first_purchase_date"] = first_purchase_date ? nlohmann::json(first_purchase_date->to_string())
                                                           : nlohmann::json(nullptr);
            j["days_held"] = days_held;
            j["annualized_return"] = annualized_return;
            return j;
        }

        PositionPerformance position_performance(const ledger::Ledger &ledger,
                                                 const std::string &symbol,
                                                 const std::optional<double> &current_price,
                                                 const Date &as_of,
                                                 double epsilon)
        {
            PositionPerformance perf;
            perf.symbol = symbol;

            ledger::HoldingsBook book;
            book.apply_all(ledger.up_to(as_of));
            const double quantity = book.quantity(symbol);
            if (quantity <= epsilon)
            {
                perf.message = "Stock not currently held";
                return perf;
            }

            if (!current_price || *current_price <= 0.0)
            {
                perf.message = "Could not fetch current price";
                return perf;
            }

            const ledger::CostBasis basis = ledger::cost_basis_fifo(ledger, symbol, quantity, as_of);

            perf.quantity = quantity;
            perf.cost_basis = basis.total_cost;
            perf.average_purchase_price = basis.average_unit_cost;
            perf.current_price = *current_price;
            perf.current_value = quantity * *current_price;
            perf.return_amount = perf.current_value - perf.cost_basis;
            perf.return_percentage = perf.cost_basis > 0.0 ? perf.return_amount / perf.cost_basis * 100.0 : 0.0;

            auto first_buy = ledger.first_buy(symbol);
            if (first_buy && first_buy->date <= as_of)
            {
                perf.first_purchase_date = first_buy->date;
                perf.days_held = static_cast<int>(first_buy->date.days_until(as_of));
            }
            perf.annualized_return = compound_annual_growth(perf.current_value, perf.cost_basis, perf.days_held);

            perf.success = true;
            perf.message = "OK";
            return perf;
        }

    } // namespace analytics
} // namespace tracker
