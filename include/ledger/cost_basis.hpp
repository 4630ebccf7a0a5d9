// SPDX-License-Identifier: MIT
#ifndef TRACKER_LEDGER_COST_BASIS_HPP
#define TRACKER_LEDGER_COST_BASIS_HPP

#include <deque>
#include <optional>
#include <string>

#include "ledger/ledger.hpp"

namespace tracker {
namespace ledger {

/**
 * @struct Lot
 * @brief Shares acquired together at one unit cost
 */
struct Lot {
    std::string symbol;
    double quantity = 0.0;
    double unit_cost = 0.0;  ///< 0 for split and bonus shares
    Date acquisition_date;

    double cost() const { return quantity * unit_cost; }
};

/**
 * @struct LotQueue
 * @brief Surviving FIFO lots of one symbol plus what sells consumed
 */
struct LotQueue {
    std::string symbol;
    std::deque<Lot> lots;                 ///< oldest first
    double realized_cost = 0.0;           ///< cost of shares taken by sells
    double realized_proceeds = 0.0;       ///< sell quantity * sell price
    double unmatched_sell_quantity = 0.0; ///< sold with no lot left to consume

    double total_quantity() const;
    double total_cost() const;
    double realized_pnl() const { return realized_proceeds - realized_cost; }
};

/**
 * @struct CostBasis
 * @brief Cost attributed to a holding of a given size
 */
struct CostBasis {
    double total_cost = 0.0;
    double average_unit_cost = 0.0;  ///< total_cost / requested quantity
    double priced_quantity = 0.0;    ///< quantity actually covered by lots
};

/**
 * @brief Replay one symbol's transactions into a FIFO lot queue
 *
 * Buys append a lot at their price, splits and capital increases append a
 * zero-cost lot for the new shares, rights issues append a lot at the
 * subscription price. Sells consume from the oldest lot.
 *
 * @param as_of Only transactions on or before this date are replayed (all if empty)
 */
LotQueue build_lots(const Ledger& ledger, const std::string& symbol,
                    const std::optional<Date>& as_of = std::nullopt);

/// Price @p quantity shares against the surviving lots, oldest first.
CostBasis price_from_lots(const LotQueue& queue, double quantity);

/// build_lots followed by price_from_lots.
CostBasis cost_basis_fifo(const Ledger& ledger, const std::string& symbol,
                          double quantity_to_price,
                          const std::optional<Date>& as_of = std::nullopt);

} // namespace ledger
} // namespace tracker

#endif // TRACKER_LEDGER_COST_BASIS_HPP
