// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of FIFO cost basis
// ============================================================================

#include "ledger/cost_basis.hpp"

#include <algorithm>

namespace tracker {
namespace ledger {

double LotQueue::total_quantity() const {
    double total = 0.0;
    for (const auto& lot : lots) total += lot.quantity;
    return total;
}

double LotQueue::total_cost() const {
    double total = 0.0;
    for (const auto& lot : lots) total += lot.cost();
    return total;
}

namespace {

void consume(LotQueue& queue, double sell_quantity) {
    double remaining = sell_quantity;
    while (remaining > 0.0 && !queue.lots.empty()) {
        Lot& head = queue.lots.front();
        if (head.quantity <= remaining) {
            remaining -= head.quantity;
            queue.realized_cost += head.cost();
            queue.lots.pop_front();
        } else {
            head.quantity -= remaining;
            queue.realized_cost += remaining * head.unit_cost;
            remaining = 0.0;
        }
    }
    queue.unmatched_sell_quantity += remaining;
}

} // namespace

LotQueue build_lots(const Ledger& ledger, const std::string& symbol,
                    const std::optional<Date>& as_of) {
    LotQueue queue;
    queue.symbol = symbol;

    for (const auto& tx : ledger.for_symbol(symbol)) {
        if (as_of && tx.date > *as_of) break;

        switch (tx.type) {
        case TransactionType::BUY:
        case TransactionType::RIGHTS_ISSUE:
            queue.lots.push_back(Lot{symbol, tx.quantity, tx.price.value_or(0.0), tx.date});
            break;
        case TransactionType::SPLIT:
        case TransactionType::CAPITAL_INCREASE:
            if (tx.quantity > 0.0) {
                queue.lots.push_back(Lot{symbol, tx.quantity, 0.0, tx.date});
            }
            break;
        case TransactionType::SELL:
            queue.realized_proceeds += tx.quantity * tx.price.value_or(0.0);
            consume(queue, tx.quantity);
            break;
        default:
            break;
        }
    }
    return queue;
}

CostBasis price_from_lots(const LotQueue& queue, double quantity) {
    CostBasis basis;
    if (quantity <= 0.0) return basis;

    double remaining = quantity;
    for (const auto& lot : queue.lots) {
        if (remaining <= 0.0) break;
        const double take = std::min(lot.quantity, remaining);
        basis.total_cost += take * lot.unit_cost;
        basis.priced_quantity += take;
        remaining -= take;
    }
    basis.average_unit_cost = basis.total_cost / quantity;
    return basis;
}

CostBasis cost_basis_fifo(const Ledger& ledger, const std::string& symbol,
                          double quantity_to_price, const std::optional<Date>& as_of) {
    return price_from_lots(build_lots(ledger, symbol, as_of), quantity_to_price);
}

} // namespace ledger
} // namespace tracker
