// SPDX-License-Identifier: MIT
/**
 * @file corporate_actions.cpp
 * @brief Implementation of split adjustment and percentage events
 */

#include "corporate/corporate_actions.hpp"
#include "ledger/replay.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tracker
{
    namespace corporate
    {
        // ============================================================================
        // SplitEvent
        // ============================================================================

        nlohmann::json SplitEvent::to_json() const
        {
            return nlohmann::json{{"symbol", symbol}, {"date", date.to_string()}, {"ratio", ratio}};
        }

        SplitEvent SplitEvent::from_json(const nlohmann::json &j)
        {
            SplitEvent event;
            event.symbol = j.at("symbol").get<std::string>();
            event.date = Date::from_string(j.at("date").get<std::string>());
            event.ratio = j.at("ratio").get<double>();
            return event;
        }

        // ============================================================================
        // Split adjustment
        // ============================================================================

        PriceSeries adjust_for_split(const PriceSeries &series,
                                     const std::string &symbol,
                                     const Date &split_date,
                                     double ratio)
        {
            if (!(ratio > 0.0))
            {
                throw std::invalid_argument("Expected positive value for parameter 'ratio', got: " +
                                            std::to_string(ratio));
            }

            PriceSeries adjusted = series;
            if (series.symbol() != symbol)
            {
                return adjusted;
            }

            for (auto &bar : adjusted.bars())
            {
                if (bar.date < split_date)
                {
                    bar.open /= ratio;
                    bar.high /= ratio;
                    bar.low /= ratio;
                    bar.close /= ratio;
                    bar.volume *= ratio;
                }
            }
            return adjusted;
        }

        // ============================================================================
        // SplitRegistry
        // ============================================================================

        SplitRegistry::SplitRegistry(const std::vector<SplitEvent> &events)
        {
            for (const auto &event : events)
            {
                add(event);
            }
        }

        void SplitRegistry::add(const SplitEvent &event)
        {
            if (event.symbol.empty())
            {
                throw std::invalid_argument("Split event requires a symbol");
            }
            if (!(event.ratio > 0.0))
            {
                throw std::invalid_argument("Expected positive value for parameter 'ratio', got: " +
                                            std::to_string(event.ratio));
            }

            auto &list = events_[event.symbol];
            auto pos = std::upper_bound(list.begin(), list.end(), event,
                                        [](const SplitEvent &a, const SplitEvent &b)
                                        { return a.date < b.date; });
            list.insert(pos, event);
        }

        std::vector<SplitEvent> SplitRegistry::for_symbol(const std::string &symbol) const
        {
            auto it = events_.find(symbol);
            if (it == events_.end())
            {
                return {};
            }
            return it->second;
        }

        PriceSeries SplitRegistry::apply(const PriceSeries &series) const
        {
            PriceSeries adjusted = series;
            for (const auto &event : for_symbol(series.symbol()))
            {
                adjusted = adjust_for_split(adjusted, event.symbol, event.date, event.ratio);
            }
            return adjusted;
        }

        size_t SplitRegistry::size() const
        {
            size_t total = 0;
            for (const auto &kv : events_)
            {
                total += kv.second.size();
            }
            return total;
        }

        nlohmann::json SplitRegistry::to_json() const
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &kv : events_)
            {
                for (const auto &event : kv.second)
                {
                    arr.push_back(event.to_json());
                }
            }
            return arr;
        }

        SplitRegistry SplitRegistry::from_json(const nlohmann::json &j)
        {
            if (!j.is_array())
            {
                throw std::invalid_argument("Known splits must be a JSON array");
            }
            SplitRegistry registry;
            for (const auto &item : j)
            {
                registry.add(SplitEvent::from_json(item));
            }
            return registry;
        }

        // ============================================================================
        // Percentage events
        // ============================================================================

        nlohmann::json CorporateActionResult::to_json() const
        {
            nlohmann::json j;
            j["success"] = success;
            j["message"] = message;
            j["shares_held"] = shares_held;
            if (success)
            {
                j["transaction"] = transaction.to_json();
            }
            return j;
        }

        double split_ratio_from_percentage(double percentage)
        {
            return 1.0 + percentage / 100.0;
        }

        namespace
        {
            std::string format_number(double value)
            {
                std::ostringstream os;
                os << std::setprecision(10) << value;
                return os.str();
            }

            CorporateActionResult no_shares(const std::string &symbol, const Date &date)
            {
                CorporateActionResult result;
                result.success = false;
                result.message = "No shares of " + symbol + " held before " + date.to_string();
                return result;
            }
        } // namespace

        CorporateActionResult dividend_from_percentage(const ledger::Ledger &ledger,
                                                       const std::string &symbol,
                                                       const Date &date,
                                                       double percentage)
        {
            const double held = ledger::holdings_before(ledger, symbol, date);
            if (held <= 0.0)
            {
                return no_shares(symbol, date);
            }

            const double total = held * percentage / 100.0;

            CorporateActionResult result;
            result.success = true;
            result.shares_held = held;
            result.message = "Dividend of " + format_number(total) + " for " +
                             format_number(held) + " shares";
            result.transaction.type = ledger::TransactionType::DIVIDEND;
            result.transaction.symbol = symbol;
            result.transaction.quantity = 0.0;
            result.transaction.price = total;
            result.transaction.date = date;
            result.transaction.note = "Dividend (" + format_number(percentage) + "%)";
            return result;
        }

        CorporateActionResult split_from_percentage(const ledger::Ledger &ledger,
                                                    const std::string &symbol,
                                                    const Date &date,
                                                    double percentage)
        {
            const double held = ledger::holdings_before(ledger, symbol, date);
            if (held <= 0.0)
            {
                return no_shares(symbol, date);
            }

            const double ratio = split_ratio_from_percentage(percentage);
            const double new_shares = held * (ratio - 1.0);

            CorporateActionResult result;
            result.success = true;
            result.shares_held = held;
            result.message = "Split adds " + format_number(new_shares) + " shares to " +
                             format_number(held);
            result.transaction.type = ledger::TransactionType::SPLIT;
            result.transaction.symbol = symbol;
            result.transaction.quantity = new_shares;
            result.transaction.price = 0.0;
            result.transaction.date = date;
            result.transaction.note = "Stock Split (" + format_number(ratio) + "-for-1)";
            return result;
        }

        nlohmann::json PercentageEvent::to_json() const
        {
            return nlohmann::json{{"symbol", symbol},
                                  {"date", date.to_string()},
                                  {"type", kind == Kind::SPLIT ? "split" : "dividend"},
                                  {"percentage", percentage}};
        }

        PercentageEvent PercentageEvent::from_json(const nlohmann::json &j)
        {
            PercentageEvent event;
            event.symbol = j.at("symbol").get<std::string>();
            event.date = Date::from_string(j.at("date").get<std::string>());
            event.percentage = j.at("percentage").get<double>();

            const std::string type = j.value("type", std::string("dividend"));
            if (type == "dividend")
            {
                event.kind = Kind::DIVIDEND;
            }
            else if (type == "split")
            {
                event.kind = Kind::SPLIT;
            }
            else
            {
                throw std::invalid_argument("Unknown corporate event type: " + type);
            }

            if (event.symbol.empty())
            {
                throw std::invalid_argument("Corporate event requires a symbol");
            }
            if (event.percentage < 0.0)
            {
                throw std::invalid_argument("Expected non-negative value for parameter 'percentage', got: " +
                                            std::to_string(event.percentage));
            }
            return event;
        }

        std::vector<CorporateActionResult> apply_percentage_events(ledger::Ledger &ledger,
                                                                   std::vector<PercentageEvent> events)
        {
            std::stable_sort(events.begin(), events.end(),
                             [](const PercentageEvent &a, const PercentageEvent &b)
                             { return a.date < b.date; });

            std::vector<CorporateActionResult> results;
            results.reserve(events.size());
            for (const auto &event : events)
            {
                CorporateActionResult result =
                    event.kind == PercentageEvent::Kind::SPLIT
                        ? split_from_percentage(ledger, event.symbol, event.date, event.percentage)
                        : dividend_from_percentage(ledger, event.symbol, event.date, event.percentage);
                if (result.success)
                {
                    result.transaction = ledger.append(result.transaction);
                }
                results.push_back(std::move(result));
            }
            return results;
        }

    } // namespace corporate
} // namespace tracker
