// SPDX-License-Identifier: MIT
/**
 * @file investment_signal.hpp
 * @brief Rule-based buy/hold/sell signal with an audit trail.
 *
 * A base action comes from the position's performance against its cost. An
 * ordered list of rules then adjusts confidence and, for some rules, the
 * action. Within a rule the first matching branch fires.
 */

#ifndef TRACKER_SCORING_INVESTMENT_SIGNAL_HPP
#define TRACKER_SCORING_INVESTMENT_SIGNAL_HPP

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tracker
{
    namespace scoring
    {
        enum class SignalAction
        {
            STRONG_BUY,
            BUY_MORE,
            BUY_SMALL,
            HOLD,
            MONITOR, ///< Reported as MONITOR_CLOSELY
            REDUCE_POSITION,
            CONSIDER_SELL
        };

        std::string to_string(SignalAction action);

        /**
         * @struct SignalInputs
         * @brief Figures the rules look at (percent where applicable).
         */
        struct SignalInputs
        {
            double performance = 0.0;   ///< Return against cost basis
            double volatility = 0.0;
            double sharpe_ratio = 0.0;
            double max_drawdown = 0.0;
            double annual_return = 0.0;
            int days_held = 0;
            int risk_score = 50;
            double grade_points = 0.0;
            double momentum_6m = 0.0;
        };

        /**
         * @struct SignalBranch
         * @brief One outcome of a rule.
         */
        struct SignalBranch
        {
            std::function<bool(const SignalInputs &)> when;
            int confidence_delta = 0;
            std::vector<std::string> reasons;
            /// Action after the branch fires; null keeps the action.
            std::function<SignalAction(SignalAction, const SignalInputs &)> adjust;
        };

        /**
         * @struct SignalRule
         * @brief Named group of mutually exclusive branches.
         */
        struct SignalRule
        {
            std::string name;
            std::vector<SignalBranch> branches;
        };

        /**
         * @struct RuleFiring
         * @brief Audit entry of a rule that matched.
         */
        struct RuleFiring
        {
            std::string rule;
            std::vector<std::string> reasons;
            int confidence_delta = 0;
            SignalAction action_before = SignalAction::HOLD;
            SignalAction action_after = SignalAction::HOLD;

            nlohmann::json to_json() const;
        };

        /**
         * @struct InvestmentSignal
         * @brief Final action with its confidence and explanation.
         */
        struct InvestmentSignal
        {
            SignalAction base_action = SignalAction::HOLD;
            SignalAction action = SignalAction::HOLD;
            int confidence_score = 0;
            std::string confidence; ///< VERY_HIGH, HIGH, MEDIUM, LOW or VERY_LOW
            std::string strength;   ///< STRONG_POSITIVE, POSITIVE, NEUTRAL or NEGATIVE
            std::vector<std::string> reasoning;
            std::vector<RuleFiring> audit_trail;

            /// Reasons joined with "; ".
            std::string reasoning_text() const;
            nlohmann::json to_json() const;
        };

        /// Base action, confidence and reason from raw performance.
        RuleFiring classify_performance(double performance);

        /// Sharpe, volatility, drawdown, holding period, risk score, grade, momentum.
        const std::vector<SignalRule> &default_signal_rules();

        InvestmentSignal investment_signal(const SignalInputs &inputs,
                                           const std::vector<SignalRule> &rules = default_signal_rules());

        /**
         * @struct PositionRecommendation
         * @brief Suggested allocation bucket of a symbol.
         */
        struct PositionRecommendation
        {
            std::string size;                    ///< LARGE .. MINIMAL
            std::string percentage_of_portfolio; ///< e.g. "5-10%"
            std::string rationale;

            nlohmann::json to_json() const;
        };

        PositionRecommendation recommend_position_size(int risk_score, double performance);

    } // namespace scoring
} // namespace tracker

#endif // TRACKER_SCORING_INVESTMENT_SIGNAL_HPP
