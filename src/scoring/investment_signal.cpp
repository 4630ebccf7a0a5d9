// SPDX-License-Identifier: MIT
/**
 * @file investment_signal.cpp
 * @brief Default signal rules and their evaluation
 */

#include "scoring/investment_signal.hpp"

namespace tracker
{
    namespace scoring
    {
        std::string to_string(SignalAction action)
        {
            switch (action)
            {
            case SignalAction::STRONG_BUY:
                return "STRONG_BUY";
            case SignalAction::BUY_MORE:
                return "BUY_MORE";
            case SignalAction::BUY_SMALL:
                return "BUY_SMALL";
            case SignalAction::HOLD:
                return "HOLD";
            case SignalAction::MONITOR:
                return "MONITOR_CLOSELY";
            case SignalAction::REDUCE_POSITION:
                return "REDUCE_POSITION";
            case SignalAction::CONSIDER_SELL:
                return "CONSIDER_SELL";
            }
            return "HOLD";
        }

        nlohmann::json RuleFiring::to_json() const
        {
            nlohmann::json j;
            j["rule"] = rule;
            j["reasons"] = reasons;
            j["confidence_delta"] = confidence_delta;
            j["action_before"] = to_string(action_before);
            j["action_after"] = to_string(action_after);
            return j;
        }

        std::string InvestmentSignal::reasoning_text() const
        {
            std::string text;
            for (size_t i = 0; i < reasoning.size(); ++i)
            {
                if (i > 0)
                {
                    text += "; ";
                }
                text += reasoning[i];
            }
            return text;
        }

        nlohmann::json InvestmentSignal::to_json() const
        {
            nlohmann::json j;
            j["action"] = to_string(action);
            j["base_action"] = to_string(base_action);
            j["strength"] = strength;
            j["confidence"] = confidence;
            j["confidence_score"] = confidence_score;
            j["reasoning"] = reasoning_text();

            nlohmann::json trail = nlohmann::json::array();
            for (const auto &firing : audit_trail)
            {
                trail.push_back(firing.to_json());
            }
            j["audit_trail"] = trail;
            return j;
        }

        // ============================================================================
        // Base classification
        // ============================================================================

        RuleFiring classify_performance(double performance)
        {
            RuleFiring firing;
            firing.rule = "performance";
            if (performance > 30)
            {
                firing.reasons = {"Exceptional performance (+30%)"};
                firing.confidence_delta = 25;
                firing.action_after = SignalAction::STRONG_BUY;
            }
            else if (performance > 15)
            {
                firing.reasons = {"Strong performance (+15%)"};
                firing.confidence_delta = 20;
                firing.action_after = SignalAction::BUY_MORE;
            }
            else if (performance > 5)
            {
                firing.reasons = {"Positive performance (+5%)"};
                firing.confidence_delta = 10;
                firing.action_after = SignalAction::HOLD;
            }
            else if (performance > -10)
            {
                firing.reasons = {"Minor losses (-10%)"};
                firing.confidence_delta = 5;
                firing.action_after = SignalAction::MONITOR;
            }
            else if (performance > -25)
            {
                firing.reasons = {"Significant losses (-25%)"};
                firing.confidence_delta = -10;
                firing.action_after = SignalAction::REDUCE_POSITION;
            }
            else
            {
                firing.reasons = {"Major losses (-25%+)"};
                firing.confidence_delta = -20;
                firing.action_after = SignalAction::CONSIDER_SELL;
            }
            firing.action_before = firing.action_after;
            return firing;
        }

        // ============================================================================
        // Default rules
        // ============================================================================

        namespace
        {
            using Action = SignalAction;

            bool is_buy(Action a)
            {
                return a == Action::STRONG_BUY || a == Action::BUY_MORE;
            }

            std::vector<SignalRule> build_default_rules()
            {
                std::vector<SignalRule> rules;

                rules.push_back({"sharpe_ratio", {
                    {[](const SignalInputs &in) { return in.sharpe_ratio > 1.5; }, 20,
                     {"Excellent risk-adjusted returns (Sharpe > 1.5)"},
                     [](Action a, const SignalInputs &) {
                         return (a == Action::HOLD || a == Action::MONITOR) ? Action::BUY_MORE : a;
                     }},
                    {[](const SignalInputs &in) { return in.sharpe_ratio > 1.0; }, 15,
                     {"Good risk-adjusted returns (Sharpe > 1.0)"}, nullptr},
                    {[](const SignalInputs &in) { return in.sharpe_ratio > 0.5; }, 5,
                     {"Fair risk-adjusted returns"}, nullptr},
                    {[](const SignalInputs &in) { return in.sharpe_ratio < 0.0; }, -15,
                     {"Poor risk-adjusted returns"},
                     [](Action a, const SignalInputs &) {
                         if (a == Action::BUY_MORE)
                             return Action::HOLD;
                         if (a == Action::HOLD)
                             return Action::MONITOR;
                         return a;
                     }},
                }});

                rules.push_back({"volatility", {
                    {[](const SignalInputs &in) { return in.volatility > 60; }, -15,
                     {"Very high volatility (>60%)"},
                     [](Action a, const SignalInputs &) { return is_buy(a) ? Action::BUY_SMALL : a; }},
                    {[](const SignalInputs &in) { return in.volatility > 40; }, -10,
                     {"High volatility (>40%)"},
                     [](Action a, const SignalInputs &) { return a == Action::STRONG_BUY ? Action::BUY_MORE : a; }},
                    {[](const SignalInputs &in) { return in.volatility < 25; }, 10,
                     {"Low volatility (<25%)"},
                     [](Action a, const SignalInputs &in) {
                         return (a == Action::HOLD && in.performance > 0) ? Action::BUY_MORE : a;
                     }},
                }});

                rules.push_back({"max_drawdown", {
                    {[](const SignalInputs &in) { return in.max_drawdown < -40; }, -20,
                     {"Severe historical drawdowns (-40%+)"},
                     [](Action a, const SignalInputs &) { return is_buy(a) ? Action::BUY_SMALL : a; }},
                    {[](const SignalInputs &in) { return in.max_drawdown < -25; }, -10,
                     {"Large historical drawdowns (-25%)"}, nullptr},
                    {[](const SignalInputs &in) { return in.max_drawdown > -10; }, 15,
                     {"Minimal historical drawdowns"}, nullptr},
                }});

                rules.push_back({"holding_period", {
                    {[](const SignalInputs &in) { return in.days_held < 90; }, 5,
                     {"Recently acquired (< 3 months)"}, nullptr},
                    {[](const SignalInputs &in) { return in.days_held > 730 && in.performance < -15; }, -10,
                     {"Long-term holding (2+ years)", "Long-term underperformance suggests reconsideration"}, nullptr},
                    {[](const SignalInputs &in) { return in.days_held > 730; }, 5,
                     {"Long-term holding (2+ years)"}, nullptr},
                }});

                rules.push_back({"risk_score", {
                    {[](const SignalInputs &in) { return in.risk_score >= 80; }, 15,
                     {"Very low risk profile"},
                     [](Action a, const SignalInputs &) { return a == Action::MONITOR ? Action::HOLD : a; }},
                    {[](const SignalInputs &in) { return in.risk_score >= 65; }, 10,
                     {"Low risk profile"}, nullptr},
                    {[](const SignalInputs &in) { return in.risk_score < 40; }, -15,
                     {"High risk profile"},
                     [](Action a, const SignalInputs &) { return is_buy(a) ? Action::BUY_SMALL : a; }},
                }});

                rules.push_back({"grade", {
                    {[](const SignalInputs &in) { return in.grade_points >= 4.0; }, 20,
                     {"A-grade investment quality"},
                     [](Action a, const SignalInputs &) { return a == Action::HOLD ? Action::BUY_MORE : a; }},
                    {[](const SignalInputs &in) { return in.grade_points >= 3.0; }, 10,
                     {"B-grade investment quality"}, nullptr},
                    {[](const SignalInputs &in) { return in.grade_points < 2.0; }, -20,
                     {"Poor investment grade (C- or below)"},
                     [](Action a, const SignalInputs &) {
                         return (a == Action::REDUCE_POSITION || a == Action::CONSIDER_SELL) ? a : Action::REDUCE_POSITION;
                     }},
                }});

                rules.push_back({"momentum", {
                    {[](const SignalInputs &in) { return in.momentum_6m > 15; }, 10,
                     {"Strong positive momentum"}, nullptr},
                    {[](const SignalInputs &in) { return in.momentum_6m < -15; }, -10,
                     {"Negative momentum trend"}, nullptr},
                }});

                return rules;
            }

            std::string confidence_label(int score)
            {
                if (score >= 60)
                    return "VERY_HIGH";
                if (score >= 40)
                    return "HIGH";
                if (score >= 20)
                    return "MEDIUM";
                if (score >= 0)
                    return "LOW";
                return "VERY_LOW";
            }

            std::string strength_label(int score, Action action)
            {
                if (score >= 50 && is_buy(action))
                    return "STRONG_POSITIVE";
                if (score >= 30 && (action == Action::BUY_MORE || action == Action::BUY_SMALL))
                    return "POSITIVE";
                if (action == Action::HOLD)
                    return "NEUTRAL";
                if (action == Action::REDUCE_POSITION || action == Action::CONSIDER_SELL)
                    return "NEGATIVE";
                return "NEUTRAL";
            }
        } // namespace

        const std::vector<SignalRule> &default_signal_rules()
        {
            static const std::vector<SignalRule> rules = build_default_rules();
            return rules;
        }

        // ============================================================================
        // Evaluation
        // ============================================================================

        InvestmentSignal investment_signal(const SignalInputs &inputs, const std::vector<SignalRule> &rules)
        {
            InvestmentSignal signal;

            RuleFiring base = classify_performance(inputs.performance);
            signal.base_action = base.action_after;
            signal.confidence_score = base.confidence_delta;
            signal.reasoning = base.reasons;
            signal.audit_trail.push_back(base);

            SignalAction action = base.action_after;
            for (const auto &rule : rules)
            {
                for (const auto &branch : rule.branches)
                {
                    if (!branch.when(inputs))
                    {
                        continue;
                    }

                    RuleFiring firing;
                    firing.rule = rule.name;
                    firing.reasons = branch.reasons;
                    firing.confidence_delta = branch.confidence_delta;
                    firing.action_before = action;
                    if (branch.adjust)
                    {
                        action = branch.adjust(action, inputs);
                    }
                    firing.action_after = action;

                    signal.confidence_score += branch.confidence_delta;
                    signal.reasoning.insert(signal.reasoning.end(), branch.reasons.begin(), branch.reasons.end());
                    signal.audit_trail.push_back(firing);
                    break;
                }
            }

            signal.action = action;
            signal.confidence = confidence_label(signal.confidence_score);
            signal.strength = strength_label(signal.confidence_score, action);
            return signal;
        }

        // ============================================================================
        // Position sizing
        // ============================================================================

        nlohmann::json PositionRecommendation::to_json() const
        {
            return nlohmann::json{{"size", size},
                                  {"percentage_of_portfolio", percentage_of_portfolio},
                                  {"rationale", rationale}};
        }

        PositionRecommendation recommend_position_size(int risk_score, double performance)
        {
            if (risk_score >= 70 && performance > 15)
                return {"LARGE", "15-20%", "High-quality stock with strong performance"};
            if (risk_score >= 60 && performance > 10)
                return {"MEDIUM_LARGE", "10-15%", "Good stock with solid performance"};
            if (risk_score >= 50 && performance > 0)
                return {"MEDIUM", "5-10%", "Average stock, moderate allocation"};
            if (risk_score >= 40)
                return {"SMALL", "2-5%", "Higher risk, smaller position"};
            return {"MINIMAL", "1-3%", "High risk, very small position or consider selling"};
        }

    } // namespace scoring
} // namespace tracker
