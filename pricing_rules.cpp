#include "pricing_rules.h"

#include <algorithm>
#include <utility>

#include "errors.h"

namespace readyset {

FormulaKind PricingRule::formula() const {
    switch (rule_name) {
        case RuleName::TieredBaseFee:
            return FormulaKind::TierLookup;
        case RuleName::Percentage:
            return FormulaKind::Percentage;
        case RuleName::Tips:
            return FormulaKind::PassThrough;
        case RuleName::BridgeToll:
            return FormulaKind::Flat;
        case RuleName::BaseFee:
        case RuleName::LongDistance:
        case RuleName::Mileage:
        case RuleName::ExtraStops:
            break;
    }

    switch (threshold_type) {
        case ThresholdType::Above:
            return FormulaKind::ThresholdAbove;
        case ThresholdType::Below:
            return FormulaKind::ThresholdBelow;
        case ThresholdType::None:
            break;
    }
    return per_unit_amount_cents != 0 ? FormulaKind::PerUnit : FormulaKind::Flat;
}

RuleSet::RuleSet(std::string name, std::vector<PricingRule> rules)
    : name_(std::move(name)), rules_(std::move(rules)) {
    for (const auto& rule : rules_) {
        if (rule.base_amount_cents < 0 || rule.per_unit_amount_cents < 0) {
            throw ConfigurationError("rule '" + rule.id + "' has a negative amount");
        }
        if (rule.base_amount_cents > kMaxAmountCents || rule.per_unit_amount_cents > kMaxAmountCents) {
            throw ConfigurationError("rule '" + rule.id + "' has an amount above the limit");
        }
        if (rule.threshold_value < 0.0) {
            throw ConfigurationError("rule '" + rule.id + "' has a negative threshold");
        }
        if (rule.percentage_rate < 0.0 || rule.percentage_rate > 1.0) {
            throw ConfigurationError("rule '" + rule.id + "' percentage rate must be within [0, 1]");
        }
    }
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const PricingRule& a, const PricingRule& b) { return a.priority > b.priority; });
}

std::vector<PricingRule> RuleSet::rulesFor(RuleType type) const {
    std::vector<PricingRule> result;
    for (const auto& rule : rules_) {
        if (rule.rule_type == type) {
            result.push_back(rule);
        }
    }
    return result;
}

std::vector<RuleType> RuleSet::ruleTypes() const {
    std::vector<RuleType> types;
    for (const auto& rule : rules_) {
        if (std::find(types.begin(), types.end(), rule.rule_type) == types.end()) {
            types.push_back(rule.rule_type);
        }
    }
    return types;
}

bool RuleSet::hasRule(RuleType type, RuleName name) const {
    for (const auto& rule : rules_) {
        if (rule.rule_type == type && rule.rule_name == name) {
            return true;
        }
    }
    return false;
}

Cents ItemizedLines::get(RuleName name) const {
    auto it = lines.find(name);
    if (it != lines.end()) {
        return it->second;
    }
    return 0;
}

Cents ItemizedLines::total() const {
    Cents sum = 0;
    for (const auto& line : lines) {
        sum += line.second;
    }
    return sum;
}

ItemizedLines RuleEvaluator::evaluate(RuleType type, const RuleSet& rules,
                                      const EvaluationContext& context) {
    ItemizedLines result;
    for (const auto& rule : rules.rules()) {
        if (rule.rule_type != type) {
            continue;
        }
        result.lines[rule.rule_name] += evaluateRule(rule, context);
    }
    return result;
}

double RuleEvaluator::quantityFor(RuleName name, const CalculationInput& input) {
    switch (name) {
        case RuleName::LongDistance:
        case RuleName::Mileage:
            return input.total_mileage;
        case RuleName::ExtraStops:
            return static_cast<double>(input.number_of_stops - 1);
        case RuleName::BaseFee:
            return static_cast<double>(input.headcount);
        case RuleName::TieredBaseFee:
        case RuleName::BridgeToll:
        case RuleName::Tips:
        case RuleName::Percentage:
            return 0.0;
    }
    return 0.0;
}

Cents RuleEvaluator::evaluateRule(const PricingRule& rule, const EvaluationContext& context) {
    const CalculationInput& input = context.input;
    if (rule.rule_name == RuleName::BridgeToll && !input.requires_bridge) {
        return 0;
    }

    const double quantity = quantityFor(rule.rule_name, input);

    switch (rule.formula()) {
        case FormulaKind::Flat:
            if (rule.rule_name == RuleName::BridgeToll && input.has_bridge_toll) {
                return input.bridge_toll_cents;
            }
            return rule.base_amount_cents;

        case FormulaKind::PerUnit:
            return roundToCents(static_cast<double>(rule.per_unit_amount_cents) * quantity);

        case FormulaKind::ThresholdAbove: {
            const double excess = std::max(0.0, quantity - rule.threshold_value);
            return roundToCents(static_cast<double>(rule.per_unit_amount_cents) * excess);
        }

        case FormulaKind::ThresholdBelow:
            return quantity <= rule.threshold_value ? rule.base_amount_cents : 0;

        case FormulaKind::TierLookup:
            if (context.tier == nullptr) {
                return 0;
            }
            if (rule.rule_type == RuleType::DriverPayment) {
                return context.tier->driver_base_pay_cents;
            }
            if (context.percentage_tier) {
                return 0;
            }
            return input.total_mileage <= context.radius_miles
                       ? context.tier->customer_base_fee_within_radius_cents
                       : context.tier->customer_base_fee_cents;

        case FormulaKind::Percentage:
            if (!context.percentage_tier) {
                return 0;
            }
            return roundToCents(rule.percentage_rate * static_cast<double>(input.food_cost_cents));

        case FormulaKind::PassThrough:
            return input.tips_cents;
    }
    return 0;
}

std::string toString(RuleType type) {
    switch (type) {
        case RuleType::CustomerCharge: return "customer_charge";
        case RuleType::DriverPayment: return "driver_payment";
    }
    return "unknown";
}

std::string toString(RuleName name) {
    switch (name) {
        case RuleName::BaseFee: return "base_fee";
        case RuleName::TieredBaseFee: return "tiered_base_fee";
        case RuleName::LongDistance: return "long_distance";
        case RuleName::BridgeToll: return "bridge_toll";
        case RuleName::Mileage: return "mileage";
        case RuleName::ExtraStops: return "extra_stops";
        case RuleName::Tips: return "tips";
        case RuleName::Percentage: return "percentage";
    }
    return "unknown";
}

std::string toString(ThresholdType type) {
    switch (type) {
        case ThresholdType::None: return "none";
        case ThresholdType::Above: return "above";
        case ThresholdType::Below: return "below";
    }
    return "none";
}

RuleType ruleTypeFromString(const std::string& value) {
    if (value == "customer_charge") return RuleType::CustomerCharge;
    if (value == "driver_payment") return RuleType::DriverPayment;
    throw ConfigurationError("unknown rule type '" + value + "'");
}

RuleName ruleNameFromString(const std::string& value) {
    static const std::map<std::string, RuleName> names = {
        {"base_fee", RuleName::BaseFee},
        {"tiered_base_fee", RuleName::TieredBaseFee},
        {"long_distance", RuleName::LongDistance},
        {"bridge_toll", RuleName::BridgeToll},
        {"mileage", RuleName::Mileage},
        {"extra_stops", RuleName::ExtraStops},
        {"tips", RuleName::Tips},
        {"percentage", RuleName::Percentage},
    };
    auto it = names.find(value);
    if (it != names.end()) {
        return it->second;
    }
    throw ConfigurationError("unknown rule name '" + value + "'");
}

ThresholdType thresholdTypeFromString(const std::string& value) {
    if (value.empty() || value == "none") return ThresholdType::None;
    if (value == "above") return ThresholdType::Above;
    if (value == "below") return ThresholdType::Below;
    throw ConfigurationError("unknown threshold type '" + value + "'");
}

} // namespace readyset
