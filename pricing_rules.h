#pragma once

#include <map>
#include <string>
#include <vector>

#include "pricing_types.h"

namespace readyset {

enum class RuleType {
    CustomerCharge,
    DriverPayment
};

enum class RuleName {
    BaseFee,
    TieredBaseFee,
    LongDistance,
    BridgeToll,
    Mileage,
    ExtraStops,
    Tips,
    Percentage
};

enum class ThresholdType {
    None,
    Above,
    Below
};

enum class FormulaKind {
    Flat,            // base amount
    PerUnit,         // per unit x quantity
    ThresholdAbove,  // per unit x max(0, quantity - threshold)
    ThresholdBelow,  // base amount while quantity <= threshold
    TierLookup,      // resolved tier's fee or base pay
    Percentage,      // rate x food cost, percentage tier only
    PassThrough      // input amount as-is (tips)
};

struct PricingRule {
    std::string id;
    RuleType rule_type = RuleType::CustomerCharge;
    RuleName rule_name = RuleName::BaseFee;
    Cents base_amount_cents = 0;
    Cents per_unit_amount_cents = 0;
    double threshold_value = 0.0;
    ThresholdType threshold_type = ThresholdType::None;
    double percentage_rate = 0.0;
    int priority = 0;

    FormulaKind formula() const;
};

// Rules of one template, highest priority first. Immutable once built.
class RuleSet {
public:
    RuleSet() = default;
    RuleSet(std::string name, std::vector<PricingRule> rules);

    const std::string& name() const { return name_; }
    const std::vector<PricingRule>& rules() const { return rules_; }
    bool empty() const { return rules_.empty(); }

    std::vector<PricingRule> rulesFor(RuleType type) const;
    std::vector<RuleType> ruleTypes() const;
    bool hasRule(RuleType type, RuleName name) const;

private:
    std::string name_;
    std::vector<PricingRule> rules_;
};

struct EvaluationContext {
    CalculationInput input;           // already sanitized
    const Tier* tier = nullptr;
    bool percentage_tier = false;
    double radius_miles = 10.0;       // within-radius fee boundary (inclusive)
};

struct ItemizedLines {
    std::map<RuleName, Cents> lines;

    Cents get(RuleName name) const;
    Cents total() const;
};

class RuleEvaluator {
public:
    // Sums every rule of the given type, per named line.
    static ItemizedLines evaluate(RuleType type, const RuleSet& rules,
                                  const EvaluationContext& context);

    static Cents evaluateRule(const PricingRule& rule, const EvaluationContext& context);

private:
    static double quantityFor(RuleName name, const CalculationInput& input);
};

std::string toString(RuleType type);
std::string toString(RuleName name);
std::string toString(ThresholdType type);
RuleType ruleTypeFromString(const std::string& value);
RuleName ruleNameFromString(const std::string& value);
ThresholdType thresholdTypeFromString(const std::string& value);

} // namespace readyset
