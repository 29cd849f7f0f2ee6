#include "pricing_engine.h"

#include <algorithm>
#include <cmath>

namespace readyset {

CalculationEngine::Resolved CalculationEngine::resolve(const CalculationInput& input,
                                                       const ClientConfiguration& config) const {
    Resolved resolved;
    resolved.context.input = sanitizeInput(input);
    resolved.selection = TierClassifier::classify(resolved.context.input, config.tiers());
    resolved.context.tier = resolved.selection.tier;
    resolved.context.percentage_tier = config.policy().isPercentageTier(*resolved.selection.tier);
    resolved.context.radius_miles = config.policy().mileage_threshold_miles;
    return resolved;
}

Cents CalculationEngine::effectiveBridgeToll(const CalculationInput& input,
                                             const ClientPricingPolicy& policy) {
    return input.has_bridge_toll ? input.bridge_toll_cents : policy.default_bridge_toll_cents;
}

bool CalculationEngine::tipReplacesBasePay(const CalculationInput& input,
                                           const ClientPricingPolicy& policy) {
    return input.tips_cents > 0 && policy.bonus_suppressed_by_direct_tip;
}

CustomerCharges CalculationEngine::customerCharges(const Resolved& resolved,
                                                   const ClientConfiguration& config,
                                                   const RuleSet& rules) const {
    const ClientPricingPolicy& policy = config.policy();
    const CalculationInput& input = resolved.context.input;
    const ItemizedLines lines = RuleEvaluator::evaluate(RuleType::CustomerCharge, rules, resolved.context);

    CustomerCharges charges;
    charges.base_fee = lines.get(RuleName::TieredBaseFee) + lines.get(RuleName::BaseFee) +
                       lines.get(RuleName::Percentage);
    charges.long_distance_charge = lines.get(RuleName::LongDistance) + lines.get(RuleName::Mileage);
    charges.extra_stops_charge = lines.get(RuleName::ExtraStops);

    // The toll line is billed (or not) by the policy below.
    const Cents toll_line = lines.get(RuleName::BridgeToll);
    charges.subtotal = lines.total() - toll_line;

    // 1. Minimum fee floor
    Cents total = std::max(charges.subtotal, policy.minimum_customer_fee_cents);

    // 2. Bridge toll, billed only when the client passes it on
    if (input.requires_bridge && policy.include_bridge_toll_in_customer_fee) {
        charges.bridge_toll = rules.hasRule(RuleType::CustomerCharge, RuleName::BridgeToll)
                                  ? toll_line
                                  : effectiveBridgeToll(input, policy);
        total += charges.bridge_toll;
    }

    // 5. Multi-drive discount (3 and 4 only touch the driver side)
    charges.daily_drive_discount =
        roundToCents(static_cast<double>(policy.daily_drive_discount_cents_per_extra_drive) *
                     static_cast<double>(input.number_of_drives - 1));
    total = std::max<Cents>(0, total - charges.daily_drive_discount);

    charges.total = total;
    return charges;
}

DriverPayments CalculationEngine::driverPayments(const Resolved& resolved,
                                                 const ClientConfiguration& config,
                                                 const RuleSet& rules) const {
    const ClientPricingPolicy& policy = config.policy();
    const CalculationInput& input = resolved.context.input;
    const ItemizedLines lines = RuleEvaluator::evaluate(RuleType::DriverPayment, rules, resolved.context);

    DriverPayments payments;
    payments.base_pay = lines.get(RuleName::TieredBaseFee) + lines.get(RuleName::BaseFee) +
                        lines.get(RuleName::Percentage);
    payments.mileage_pay = lines.get(RuleName::Mileage) + lines.get(RuleName::LongDistance);
    payments.extra_stops_bonus = lines.get(RuleName::ExtraStops);
    payments.tips = lines.get(RuleName::Tips);
    payments.subtotal = lines.total();

    // 2. Bridge toll is always reimbursed to the driver
    if (input.requires_bridge) {
        payments.bridge_toll = rules.hasRule(RuleType::DriverPayment, RuleName::BridgeToll)
                                   ? lines.get(RuleName::BridgeToll)
                                   : effectiveBridgeToll(input, policy);
    }

    // 3. Tip/bonus exclusivity
    if (tipReplacesBasePay(input, policy)) {
        payments.base_pay = 0;
        payments.bonus = 0;
        payments.tips = input.tips_cents;
    } else if (input.bonus_qualified) {
        payments.bonus = policy.bonus_flat_cents;
    }

    // 4. Driver mileage minimum
    if (policy.driver_minimum_mileage_pay_cents > 0 &&
        rules.hasRule(RuleType::DriverPayment, RuleName::Mileage)) {
        payments.mileage_pay = std::max(payments.mileage_pay, policy.driver_minimum_mileage_pay_cents);
    }

    // bonus is reported on its own line and never paid through the total
    payments.total = payments.base_pay + payments.mileage_pay + payments.bridge_toll +
                     payments.extra_stops_bonus + payments.tips;
    return payments;
}

CustomerCharges CalculationEngine::calculateCustomerCharge(const CalculationInput& input,
                                                           const ClientConfiguration& config) const {
    return customerCharges(resolve(input, config), config, config.rules());
}

DriverPayments CalculationEngine::calculateDriverPayment(const CalculationInput& input,
                                                         const ClientConfiguration& config) const {
    return driverPayments(resolve(input, config), config, config.rules());
}

CalculationResult CalculationEngine::calculate(const CalculationInput& input,
                                               const ClientConfiguration& config) const {
    const Resolved resolved = resolve(input, config);

    CalculationResult result;
    result.customer_charges = customerCharges(resolved, config, config.rules());
    result.driver_payments = driverPayments(resolved, config, config.rules());
    result.profit = result.customer_charges.total - result.driver_payments.total;
    if (result.customer_charges.total > 0) {
        result.profit_margin_percent = static_cast<double>(result.profit) /
                                       static_cast<double>(result.customer_charges.total) * 100.0;
    }
    result.tier_index = resolved.selection.index;
    result.percentage_tier = resolved.context.percentage_tier;
    result.template_used = config.rules().name();
    return result;
}

DeliveryCostBreakdown CalculationEngine::calculateDeliveryCost(const CalculationInput& input,
                                                               const ClientConfiguration& config) const {
    const CustomerCharges charges = customerCharges(resolve(input, config), config, config.policyRules());

    DeliveryCostBreakdown breakdown;
    breakdown.delivery_cost = charges.base_fee;
    breakdown.total_mileage_pay = charges.long_distance_charge;
    breakdown.daily_drive_discount = charges.daily_drive_discount;
    breakdown.bridge_toll = charges.bridge_toll;
    breakdown.extra_stops_charge = charges.extra_stops_charge;
    breakdown.delivery_fee = charges.total;
    return breakdown;
}

DriverPayBreakdown CalculationEngine::calculateDriverPay(const CalculationInput& input,
                                                         const ClientConfiguration& config) const {
    const ClientPricingPolicy& policy = config.policy();
    const Resolved resolved = resolve(input, config);
    const CalculationInput& clean = resolved.context.input;
    const Tier& tier = *resolved.selection.tier;
    const DriverPayments payments = driverPayments(resolved, config, config.policyRules());

    DriverPayBreakdown pay;
    pay.driver_max_pay_per_drop = policy.driver_max_pay_per_drop_cents;
    pay.driver_base_pay_per_drop = tier.driver_base_pay_cents;
    pay.driver_total_base_pay = payments.base_pay + payments.mileage_pay;
    pay.total_mileage = clean.total_mileage;
    pay.mileage_rate_cents = policy.driver_mileage_rate_cents_per_mile;
    pay.total_mileage_pay = payments.mileage_pay;
    pay.bridge_toll = payments.bridge_toll;
    pay.extra_stops_bonus = payments.extra_stops_bonus;
    pay.direct_tip = payments.tips;

    pay.ready_set_fee = tier.ready_set_fee_cents >= 0 ? tier.ready_set_fee_cents : policy.ready_set_fee_cents;
    pay.ready_set_addon_fee = clean.ready_set_addon_fee_cents;
    pay.ready_set_total_fee = pay.ready_set_fee + pay.ready_set_addon_fee + pay.bridge_toll;

    pay.bonus_qualified = clean.bonus_qualified && !tipReplacesBasePay(clean, policy);
    pay.bonus_qualified_percent = pay.bonus_qualified ? 100 : 0;
    pay.driver_bonus_pay = payments.bonus;
    pay.total_driver_pay = payments.total;
    return pay;
}

Cents CalculationEngine::calculateMileagePay(double total_mileage, const ClientConfiguration& config) const {
    const ClientPricingPolicy& policy = config.policy();
    if (!(total_mileage > policy.mileage_threshold_miles)) {
        return 0;
    }
    const double excess = total_mileage - policy.mileage_threshold_miles;
    return roundToCents(static_cast<double>(policy.customer_mileage_rate_cents_per_mile) * excess);
}

Cents CalculationEngine::calculateVendorPay(const CalculationInput& input,
                                            const ClientConfiguration& config) const {
    return calculateDeliveryCost(input, config).delivery_fee;
}

std::vector<ValidationIssue> CalculationEngine::validateInput(const CalculationInput& input,
                                                              const ClientConfiguration& config) const {
    std::vector<ValidationIssue> issues;
    if (input.food_cost_cents < 0) {
        issues.push_back({"foodCost", "food cost cannot be negative; treated as 0"});
    }
    if (std::isnan(input.total_mileage) || input.total_mileage < 0.0) {
        issues.push_back({"totalMileage", "mileage must be a non-negative number; treated as 0"});
    }
    if (input.number_of_drives < 1) {
        issues.push_back({"numberOfDrives", "at least one drive is required; treated as 1"});
    }
    if (input.number_of_stops < 1) {
        issues.push_back({"numberOfStops", "at least one stop is required; treated as 1"});
    }
    if (input.tips_cents < 0) {
        issues.push_back({"tips", "tips cannot be negative; treated as 0"});
    }
    if (input.has_bridge_toll && input.bridge_toll_cents < 0) {
        issues.push_back({"bridgeToll", "bridge toll cannot be negative; treated as 0"});
    }
    if (input.ready_set_addon_fee_cents < 0) {
        issues.push_back({"readySetAddonFee", "add-on fee cannot be negative; treated as 0"});
    }

    const Resolved resolved = resolve(input, config);
    const Tier& tier = *resolved.selection.tier;
    if (!resolved.context.percentage_tier && tier.customer_base_fee_cents == 0 &&
        tier.customer_base_fee_within_radius_cents == 0) {
        issues.push_back({"tier", "order falls in an unpriced tier and needs manual review"});
    }
    return issues;
}

} // namespace readyset
