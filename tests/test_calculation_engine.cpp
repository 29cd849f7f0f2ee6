#include <cassert>
#include <cmath>
#include <string>
#include <vector>

#include "client_policy.h"
#include "pricing_engine.h"

using namespace readyset;

static PricingRule rule(const std::string& id, RuleType type, RuleName name, int priority,
                        Cents base, Cents per_unit) {
    PricingRule r;
    r.id = id;
    r.rule_type = type;
    r.rule_name = name;
    r.priority = priority;
    r.base_amount_cents = base;
    r.per_unit_amount_cents = per_unit;
    return r;
}

// Flat base fee and base pay with per-mile extras, independent of tiers.
static ClientConfiguration ruleBasedClient() {
    ClientPricingPolicy policy;
    policy.client_id = "rule-based";
    policy.client_name = "Rule-based client";

    std::vector<PricingRule> rules;
    rules.push_back(rule("customer-base", RuleType::CustomerCharge, RuleName::BaseFee, 100, 6000, 0));
    PricingRule long_distance = rule("customer-long-distance", RuleType::CustomerCharge,
                                     RuleName::LongDistance, 90, 0, 300);
    long_distance.threshold_value = 10.0;
    long_distance.threshold_type = ThresholdType::Above;
    rules.push_back(long_distance);
    rules.push_back(rule("customer-bridge", RuleType::CustomerCharge, RuleName::BridgeToll, 80, 800, 0));
    rules.push_back(rule("customer-stops", RuleType::CustomerCharge, RuleName::ExtraStops, 70, 0, 500));
    rules.push_back(rule("driver-base", RuleType::DriverPayment, RuleName::BaseFee, 100, 3500, 0));
    rules.push_back(rule("driver-mileage", RuleType::DriverPayment, RuleName::Mileage, 90, 0, 70));
    rules.push_back(rule("driver-bridge", RuleType::DriverPayment, RuleName::BridgeToll, 80, 800, 0));
    rules.push_back(rule("driver-stops", RuleType::DriverPayment, RuleName::ExtraStops, 70, 0, 250));

    return ClientConfiguration(policy, builtin::readySetFoodStandard()->tiers(),
                               RuleSet("standard-delivery", rules));
}

static CalculationInput trip(double miles) {
    CalculationInput input;
    input.headcount = 40;
    input.food_cost_cents = 50000;
    input.total_mileage = miles;
    return input;
}

static bool sameResult(const CalculationResult& a, const CalculationResult& b) {
    return a.customer_charges.base_fee == b.customer_charges.base_fee &&
           a.customer_charges.long_distance_charge == b.customer_charges.long_distance_charge &&
           a.customer_charges.bridge_toll == b.customer_charges.bridge_toll &&
           a.customer_charges.total == b.customer_charges.total &&
           a.driver_payments.base_pay == b.driver_payments.base_pay &&
           a.driver_payments.mileage_pay == b.driver_payments.mileage_pay &&
           a.driver_payments.tips == b.driver_payments.tips &&
           a.driver_payments.bonus == b.driver_payments.bonus &&
           a.driver_payments.total == b.driver_payments.total &&
           a.profit == b.profit &&
           a.profit_margin_percent == b.profit_margin_percent &&
           a.tier_index == b.tier_index &&
           a.template_used == b.template_used;
}

int main() {
    const CalculationEngine engine;
    const ClientConfiguration client = ruleBasedClient();

    // short trip
    {
        const CalculationResult result = engine.calculate(trip(5), client);
        assert(result.customer_charges.base_fee == 6000);
        assert(result.customer_charges.long_distance_charge == 0);
        assert(result.customer_charges.total == 6000);
        assert(result.driver_payments.base_pay == 3500);
        assert(result.driver_payments.mileage_pay == 350);
        assert(result.driver_payments.total == 3850);
        assert(result.profit == 2150);
        assert(std::fabs(result.profit_margin_percent - 2150.0 / 6000.0 * 100.0) < 1e-9);
        assert(result.template_used == "standard-delivery");
        assert(result.tier_index == 1);
    }

    // long distance
    {
        const CalculationResult result = engine.calculate(trip(15), client);
        assert(result.customer_charges.long_distance_charge == 1500);
        assert(result.customer_charges.total == 7500);
        assert(result.driver_payments.mileage_pay == 1050);
        assert(result.driver_payments.total == 4550);
        assert(result.profit == 2950);

        // exactly at the threshold nothing is added
        assert(engine.calculate(trip(10.0), client).customer_charges.long_distance_charge == 0);
    }

    // bridge crossing
    {
        CalculationInput input = trip(8);
        input.requires_bridge = true;
        const CalculationResult result = engine.calculate(input, client);
        assert(result.customer_charges.bridge_toll == 800);
        assert(result.customer_charges.total == 6800);
        assert(result.driver_payments.bridge_toll == 800);
        assert(result.driver_payments.total == 3500 + 560 + 800);
    }

    // multiple stops
    {
        CalculationInput input = trip(10);
        input.number_of_stops = 3;
        const CalculationResult result = engine.calculate(input, client);
        assert(result.customer_charges.extra_stops_charge == 1000);
        assert(result.customer_charges.total == 7000);
        assert(result.driver_payments.extra_stops_bonus == 500);
        assert(result.driver_payments.total == 3500 + 700 + 500);
    }

    // the split entry points agree with calculate()
    {
        const CalculationInput input = trip(12);
        const CalculationResult result = engine.calculate(input, client);
        assert(engine.calculateCustomerCharge(input, client).total == result.customer_charges.total);
        assert(engine.calculateDriverPayment(input, client).total == result.driver_payments.total);
    }

    // same input, same output
    {
        CalculationInput input = trip(13.37);
        input.requires_bridge = true;
        input.tips_cents = 500;
        input.bonus_qualified = true;
        const CalculationResult first = engine.calculate(input, client);
        const CalculationResult second = engine.calculate(input, client);
        assert(sameResult(first, second));

        auto cater = builtin::caterValley();
        assert(sameResult(engine.calculate(input, *cater), engine.calculate(input, *cater)));
    }

    // built-in clients: rule-based view matches the aggregate view
    {
        auto cater = builtin::caterValley();
        CalculationInput input;
        input.headcount = 150;
        input.food_cost_cents = 200000;
        input.total_mileage = 20;
        const CalculationResult result = engine.calculate(input, *cater);
        assert(result.percentage_tier);
        assert(result.tier_index == 4);
        assert(result.customer_charges.base_fee == 20000);
        assert(result.customer_charges.total == engine.calculateDeliveryCost(input, *cater).delivery_fee);
        assert(result.driver_payments.total == engine.calculateDriverPay(input, *cater).total_driver_pay);
        assert(result.profit == 23000 - 5700);
        assert(result.template_used == "cater-valley-default");
    }

    // an unpriced tier yields a zero total and a zero margin, not a division by zero
    {
        CalculationInput input;
        input.headcount = 400;
        input.food_cost_cents = 300000;
        input.total_mileage = 5;
        const CalculationResult result = engine.calculate(input, *builtin::readySetFoodStandard());
        assert(result.customer_charges.total == 0);
        assert(result.driver_payments.total == 4300 + 700);
        assert(result.profit == -5000);
        assert(result.profit_margin_percent == 0.0);
    }

    return 0;
}
