#include <cassert>

#include "client_policy.h"
#include "tier_table.h"

using namespace readyset;

static CalculationInput order(uint32_t headcount, Cents food_cost_cents) {
    CalculationInput input;
    input.headcount = headcount;
    input.food_cost_cents = food_cost_cents;
    return input;
}

int main() {
    auto standard = builtin::readySetFoodStandard();
    const TierTable& table = standard->tiers();
    assert(table.size() == 11);

    // zero order lands on tier 1
    TierSelection empty = TierClassifier::classify(order(0, 0), table);
    assert(empty.index == 0);
    assert(empty.tier == &table.at(0));

    // headcount boundary 24 | 25
    assert(table.headcountTierIndex(24) == 0);
    assert(table.headcountTierIndex(25) == 1);
    assert(TierClassifier::classify(order(24, 200000), table).index == 0);
    assert(TierClassifier::classify(order(25, 200000), table).index == 1);

    // food cost boundary $299.99 | $300.00
    assert(table.foodCostTierIndex(29999) == 0);
    assert(table.foodCostTierIndex(30000) == 1);
    assert(TierClassifier::classify(order(100, 29999), table).index == 0);
    assert(TierClassifier::classify(order(100, 30000), table).index == 1);

    // headcount 60 is tier 3, $500 is tier 2: tier 2 prices the order
    TierSelection mixed = TierClassifier::classify(order(60, 50000), table);
    assert(mixed.headcount_index == 2);
    assert(mixed.food_cost_index == 1);
    assert(mixed.index == 1);
    assert(mixed.tier->customer_base_fee_cents == 7000);
    assert(mixed.tier->driver_base_pay_cents == 2300);

    // symmetric: the food cost can be the higher one too
    TierSelection mixed_other_way = TierClassifier::classify(order(30, 200000), table);
    assert(mixed_other_way.headcount_index == 1);
    assert(mixed_other_way.food_cost_index == 7);
    assert(mixed_other_way.index == 1);

    // beyond every band: open top tier
    TierSelection huge = TierClassifier::classify(order(5000, 100000000), table);
    assert(huge.index == table.topIndex());
    assert(table.headcountTierIndex(300) == table.topIndex());
    assert(table.foodCostTierIndex(250000) == table.topIndex());

    // negative food cost never reaches the classifier unclamped, but is safe
    assert(table.foodCostTierIndex(-100) == 0);

    // CaterValley bands are shifted by one at the first boundary
    auto cater = builtin::caterValley();
    const TierTable& cater_table = cater->tiers();
    assert(cater_table.headcountTierIndex(25) == 0);
    assert(cater_table.headcountTierIndex(26) == 1);
    assert(cater_table.foodCostTierIndex(30000) == 0);
    assert(cater_table.foodCostTierIndex(30001) == 1);
    assert(TierClassifier::classify(order(35, 45000), cater_table).index == 1);
    assert(TierClassifier::classify(order(150, 200000), cater_table).index == 4);
    assert(TierClassifier::classify(order(150, 50000), cater_table).index == 1);

    return 0;
}
