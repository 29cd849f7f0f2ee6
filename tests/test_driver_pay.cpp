#include <cassert>

#include "client_policy.h"
#include "pricing_engine.h"

using namespace readyset;

static CalculationInput order(uint32_t headcount, double food_cost_dollars, double miles) {
    CalculationInput input;
    input.headcount = headcount;
    input.food_cost_cents = dollarsToCents(food_cost_dollars);
    input.total_mileage = miles;
    return input;
}

int main() {
    const CalculationEngine engine;
    auto standard = builtin::readySetFoodStandard();
    auto cater = builtin::caterValley();

    // short trip: mileage minimum applies, bonus is reported on its own
    {
        CalculationInput input = order(28, 400, 3.1);
        input.bonus_qualified = true;
        const DriverPayBreakdown pay = engine.calculateDriverPay(input, *standard);
        assert(pay.driver_max_pay_per_drop == 4000);
        assert(pay.driver_base_pay_per_drop == 2300);
        assert(pay.total_mileage == 3.1);
        assert(pay.mileage_rate_cents == 70);
        assert(pay.total_mileage_pay == 700);
        assert(pay.driver_total_base_pay == 3000);
        assert(pay.driver_bonus_pay == 1000);
        assert(pay.bonus_qualified);
        assert(pay.bonus_qualified_percent == 100);
        assert(pay.total_driver_pay == 3000);
        assert(pay.ready_set_fee == 7000);
        assert(pay.ready_set_total_fee == 7000);
    }

    // long distance: tier base pay plus the plain per-mile rate, no cap
    {
        const DriverPayBreakdown pay = engine.calculateDriverPay(order(20, 250, 20), *standard);
        assert(pay.driver_base_pay_per_drop == 1800);
        assert(pay.total_mileage_pay == 1400);
        assert(pay.total_driver_pay == 3200);
        assert(pay.driver_bonus_pay == 0);
        assert(!pay.bonus_qualified);
        assert(pay.bonus_qualified_percent == 0);

        const DriverPayBreakdown top = engine.calculateDriverPay(order(250, 2400, 40), *standard);
        assert(top.driver_base_pay_per_drop == 4300);
        assert(top.total_driver_pay == 4300 + 2800);
        assert(top.total_driver_pay > top.driver_max_pay_per_drop);
    }

    // percentage-tier orders still pay the tier base pay
    {
        const DriverPayBreakdown pay = engine.calculateDriverPay(order(150, 2000, 20), *cater);
        assert(pay.driver_base_pay_per_drop == 4300);
        assert(pay.total_mileage_pay == 1400);
        assert(pay.total_driver_pay == 5700);
    }

    // bridge toll reaches the driver even when the customer is not billed
    {
        CalculationInput input = order(20, 250, 8);
        input.requires_bridge = true;
        const DriverPayBreakdown pay = engine.calculateDriverPay(input, *cater);
        assert(pay.bridge_toll == 800);
        assert(pay.total_driver_pay == 1800 + 560 + 800);
        assert(pay.ready_set_total_fee == 7000 + 800);
    }

    // a direct tip replaces base pay and bonus under CaterValley
    {
        CalculationInput input = order(20, 250, 8);
        input.tips_cents = 2000;
        input.bonus_qualified = true;
        const DriverPayBreakdown pay = engine.calculateDriverPay(input, *cater);
        assert(pay.direct_tip == 2000);
        assert(pay.driver_total_base_pay == 560);
        assert(pay.driver_bonus_pay == 0);
        assert(!pay.bonus_qualified);
        assert(pay.bonus_qualified_percent == 0);
        assert(pay.total_driver_pay == 560 + 2000);
        // the per-drop figure still shows what the tier would have paid
        assert(pay.driver_base_pay_per_drop == 1800);
    }

    // extra stops
    {
        CalculationInput input = order(20, 250, 8);
        input.number_of_stops = 3;
        const DriverPayBreakdown pay = engine.calculateDriverPay(input, *standard);
        assert(pay.extra_stops_bonus == 500);
        assert(pay.total_driver_pay == 1800 + 700 + 500);
    }

    // Ready Set fee: per tier for Try Hungry, plus any add-on
    {
        CalculationInput input = order(30, 400, 5);
        input.ready_set_addon_fee_cents = 1000;
        const DriverPayBreakdown pay = engine.calculateDriverPay(input, *builtin::tryHungry());
        assert(pay.ready_set_fee == 5000);
        assert(pay.ready_set_addon_fee == 1000);
        assert(pay.ready_set_total_fee == 6000);
        assert(pay.driver_base_pay_per_drop == 2300);
    }

    // Kasa pays a flat base
    {
        const DriverPayBreakdown pay = engine.calculateDriverPay(order(20, 250, 5), *builtin::kasa());
        assert(pay.driver_base_pay_per_drop == 6300);
        assert(pay.total_driver_pay == 6300 + 700);
        assert(pay.driver_max_pay_per_drop == 9869);
        assert(pay.ready_set_fee == 13500);

        const DriverPayBreakdown hy = engine.calculateDriverPay(order(20, 250, 5), *builtin::hyFoodCompanyDirect());
        assert(hy.driver_base_pay_per_drop == 5000);
    }

    return 0;
}
