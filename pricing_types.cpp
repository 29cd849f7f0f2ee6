#include "pricing_types.h"

#include <algorithm>
#include <cmath>

namespace readyset {

namespace {

Cents clampAmount(Cents cents) {
    return std::min(std::max<Cents>(cents, 0), kMaxAmountCents);
}

} // namespace

CalculationInput sanitizeInput(const CalculationInput& input) {
    CalculationInput clean = input;
    clean.food_cost_cents = clampAmount(clean.food_cost_cents);
    if (!(clean.total_mileage >= 0.0)) {
        // also catches NaN
        clean.total_mileage = 0.0;
    } else if (clean.total_mileage > kMaxMileage) {
        clean.total_mileage = kMaxMileage;
    }
    if (clean.number_of_drives < 1) {
        clean.number_of_drives = 1;
    }
    if (clean.number_of_stops < 1) {
        clean.number_of_stops = 1;
    }
    clean.tips_cents = clampAmount(clean.tips_cents);
    if (clean.has_bridge_toll) {
        clean.bridge_toll_cents = clampAmount(clean.bridge_toll_cents);
    }
    clean.ready_set_addon_fee_cents = clampAmount(clean.ready_set_addon_fee_cents);
    return clean;
}

bool Tier::containsHeadcount(uint32_t headcount) const {
    if (headcount < min_headcount) {
        return false;
    }
    return headcount_open || headcount <= max_headcount;
}

bool Tier::containsFoodCost(Cents food_cost_cents) const {
    if (food_cost_cents < min_food_cost_cents) {
        return false;
    }
    return food_cost_open || food_cost_cents <= max_food_cost_cents;
}

Cents roundToCents(double amount_cents) {
    if (std::isnan(amount_cents)) {
        return 0;
    }
    const double limit = static_cast<double>(kMaxAmountCents);
    if (amount_cents >= limit) {
        return kMaxAmountCents;
    }
    if (amount_cents <= -limit) {
        return -kMaxAmountCents;
    }
    return static_cast<Cents>(std::llround(amount_cents));
}

double centsToDollars(Cents cents) {
    return static_cast<double>(cents) / 100.0;
}

Cents dollarsToCents(double dollars) {
    return roundToCents(dollars * 100.0);
}

} // namespace readyset
