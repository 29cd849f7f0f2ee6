#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace readyset {

// Money is carried as integer cents everywhere.
using Cents = int64_t;

// Largest amount a single input value or line item may carry ($10 trillion).
// Sums of a few dozen such lines stay far inside int64.
constexpr Cents kMaxAmountCents = 1000000000000000LL;
constexpr double kMaxMileage = 1.0e7;

struct CalculationInput {
    uint32_t headcount = 0;
    Cents food_cost_cents = 0;
    double total_mileage = 0.0;
    uint32_t number_of_drives = 1;
    uint32_t number_of_stops = 1;
    bool requires_bridge = false;
    bool has_bridge_toll = false;     // false -> client default toll
    Cents bridge_toll_cents = 0;
    Cents tips_cents = 0;             // may arrive negative, clamped
    bool bonus_qualified = false;
    Cents ready_set_addon_fee_cents = 0;
};

// Copy of the input with out-of-range values pulled back into range.
// Never throws: pricing must always produce a number.
CalculationInput sanitizeInput(const CalculationInput& input);

struct Tier {
    uint32_t min_headcount = 0;
    uint32_t max_headcount = 0;
    bool headcount_open = false;      // no upper bound
    Cents min_food_cost_cents = 0;
    Cents max_food_cost_cents = 0;
    bool food_cost_open = false;      // no upper bound
    Cents customer_base_fee_cents = 0;               // beyond the radius
    Cents customer_base_fee_within_radius_cents = 0;
    Cents driver_base_pay_cents = 0;
    Cents ready_set_fee_cents = -1;   // -1 -> policy fee

    bool containsHeadcount(uint32_t headcount) const;
    bool containsFoodCost(Cents food_cost_cents) const;
};

struct CustomerCharges {
    Cents base_fee = 0;
    Cents long_distance_charge = 0;
    Cents bridge_toll = 0;
    Cents extra_stops_charge = 0;
    Cents daily_drive_discount = 0;
    Cents subtotal = 0;               // before policy adjustments
    Cents total = 0;
};

struct DriverPayments {
    Cents base_pay = 0;
    Cents mileage_pay = 0;
    Cents bridge_toll = 0;
    Cents extra_stops_bonus = 0;
    Cents tips = 0;
    Cents bonus = 0;                  // reported, never part of total
    Cents subtotal = 0;
    Cents total = 0;
};

struct CalculationResult {
    CustomerCharges customer_charges;
    DriverPayments driver_payments;
    Cents profit = 0;
    double profit_margin_percent = 0.0;
    size_t tier_index = 0;
    bool percentage_tier = false;
    std::string template_used;
};

// Customer-facing aggregate view.
struct DeliveryCostBreakdown {
    Cents delivery_cost = 0;
    Cents total_mileage_pay = 0;
    Cents daily_drive_discount = 0;
    Cents bridge_toll = 0;
    Cents extra_stops_charge = 0;
    Cents delivery_fee = 0;
};

struct DriverPayBreakdown {
    Cents driver_max_pay_per_drop = 0;
    Cents driver_base_pay_per_drop = 0;
    Cents driver_total_base_pay = 0;
    double total_mileage = 0.0;
    Cents mileage_rate_cents = 0;
    Cents total_mileage_pay = 0;
    Cents bridge_toll = 0;
    Cents extra_stops_bonus = 0;
    Cents direct_tip = 0;
    Cents ready_set_fee = 0;
    Cents ready_set_addon_fee = 0;
    Cents ready_set_total_fee = 0;
    Cents driver_bonus_pay = 0;
    bool bonus_qualified = false;
    int bonus_qualified_percent = 0;
    Cents total_driver_pay = 0;
};

// Saturates to [-kMaxAmountCents, kMaxAmountCents]; NaN rounds to 0.
Cents roundToCents(double amount_cents);
double centsToDollars(Cents cents);
Cents dollarsToCents(double dollars);

} // namespace readyset
