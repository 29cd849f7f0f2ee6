#include "request_codec.h"

#include <algorithm>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace readyset {

namespace {

uint32_t clampCount(int64_t value) {
    const int64_t max = std::numeric_limits<uint32_t>::max();
    return static_cast<uint32_t>(std::min(std::max<int64_t>(value, 0), max));
}

double dollars(Cents cents) {
    return centsToDollars(cents);
}

} // namespace

bool PricingRequest::fromJson(const json& j, std::string& error) {
    try {
        if (!j.is_object()) {
            error = "request must be a JSON object";
            return false;
        }
        trace_id = j.value("traceId", std::string());
        view = j.at("view").get<std::string>();
        client_id = j.value("clientId", std::string());
        input = j.value("input", json::object());
        if (!input.is_object()) {
            error = "\"input\" must be an object";
            return false;
        }
        return true;
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }
}

CalculationInput inputFromJson(const json& j) {
    CalculationInput input;
    input.headcount = clampCount(j.at("headcount").get<int64_t>());
    input.food_cost_cents = dollarsToCents(j.at("foodCost").get<double>());
    input.total_mileage = j.at("totalMileage").get<double>();
    input.number_of_drives = clampCount(j.value("numberOfDrives", int64_t{1}));
    input.number_of_stops = clampCount(j.value("numberOfStops", int64_t{1}));
    input.requires_bridge = j.value("requiresBridge", false);
    if (j.contains("bridgeToll") && !j.at("bridgeToll").is_null()) {
        input.has_bridge_toll = true;
        input.bridge_toll_cents = dollarsToCents(j.at("bridgeToll").get<double>());
    }
    input.tips_cents = dollarsToCents(j.value("tips", 0.0));
    input.bonus_qualified = j.value("bonusQualified", false);
    input.ready_set_addon_fee_cents = dollarsToCents(j.value("readySetAddonFee", 0.0));
    return input;
}

json toJson(const CalculationInput& input) {
    json j = {
        {"headcount", input.headcount},
        {"foodCost", dollars(input.food_cost_cents)},
        {"totalMileage", input.total_mileage},
        {"numberOfDrives", input.number_of_drives},
        {"numberOfStops", input.number_of_stops},
        {"requiresBridge", input.requires_bridge},
        {"tips", dollars(input.tips_cents)},
        {"bonusQualified", input.bonus_qualified}
    };
    if (input.has_bridge_toll) {
        j["bridgeToll"] = dollars(input.bridge_toll_cents);
    }
    return j;
}

json toJson(const CustomerCharges& charges) {
    return {
        {"baseFee", dollars(charges.base_fee)},
        {"longDistanceCharge", dollars(charges.long_distance_charge)},
        {"bridgeToll", dollars(charges.bridge_toll)},
        {"extraStopsCharge", dollars(charges.extra_stops_charge)},
        {"dailyDriveDiscount", dollars(charges.daily_drive_discount)},
        {"subtotal", dollars(charges.subtotal)},
        {"total", dollars(charges.total)}
    };
}

json toJson(const DriverPayments& payments) {
    return {
        {"basePay", dollars(payments.base_pay)},
        {"mileagePay", dollars(payments.mileage_pay)},
        {"bridgeToll", dollars(payments.bridge_toll)},
        {"extraStopsBonus", dollars(payments.extra_stops_bonus)},
        {"tips", dollars(payments.tips)},
        {"bonus", dollars(payments.bonus)},
        {"subtotal", dollars(payments.subtotal)},
        {"total", dollars(payments.total)}
    };
}

json toJson(const CalculationResult& result) {
    return {
        {"customerCharges", toJson(result.customer_charges)},
        {"driverPayments", toJson(result.driver_payments)},
        {"profit", dollars(result.profit)},
        {"profitMarginPercent", result.profit_margin_percent},
        {"tier", result.tier_index + 1},
        {"percentageTier", result.percentage_tier},
        {"templateUsed", result.template_used}
    };
}

json toJson(const DeliveryCostBreakdown& breakdown) {
    return {
        {"deliveryCost", dollars(breakdown.delivery_cost)},
        {"totalMileagePay", dollars(breakdown.total_mileage_pay)},
        {"dailyDriveDiscount", dollars(breakdown.daily_drive_discount)},
        {"bridgeToll", dollars(breakdown.bridge_toll)},
        {"extraStopsCharge", dollars(breakdown.extra_stops_charge)},
        {"deliveryFee", dollars(breakdown.delivery_fee)}
    };
}

json toJson(const DriverPayBreakdown& pay) {
    return {
        {"driverMaxPayPerDrop", dollars(pay.driver_max_pay_per_drop)},
        {"driverBasePayPerDrop", dollars(pay.driver_base_pay_per_drop)},
        {"driverTotalBasePay", dollars(pay.driver_total_base_pay)},
        {"totalMileage", pay.total_mileage},
        {"mileageRate", dollars(pay.mileage_rate_cents)},
        {"totalMileagePay", dollars(pay.total_mileage_pay)},
        {"bridgeToll", dollars(pay.bridge_toll)},
        {"extraStopsBonus", dollars(pay.extra_stops_bonus)},
        {"directTip", dollars(pay.direct_tip)},
        {"readySetFee", dollars(pay.ready_set_fee)},
        {"readySetAddonFee", dollars(pay.ready_set_addon_fee)},
        {"readySetTotalFee", dollars(pay.ready_set_total_fee)},
        {"driverBonusPay", dollars(pay.driver_bonus_pay)},
        {"bonusQualified", pay.bonus_qualified},
        {"bonusQualifiedPercent", pay.bonus_qualified_percent},
        {"totalDriverPay", dollars(pay.total_driver_pay)}
    };
}

json toJson(const std::vector<ValidationIssue>& issues) {
    json list = json::array();
    for (const auto& issue : issues) {
        list.push_back({{"field", issue.field}, {"message", issue.message}});
    }
    return {
        {"valid", issues.empty()},
        {"issues", list}
    };
}

json clientSummaryJson(const ClientConfiguration& config, bool is_default) {
    const ClientPricingPolicy& policy = config.policy();
    return {
        {"id", policy.client_id},
        {"name", policy.client_name},
        {"vendor", policy.vendor_name},
        {"tiers", config.tiers().size()},
        {"template", config.rules().name()},
        {"default", is_default}
    };
}

json makeSuccessResponse(const json& data, const std::string& trace_id) {
    return {
        {"data", data},
        {"error", nullptr},
        {"traceId", trace_id}
    };
}

json makeErrorResponse(const std::string& code, const std::string& message, const std::string& trace_id) {
    return {
        {"data", nullptr},
        {"error", {
            {"code", code},
            {"message", message}
        }},
        {"traceId", trace_id}
    };
}

} // namespace readyset
