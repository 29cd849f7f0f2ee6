#include "config_loader.h"

#include <cstdlib>
#include <fstream>

#include "errors.h"

using json = nlohmann::json;

namespace readyset {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

ClientPricingPolicy policyFromJson(const json& client) {
    ClientPricingPolicy p;
    p.client_id = client.at("id").get<std::string>();
    p.client_name = client.value("name", p.client_id);
    p.vendor_name = client.value("vendor", std::string());
    p.active = client.value("active", true);

    const json& j = client.at("policy");
    p.minimum_customer_fee_cents = j.value("minimumCustomerFeeCents", p.minimum_customer_fee_cents);
    p.mileage_threshold_miles = j.value("mileageThresholdMiles", p.mileage_threshold_miles);
    p.customer_mileage_rate_cents_per_mile =
        j.value("customerMileageRateCentsPerMile", p.customer_mileage_rate_cents_per_mile);
    p.driver_mileage_rate_cents_per_mile =
        j.value("driverMileageRateCentsPerMile", p.driver_mileage_rate_cents_per_mile);
    p.driver_minimum_mileage_pay_cents =
        j.value("driverMinimumMileagePayCents", p.driver_minimum_mileage_pay_cents);
    p.include_bridge_toll_in_customer_fee =
        j.value("includeBridgeTollInCustomerFee", p.include_bridge_toll_in_customer_fee);
    p.default_bridge_toll_cents = j.value("defaultBridgeTollCents", p.default_bridge_toll_cents);
    if (j.contains("percentageTier") && !j.at("percentageTier").is_null()) {
        const json& threshold = j.at("percentageTier");
        p.percentage_tier_threshold.enabled = true;
        p.percentage_tier_threshold.headcount = threshold.at("headcount").get<uint32_t>();
        p.percentage_tier_threshold.food_cost_cents = threshold.at("foodCostCents").get<Cents>();
    }
    p.percentage_rate = j.value("percentageRate", p.percentage_rate);
    p.daily_drive_discount_cents_per_extra_drive =
        j.value("dailyDriveDiscountCentsPerExtraDrive", p.daily_drive_discount_cents_per_extra_drive);
    p.bonus_flat_cents = j.value("bonusFlatCents", p.bonus_flat_cents);
    p.bonus_suppressed_by_direct_tip = j.value("bonusSuppressedByDirectTip", p.bonus_suppressed_by_direct_tip);
    p.customer_extra_stop_cents = j.value("customerExtraStopCents", p.customer_extra_stop_cents);
    p.driver_extra_stop_cents = j.value("driverExtraStopCents", p.driver_extra_stop_cents);
    p.driver_max_pay_per_drop_cents = j.value("driverMaxPayPerDropCents", p.driver_max_pay_per_drop_cents);
    p.ready_set_fee_cents = j.value("readySetFeeCents", p.ready_set_fee_cents);
    return p;
}

Tier tierFromJson(const json& j) {
    Tier t;
    t.min_headcount = j.at("minHeadcount").get<uint32_t>();
    if (j.contains("maxHeadcount") && !j.at("maxHeadcount").is_null()) {
        t.max_headcount = j.at("maxHeadcount").get<uint32_t>();
    } else {
        t.headcount_open = true;
    }
    t.min_food_cost_cents = j.at("minFoodCostCents").get<Cents>();
    if (j.contains("maxFoodCostCents") && !j.at("maxFoodCostCents").is_null()) {
        t.max_food_cost_cents = j.at("maxFoodCostCents").get<Cents>();
    } else {
        t.food_cost_open = true;
    }
    t.customer_base_fee_cents = j.at("customerBaseFeeCents").get<Cents>();
    t.customer_base_fee_within_radius_cents =
        j.value("customerBaseFeeWithinRadiusCents", t.customer_base_fee_cents);
    t.driver_base_pay_cents = j.at("driverBasePayCents").get<Cents>();
    t.ready_set_fee_cents = j.value("readySetFeeCents", t.ready_set_fee_cents);
    return t;
}

PricingRule ruleFromJson(const json& j) {
    PricingRule r;
    r.id = j.at("id").get<std::string>();
    r.rule_type = ruleTypeFromString(j.at("ruleType").get<std::string>());
    r.rule_name = ruleNameFromString(j.at("ruleName").get<std::string>());
    r.base_amount_cents = j.value("baseAmountCents", r.base_amount_cents);
    r.per_unit_amount_cents = j.value("perUnitAmountCents", r.per_unit_amount_cents);
    r.threshold_value = j.value("thresholdValue", r.threshold_value);
    r.threshold_type = thresholdTypeFromString(j.value("thresholdType", std::string("none")));
    r.percentage_rate = j.value("percentageRate", r.percentage_rate);
    r.priority = j.value("priority", r.priority);
    return r;
}

} // namespace

ServiceConfig::ServiceConfig() {
    pricing_config_path = envOr("PRICING_CONFIG", "");
    default_client_id = envOr("DEFAULT_CLIENT_ID", builtin::kReadySetFoodStandard);
    log_level = parseLogLevel(envOr("LOG_LEVEL", "INFO"));
}

ClientConfigurationPtr clientConfigurationFromJson(const json& j) {
    std::string id = "<unnamed>";
    try {
        id = j.at("id").get<std::string>();
        ClientPricingPolicy policy = policyFromJson(j);

        std::vector<Tier> tiers;
        for (const auto& tier : j.at("tiers")) {
            tiers.push_back(tierFromJson(tier));
        }
        TierTable table(std::move(tiers));

        if (j.contains("rules") && !j.at("rules").is_null()) {
            std::vector<PricingRule> rules;
            for (const auto& rule : j.at("rules")) {
                rules.push_back(ruleFromJson(rule));
            }
            RuleSet rule_set(j.value("template", id + "-rules"), std::move(rules));
            return std::make_shared<const ClientConfiguration>(std::move(policy), std::move(table),
                                                               std::move(rule_set));
        }
        return std::make_shared<const ClientConfiguration>(std::move(policy), std::move(table));
    } catch (const ConfigurationError& e) {
        throw ConfigurationError("client '" + id + "': " + e.detail());
    } catch (const json::exception& e) {
        throw ConfigurationError("client '" + id + "': " + e.what());
    }
}

std::vector<ClientConfigurationPtr> loadClientConfigurations(const json& document) {
    if (!document.is_object() || !document.contains("clients") || !document.at("clients").is_array()) {
        throw ConfigurationError("expected an object with a \"clients\" array");
    }
    std::vector<ClientConfigurationPtr> clients;
    for (const auto& client : document.at("clients")) {
        clients.push_back(clientConfigurationFromJson(client));
    }
    if (clients.empty()) {
        throw ConfigurationError("no clients configured");
    }
    return clients;
}

std::vector<ClientConfigurationPtr> loadClientConfigurationsFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot open " + path);
    }
    json document;
    try {
        in >> document;
    } catch (const json::parse_error& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
    return loadClientConfigurations(document);
}

json toJson(const ClientPricingPolicy& policy) {
    json j = {
        {"minimumCustomerFeeCents", policy.minimum_customer_fee_cents},
        {"mileageThresholdMiles", policy.mileage_threshold_miles},
        {"customerMileageRateCentsPerMile", policy.customer_mileage_rate_cents_per_mile},
        {"driverMileageRateCentsPerMile", policy.driver_mileage_rate_cents_per_mile},
        {"driverMinimumMileagePayCents", policy.driver_minimum_mileage_pay_cents},
        {"includeBridgeTollInCustomerFee", policy.include_bridge_toll_in_customer_fee},
        {"defaultBridgeTollCents", policy.default_bridge_toll_cents},
        {"percentageRate", policy.percentage_rate},
        {"dailyDriveDiscountCentsPerExtraDrive", policy.daily_drive_discount_cents_per_extra_drive},
        {"bonusFlatCents", policy.bonus_flat_cents},
        {"bonusSuppressedByDirectTip", policy.bonus_suppressed_by_direct_tip},
        {"customerExtraStopCents", policy.customer_extra_stop_cents},
        {"driverExtraStopCents", policy.driver_extra_stop_cents},
        {"driverMaxPayPerDropCents", policy.driver_max_pay_per_drop_cents},
        {"readySetFeeCents", policy.ready_set_fee_cents}
    };
    if (policy.percentage_tier_threshold.enabled) {
        j["percentageTier"] = {
            {"headcount", policy.percentage_tier_threshold.headcount},
            {"foodCostCents", policy.percentage_tier_threshold.food_cost_cents}
        };
    }
    return j;
}

json toJson(const Tier& tier) {
    json j = {
        {"minHeadcount", tier.min_headcount},
        {"minFoodCostCents", tier.min_food_cost_cents},
        {"customerBaseFeeCents", tier.customer_base_fee_cents},
        {"customerBaseFeeWithinRadiusCents", tier.customer_base_fee_within_radius_cents},
        {"driverBasePayCents", tier.driver_base_pay_cents}
    };
    if (!tier.headcount_open) {
        j["maxHeadcount"] = tier.max_headcount;
    }
    if (!tier.food_cost_open) {
        j["maxFoodCostCents"] = tier.max_food_cost_cents;
    }
    if (tier.ready_set_fee_cents >= 0) {
        j["readySetFeeCents"] = tier.ready_set_fee_cents;
    }
    return j;
}

json toJson(const PricingRule& rule) {
    return {
        {"id", rule.id},
        {"ruleType", toString(rule.rule_type)},
        {"ruleName", toString(rule.rule_name)},
        {"baseAmountCents", rule.base_amount_cents},
        {"perUnitAmountCents", rule.per_unit_amount_cents},
        {"thresholdValue", rule.threshold_value},
        {"thresholdType", toString(rule.threshold_type)},
        {"percentageRate", rule.percentage_rate},
        {"priority", rule.priority}
    };
}

json toJson(const ClientConfiguration& config) {
    const ClientPricingPolicy& policy = config.policy();
    json tiers = json::array();
    for (const auto& tier : config.tiers().tiers()) {
        tiers.push_back(toJson(tier));
    }
    json rules = json::array();
    for (const auto& rule : config.rules().rules()) {
        rules.push_back(toJson(rule));
    }
    return {
        {"id", policy.client_id},
        {"name", policy.client_name},
        {"vendor", policy.vendor_name},
        {"active", policy.active},
        {"policy", toJson(policy)},
        {"tiers", tiers},
        {"template", config.rules().name()},
        {"rules", rules}
    };
}

json clientConfigurationsToJson(const std::vector<ClientConfigurationPtr>& clients) {
    json list = json::array();
    for (const auto& client : clients) {
        list.push_back(toJson(*client));
    }
    return {{"clients", list}};
}

} // namespace readyset
