#include "client_policy.h"

#include <atomic>
#include <utility>

#include "errors.h"

namespace readyset {

namespace {

Tier band(uint32_t hc_min, uint32_t hc_max, Cents fc_min, Cents fc_max,
          Cents regular, Cents within_radius, Cents driver_base) {
    Tier t;
    t.min_headcount = hc_min;
    t.max_headcount = hc_max;
    t.min_food_cost_cents = fc_min;
    t.max_food_cost_cents = fc_max;
    t.customer_base_fee_cents = regular;
    t.customer_base_fee_within_radius_cents = within_radius;
    t.driver_base_pay_cents = driver_base;
    return t;
}

Tier topBand(uint32_t hc_min, Cents fc_min, Cents regular, Cents within_radius, Cents driver_base) {
    Tier t = band(hc_min, 0, fc_min, 0, regular, within_radius, driver_base);
    t.headcount_open = true;
    t.food_cost_open = true;
    return t;
}

PricingRule makeRule(const std::string& id, RuleType type, RuleName name, int priority) {
    PricingRule rule;
    rule.id = id;
    rule.rule_type = type;
    rule.rule_name = name;
    rule.priority = priority;
    return rule;
}

// Ready Set food bands shared by several clients (dollar amounts x100).
std::vector<Tier> readySetStandardBands(bool flat_fee) {
    struct Row { uint32_t hc_min, hc_max; Cents fc_min, fc_max, regular, within, driver; };
    static const Row rows[] = {
        {0, 24, 0, 29999, 6000, 3000, 1800},
        {25, 49, 30000, 59999, 7000, 4000, 2300},
        {50, 74, 60000, 89999, 9000, 6000, 3300},
        {75, 99, 90000, 119999, 10000, 7000, 4300},
        {100, 124, 120000, 149999, 12000, 8000, 4300},
        {125, 149, 150000, 169999, 15000, 9000, 4300},
        {150, 174, 170000, 189999, 18000, 10000, 4300},
        {175, 199, 190000, 209999, 21000, 11000, 4300},
        {200, 249, 210000, 229999, 28000, 12000, 4300},
        {250, 299, 230000, 249999, 31000, 13000, 4300},
    };
    std::vector<Tier> tiers;
    for (const auto& r : rows) {
        tiers.push_back(band(r.hc_min, r.hc_max, r.fc_min, r.fc_max,
                             r.regular, flat_fee ? r.regular : r.within, r.driver));
    }
    // 300+ / $2500+ is priced case by case
    tiers.push_back(topBand(300, 250000, 0, 0, 4300));
    return tiers;
}

} // namespace

bool ClientPricingPolicy::isPercentageTier(const Tier& tier) const {
    if (!percentage_tier_threshold.enabled) {
        return false;
    }
    return tier.min_headcount >= percentage_tier_threshold.headcount &&
           tier.min_food_cost_cents >= percentage_tier_threshold.food_cost_cents;
}

void ClientPricingPolicy::validate() const {
    if (client_id.empty()) {
        throw ConfigurationError("client id is required");
    }
    if (minimum_customer_fee_cents < 0 || customer_mileage_rate_cents_per_mile < 0 ||
        driver_mileage_rate_cents_per_mile < 0 || driver_minimum_mileage_pay_cents < 0 ||
        default_bridge_toll_cents < 0 || daily_drive_discount_cents_per_extra_drive < 0 ||
        bonus_flat_cents < 0 || customer_extra_stop_cents < 0 || driver_extra_stop_cents < 0 ||
        driver_max_pay_per_drop_cents < 0 || ready_set_fee_cents < 0) {
        throw ConfigurationError("amounts cannot be negative");
    }
    const Cents amounts[] = {
        minimum_customer_fee_cents, customer_mileage_rate_cents_per_mile,
        driver_mileage_rate_cents_per_mile, driver_minimum_mileage_pay_cents,
        default_bridge_toll_cents, daily_drive_discount_cents_per_extra_drive,
        bonus_flat_cents, customer_extra_stop_cents, driver_extra_stop_cents,
        driver_max_pay_per_drop_cents, ready_set_fee_cents};
    for (Cents amount : amounts) {
        if (amount > kMaxAmountCents) {
            throw ConfigurationError("amount above the limit");
        }
    }
    if (!(mileage_threshold_miles >= 0.0)) {
        throw ConfigurationError("mileage threshold cannot be negative");
    }
    if (percentage_rate < 0.0 || percentage_rate > 1.0) {
        throw ConfigurationError("percentage rate must be within [0, 1]");
    }
    if (percentage_tier_threshold.enabled && percentage_rate <= 0.0) {
        throw ConfigurationError("percentage tier configured without a rate");
    }
}

RuleSet defaultRuleSet(const ClientPricingPolicy& policy) {
    std::vector<PricingRule> rules;

    rules.push_back(makeRule("customer-base-fee", RuleType::CustomerCharge, RuleName::TieredBaseFee, 100));
    if (policy.percentage_tier_threshold.enabled) {
        PricingRule pct = makeRule("customer-percentage", RuleType::CustomerCharge, RuleName::Percentage, 95);
        pct.percentage_rate = policy.percentage_rate;
        rules.push_back(pct);
    }
    PricingRule long_distance =
        makeRule("customer-long-distance", RuleType::CustomerCharge, RuleName::LongDistance, 90);
    long_distance.per_unit_amount_cents = policy.customer_mileage_rate_cents_per_mile;
    long_distance.threshold_value = policy.mileage_threshold_miles;
    long_distance.threshold_type = ThresholdType::Above;
    rules.push_back(long_distance);

    PricingRule customer_bridge =
        makeRule("customer-bridge-toll", RuleType::CustomerCharge, RuleName::BridgeToll, 80);
    customer_bridge.base_amount_cents = policy.default_bridge_toll_cents;
    rules.push_back(customer_bridge);

    if (policy.customer_extra_stop_cents > 0) {
        PricingRule stops = makeRule("customer-extra-stops", RuleType::CustomerCharge, RuleName::ExtraStops, 70);
        stops.per_unit_amount_cents = policy.customer_extra_stop_cents;
        rules.push_back(stops);
    }

    rules.push_back(makeRule("driver-base-pay", RuleType::DriverPayment, RuleName::TieredBaseFee, 100));

    PricingRule mileage = makeRule("driver-mileage", RuleType::DriverPayment, RuleName::Mileage, 90);
    mileage.per_unit_amount_cents = policy.driver_mileage_rate_cents_per_mile;
    rules.push_back(mileage);

    PricingRule driver_bridge = makeRule("driver-bridge-toll", RuleType::DriverPayment, RuleName::BridgeToll, 80);
    driver_bridge.base_amount_cents = policy.default_bridge_toll_cents;
    rules.push_back(driver_bridge);

    if (policy.driver_extra_stop_cents > 0) {
        PricingRule stops = makeRule("driver-extra-stops", RuleType::DriverPayment, RuleName::ExtraStops, 70);
        stops.per_unit_amount_cents = policy.driver_extra_stop_cents;
        rules.push_back(stops);
    }

    rules.push_back(makeRule("driver-tips", RuleType::DriverPayment, RuleName::Tips, 60));

    return RuleSet(policy.client_id + "-default", std::move(rules));
}

ClientConfiguration::ClientConfiguration(ClientPricingPolicy policy, TierTable tiers)
    : policy_(std::move(policy)), tiers_(std::move(tiers)) {
    policy_.validate();
    policy_rules_ = defaultRuleSet(policy_);
    rules_ = policy_rules_;
}

ClientConfiguration::ClientConfiguration(ClientPricingPolicy policy, TierTable tiers, RuleSet rules)
    : policy_(std::move(policy)), tiers_(std::move(tiers)), rules_(std::move(rules)) {
    policy_.validate();
    if (rules_.empty()) {
        throw ConfigurationError("client '" + policy_.client_id + "' has an empty rule set");
    }
    policy_rules_ = defaultRuleSet(policy_);
}

namespace builtin {

const char* const kReadySetFoodStandard = "ready-set-food-standard";
const char* const kCaterValley = "cater-valley";
const char* const kKasa = "kasa";
const char* const kHyFoodCompanyDirect = "hy-food-company-direct";
const char* const kTryHungry = "try-hungry";

ClientConfigurationPtr readySetFoodStandard() {
    ClientPricingPolicy p;
    p.client_id = kReadySetFoodStandard;
    p.client_name = "Ready Set Food - Standard";
    p.vendor_name = "Destino";
    p.customer_mileage_rate_cents_per_mile = 300;
    p.driver_mileage_rate_cents_per_mile = 70;
    p.driver_minimum_mileage_pay_cents = 700;
    p.include_bridge_toll_in_customer_fee = true;
    p.default_bridge_toll_cents = 800;
    p.daily_drive_discount_cents_per_extra_drive = 500;
    p.bonus_flat_cents = 1000;
    p.customer_extra_stop_cents = 500;
    p.driver_extra_stop_cents = 250;
    p.driver_max_pay_per_drop_cents = 4000;
    p.ready_set_fee_cents = 7000;
    return std::make_shared<const ClientConfiguration>(p, TierTable(readySetStandardBands(false)));
}

ClientConfigurationPtr caterValley() {
    ClientPricingPolicy p;
    p.client_id = kCaterValley;
    p.client_name = "CaterValley";
    p.vendor_name = "CaterValley";
    p.minimum_customer_fee_cents = 4250;
    p.customer_mileage_rate_cents_per_mile = 300;
    p.driver_mileage_rate_cents_per_mile = 70;
    p.driver_minimum_mileage_pay_cents = 0;
    // toll is a driver reimbursement absorbed by Ready Set
    p.include_bridge_toll_in_customer_fee = false;
    p.default_bridge_toll_cents = 800;
    p.percentage_tier_threshold.enabled = true;
    p.percentage_tier_threshold.headcount = 100;
    p.percentage_tier_threshold.food_cost_cents = 120000;
    p.percentage_rate = 0.10;
    p.bonus_flat_cents = 1000;
    p.bonus_suppressed_by_direct_tip = true;
    p.driver_max_pay_per_drop_cents = 4000;
    p.ready_set_fee_cents = 7000;

    std::vector<Tier> tiers = {
        band(0, 25, 0, 30000, 8500, 4250, 1800),
        band(26, 49, 30001, 59999, 9000, 5250, 2300),
        band(50, 74, 60000, 89999, 11000, 6250, 3300),
        band(75, 99, 90000, 119999, 12000, 7250, 4300),
        topBand(100, 120000, 0, 0, 4300),
    };
    return std::make_shared<const ClientConfiguration>(p, TierTable(tiers));
}

ClientConfigurationPtr kasa() {
    ClientPricingPolicy p;
    p.client_id = kKasa;
    p.client_name = "Kasa";
    p.vendor_name = "Kasa";
    p.customer_mileage_rate_cents_per_mile = 300;
    p.driver_mileage_rate_cents_per_mile = 70;
    p.driver_minimum_mileage_pay_cents = 700;
    p.default_bridge_toll_cents = 800;
    p.daily_drive_discount_cents_per_extra_drive = 500;
    p.bonus_flat_cents = 1000;
    p.driver_max_pay_per_drop_cents = 9869;
    p.ready_set_fee_cents = 13500;

    std::vector<Tier> tiers = {
        band(0, 24, 0, 29999, 6000, 3000, 6300),
        band(25, 49, 30000, 59999, 7000, 4000, 6300),
        band(50, 74, 60000, 89999, 9000, 6000, 6300),
        band(75, 99, 90000, 119999, 10000, 7000, 6300),
        band(100, 124, 120000, 149999, 12000, 8000, 6300),
        band(125, 149, 150000, 179999, 14000, 9000, 6300),
        band(150, 174, 180000, 209999, 16000, 10000, 6300),
        band(175, 199, 210000, 239999, 18000, 11000, 6300),
        band(200, 249, 240000, 299999, 20000, 12000, 6300),
        band(250, 299, 300000, 349999, 22000, 13000, 6300),
        topBand(300, 350000, 0, 0, 6300),
    };
    return std::make_shared<const ClientConfiguration>(p, TierTable(tiers));
}

ClientConfigurationPtr hyFoodCompanyDirect() {
    ClientPricingPolicy p;
    p.client_id = kHyFoodCompanyDirect;
    p.client_name = "HY Food Company - Direct";
    p.vendor_name = "HY Food Company";
    p.customer_mileage_rate_cents_per_mile = 250;
    p.driver_mileage_rate_cents_per_mile = 70;
    p.driver_minimum_mileage_pay_cents = 700;
    p.default_bridge_toll_cents = 800;
    p.daily_drive_discount_cents_per_extra_drive = 500;
    p.bonus_flat_cents = 1000;
    p.driver_max_pay_per_drop_cents = 5000;
    p.ready_set_fee_cents = 7000;

    std::vector<Tier> tiers = readySetStandardBands(true);
    for (auto& tier : tiers) {
        tier.driver_base_pay_cents = 5000;
    }
    return std::make_shared<const ClientConfiguration>(p, TierTable(tiers));
}

ClientConfigurationPtr tryHungry() {
    ClientPricingPolicy p;
    p.client_id = kTryHungry;
    p.client_name = "Try Hungry";
    p.vendor_name = "Try Hungry";
    p.customer_mileage_rate_cents_per_mile = 250;
    p.driver_mileage_rate_cents_per_mile = 70;
    p.driver_minimum_mileage_pay_cents = 700;
    p.default_bridge_toll_cents = 800;
    p.daily_drive_discount_cents_per_extra_drive = 500;
    p.bonus_flat_cents = 1000;
    p.driver_max_pay_per_drop_cents = 4000;
    p.ready_set_fee_cents = 7000;

    // Flat fee by headcount; the Ready Set fee follows the same tier
    std::vector<Tier> tiers = {
        band(0, 24, 0, 29999, 4000, 4000, 1800),
        band(25, 49, 30000, 59999, 5000, 5000, 2300),
        band(50, 74, 60000, 89999, 6000, 6000, 3300),
        band(75, 99, 90000, 119999, 7000, 7000, 4300),
        topBand(100, 120000, 0, 0, 0),
    };
    const Cents rs_fees[] = {4000, 5000, 6000, 7000, 0};
    for (size_t i = 0; i < tiers.size(); ++i) {
        tiers[i].ready_set_fee_cents = rs_fees[i];
    }
    return std::make_shared<const ClientConfiguration>(p, TierTable(tiers));
}

std::vector<ClientConfigurationPtr> all() {
    return {readySetFoodStandard(), caterValley(), kasa(), hyFoodCompanyDirect(), tryHungry()};
}

} // namespace builtin

PolicyRegistry::PolicyRegistry(std::vector<ClientConfigurationPtr> clients,
                               const std::string& default_client_id)
    : snapshot_(buildSnapshot(std::move(clients), default_client_id)) {}

std::shared_ptr<const PolicyRegistry::Snapshot> PolicyRegistry::buildSnapshot(
    std::vector<ClientConfigurationPtr> clients, const std::string& default_client_id) {
    auto snapshot = std::make_shared<Snapshot>();
    for (auto& client : clients) {
        if (!client) {
            throw ConfigurationError("null client configuration");
        }
        const std::string id = client->id();
        if (!snapshot->clients.emplace(id, std::move(client)).second) {
            throw ConfigurationError("duplicate client id '" + id + "'");
        }
    }
    if (snapshot->clients.find(default_client_id) == snapshot->clients.end()) {
        throw ConfigurationError("default client '" + default_client_id + "' is not configured");
    }
    snapshot->default_client_id = default_client_id;
    return snapshot;
}

std::shared_ptr<const PolicyRegistry::Snapshot> PolicyRegistry::snapshot() const {
    return std::atomic_load(&snapshot_);
}

void PolicyRegistry::reload(std::vector<ClientConfigurationPtr> clients,
                            const std::string& default_client_id) {
    auto next = buildSnapshot(std::move(clients), default_client_id);
    std::atomic_store(&snapshot_, next);
}

ClientConfigurationPtr PolicyRegistry::resolve(const std::string& client_id) const {
    auto current = snapshot();
    auto it = current->clients.find(client_id);
    if (it != current->clients.end()) {
        return it->second;
    }
    return current->clients.at(current->default_client_id);
}

bool PolicyRegistry::contains(const std::string& client_id) const {
    auto current = snapshot();
    return current->clients.find(client_id) != current->clients.end();
}

std::vector<ClientConfigurationPtr> PolicyRegistry::activeClients() const {
    auto current = snapshot();
    std::vector<ClientConfigurationPtr> result;
    for (const auto& entry : current->clients) {
        if (entry.second->policy().active) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::string PolicyRegistry::defaultClientId() const {
    return snapshot()->default_client_id;
}

} // namespace readyset
