#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "pricing_rules.h"
#include "pricing_types.h"
#include "tier_table.h"

namespace readyset {

struct PercentageTierThreshold {
    bool enabled = false;
    uint32_t headcount = 0;
    Cents food_cost_cents = 0;
};

// Per-client behaviour that cannot be expressed as a plain rule.
struct ClientPricingPolicy {
    std::string client_id;
    std::string client_name;
    std::string vendor_name;
    bool active = true;

    Cents minimum_customer_fee_cents = 0;
    double mileage_threshold_miles = 10.0;
    Cents customer_mileage_rate_cents_per_mile = 300;
    Cents driver_mileage_rate_cents_per_mile = 70;
    Cents driver_minimum_mileage_pay_cents = 0;     // 0 -> plain rate, no floor

    bool include_bridge_toll_in_customer_fee = true;
    Cents default_bridge_toll_cents = 800;

    PercentageTierThreshold percentage_tier_threshold;
    double percentage_rate = 0.0;

    Cents daily_drive_discount_cents_per_extra_drive = 0;
    Cents bonus_flat_cents = 0;
    bool bonus_suppressed_by_direct_tip = false;

    Cents customer_extra_stop_cents = 0;
    Cents driver_extra_stop_cents = 0;
    Cents driver_max_pay_per_drop_cents = 0;        // reported only
    Cents ready_set_fee_cents = 0;

    bool isPercentageTier(const Tier& tier) const;
    void validate() const;
};

// Immutable pricing configuration for one client: policy, tiers and rules.
class ClientConfiguration {
public:
    // Rules derived from the policy (the aggregate pricing model).
    ClientConfiguration(ClientPricingPolicy policy, TierTable tiers);
    ClientConfiguration(ClientPricingPolicy policy, TierTable tiers, RuleSet rules);

    const std::string& id() const { return policy_.client_id; }
    const ClientPricingPolicy& policy() const { return policy_; }
    const TierTable& tiers() const { return tiers_; }
    // Explicit rules when configured, else the policy rules.
    const RuleSet& rules() const { return rules_; }
    // Rules of the aggregate cost/pay views, always derived from the policy.
    const RuleSet& policyRules() const { return policy_rules_; }

private:
    ClientPricingPolicy policy_;
    TierTable tiers_;
    RuleSet rules_;
    RuleSet policy_rules_;
};

using ClientConfigurationPtr = std::shared_ptr<const ClientConfiguration>;

RuleSet defaultRuleSet(const ClientPricingPolicy& policy);

namespace builtin {

extern const char* const kReadySetFoodStandard;
extern const char* const kCaterValley;
extern const char* const kKasa;
extern const char* const kHyFoodCompanyDirect;
extern const char* const kTryHungry;

ClientConfigurationPtr readySetFoodStandard();
ClientConfigurationPtr caterValley();
ClientConfigurationPtr kasa();
ClientConfigurationPtr hyFoodCompanyDirect();
ClientConfigurationPtr tryHungry();

std::vector<ClientConfigurationPtr> all();

} // namespace builtin

// Client id -> configuration. Readers take the current snapshot; reload()
// publishes a new one without touching the old.
class PolicyRegistry {
public:
    struct Snapshot {
        std::map<std::string, ClientConfigurationPtr> clients;
        std::string default_client_id;
    };

    PolicyRegistry(std::vector<ClientConfigurationPtr> clients, const std::string& default_client_id);

    // Unknown ids resolve to the default client.
    ClientConfigurationPtr resolve(const std::string& client_id) const;
    bool contains(const std::string& client_id) const;
    std::vector<ClientConfigurationPtr> activeClients() const;
    std::string defaultClientId() const;

    void reload(std::vector<ClientConfigurationPtr> clients, const std::string& default_client_id);
    std::shared_ptr<const Snapshot> snapshot() const;

private:
    static std::shared_ptr<const Snapshot> buildSnapshot(std::vector<ClientConfigurationPtr> clients,
                                                         const std::string& default_client_id);

    std::shared_ptr<const Snapshot> snapshot_;
};

} // namespace readyset
