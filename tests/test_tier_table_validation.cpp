#include <cassert>
#include <limits>
#include <string>
#include <vector>

#include "errors.h"
#include "tier_table.h"

using namespace readyset;

static Tier band(uint32_t hc_min, uint32_t hc_max, Cents fc_min, Cents fc_max) {
    Tier t;
    t.min_headcount = hc_min;
    t.max_headcount = hc_max;
    t.min_food_cost_cents = fc_min;
    t.max_food_cost_cents = fc_max;
    t.customer_base_fee_cents = 6000;
    t.customer_base_fee_within_radius_cents = 3000;
    t.driver_base_pay_cents = 1800;
    return t;
}

static Tier top(uint32_t hc_min, Cents fc_min) {
    Tier t = band(hc_min, 0, fc_min, 0);
    t.headcount_open = true;
    t.food_cost_open = true;
    return t;
}

static std::string rejection(const std::vector<Tier>& tiers) {
    try {
        TierTable table(tiers);
    } catch (const ConfigurationError& e) {
        return e.what();
    }
    return "";
}

static bool mentions(const std::string& message, const std::string& part) {
    return message.find(part) != std::string::npos;
}

int main() {
    // well-formed
    TierTable ok({band(0, 24, 0, 29999), band(25, 49, 30000, 59999), top(50, 60000)});
    assert(ok.size() == 3);
    assert(ok.topIndex() == 2);

    // a single open tier is a valid table
    TierTable single({top(0, 0)});
    assert(single.headcountTierIndex(1000) == 0);

    assert(mentions(rejection({}), "empty"));

    // must start at zero
    assert(mentions(rejection({band(1, 24, 0, 29999), top(25, 30000)}), "tier 1"));
    assert(mentions(rejection({band(0, 24, 100, 29999), top(25, 30000)}), "tier 1"));

    // headcount gap and overlap
    assert(mentions(rejection({band(0, 24, 0, 29999), top(26, 30000)}), "headcount gap"));
    assert(mentions(rejection({band(0, 24, 0, 29999), top(24, 30000)}), "headcount overlap"));

    // food cost gap and overlap
    assert(mentions(rejection({band(0, 24, 0, 29999), top(25, 30001)}), "food cost gap"));
    assert(mentions(rejection({band(0, 24, 0, 29999), top(25, 29999)}), "food cost overlap"));

    // only the highest tier may be open, and it must be
    Tier open_middle = band(0, 24, 0, 29999);
    open_middle.headcount_open = true;
    assert(mentions(rejection({open_middle, top(25, 30000)}), "open-ended"));
    Tier bounded_top = band(25, 49, 30000, 59999);
    assert(mentions(rejection({band(0, 24, 0, 29999), bounded_top}), "top tier"));

    Tier inverted = band(0, 24, 0, 29999);
    inverted.max_headcount = 0;
    inverted.min_headcount = 0;
    inverted.max_food_cost_cents = -1;
    assert(!rejection({inverted, top(1, 0)}).empty());

    Tier negative = band(0, 24, 0, 29999);
    negative.driver_base_pay_cents = -1;
    assert(mentions(rejection({negative, top(25, 30000)}), "negative"));

    // a lower band ending at the type maximum leaves no room above it
    assert(mentions(rejection({band(0, 4294967295u, 0, 29999), top(0, 30000)}), "upper bound"));
    assert(mentions(rejection({band(0, 24, 0, std::numeric_limits<Cents>::max()), top(25, 0)}),
                    "upper bound"));

    Tier costly = band(0, 24, 0, 29999);
    costly.customer_base_fee_cents = kMaxAmountCents + 1;
    assert(mentions(rejection({costly, top(25, 30000)}), "above the limit"));

    // every message carries the configuration prefix
    assert(mentions(rejection({}), "invalid configuration"));

    return 0;
}
