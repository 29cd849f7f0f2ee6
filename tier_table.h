#pragma once

#include <cstddef>
#include <vector>

#include "pricing_types.h"

namespace readyset {

// Headcount / food-cost bands for one client, cheapest first.
// Validated on construction and immutable afterwards.
class TierTable {
public:
    explicit TierTable(std::vector<Tier> tiers);

    size_t size() const { return tiers_.size(); }
    const Tier& at(size_t index) const { return tiers_.at(index); }
    const std::vector<Tier>& tiers() const { return tiers_; }
    size_t topIndex() const { return tiers_.size() - 1; }

    // Index of the band containing the value; the open top tier when none does.
    size_t headcountTierIndex(uint32_t headcount) const;
    size_t foodCostTierIndex(Cents food_cost_cents) const;

private:
    static void validate(const std::vector<Tier>& tiers);

    std::vector<Tier> tiers_;
};

struct TierSelection {
    size_t headcount_index = 0;
    size_t food_cost_index = 0;
    size_t index = 0;                 // min of the two
    const Tier* tier = nullptr;       // points into the classified table
};

class TierClassifier {
public:
    // Lesser-of rule: the cheaper (lower index) of the headcount tier and the
    // food-cost tier prices both the customer fee and the driver base pay.
    static TierSelection classify(const CalculationInput& input, const TierTable& table);
};

} // namespace readyset
