#include "tier_table.h"

#include <algorithm>
#include <limits>
#include <sstream>
#include <utility>

#include "errors.h"

namespace readyset {

namespace {

std::string tierLabel(size_t index) {
    std::ostringstream oss;
    oss << "tier " << (index + 1);
    return oss.str();
}

} // namespace

TierTable::TierTable(std::vector<Tier> tiers) : tiers_(std::move(tiers)) {
    validate(tiers_);
}

void TierTable::validate(const std::vector<Tier>& tiers) {
    if (tiers.empty()) {
        throw ConfigurationError("tier table is empty");
    }
    if (tiers.front().min_headcount != 0 || tiers.front().min_food_cost_cents != 0) {
        throw ConfigurationError("tier 1 must start at headcount 0 and food cost 0");
    }

    for (size_t i = 0; i < tiers.size(); ++i) {
        const Tier& tier = tiers[i];
        const bool is_top = (i + 1 == tiers.size());

        if (tier.customer_base_fee_cents < 0 ||
            tier.customer_base_fee_within_radius_cents < 0 ||
            tier.driver_base_pay_cents < 0) {
            throw ConfigurationError(tierLabel(i) + " has a negative amount");
        }
        if (tier.customer_base_fee_cents > kMaxAmountCents ||
            tier.customer_base_fee_within_radius_cents > kMaxAmountCents ||
            tier.driver_base_pay_cents > kMaxAmountCents ||
            tier.ready_set_fee_cents > kMaxAmountCents) {
            throw ConfigurationError(tierLabel(i) + " has an amount above the limit");
        }
        if (tier.min_food_cost_cents < 0) {
            throw ConfigurationError(tierLabel(i) + " has a negative food cost bound");
        }

        if (is_top) {
            if (!tier.headcount_open || !tier.food_cost_open) {
                throw ConfigurationError("top tier must be open-ended in both dimensions");
            }
            break;
        }

        if (tier.headcount_open || tier.food_cost_open) {
            throw ConfigurationError(tierLabel(i) + " is open-ended but is not the top tier");
        }
        if (tier.max_headcount < tier.min_headcount ||
            tier.max_food_cost_cents < tier.min_food_cost_cents) {
            throw ConfigurationError(tierLabel(i) + " has an inverted band");
        }
        // the next band starts one past this one
        if (tier.max_headcount == std::numeric_limits<uint32_t>::max() ||
            tier.max_food_cost_cents >= kMaxAmountCents) {
            throw ConfigurationError(tierLabel(i) + " upper bound leaves no room for the next tier");
        }

        const Tier& next = tiers[i + 1];
        if (next.min_headcount != tier.max_headcount + 1) {
            throw ConfigurationError(
                (next.min_headcount <= tier.max_headcount ? "headcount overlap between "
                                                          : "headcount gap between ") +
                tierLabel(i) + " and " + tierLabel(i + 1));
        }
        if (next.min_food_cost_cents != tier.max_food_cost_cents + 1) {
            throw ConfigurationError(
                (next.min_food_cost_cents <= tier.max_food_cost_cents ? "food cost overlap between "
                                                                      : "food cost gap between ") +
                tierLabel(i) + " and " + tierLabel(i + 1));
        }
    }
}

size_t TierTable::headcountTierIndex(uint32_t headcount) const {
    for (size_t i = 0; i < tiers_.size(); ++i) {
        if (tiers_[i].containsHeadcount(headcount)) {
            return i;
        }
    }
    return topIndex();
}

size_t TierTable::foodCostTierIndex(Cents food_cost_cents) const {
    if (food_cost_cents < 0) {
        return 0;
    }
    for (size_t i = 0; i < tiers_.size(); ++i) {
        if (tiers_[i].containsFoodCost(food_cost_cents)) {
            return i;
        }
    }
    return topIndex();
}

TierSelection TierClassifier::classify(const CalculationInput& input, const TierTable& table) {
    TierSelection selection;
    selection.headcount_index = table.headcountTierIndex(input.headcount);
    selection.food_cost_index = table.foodCostTierIndex(input.food_cost_cents);
    selection.index = std::min(selection.headcount_index, selection.food_cost_index);
    selection.tier = &table.at(selection.index);
    return selection;
}

} // namespace readyset
