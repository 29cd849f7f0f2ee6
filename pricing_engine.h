#pragma once

#include <string>
#include <vector>

#include "client_policy.h"
#include "pricing_rules.h"
#include "pricing_types.h"
#include "tier_table.h"

namespace readyset {

struct ValidationIssue {
    std::string field;
    std::string message;
};

// Stateless; one instance can be shared by any number of callers.
class CalculationEngine {
public:
    CalculationEngine() = default;

    // Rule-based view over the client's configured rules.
    CustomerCharges calculateCustomerCharge(const CalculationInput& input,
                                            const ClientConfiguration& config) const;
    DriverPayments calculateDriverPayment(const CalculationInput& input,
                                          const ClientConfiguration& config) const;
    CalculationResult calculate(const CalculationInput& input,
                                const ClientConfiguration& config) const;

    // Aggregate views over the policy-derived rules.
    DeliveryCostBreakdown calculateDeliveryCost(const CalculationInput& input,
                                                const ClientConfiguration& config) const;
    DriverPayBreakdown calculateDriverPay(const CalculationInput& input,
                                          const ClientConfiguration& config) const;
    Cents calculateMileagePay(double total_mileage, const ClientConfiguration& config) const;
    Cents calculateVendorPay(const CalculationInput& input, const ClientConfiguration& config) const;

    // Reports what sanitizeInput() would silently clamp, plus orders that land
    // on an unpriced tier. Empty when the input is clean.
    std::vector<ValidationIssue> validateInput(const CalculationInput& input,
                                               const ClientConfiguration& config) const;

private:
    struct Resolved {
        EvaluationContext context;
        TierSelection selection;
    };

    Resolved resolve(const CalculationInput& input, const ClientConfiguration& config) const;

    CustomerCharges customerCharges(const Resolved& resolved, const ClientConfiguration& config,
                                    const RuleSet& rules) const;
    DriverPayments driverPayments(const Resolved& resolved, const ClientConfiguration& config,
                                  const RuleSet& rules) const;

    static Cents effectiveBridgeToll(const CalculationInput& input, const ClientPricingPolicy& policy);
    static bool tipReplacesBasePay(const CalculationInput& input, const ClientPricingPolicy& policy);
};

} // namespace readyset
