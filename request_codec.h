#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "client_policy.h"
#include "pricing_engine.h"
#include "pricing_types.h"

namespace readyset {

// One line of the request stream:
// {"view": "...", "clientId": "...", "traceId": "...", "input": {...}}
struct PricingRequest {
    std::string view;
    std::string client_id;      // empty -> default client
    std::string trace_id;       // empty -> generated by the router
    nlohmann::json input;

    bool fromJson(const nlohmann::json& j, std::string& error);
};

// Money arrives in dollars and is converted to cents here. Out-of-range
// numbers are carried through for sanitizeInput()/validateInput(); only
// missing or mistyped fields throw (nlohmann::json::exception).
CalculationInput inputFromJson(const nlohmann::json& j);

nlohmann::json toJson(const CalculationInput& input);
nlohmann::json toJson(const CustomerCharges& charges);
nlohmann::json toJson(const DriverPayments& payments);
nlohmann::json toJson(const CalculationResult& result);
nlohmann::json toJson(const DeliveryCostBreakdown& breakdown);
nlohmann::json toJson(const DriverPayBreakdown& breakdown);
nlohmann::json toJson(const std::vector<ValidationIssue>& issues);
nlohmann::json clientSummaryJson(const ClientConfiguration& config, bool is_default);

nlohmann::json makeSuccessResponse(const nlohmann::json& data, const std::string& trace_id);
nlohmann::json makeErrorResponse(const std::string& code, const std::string& message,
                                 const std::string& trace_id);

} // namespace readyset
