#include "request_router.h"

#include <exception>
#include <utility>

using json = nlohmann::json;

namespace readyset {

RequestRouter::RequestRouter(const PolicyRegistry& registry, Logger& logger)
    : registry_(registry), logger_(logger) {
    registerDefaultHandlers();
}

void RequestRouter::registerDefaultHandlers() {
    using namespace std::placeholders;
    registerHandler("delivery-cost", std::bind(&RequestRouter::deliveryCostHandler, this, _1, _2));
    registerHandler("driver-pay", std::bind(&RequestRouter::driverPayHandler, this, _1, _2));
    registerHandler("calculate", std::bind(&RequestRouter::calculateHandler, this, _1, _2));
    registerHandler("mileage", std::bind(&RequestRouter::mileageHandler, this, _1, _2));
    registerHandler("vendor-pay", std::bind(&RequestRouter::vendorPayHandler, this, _1, _2));
    registerHandler("validate", std::bind(&RequestRouter::validateHandler, this, _1, _2));
    registerHandler("clients", std::bind(&RequestRouter::clientsHandler, this, _1, _2));
}

void RequestRouter::registerHandler(const std::string& view, RequestHandler handler) {
    handlers_[view] = std::move(handler);
}

bool RequestRouter::hasView(const std::string& view) const {
    return handlers_.find(view) != handlers_.end();
}

std::vector<std::string> RequestRouter::views() const {
    std::vector<std::string> names;
    for (const auto& entry : handlers_) {
        names.push_back(entry.first);
    }
    return names;
}

json RequestRouter::handleLine(const std::string& line) {
    const std::string trace_id = generateTraceId();
    try {
        return handle(json::parse(line), trace_id);
    } catch (const json::parse_error& e) {
        logger_.warn("Rejected request", trace_id, {{"reason", e.what()}});
        return makeErrorResponse("JSON_PARSE_ERROR", "Invalid JSON format", trace_id);
    }
}

json RequestRouter::handle(const json& body, const std::string& fallback_trace_id) {
    PricingRequest request;
    std::string error;
    if (!request.fromJson(body, error)) {
        const std::string trace_id = request.trace_id.empty() ? fallback_trace_id : request.trace_id;
        logger_.warn("Rejected request", trace_id, {{"reason", error}});
        return makeErrorResponse("INVALID_REQUEST", error, trace_id);
    }
    if (request.trace_id.empty()) {
        request.trace_id = fallback_trace_id;
    }
    const std::string& trace_id = request.trace_id;

    auto handler = handlers_.find(request.view);
    if (handler == handlers_.end()) {
        logger_.warn("Unknown view", trace_id, {{"view", request.view}});
        return makeErrorResponse("UNKNOWN_VIEW", "Unknown view '" + request.view + "'", trace_id);
    }

    // Held for the whole request; a concurrent reload cannot change it.
    ClientConfigurationPtr config = registry_.resolve(request.client_id);
    if (!request.client_id.empty() && request.client_id != config->id()) {
        logger_.warn("Unknown client, using default", trace_id,
                     {{"clientId", request.client_id}, {"resolvedClientId", config->id()}});
    }
    logger_.info("Request: " + request.view, trace_id, {{"clientId", config->id()}});

    try {
        json data = handler->second(request, *config);
        logger_.debug("Request completed", trace_id, {{"view", request.view}, {"data", data}});
        return makeSuccessResponse(data, trace_id);
    } catch (const json::exception& e) {
        logger_.warn("Invalid request input", trace_id, {{"view", request.view}, {"reason", e.what()}});
        return makeErrorResponse("INVALID_REQUEST", e.what(), trace_id);
    } catch (const std::exception& e) {
        logger_.error("Request failed", trace_id, {{"view", request.view}, {"reason", e.what()}});
        return makeErrorResponse("INTERNAL_ERROR", e.what(), trace_id);
    }
}

json RequestRouter::deliveryCostHandler(const PricingRequest& request, const ClientConfiguration& config) const {
    const CalculationInput input = inputFromJson(request.input);
    json data = toJson(engine_.calculateDeliveryCost(input, config));
    data["clientId"] = config.id();
    return data;
}

json RequestRouter::driverPayHandler(const PricingRequest& request, const ClientConfiguration& config) const {
    const CalculationInput input = inputFromJson(request.input);
    json data = toJson(engine_.calculateDriverPay(input, config));
    data["clientId"] = config.id();
    return data;
}

json RequestRouter::calculateHandler(const PricingRequest& request, const ClientConfiguration& config) const {
    const CalculationInput input = inputFromJson(request.input);
    CalculationResult result = engine_.calculate(input, config);
    logger_.info("Calculation completed", request.trace_id,
                 {{"input", toJson(input)},
                  {"customerTotal", centsToDollars(result.customer_charges.total)},
                  {"driverTotal", centsToDollars(result.driver_payments.total)},
                  {"profit", centsToDollars(result.profit)}});
    json data = toJson(result);
    data["clientId"] = config.id();
    return data;
}

json RequestRouter::mileageHandler(const PricingRequest& request, const ClientConfiguration& config) const {
    const double miles = request.input.at("totalMileage").get<double>();
    return {
        {"clientId", config.id()},
        {"totalMileage", miles},
        {"mileageThreshold", config.policy().mileage_threshold_miles},
        {"mileageRate", centsToDollars(config.policy().customer_mileage_rate_cents_per_mile)},
        {"mileagePay", centsToDollars(engine_.calculateMileagePay(miles, config))}
    };
}

json RequestRouter::vendorPayHandler(const PricingRequest& request, const ClientConfiguration& config) const {
    const CalculationInput input = inputFromJson(request.input);
    return {
        {"clientId", config.id()},
        {"vendorPay", centsToDollars(engine_.calculateVendorPay(input, config))}
    };
}

json RequestRouter::validateHandler(const PricingRequest& request, const ClientConfiguration& config) const {
    const CalculationInput input = inputFromJson(request.input);
    json data = toJson(engine_.validateInput(input, config));
    data["clientId"] = config.id();
    return data;
}

json RequestRouter::clientsHandler(const PricingRequest&, const ClientConfiguration&) const {
    const std::string default_id = registry_.defaultClientId();
    json list = json::array();
    for (const auto& client : registry_.activeClients()) {
        list.push_back(clientSummaryJson(*client, client->id() == default_id));
    }
    return {{"clients", list}};
}

} // namespace readyset
