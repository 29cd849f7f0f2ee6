#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "client_policy.h"
#include "logger.h"
#include "pricing_engine.h"
#include "request_codec.h"

namespace readyset {

// Dispatches one JSON request to the handler registered for its view and
// wraps the result in the response envelope. Never throws.
class RequestRouter {
public:
    using RequestHandler = std::function<nlohmann::json(const PricingRequest&, const ClientConfiguration&)>;

    RequestRouter(const PolicyRegistry& registry, Logger& logger);
    // handlers are bound to this instance
    RequestRouter(const RequestRouter&) = delete;
    RequestRouter& operator=(const RequestRouter&) = delete;

    void registerHandler(const std::string& view, RequestHandler handler);
    bool hasView(const std::string& view) const;
    std::vector<std::string> views() const;

    nlohmann::json handleLine(const std::string& line);
    nlohmann::json handle(const nlohmann::json& request, const std::string& fallback_trace_id);

private:
    void registerDefaultHandlers();

    nlohmann::json deliveryCostHandler(const PricingRequest& request, const ClientConfiguration& config) const;
    nlohmann::json driverPayHandler(const PricingRequest& request, const ClientConfiguration& config) const;
    nlohmann::json calculateHandler(const PricingRequest& request, const ClientConfiguration& config) const;
    nlohmann::json mileageHandler(const PricingRequest& request, const ClientConfiguration& config) const;
    nlohmann::json vendorPayHandler(const PricingRequest& request, const ClientConfiguration& config) const;
    nlohmann::json validateHandler(const PricingRequest& request, const ClientConfiguration& config) const;
    nlohmann::json clientsHandler(const PricingRequest& request, const ClientConfiguration& config) const;

private:
    const PolicyRegistry& registry_;
    Logger& logger_;
    CalculationEngine engine_;

    std::map<std::string, RequestHandler> handlers_;
};

} // namespace readyset
