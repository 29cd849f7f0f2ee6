#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "client_policy.h"
#include "logger.h"

namespace readyset {

// Service settings from the environment.
struct ServiceConfig {
    std::string pricing_config_path;   // PRICING_CONFIG, empty -> built-in clients
    std::string default_client_id;     // DEFAULT_CLIENT_ID
    LogLevel log_level;                // LOG_LEVEL

    ServiceConfig();
};

// Parses {"clients": [...]}. Throws ConfigurationError on any malformed or
// inconsistent entry; nothing is returned partially.
std::vector<ClientConfigurationPtr> loadClientConfigurations(const nlohmann::json& document);
std::vector<ClientConfigurationPtr> loadClientConfigurationsFromFile(const std::string& path);

ClientConfigurationPtr clientConfigurationFromJson(const nlohmann::json& j);

nlohmann::json toJson(const ClientPricingPolicy& policy);
nlohmann::json toJson(const Tier& tier);
nlohmann::json toJson(const PricingRule& rule);
nlohmann::json toJson(const ClientConfiguration& config);
nlohmann::json clientConfigurationsToJson(const std::vector<ClientConfigurationPtr>& clients);

} // namespace readyset
