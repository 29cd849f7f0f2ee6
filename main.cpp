#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "client_policy.h"
#include "config_loader.h"
#include "errors.h"
#include "logger.h"
#include "request_router.h"

using json = nlohmann::json;
using namespace readyset;

namespace {

void printUsage(const char* program) {
    std::cerr << "usage: " << program << " [requests.jsonl | --export-config]" << std::endl
              << "  Reads one JSON request per line (stdin when no file is given) and" << std::endl
              << "  writes one JSON response per line to stdout." << std::endl
              << "  PRICING_CONFIG, DEFAULT_CLIENT_ID and LOG_LEVEL are read from the environment." << std::endl;
}

int serve(std::istream& in, RequestRouter& router) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        std::cout << router.handleLine(line).dump() << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    ServiceConfig config;
    Logger logger(config.log_level);

    const std::string argument = argc > 1 ? argv[1] : "";
    if (argument == "-h" || argument == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    std::unique_ptr<PolicyRegistry> registry;
    try {
        std::vector<ClientConfigurationPtr> clients = config.pricing_config_path.empty()
                                                          ? builtin::all()
                                                          : loadClientConfigurationsFromFile(config.pricing_config_path);
        registry = std::make_unique<PolicyRegistry>(std::move(clients), config.default_client_id);
    } catch (const ConfigurationError& e) {
        logger.error("Failed to load pricing configuration", "",
                     {{"path", config.pricing_config_path}, {"reason", e.what()}});
        return 1;
    }

    if (argument == "--export-config") {
        std::vector<ClientConfigurationPtr> clients;
        for (const auto& entry : registry->snapshot()->clients) {
            clients.push_back(entry.second);
        }
        std::cout << clientConfigurationsToJson(clients).dump(2) << std::endl;
        return 0;
    }

    logger.info("Pricing core started", "", {
        {"clients", registry->snapshot()->clients.size()},
        {"defaultClientId", registry->defaultClientId()},
        {"config", config.pricing_config_path.empty() ? "built-in" : config.pricing_config_path}
    });

    RequestRouter router(*registry, logger);

    if (argument.empty() || argument == "-") {
        return serve(std::cin, router);
    }

    std::ifstream file(argument);
    if (!file) {
        logger.error("Cannot open request file", "", {{"path", argument}});
        return 1;
    }
    return serve(file, router);
}
