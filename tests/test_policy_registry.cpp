#include <atomic>
#include <cassert>
#include <thread>
#include <vector>

#include "client_policy.h"
#include "errors.h"
#include "pricing_engine.h"

using namespace readyset;

template <typename F>
static bool rejects(F build) {
    try {
        build();
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

static ClientConfigurationPtr inactive(const ClientConfiguration& base) {
    ClientPricingPolicy policy = base.policy();
    policy.client_id = "retired-client";
    policy.active = false;
    return std::make_shared<const ClientConfiguration>(policy, base.tiers());
}

int main() {
    PolicyRegistry registry(builtin::all(), builtin::kReadySetFoodStandard);

    // lookup
    assert(registry.defaultClientId() == "ready-set-food-standard");
    assert(registry.resolve("cater-valley")->id() == "cater-valley");
    assert(registry.resolve("kasa")->id() == "kasa");
    assert(registry.resolve("try-hungry")->id() == "try-hungry");
    assert(registry.resolve("hy-food-company-direct")->id() == "hy-food-company-direct");
    assert(registry.contains("cater-valley"));
    assert(!registry.contains("nobody"));

    // unknown and empty ids fall back to the default client
    assert(registry.resolve("nobody")->id() == "ready-set-food-standard");
    assert(registry.resolve("")->id() == "ready-set-food-standard");

    assert(registry.activeClients().size() == 5);

    // inactive clients resolve but are not listed
    {
        std::vector<ClientConfigurationPtr> clients = builtin::all();
        clients.push_back(inactive(*clients.front()));
        PolicyRegistry with_retired(clients, builtin::kReadySetFoodStandard);
        assert(with_retired.contains("retired-client"));
        assert(with_retired.activeClients().size() == 5);
    }

    // construction errors
    assert(rejects([] { PolicyRegistry r(builtin::all(), "nobody"); }));
    assert(rejects([] {
        std::vector<ClientConfigurationPtr> twice = {builtin::kasa(), builtin::kasa()};
        PolicyRegistry r(twice, builtin::kKasa);
    }));
    assert(rejects([] {
        std::vector<ClientConfigurationPtr> holes = {builtin::kasa(), nullptr};
        PolicyRegistry r(holes, builtin::kKasa);
    }));

    // reload publishes a new snapshot; holders of the old one are unaffected
    {
        auto before = registry.snapshot();
        ClientConfigurationPtr held = registry.resolve("kasa");

        registry.reload({builtin::caterValley()}, builtin::kCaterValley);

        assert(before->clients.size() == 5);
        assert(before->default_client_id == "ready-set-food-standard");
        assert(held->id() == "kasa");
        assert(registry.snapshot() != before);
        assert(registry.defaultClientId() == "cater-valley");
        assert(registry.resolve("kasa")->id() == "cater-valley");
    }

    // a failed reload leaves the current snapshot in place
    {
        auto current = registry.snapshot();
        assert(rejects([&] { registry.reload({builtin::kasa()}, "missing-default"); }));
        assert(registry.snapshot() == current);
        assert(registry.defaultClientId() == "cater-valley");
    }

    // readers price concurrently while the registry is reloaded
    {
        PolicyRegistry shared(builtin::all(), builtin::kCaterValley);
        const CalculationEngine engine;
        CalculationInput input;
        input.headcount = 35;
        input.food_cost_cents = 45000;
        input.total_mileage = 12;

        std::atomic<bool> mismatch(false);
        std::vector<std::thread> readers;
        for (int t = 0; t < 4; ++t) {
            readers.emplace_back([&] {
                for (int i = 0; i < 500; ++i) {
                    ClientConfigurationPtr config = shared.resolve(builtin::kCaterValley);
                    if (engine.calculateDeliveryCost(input, *config).delivery_fee != 9600) {
                        mismatch = true;
                    }
                }
            });
        }
        for (int i = 0; i < 50; ++i) {
            shared.reload(builtin::all(), builtin::kCaterValley);
        }
        for (auto& reader : readers) {
            reader.join();
        }
        assert(!mismatch);
    }

    return 0;
}
