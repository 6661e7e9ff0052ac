// 01_basic_batch.cpp
//
// Minimal Conductor example: one batch of dependent actions, two providers.
//
// Scenario:
//   - "fetch_docs" and "fetch_tickets" have no dependencies and run
//     together in the first level.
//   - "summarize" needs both, so it waits for the second level.
//   - "publish" needs the summary and runs last.
//   - A simulated client answers every call; the coordinator reports one
//     terminal result per action and a batch summary.

#include <conductor/conductor.hpp>

#include <iostream>
#include <string>
#include <thread>

using namespace conductor;
using namespace std::chrono_literals;

// Pretends to be an upstream LLM API: sleeps a little and echoes the action.
class SimulatedClient : public ProviderClient {
public:
    ProviderResponse invoke(const ProviderConfig& provider, const ProviderRequest& request) override {
        std::this_thread::sleep_for(20ms);
        ProviderResponse response;
        response.payload = provider.name + " handled " + request.action_id;
        response.input_tokens = 400;
        response.output_tokens = 200;
        return response;
    }
};

static ProviderConfig provider(const std::string& id, int priority, double in_price, double out_price) {
    ProviderConfig p;
    p.id = id;
    p.name = id;
    p.priority = priority;
    p.model = id + "-model";
    p.pricing.model_name = p.model;
    p.pricing.input_price_per_1k = in_price;
    p.pricing.output_price_per_1k = out_price;
    p.rate_limit.requests_per_window = 120.0;
    p.rate_limit.window = 60s;
    return p;
}

static Action action(const std::string& id, std::vector<ActionId> deps = {}) {
    Action a;
    a.id = id;
    a.type = "completion";
    a.dependencies = std::move(deps);
    a.timeout = 5s;
    return a;
}

int main() {
    std::cout << "=== Conductor: Basic Batch Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Configure two providers. Lower priority value is preferred.
    // ----------------------------------------------------------------
    Config config;
    config.providers = {
        provider("primary", 0, 0.01, 0.03),
        provider("secondary", 1, 0.0005, 0.0015),
    };

    Orchestrator orchestrator(config, std::make_shared<SimulatedClient>(),
                              std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Plan the batch and show the levels.
    // ----------------------------------------------------------------
    std::vector<Action> batch = {
        action("fetch_docs"),
        action("fetch_tickets"),
        action("summarize", {"fetch_docs", "fetch_tickets"}),
        action("publish", {"summarize"}),
    };

    auto plan = orchestrator.plan(batch);
    std::cout << "\nPlan has " << plan.level_count() << " levels:\n";
    for (std::size_t i = 0; i < plan.levels.size(); ++i) {
        std::cout << "  Level " << i << ":";
        for (const auto& a : plan.levels[i]) {
            std::cout << " " << a.id;
        }
        std::cout << "\n";
    }
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 3. Run it.
    // ----------------------------------------------------------------
    auto summary = orchestrator.run(plan);

    std::cout << "\n=== Results ===\n";
    for (const auto& r : summary.results) {
        std::cout << "  " << r.action_id << ": "
                  << (r.success ? "OK" : to_string(r.error.kind))
                  << " via " << r.provider_id
                  << " ($" << r.cost << ")\n";
    }
    std::cout << "Succeeded " << summary.successful << " / " << summary.total_actions
              << ", total cost $" << summary.total_cost << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
