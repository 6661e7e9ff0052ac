// 03_provider_failover.cpp
//
// Health-aware routing and failover.
//
// Scenario:
//   - Three providers: "fast" is preferred but starts returning HTTP 503,
//     "steady" answers slowly but reliably, and "strict" rejects every
//     call with HTTP 401.
//   - The router fails over to the next provider once a provider's
//     transient retries run out.
//   - A failing provider crosses the error-rate threshold, the health
//     monitor marks it Unhealthy and the router stops sending it traffic.
//   - The orchestrator's built-in probe sends a small request through the
//     client, notices when "fast" comes back and returns it to rotation.

#include <conductor/conductor.hpp>

#include <atomic>
#include <iostream>
#include <string>
#include <thread>

using namespace conductor;
using namespace std::chrono_literals;

class FlakyClient : public ProviderClient {
public:
    std::atomic<bool> fast_up{true};

    ProviderResponse invoke(const ProviderConfig& provider, const ProviderRequest& request) override {
        if (provider.id == "strict") {
            throw ProviderError("401 Unauthorized", 401);
        }
        if (provider.id == "fast" && !fast_up.load()) {
            throw ProviderError("503 Service Unavailable", 503);
        }
        std::this_thread::sleep_for(provider.id == "steady" ? 40ms : 5ms);

        ProviderResponse response;
        response.payload = request.action_id + "@" + provider.id;
        response.input_tokens = 200;
        response.output_tokens = 100;
        return response;
    }
};

static ProviderConfig provider(const std::string& id, int priority) {
    ProviderConfig p;
    p.id = id;
    p.name = id;
    p.priority = priority;
    p.model = id + "-model";
    p.rate_limit.requests_per_window = 100.0;
    p.rate_limit.window = 1s;
    p.thresholds.health_check_interval = 100ms;
    return p;
}

static Action chat(const std::string& id) {
    Action a;
    a.id = id;
    a.type = "chat";
    return a;
}

static void print_health(Orchestrator& orchestrator) {
    for (const auto& [id, metrics] : orchestrator.health().health_summary()) {
        std::cout << "  " << id << ": " << to_string(metrics.effective_status())
                  << " (success " << metrics.success_rate * 100.0 << "%, "
                  << metrics.consecutive_failures << " consecutive failures)\n";
    }
}

int main() {
    std::cout << "=== Conductor: Provider Failover Example ===\n\n";

    Config config;
    config.providers = {provider("strict", 0), provider("fast", 1), provider("steady", 2)};
    config.router.max_retries = 0;
    config.health.window_size = 5;
    config.health.enable_periodic_checks = true;
    config.health.check_interval = 50ms;
    config.coordinator.default_base_delay = 10ms;

    auto client = std::make_shared<FlakyClient>();
    Orchestrator orchestrator(config, client,
                              std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

    // ----------------------------------------------------------------
    // 1. Everything up except "strict": permanent errors fail over at once.
    // ----------------------------------------------------------------
    std::cout << "--- Round 1: strict rejects, fast serves ---\n";
    auto r1 = orchestrator.execute({chat("q1"), chat("q2")});
    for (const auto& r : r1.results) {
        std::cout << "  " << r.action_id << " -> " << r.provider_id << "\n";
    }
    print_health(orchestrator);

    // ----------------------------------------------------------------
    // 2. "fast" goes down; its 503s fail over to "steady".
    // ----------------------------------------------------------------
    std::cout << "\n--- Round 2: fast returns 503 ---\n";
    client->fast_up = false;
    std::vector<Action> burst;
    for (int i = 0; i < 6; ++i) {
        burst.push_back(chat("burst-" + std::to_string(i)));
    }
    auto r2 = orchestrator.execute(burst);
    for (const auto& r : r2.results) {
        std::cout << "  " << r.action_id << " -> " << r.provider_id
                  << " after " << r.attempt << " attempt(s)\n";
    }
    print_health(orchestrator);

    // ----------------------------------------------------------------
    // 3. "fast" recovers; background health checks bring it back.
    // ----------------------------------------------------------------
    std::cout << "\n--- Round 3: fast recovers ---\n";
    client->fast_up = true;
    orchestrator.start();
    std::this_thread::sleep_for(800ms);
    print_health(orchestrator);

    auto r3 = orchestrator.execute({chat("q3")});
    std::cout << "  q3 -> " << r3.results.front().provider_id << "\n";

    orchestrator.stop();

    // ----------------------------------------------------------------
    // 4. Per-provider cost summary.
    // ----------------------------------------------------------------
    std::cout << "\n=== Provider costs ===\n";
    for (const auto& [id, c] : orchestrator.router().cost_summary()) {
        std::cout << "  " << id << ": " << c.requests << " requests, "
                  << c.failures << " failures, $" << c.total_cost << "\n";
    }

    std::cout << "\n=== Done ===\n";
    return 0;
}
