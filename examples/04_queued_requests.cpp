// 04_queued_requests.cpp
//
// Per-agent rate limiting with a priority queue in front.
//
// Scenario:
//   - Three agents share a provider. Each agent may make 2 requests per
//     second; the whole process may make 5.
//   - Requests are submitted faster than that. The queue holds them and
//     the background processor releases them as tokens refill, serving
//     High priority requests first.

#include <conductor/conductor.hpp>

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

using namespace conductor;
using namespace std::chrono_literals;

class EchoClient : public ProviderClient {
public:
    ProviderResponse invoke(const ProviderConfig& provider, const ProviderRequest& request) override {
        ProviderResponse response;
        auto prompt = request.parameters.find("prompt");
        response.payload = provider.id + ": " +
                           (prompt != request.parameters.end() ? prompt->second : "");
        response.input_tokens = 50;
        response.output_tokens = 50;
        return response;
    }
};

int main() {
    std::cout << "=== Conductor: Queued Requests Example ===\n\n";

    Config config;
    ProviderConfig shared;
    shared.id = "shared";
    shared.name = "Shared API";
    shared.model = "shared-model";
    shared.rate_limit.requests_per_window = 100.0;
    shared.rate_limit.window = 1s;
    config.providers = {shared};

    config.agent_rate_limit.requests_per_window = 2.0;
    config.agent_rate_limit.window = 1s;
    config.global_rate_limit.requests_per_window = 5.0;
    config.global_rate_limit.window = 1s;
    config.queue.type = QueueType::Priority;

    Orchestrator orchestrator(config, std::make_shared<EchoClient>(),
                              std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Quiet));

    std::mutex out_mutex;
    std::atomic<int> done{0};
    auto start = Clock::now();

    auto on_response = [&](RequestId id, const RouteResult& result) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << "  [" << elapsed.count() << "ms] request " << id << ": "
                  << (result.success ? result.response.payload : result.error.message) << "\n";
        done++;
    };

    // ----------------------------------------------------------------
    // 1. Submit 12 requests across three agents before starting.
    // ----------------------------------------------------------------
    const char* agents[] = {"planner", "researcher", "writer"};
    int submitted = 0;
    for (int round = 0; round < 4; ++round) {
        for (const char* agent : agents) {
            QueuedRequest r;
            r.agent_id = agent;
            r.priority = (round == 3) ? RequestPriority::High : RequestPriority::Medium;
            r.payload["prompt"] = std::string(agent) + " round " + std::to_string(round);
            orchestrator.submit(std::move(r), on_response);
            submitted++;
        }
    }
    std::cout << "Submitted " << submitted << " requests; pending "
              << orchestrator.pending_request_count() << "\n\n";

    // ----------------------------------------------------------------
    // 2. Start processing and wait for every response.
    // ----------------------------------------------------------------
    orchestrator.start();
    while (done.load() < submitted && Clock::now() - start < 30s) {
        std::this_thread::sleep_for(50ms);
    }
    orchestrator.stop();

    auto snap = orchestrator.snapshot();
    std::cout << "\nPending after stop: " << snap.pending_requests
              << ", global tokens left: " << snap.global_tokens_remaining << "\n";

    auto stats = orchestrator.rate_limiter().stats();
    std::cout << "Rate limiter admitted " << stats.admitted << ", denied " << stats.denied << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
