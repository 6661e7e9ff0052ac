// 02_budget_guardrails.cpp
//
// Budget guardrails on a request chain.
//
// Scenario:
//   - A research chain of eight sequential steps shares one $0.50 budget.
//   - Each step costs roughly $0.09 on the primary provider.
//   - As spend crosses 80% the guardrail warns, past 90% it attaches
//     degradation advice (cheaper model, smaller context) to the request,
//     and once the limit is reached further steps are not dispatched.

#include <conductor/conductor.hpp>

#include <iostream>
#include <string>

using namespace conductor;
using namespace std::chrono_literals;

// Reports the advice it receives so the degradation step is visible.
class AdviceAwareClient : public ProviderClient {
public:
    ProviderResponse invoke(const ProviderConfig& provider, const ProviderRequest& request) override {
        ProviderResponse response;
        response.input_tokens = 3000;
        response.output_tokens = 2000;
        response.model = request.fallback_model.value_or(provider.model);
        response.payload = request.action_id + " answered by " + response.model;
        if (request.max_context_tokens.has_value()) {
            response.payload += " (context capped at " +
                                std::to_string(request.max_context_tokens.value()) + ")";
        }
        return response;
    }
};

int main() {
    std::cout << "=== Conductor: Budget Guardrails Example ===\n\n";

    Config config;
    ProviderConfig primary;
    primary.id = "primary";
    primary.name = "Primary";
    primary.model = "gpt-4";
    primary.pricing.model_name = "gpt-4";
    primary.pricing.input_price_per_1k = 0.01;
    primary.pricing.output_price_per_1k = 0.03;
    config.providers = {primary};

    config.guardrail.budget_limit_usd = 0.50;
    config.guardrail.fallback_model = "gpt-3.5-turbo";
    config.guardrail.default_max_context_tokens = 8000;

    auto metrics = std::make_shared<MetricsMonitor>();
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
    composite->add_monitor(metrics);

    Orchestrator orchestrator(config, std::make_shared<AdviceAwareClient>(), composite);

    // ----------------------------------------------------------------
    // 1. Build a sequential chain; each step depends on the previous.
    // ----------------------------------------------------------------
    std::vector<Action> chain;
    for (int i = 0; i < 8; ++i) {
        Action a;
        a.id = "step-" + std::to_string(i);
        a.type = "research";
        a.model = "gpt-4";
        a.estimate.input_tokens = 3000;
        a.estimate.output_tokens = 2000;
        if (i > 0) {
            a.dependencies.push_back("step-" + std::to_string(i - 1));
        }
        chain.push_back(a);
    }

    // ----------------------------------------------------------------
    // 2. Run it against one ledger.
    // ----------------------------------------------------------------
    auto ledger = orchestrator.create_ledger();
    auto summary = orchestrator.execute(chain, ledger.get());

    std::cout << "\n=== Steps ===\n";
    for (const auto& r : summary.results) {
        if (r.success) {
            std::cout << "  " << r.action_id << ": $" << r.cost << "  " << r.payload << "\n";
        } else {
            std::cout << "  " << r.action_id << ": " << to_string(r.error.kind)
                      << "  " << r.error.message << "\n";
        }
    }

    // ----------------------------------------------------------------
    // 3. Inspect the ledger.
    // ----------------------------------------------------------------
    auto state = ledger->snapshot();
    auto status = orchestrator.cost_tracker().check_budget_status(state);
    std::cout << "\n=== Ledger ===\n";
    std::cout << "Spent $" << state.total_cost_usd << " of $" << state.budget_limit_usd
              << " (" << status.budget_usage * 100.0 << "%)\n";
    std::cout << "Tokens: " << state.total_tokens << "\n";
    for (const auto& [model, cost] : state.model_costs) {
        std::cout << "  " << model << ": $" << cost << "\n";
    }
    std::cout << "Guardrail now says: " << to_string(ledger->current_action()) << "\n";

    auto err = ledger->exceeded_error();
    if (state.budget_exceeded) {
        std::cout << err.message << "\n" << err.suggestion << "\n";
    }

    auto m = metrics->get_metrics();
    std::cout << "\nWarnings: " << m.budget_warnings << ", halts: " << m.budget_halts << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
