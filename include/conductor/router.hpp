#pragma once

#include "conductor/types.hpp"
#include "conductor/config.hpp"
#include "conductor/action.hpp"
#include "conductor/monitor.hpp"
#include "conductor/provider.hpp"
#include "conductor/selection_strategy.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace conductor {

class ProviderHealthMonitor;
class RateLimiter;

struct RouteResult {
    bool success{false};
    ProviderId provider_id;          // provider of the last attempt
    ProviderResponse response;
    ActionError error;
    Duration latency{};              // latency of the last attempt
    double cost{0.0};
    int attempts{0};
    std::vector<ProviderId> tried_providers;

    // Kind of the last provider-level error behind AllProvidersFailed
    ErrorKind last_error_kind{ErrorKind::None};

    // Some failure was transient, so a later re-dispatch may succeed
    bool retryable{false};

    // Providers that answered with a permanent error during this route
    std::vector<ProviderId> permanent_failures;
};

struct ProviderCostSummary {
    ProviderId provider_id;
    double total_cost{0.0};
    std::uint64_t requests{0};
    std::uint64_t successes{0};
    std::uint64_t failures{0};
    std::int64_t input_tokens{0};
    std::int64_t output_tokens{0};
    std::size_t in_flight{0};
};

struct AgentCostSummary {
    AgentKey agent_id;
    double total_cost{0.0};
    std::uint64_t requests{0};
    std::uint64_t successes{0};
    std::uint64_t failures{0};
    std::int64_t input_tokens{0};
    std::int64_t output_tokens{0};
};

// Selects a provider per request and drives failover.
//
// Each attempt first obtains rate-limiter admission for the provider, the
// requesting agent and the global pool, then invokes the client on a
// detached worker bounded by the request timeout. Transient errors retry
// the same provider up to max_retries and then fail over; permanent errors
// fail over at once. AllProvidersFailed means no candidate was left.
//
// A denial by the agent or global bucket ends the route with RateLimited,
// since every other provider would be refused the same way. A request
// carrying a cancelled token stops before its next attempt.
class Router {
public:
    Router(std::vector<ProviderConfig> providers,
           RouterConfig config,
           std::shared_ptr<ProviderClient> client,
           ProviderHealthMonitor& health,
           RateLimiter& limiter);

    // Non-copyable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    RouteResult route(const ProviderRequest& request);
    RouteResult route(const ProviderRequest& request, int max_retries);

    void set_strategy(std::unique_ptr<SelectionStrategy> strategy);
    std::string strategy_name() const;

    // Observability
    std::vector<ProviderConfig> providers() const;
    const ProviderConfig& provider(const ProviderId& id) const;
    std::size_t in_flight(const ProviderId& id) const;
    std::unordered_map<ProviderId, ProviderCostSummary> cost_summary() const;
    std::unordered_map<AgentKey, AgentCostSummary> agent_cost_summary() const;
    double total_cost() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct AttemptOutcome {
        bool success{false};
        ProviderResponse response;
        ActionError error;
        Duration latency{};
        double cost{0.0};
        bool shared_limit{false};    // refused by the agent or global bucket
    };

    std::vector<ProviderConfig> providers_;     // sorted by priority
    RouterConfig config_;
    std::shared_ptr<ProviderClient> client_;
    ProviderHealthMonitor& health_;
    RateLimiter& limiter_;

    mutable std::mutex mutex_;
    std::unique_ptr<SelectionStrategy> strategy_;
    std::unordered_map<ProviderId, ProviderCostSummary> counters_;
    std::unordered_map<AgentKey, AgentCostSummary> agent_counters_;
    std::shared_ptr<Monitor> monitor_;

    std::vector<ProviderCandidate> candidates_for(const ProviderRequest& request) const;
    RouteResult cancelled(RouteResult result, const ProviderRequest& request);
    AttemptOutcome attempt(const ProviderConfig& provider, const ProviderRequest& request, int attempt_no);
    void emit_event(EventType type, const std::string& message,
                    const ProviderRequest& request, const ProviderId& provider,
                    std::optional<ErrorKind> kind = std::nullopt,
                    std::optional<int> attempt_no = std::nullopt);
};

} // namespace conductor
