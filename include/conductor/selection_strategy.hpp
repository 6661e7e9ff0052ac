#pragma once

#include "conductor/types.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace conductor {

// Router's view of one eligible provider
struct ProviderCandidate {
    ProviderId id;
    int priority{0};
    HealthStatus status{HealthStatus::Healthy};
    std::size_t in_flight{0};
};

// Abstract provider selection strategy.
class SelectionStrategy {
public:
    virtual ~SelectionStrategy() = default;

    // Given candidates sorted by priority ascending (none Unhealthy), return
    // the order to attempt them in. The first entry is the strategy's pick.
    virtual std::vector<ProviderCandidate> order(
        const std::vector<ProviderCandidate>& candidates) const = 0;

    virtual std::string name() const = 0;
};

// Highest-priority Healthy provider; Degraded ones only when none is Healthy
class HealthBasedStrategy : public SelectionStrategy {
public:
    std::vector<ProviderCandidate> order(
        const std::vector<ProviderCandidate>& candidates) const override;
    std::string name() const override { return "HealthBased"; }
};

// Rotates the first pick among candidates
class RoundRobinStrategy : public SelectionStrategy {
public:
    std::vector<ProviderCandidate> order(
        const std::vector<ProviderCandidate>& candidates) const override;
    std::string name() const override { return "RoundRobin"; }

private:
    mutable std::atomic<std::size_t> next_{0};
};

// Candidate with the fewest in-flight requests (ties: priority)
class LeastConnectionsStrategy : public SelectionStrategy {
public:
    std::vector<ProviderCandidate> order(
        const std::vector<ProviderCandidate>& candidates) const override;
    std::string name() const override { return "LeastConnections"; }
};

std::unique_ptr<SelectionStrategy> make_strategy(RoutingStrategy strategy);

} // namespace conductor
