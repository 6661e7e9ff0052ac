#include "conductor/selection_strategy.hpp"

#include <algorithm>

namespace conductor {

namespace {

// Move candidates[index] to the front, keep the rest in priority order
std::vector<ProviderCandidate> promote(const std::vector<ProviderCandidate>& candidates,
                                       std::size_t index) {
    std::vector<ProviderCandidate> result;
    result.reserve(candidates.size());
    result.push_back(candidates[index]);
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (i != index) {
            result.push_back(candidates[i]);
        }
    }
    return result;
}

} // anonymous namespace

// ========== HealthBasedStrategy ==========

std::vector<ProviderCandidate> HealthBasedStrategy::order(
    const std::vector<ProviderCandidate>& candidates) const
{
    auto result = candidates;
    std::stable_partition(result.begin(), result.end(),
        [](const ProviderCandidate& c) { return c.status == HealthStatus::Healthy; });
    return result;
}

// ========== RoundRobinStrategy ==========

std::vector<ProviderCandidate> RoundRobinStrategy::order(
    const std::vector<ProviderCandidate>& candidates) const
{
    if (candidates.empty()) return {};
    std::size_t index = next_.fetch_add(1) % candidates.size();
    return promote(candidates, index);
}

// ========== LeastConnectionsStrategy ==========

std::vector<ProviderCandidate> LeastConnectionsStrategy::order(
    const std::vector<ProviderCandidate>& candidates) const
{
    if (candidates.empty()) return {};
    auto it = std::min_element(candidates.begin(), candidates.end(),
        [](const ProviderCandidate& a, const ProviderCandidate& b) {
            return a.in_flight < b.in_flight;
        });
    return promote(candidates, static_cast<std::size_t>(it - candidates.begin()));
}

std::unique_ptr<SelectionStrategy> make_strategy(RoutingStrategy strategy) {
    switch (strategy) {
        case RoutingStrategy::RoundRobin:
            return std::make_unique<RoundRobinStrategy>();
        case RoutingStrategy::LeastConnections:
            return std::make_unique<LeastConnectionsStrategy>();
        case RoutingStrategy::HealthBased:
            break;
    }
    return std::make_unique<HealthBasedStrategy>();
}

} // namespace conductor
