#pragma once

#include "conductor/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace conductor {

struct RetryPolicy {
    int max_attempts = 3;
    BackoffShape backoff = BackoffShape::Exponential;
    Duration base_delay = std::chrono::milliseconds(100);
    Duration max_delay = std::chrono::seconds(5);

    // Delay before the attempt following `attempt` (1-based).
    Duration delay_after(int attempt) const;
};

// Token estimate used for the projected budget check
struct CostEstimate {
    std::int64_t input_tokens{0};
    std::int64_t output_tokens{0};
};

// A unit of dispatchable work handed over by the planner. Read-only to the core.
struct Action {
    ActionId id;
    std::string type;
    ParameterMap parameters;
    std::vector<ActionId> dependencies;

    // Unset = the coordinator's defaults
    std::optional<RetryPolicy> retry;
    std::optional<Duration> timeout;

    // Rate-limit key; the action type is used when empty
    AgentKey agent_id;
    RequestPriority priority{RequestPriority::Medium};

    // Model the estimate is priced against; empty = provider default
    std::string model;
    CostEstimate estimate;
};

struct ActionError {
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

struct ActionResult {
    ActionId action_id;
    bool success{false};
    std::string payload;
    ActionError error;
    Duration latency{};
    ProviderId provider_id;
    double cost{0.0};
    int attempt{0};
    std::int64_t input_tokens{0};
    std::int64_t output_tokens{0};
};

// Levels of actions; each level only depends on earlier levels.
struct ExecutionPlan {
    std::vector<std::vector<Action>> levels;
    std::size_t total_actions{0};
    Duration estimated_time{};

    std::size_t level_count() const noexcept { return levels.size(); }
};

struct ExecutionSummary {
    std::size_t total_actions{0};
    std::size_t successful{0};
    std::size_t failed{0};
    double success_rate{0.0};
    Duration total_latency{};
    Duration average_latency{};
    double total_cost{0.0};
    bool cancelled{false};

    // Authoritative (last) result per action
    std::vector<ActionResult> results;
    std::vector<ActionError> errors;

    // Every attempt, keyed by action id, in attempt order
    std::unordered_map<ActionId, std::vector<ActionResult>> attempts;

    const ActionResult* find(const ActionId& id) const;
};

} // namespace conductor
