#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace conductor {

// Identifiers
using ActionId = std::string;
using ProviderId = std::string;
using AgentKey = std::string;
using RequestId = std::uint64_t;

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Parameter bag carried by actions and provider requests
using ParameterMap = std::unordered_map<std::string, std::string>;

// Provider health status
enum class HealthStatus {
    Healthy,
    Degraded,
    Unhealthy
};

// Budget guardrail decision (monotonic staircase)
enum class GuardrailAction {
    Continue,
    Warn,
    Degrade,
    Halt
};

// Failure taxonomy for action and route outcomes
enum class ErrorKind {
    None,
    CyclicDependency,
    Timeout,
    RateLimited,
    TransientProviderError,
    PermanentProviderError,
    AllProvidersFailed,
    BudgetExceeded,
    SkippedDueToUpstreamFailure,
    Cancelled
};

// Provider selection strategy
enum class RoutingStrategy {
    HealthBased,
    RoundRobin,
    LeastConnections
};

// Request queue ordering
enum class QueueType {
    Fifo,
    Priority
};

// Request priority (higher value = served first)
enum class RequestPriority {
    Low = 1,
    Medium = 2,
    High = 3
};

// Retry backoff shape
enum class BackoffShape {
    Linear,
    Exponential
};

// Per-action execution state
enum class ActionState {
    Pending,
    Dispatched,
    Retrying,
    Succeeded,
    Failed,
    Skipped,
    Cancelled
};

// Transient failures are retried; everything else is terminal.
inline bool is_transient(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Timeout:
        case ErrorKind::RateLimited:
        case ErrorKind::TransientProviderError:
            return true;
        default:
            return false;
    }
}

inline double to_seconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

inline const char* to_string(HealthStatus s) {
    switch (s) {
        case HealthStatus::Healthy:   return "Healthy";
        case HealthStatus::Degraded:  return "Degraded";
        case HealthStatus::Unhealthy: return "Unhealthy";
    }
    return "Unknown";
}

inline const char* to_string(GuardrailAction a) {
    switch (a) {
        case GuardrailAction::Continue: return "Continue";
        case GuardrailAction::Warn:     return "Warn";
        case GuardrailAction::Degrade:  return "Degrade";
        case GuardrailAction::Halt:     return "Halt";
    }
    return "Unknown";
}

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:                        return "None";
        case ErrorKind::CyclicDependency:            return "CyclicDependency";
        case ErrorKind::Timeout:                     return "Timeout";
        case ErrorKind::RateLimited:                 return "RateLimited";
        case ErrorKind::TransientProviderError:      return "TransientProviderError";
        case ErrorKind::PermanentProviderError:      return "PermanentProviderError";
        case ErrorKind::AllProvidersFailed:          return "AllProvidersFailed";
        case ErrorKind::BudgetExceeded:              return "BudgetExceeded";
        case ErrorKind::SkippedDueToUpstreamFailure: return "SkippedDueToUpstreamFailure";
        case ErrorKind::Cancelled:                   return "Cancelled";
    }
    return "Unknown";
}

inline const char* to_string(RoutingStrategy s) {
    switch (s) {
        case RoutingStrategy::HealthBased:      return "HealthBased";
        case RoutingStrategy::RoundRobin:       return "RoundRobin";
        case RoutingStrategy::LeastConnections: return "LeastConnections";
    }
    return "Unknown";
}

inline const char* to_string(QueueType t) {
    switch (t) {
        case QueueType::Fifo:     return "Fifo";
        case QueueType::Priority: return "Priority";
    }
    return "Unknown";
}

inline const char* to_string(RequestPriority p) {
    switch (p) {
        case RequestPriority::Low:    return "Low";
        case RequestPriority::Medium: return "Medium";
        case RequestPriority::High:   return "High";
    }
    return "Unknown";
}

inline const char* to_string(BackoffShape b) {
    switch (b) {
        case BackoffShape::Linear:      return "Linear";
        case BackoffShape::Exponential: return "Exponential";
    }
    return "Unknown";
}

inline const char* to_string(ActionState s) {
    switch (s) {
        case ActionState::Pending:    return "Pending";
        case ActionState::Dispatched: return "Dispatched";
        case ActionState::Retrying:   return "Retrying";
        case ActionState::Succeeded:  return "Succeeded";
        case ActionState::Failed:     return "Failed";
        case ActionState::Skipped:    return "Skipped";
        case ActionState::Cancelled:  return "Cancelled";
    }
    return "Unknown";
}

} // namespace conductor
