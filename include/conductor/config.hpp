#pragma once

#include "conductor/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

// Token bucket configuration (requests per window, plus burst headroom)
struct RateLimitConfig {
    double requests_per_window = 60.0;
    Duration window = std::chrono::seconds(60);
    double burst_allowance = 0.0;

    double capacity() const { return requests_per_window + burst_allowance; }
    double refill_rate() const {
        double secs = to_seconds(window);
        return (secs > 0.0) ? requests_per_window / secs : 0.0;
    }
};

// Per-provider health thresholds
struct HealthThresholds {
    int max_consecutive_failures = 3;
    double error_rate_threshold = 0.1;
    Duration latency_threshold = std::chrono::seconds(5);
    Duration health_check_interval = std::chrono::seconds(30);
};

// Per-model pricing in USD
struct ModelPricing {
    std::string model_name;
    double input_price_per_1k = 0.01;
    double output_price_per_1k = 0.03;
    double cost_per_request = 0.0;
    std::string provider;
};

// Static provider configuration, loaded at startup
struct ProviderConfig {
    ProviderId id;
    std::string name;
    int priority = 0;            // lower = preferred
    std::string endpoint;        // opaque to the core
    std::string model;
    RateLimitConfig rate_limit;
    ModelPricing pricing;
    HealthThresholds thresholds;
};

struct HealthConfig {
    // Number of recent outcomes used for rolling rates and latency
    std::size_t window_size = 100;

    // Success rate below which a provider is Degraded
    double degraded_success_rate = 0.9;

    // Outcomes required in the window before rate rules apply. The default
    // lets a single failed call count; raise it to ignore early noise.
    std::size_t min_samples = 1;

    // Periodic synthetic health checks; they are what lets an Unhealthy
    // provider come back without an administrative reset
    bool enable_periodic_checks = true;
    Duration check_interval = std::chrono::seconds(30);
};

struct RouterConfig {
    RoutingStrategy strategy = RoutingStrategy::HealthBased;

    // Retries against the same provider for transient errors
    int max_retries = 2;

    // Delay between same-provider retries
    Duration retry_delay = std::chrono::milliseconds(50);

    // How long to wait for rate-limiter admission before failing RateLimited
    Duration admission_timeout = std::chrono::seconds(10);

    // Used when a request carries no timeout of its own
    Duration default_request_timeout = std::chrono::seconds(60);
};

struct GuardrailConfig {
    double budget_limit_usd = 10.0;
    double warning_threshold = 0.8;
    double soft_limit_threshold = 0.9;
    double hard_limit_threshold = 1.0;

    bool enable_graceful_degradation = true;
    std::optional<std::string> fallback_model;
    bool reduce_context_on_degradation = true;
    double context_reduction_factor = 0.5;
    std::int64_t default_max_context_tokens = 8000;
};

struct QueueConfig {
    QueueType type = QueueType::Priority;
    std::size_t max_size = 1000;
    int max_retries = 3;
};

struct CoordinatorConfig {
    // Worker threads per level (independent of provider rate limits)
    std::size_t max_concurrency = 8;

    bool stop_on_failure = false;

    // Defaults for actions that do not carry their own policy
    int default_max_attempts = 3;
    BackoffShape default_backoff = BackoffShape::Exponential;
    Duration default_base_delay = std::chrono::milliseconds(100);
    Duration default_max_delay = std::chrono::seconds(5);
    Duration default_action_timeout = std::chrono::seconds(60);
};

struct Config {
    std::vector<ProviderConfig> providers;

    // Default per-agent bucket and the shared global bucket
    RateLimitConfig agent_rate_limit;
    RateLimitConfig global_rate_limit{600.0, std::chrono::seconds(60), 0.0};

    HealthConfig health;
    RouterConfig router;
    GuardrailConfig guardrail;
    QueueConfig queue;
    CoordinatorConfig coordinator;
};

// Throws InvalidConfigException describing the first problem found.
void validate(const Config& config);

} // namespace conductor
