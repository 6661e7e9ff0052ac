#include "conductor/config.hpp"
#include "conductor/exceptions.hpp"

#include <unordered_set>

namespace conductor {

namespace {

void check_fraction(double value, const char* name) {
    if (!(value > 0.0 && value <= 1.0)) {
        throw InvalidConfigException(std::string(name) + " must be in (0, 1], got " +
                                     std::to_string(value));
    }
}

void check_rate_limit(const RateLimitConfig& cfg, const std::string& owner) {
    if (cfg.requests_per_window <= 0.0) {
        throw InvalidConfigException(owner + ": requests_per_window must be positive");
    }
    if (cfg.window <= Duration::zero()) {
        throw InvalidConfigException(owner + ": rate-limit window must be positive");
    }
    if (cfg.burst_allowance < 0.0) {
        throw InvalidConfigException(owner + ": burst_allowance must not be negative");
    }
    if (cfg.capacity() < 1.0) {
        throw InvalidConfigException(owner + ": bucket capacity (requests_per_window + "
                                     "burst_allowance) must be at least 1");
    }
}

} // anonymous namespace

void validate(const Config& config) {
    std::unordered_set<ProviderId> ids;
    for (const auto& p : config.providers) {
        if (p.id.empty()) {
            throw InvalidConfigException("Provider id must not be empty");
        }
        if (!ids.insert(p.id).second) {
            throw InvalidConfigException("Duplicate provider id: " + p.id);
        }
        check_rate_limit(p.rate_limit, "provider " + p.id);
        if (p.thresholds.max_consecutive_failures < 1) {
            throw InvalidConfigException("provider " + p.id +
                                         ": max_consecutive_failures must be at least 1");
        }
        check_fraction(p.thresholds.error_rate_threshold, "error_rate_threshold");
        if (p.pricing.input_price_per_1k < 0.0 || p.pricing.output_price_per_1k < 0.0 ||
            p.pricing.cost_per_request < 0.0) {
            throw InvalidConfigException("provider " + p.id + ": prices must not be negative");
        }
    }

    check_rate_limit(config.agent_rate_limit, "agent_rate_limit");
    check_rate_limit(config.global_rate_limit, "global_rate_limit");

    if (config.health.window_size == 0) {
        throw InvalidConfigException("health.window_size must be positive");
    }
    check_fraction(config.health.degraded_success_rate, "degraded_success_rate");
    if (config.health.enable_periodic_checks && config.health.check_interval <= Duration::zero()) {
        throw InvalidConfigException("health.check_interval must be positive");
    }

    if (config.router.max_retries < 0) {
        throw InvalidConfigException("router.max_retries must not be negative");
    }

    const auto& g = config.guardrail;
    if (g.budget_limit_usd <= 0.0) {
        throw InvalidConfigException("budget_limit_usd must be positive");
    }
    check_fraction(g.warning_threshold, "warning_threshold");
    check_fraction(g.soft_limit_threshold, "soft_limit_threshold");
    check_fraction(g.hard_limit_threshold, "hard_limit_threshold");
    if (g.warning_threshold > g.soft_limit_threshold ||
        g.soft_limit_threshold > g.hard_limit_threshold) {
        throw InvalidConfigException(
            "Guardrail thresholds must satisfy warning <= soft <= hard");
    }
    check_fraction(g.context_reduction_factor, "context_reduction_factor");

    if (config.queue.max_size == 0) {
        throw InvalidConfigException("queue.max_size must be positive");
    }
    if (config.queue.max_retries < 0) {
        throw InvalidConfigException("queue.max_retries must not be negative");
    }

    if (config.coordinator.max_concurrency == 0) {
        throw InvalidConfigException("coordinator.max_concurrency must be at least 1");
    }
    if (config.coordinator.default_max_attempts < 1) {
        throw InvalidConfigException("coordinator.default_max_attempts must be at least 1");
    }
}

} // namespace conductor
