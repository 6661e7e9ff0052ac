#pragma once

#include "conductor/types.hpp"
#include "conductor/config.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace conductor {

// Cumulative spend for one request chain.
struct BudgetState {
    std::int64_t total_input_tokens{0};
    std::int64_t total_output_tokens{0};
    std::int64_t total_tokens{0};
    double total_cost_usd{0.0};

    std::map<std::string, double> model_costs;
    std::map<std::string, std::int64_t> model_tokens;
    std::map<std::string, double> node_costs;
    std::map<std::string, std::int64_t> node_tokens;

    Timestamp session_start_time{};
    Timestamp last_update_time{};

    double budget_limit_usd{10.0};
    double warning_threshold{0.8};
    std::int64_t max_context_tokens{8000};
    bool budget_exceeded{false};
};

struct BudgetStatus {
    double budget_used{0.0};
    double budget_remaining{0.0};
    double budget_usage{0.0};       // fraction of the limit, 1.0 = at limit
    bool is_warning{false};
    bool is_exceeded{false};
};

// Per-model prices with a conservative default for unknown models.
class PricingRegistry {
public:
    PricingRegistry();

    ModelPricing get_pricing(const std::string& model_name) const;
    void register_pricing(const ModelPricing& pricing);
    bool has_pricing(const std::string& model_name) const;

    const ModelPricing& default_pricing() const noexcept { return default_pricing_; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, ModelPricing> pricing_;
    ModelPricing default_pricing_;
};

class CostTracker {
public:
    explicit CostTracker(std::shared_ptr<PricingRegistry> registry,
                         double budget_limit_usd = 10.0,
                         double warning_threshold = 0.8,
                         std::int64_t max_context_tokens = 8000);

    double calculate_cost(const std::string& model_name,
                          std::int64_t input_tokens,
                          std::int64_t output_tokens) const;

    // Adds the call to every breakdown and returns its cost. Never subtracts.
    double update_after_call(BudgetState& state,
                             const std::string& model_name,
                             const std::string& node_name,
                             std::int64_t input_tokens,
                             std::int64_t output_tokens) const;

    // Same, with a cost already priced elsewhere (e.g. by the provider)
    void apply_cost(BudgetState& state,
                    const std::string& model_name,
                    const std::string& node_name,
                    std::int64_t input_tokens,
                    std::int64_t output_tokens,
                    double cost) const;

    BudgetStatus check_budget_status(const BudgetState& state) const;

    BudgetState new_state() const;

    double budget_limit_usd() const noexcept { return budget_limit_usd_; }
    double warning_threshold() const noexcept { return warning_threshold_; }
    PricingRegistry& registry() const noexcept { return *registry_; }

private:
    std::shared_ptr<PricingRegistry> registry_;
    double budget_limit_usd_;
    double warning_threshold_;
    std::int64_t max_context_tokens_;
};

} // namespace conductor
