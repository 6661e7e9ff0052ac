#include "conductor/budget.hpp"
#include "conductor/exceptions.hpp"

#include <algorithm>

namespace conductor {

namespace {

ModelPricing make_pricing(const char* model, double in, double out, const char* provider) {
    ModelPricing p;
    p.model_name = model;
    p.input_price_per_1k = in;
    p.output_price_per_1k = out;
    p.provider = provider;
    return p;
}

} // anonymous namespace

// ========== PricingRegistry ==========

PricingRegistry::PricingRegistry()
    : default_pricing_(make_pricing("unknown", 0.01, 0.03, "unknown"))
{
    for (auto& p : {
            make_pricing("gpt-4",         0.03,    0.06,    "openai"),
            make_pricing("gpt-4-turbo",   0.01,    0.03,    "openai"),
            make_pricing("gpt-3.5-turbo", 0.0005,  0.0015,  "openai"),
            make_pricing("claude-opus",   0.015,   0.075,   "anthropic"),
            make_pricing("claude-sonnet", 0.003,   0.015,   "anthropic"),
            make_pricing("claude-haiku",  0.00025, 0.00125, "anthropic"),
         }) {
        pricing_[p.model_name] = p;
    }
}

ModelPricing PricingRegistry::get_pricing(const std::string& model_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pricing_.find(model_name);
    return (it != pricing_.end()) ? it->second : default_pricing_;
}

void PricingRegistry::register_pricing(const ModelPricing& pricing) {
    if (pricing.model_name.empty()) {
        throw InvalidConfigException("Pricing requires a model name");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pricing_[pricing.model_name] = pricing;
}

bool PricingRegistry::has_pricing(const std::string& model_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pricing_.count(model_name) > 0;
}

// ========== CostTracker ==========

CostTracker::CostTracker(std::shared_ptr<PricingRegistry> registry,
                         double budget_limit_usd,
                         double warning_threshold,
                         std::int64_t max_context_tokens)
    : registry_(std::move(registry))
    , budget_limit_usd_(budget_limit_usd)
    , warning_threshold_(warning_threshold)
    , max_context_tokens_(max_context_tokens)
{
    if (!registry_) {
        throw InvalidConfigException("CostTracker requires a pricing registry");
    }
    if (budget_limit_usd_ <= 0.0) {
        throw InvalidConfigException("Budget limit must be positive");
    }
}

double CostTracker::calculate_cost(const std::string& model_name,
                                   std::int64_t input_tokens,
                                   std::int64_t output_tokens) const {
    auto pricing = registry_->get_pricing(model_name);
    return (static_cast<double>(input_tokens) / 1000.0) * pricing.input_price_per_1k +
           (static_cast<double>(output_tokens) / 1000.0) * pricing.output_price_per_1k;
}

double CostTracker::update_after_call(BudgetState& state,
                                      const std::string& model_name,
                                      const std::string& node_name,
                                      std::int64_t input_tokens,
                                      std::int64_t output_tokens) const {
    double cost = calculate_cost(model_name, input_tokens, output_tokens);
    apply_cost(state, model_name, node_name, input_tokens, output_tokens, cost);
    return cost;
}

void CostTracker::apply_cost(BudgetState& state,
                             const std::string& model_name,
                             const std::string& node_name,
                             std::int64_t input_tokens,
                             std::int64_t output_tokens,
                             double cost) const {
    std::int64_t tokens = input_tokens + output_tokens;

    state.total_input_tokens += input_tokens;
    state.total_output_tokens += output_tokens;
    state.total_tokens += tokens;
    state.total_cost_usd += cost;

    state.model_costs[model_name] += cost;
    state.model_tokens[model_name] += tokens;
    state.node_costs[node_name] += cost;
    state.node_tokens[node_name] += tokens;

    auto now = Clock::now();
    if (state.session_start_time == Timestamp{}) {
        state.session_start_time = now;
    }
    state.last_update_time = now;

    if (state.budget_limit_usd > 0.0 &&
        state.total_cost_usd / state.budget_limit_usd >= 1.0) {
        state.budget_exceeded = true;
    }
}

BudgetStatus CostTracker::check_budget_status(const BudgetState& state) const {
    BudgetStatus status;
    double limit = state.budget_limit_usd;
    status.budget_used = state.total_cost_usd;
    status.budget_remaining = std::max(0.0, limit - state.total_cost_usd);
    status.budget_usage = (limit > 0.0) ? state.total_cost_usd / limit : 0.0;
    status.is_warning = status.budget_usage >= state.warning_threshold;
    status.is_exceeded = state.budget_exceeded || status.budget_usage >= 1.0;
    return status;
}

BudgetState CostTracker::new_state() const {
    BudgetState state;
    state.budget_limit_usd = budget_limit_usd_;
    state.warning_threshold = warning_threshold_;
    state.max_context_tokens = max_context_tokens_;
    state.session_start_time = Clock::now();
    state.last_update_time = state.session_start_time;
    return state;
}

} // namespace conductor
