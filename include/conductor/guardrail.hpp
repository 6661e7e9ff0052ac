#pragma once

#include "conductor/types.hpp"
#include "conductor/config.hpp"
#include "conductor/budget.hpp"
#include "conductor/monitor.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace conductor {

// Advice attached to a call when the guardrail says Degrade
struct DegradationConfig {
    std::optional<std::string> model;               // cheaper fallback
    std::optional<std::int64_t> max_context_tokens; // reduced context window
};

// Structured "budget exceeded" outcome for callers that want to ask for
// a higher limit or simplify the request.
struct BudgetExceededError {
    std::string message;
    double budget_limit_usd{0.0};
    double current_cost_usd{0.0};
    double budget_usage{0.0};
    std::string suggestion;
    bool state_preserved{true};
};

// Cost-threshold decision function.
//
// Staircase over usage = cost / limit:
//   usage >= 1.0, usage >= hard limit, or exceeded flag  -> Halt
//   usage >= soft limit   -> Degrade (Halt when degradation is disabled)
//   usage >= warning      -> Warn
//   otherwise             -> Continue
class BudgetGuardrail {
public:
    BudgetGuardrail(GuardrailConfig config, std::shared_ptr<const CostTracker> tracker);

    GuardrailAction check(const BudgetState& state) const;

    // Check against state + estimated_cost of a pending call
    GuardrailAction check_projected(const BudgetState& state, double estimated_cost) const;

    bool should_halt(const BudgetState& state) const;

    std::optional<DegradationConfig> degradation_config(const BudgetState& state) const;
    DegradationConfig degradation_advice(const BudgetState& state) const;

    BudgetExceededError budget_exceeded_error(const BudgetState& state) const;

    // Throws BudgetExceededException when check() says Halt
    void enforce(const BudgetState& state) const;

    const GuardrailConfig& config() const noexcept { return config_; }
    const CostTracker& tracker() const noexcept { return *tracker_; }

private:
    GuardrailConfig config_;
    std::shared_ptr<const CostTracker> tracker_;
};

// Outcome of a pre-dispatch budget check
struct Reservation {
    std::uint64_t id{0};                // 0 = nothing reserved
    double amount{0.0};
    GuardrailAction action{GuardrailAction::Continue};
    std::optional<DegradationConfig> degradation;

    bool admitted() const noexcept { return action != GuardrailAction::Halt; }
};

// Budget state of one request chain.
//
// The projected check and the reservation happen under one lock, so
// concurrent calls in the same chain cannot each pass individually and
// jointly overshoot the limit. Outstanding reservations count toward the
// projection until they are committed or released.
class BudgetLedger {
public:
    BudgetLedger(std::shared_ptr<const BudgetGuardrail> guardrail, BudgetState initial);

    // Non-copyable
    BudgetLedger(const BudgetLedger&) = delete;
    BudgetLedger& operator=(const BudgetLedger&) = delete;

    Reservation reserve(double estimated_cost, const std::string& node = "");

    // Record the actual call. Returns the committed cost.
    double commit(const Reservation& reservation,
                  const std::string& model,
                  const std::string& node,
                  std::int64_t input_tokens,
                  std::int64_t output_tokens);

    // Same, with a cost priced by the provider
    double commit(const Reservation& reservation,
                  const std::string& model,
                  const std::string& node,
                  std::int64_t input_tokens,
                  std::int64_t output_tokens,
                  double cost);

    void release(const Reservation& reservation);

    BudgetState snapshot() const;
    double reserved() const;
    GuardrailAction current_action() const;
    BudgetExceededError exceeded_error() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    std::shared_ptr<const BudgetGuardrail> guardrail_;
    mutable std::mutex mutex_;
    BudgetState state_;
    std::unordered_map<std::uint64_t, double> outstanding_;
    double reserved_total_{0.0};
    std::uint64_t next_id_{1};
    std::shared_ptr<Monitor> monitor_;

    // Caller must hold mutex_
    void drop_reservation(std::uint64_t id);
};

} // namespace conductor
