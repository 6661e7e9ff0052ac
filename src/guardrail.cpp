#include "conductor/guardrail.hpp"
#include "conductor/exceptions.hpp"

namespace conductor {

// ========== BudgetGuardrail ==========

BudgetGuardrail::BudgetGuardrail(GuardrailConfig config, std::shared_ptr<const CostTracker> tracker)
    : config_(std::move(config))
    , tracker_(std::move(tracker))
{
    if (!tracker_) {
        throw InvalidConfigException("BudgetGuardrail requires a cost tracker");
    }
}

GuardrailAction BudgetGuardrail::check(const BudgetState& state) const {
    auto status = tracker_->check_budget_status(state);

    if (status.is_exceeded) {
        return GuardrailAction::Halt;
    }
    if (status.budget_usage >= config_.hard_limit_threshold) {
        return GuardrailAction::Halt;
    }
    if (status.budget_usage >= config_.soft_limit_threshold) {
        return config_.enable_graceful_degradation ? GuardrailAction::Degrade
                                                   : GuardrailAction::Halt;
    }
    if (status.is_warning || status.budget_usage >= config_.warning_threshold) {
        return GuardrailAction::Warn;
    }
    return GuardrailAction::Continue;
}

GuardrailAction BudgetGuardrail::check_projected(const BudgetState& state, double estimated_cost) const {
    BudgetState projected = state;
    projected.total_cost_usd += estimated_cost;
    return check(projected);
}

bool BudgetGuardrail::should_halt(const BudgetState& state) const {
    return check(state) == GuardrailAction::Halt;
}

std::optional<DegradationConfig> BudgetGuardrail::degradation_config(const BudgetState& state) const {
    if (check(state) != GuardrailAction::Degrade) {
        return std::nullopt;
    }
    return degradation_advice(state);
}

DegradationConfig BudgetGuardrail::degradation_advice(const BudgetState& state) const {
    DegradationConfig advice;
    if (config_.fallback_model.has_value()) {
        advice.model = config_.fallback_model;
    }
    if (config_.reduce_context_on_degradation) {
        std::int64_t base = (state.max_context_tokens > 0) ? state.max_context_tokens
                                                           : config_.default_max_context_tokens;
        advice.max_context_tokens =
            static_cast<std::int64_t>(static_cast<double>(base) * config_.context_reduction_factor);
    }
    return advice;
}

BudgetExceededError BudgetGuardrail::budget_exceeded_error(const BudgetState& state) const {
    auto status = tracker_->check_budget_status(state);

    BudgetExceededError error;
    error.budget_limit_usd = state.budget_limit_usd;
    error.current_cost_usd = status.budget_used;
    error.budget_usage = status.budget_usage;
    error.message = "Budget limit of $" + BudgetExceededException::format_usd(state.budget_limit_usd) +
                    " exceeded. Current cost: $" + BudgetExceededException::format_usd(status.budget_used);
    error.suggestion = "Retry with a higher budget limit or simplify your request";
    error.state_preserved = true;
    return error;
}

void BudgetGuardrail::enforce(const BudgetState& state) const {
    if (should_halt(state)) {
        throw BudgetExceededException(state.total_cost_usd, state.budget_limit_usd);
    }
}

// ========== BudgetLedger ==========

BudgetLedger::BudgetLedger(std::shared_ptr<const BudgetGuardrail> guardrail, BudgetState initial)
    : guardrail_(std::move(guardrail))
    , state_(std::move(initial))
{
    if (!guardrail_) {
        throw InvalidConfigException("BudgetLedger requires a guardrail");
    }
}

Reservation BudgetLedger::reserve(double estimated_cost, const std::string& node) {
    Reservation reservation;
    std::shared_ptr<Monitor> monitor;
    BudgetState view;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;

        // Outstanding reservations count as spent for the projection
        view = state_;
        view.total_cost_usd += reserved_total_;

        reservation.action = guardrail_->check_projected(view, estimated_cost);
        if (reservation.action == GuardrailAction::Degrade) {
            reservation.degradation = guardrail_->degradation_advice(view);
        }
        if (reservation.admitted()) {
            reservation.id = next_id_++;
            reservation.amount = estimated_cost;
            outstanding_[reservation.id] = estimated_cost;
            reserved_total_ += estimated_cost;
        }
    }

    if (reservation.action != GuardrailAction::Continue) {
        EventType type = EventType::BudgetWarning;
        std::string message;
        switch (reservation.action) {
            case GuardrailAction::Halt:
                type = EventType::BudgetHalted;
                message = guardrail_->budget_exceeded_error(view).message;
                break;
            case GuardrailAction::Degrade:
                type = EventType::BudgetDegraded;
                message = "Soft limit reached, degrading";
                break;
            default:
                message = "Warning threshold reached";
                break;
        }
        auto event = make_event(type, message);
        if (!node.empty()) event.action_id = node;
        event.guardrail_action = reservation.action;
        event.cost_usd = view.total_cost_usd;
        emit(monitor, std::move(event));
    }
    return reservation;
}

double BudgetLedger::commit(const Reservation& reservation,
                            const std::string& model,
                            const std::string& node,
                            std::int64_t input_tokens,
                            std::int64_t output_tokens) {
    double cost = guardrail_->tracker().calculate_cost(model, input_tokens, output_tokens);
    return commit(reservation, model, node, input_tokens, output_tokens, cost);
}

double BudgetLedger::commit(const Reservation& reservation,
                            const std::string& model,
                            const std::string& node,
                            std::int64_t input_tokens,
                            std::int64_t output_tokens,
                            double cost) {
    std::shared_ptr<Monitor> monitor;
    double total;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drop_reservation(reservation.id);
        guardrail_->tracker().apply_cost(state_, model, node, input_tokens, output_tokens, cost);
        total = state_.total_cost_usd;
        monitor = monitor_;
    }

    auto event = make_event(EventType::BudgetUpdated, "Committed call cost for " + model);
    if (!node.empty()) event.action_id = node;
    event.cost_usd = total;
    emit(monitor, std::move(event));
    return cost;
}

void BudgetLedger::release(const Reservation& reservation) {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_reservation(reservation.id);
}

BudgetState BudgetLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

double BudgetLedger::reserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_total_;
}

GuardrailAction BudgetLedger::current_action() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return guardrail_->check(state_);
}

BudgetExceededError BudgetLedger::exceeded_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return guardrail_->budget_exceeded_error(state_);
}

void BudgetLedger::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

void BudgetLedger::drop_reservation(std::uint64_t id) {
    auto it = outstanding_.find(id);
    if (it == outstanding_.end()) return;
    reserved_total_ -= it->second;
    if (reserved_total_ < 0.0) reserved_total_ = 0.0;
    outstanding_.erase(it);
}

} // namespace conductor
