#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <conductor/conductor.hpp>

using namespace conductor;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_conductor, m) {
    m.doc() = "Conductor: dependency-aware execution, routing and budgets for LLM actions";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_monitors(m);
    bind_policies(m);
    bind_subsystems(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<HealthStatus>(m, "HealthStatus")
        .value("Healthy",   HealthStatus::Healthy)
        .value("Degraded",  HealthStatus::Degraded)
        .value("Unhealthy", HealthStatus::Unhealthy)
        .export_values();

    py::enum_<GuardrailAction>(m, "GuardrailAction")
        .value("Continue", GuardrailAction::Continue)
        .value("Warn",     GuardrailAction::Warn)
        .value("Degrade",  GuardrailAction::Degrade)
        .value("Halt",     GuardrailAction::Halt)
        .export_values();

    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("NoError",                     ErrorKind::None)
        .value("CyclicDependency",            ErrorKind::CyclicDependency)
        .value("Timeout",                     ErrorKind::Timeout)
        .value("RateLimited",                 ErrorKind::RateLimited)
        .value("TransientProviderError",      ErrorKind::TransientProviderError)
        .value("PermanentProviderError",      ErrorKind::PermanentProviderError)
        .value("AllProvidersFailed",          ErrorKind::AllProvidersFailed)
        .value("BudgetExceeded",              ErrorKind::BudgetExceeded)
        .value("SkippedDueToUpstreamFailure", ErrorKind::SkippedDueToUpstreamFailure)
        .value("Cancelled",                   ErrorKind::Cancelled)
        .export_values();

    py::enum_<RoutingStrategy>(m, "RoutingStrategy")
        .value("HealthBased",      RoutingStrategy::HealthBased)
        .value("RoundRobin",       RoutingStrategy::RoundRobin)
        .value("LeastConnections", RoutingStrategy::LeastConnections)
        .export_values();

    py::enum_<QueueType>(m, "QueueType")
        .value("Fifo",     QueueType::Fifo)
        .value("Priority", QueueType::Priority)
        .export_values();

    py::enum_<RequestPriority>(m, "RequestPriority")
        .value("Low",    RequestPriority::Low)
        .value("Medium", RequestPriority::Medium)
        .value("High",   RequestPriority::High)
        .export_values();

    py::enum_<BackoffShape>(m, "BackoffShape")
        .value("Linear",      BackoffShape::Linear)
        .value("Exponential", BackoffShape::Exponential)
        .export_values();

    py::enum_<ActionState>(m, "ActionState")
        .value("Pending",    ActionState::Pending)
        .value("Dispatched", ActionState::Dispatched)
        .value("Retrying",   ActionState::Retrying)
        .value("Succeeded",  ActionState::Succeeded)
        .value("Failed",     ActionState::Failed)
        .value("Skipped",    ActionState::Skipped)
        .value("Cancelled",  ActionState::Cancelled)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("PlanCreated",           EventType::PlanCreated)
        .value("LevelStarted",          EventType::LevelStarted)
        .value("LevelCompleted",        EventType::LevelCompleted)
        .value("ActionDispatched",      EventType::ActionDispatched)
        .value("ActionRetrying",        EventType::ActionRetrying)
        .value("ActionSucceeded",       EventType::ActionSucceeded)
        .value("ActionFailed",          EventType::ActionFailed)
        .value("ActionSkipped",         EventType::ActionSkipped)
        .value("ActionCancelled",       EventType::ActionCancelled)
        .value("BatchCancelled",        EventType::BatchCancelled)
        .value("ProviderSelected",      EventType::ProviderSelected)
        .value("ProviderFailover",      EventType::ProviderFailover)
        .value("ProviderRequestFailed", EventType::ProviderRequestFailed)
        .value("AllProvidersFailed",    EventType::AllProvidersFailed)
        .value("ProviderHealthChanged", EventType::ProviderHealthChanged)
        .value("HealthCheckPerformed",  EventType::HealthCheckPerformed)
        .value("HealthOverrideSet",     EventType::HealthOverrideSet)
        .value("RateLimited",           EventType::RateLimited)
        .value("RequestEnqueued",       EventType::RequestEnqueued)
        .value("RequestRequeued",       EventType::RequestRequeued)
        .value("RequestDropped",        EventType::RequestDropped)
        .value("BudgetWarning",         EventType::BudgetWarning)
        .value("BudgetDegraded",        EventType::BudgetDegraded)
        .value("BudgetHalted",          EventType::BudgetHalted)
        .value("BudgetUpdated",         EventType::BudgetUpdated);

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Configuration ----------------------------------------------------

    py::class_<RateLimitConfig>(m, "RateLimitConfig")
        .def(py::init<>())
        .def_readwrite("requests_per_window", &RateLimitConfig::requests_per_window)
        .def_readwrite("window",              &RateLimitConfig::window)
        .def_readwrite("burst_allowance",     &RateLimitConfig::burst_allowance)
        .def("capacity",    &RateLimitConfig::capacity)
        .def("refill_rate", &RateLimitConfig::refill_rate);

    py::class_<HealthThresholds>(m, "HealthThresholds")
        .def(py::init<>())
        .def_readwrite("max_consecutive_failures", &HealthThresholds::max_consecutive_failures)
        .def_readwrite("error_rate_threshold",     &HealthThresholds::error_rate_threshold)
        .def_readwrite("latency_threshold",        &HealthThresholds::latency_threshold)
        .def_readwrite("health_check_interval",    &HealthThresholds::health_check_interval);

    py::class_<ModelPricing>(m, "ModelPricing")
        .def(py::init<>())
        .def_readwrite("model_name",          &ModelPricing::model_name)
        .def_readwrite("input_price_per_1k",  &ModelPricing::input_price_per_1k)
        .def_readwrite("output_price_per_1k", &ModelPricing::output_price_per_1k)
        .def_readwrite("cost_per_request",    &ModelPricing::cost_per_request)
        .def_readwrite("provider",            &ModelPricing::provider);

    py::class_<ProviderConfig>(m, "ProviderConfig")
        .def(py::init<>())
        .def_readwrite("id",         &ProviderConfig::id)
        .def_readwrite("name",       &ProviderConfig::name)
        .def_readwrite("priority",   &ProviderConfig::priority)
        .def_readwrite("endpoint",   &ProviderConfig::endpoint)
        .def_readwrite("model",      &ProviderConfig::model)
        .def_readwrite("rate_limit", &ProviderConfig::rate_limit)
        .def_readwrite("pricing",    &ProviderConfig::pricing)
        .def_readwrite("thresholds", &ProviderConfig::thresholds)
        .def("__repr__", [](const ProviderConfig& p) {
            return "<ProviderConfig id='" + p.id + "' priority=" + std::to_string(p.priority) + ">";
        });

    py::class_<HealthConfig>(m, "HealthConfig")
        .def(py::init<>())
        .def_readwrite("window_size",            &HealthConfig::window_size)
        .def_readwrite("degraded_success_rate",  &HealthConfig::degraded_success_rate)
        .def_readwrite("min_samples",            &HealthConfig::min_samples)
        .def_readwrite("enable_periodic_checks", &HealthConfig::enable_periodic_checks)
        .def_readwrite("check_interval",         &HealthConfig::check_interval);

    py::class_<RouterConfig>(m, "RouterConfig")
        .def(py::init<>())
        .def_readwrite("strategy",                &RouterConfig::strategy)
        .def_readwrite("max_retries",             &RouterConfig::max_retries)
        .def_readwrite("retry_delay",             &RouterConfig::retry_delay)
        .def_readwrite("admission_timeout",       &RouterConfig::admission_timeout)
        .def_readwrite("default_request_timeout", &RouterConfig::default_request_timeout);

    py::class_<GuardrailConfig>(m, "GuardrailConfig")
        .def(py::init<>())
        .def_readwrite("budget_limit_usd",              &GuardrailConfig::budget_limit_usd)
        .def_readwrite("warning_threshold",             &GuardrailConfig::warning_threshold)
        .def_readwrite("soft_limit_threshold",          &GuardrailConfig::soft_limit_threshold)
        .def_readwrite("hard_limit_threshold",          &GuardrailConfig::hard_limit_threshold)
        .def_readwrite("enable_graceful_degradation",   &GuardrailConfig::enable_graceful_degradation)
        .def_readwrite("fallback_model",                &GuardrailConfig::fallback_model)
        .def_readwrite("reduce_context_on_degradation", &GuardrailConfig::reduce_context_on_degradation)
        .def_readwrite("context_reduction_factor",      &GuardrailConfig::context_reduction_factor)
        .def_readwrite("default_max_context_tokens",    &GuardrailConfig::default_max_context_tokens);

    py::class_<QueueConfig>(m, "QueueConfig")
        .def(py::init<>())
        .def_readwrite("type",        &QueueConfig::type)
        .def_readwrite("max_size",    &QueueConfig::max_size)
        .def_readwrite("max_retries", &QueueConfig::max_retries);

    py::class_<CoordinatorConfig>(m, "CoordinatorConfig")
        .def(py::init<>())
        .def_readwrite("max_concurrency",        &CoordinatorConfig::max_concurrency)
        .def_readwrite("stop_on_failure",        &CoordinatorConfig::stop_on_failure)
        .def_readwrite("default_max_attempts",   &CoordinatorConfig::default_max_attempts)
        .def_readwrite("default_backoff",        &CoordinatorConfig::default_backoff)
        .def_readwrite("default_base_delay",     &CoordinatorConfig::default_base_delay)
        .def_readwrite("default_max_delay",      &CoordinatorConfig::default_max_delay)
        .def_readwrite("default_action_timeout", &CoordinatorConfig::default_action_timeout);

    // Config (top-level, embeds the sub-configs)
    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("providers",         &Config::providers)
        .def_readwrite("agent_rate_limit",  &Config::agent_rate_limit)
        .def_readwrite("global_rate_limit", &Config::global_rate_limit)
        .def_readwrite("health",            &Config::health)
        .def_readwrite("router",            &Config::router)
        .def_readwrite("guardrail",         &Config::guardrail)
        .def_readwrite("queue",             &Config::queue)
        .def_readwrite("coordinator",       &Config::coordinator);

    m.def("validate", &validate, py::arg("config"));

    // ---- Actions and results ----------------------------------------------

    py::class_<RetryPolicy>(m, "RetryPolicy")
        .def(py::init<>())
        .def_readwrite("max_attempts", &RetryPolicy::max_attempts)
        .def_readwrite("backoff",      &RetryPolicy::backoff)
        .def_readwrite("base_delay",   &RetryPolicy::base_delay)
        .def_readwrite("max_delay",    &RetryPolicy::max_delay)
        .def("delay_after", &RetryPolicy::delay_after, py::arg("attempt"));

    py::class_<CostEstimate>(m, "CostEstimate")
        .def(py::init<>())
        .def_readwrite("input_tokens",  &CostEstimate::input_tokens)
        .def_readwrite("output_tokens", &CostEstimate::output_tokens);

    py::class_<Action>(m, "Action")
        .def(py::init<>())
        .def(py::init([](ActionId id, std::string type, std::vector<ActionId> dependencies) {
                 Action a;
                 a.id = std::move(id);
                 a.type = std::move(type);
                 a.dependencies = std::move(dependencies);
                 return a;
             }),
             py::arg("id"), py::arg("type") = "", py::arg("dependencies") = std::vector<ActionId>{})
        .def_readwrite("id",           &Action::id)
        .def_readwrite("type",         &Action::type)
        .def_readwrite("parameters",   &Action::parameters)
        .def_readwrite("dependencies", &Action::dependencies)
        .def_readwrite("retry",        &Action::retry)
        .def_readwrite("timeout",      &Action::timeout)
        .def_readwrite("agent_id",     &Action::agent_id)
        .def_readwrite("priority",     &Action::priority)
        .def_readwrite("model",        &Action::model)
        .def_readwrite("estimate",     &Action::estimate)
        .def("__repr__", [](const Action& a) {
            return "<Action id='" + a.id + "' deps=" + std::to_string(a.dependencies.size()) + ">";
        });

    py::class_<ActionError>(m, "ActionError")
        .def(py::init<>())
        .def_readwrite("kind",    &ActionError::kind)
        .def_readwrite("message", &ActionError::message);

    py::class_<ActionResult>(m, "ActionResult")
        .def(py::init<>())
        .def_readwrite("action_id",     &ActionResult::action_id)
        .def_readwrite("success",       &ActionResult::success)
        .def_readwrite("payload",       &ActionResult::payload)
        .def_readwrite("error",         &ActionResult::error)
        .def_readwrite("latency",       &ActionResult::latency)
        .def_readwrite("provider_id",   &ActionResult::provider_id)
        .def_readwrite("cost",          &ActionResult::cost)
        .def_readwrite("attempt",       &ActionResult::attempt)
        .def_readwrite("input_tokens",  &ActionResult::input_tokens)
        .def_readwrite("output_tokens", &ActionResult::output_tokens);

    py::class_<ExecutionPlan>(m, "ExecutionPlan")
        .def(py::init<>())
        .def_readwrite("levels",         &ExecutionPlan::levels)
        .def_readwrite("total_actions",  &ExecutionPlan::total_actions)
        .def_readwrite("estimated_time", &ExecutionPlan::estimated_time)
        .def("level_count", &ExecutionPlan::level_count);

    py::class_<ExecutionSummary>(m, "ExecutionSummary")
        .def(py::init<>())
        .def_readwrite("total_actions",   &ExecutionSummary::total_actions)
        .def_readwrite("successful",      &ExecutionSummary::successful)
        .def_readwrite("failed",          &ExecutionSummary::failed)
        .def_readwrite("success_rate",    &ExecutionSummary::success_rate)
        .def_readwrite("total_latency",   &ExecutionSummary::total_latency)
        .def_readwrite("average_latency", &ExecutionSummary::average_latency)
        .def_readwrite("total_cost",      &ExecutionSummary::total_cost)
        .def_readwrite("cancelled",       &ExecutionSummary::cancelled)
        .def_readwrite("results",         &ExecutionSummary::results)
        .def_readwrite("errors",          &ExecutionSummary::errors)
        .def_readwrite("attempts",        &ExecutionSummary::attempts)
        .def("find", [](const ExecutionSummary& s, const ActionId& id) -> std::optional<ActionResult> {
            const auto* r = s.find(id);
            if (r == nullptr) return std::nullopt;
            return *r;
        }, py::arg("action_id"));

    // ---- Provider traffic -------------------------------------------------

    py::class_<ProviderRequest>(m, "ProviderRequest")
        .def(py::init<>())
        .def_readwrite("action_id",          &ProviderRequest::action_id)
        .def_readwrite("agent_id",           &ProviderRequest::agent_id)
        .def_readwrite("type",               &ProviderRequest::type)
        .def_readwrite("parameters",         &ProviderRequest::parameters)
        .def_readwrite("model",              &ProviderRequest::model)
        .def_readwrite("priority",           &ProviderRequest::priority)
        .def_readwrite("timeout",            &ProviderRequest::timeout)
        .def_readwrite("excluded_providers", &ProviderRequest::excluded_providers)
        .def_readwrite("fallback_model",     &ProviderRequest::fallback_model)
        .def_readwrite("max_context_tokens", &ProviderRequest::max_context_tokens)
        .def_readwrite("charge_agent",       &ProviderRequest::charge_agent)
        .def_readwrite("cancellation",       &ProviderRequest::cancellation);

    py::class_<ProviderResponse>(m, "ProviderResponse")
        .def(py::init<>())
        .def(py::init([](std::string payload, std::int64_t input_tokens, std::int64_t output_tokens) {
                 ProviderResponse r;
                 r.payload = std::move(payload);
                 r.input_tokens = input_tokens;
                 r.output_tokens = output_tokens;
                 return r;
             }),
             py::arg("payload"), py::arg("input_tokens") = 0, py::arg("output_tokens") = 0)
        .def_readwrite("payload",       &ProviderResponse::payload)
        .def_readwrite("input_tokens",  &ProviderResponse::input_tokens)
        .def_readwrite("output_tokens", &ProviderResponse::output_tokens)
        .def_readwrite("model",         &ProviderResponse::model);

    py::class_<RouteResult>(m, "RouteResult")
        .def(py::init<>())
        .def_readwrite("success",         &RouteResult::success)
        .def_readwrite("provider_id",     &RouteResult::provider_id)
        .def_readwrite("response",        &RouteResult::response)
        .def_readwrite("error",           &RouteResult::error)
        .def_readwrite("latency",         &RouteResult::latency)
        .def_readwrite("cost",            &RouteResult::cost)
        .def_readwrite("attempts",        &RouteResult::attempts)
        .def_readwrite("tried_providers", &RouteResult::tried_providers)
        .def_readwrite("last_error_kind", &RouteResult::last_error_kind)
        .def_readwrite("retryable",       &RouteResult::retryable)
        .def_readwrite("permanent_failures", &RouteResult::permanent_failures);

    py::class_<ProviderCostSummary>(m, "ProviderCostSummary")
        .def(py::init<>())
        .def_readwrite("provider_id",   &ProviderCostSummary::provider_id)
        .def_readwrite("total_cost",    &ProviderCostSummary::total_cost)
        .def_readwrite("requests",      &ProviderCostSummary::requests)
        .def_readwrite("successes",     &ProviderCostSummary::successes)
        .def_readwrite("failures",      &ProviderCostSummary::failures)
        .def_readwrite("input_tokens",  &ProviderCostSummary::input_tokens)
        .def_readwrite("output_tokens", &ProviderCostSummary::output_tokens)
        .def_readwrite("in_flight",     &ProviderCostSummary::in_flight);

    py::class_<AgentCostSummary>(m, "AgentCostSummary")
        .def(py::init<>())
        .def_readwrite("agent_id",      &AgentCostSummary::agent_id)
        .def_readwrite("total_cost",    &AgentCostSummary::total_cost)
        .def_readwrite("requests",      &AgentCostSummary::requests)
        .def_readwrite("successes",     &AgentCostSummary::successes)
        .def_readwrite("failures",      &AgentCostSummary::failures)
        .def_readwrite("input_tokens",  &AgentCostSummary::input_tokens)
        .def_readwrite("output_tokens", &AgentCostSummary::output_tokens);

    py::class_<HealthMetrics>(m, "HealthMetrics")
        .def(py::init<>())
        .def_readwrite("provider_id",          &HealthMetrics::provider_id)
        .def_readwrite("success_rate",         &HealthMetrics::success_rate)
        .def_readwrite("error_rate",           &HealthMetrics::error_rate)
        .def_readwrite("avg_latency",          &HealthMetrics::avg_latency)
        .def_readwrite("window_samples",       &HealthMetrics::window_samples)
        .def_readwrite("consecutive_failures", &HealthMetrics::consecutive_failures)
        .def_readwrite("total_requests",       &HealthMetrics::total_requests)
        .def_readwrite("total_errors",         &HealthMetrics::total_errors)
        .def_readwrite("last_check",           &HealthMetrics::last_check)
        .def_readwrite("status",               &HealthMetrics::status)
        .def_readwrite("override_status",      &HealthMetrics::override_status)
        .def("effective_status", &HealthMetrics::effective_status);

    // ---- Budgets ----------------------------------------------------------

    py::class_<BudgetState>(m, "BudgetState")
        .def(py::init<>())
        .def_readwrite("total_input_tokens",  &BudgetState::total_input_tokens)
        .def_readwrite("total_output_tokens", &BudgetState::total_output_tokens)
        .def_readwrite("total_tokens",        &BudgetState::total_tokens)
        .def_readwrite("total_cost_usd",      &BudgetState::total_cost_usd)
        .def_readwrite("model_costs",         &BudgetState::model_costs)
        .def_readwrite("model_tokens",        &BudgetState::model_tokens)
        .def_readwrite("node_costs",          &BudgetState::node_costs)
        .def_readwrite("node_tokens",         &BudgetState::node_tokens)
        .def_readwrite("budget_limit_usd",    &BudgetState::budget_limit_usd)
        .def_readwrite("warning_threshold",   &BudgetState::warning_threshold)
        .def_readwrite("max_context_tokens",  &BudgetState::max_context_tokens)
        .def_readwrite("budget_exceeded",     &BudgetState::budget_exceeded);

    py::class_<BudgetStatus>(m, "BudgetStatus")
        .def(py::init<>())
        .def_readwrite("budget_used",      &BudgetStatus::budget_used)
        .def_readwrite("budget_remaining", &BudgetStatus::budget_remaining)
        .def_readwrite("budget_usage",     &BudgetStatus::budget_usage)
        .def_readwrite("is_warning",       &BudgetStatus::is_warning)
        .def_readwrite("is_exceeded",      &BudgetStatus::is_exceeded);

    py::class_<DegradationConfig>(m, "DegradationConfig")
        .def(py::init<>())
        .def_readwrite("model",              &DegradationConfig::model)
        .def_readwrite("max_context_tokens", &DegradationConfig::max_context_tokens);

    // Bound under a different name so it does not shadow the exception type
    py::class_<BudgetExceededError>(m, "BudgetExceededDetails")
        .def(py::init<>())
        .def_readwrite("message",          &BudgetExceededError::message)
        .def_readwrite("budget_limit_usd", &BudgetExceededError::budget_limit_usd)
        .def_readwrite("current_cost_usd", &BudgetExceededError::current_cost_usd)
        .def_readwrite("budget_usage",     &BudgetExceededError::budget_usage)
        .def_readwrite("suggestion",       &BudgetExceededError::suggestion)
        .def_readwrite("state_preserved",  &BudgetExceededError::state_preserved);

    py::class_<Reservation>(m, "Reservation")
        .def(py::init<>())
        .def_readwrite("id",          &Reservation::id)
        .def_readwrite("amount",      &Reservation::amount)
        .def_readwrite("action",      &Reservation::action)
        .def_readwrite("degradation", &Reservation::degradation)
        .def("admitted", &Reservation::admitted);

    // ---- Queue ------------------------------------------------------------

    py::class_<QueuedRequest>(m, "QueuedRequest")
        .def(py::init<>())
        .def_readwrite("id",          &QueuedRequest::id)
        .def_readwrite("agent_id",    &QueuedRequest::agent_id)
        .def_readwrite("payload",     &QueuedRequest::payload)
        .def_readwrite("priority",    &QueuedRequest::priority)
        .def_readwrite("created_at",  &QueuedRequest::created_at)
        .def_readwrite("retry_count", &QueuedRequest::retry_count)
        .def_readwrite("max_retries", &QueuedRequest::max_retries);

    // ---- Observability ----------------------------------------------------

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",             &MonitorEvent::type)
        .def_readwrite("timestamp",        &MonitorEvent::timestamp)
        .def_readwrite("message",          &MonitorEvent::message)
        .def_readwrite("action_id",        &MonitorEvent::action_id)
        .def_readwrite("provider_id",      &MonitorEvent::provider_id)
        .def_readwrite("agent_id",         &MonitorEvent::agent_id)
        .def_readwrite("level",            &MonitorEvent::level)
        .def_readwrite("attempt",          &MonitorEvent::attempt)
        .def_readwrite("error_kind",       &MonitorEvent::error_kind)
        .def_readwrite("health_status",    &MonitorEvent::health_status)
        .def_readwrite("guardrail_action", &MonitorEvent::guardrail_action)
        .def_readwrite("cost_usd",         &MonitorEvent::cost_usd)
        .def_readwrite("latency_ms",       &MonitorEvent::latency_ms);

    py::class_<ProviderSnapshot>(m, "ProviderSnapshot")
        .def(py::init<>())
        .def_readwrite("id",             &ProviderSnapshot::id)
        .def_readwrite("priority",       &ProviderSnapshot::priority)
        .def_readwrite("status",         &ProviderSnapshot::status)
        .def_readwrite("in_flight",      &ProviderSnapshot::in_flight)
        .def_readwrite("total_cost",     &ProviderSnapshot::total_cost)
        .def_readwrite("success_rate",   &ProviderSnapshot::success_rate)
        .def_readwrite("avg_latency_ms", &ProviderSnapshot::avg_latency_ms);

    py::class_<AgentSnapshot>(m, "AgentSnapshot")
        .def(py::init<>())
        .def_readwrite("agent_id",      &AgentSnapshot::agent_id)
        .def_readwrite("total_cost",    &AgentSnapshot::total_cost)
        .def_readwrite("requests",      &AgentSnapshot::requests)
        .def_readwrite("input_tokens",  &AgentSnapshot::input_tokens)
        .def_readwrite("output_tokens", &AgentSnapshot::output_tokens);

    py::class_<SystemSnapshot>(m, "SystemSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp",               &SystemSnapshot::timestamp)
        .def_readwrite("providers",               &SystemSnapshot::providers)
        .def_readwrite("agents",                  &SystemSnapshot::agents)
        .def_readwrite("global_tokens_remaining", &SystemSnapshot::global_tokens_remaining)
        .def_readwrite("pending_requests",        &SystemSnapshot::pending_requests);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("actions_dispatched", &MetricsMonitor::Metrics::actions_dispatched)
        .def_readwrite("actions_succeeded",  &MetricsMonitor::Metrics::actions_succeeded)
        .def_readwrite("actions_failed",     &MetricsMonitor::Metrics::actions_failed)
        .def_readwrite("actions_retried",    &MetricsMonitor::Metrics::actions_retried)
        .def_readwrite("actions_skipped",    &MetricsMonitor::Metrics::actions_skipped)
        .def_readwrite("provider_failovers", &MetricsMonitor::Metrics::provider_failovers)
        .def_readwrite("provider_errors",    &MetricsMonitor::Metrics::provider_errors)
        .def_readwrite("rate_limited",       &MetricsMonitor::Metrics::rate_limited)
        .def_readwrite("budget_warnings",    &MetricsMonitor::Metrics::budget_warnings)
        .def_readwrite("budget_halts",       &MetricsMonitor::Metrics::budget_halts)
        .def_readwrite("health_changes",     &MetricsMonitor::Metrics::health_changes)
        .def_readwrite("requests_dropped",   &MetricsMonitor::Metrics::requests_dropped)
        .def_readwrite("average_latency_ms", &MetricsMonitor::Metrics::average_latency_ms)
        .def_readwrite("total_cost_usd",     &MetricsMonitor::Metrics::total_cost_usd);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_ConductorError =
        py::register_exception<ConductorException>(m, "ConductorError", PyExc_RuntimeError);

    static auto py_InvalidConfigError =
        py::register_exception<InvalidConfigException>(m, "InvalidConfigError", py_ConductorError.ptr());
    static auto py_InvalidPlanError =
        py::register_exception<InvalidPlanException>(m, "InvalidPlanError", py_ConductorError.ptr());

    // Derived from InvalidPlanError
    static auto py_CyclicDependencyError =
        py::register_exception<CyclicDependencyException>(m, "CyclicDependencyError", py_InvalidPlanError.ptr());
    static auto py_DuplicateActionError =
        py::register_exception<DuplicateActionException>(m, "DuplicateActionError", py_InvalidPlanError.ptr());
    static auto py_UnknownDependencyError =
        py::register_exception<UnknownDependencyException>(m, "UnknownDependencyError", py_InvalidPlanError.ptr());

    // Derived from ConductorError
    static auto py_ProviderNotFoundError =
        py::register_exception<ProviderNotFoundException>(m, "ProviderNotFoundError", py_ConductorError.ptr());
    static auto py_QueueFullError =
        py::register_exception<QueueFullException>(m, "QueueFullError", py_ConductorError.ptr());
    static auto py_BudgetExceededError =
        py::register_exception<BudgetExceededException>(m, "BudgetExceededError", py_ConductorError.ptr());
    static auto py_ProviderError =
        py::register_exception<ProviderError>(m, "ProviderError", py_ConductorError.ptr());
}
