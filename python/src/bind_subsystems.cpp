#include "bind_forward.hpp"
#include <conductor/conductor.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace conductor;

// Trampoline class to allow Python subclassing of ProviderClient.
//
// Called from router worker threads. A Python exception carrying an
// `http_status` attribute is turned into a classified ProviderError; any
// other Python exception counts as a transient provider failure.
class PyProviderClient : public ProviderClient {
public:
    using ProviderClient::ProviderClient;

    ProviderResponse invoke(const ProviderConfig& provider, const ProviderRequest& request) override {
        py::gil_scoped_acquire acquire;
        try {
            PYBIND11_OVERRIDE_PURE(ProviderResponse, ProviderClient, invoke, provider, request);
        } catch (py::error_already_set& e) {
            std::optional<int> status;
            if (py::hasattr(e.value(), "http_status")) {
                py::object s = e.value().attr("http_status");
                if (!s.is_none()) status = s.cast<int>();
            }
            throw ProviderError(e.what(), status);
        }
    }
};

void bind_subsystems(py::module_& m) {
    // ProviderClient
    py::class_<ProviderClient, PyProviderClient, std::shared_ptr<ProviderClient>>(m, "ProviderClient")
        .def(py::init<>())
        .def("invoke", &ProviderClient::invoke, py::arg("provider"), py::arg("request"));

    m.def("classify_status", &classify_status, py::arg("http_status"));
    m.def("call_cost", &call_cost,
          py::arg("pricing"), py::arg("input_tokens"), py::arg("output_tokens"));

    // RateLimiter (owned by the Orchestrator)
    py::class_<Admission>(m, "Admission")
        .def(py::init<>())
        .def_readwrite("admitted",       &Admission::admitted)
        .def_readwrite("wait",           &Admission::wait)
        .def_readwrite("global_limited", &Admission::global_limited)
        .def_readwrite("agent_limited",  &Admission::agent_limited)
        .def_readwrite("provider_limited", &Admission::provider_limited);

    py::class_<RateLimiter::Stats>(m, "RateLimiterStats")
        .def(py::init<>())
        .def_readwrite("admitted",         &RateLimiter::Stats::admitted)
        .def_readwrite("denied",           &RateLimiter::Stats::denied)
        .def_readwrite("denied_by_global", &RateLimiter::Stats::denied_by_global)
        .def_readwrite("denied_by_agent",  &RateLimiter::Stats::denied_by_agent)
        .def_readwrite("denied_by_provider", &RateLimiter::Stats::denied_by_provider);

    py::class_<RateLimiter>(m, "RateLimiter")
        .def("configure_agent", &RateLimiter::configure_agent,
             py::arg("key"), py::arg("config"))
        .def("configure_provider", &RateLimiter::configure_provider,
             py::arg("provider_id"), py::arg("config"))
        .def("can_proceed", py::overload_cast<const AgentKey&>(&RateLimiter::can_proceed),
             py::arg("key"))
        .def("can_dispatch",
             [](RateLimiter& self, const ProviderId& provider, const AgentKey& agent) {
                 return self.can_dispatch(provider, agent, Clock::now());
             },
             py::arg("provider_id"), py::arg("agent_id") = AgentKey{})
        .def("get_wait_time",           &RateLimiter::get_wait_time, py::arg("key"))
        .def("remaining_tokens",        &RateLimiter::remaining_tokens, py::arg("key"))
        .def("provider_remaining_tokens", &RateLimiter::provider_remaining_tokens,
             py::arg("provider_id"))
        .def("global_remaining_tokens", &RateLimiter::global_remaining_tokens)
        .def("stats",                   &RateLimiter::stats)
        .def("reset",                   &RateLimiter::reset);

    // ProviderHealthMonitor (owned by the Orchestrator)
    py::class_<ProviderHealthMonitor>(m, "ProviderHealthMonitor")
        .def("record_result", &ProviderHealthMonitor::record_result,
             py::arg("provider_id"), py::arg("success"), py::arg("latency"))
        .def("check_provider_health", &ProviderHealthMonitor::check_provider_health,
             py::arg("provider_id"), py::call_guard<py::gil_scoped_release>())
        .def("set_override",   &ProviderHealthMonitor::set_override,
             py::arg("provider_id"), py::arg("status"))
        .def("clear_override", &ProviderHealthMonitor::clear_override, py::arg("provider_id"))
        .def("reset",          &ProviderHealthMonitor::reset, py::arg("provider_id"))
        .def("get_status",     &ProviderHealthMonitor::get_status, py::arg("provider_id"))
        .def("get_metrics",    &ProviderHealthMonitor::get_metrics, py::arg("provider_id"))
        .def("get_healthy_providers",   &ProviderHealthMonitor::get_healthy_providers)
        .def("get_available_providers", &ProviderHealthMonitor::get_available_providers)
        .def("health_summary",          &ProviderHealthMonitor::health_summary)
        .def("running",                 &ProviderHealthMonitor::running);

    // Router (owned by the Orchestrator)
    py::class_<Router>(m, "Router")
        .def("route", py::overload_cast<const ProviderRequest&>(&Router::route),
             py::arg("request"), py::call_guard<py::gil_scoped_release>())
        .def("set_strategy",
             [](Router& self, std::shared_ptr<SelectionStrategy> strategy) {
                 // Bridge shared_ptr (pybind11 holder) to unique_ptr (C++ API)
                 struct StrategyBridge : SelectionStrategy {
                     std::shared_ptr<SelectionStrategy> inner;
                     explicit StrategyBridge(std::shared_ptr<SelectionStrategy> s) : inner(std::move(s)) {}
                     std::vector<ProviderCandidate> order(
                         const std::vector<ProviderCandidate>& candidates) const override {
                         return inner->order(candidates);
                     }
                     std::string name() const override { return inner->name(); }
                 };
                 self.set_strategy(std::make_unique<StrategyBridge>(std::move(strategy)));
             },
             py::arg("strategy"))
        .def("strategy_name", &Router::strategy_name)
        .def("providers",     &Router::providers)
        .def("provider",      &Router::provider, py::arg("id"),
             py::return_value_policy::reference_internal)
        .def("in_flight",     &Router::in_flight, py::arg("id"))
        .def("cost_summary",  &Router::cost_summary)
        .def("agent_cost_summary", &Router::agent_cost_summary)
        .def("total_cost",    &Router::total_cost);

    // Pricing and cost tracking
    py::class_<PricingRegistry, std::shared_ptr<PricingRegistry>>(m, "PricingRegistry")
        .def(py::init<>())
        .def("get_pricing",      &PricingRegistry::get_pricing, py::arg("model_name"))
        .def("register_pricing", &PricingRegistry::register_pricing, py::arg("pricing"))
        .def("has_pricing",      &PricingRegistry::has_pricing, py::arg("model_name"))
        .def("default_pricing",  &PricingRegistry::default_pricing,
             py::return_value_policy::reference_internal);

    py::class_<CostTracker, std::shared_ptr<CostTracker>>(m, "CostTracker")
        .def(py::init<std::shared_ptr<PricingRegistry>, double, double, std::int64_t>(),
             py::arg("registry"), py::arg("budget_limit_usd") = 10.0,
             py::arg("warning_threshold") = 0.8, py::arg("max_context_tokens") = 8000)
        .def("calculate_cost", &CostTracker::calculate_cost,
             py::arg("model_name"), py::arg("input_tokens"), py::arg("output_tokens"))
        .def("update_after_call", &CostTracker::update_after_call,
             py::arg("state"), py::arg("model_name"), py::arg("node_name"),
             py::arg("input_tokens"), py::arg("output_tokens"))
        .def("check_budget_status", &CostTracker::check_budget_status, py::arg("state"))
        .def("new_state",           &CostTracker::new_state)
        .def("budget_limit_usd",    &CostTracker::budget_limit_usd)
        .def("warning_threshold",   &CostTracker::warning_threshold);

    // BudgetGuardrail - all methods are const
    py::class_<BudgetGuardrail, std::shared_ptr<BudgetGuardrail>>(m, "BudgetGuardrail")
        .def(py::init([](GuardrailConfig config, std::shared_ptr<CostTracker> tracker) {
                 return std::make_shared<BudgetGuardrail>(std::move(config), std::move(tracker));
             }),
             py::arg("config"), py::arg("tracker"))
        .def("check",              &BudgetGuardrail::check, py::arg("state"))
        .def("check_projected",    &BudgetGuardrail::check_projected,
             py::arg("state"), py::arg("estimated_cost"))
        .def("should_halt",        &BudgetGuardrail::should_halt, py::arg("state"))
        .def("degradation_config", &BudgetGuardrail::degradation_config, py::arg("state"))
        .def("budget_exceeded_error", &BudgetGuardrail::budget_exceeded_error, py::arg("state"))
        .def("enforce",            &BudgetGuardrail::enforce, py::arg("state"));
}
