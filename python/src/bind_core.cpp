#include "bind_forward.hpp"
#include <conductor/conductor.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace conductor;

// ---------------------------------------------------------------------------
// bind_core  --  CancellationToken, RunOptions, BudgetLedger, Orchestrator
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // CancellationToken / RunOptions
    // ===================================================================
    py::class_<CancellationToken, std::shared_ptr<CancellationToken>>(m, "CancellationToken")
        .def(py::init<>())
        .def("cancel",    &CancellationToken::cancel)
        .def("cancelled", &CancellationToken::cancelled);

    // on_result is called from worker threads; the functional caster
    // takes the GIL around the Python call
    py::class_<RunOptions>(m, "RunOptions")
        .def(py::init<>())
        .def_readwrite("max_concurrency", &RunOptions::max_concurrency)
        .def_readwrite("stop_on_failure", &RunOptions::stop_on_failure)
        .def_readwrite("cancellation",    &RunOptions::cancellation)
        .def_readwrite("on_result",       &RunOptions::on_result);

    // ===================================================================
    // BudgetLedger (created by Orchestrator.create_ledger)
    // ===================================================================
    py::class_<BudgetLedger, std::shared_ptr<BudgetLedger>>(m, "BudgetLedger")
        .def("reserve", &BudgetLedger::reserve,
             py::arg("estimated_cost"), py::arg("node") = "")
        .def("commit",
             py::overload_cast<const Reservation&, const std::string&, const std::string&,
                               std::int64_t, std::int64_t>(&BudgetLedger::commit),
             py::arg("reservation"), py::arg("model"), py::arg("node"),
             py::arg("input_tokens"), py::arg("output_tokens"))
        .def("commit",
             py::overload_cast<const Reservation&, const std::string&, const std::string&,
                               std::int64_t, std::int64_t, double>(&BudgetLedger::commit),
             py::arg("reservation"), py::arg("model"), py::arg("node"),
             py::arg("input_tokens"), py::arg("output_tokens"), py::arg("cost"))
        .def("release",        &BudgetLedger::release, py::arg("reservation"))
        .def("snapshot",       &BudgetLedger::snapshot)
        .def("reserved",       &BudgetLedger::reserved)
        .def("current_action", &BudgetLedger::current_action)
        .def("exceeded_error", &BudgetLedger::exceeded_error)
        .def("set_monitor",    &BudgetLedger::set_monitor, py::arg("monitor"));

    // ===================================================================
    // Orchestrator
    // ===================================================================
    py::class_<Orchestrator>(m, "Orchestrator")
        .def(py::init<Config, std::shared_ptr<ProviderClient>, std::shared_ptr<Monitor>>(),
             py::arg("config"), py::arg("client"), py::arg("monitor") = nullptr,
             py::keep_alive<1, 3>(), py::keep_alive<1, 4>())

        // ------------- Batches -------------
        .def("plan", &Orchestrator::plan, py::arg("actions"))
        .def("run", &Orchestrator::run,
             py::arg("plan"), py::arg("ledger") = nullptr, py::arg("options") = RunOptions{},
             py::call_guard<py::gil_scoped_release>())
        .def("execute", &Orchestrator::execute,
             py::arg("actions"), py::arg("ledger") = nullptr, py::arg("options") = RunOptions{},
             py::call_guard<py::gil_scoped_release>())

        // ------------- Budgets -------------
        .def("create_ledger", py::overload_cast<>(&Orchestrator::create_ledger, py::const_))
        .def("create_ledger", py::overload_cast<double>(&Orchestrator::create_ledger, py::const_),
             py::arg("budget_limit_usd"))

        // ------------- Queued requests -------------
        .def("submit",
             [](Orchestrator& self, QueuedRequest request, py::object callback) -> RequestId {
                 Orchestrator::QueuedResponseCallback cpp_cb;
                 if (!callback.is_none()) {
                     cpp_cb = [cb = std::move(callback)](RequestId id, const RouteResult& result) {
                         py::gil_scoped_acquire acquire;
                         cb(id, result);
                     };
                 }
                 return self.submit(std::move(request), std::move(cpp_cb));
             },
             py::arg("request"), py::arg("callback") = py::none())
        .def("cancel",                &Orchestrator::cancel, py::arg("id"))
        .def("pending_request_count", &Orchestrator::pending_request_count)

        // ------------- Health -------------
        .def("set_health_probe",
             [](Orchestrator& self, py::function probe) {
                 HealthProbe cpp_probe = [p = py::object(probe)](const ProviderConfig& provider) {
                     py::gil_scoped_acquire acquire;
                     return p(provider).cast<bool>();
                 };
                 self.set_health_probe(std::move(cpp_probe));
             },
             py::arg("probe"))

        // ------------- Observability -------------
        .def("snapshot",         &Orchestrator::snapshot)
        .def("publish_snapshot", &Orchestrator::publish_snapshot)
        .def("set_monitor",      &Orchestrator::set_monitor, py::arg("monitor"),
             py::keep_alive<1, 2>())
        .def("monitor",          &Orchestrator::monitor)

        // ------------- Components -------------
        .def("config",       &Orchestrator::config, py::return_value_policy::reference_internal)
        .def("rate_limiter", &Orchestrator::rate_limiter, py::return_value_policy::reference_internal)
        .def("health",       &Orchestrator::health, py::return_value_policy::reference_internal)
        .def("router",       &Orchestrator::router, py::return_value_policy::reference_internal)
        .def("guardrail",    &Orchestrator::guardrail, py::return_value_policy::reference_internal)
        .def("cost_tracker", &Orchestrator::cost_tracker, py::return_value_policy::reference_internal)
        .def("pricing",      &Orchestrator::pricing, py::return_value_policy::reference_internal)

        // ------------- Lifecycle -------------
        .def("start",      &Orchestrator::start)
        .def("stop",       &Orchestrator::stop, py::call_guard<py::gil_scoped_release>())
        .def("is_running", &Orchestrator::is_running);
}
