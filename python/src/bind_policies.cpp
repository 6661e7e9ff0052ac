#include "bind_forward.hpp"
#include <conductor/conductor.hpp>
#include <pybind11/stl.h>

using namespace conductor;

// Trampoline class to allow Python subclassing of SelectionStrategy
class PySelectionStrategy : public SelectionStrategy {
public:
    using SelectionStrategy::SelectionStrategy;

    std::vector<ProviderCandidate> order(
        const std::vector<ProviderCandidate>& candidates) const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(
            std::vector<ProviderCandidate>, SelectionStrategy, order, candidates);
    }

    std::string name() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(std::string, SelectionStrategy, name);
    }
};

void bind_policies(py::module_& m) {
    py::class_<ProviderCandidate>(m, "ProviderCandidate")
        .def(py::init<>())
        .def_readwrite("id",        &ProviderCandidate::id)
        .def_readwrite("priority",  &ProviderCandidate::priority)
        .def_readwrite("status",    &ProviderCandidate::status)
        .def_readwrite("in_flight", &ProviderCandidate::in_flight);

    // --- Abstract SelectionStrategy with trampoline ---
    py::class_<SelectionStrategy, PySelectionStrategy, std::shared_ptr<SelectionStrategy>>(
            m, "SelectionStrategy")
        .def(py::init<>())
        .def("order", &SelectionStrategy::order)
        .def("name", &SelectionStrategy::name);

    // --- Concrete strategies ---

    py::class_<HealthBasedStrategy, SelectionStrategy, std::shared_ptr<HealthBasedStrategy>>(
            m, "HealthBasedStrategy")
        .def(py::init<>());

    py::class_<RoundRobinStrategy, SelectionStrategy, std::shared_ptr<RoundRobinStrategy>>(
            m, "RoundRobinStrategy")
        .def(py::init<>());

    py::class_<LeastConnectionsStrategy, SelectionStrategy, std::shared_ptr<LeastConnectionsStrategy>>(
            m, "LeastConnectionsStrategy")
        .def(py::init<>());
}
