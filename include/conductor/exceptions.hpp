#pragma once

#include "conductor/types.hpp"
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace conductor {

class ConductorException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidConfigException : public ConductorException {
public:
    using ConductorException::ConductorException;
};

class InvalidPlanException : public ConductorException {
public:
    using ConductorException::ConductorException;
};

class CyclicDependencyException : public InvalidPlanException {
public:
    explicit CyclicDependencyException(std::vector<ActionId> unresolved)
        : InvalidPlanException(build_message(unresolved))
        , unresolved_(std::move(unresolved)) {}

    // Actions left with unresolved dependencies when leveling stalled
    const std::vector<ActionId>& unresolved() const noexcept { return unresolved_; }

private:
    std::vector<ActionId> unresolved_;

    static std::string build_message(const std::vector<ActionId>& ids) {
        std::string msg = "Cyclic dependency among actions:";
        for (auto& id : ids) {
            msg += " " + id;
        }
        return msg;
    }
};

class DuplicateActionException : public InvalidPlanException {
public:
    explicit DuplicateActionException(const ActionId& id)
        : InvalidPlanException("Duplicate action id: " + id)
        , action_id_(id) {}

    const ActionId& action_id() const noexcept { return action_id_; }

private:
    ActionId action_id_;
};

class UnknownDependencyException : public InvalidPlanException {
public:
    UnknownDependencyException(const ActionId& action, const ActionId& dependency)
        : InvalidPlanException("Action " + action +
                               " depends on unknown action " + dependency)
        , action_id_(action)
        , dependency_id_(dependency) {}

    const ActionId& action_id() const noexcept { return action_id_; }
    const ActionId& dependency_id() const noexcept { return dependency_id_; }

private:
    ActionId action_id_;
    ActionId dependency_id_;
};

class ProviderNotFoundException : public ConductorException {
public:
    explicit ProviderNotFoundException(const ProviderId& id)
        : ConductorException("Provider not found: " + id)
        , provider_id_(id) {}

    const ProviderId& provider_id() const noexcept { return provider_id_; }

private:
    ProviderId provider_id_;
};

class QueueFullException : public ConductorException {
public:
    QueueFullException()
        : ConductorException("Request queue is full") {}
};

class BudgetExceededException : public ConductorException {
public:
    BudgetExceededException(double current_cost, double limit)
        : ConductorException(
            "Budget limit of $" + format_usd(limit) +
            " exceeded. Current cost: $" + format_usd(current_cost))
        , current_cost_(current_cost)
        , limit_(limit) {}

    double current_cost() const noexcept { return current_cost_; }
    double limit() const noexcept { return limit_; }

    static std::string format_usd(double v) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f", v);
        return buf;
    }

private:
    double current_cost_;
    double limit_;
};

} // namespace conductor
