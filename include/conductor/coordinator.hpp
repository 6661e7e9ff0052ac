#pragma once

#include "conductor/types.hpp"
#include "conductor/config.hpp"
#include "conductor/action.hpp"
#include "conductor/monitor.hpp"
#include "conductor/cancellation.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace conductor {

class Router;
class CostTracker;
class BudgetLedger;

// Invoked after each terminal ActionResult, from a worker thread
using ResultHandler = std::function<void(const Action&, const ActionResult&)>;

struct RunOptions {
    std::optional<std::size_t> max_concurrency;
    std::optional<bool> stop_on_failure;
    std::shared_ptr<CancellationToken> cancellation;
    ResultHandler on_result;
};

// Turns a batch of actions into dependency levels and executes them.
//
// Levels run strictly in order. Inside a level a bounded set of workers
// pulls actions; each action goes through budget reservation, routing and
// (when the router saw a transient failure) backoff plus re-dispatch that
// skips providers which refused permanently. Every action ends with
// exactly one terminal result.
class ExecutionCoordinator {
public:
    ExecutionCoordinator(Router& router,
                         CoordinatorConfig config = CoordinatorConfig{},
                         std::shared_ptr<const CostTracker> tracker = nullptr);

    // Non-copyable
    ExecutionCoordinator(const ExecutionCoordinator&) = delete;
    ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

    // Throws DuplicateActionException, UnknownDependencyException or
    // CyclicDependencyException; nothing is dispatched in that case.
    ExecutionPlan plan(const std::vector<Action>& actions) const;

    // ledger may be null: no budget enforcement for this run
    ExecutionSummary run(const ExecutionPlan& plan,
                         const RunOptions& options = RunOptions{},
                         BudgetLedger* ledger = nullptr);

    // plan() then run()
    ExecutionSummary execute(const std::vector<Action>& actions,
                             const RunOptions& options = RunOptions{},
                             BudgetLedger* ledger = nullptr);

    static ExecutionSummary collect_results(const std::vector<ActionResult>& results);

    // Estimated USD cost of one call of `action`, used for the projected check
    double estimate_cost(const Action& action) const;

    const CoordinatorConfig& config() const noexcept { return config_; }

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct ActionRun {
        ActionResult result;                 // terminal
        std::vector<ActionResult> attempts;  // dispatched attempts in order
    };

    Router& router_;
    CoordinatorConfig config_;
    std::shared_ptr<const CostTracker> tracker_;

    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    std::vector<ActionRun> run_level(const std::vector<Action>& level,
                                     std::size_t level_index,
                                     std::size_t concurrency,
                                     const RunOptions& options,
                                     BudgetLedger* ledger);

    ActionRun execute_action(const Action& action,
                             std::size_t level_index,
                             const RunOptions& options,
                             BudgetLedger* ledger);

    ActionResult terminal_result(const Action& action, ErrorKind kind,
                                 const std::string& message, int attempt) const;

    void emit_event(EventType type, const std::string& message,
                    const std::optional<ActionId>& action_id = std::nullopt,
                    std::optional<std::size_t> level = std::nullopt,
                    std::optional<int> attempt = std::nullopt,
                    std::optional<ErrorKind> kind = std::nullopt) const;

    std::shared_ptr<Monitor> monitor() const;
};

} // namespace conductor
