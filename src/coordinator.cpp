#include "conductor/coordinator.hpp"
#include "conductor/budget.hpp"
#include "conductor/exceptions.hpp"
#include "conductor/guardrail.hpp"
#include "conductor/router.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace conductor {

namespace {

EventType event_for(ActionState state) {
    switch (state) {
        case ActionState::Dispatched: return EventType::ActionDispatched;
        case ActionState::Retrying:   return EventType::ActionRetrying;
        case ActionState::Succeeded:  return EventType::ActionSucceeded;
        case ActionState::Skipped:    return EventType::ActionSkipped;
        case ActionState::Cancelled:  return EventType::ActionCancelled;
        case ActionState::Pending:
        case ActionState::Failed:
            break;
    }
    return EventType::ActionFailed;
}

double to_ms(Duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

} // anonymous namespace

// ========== ExecutionCoordinator ==========

ExecutionCoordinator::ExecutionCoordinator(Router& router,
                                           CoordinatorConfig config,
                                           std::shared_ptr<const CostTracker> tracker)
    : router_(router)
    , config_(std::move(config))
    , tracker_(std::move(tracker))
{
    if (config_.max_concurrency == 0) {
        throw InvalidConfigException("max_concurrency must be at least 1");
    }
}

ExecutionPlan ExecutionCoordinator::plan(const std::vector<Action>& actions) const {
    std::unordered_map<ActionId, std::size_t> index;
    for (std::size_t i = 0; i < actions.size(); ++i) {
        if (!index.emplace(actions[i].id, i).second) {
            throw DuplicateActionException(actions[i].id);
        }
    }

    std::vector<std::size_t> in_degree(actions.size(), 0);
    std::vector<std::vector<std::size_t>> dependents(actions.size());
    for (std::size_t i = 0; i < actions.size(); ++i) {
        std::unordered_set<ActionId> seen;
        for (const auto& dep : actions[i].dependencies) {
            if (!seen.insert(dep).second) continue;     // listed twice
            auto it = index.find(dep);
            if (it == index.end()) {
                throw UnknownDependencyException(actions[i].id, dep);
            }
            in_degree[i]++;
            dependents[it->second].push_back(i);
        }
    }

    // Breadth-first leveling; input order is kept inside a level
    std::vector<std::size_t> current;
    for (std::size_t i = 0; i < actions.size(); ++i) {
        if (in_degree[i] == 0) current.push_back(i);
    }

    ExecutionPlan plan;
    std::size_t placed = 0;
    while (placed < actions.size()) {
        if (current.empty()) {
            std::vector<ActionId> unresolved;
            for (std::size_t i = 0; i < actions.size(); ++i) {
                if (in_degree[i] > 0) unresolved.push_back(actions[i].id);
            }
            throw CyclicDependencyException(std::move(unresolved));
        }

        std::vector<Action> level;
        std::vector<std::size_t> next;
        Duration level_estimate = Duration::zero();
        for (std::size_t i : current) {
            level.push_back(actions[i]);
            level_estimate = std::max(level_estimate,
                                      actions[i].timeout.value_or(config_.default_action_timeout));
            for (std::size_t d : dependents[i]) {
                if (--in_degree[d] == 0) next.push_back(d);
            }
        }
        std::sort(next.begin(), next.end());

        placed += level.size();
        plan.estimated_time += level_estimate;
        plan.levels.push_back(std::move(level));
        current = std::move(next);
    }
    plan.total_actions = actions.size();

    emit_event(EventType::PlanCreated,
               "Planned " + std::to_string(plan.total_actions) + " actions in " +
               std::to_string(plan.level_count()) + " levels");
    return plan;
}

ExecutionSummary ExecutionCoordinator::run(const ExecutionPlan& plan,
                                           const RunOptions& options,
                                           BudgetLedger* ledger) {
    const std::size_t concurrency = std::max<std::size_t>(
        1, options.max_concurrency.value_or(config_.max_concurrency));
    const bool stop_on_failure = options.stop_on_failure.value_or(config_.stop_on_failure);
    const auto& token = options.cancellation;

    std::vector<ActionResult> results;
    std::unordered_map<ActionId, std::vector<ActionResult>> attempts;
    bool upstream_failed = false;
    bool cancel_reported = false;

    auto finish_undispatched = [&](const Action& action, ActionState state,
                                   ErrorKind kind, const std::string& message,
                                   std::size_t level_index) {
        auto result = terminal_result(action, kind, message, 0);
        auto event = make_event(event_for(state), message);
        event.action_id = action.id;
        event.level = level_index;
        event.error_kind = kind;
        emit(monitor(), std::move(event));
        if (options.on_result) {
            options.on_result(action, result);
        }
        results.push_back(std::move(result));
    };

    for (std::size_t level_index = 0; level_index < plan.levels.size(); ++level_index) {
        const auto& level = plan.levels[level_index];

        if (upstream_failed) {
            for (const auto& action : level) {
                finish_undispatched(action, ActionState::Skipped,
                                    ErrorKind::SkippedDueToUpstreamFailure,
                                    "Skipped: an earlier level had a failure", level_index);
            }
            continue;
        }

        if (token && token->cancelled()) {
            if (!cancel_reported) {
                emit_event(EventType::BatchCancelled, "Batch cancelled", std::nullopt, level_index);
                cancel_reported = true;
            }
            for (const auto& action : level) {
                finish_undispatched(action, ActionState::Cancelled, ErrorKind::Cancelled,
                                    "Cancelled before dispatch", level_index);
            }
            continue;
        }

        emit_event(EventType::LevelStarted,
                   "Level " + std::to_string(level_index) + " with " +
                   std::to_string(level.size()) + " actions",
                   std::nullopt, level_index);

        auto runs = run_level(level, level_index, concurrency, options, ledger);

        bool level_failed = false;
        for (auto& r : runs) {
            if (!r.result.success) level_failed = true;
            if (!r.attempts.empty()) {
                attempts[r.result.action_id] = std::move(r.attempts);
            }
            results.push_back(std::move(r.result));
        }

        emit_event(EventType::LevelCompleted,
                   level_failed ? "Level completed with failures" : "Level completed",
                   std::nullopt, level_index);

        if (level_failed && stop_on_failure) {
            upstream_failed = true;
        }
    }

    auto summary = collect_results(results);
    summary.attempts = std::move(attempts);
    summary.cancelled = token && token->cancelled();
    if (summary.cancelled && !cancel_reported) {
        emit_event(EventType::BatchCancelled, "Batch cancelled");
    }
    return summary;
}

ExecutionSummary ExecutionCoordinator::execute(const std::vector<Action>& actions,
                                               const RunOptions& options,
                                               BudgetLedger* ledger) {
    return run(plan(actions), options, ledger);
}

ExecutionSummary ExecutionCoordinator::collect_results(const std::vector<ActionResult>& results) {
    ExecutionSummary summary;
    summary.total_actions = results.size();
    summary.results = results;

    for (const auto& r : results) {
        if (r.success) {
            summary.successful++;
        } else {
            summary.failed++;
            summary.errors.push_back(r.error);
        }
        summary.total_latency += r.latency;
        summary.total_cost += r.cost;
    }

    if (summary.total_actions > 0) {
        summary.success_rate = static_cast<double>(summary.successful) /
                               static_cast<double>(summary.total_actions);
        summary.average_latency = summary.total_latency /
                                  static_cast<Duration::rep>(summary.total_actions);
    }
    return summary;
}

double ExecutionCoordinator::estimate_cost(const Action& action) const {
    if (!tracker_) return 0.0;
    if (action.estimate.input_tokens == 0 && action.estimate.output_tokens == 0) return 0.0;
    return tracker_->calculate_cost(action.model,
                                    action.estimate.input_tokens,
                                    action.estimate.output_tokens);
}

void ExecutionCoordinator::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

std::vector<ExecutionCoordinator::ActionRun> ExecutionCoordinator::run_level(
    const std::vector<Action>& level,
    std::size_t level_index,
    std::size_t concurrency,
    const RunOptions& options,
    BudgetLedger* ledger)
{
    std::vector<ActionRun> runs(level.size());
    std::atomic<std::size_t> next{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    // Workers pull from the level's dispatch channel until it is empty
    auto worker = [&]() {
        while (true) {
            std::size_t i = next.fetch_add(1);
            if (i >= level.size()) return;
            try {
                runs[i] = execute_action(level[i], level_index, options, ledger);
                if (options.on_result) {
                    options.on_result(level[i], runs[i].result);
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
            }
        }
    };

    std::size_t worker_count = std::min(concurrency, level.size());
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t w = 0; w < worker_count; ++w) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return runs;
}

ExecutionCoordinator::ActionRun ExecutionCoordinator::execute_action(
    const Action& action,
    std::size_t level_index,
    const RunOptions& options,
    BudgetLedger* ledger)
{
    ActionRun run;
    const auto& token = options.cancellation;

    RetryPolicy policy;
    if (action.retry.has_value()) {
        policy = action.retry.value();
    } else {
        policy.max_attempts = config_.default_max_attempts;
        policy.backoff = config_.default_backoff;
        policy.base_delay = config_.default_base_delay;
        policy.max_delay = config_.default_max_delay;
    }
    const int max_attempts = std::max(1, policy.max_attempts);
    const double estimate = estimate_cost(action);

    ActionState state = ActionState::Pending;
    auto transition = [&](ActionState next, const std::string& message, int attempt,
                          const ActionResult* result) {
        state = next;
        auto event = make_event(event_for(state), message);
        event.action_id = action.id;
        event.level = level_index;
        event.attempt = attempt;
        if (result != nullptr) {
            if (!result->provider_id.empty()) event.provider_id = result->provider_id;
            if (result->error.kind != ErrorKind::None) event.error_kind = result->error.kind;
            event.latency_ms = to_ms(result->latency);
            event.cost_usd = result->cost;
        }
        emit(monitor(), std::move(event));
    };

    ProviderRequest request;
    request.action_id = action.id;
    request.agent_id = action.agent_id.empty() ? action.type : action.agent_id;
    request.type = action.type;
    request.parameters = action.parameters;
    request.model = action.model;
    request.priority = action.priority;
    request.timeout = action.timeout.value_or(config_.default_action_timeout);
    request.cancellation = token;

    for (int attempt = 1; ; ++attempt) {
        if (token && token->cancelled()) {
            run.result = terminal_result(action, ErrorKind::Cancelled,
                                         "Cancelled before dispatch", attempt - 1);
            transition(ActionState::Cancelled, run.result.error.message, attempt - 1, &run.result);
            return run;
        }

        Reservation reservation;
        if (ledger != nullptr) {
            reservation = ledger->reserve(estimate, action.id);
            if (!reservation.admitted()) {
                auto err = ledger->exceeded_error();
                run.result = terminal_result(action, ErrorKind::BudgetExceeded,
                    err.message + ". Estimated call cost: $" +
                    BudgetExceededException::format_usd(estimate),
                    attempt - 1);
                transition(ActionState::Failed, run.result.error.message, attempt - 1, &run.result);
                return run;
            }
            request.fallback_model.reset();
            request.max_context_tokens.reset();
            if (reservation.degradation.has_value()) {
                request.fallback_model = reservation.degradation->model;
                request.max_context_tokens = reservation.degradation->max_context_tokens;
            }
        }

        transition(ActionState::Dispatched, "Dispatching attempt " + std::to_string(attempt),
                   attempt, nullptr);

        RouteResult route = router_.route(request);

        ActionResult result;
        result.action_id = action.id;
        result.success = route.success;
        result.payload = route.response.payload;
        result.error = route.error;
        result.latency = route.latency;
        result.provider_id = route.provider_id;
        result.attempt = attempt;
        result.input_tokens = route.response.input_tokens;
        result.output_tokens = route.response.output_tokens;

        if (route.success) {
            result.cost = route.cost;
            if (ledger != nullptr) {
                std::string model = route.response.model;
                if (model.empty()) model = action.model;
                if (model.empty()) model = router_.provider(route.provider_id).model;
                result.cost = ledger->commit(reservation, model, action.id,
                                             route.response.input_tokens,
                                             route.response.output_tokens,
                                             route.cost);
            }
            run.attempts.push_back(result);
            run.result = result;
            transition(ActionState::Succeeded, "Action succeeded", attempt, &run.result);
            return run;
        }

        if (ledger != nullptr) {
            ledger->release(reservation);
        }
        run.attempts.push_back(result);

        if (result.error.kind == ErrorKind::Cancelled) {
            run.result = result;
            transition(ActionState::Cancelled, result.error.message, attempt, &run.result);
            return run;
        }

        // The router already walked the whole chain; a re-dispatch starts
        // from its head again, minus providers that refused permanently.
        if (route.retryable && attempt < max_attempts) {
            for (const auto& p : route.permanent_failures) {
                if (std::find(request.excluded_providers.begin(),
                              request.excluded_providers.end(), p) == request.excluded_providers.end()) {
                    request.excluded_providers.push_back(p);
                }
            }
            transition(ActionState::Retrying, result.error.message, attempt, &result);

            Duration delay = policy.delay_after(attempt);
            if (token) {
                token->wait_for(delay);     // returns early on cancel; loop top handles it
            } else {
                std::this_thread::sleep_for(delay);
            }
            continue;
        }

        run.result = result;
        transition(ActionState::Failed, result.error.message, attempt, &run.result);
        return run;
    }
}

ActionResult ExecutionCoordinator::terminal_result(const Action& action, ErrorKind kind,
                                                   const std::string& message, int attempt) const {
    ActionResult result;
    result.action_id = action.id;
    result.success = false;
    result.error = {kind, message};
    result.attempt = attempt;
    return result;
}

void ExecutionCoordinator::emit_event(EventType type, const std::string& message,
                                      const std::optional<ActionId>& action_id,
                                      std::optional<std::size_t> level,
                                      std::optional<int> attempt,
                                      std::optional<ErrorKind> kind) const {
    auto event = make_event(type, message);
    event.action_id = action_id;
    event.level = level;
    event.attempt = attempt;
    event.error_kind = kind;
    emit(monitor(), std::move(event));
}

std::shared_ptr<Monitor> ExecutionCoordinator::monitor() const {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    return monitor_;
}

} // namespace conductor
