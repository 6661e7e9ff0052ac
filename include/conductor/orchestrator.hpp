#pragma once

#include "conductor/types.hpp"
#include "conductor/config.hpp"
#include "conductor/action.hpp"
#include "conductor/budget.hpp"
#include "conductor/coordinator.hpp"
#include "conductor/guardrail.hpp"
#include "conductor/health_monitor.hpp"
#include "conductor/monitor.hpp"
#include "conductor/provider.hpp"
#include "conductor/rate_limiter.hpp"
#include "conductor/request_queue.hpp"
#include "conductor/router.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace conductor {

// Process-wide entry point.
//
// Builds the rate limiter, health monitor, router, pricing and coordinator
// from one Config and owns their lifecycle. Provider health and rate-limit
// buckets are shared by every batch; budgets are per request chain and come
// from create_ledger().
//
// Unless replaced with set_health_probe(), providers are probed with a
// small "health_check" request through the same client, which is how an
// Unhealthy provider returns to rotation while periodic checks run.
class Orchestrator {
public:
    using QueuedResponseCallback = std::function<void(RequestId, const RouteResult&)>;

    Orchestrator(Config config,
                 std::shared_ptr<ProviderClient> client,
                 std::shared_ptr<Monitor> monitor = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ==================== Batches ====================

    ExecutionPlan plan(const std::vector<Action>& actions) const;

    ExecutionSummary run(const ExecutionPlan& plan,
                         BudgetLedger* ledger = nullptr,
                         const RunOptions& options = RunOptions{});

    ExecutionSummary execute(const std::vector<Action>& actions,
                             BudgetLedger* ledger = nullptr,
                             const RunOptions& options = RunOptions{});

    // ==================== Budgets ====================

    std::shared_ptr<BudgetLedger> create_ledger() const;
    std::shared_ptr<BudgetLedger> create_ledger(double budget_limit_usd) const;

    // ==================== Queued requests ====================

    // Queued requests are paced per agent and routed by the background
    // processor while the orchestrator is running.
    RequestId submit(QueuedRequest request, QueuedResponseCallback on_response = nullptr);
    bool cancel(RequestId id);
    std::size_t pending_request_count() const;

    // ==================== Health ====================

    void set_health_probe(HealthProbe probe);

    // ==================== Observability ====================

    SystemSnapshot snapshot() const;
    void publish_snapshot() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);
    std::shared_ptr<Monitor> monitor() const;

    // ==================== Components ====================

    const Config& config() const noexcept { return config_; }
    RateLimiter& rate_limiter() noexcept { return limiter_; }
    ProviderHealthMonitor& health() noexcept { return health_; }
    Router& router() noexcept { return router_; }
    ExecutionCoordinator& coordinator() noexcept { return coordinator_; }
    QueueManager& queues() noexcept { return queues_; }
    const BudgetGuardrail& guardrail() const noexcept { return *guardrail_; }
    const CostTracker& cost_tracker() const noexcept { return *tracker_; }
    PricingRegistry& pricing() noexcept { return *pricing_; }

    // ==================== Lifecycle ====================

    void start();
    void stop();
    bool is_running() const noexcept;

private:
    Config config_;

    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    std::shared_ptr<PricingRegistry> pricing_;
    std::shared_ptr<CostTracker> tracker_;
    std::shared_ptr<BudgetGuardrail> guardrail_;

    RateLimiter limiter_;
    ProviderHealthMonitor health_;
    Router router_;
    ExecutionCoordinator coordinator_;
    QueueManager queues_;

    mutable std::mutex callbacks_mutex_;
    std::unordered_map<RequestId, QueuedResponseCallback> callbacks_;

    std::thread processor_thread_;
    std::atomic<bool> running_{false};
    std::mutex processor_mutex_;
    std::condition_variable processor_cv_;

    void process_queue_loop();
    bool handle_queued(const QueuedRequest& request);
};

} // namespace conductor
