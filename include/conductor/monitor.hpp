#pragma once

#include "conductor/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace conductor {

enum class EventType {
    // Coordinator
    PlanCreated,
    LevelStarted,
    LevelCompleted,
    ActionDispatched,
    ActionRetrying,
    ActionSucceeded,
    ActionFailed,
    ActionSkipped,
    ActionCancelled,
    BatchCancelled,
    // Router
    ProviderSelected,
    ProviderFailover,
    ProviderRequestFailed,
    AllProvidersFailed,
    // Health
    ProviderHealthChanged,
    HealthCheckPerformed,
    HealthOverrideSet,
    // Rate limiting and queue
    RateLimited,
    RequestEnqueued,
    RequestRequeued,
    RequestDropped,
    // Budget
    BudgetWarning,
    BudgetDegraded,
    BudgetHalted,
    BudgetUpdated
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<ActionId> action_id;
    std::optional<ProviderId> provider_id;
    std::optional<AgentKey> agent_id;
    std::optional<std::size_t> level;
    std::optional<int> attempt;
    std::optional<ErrorKind> error_kind;
    std::optional<HealthStatus> health_status;
    std::optional<GuardrailAction> guardrail_action;
    std::optional<double> cost_usd;

    // Call latency in milliseconds
    std::optional<double> latency_ms;
};

struct ProviderSnapshot {
    ProviderId id;
    int priority{0};
    HealthStatus status{HealthStatus::Healthy};
    std::size_t in_flight{0};
    double total_cost{0.0};
    double success_rate{1.0};
    double avg_latency_ms{0.0};
};

struct AgentSnapshot {
    AgentKey agent_id;
    double total_cost{0.0};
    std::uint64_t requests{0};
    std::int64_t input_tokens{0};
    std::int64_t output_tokens{0};
};

// Process-wide view for an external metrics collaborator
struct SystemSnapshot {
    Timestamp timestamp{};
    std::vector<ProviderSnapshot> providers;
    std::vector<AgentSnapshot> agents;          // sorted by agent id
    double global_tokens_remaining{0.0};
    std::size_t pending_requests{0};
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const SystemSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t actions_dispatched{0};
        std::uint64_t actions_succeeded{0};
        std::uint64_t actions_failed{0};
        std::uint64_t actions_retried{0};
        std::uint64_t actions_skipped{0};
        std::uint64_t provider_failovers{0};
        std::uint64_t provider_errors{0};
        std::uint64_t rate_limited{0};
        std::uint64_t budget_warnings{0};
        std::uint64_t budget_halts{0};
        std::uint64_t health_changes{0};
        std::uint64_t requests_dropped{0};
        double average_latency_ms{0.0};
        double total_cost_usd{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_unhealthy_alert(AlertCallback cb);
    void set_queue_size_alert_threshold(std::size_t threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    AlertCallback unhealthy_cb_;
    std::size_t queue_size_threshold_{0};
    AlertCallback queue_size_cb_;

    std::uint64_t latency_sample_count_{0};
    double latency_sum_ms_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SystemSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

// Stamps and forwards an event when a monitor is attached.
inline void emit(const std::shared_ptr<Monitor>& monitor, MonitorEvent event) {
    if (!monitor) return;
    event.timestamp = Clock::now();
    monitor->on_event(event);
}

inline MonitorEvent make_event(EventType type, std::string message) {
    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = std::move(message);
    return event;
}

} // namespace conductor
