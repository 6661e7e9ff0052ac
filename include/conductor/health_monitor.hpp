#pragma once

#include "conductor/types.hpp"
#include "conductor/config.hpp"
#include "conductor/monitor.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace conductor {

struct HealthMetrics {
    ProviderId provider_id;

    // Rolling (windowed) values
    double success_rate{1.0};
    double error_rate{0.0};
    Duration avg_latency{};
    std::size_t window_samples{0};

    int consecutive_failures{0};

    // Cumulative since start or last reset
    std::uint64_t total_requests{0};
    std::uint64_t total_errors{0};

    std::optional<Timestamp> last_check;

    // Status derived from metrics; the effective status honors the override
    HealthStatus status{HealthStatus::Healthy};
    std::optional<HealthStatus> override_status;

    HealthStatus effective_status() const noexcept {
        return override_status.value_or(status);
    }
};

// Lightweight synthetic request against a provider; true = healthy.
using HealthProbe = std::function<bool(const ProviderConfig&)>;

// Tracks per-provider outcomes and derives Healthy / Degraded / Unhealthy.
//
// Status is re-evaluated after every recorded outcome. When periodic checks
// are started, a background thread probes each provider at its configured
// interval so an idle failing provider is detected without live traffic.
class ProviderHealthMonitor {
public:
    ProviderHealthMonitor(std::vector<ProviderConfig> providers, HealthConfig config = HealthConfig{});
    ~ProviderHealthMonitor();

    // Non-copyable
    ProviderHealthMonitor(const ProviderHealthMonitor&) = delete;
    ProviderHealthMonitor& operator=(const ProviderHealthMonitor&) = delete;

    void add_provider(const ProviderConfig& provider);

    // Traffic-driven update. Returns the effective status afterwards.
    // Throws ProviderNotFoundException for unknown ids.
    HealthStatus record_result(const ProviderId& id, bool success, Duration latency);

    // Run the probe once, synchronously, and record its outcome.
    HealthStatus check_provider_health(const ProviderId& id);

    void set_probe(HealthProbe probe);

    // Administrative
    void set_override(const ProviderId& id, HealthStatus status);
    void clear_override(const ProviderId& id);
    void reset(const ProviderId& id);

    // Queries
    HealthStatus get_status(const ProviderId& id) const;
    HealthMetrics get_metrics(const ProviderId& id) const;
    std::vector<ProviderId> get_healthy_providers() const;
    std::vector<ProviderId> get_available_providers() const;   // not Unhealthy, by priority
    std::unordered_map<ProviderId, HealthMetrics> health_summary() const;

    // Periodic checks
    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct ProviderRecord {
        ProviderConfig config;
        HealthMetrics metrics;
        std::deque<bool> outcomes;
        std::deque<Duration> latencies;
        Timestamp next_probe{};
    };

    struct StatusChange {
        ProviderId id;
        HealthStatus from;
        HealthStatus to;
    };

    HealthConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<ProviderId, ProviderRecord> records_;
    HealthProbe probe_;
    std::shared_ptr<Monitor> monitor_;

    std::thread checker_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    void check_loop();
    void probe_due_providers();

    // Caller must hold mutex_
    ProviderRecord& record_for(const ProviderId& id);
    const ProviderRecord& record_for(const ProviderId& id) const;
    std::optional<StatusChange> apply_outcome(ProviderRecord& record, bool success, Duration latency);
    void recompute(ProviderRecord& record);
    HealthStatus evaluate(const ProviderRecord& record) const;

    void emit_change(const StatusChange& change, const std::string& reason);
};

} // namespace conductor
