#include "conductor/monitor.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>

namespace conductor {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::PlanCreated:           return "PlanCreated";
        case EventType::LevelStarted:          return "LevelStarted";
        case EventType::LevelCompleted:        return "LevelCompleted";
        case EventType::ActionDispatched:      return "ActionDispatched";
        case EventType::ActionRetrying:        return "ActionRetrying";
        case EventType::ActionSucceeded:       return "ActionSucceeded";
        case EventType::ActionFailed:          return "ActionFailed";
        case EventType::ActionSkipped:         return "ActionSkipped";
        case EventType::ActionCancelled:       return "ActionCancelled";
        case EventType::BatchCancelled:        return "BatchCancelled";
        case EventType::ProviderSelected:      return "ProviderSelected";
        case EventType::ProviderFailover:      return "ProviderFailover";
        case EventType::ProviderRequestFailed: return "ProviderRequestFailed";
        case EventType::AllProvidersFailed:    return "AllProvidersFailed";
        case EventType::ProviderHealthChanged: return "ProviderHealthChanged";
        case EventType::HealthCheckPerformed:  return "HealthCheckPerformed";
        case EventType::HealthOverrideSet:     return "HealthOverrideSet";
        case EventType::RateLimited:           return "RateLimited";
        case EventType::RequestEnqueued:       return "RequestEnqueued";
        case EventType::RequestRequeued:       return "RequestRequeued";
        case EventType::RequestDropped:        return "RequestDropped";
        case EventType::BudgetWarning:         return "BudgetWarning";
        case EventType::BudgetDegraded:        return "BudgetDegraded";
        case EventType::BudgetHalted:          return "BudgetHalted";
        case EventType::BudgetUpdated:         return "BudgetUpdated";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::ActionFailed:
        case EventType::ActionSkipped:
        case EventType::BatchCancelled:
        case EventType::ProviderFailover:
        case EventType::AllProvidersFailed:
        case EventType::ProviderHealthChanged:
        case EventType::HealthOverrideSet:
        case EventType::RequestDropped:
        case EventType::BudgetWarning:
        case EventType::BudgetDegraded:
        case EventType::BudgetHalted:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[Conductor] " << to_string(event.type);

    if (event.action_id.has_value()) {
        std::cout << " action=" << event.action_id.value();
    }
    if (event.provider_id.has_value()) {
        std::cout << " provider=" << event.provider_id.value();
    }
    if (event.agent_id.has_value()) {
        std::cout << " agent=" << event.agent_id.value();
    }
    if (event.level.has_value()) {
        std::cout << " level=" << event.level.value();
    }
    if (event.attempt.has_value()) {
        std::cout << " attempt=" << event.attempt.value();
    }
    if (event.error_kind.has_value()) {
        std::cout << " error=" << to_string(event.error_kind.value());
    }
    if (event.health_status.has_value()) {
        std::cout << " health=" << to_string(event.health_status.value());
    }
    if (event.guardrail_action.has_value()) {
        std::cout << " guardrail=" << to_string(event.guardrail_action.value());
    }
    if (verbosity_ == Verbosity::Debug) {
        if (event.cost_usd.has_value()) {
            std::cout << " cost=$" << std::fixed << std::setprecision(4)
                      << event.cost_usd.value();
        }
        if (event.latency_ms.has_value()) {
            std::cout << " latency=" << std::fixed << std::setprecision(1)
                      << event.latency_ms.value() << "ms";
        }
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const SystemSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[Conductor] === System Snapshot ===\n";
    std::cout << "  Pending requests: " << snapshot.pending_requests << "\n";
    std::cout << "  Global tokens: " << std::fixed << std::setprecision(1)
              << snapshot.global_tokens_remaining << "\n";
    std::cout << "  Providers:\n";

    for (auto& p : snapshot.providers) {
        std::cout << "    [" << p.id << "] prio=" << p.priority
                  << " status=" << to_string(p.status)
                  << " in_flight=" << p.in_flight
                  << " success=" << std::fixed << std::setprecision(1)
                  << (p.success_rate * 100.0) << "%"
                  << " latency=" << p.avg_latency_ms << "ms"
                  << " cost=$" << std::setprecision(4) << p.total_cost << "\n";
    }
    if (!snapshot.agents.empty()) {
        std::cout << "  Agents:\n";
        for (auto& a : snapshot.agents) {
            std::cout << "    [" << a.agent_id << "] requests=" << a.requests
                      << " tokens=" << a.input_tokens << "/" << a.output_tokens
                      << " cost=$" << std::setprecision(4) << a.total_cost << "\n";
        }
    }
    std::cout << "  ========================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    AlertCallback alert;
    std::string alert_msg;

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        switch (event.type) {
            case EventType::ActionDispatched:
                metrics_.actions_dispatched++;
                break;
            case EventType::ActionSucceeded:
                metrics_.actions_succeeded++;
                if (event.latency_ms.has_value()) {
                    latency_sample_count_++;
                    latency_sum_ms_ += event.latency_ms.value();
                    metrics_.average_latency_ms = latency_sum_ms_ / latency_sample_count_;
                }
                if (event.cost_usd.has_value()) {
                    metrics_.total_cost_usd += event.cost_usd.value();
                }
                break;
            case EventType::ActionFailed:
                metrics_.actions_failed++;
                break;
            case EventType::ActionRetrying:
                metrics_.actions_retried++;
                break;
            case EventType::ActionSkipped:
            case EventType::ActionCancelled:
                metrics_.actions_skipped++;
                break;
            case EventType::ProviderFailover:
                metrics_.provider_failovers++;
                break;
            case EventType::ProviderRequestFailed:
                metrics_.provider_errors++;
                break;
            case EventType::RateLimited:
                metrics_.rate_limited++;
                break;
            case EventType::BudgetWarning:
            case EventType::BudgetDegraded:
                metrics_.budget_warnings++;
                break;
            case EventType::BudgetHalted:
                metrics_.budget_halts++;
                break;
            case EventType::ProviderHealthChanged:
                metrics_.health_changes++;
                if (unhealthy_cb_ && event.health_status == HealthStatus::Unhealthy) {
                    alert = unhealthy_cb_;
                    alert_msg = "Provider " + event.provider_id.value_or("?") +
                                " became Unhealthy";
                }
                break;
            case EventType::RequestDropped:
                metrics_.requests_dropped++;
                break;
            default:
                break;
        }
    }

    // Outside the lock: user callback
    if (alert) {
        alert(alert_msg);
    }
}

void MetricsMonitor::on_snapshot(const SystemSnapshot& snapshot) {
    AlertCallback alert;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        if (queue_size_cb_ && snapshot.pending_requests > queue_size_threshold_) {
            alert = queue_size_cb_;
        }
    }
    if (alert) {
        alert("Queue size " + std::to_string(snapshot.pending_requests) +
              " exceeds threshold " + std::to_string(queue_size_threshold_));
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    latency_sample_count_ = 0;
    latency_sum_ms_ = 0.0;
}

void MetricsMonitor::set_unhealthy_alert(AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    unhealthy_cb_ = std::move(cb);
}

void MetricsMonitor::set_queue_size_alert_threshold(std::size_t threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    queue_size_threshold_ = threshold;
    queue_size_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const SystemSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace conductor
