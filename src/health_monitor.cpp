#include "conductor/health_monitor.hpp"
#include "conductor/exceptions.hpp"

#include <algorithm>

namespace conductor {

ProviderHealthMonitor::ProviderHealthMonitor(std::vector<ProviderConfig> providers, HealthConfig config)
    : config_(std::move(config))
{
    for (auto& p : providers) {
        add_provider(p);
    }
}

ProviderHealthMonitor::~ProviderHealthMonitor() {
    if (running_.load()) {
        stop();
    }
}

void ProviderHealthMonitor::add_provider(const ProviderConfig& provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    ProviderRecord record;
    record.config = provider;
    record.metrics.provider_id = provider.id;
    record.next_probe = Clock::now() + provider.thresholds.health_check_interval;
    records_[provider.id] = std::move(record);
}

HealthStatus ProviderHealthMonitor::record_result(const ProviderId& id, bool success, Duration latency) {
    std::optional<StatusChange> change;
    HealthStatus effective;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& record = record_for(id);
        change = apply_outcome(record, success, latency);
        effective = record.metrics.effective_status();
    }

    if (change.has_value()) {
        emit_change(*change, success ? "Recovered after successful requests"
                                     : "Request failure crossed health threshold");
    }
    return effective;
}

HealthStatus ProviderHealthMonitor::check_provider_health(const ProviderId& id) {
    ProviderConfig config;
    HealthProbe probe;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& record = record_for(id);
        config = record.config;
        probe = probe_;
        if (!probe) {
            // Nothing to probe with; refresh the check time only
            record.metrics.last_check = Clock::now();
            return record.metrics.effective_status();
        }
    }

    // The probe may block; run it without holding the lock
    auto started = Clock::now();
    bool healthy = false;
    std::string reason = "Health check failed";
    try {
        healthy = probe(config);
    } catch (const std::exception& e) {
        reason = std::string("Health check threw: ") + e.what();
    }
    auto latency = Clock::now() - started;

    std::optional<StatusChange> change;
    HealthStatus effective;
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& record = record_for(id);
        change = apply_outcome(record, healthy, latency);
        record.next_probe = Clock::now() + record.config.thresholds.health_check_interval;
        effective = record.metrics.effective_status();
        monitor = monitor_;
    }

    auto event = make_event(EventType::HealthCheckPerformed,
                            healthy ? "Health check passed" : reason);
    event.provider_id = id;
    event.health_status = effective;
    event.latency_ms = std::chrono::duration<double, std::milli>(latency).count();
    emit(monitor, std::move(event));

    if (change.has_value()) {
        emit_change(*change, healthy ? "Health check passed" : reason);
    }
    return effective;
}

void ProviderHealthMonitor::set_probe(HealthProbe probe) {
    std::lock_guard<std::mutex> lock(mutex_);
    probe_ = std::move(probe);
}

void ProviderHealthMonitor::set_override(const ProviderId& id, HealthStatus status) {
    std::optional<StatusChange> change;
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& record = record_for(id);
        HealthStatus before = record.metrics.effective_status();
        record.metrics.override_status = status;
        if (before != status) {
            change = StatusChange{id, before, status};
        }
        monitor = monitor_;
    }

    auto event = make_event(EventType::HealthOverrideSet, "Administrative override set");
    event.provider_id = id;
    event.health_status = status;
    emit(monitor, std::move(event));

    if (change.has_value()) {
        emit_change(*change, "Administrative override");
    }
}

void ProviderHealthMonitor::clear_override(const ProviderId& id) {
    std::optional<StatusChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& record = record_for(id);
        HealthStatus before = record.metrics.effective_status();
        record.metrics.override_status.reset();
        HealthStatus after = record.metrics.status;
        if (before != after) {
            change = StatusChange{id, before, after};
        }
    }
    if (change.has_value()) {
        emit_change(*change, "Administrative override cleared");
    }
}

void ProviderHealthMonitor::reset(const ProviderId& id) {
    std::optional<StatusChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& record = record_for(id);
        HealthStatus before = record.metrics.effective_status();

        record.outcomes.clear();
        record.latencies.clear();
        record.metrics = HealthMetrics{};
        record.metrics.provider_id = id;
        record.next_probe = Clock::now();

        if (before != HealthStatus::Healthy) {
            change = StatusChange{id, before, HealthStatus::Healthy};
        }
    }
    if (change.has_value()) {
        emit_change(*change, "Administrative reset");
    }
}

HealthStatus ProviderHealthMonitor::get_status(const ProviderId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_for(id).metrics.effective_status();
}

HealthMetrics ProviderHealthMonitor::get_metrics(const ProviderId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_for(id).metrics;
}

std::vector<ProviderId> ProviderHealthMonitor::get_healthy_providers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const ProviderRecord*> healthy;
    for (const auto& [id, record] : records_) {
        if (record.metrics.effective_status() == HealthStatus::Healthy) {
            healthy.push_back(&record);
        }
    }
    std::sort(healthy.begin(), healthy.end(), [](const ProviderRecord* a, const ProviderRecord* b) {
        return a->config.priority < b->config.priority;
    });

    std::vector<ProviderId> ids;
    ids.reserve(healthy.size());
    for (auto* r : healthy) {
        ids.push_back(r->config.id);
    }
    return ids;
}

std::vector<ProviderId> ProviderHealthMonitor::get_available_providers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const ProviderRecord*> available;
    for (const auto& [id, record] : records_) {
        if (record.metrics.effective_status() != HealthStatus::Unhealthy) {
            available.push_back(&record);
        }
    }
    std::sort(available.begin(), available.end(), [](const ProviderRecord* a, const ProviderRecord* b) {
        return a->config.priority < b->config.priority;
    });

    std::vector<ProviderId> ids;
    ids.reserve(available.size());
    for (auto* r : available) {
        ids.push_back(r->config.id);
    }
    return ids;
}

std::unordered_map<ProviderId, HealthMetrics> ProviderHealthMonitor::health_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<ProviderId, HealthMetrics> summary;
    for (const auto& [id, record] : records_) {
        summary.emplace(id, record.metrics);
    }
    return summary;
}

void ProviderHealthMonitor::start() {
    if (running_.exchange(true)) return;
    checker_thread_ = std::thread(&ProviderHealthMonitor::check_loop, this);
}

void ProviderHealthMonitor::stop() {
    running_.store(false);
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }
    if (checker_thread_.joinable()) {
        checker_thread_.join();
    }
}

void ProviderHealthMonitor::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

void ProviderHealthMonitor::check_loop() {
    while (running_.load()) {
        probe_due_providers();

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.check_interval, [this] {
            return !running_.load();
        });
    }
}

void ProviderHealthMonitor::probe_due_providers() {
    std::vector<ProviderId> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!probe_) return;
        auto now = Clock::now();
        for (const auto& [id, record] : records_) {
            if (record.next_probe <= now) {
                due.push_back(id);
            }
        }
    }

    for (const auto& id : due) {
        if (!running_.load()) break;
        check_provider_health(id);
    }
}

ProviderHealthMonitor::ProviderRecord& ProviderHealthMonitor::record_for(const ProviderId& id) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        throw ProviderNotFoundException(id);
    }
    return it->second;
}

const ProviderHealthMonitor::ProviderRecord& ProviderHealthMonitor::record_for(const ProviderId& id) const {
    auto it = records_.find(id);
    if (it == records_.end()) {
        throw ProviderNotFoundException(id);
    }
    return it->second;
}

std::optional<ProviderHealthMonitor::StatusChange>
ProviderHealthMonitor::apply_outcome(ProviderRecord& record, bool success, Duration latency) {
    HealthStatus before = record.metrics.effective_status();

    record.outcomes.push_back(success);
    record.latencies.push_back(latency);
    while (record.outcomes.size() > config_.window_size) {
        record.outcomes.pop_front();
    }
    while (record.latencies.size() > config_.window_size) {
        record.latencies.pop_front();
    }

    auto& m = record.metrics;
    m.total_requests++;
    if (success) {
        m.consecutive_failures = 0;
    } else {
        m.total_errors++;
        m.consecutive_failures++;
    }
    m.last_check = Clock::now();

    recompute(record);
    m.status = evaluate(record);

    HealthStatus after = m.effective_status();
    if (before == after) {
        return std::nullopt;
    }
    return StatusChange{record.config.id, before, after};
}

void ProviderHealthMonitor::recompute(ProviderRecord& record) {
    auto& m = record.metrics;
    m.window_samples = record.outcomes.size();
    if (record.outcomes.empty()) {
        m.success_rate = 1.0;
        m.error_rate = 0.0;
        m.avg_latency = Duration::zero();
        return;
    }

    auto successes = std::count(record.outcomes.begin(), record.outcomes.end(), true);
    m.success_rate = static_cast<double>(successes) / static_cast<double>(record.outcomes.size());
    m.error_rate = 1.0 - m.success_rate;

    Duration sum = Duration::zero();
    for (auto d : record.latencies) {
        sum += d;
    }
    m.avg_latency = sum / static_cast<Duration::rep>(record.latencies.size());
}

HealthStatus ProviderHealthMonitor::evaluate(const ProviderRecord& record) const {
    const auto& m = record.metrics;
    const auto& t = record.config.thresholds;
    bool enough_samples = m.window_samples >= config_.min_samples;

    if (m.consecutive_failures >= t.max_consecutive_failures) {
        return HealthStatus::Unhealthy;
    }
    if (enough_samples && m.error_rate > t.error_rate_threshold) {
        return HealthStatus::Unhealthy;
    }
    if (m.avg_latency > t.latency_threshold) {
        return HealthStatus::Degraded;
    }
    if (enough_samples && m.success_rate < config_.degraded_success_rate) {
        return HealthStatus::Degraded;
    }
    return HealthStatus::Healthy;
}

void ProviderHealthMonitor::emit_change(const StatusChange& change, const std::string& reason) {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
    }
    auto event = make_event(EventType::ProviderHealthChanged,
                            std::string(to_string(change.from)) + " -> " +
                            to_string(change.to) + ": " + reason);
    event.provider_id = change.id;
    event.health_status = change.to;
    emit(monitor, std::move(event));
}

} // namespace conductor
