#include "conductor/orchestrator.hpp"
#include "conductor/exceptions.hpp"

#include <algorithm>
#include <future>

namespace conductor {

namespace {

Config validated(Config config) {
    validate(config);
    if (config.providers.empty()) {
        throw InvalidConfigException("At least one provider must be configured");
    }
    return config;
}

std::shared_ptr<PricingRegistry> make_pricing(const std::vector<ProviderConfig>& providers) {
    auto registry = std::make_shared<PricingRegistry>();
    for (const auto& p : providers) {
        ModelPricing pricing = p.pricing;
        if (pricing.model_name.empty()) pricing.model_name = p.model;
        if (pricing.model_name.empty()) continue;
        if (pricing.provider.empty()) pricing.provider = p.id;
        registry->register_pricing(pricing);
    }
    return registry;
}

// Health probe that sends a minimal request through the provider client.
// The call runs on a detached worker bounded by the provider's latency
// threshold; a throw or an overrun counts as a failed check.
HealthProbe client_health_check(std::shared_ptr<ProviderClient> client) {
    return [client](const ProviderConfig& provider) {
        ProviderRequest request;
        request.action_id = "health-check";
        request.type = "health_check";
        request.model = provider.model;
        request.priority = RequestPriority::Low;
        request.charge_agent = false;

        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();
        std::thread([client, provider, request, promise]() {
            try {
                client->invoke(provider, request);
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();

        if (future.wait_for(provider.thresholds.latency_threshold) == std::future_status::timeout) {
            return false;
        }
        future.get();   // rethrows; the health monitor records a failure
        return true;
    };
}

} // anonymous namespace

Orchestrator::Orchestrator(Config config,
                           std::shared_ptr<ProviderClient> client,
                           std::shared_ptr<Monitor> monitor)
    : config_(validated(std::move(config)))
    , monitor_(std::move(monitor))
    , pricing_(make_pricing(config_.providers))
    , tracker_(std::make_shared<CostTracker>(pricing_,
                                             config_.guardrail.budget_limit_usd,
                                             config_.guardrail.warning_threshold,
                                             config_.guardrail.default_max_context_tokens))
    , guardrail_(std::make_shared<BudgetGuardrail>(config_.guardrail, tracker_))
    , limiter_(config_.agent_rate_limit, config_.global_rate_limit)
    , health_(config_.providers, config_.health)
    , router_(config_.providers, config_.router, client, health_, limiter_)
    , coordinator_(router_, config_.coordinator, tracker_)
    , queues_(config_.queue)
{
    if (client) {
        health_.set_probe(client_health_check(client));
    }
    set_monitor(this->monitor());
}

Orchestrator::~Orchestrator() {
    stop();
}

// ==================== Batches ====================

ExecutionPlan Orchestrator::plan(const std::vector<Action>& actions) const {
    return coordinator_.plan(actions);
}

ExecutionSummary Orchestrator::run(const ExecutionPlan& plan,
                                   BudgetLedger* ledger,
                                   const RunOptions& options) {
    return coordinator_.run(plan, options, ledger);
}

ExecutionSummary Orchestrator::execute(const std::vector<Action>& actions,
                                       BudgetLedger* ledger,
                                       const RunOptions& options) {
    return coordinator_.execute(actions, options, ledger);
}

// ==================== Budgets ====================

std::shared_ptr<BudgetLedger> Orchestrator::create_ledger() const {
    return create_ledger(config_.guardrail.budget_limit_usd);
}

std::shared_ptr<BudgetLedger> Orchestrator::create_ledger(double budget_limit_usd) const {
    if (budget_limit_usd <= 0.0) {
        throw InvalidConfigException("Budget limit must be positive");
    }
    BudgetState state = tracker_->new_state();
    state.budget_limit_usd = budget_limit_usd;
    auto ledger = std::make_shared<BudgetLedger>(guardrail_, std::move(state));
    ledger->set_monitor(monitor());
    return ledger;
}

// ==================== Queued requests ====================

RequestId Orchestrator::submit(QueuedRequest request, QueuedResponseCallback on_response) {
    RequestId id;
    {
        // Held across enqueue so the processor cannot finish the request
        // before its callback is registered
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        id = queues_.enqueue_request(std::move(request), true);
        if (on_response) {
            callbacks_[id] = std::move(on_response);
        }
    }
    {
        std::lock_guard<std::mutex> lock(processor_mutex_);
        processor_cv_.notify_all();
    }
    return id;
}

bool Orchestrator::cancel(RequestId id) {
    bool removed = queues_.global_queue().cancel(id);
    if (removed) {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks_.erase(id);
    }
    return removed;
}

std::size_t Orchestrator::pending_request_count() const {
    auto stats = queues_.stats();
    std::size_t total = stats.global_queue.has_value() ? stats.global_queue->size : 0;
    for (const auto& [agent, qs] : stats.agent_queues) {
        total += qs.size;
    }
    return total;
}

// ==================== Health ====================

void Orchestrator::set_health_probe(HealthProbe probe) {
    health_.set_probe(std::move(probe));
}

// ==================== Observability ====================

SystemSnapshot Orchestrator::snapshot() const {
    SystemSnapshot snap;
    snap.timestamp = Clock::now();

    auto costs = router_.cost_summary();
    auto health = health_.health_summary();
    for (const auto& p : router_.providers()) {
        ProviderSnapshot ps;
        ps.id = p.id;
        ps.priority = p.priority;

        auto h = health.find(p.id);
        if (h != health.end()) {
            ps.status = h->second.effective_status();
            ps.success_rate = h->second.success_rate;
            ps.avg_latency_ms = std::chrono::duration<double, std::milli>(h->second.avg_latency).count();
        }
        auto c = costs.find(p.id);
        if (c != costs.end()) {
            ps.in_flight = c->second.in_flight;
            ps.total_cost = c->second.total_cost;
        }
        snap.providers.push_back(std::move(ps));
    }

    for (const auto& [agent, summary] : router_.agent_cost_summary()) {
        AgentSnapshot as;
        as.agent_id = agent;
        as.total_cost = summary.total_cost;
        as.requests = summary.requests;
        as.input_tokens = summary.input_tokens;
        as.output_tokens = summary.output_tokens;
        snap.agents.push_back(std::move(as));
    }
    std::sort(snap.agents.begin(), snap.agents.end(),
        [](const AgentSnapshot& a, const AgentSnapshot& b) { return a.agent_id < b.agent_id; });

    snap.global_tokens_remaining = limiter_.global_remaining_tokens();
    snap.pending_requests = pending_request_count();
    return snap;
}

void Orchestrator::publish_snapshot() const {
    auto current = monitor();
    if (current) {
        current->on_snapshot(snapshot());
    }
}

void Orchestrator::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
    limiter_.set_monitor(monitor_);
    health_.set_monitor(monitor_);
    router_.set_monitor(monitor_);
    coordinator_.set_monitor(monitor_);
    queues_.global_queue().set_monitor(monitor_);
}

std::shared_ptr<Monitor> Orchestrator::monitor() const {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    return monitor_;
}

// ==================== Lifecycle ====================

void Orchestrator::start() {
    if (running_.exchange(true)) return;  // Already running

    if (config_.health.enable_periodic_checks) {
        health_.start();
    }
    queues_.global_queue().resume();
    processor_thread_ = std::thread([this] { process_queue_loop(); });
}

void Orchestrator::stop() {
    if (!running_.exchange(false)) return;  // Already stopped

    queues_.global_queue().stop();
    {
        std::lock_guard<std::mutex> lock(processor_mutex_);
        processor_cv_.notify_all();
    }
    if (processor_thread_.joinable()) {
        processor_thread_.join();
    }
    health_.stop();
}

bool Orchestrator::is_running() const noexcept {
    return running_.load();
}

// ==================== Internal Helpers ====================

void Orchestrator::process_queue_loop() {
    auto& queue = queues_.global_queue();
    while (running_.load()) {
        // Agent buckets pace the queue; the router charges the global pool
        queue.drain(limiter_, [this](const QueuedRequest& r) { return handle_queued(r); }, false);

        std::unique_lock<std::mutex> lock(processor_mutex_);
        processor_cv_.wait_for(lock, std::chrono::milliseconds(50), [this, &queue] {
            return !running_.load() || !queue.empty();
        });
    }
}

bool Orchestrator::handle_queued(const QueuedRequest& queued) {
    ProviderRequest request;
    request.agent_id = queued.agent_id;
    request.charge_agent = false;       // drained through the agent's bucket already
    request.parameters = queued.payload;
    request.priority = queued.priority;
    auto type = queued.payload.find("type");
    if (type != queued.payload.end()) request.type = type->second;
    auto model = queued.payload.find("model");
    if (model != queued.payload.end()) request.model = model->second;

    RouteResult result = router_.route(request);

    bool final_attempt = result.success || queued.retry_count >= queued.max_retries;
    if (final_attempt) {
        QueuedResponseCallback callback;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            auto it = callbacks_.find(queued.id);
            if (it != callbacks_.end()) {
                callback = std::move(it->second);
                callbacks_.erase(it);
            }
        }
        if (callback) {
            callback(queued.id, result);
        }
    }
    return result.success;
}

} // namespace conductor
