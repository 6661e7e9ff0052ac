#include "conductor/router.hpp"
#include "conductor/health_monitor.hpp"
#include "conductor/rate_limiter.hpp"

#include <algorithm>
#include <future>
#include <thread>

namespace conductor {

Router::Router(std::vector<ProviderConfig> providers,
               RouterConfig config,
               std::shared_ptr<ProviderClient> client,
               ProviderHealthMonitor& health,
               RateLimiter& limiter)
    : providers_(std::move(providers))
    , config_(std::move(config))
    , client_(std::move(client))
    , health_(health)
    , limiter_(limiter)
    , strategy_(make_strategy(config_.strategy))
{
    if (!client_) {
        throw InvalidConfigException("Router requires a provider client");
    }
    std::stable_sort(providers_.begin(), providers_.end(),
        [](const ProviderConfig& a, const ProviderConfig& b) {
            return a.priority < b.priority;
        });
    for (const auto& p : providers_) {
        limiter_.configure_provider(p.id, p.rate_limit);
        ProviderCostSummary summary;
        summary.provider_id = p.id;
        counters_[p.id] = summary;
    }
}

RouteResult Router::route(const ProviderRequest& request) {
    return route(request, config_.max_retries);
}

RouteResult Router::route(const ProviderRequest& request, int max_retries) {
    RouteResult result;
    const int attempts_per_provider = 1 + std::max(0, max_retries);
    CancellationToken* token = request.cancellation.get();

    if (token != nullptr && token->cancelled()) {
        return cancelled(std::move(result), request);
    }

    auto candidates = candidates_for(request);
    if (candidates.empty()) {
        result.error = {ErrorKind::AllProvidersFailed, "No available providers"};
        emit_event(EventType::AllProvidersFailed, result.error.message, request, "",
                   ErrorKind::AllProvidersFailed);
        return result;
    }

    std::vector<ProviderCandidate> ordered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ordered = strategy_->order(candidates);
    }

    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const auto& provider = this->provider(ordered[i].id);

        if (i > 0) {
            emit_event(EventType::ProviderFailover,
                       "Failing over from " + ordered[i - 1].id + ": " + result.error.message,
                       request, provider.id, result.error.kind);
        }
        result.tried_providers.push_back(provider.id);

        for (int n = 1; n <= attempts_per_provider; ++n) {
            if (token != nullptr && token->cancelled()) {
                return cancelled(std::move(result), request);
            }

            auto outcome = attempt(provider, request, result.attempts + 1);
            result.attempts++;
            result.provider_id = provider.id;
            result.latency = outcome.latency;
            result.error = outcome.error;

            if (outcome.success) {
                result.success = true;
                result.response = std::move(outcome.response);
                result.cost = outcome.cost;
                return result;
            }
            if (outcome.error.kind == ErrorKind::Cancelled) {
                return cancelled(std::move(result), request);
            }
            if (outcome.shared_limit) {
                // Every other provider would be refused by the same bucket
                result.retryable = true;
                return result;
            }
            if (!is_transient(outcome.error.kind)) {
                result.permanent_failures.push_back(provider.id);
                break;
            }

            result.retryable = true;
            if (n == attempts_per_provider) {
                break;      // same-provider retries exhausted: next candidate
            }
            if (token != nullptr) {
                if (token->wait_for(config_.retry_delay)) {
                    return cancelled(std::move(result), request);
                }
            } else {
                std::this_thread::sleep_for(config_.retry_delay);
            }
        }
    }

    result.last_error_kind = result.error.kind;
    std::string last = result.error.message;
    result.error = {ErrorKind::AllProvidersFailed,
                    "All providers failed. Last error: " + last};
    emit_event(EventType::AllProvidersFailed, result.error.message, request,
               result.provider_id, ErrorKind::AllProvidersFailed);
    return result;
}

RouteResult Router::cancelled(RouteResult result, const ProviderRequest& request) {
    result.success = false;
    result.retryable = false;
    result.error = {ErrorKind::Cancelled,
                    result.attempts == 0 ? "Cancelled before dispatch"
                                         : "Cancelled after " + std::to_string(result.attempts) + " attempt(s)"};
    emit_event(EventType::ProviderRequestFailed, result.error.message, request,
               result.provider_id, ErrorKind::Cancelled);
    return result;
}

void Router::set_strategy(std::unique_ptr<SelectionStrategy> strategy) {
    std::lock_guard<std::mutex> lock(mutex_);
    strategy_ = std::move(strategy);
}

std::string Router::strategy_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategy_->name();
}

std::vector<ProviderConfig> Router::providers() const {
    return providers_;
}

const ProviderConfig& Router::provider(const ProviderId& id) const {
    auto it = std::find_if(providers_.begin(), providers_.end(),
        [&id](const ProviderConfig& p) { return p.id == id; });
    if (it == providers_.end()) {
        throw ProviderNotFoundException(id);
    }
    return *it;
}

std::size_t Router::in_flight(const ProviderId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(id);
    if (it == counters_.end()) {
        throw ProviderNotFoundException(id);
    }
    return it->second.in_flight;
}

std::unordered_map<ProviderId, ProviderCostSummary> Router::cost_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

std::unordered_map<AgentKey, AgentCostSummary> Router::agent_cost_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agent_counters_;
}

double Router::total_cost() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& [id, summary] : counters_) {
        total += summary.total_cost;
    }
    return total;
}

void Router::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

std::vector<ProviderCandidate> Router::candidates_for(const ProviderRequest& request) const {
    std::vector<ProviderCandidate> candidates;
    for (const auto& p : providers_) {
        bool excluded = std::find(request.excluded_providers.begin(),
                                  request.excluded_providers.end(),
                                  p.id) != request.excluded_providers.end();
        if (excluded) continue;

        HealthStatus status = health_.get_status(p.id);
        if (status == HealthStatus::Unhealthy) continue;

        ProviderCandidate c;
        c.id = p.id;
        c.priority = p.priority;
        c.status = status;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            c.in_flight = counters_.at(p.id).in_flight;
        }
        candidates.push_back(std::move(c));
    }
    return candidates;
}

Router::AttemptOutcome Router::attempt(const ProviderConfig& provider,
                                       const ProviderRequest& request,
                                       int attempt_no) {
    AttemptOutcome outcome;

    // Admission for the provider, the agent and the global pool. Rate-limit
    // refusals never reach the health monitor.
    const AgentKey agent = request.charge_agent ? request.agent_id : AgentKey{};
    auto admission = limiter_.acquire_dispatch(provider.id, agent,
                                               Clock::now() + config_.admission_timeout,
                                               request.cancellation.get());
    if (!admission.admitted) {
        if (request.cancellation && request.cancellation->cancelled()) {
            outcome.error = {ErrorKind::Cancelled, "Cancelled while waiting for admission"};
            return outcome;
        }
        std::string scope = admission.global_limited ? "global pool"
                          : admission.agent_limited  ? "agent " + request.agent_id
                                                     : "provider " + provider.id;
        outcome.error = {ErrorKind::RateLimited, "Rate limit admission timed out for " + scope};
        outcome.shared_limit = admission.global_limited || admission.agent_limited;
        emit_event(EventType::ProviderRequestFailed, outcome.error.message, request,
                   provider.id, ErrorKind::RateLimited, attempt_no);
        return outcome;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& c = counters_[provider.id];
        c.in_flight++;
        c.requests++;
        if (!request.agent_id.empty()) {
            auto& a = agent_counters_[request.agent_id];
            a.agent_id = request.agent_id;
            a.requests++;
        }
    }
    emit_event(EventType::ProviderSelected, "Dispatching to " + provider.name, request,
               provider.id, std::nullopt, attempt_no);

    Duration timeout = request.timeout.value_or(config_.default_request_timeout);

    // The worker owns everything it touches so an abandoned call can finish
    // after this frame is gone; its late result is discarded.
    auto promise = std::make_shared<std::promise<ProviderResponse>>();
    auto future = promise->get_future();
    std::thread([client = client_, provider, request, promise]() {
        try {
            promise->set_value(client->invoke(provider, request));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    auto started = Clock::now();
    if (future.wait_for(timeout) == std::future_status::timeout) {
        outcome.error = {ErrorKind::Timeout,
                         "Provider " + provider.id + " timed out after " +
                         std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()) +
                         "ms"};
    } else {
        try {
            outcome.response = future.get();
            outcome.success = true;
        } catch (const ProviderError& e) {
            outcome.error = {classify_error(e), e.what()};
        } catch (const std::exception& e) {
            outcome.error = {ErrorKind::TransientProviderError, e.what()};
        }
    }
    outcome.latency = Clock::now() - started;

    if (outcome.success) {
        outcome.cost = call_cost(provider.pricing,
                                 outcome.response.input_tokens,
                                 outcome.response.output_tokens);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& c = counters_[provider.id];
        c.in_flight--;
        if (outcome.success) {
            c.successes++;
            c.total_cost += outcome.cost;
            c.input_tokens += outcome.response.input_tokens;
            c.output_tokens += outcome.response.output_tokens;
        } else {
            c.failures++;
        }
        if (!request.agent_id.empty()) {
            auto& a = agent_counters_[request.agent_id];
            if (outcome.success) {
                a.successes++;
                a.total_cost += outcome.cost;
                a.input_tokens += outcome.response.input_tokens;
                a.output_tokens += outcome.response.output_tokens;
            } else {
                a.failures++;
            }
        }
    }

    health_.record_result(provider.id, outcome.success, outcome.latency);

    if (!outcome.success) {
        emit_event(EventType::ProviderRequestFailed, outcome.error.message, request,
                   provider.id, outcome.error.kind, attempt_no);
    }
    return outcome;
}

void Router::emit_event(EventType type, const std::string& message,
                        const ProviderRequest& request, const ProviderId& provider,
                        std::optional<ErrorKind> kind,
                        std::optional<int> attempt_no) {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
    }
    auto event = make_event(type, message);
    if (!request.action_id.empty()) event.action_id = request.action_id;
    if (!request.agent_id.empty()) event.agent_id = request.agent_id;
    if (!provider.empty()) event.provider_id = provider;
    event.error_kind = kind;
    event.attempt = attempt_no;
    emit(monitor, std::move(event));
}

} // namespace conductor
