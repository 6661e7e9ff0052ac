#include "conductor/rate_limiter.hpp"
#include "conductor/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace conductor {

// ========== TokenBucket ==========

TokenBucket::TokenBucket(double capacity, double refill_rate, Timestamp now)
    : capacity_(capacity)
    , refill_rate_(refill_rate)
    , tokens_(capacity)
    , last_refill_(now)
{
    if (capacity_ < 1.0) {
        throw std::invalid_argument("TokenBucket capacity must be at least 1");
    }
    if (refill_rate_ < 0.0) {
        throw std::invalid_argument("TokenBucket refill_rate must be non-negative");
    }
}

TokenBucket::TokenBucket(const RateLimitConfig& config, Timestamp now)
    : TokenBucket(config.capacity(), config.refill_rate(), now)
{}

void TokenBucket::refill(Timestamp now) {
    if (now <= last_refill_) return;
    double elapsed = to_seconds(now - last_refill_);
    tokens_ = std::min(capacity_, tokens_ + elapsed * refill_rate_);
    last_refill_ = now;
}

bool TokenBucket::has_token() const noexcept {
    return tokens_ >= 1.0;
}

void TokenBucket::consume() noexcept {
    tokens_ -= 1.0;
}

bool TokenBucket::try_consume(Timestamp now) {
    refill(now);
    if (!has_token()) return false;
    consume();
    return true;
}

Duration TokenBucket::wait_time() const {
    if (tokens_ >= 1.0) return Duration::zero();
    if (refill_rate_ <= 0.0) return Duration::max();
    double secs = (1.0 - tokens_) / refill_rate_;
    return std::chrono::duration_cast<Duration>(std::chrono::duration<double>(secs));
}

double TokenBucket::tokens() const noexcept { return tokens_; }
double TokenBucket::capacity() const noexcept { return capacity_; }
double TokenBucket::refill_rate() const noexcept { return refill_rate_; }
Timestamp TokenBucket::last_refill() const noexcept { return last_refill_; }

// ========== RateLimiter ==========

RateLimiter::RateLimiter(RateLimitConfig default_agent_config, RateLimitConfig global_config)
    : default_config_(std::move(default_agent_config))
    , global_config_(std::move(global_config))
    , global_bucket_(global_config_)
{}

void RateLimiter::configure_agent(const AgentKey& key, const RateLimitConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    agent_configs_[key] = config;
    agent_buckets_.erase(key);
    agent_buckets_.emplace(key, TokenBucket(config));
}

void RateLimiter::configure_provider(const ProviderId& id, const RateLimitConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    provider_configs_[id] = config;
    provider_buckets_.erase(id);
    provider_buckets_.emplace(id, TokenBucket(config));
}

Admission RateLimiter::can_proceed(const AgentKey& key) {
    return can_proceed(key, Clock::now());
}

Admission RateLimiter::can_proceed(const AgentKey& key, Timestamp now) {
    return can_proceed(key, now, true);
}

Admission RateLimiter::can_proceed(const AgentKey& key, Timestamp now, bool charge_global) {
    Admission result;
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
        auto& agent = bucket_for(key, now);
        agent.refill(now);
        global_bucket_.refill(now);

        bool global_ok = !charge_global || global_bucket_.has_token();
        if (agent.has_token() && global_ok) {
            agent.consume();
            if (charge_global) global_bucket_.consume();
            stats_.admitted++;
            result.admitted = true;
            return result;
        }

        result.global_limited = !global_ok;
        result.wait = agent.wait_time();
        if (result.global_limited) {
            result.wait = std::max(result.wait, global_bucket_.wait_time());
        }
        result.agent_limited = !agent.has_token();
        stats_.denied++;
        if (result.global_limited) stats_.denied_by_global++;
        if (result.agent_limited) stats_.denied_by_agent++;
    }

    auto event = make_event(EventType::RateLimited,
        result.global_limited ? "Global bucket exhausted" : "Agent bucket exhausted");
    event.agent_id = key;
    event.latency_ms = std::chrono::duration<double, std::milli>(result.wait).count();
    emit(monitor, std::move(event));
    return result;
}

bool RateLimiter::acquire(const AgentKey& key, Timestamp deadline) {
    while (true) {
        auto admission = can_proceed(key);
        if (admission.admitted) return true;

        auto now = Clock::now();
        if (now >= deadline) return false;

        auto remaining = deadline - now;
        if (admission.wait >= remaining) {
            // The token would not arrive in time
            return false;
        }
        std::this_thread::sleep_for(std::max(admission.wait,
                                             Duration(std::chrono::microseconds(100))));
    }
}

Admission RateLimiter::can_dispatch(const ProviderId& provider,
                                     const AgentKey& agent,
                                     Timestamp now) {
    Admission result;
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
        auto it = provider_buckets_.find(provider);
        if (it == provider_buckets_.end()) {
            throw ProviderNotFoundException(provider);
        }
        TokenBucket& provider_bucket = it->second;
        TokenBucket* agent_bucket = agent.empty() ? nullptr : &bucket_for(agent, now);

        provider_bucket.refill(now);
        if (agent_bucket != nullptr) agent_bucket->refill(now);
        global_bucket_.refill(now);

        result.provider_limited = !provider_bucket.has_token();
        result.agent_limited = agent_bucket != nullptr && !agent_bucket->has_token();
        result.global_limited = !global_bucket_.has_token();

        if (!result.provider_limited && !result.agent_limited && !result.global_limited) {
            provider_bucket.consume();
            if (agent_bucket != nullptr) agent_bucket->consume();
            global_bucket_.consume();
            stats_.admitted++;
            result.admitted = true;
            return result;
        }

        result.wait = Duration::zero();
        if (result.provider_limited) {
            result.wait = std::max(result.wait, provider_bucket.wait_time());
        }
        if (result.agent_limited) {
            result.wait = std::max(result.wait, agent_bucket->wait_time());
        }
        if (result.global_limited) {
            result.wait = std::max(result.wait, global_bucket_.wait_time());
        }
        stats_.denied++;
        if (result.global_limited) stats_.denied_by_global++;
        if (result.agent_limited) stats_.denied_by_agent++;
        if (result.provider_limited) stats_.denied_by_provider++;
    }

    const char* message = result.global_limited ? "Global bucket exhausted"
                        : result.agent_limited  ? "Agent bucket exhausted"
                                                : "Provider bucket exhausted";
    auto event = make_event(EventType::RateLimited, message);
    event.provider_id = provider;
    if (!agent.empty()) event.agent_id = agent;
    event.latency_ms = std::chrono::duration<double, std::milli>(result.wait).count();
    emit(monitor, std::move(event));
    return result;
}

Admission RateLimiter::acquire_dispatch(const ProviderId& provider,
                                        const AgentKey& agent,
                                        Timestamp deadline,
                                        CancellationToken* cancel) {
    while (true) {
        auto admission = can_dispatch(provider, agent, Clock::now());
        if (admission.admitted) return admission;
        if (cancel != nullptr && cancel->cancelled()) return admission;

        auto now = Clock::now();
        if (now >= deadline || admission.wait >= deadline - now) {
            return admission;
        }
        auto pause = std::max(admission.wait, Duration(std::chrono::microseconds(100)));
        if (cancel != nullptr) {
            if (cancel->wait_for(pause)) return admission;
        } else {
            std::this_thread::sleep_for(pause);
        }
    }
}

Duration RateLimiter::get_wait_time(const AgentKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    auto global = global_bucket_;
    global.refill(now);

    Duration agent_wait = Duration::zero();
    auto it = agent_buckets_.find(key);
    if (it != agent_buckets_.end()) {
        auto agent = it->second;
        agent.refill(now);
        agent_wait = agent.wait_time();
    }
    return std::max(agent_wait, global.wait_time());
}

double RateLimiter::remaining_tokens(const AgentKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agent_buckets_.find(key);
    if (it == agent_buckets_.end()) {
        auto cfg_it = agent_configs_.find(key);
        return (cfg_it != agent_configs_.end()) ? cfg_it->second.capacity()
                                                : default_config_.capacity();
    }
    auto copy = it->second;
    copy.refill(Clock::now());
    return copy.tokens();
}

double RateLimiter::provider_remaining_tokens(const ProviderId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = provider_buckets_.find(id);
    if (it == provider_buckets_.end()) {
        throw ProviderNotFoundException(id);
    }
    auto copy = it->second;
    copy.refill(Clock::now());
    return copy.tokens();
}

double RateLimiter::global_remaining_tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto copy = global_bucket_;
    copy.refill(Clock::now());
    return copy.tokens();
}

RateLimiter::Stats RateLimiter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    agent_buckets_.clear();
    for (auto& [key, cfg] : agent_configs_) {
        agent_buckets_.emplace(key, TokenBucket(cfg, now));
    }
    provider_buckets_.clear();
    for (auto& [id, cfg] : provider_configs_) {
        provider_buckets_.emplace(id, TokenBucket(cfg, now));
    }
    global_bucket_ = TokenBucket(global_config_, now);
    stats_ = Stats{};
}

void RateLimiter::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

TokenBucket& RateLimiter::bucket_for(const AgentKey& key, Timestamp now) {
    auto it = agent_buckets_.find(key);
    if (it != agent_buckets_.end()) return it->second;

    auto cfg_it = agent_configs_.find(key);
    const RateLimitConfig& cfg = (cfg_it != agent_configs_.end()) ? cfg_it->second
                                                                  : default_config_;
    return agent_buckets_.emplace(key, TokenBucket(cfg, now)).first->second;
}

} // namespace conductor
