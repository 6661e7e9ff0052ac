#pragma once

#include "conductor/types.hpp"
#include "conductor/config.hpp"
#include "conductor/monitor.hpp"
#include "conductor/cancellation.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace conductor {

// Continuous-refill token bucket. Not synchronized; RateLimiter guards it.
class TokenBucket {
public:
    TokenBucket(double capacity, double refill_rate, Timestamp now = Clock::now());
    explicit TokenBucket(const RateLimitConfig& config, Timestamp now = Clock::now());

    // Add elapsed * rate tokens, capped at capacity
    void refill(Timestamp now);

    bool has_token() const noexcept;
    void consume() noexcept;

    // refill + consume one token if available
    bool try_consume(Timestamp now);

    // Time until one token is available (zero when one is available now)
    Duration wait_time() const;

    double tokens() const noexcept;
    double capacity() const noexcept;
    double refill_rate() const noexcept;
    Timestamp last_refill() const noexcept;

private:
    double capacity_;
    double refill_rate_;
    double tokens_;
    Timestamp last_refill_;
};

struct Admission {
    bool admitted{false};
    Duration wait{};          // suggested wait when not admitted
    bool global_limited{false};
    bool agent_limited{false};
    bool provider_limited{false};
};

// Per-agent, per-provider and global token-bucket admission control.
//
// Agents and providers live in separate key spaces, so an agent named
// like a provider never shares its bucket. A request proceeds only when
// every bucket it is charged to holds a token; they are consumed together
// under one lock.
class RateLimiter {
public:
    struct Stats {
        std::uint64_t admitted{0};
        std::uint64_t denied{0};
        std::uint64_t denied_by_global{0};
        std::uint64_t denied_by_agent{0};
        std::uint64_t denied_by_provider{0};
    };

    RateLimiter(RateLimitConfig default_agent_config, RateLimitConfig global_config);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Give an agent its own bucket configuration instead of the default
    void configure_agent(const AgentKey& key, const RateLimitConfig& config);

    // Register a provider's request ceiling
    void configure_provider(const ProviderId& id, const RateLimitConfig& config);

    Admission can_proceed(const AgentKey& key);
    Admission can_proceed(const AgentKey& key, Timestamp now);

    // charge_global = false checks and consumes the key's bucket only, for
    // callers whose request is charged to the global pool later on
    Admission can_proceed(const AgentKey& key, Timestamp now, bool charge_global);

    // Sleep the computed wait between attempts until admitted or deadline.
    bool acquire(const AgentKey& key, Timestamp deadline);

    // Admission for one provider call: the provider's bucket, the agent's
    // bucket and the global bucket. An empty agent skips the agent bucket.
    // Throws ProviderNotFoundException for an unregistered provider.
    Admission can_dispatch(const ProviderId& provider, const AgentKey& agent, Timestamp now);

    // can_dispatch retried until admitted, the deadline passes or `cancel`
    // fires. Returns the last denial when not admitted.
    Admission acquire_dispatch(const ProviderId& provider,
                               const AgentKey& agent,
                               Timestamp deadline,
                               CancellationToken* cancel = nullptr);

    // Wait time without consuming anything
    Duration get_wait_time(const AgentKey& key) const;

    double remaining_tokens(const AgentKey& key) const;
    double provider_remaining_tokens(const ProviderId& id) const;
    double global_remaining_tokens() const;

    Stats stats() const;

    // Administrative: refill every bucket to capacity
    void reset();

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    mutable std::mutex mutex_;
    RateLimitConfig default_config_;
    RateLimitConfig global_config_;
    std::unordered_map<AgentKey, RateLimitConfig> agent_configs_;
    std::unordered_map<AgentKey, TokenBucket> agent_buckets_;
    std::unordered_map<ProviderId, RateLimitConfig> provider_configs_;
    std::unordered_map<ProviderId, TokenBucket> provider_buckets_;
    TokenBucket global_bucket_;
    Stats stats_;
    std::shared_ptr<Monitor> monitor_;

    // Caller must hold mutex_
    TokenBucket& bucket_for(const AgentKey& key, Timestamp now);
};

} // namespace conductor
