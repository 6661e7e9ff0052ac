#include <gtest/gtest.h>
#include <conductor/conductor.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>
#include <vector>

using namespace conductor;
using namespace std::chrono_literals;

static RateLimitConfig limit(double requests, Duration window, double burst = 0.0) {
    RateLimitConfig cfg;
    cfg.requests_per_window = requests;
    cfg.window = window;
    cfg.burst_allowance = burst;
    return cfg;
}

// ===========================================================================
// TokenBucket
// ===========================================================================

TEST(TokenBucketTest, StartsFullAndDrains) {
    auto t0 = Clock::now();
    TokenBucket bucket(3.0, 1.0, t0);

    EXPECT_DOUBLE_EQ(bucket.tokens(), 3.0);
    EXPECT_TRUE(bucket.try_consume(t0));
    EXPECT_TRUE(bucket.try_consume(t0));
    EXPECT_TRUE(bucket.try_consume(t0));
    EXPECT_FALSE(bucket.try_consume(t0));
}

TEST(TokenBucketTest, RefillsAtRateAndCapsAtCapacity) {
    auto t0 = Clock::now();
    TokenBucket bucket(2.0, 1.0, t0);
    ASSERT_TRUE(bucket.try_consume(t0));
    ASSERT_TRUE(bucket.try_consume(t0));

    bucket.refill(t0 + 500ms);
    EXPECT_NEAR(bucket.tokens(), 0.5, 1e-9);
    EXPECT_FALSE(bucket.has_token());

    bucket.refill(t0 + 1500ms);
    EXPECT_NEAR(bucket.tokens(), 1.5, 1e-9);

    bucket.refill(t0 + 1h);
    EXPECT_DOUBLE_EQ(bucket.tokens(), 2.0);
}

TEST(TokenBucketTest, WaitTimeForNextToken) {
    auto t0 = Clock::now();
    TokenBucket bucket(1.0, 2.0, t0);   // one token every 500ms
    EXPECT_EQ(bucket.wait_time(), Duration::zero());

    ASSERT_TRUE(bucket.try_consume(t0));
    auto wait = bucket.wait_time();
    EXPECT_NEAR(to_seconds(wait), 0.5, 1e-6);
}

TEST(TokenBucketTest, BurstAllowanceRaisesCapacity) {
    auto cfg = limit(10.0, 1s, 5.0);
    TokenBucket bucket(cfg);
    EXPECT_DOUBLE_EQ(bucket.capacity(), 15.0);
    EXPECT_DOUBLE_EQ(bucket.refill_rate(), 10.0);
}

TEST(TokenBucketTest, RejectsCapacityBelowOne) {
    EXPECT_THROW(TokenBucket(0.5, 1.0), std::invalid_argument);
    EXPECT_THROW(TokenBucket(1.0, -1.0), std::invalid_argument);
}

TEST(TokenBucketTest, AdmissionsNeverExceedCapacityPlusRefill) {
    const double capacity = 5.0;
    const double rate = 10.0;
    auto t0 = Clock::now();
    TokenBucket bucket(capacity, rate, t0);

    // Hammer the bucket every 7ms for two simulated seconds
    int admitted = 0;
    for (int step = 0; step <= 300; ++step) {
        auto now = t0 + std::chrono::milliseconds(step * 7);
        for (int k = 0; k < 3; ++k) {
            if (bucket.try_consume(now)) admitted++;
        }
        double elapsed = to_seconds(now - t0);
        ASSERT_LE(admitted, static_cast<int>(std::floor(capacity + rate * elapsed + 1e-6)))
            << "at step " << step;
    }
    EXPECT_GT(admitted, 0);
}

// ===========================================================================
// RateLimiter: per-agent and global buckets
// ===========================================================================

TEST(RateLimiterTest, AgentBucketLimitsItsOwnKey) {
    RateLimiter limiter(limit(2.0, 1h), limit(100.0, 1h));
    auto now = Clock::now();

    EXPECT_TRUE(limiter.can_proceed("agent-a", now).admitted);
    EXPECT_TRUE(limiter.can_proceed("agent-a", now).admitted);

    auto denied = limiter.can_proceed("agent-a", now);
    EXPECT_FALSE(denied.admitted);
    EXPECT_FALSE(denied.global_limited);
    EXPECT_GT(denied.wait, Duration::zero());

    // Other keys have their own bucket
    EXPECT_TRUE(limiter.can_proceed("agent-b", now).admitted);
}

TEST(RateLimiterTest, GlobalBucketBoundsAllKeys) {
    RateLimiter limiter(limit(100.0, 1h), limit(3.0, 1h));
    auto now = Clock::now();

    EXPECT_TRUE(limiter.can_proceed("a", now).admitted);
    EXPECT_TRUE(limiter.can_proceed("b", now).admitted);
    EXPECT_TRUE(limiter.can_proceed("c", now).admitted);

    auto denied = limiter.can_proceed("d", now);
    EXPECT_FALSE(denied.admitted);
    EXPECT_TRUE(denied.global_limited);

    auto stats = limiter.stats();
    EXPECT_EQ(stats.admitted, 3u);
    EXPECT_EQ(stats.denied, 1u);
    EXPECT_EQ(stats.denied_by_global, 1u);
}

TEST(RateLimiterTest, DeniedRequestConsumesNothing) {
    RateLimiter limiter(limit(1.0, 1h), limit(2.0, 1h));
    auto now = Clock::now();

    ASSERT_TRUE(limiter.can_proceed("a", now).admitted);
    // Agent "a" is empty; the global token must stay available for "b"
    EXPECT_FALSE(limiter.can_proceed("a", now).admitted);
    EXPECT_FALSE(limiter.can_proceed("a", now).admitted);
    EXPECT_TRUE(limiter.can_proceed("b", now).admitted);
}

TEST(RateLimiterTest, KeyOnlyAdmissionLeavesGlobalPoolAlone) {
    RateLimiter limiter(limit(10.0, 1h), limit(2.0, 1h));
    auto now = Clock::now();

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(limiter.can_proceed("queued", now, false).admitted);
    }
    EXPECT_NEAR(limiter.global_remaining_tokens(), 2.0, 0.01);
    EXPECT_NEAR(limiter.remaining_tokens("queued"), 5.0, 0.01);
}

TEST(RateLimiterTest, ConfiguredAgentUsesItsOwnLimit) {
    RateLimiter limiter(limit(100.0, 1h), limit(100.0, 1h));
    limiter.configure_agent("planner", limit(1.0, 1h));
    auto now = Clock::now();

    EXPECT_TRUE(limiter.can_proceed("planner", now).admitted);
    EXPECT_FALSE(limiter.can_proceed("planner", now).admitted);
    EXPECT_DOUBLE_EQ(limiter.remaining_tokens("unseen"), 100.0);
}

// ===========================================================================
// RateLimiter: dispatch admission (provider + agent + global)
// ===========================================================================

TEST(RateLimiterTest, DispatchChargesProviderAgentAndGlobalTogether) {
    RateLimiter limiter(limit(10.0, 1h), limit(20.0, 1h));
    limiter.configure_provider("p1", limit(5.0, 1h));
    auto now = Clock::now();

    auto admission = limiter.can_dispatch("p1", "agent-x", now);
    ASSERT_TRUE(admission.admitted);

    EXPECT_NEAR(limiter.provider_remaining_tokens("p1"), 4.0, 0.01);
    EXPECT_NEAR(limiter.remaining_tokens("agent-x"), 9.0, 0.01);
    EXPECT_NEAR(limiter.global_remaining_tokens(), 19.0, 0.01);
}

TEST(RateLimiterTest, AgentDenialConsumesNoProviderToken) {
    RateLimiter limiter(limit(1.0, 1h), limit(100.0, 1h));
    limiter.configure_provider("p1", limit(5.0, 1h));
    auto now = Clock::now();

    ASSERT_TRUE(limiter.can_dispatch("p1", "agent-x", now).admitted);

    auto denied = limiter.can_dispatch("p1", "agent-x", now);
    EXPECT_FALSE(denied.admitted);
    EXPECT_TRUE(denied.agent_limited);
    EXPECT_FALSE(denied.provider_limited);
    EXPECT_FALSE(denied.global_limited);
    EXPECT_GT(denied.wait, 1min);

    EXPECT_NEAR(limiter.provider_remaining_tokens("p1"), 4.0, 0.01);
    EXPECT_EQ(limiter.stats().denied_by_agent, 1u);
}

TEST(RateLimiterTest, ProviderDenialIsReportedSeparately) {
    RateLimiter limiter(limit(100.0, 1h), limit(100.0, 1h));
    limiter.configure_provider("p1", limit(1.0, 1h));
    auto now = Clock::now();

    ASSERT_TRUE(limiter.can_dispatch("p1", "a", now).admitted);
    auto denied = limiter.can_dispatch("p1", "b", now);
    EXPECT_FALSE(denied.admitted);
    EXPECT_TRUE(denied.provider_limited);
    EXPECT_FALSE(denied.agent_limited);
    EXPECT_EQ(limiter.stats().denied_by_provider, 1u);
}

TEST(RateLimiterTest, EmptyAgentSkipsAgentBucket) {
    RateLimiter limiter(limit(1.0, 1h), limit(100.0, 1h));
    limiter.configure_provider("p1", limit(10.0, 1h));
    auto now = Clock::now();

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(limiter.can_dispatch("p1", "", now).admitted);
    }
}

TEST(RateLimiterTest, ProvidersAndAgentsDoNotShareKeys) {
    RateLimiter limiter(limit(1.0, 1h), limit(100.0, 1h));
    limiter.configure_provider("shared-name", limit(10.0, 1h));
    auto now = Clock::now();

    // An agent named after a provider drains only the agent bucket
    ASSERT_TRUE(limiter.can_proceed("shared-name", now).admitted);
    EXPECT_FALSE(limiter.can_proceed("shared-name", now).admitted);
    EXPECT_NEAR(limiter.provider_remaining_tokens("shared-name"), 10.0, 0.01);

    EXPECT_TRUE(limiter.can_dispatch("shared-name", "", now).admitted);
    EXPECT_NEAR(limiter.provider_remaining_tokens("shared-name"), 9.0, 0.01);
}

TEST(RateLimiterTest, DispatchToUnknownProviderThrows) {
    RateLimiter limiter(limit(10.0, 1h), limit(10.0, 1h));
    EXPECT_THROW(limiter.can_dispatch("missing", "a", Clock::now()), ProviderNotFoundException);
    EXPECT_THROW(limiter.provider_remaining_tokens("missing"), ProviderNotFoundException);
}

TEST(RateLimiterTest, AcquireDispatchStopsOnCancel) {
    RateLimiter limiter(limit(100.0, 1h), limit(100.0, 1h));
    limiter.configure_provider("p1", limit(1.0, 2s));
    ASSERT_TRUE(limiter.can_dispatch("p1", "a", Clock::now()).admitted);

    CancellationToken token;
    std::thread canceller([&token] {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });

    auto start = Clock::now();
    auto admission = limiter.acquire_dispatch("p1", "a", Clock::now() + 5s, &token);
    canceller.join();

    EXPECT_FALSE(admission.admitted);
    EXPECT_LT(Clock::now() - start, 1s);
}

TEST(RateLimiterTest, AcquireGivesUpWhenTokenArrivesAfterDeadline) {
    RateLimiter limiter(limit(1.0, 1h), limit(100.0, 1h));
    ASSERT_TRUE(limiter.acquire("a", Clock::now() + 50ms));

    auto start = Clock::now();
    EXPECT_FALSE(limiter.acquire("a", Clock::now() + 50ms));
    // Fails fast instead of sleeping until the deadline
    EXPECT_LT(Clock::now() - start, 40ms);
}

TEST(RateLimiterTest, AcquireWaitsForRefill) {
    RateLimiter limiter(limit(1.0, 100ms), limit(100.0, 1s));
    ASSERT_TRUE(limiter.acquire("a", Clock::now() + 1s));

    auto start = Clock::now();
    EXPECT_TRUE(limiter.acquire("a", Clock::now() + 1s));
    EXPECT_GE(Clock::now() - start, 50ms);
}

TEST(RateLimiterTest, WaitTimeDoesNotConsume) {
    RateLimiter limiter(limit(1.0, 1h), limit(100.0, 1h));
    EXPECT_EQ(limiter.get_wait_time("a"), Duration::zero());
    EXPECT_EQ(limiter.get_wait_time("a"), Duration::zero());

    ASSERT_TRUE(limiter.can_proceed("a").admitted);
    EXPECT_GT(limiter.get_wait_time("a"), 1min);
}

TEST(RateLimiterTest, ResetRefillsEveryBucket) {
    RateLimiter limiter(limit(1.0, 1h), limit(2.0, 1h));
    limiter.configure_provider("p1", limit(1.0, 1h));
    ASSERT_TRUE(limiter.can_proceed("a").admitted);
    ASSERT_TRUE(limiter.can_dispatch("p1", "", Clock::now()).admitted);
    ASSERT_FALSE(limiter.can_proceed("b").admitted);

    limiter.reset();

    EXPECT_TRUE(limiter.can_proceed("b").admitted);
    EXPECT_NEAR(limiter.provider_remaining_tokens("p1"), 1.0, 0.01);
    EXPECT_EQ(limiter.stats().denied, 0u);
}

TEST(RateLimiterTest, ConcurrentCallersNeverOvershoot) {
    RateLimiter limiter(limit(1000.0, 1h), limit(50.0, 1h));
    std::atomic<int> admitted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&limiter, &admitted, t] {
            for (int i = 0; i < 20; ++i) {
                if (limiter.can_proceed("agent-" + std::to_string(t)).admitted) {
                    admitted++;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    // 160 attempts, 50 global tokens; an hour-long window refills ~nothing
    EXPECT_EQ(admitted.load(), 50);
}
