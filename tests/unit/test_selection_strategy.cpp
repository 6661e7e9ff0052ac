#include <gtest/gtest.h>
#include <conductor/conductor.hpp>

#include <set>

using namespace conductor;

static ProviderCandidate candidate(const ProviderId& id, int priority,
                                   HealthStatus status = HealthStatus::Healthy,
                                   std::size_t in_flight = 0) {
    ProviderCandidate c;
    c.id = id;
    c.priority = priority;
    c.status = status;
    c.in_flight = in_flight;
    return c;
}

static std::vector<ProviderId> ids(const std::vector<ProviderCandidate>& candidates) {
    std::vector<ProviderId> out;
    for (const auto& c : candidates) out.push_back(c.id);
    return out;
}

// ===========================================================================
// HealthBased
// ===========================================================================

TEST(SelectionStrategyTest, HealthBasedKeepsPriorityOrder) {
    HealthBasedStrategy strategy;
    auto ordered = strategy.order({candidate("a", 0), candidate("b", 1), candidate("c", 2)});
    EXPECT_EQ(ids(ordered), (std::vector<ProviderId>{"a", "b", "c"}));
    EXPECT_EQ(strategy.name(), "HealthBased");
}

TEST(SelectionStrategyTest, HealthBasedPrefersHealthyOverDegraded) {
    HealthBasedStrategy strategy;
    auto ordered = strategy.order({
        candidate("primary", 0, HealthStatus::Degraded),
        candidate("secondary", 1),
        candidate("tertiary", 2, HealthStatus::Degraded),
        candidate("backup", 3),
    });
    EXPECT_EQ(ids(ordered),
              (std::vector<ProviderId>{"secondary", "backup", "primary", "tertiary"}));
}

TEST(SelectionStrategyTest, HealthBasedFallsBackToDegraded) {
    HealthBasedStrategy strategy;
    auto ordered = strategy.order({candidate("a", 0, HealthStatus::Degraded)});
    ASSERT_EQ(ordered.size(), 1u);
    EXPECT_EQ(ordered[0].id, "a");
}

// ===========================================================================
// RoundRobin
// ===========================================================================

TEST(SelectionStrategyTest, RoundRobinRotatesFirstPick) {
    RoundRobinStrategy strategy;
    std::vector<ProviderCandidate> pool{candidate("a", 0), candidate("b", 1), candidate("c", 2)};

    EXPECT_EQ(strategy.order(pool)[0].id, "a");
    EXPECT_EQ(strategy.order(pool)[0].id, "b");
    EXPECT_EQ(strategy.order(pool)[0].id, "c");
    EXPECT_EQ(strategy.order(pool)[0].id, "a");
}

TEST(SelectionStrategyTest, RoundRobinKeepsRestAsFailoverChain) {
    RoundRobinStrategy strategy;
    std::vector<ProviderCandidate> pool{candidate("a", 0), candidate("b", 1), candidate("c", 2)};

    strategy.order(pool);   // "a" first
    auto ordered = strategy.order(pool);
    EXPECT_EQ(ids(ordered), (std::vector<ProviderId>{"b", "a", "c"}));
}

TEST(SelectionStrategyTest, RoundRobinEmptyPool) {
    RoundRobinStrategy strategy;
    EXPECT_TRUE(strategy.order({}).empty());
}

// ===========================================================================
// LeastConnections
// ===========================================================================

TEST(SelectionStrategyTest, LeastConnectionsPicksFewestInFlight) {
    LeastConnectionsStrategy strategy;
    auto ordered = strategy.order({
        candidate("a", 0, HealthStatus::Healthy, 4),
        candidate("b", 1, HealthStatus::Healthy, 1),
        candidate("c", 2, HealthStatus::Healthy, 2),
    });
    EXPECT_EQ(ids(ordered), (std::vector<ProviderId>{"b", "a", "c"}));
}

TEST(SelectionStrategyTest, LeastConnectionsTieGoesToPriority) {
    LeastConnectionsStrategy strategy;
    auto ordered = strategy.order({
        candidate("a", 0, HealthStatus::Healthy, 2),
        candidate("b", 1, HealthStatus::Healthy, 2),
    });
    EXPECT_EQ(ordered[0].id, "a");
}

// ===========================================================================
// Factory
// ===========================================================================

TEST(SelectionStrategyTest, FactoryBuildsEachStrategy) {
    EXPECT_EQ(make_strategy(RoutingStrategy::HealthBased)->name(), "HealthBased");
    EXPECT_EQ(make_strategy(RoutingStrategy::RoundRobin)->name(), "RoundRobin");
    EXPECT_EQ(make_strategy(RoutingStrategy::LeastConnections)->name(), "LeastConnections");
}

TEST(SelectionStrategyTest, OrderIsAPermutation) {
    std::vector<ProviderCandidate> pool{
        candidate("a", 0, HealthStatus::Degraded, 3),
        candidate("b", 1, HealthStatus::Healthy, 0),
        candidate("c", 2, HealthStatus::Healthy, 1),
    };
    for (auto kind : {RoutingStrategy::HealthBased, RoutingStrategy::RoundRobin,
                      RoutingStrategy::LeastConnections}) {
        auto strategy = make_strategy(kind);
        auto ordered = ids(strategy->order(pool));
        EXPECT_EQ(std::set<ProviderId>(ordered.begin(), ordered.end()),
                  (std::set<ProviderId>{"a", "b", "c"}))
            << to_string(kind);
    }
}
