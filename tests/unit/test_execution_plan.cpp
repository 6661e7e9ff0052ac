#include <gtest/gtest.h>
#include <conductor/conductor.hpp>

#include <algorithm>
#include <memory>
#include <random>
#include <set>
#include <unordered_map>

#include "../test_support.hpp"

using namespace conductor;
using namespace conductor::test;
using namespace std::chrono_literals;

// Planning never touches providers; the router only has to exist.
class ExecutionPlanTest : public ::testing::Test {
protected:
    void SetUp() override {
        providers_ = {make_provider("p1", 0)};
        client_ = std::make_shared<FakeProviderClient>();
        monitor_ = std::make_shared<TestMonitor>();
        health_ = std::make_unique<ProviderHealthMonitor>(providers_);
        limiter_ = std::make_unique<RateLimiter>(generous_limit(), generous_limit());
        router_ = std::make_unique<Router>(providers_, fast_router_config(), client_, *health_, *limiter_);
        coordinator_ = std::make_unique<ExecutionCoordinator>(*router_);
        coordinator_->set_monitor(monitor_);
    }

    static std::vector<ActionId> ids(const std::vector<Action>& level) {
        std::vector<ActionId> out;
        for (const auto& a : level) out.push_back(a.id);
        return out;
    }

    std::vector<ProviderConfig> providers_;
    std::shared_ptr<FakeProviderClient> client_;
    std::shared_ptr<TestMonitor> monitor_;
    std::unique_ptr<ProviderHealthMonitor> health_;
    std::unique_ptr<RateLimiter> limiter_;
    std::unique_ptr<Router> router_;
    std::unique_ptr<ExecutionCoordinator> coordinator_;
};

// ===========================================================================
// Leveling
// ===========================================================================

TEST_F(ExecutionPlanTest, JoinWaitsForBothRoots) {
    auto plan = coordinator_->plan({
        make_action("A"),
        make_action("B"),
        make_action("C", {"A", "B"}),
    });

    ASSERT_EQ(plan.level_count(), 2u);
    EXPECT_EQ(ids(plan.levels[0]), (std::vector<ActionId>{"A", "B"}));
    EXPECT_EQ(ids(plan.levels[1]), (std::vector<ActionId>{"C"}));
    EXPECT_EQ(plan.total_actions, 3u);
    EXPECT_TRUE(monitor_->has_event_type(EventType::PlanCreated));
}

TEST_F(ExecutionPlanTest, ChainIsOneActionPerLevel) {
    auto plan = coordinator_->plan({
        make_action("load"),
        make_action("parse", {"load"}),
        make_action("index", {"parse"}),
        make_action("report", {"index"}),
    });
    ASSERT_EQ(plan.level_count(), 4u);
    EXPECT_EQ(plan.levels[3][0].id, "report");
}

TEST_F(ExecutionPlanTest, InputOrderKeptWithinLevel) {
    auto plan = coordinator_->plan({
        make_action("z"),
        make_action("y"),
        make_action("x"),
        make_action("w", {"x"}),
        make_action("v", {"z"}),
    });
    ASSERT_EQ(plan.level_count(), 2u);
    EXPECT_EQ(ids(plan.levels[0]), (std::vector<ActionId>{"z", "y", "x"}));
    EXPECT_EQ(ids(plan.levels[1]), (std::vector<ActionId>{"w", "v"}));
}

TEST_F(ExecutionPlanTest, DuplicateDependencyIsCountedOnce) {
    auto plan = coordinator_->plan({
        make_action("A"),
        make_action("B", {"A", "A"}),
    });
    ASSERT_EQ(plan.level_count(), 2u);
    EXPECT_EQ(plan.levels[1][0].id, "B");
}

TEST_F(ExecutionPlanTest, EmptyBatch) {
    auto plan = coordinator_->plan({});
    EXPECT_EQ(plan.level_count(), 0u);
    EXPECT_EQ(plan.total_actions, 0u);
    EXPECT_EQ(plan.estimated_time, Duration::zero());
}

TEST_F(ExecutionPlanTest, EstimatedTimeSumsSlowestPerLevel) {
    auto a = make_action("A");
    a.timeout = 2s;
    auto b = make_action("B");
    b.timeout = 5s;
    auto c = make_action("C", {"A", "B"});
    c.timeout = 1s;

    auto plan = coordinator_->plan({a, b, c});
    EXPECT_EQ(plan.estimated_time, Duration(6s));
}

TEST_F(ExecutionPlanTest, RandomGraphsSatisfyLevelProperty) {
    std::mt19937 rng(42);
    for (int trial = 0; trial < 50; ++trial) {
        // Edges only point to earlier ids, so every graph is acyclic
        std::vector<Action> actions;
        int n = 1 + static_cast<int>(rng() % 25);
        for (int i = 0; i < n; ++i) {
            std::vector<ActionId> deps;
            for (int j = 0; j < i; ++j) {
                if (rng() % 4 == 0) deps.push_back("a" + std::to_string(j));
            }
            actions.push_back(make_action("a" + std::to_string(i), deps));
        }
        std::shuffle(actions.begin(), actions.end(), rng);

        auto plan = coordinator_->plan(actions);

        std::unordered_map<ActionId, std::size_t> level_of;
        for (std::size_t l = 0; l < plan.levels.size(); ++l) {
            for (const auto& a : plan.levels[l]) {
                ASSERT_TRUE(level_of.emplace(a.id, l).second) << a.id << " placed twice";
            }
        }
        ASSERT_EQ(level_of.size(), actions.size());

        for (const auto& a : actions) {
            for (const auto& dep : a.dependencies) {
                EXPECT_GT(level_of.at(a.id), level_of.at(dep))
                    << a.id << " must run after " << dep;
            }
        }
    }
}

// ===========================================================================
// Invalid batches
// ===========================================================================

TEST_F(ExecutionPlanTest, CycleIsRejected) {
    try {
        coordinator_->plan({
            make_action("ok"),
            make_action("A", {"C"}),
            make_action("B", {"A"}),
            make_action("C", {"B"}),
        });
        FAIL() << "Expected CyclicDependencyException";
    } catch (const CyclicDependencyException& e) {
        std::set<ActionId> unresolved(e.unresolved().begin(), e.unresolved().end());
        EXPECT_EQ(unresolved, (std::set<ActionId>{"A", "B", "C"}));
    }
}

TEST_F(ExecutionPlanTest, SelfDependencyIsACycle) {
    EXPECT_THROW(coordinator_->plan({make_action("A", {"A"})}), CyclicDependencyException);
}

TEST_F(ExecutionPlanTest, DuplicateIdIsRejected) {
    try {
        coordinator_->plan({make_action("A"), make_action("A")});
        FAIL() << "Expected DuplicateActionException";
    } catch (const DuplicateActionException& e) {
        EXPECT_EQ(e.action_id(), "A");
    }
}

TEST_F(ExecutionPlanTest, UnknownDependencyIsRejected) {
    try {
        coordinator_->plan({make_action("A", {"ghost"})});
        FAIL() << "Expected UnknownDependencyException";
    } catch (const UnknownDependencyException& e) {
        EXPECT_EQ(e.action_id(), "A");
        EXPECT_EQ(e.dependency_id(), "ghost");
    }
}

TEST_F(ExecutionPlanTest, InvalidBatchDispatchesNothing) {
    EXPECT_THROW(coordinator_->execute({make_action("A", {"B"}), make_action("B", {"A"})}),
                 InvalidPlanException);
    EXPECT_EQ(client_->total_calls(), 0u);
    EXPECT_FALSE(monitor_->has_event_type(EventType::ActionDispatched));
}

// ===========================================================================
// Result aggregation
// ===========================================================================

TEST_F(ExecutionPlanTest, CollectResultsAggregates) {
    ActionResult ok;
    ok.action_id = "a";
    ok.success = true;
    ok.latency = 100ms;
    ok.cost = 0.5;

    ActionResult bad;
    bad.action_id = "b";
    bad.error = {ErrorKind::PermanentProviderError, "nope"};
    bad.latency = 300ms;

    auto summary = ExecutionCoordinator::collect_results({ok, bad});
    EXPECT_EQ(summary.total_actions, 2u);
    EXPECT_EQ(summary.successful, 1u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_DOUBLE_EQ(summary.success_rate, 0.5);
    EXPECT_EQ(summary.total_latency, Duration(400ms));
    EXPECT_EQ(summary.average_latency, Duration(200ms));
    EXPECT_DOUBLE_EQ(summary.total_cost, 0.5);
    ASSERT_EQ(summary.errors.size(), 1u);
    EXPECT_EQ(summary.errors[0].kind, ErrorKind::PermanentProviderError);
    ASSERT_NE(summary.find("b"), nullptr);
    EXPECT_EQ(summary.find("missing"), nullptr);
}

TEST_F(ExecutionPlanTest, CoordinatorRejectsZeroConcurrency) {
    CoordinatorConfig cfg;
    cfg.max_concurrency = 0;
    EXPECT_THROW(ExecutionCoordinator(*router_, cfg), InvalidConfigException);
}
