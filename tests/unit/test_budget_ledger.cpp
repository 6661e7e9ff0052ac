#include <gtest/gtest.h>
#include <conductor/conductor.hpp>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "../test_support.hpp"

using namespace conductor;
using namespace conductor::test;

class BudgetLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto registry = std::make_shared<PricingRegistry>();
        tracker_ = std::make_shared<CostTracker>(registry, 10.0);
        GuardrailConfig cfg;
        cfg.fallback_model = "gpt-3.5-turbo";
        guardrail_ = std::make_shared<BudgetGuardrail>(cfg, tracker_);
        monitor_ = std::make_shared<TestMonitor>();
    }

    std::unique_ptr<BudgetLedger> make_ledger(double spent = 0.0) {
        auto state = tracker_->new_state();
        state.total_cost_usd = spent;
        auto ledger = std::make_unique<BudgetLedger>(guardrail_, state);
        ledger->set_monitor(monitor_);
        return ledger;
    }

    std::shared_ptr<CostTracker> tracker_;
    std::shared_ptr<BudgetGuardrail> guardrail_;
    std::shared_ptr<TestMonitor> monitor_;
};

// ===========================================================================
// Reserve / commit / release
// ===========================================================================

TEST_F(BudgetLedgerTest, ReserveThenCommitRecordsActualCost) {
    auto ledger = make_ledger();

    auto r = ledger->reserve(0.5, "summarize");
    ASSERT_TRUE(r.admitted());
    EXPECT_EQ(r.action, GuardrailAction::Continue);
    EXPECT_DOUBLE_EQ(ledger->reserved(), 0.5);

    double cost = ledger->commit(r, "gpt-4", "summarize", 1000, 500);
    EXPECT_NEAR(cost, 0.06, 1e-12);
    EXPECT_DOUBLE_EQ(ledger->reserved(), 0.0);

    auto state = ledger->snapshot();
    EXPECT_NEAR(state.total_cost_usd, 0.06, 1e-12);
    EXPECT_NEAR(state.node_costs["summarize"], 0.06, 1e-12);
    EXPECT_TRUE(monitor_->has_event_type(EventType::BudgetUpdated));
}

TEST_F(BudgetLedgerTest, CommitWithProviderPricedCost) {
    auto ledger = make_ledger();
    auto r = ledger->reserve(0.1);
    ledger->commit(r, "model-p1", "node", 10, 10, 0.25);
    EXPECT_DOUBLE_EQ(ledger->snapshot().total_cost_usd, 0.25);
}

TEST_F(BudgetLedgerTest, ReleaseReturnsReservation) {
    auto ledger = make_ledger();
    auto r = ledger->reserve(3.0);
    EXPECT_DOUBLE_EQ(ledger->reserved(), 3.0);

    ledger->release(r);
    EXPECT_DOUBLE_EQ(ledger->reserved(), 0.0);
    EXPECT_DOUBLE_EQ(ledger->snapshot().total_cost_usd, 0.0);

    // Releasing twice is harmless
    ledger->release(r);
    EXPECT_DOUBLE_EQ(ledger->reserved(), 0.0);
}

TEST_F(BudgetLedgerTest, HaltedReservationHoldsNothing) {
    auto ledger = make_ledger(9.5);
    auto r = ledger->reserve(1.0, "expensive");

    EXPECT_FALSE(r.admitted());
    EXPECT_EQ(r.action, GuardrailAction::Halt);
    EXPECT_EQ(r.id, 0u);
    EXPECT_DOUBLE_EQ(ledger->reserved(), 0.0);

    auto halted = monitor_->get_events_of_type(EventType::BudgetHalted);
    ASSERT_EQ(halted.size(), 1u);
    EXPECT_EQ(halted[0].action_id.value_or(""), "expensive");
}

TEST_F(BudgetLedgerTest, DegradeCarriesAdvice) {
    auto ledger = make_ledger(9.0);
    auto r = ledger->reserve(0.2);

    ASSERT_TRUE(r.admitted());
    EXPECT_EQ(r.action, GuardrailAction::Degrade);
    ASSERT_TRUE(r.degradation.has_value());
    EXPECT_EQ(r.degradation->model.value_or(""), "gpt-3.5-turbo");
    EXPECT_TRUE(monitor_->has_event_type(EventType::BudgetDegraded));
}

TEST_F(BudgetLedgerTest, WarnEmitsWarningEvent) {
    auto ledger = make_ledger(8.1);
    auto r = ledger->reserve(0.0);
    EXPECT_EQ(r.action, GuardrailAction::Warn);
    EXPECT_TRUE(monitor_->has_event_type(EventType::BudgetWarning));
    EXPECT_EQ(ledger->current_action(), GuardrailAction::Warn);
}

TEST_F(BudgetLedgerTest, OutstandingReservationsCountTowardProjection) {
    auto ledger = make_ledger();

    auto first = ledger->reserve(6.0);
    ASSERT_TRUE(first.admitted());

    // 6 outstanding + 5 estimated crosses the limit even though nothing is spent
    auto second = ledger->reserve(5.0);
    EXPECT_FALSE(second.admitted());

    ledger->release(first);
    EXPECT_TRUE(ledger->reserve(5.0).admitted());
}

TEST_F(BudgetLedgerTest, ExceededErrorUsesCommittedState) {
    auto ledger = make_ledger(10.0);
    auto err = ledger->exceeded_error();
    EXPECT_EQ(err.message, "Budget limit of $10.00 exceeded. Current cost: $10.00");
    EXPECT_EQ(ledger->current_action(), GuardrailAction::Halt);
}

TEST_F(BudgetLedgerTest, RequiresGuardrail) {
    EXPECT_THROW(BudgetLedger(nullptr, BudgetState{}), InvalidConfigException);
}

// ===========================================================================
// Concurrency: reservations serialize against one limit
// ===========================================================================

TEST_F(BudgetLedgerTest, ConcurrentReservationsNeverOvershoot) {
    auto ledger = make_ledger();
    std::atomic<int> admitted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 16; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 10; ++i) {
                auto r = ledger->reserve(0.25);
                if (r.admitted()) admitted++;
            }
        });
    }
    for (auto& th : threads) th.join();

    // 160 attempts at $0.25 against $10: projected total must stay below 1.0 usage
    EXPECT_EQ(admitted.load(), 39);
    EXPECT_LT(ledger->reserved(), 10.0);
}

TEST_F(BudgetLedgerTest, ConcurrentCommitsAreAllRecorded) {
    auto ledger = make_ledger();

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&ledger, t] {
            for (int i = 0; i < 25; ++i) {
                auto r = ledger->reserve(0.01);
                ledger->commit(r, "gpt-3.5-turbo", "node-" + std::to_string(t), 100, 100, 0.01);
            }
        });
    }
    for (auto& th : threads) th.join();

    auto state = ledger->snapshot();
    EXPECT_NEAR(state.total_cost_usd, 2.0, 1e-9);
    EXPECT_EQ(state.total_tokens, 200 * 200);
    EXPECT_EQ(state.node_costs.size(), 8u);
    EXPECT_DOUBLE_EQ(ledger->reserved(), 0.0);
}
