#include <gtest/gtest.h>
#include <conductor/conductor.hpp>

#include <memory>

using namespace conductor;

// ===========================================================================
// Fixture: $10 budget, warning 0.8, soft 0.9, hard 1.0
// ===========================================================================

class BudgetTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<PricingRegistry>();
        tracker_ = std::make_shared<CostTracker>(registry_, 10.0, 0.8, 8000);
        guardrail_ = std::make_shared<BudgetGuardrail>(GuardrailConfig{}, tracker_);
    }

    BudgetState state_at(double cost) const {
        auto state = tracker_->new_state();
        state.total_cost_usd = cost;
        return state;
    }

    std::shared_ptr<PricingRegistry> registry_;
    std::shared_ptr<CostTracker> tracker_;
    std::shared_ptr<BudgetGuardrail> guardrail_;
};

// ===========================================================================
// Pricing
// ===========================================================================

TEST_F(BudgetTest, KnownModelPrices) {
    auto gpt4 = registry_->get_pricing("gpt-4");
    EXPECT_DOUBLE_EQ(gpt4.input_price_per_1k, 0.03);
    EXPECT_DOUBLE_EQ(gpt4.output_price_per_1k, 0.06);

    auto haiku = registry_->get_pricing("claude-haiku");
    EXPECT_DOUBLE_EQ(haiku.input_price_per_1k, 0.00025);
    EXPECT_EQ(haiku.provider, "anthropic");
}

TEST_F(BudgetTest, UnknownModelUsesConservativeDefault) {
    EXPECT_FALSE(registry_->has_pricing("mystery-model"));
    auto p = registry_->get_pricing("mystery-model");
    EXPECT_DOUBLE_EQ(p.input_price_per_1k, 0.01);
    EXPECT_DOUBLE_EQ(p.output_price_per_1k, 0.03);
}

TEST_F(BudgetTest, RegisterCustomPricing) {
    ModelPricing custom;
    custom.model_name = "house-model";
    custom.input_price_per_1k = 0.002;
    custom.output_price_per_1k = 0.004;
    registry_->register_pricing(custom);

    EXPECT_TRUE(registry_->has_pricing("house-model"));
    EXPECT_NEAR(tracker_->calculate_cost("house-model", 1000, 500), 0.004, 1e-12);

    ModelPricing unnamed;
    EXPECT_THROW(registry_->register_pricing(unnamed), InvalidConfigException);
}

TEST_F(BudgetTest, CalculateCost) {
    // 1000 in * 0.03/1k + 500 out * 0.06/1k
    EXPECT_NEAR(tracker_->calculate_cost("gpt-4", 1000, 500), 0.06, 1e-12);
    EXPECT_DOUBLE_EQ(tracker_->calculate_cost("gpt-4", 0, 0), 0.0);
}

TEST_F(BudgetTest, TrackerRejectsBadArguments) {
    EXPECT_THROW(CostTracker(nullptr), InvalidConfigException);
    EXPECT_THROW(CostTracker(registry_, 0.0), InvalidConfigException);
}

// ===========================================================================
// UpdateAfterCall
// ===========================================================================

TEST_F(BudgetTest, UpdateAfterCallAccumulatesBreakdowns) {
    auto state = tracker_->new_state();

    double c1 = tracker_->update_after_call(state, "gpt-4", "planner", 1000, 500);
    double c2 = tracker_->update_after_call(state, "claude-haiku", "writer", 2000, 1000);
    double c3 = tracker_->update_after_call(state, "gpt-4", "writer", 100, 100);

    EXPECT_NEAR(state.total_cost_usd, c1 + c2 + c3, 1e-12);
    EXPECT_EQ(state.total_input_tokens, 3100);
    EXPECT_EQ(state.total_output_tokens, 1600);
    EXPECT_EQ(state.total_tokens, 4700);

    EXPECT_NEAR(state.model_costs["gpt-4"], c1 + c3, 1e-12);
    EXPECT_EQ(state.model_tokens["claude-haiku"], 3000);
    EXPECT_NEAR(state.node_costs["writer"], c2 + c3, 1e-12);
    EXPECT_EQ(state.node_tokens["planner"], 1500);
    EXPECT_FALSE(state.budget_exceeded);
}

TEST_F(BudgetTest, CostNeverDecreases) {
    auto state = tracker_->new_state();
    double previous = 0.0;
    for (int i = 0; i < 20; ++i) {
        tracker_->update_after_call(state, "gpt-3.5-turbo", "node", i * 10, i * 5);
        EXPECT_GE(state.total_cost_usd, previous);
        previous = state.total_cost_usd;
    }
}

TEST_F(BudgetTest, ReachingLimitSetsExceededFlag) {
    auto state = state_at(9.99);
    tracker_->apply_cost(state, "gpt-4", "node", 0, 0, 0.01);
    EXPECT_TRUE(state.budget_exceeded);
    EXPECT_TRUE(tracker_->check_budget_status(state).is_exceeded);
}

TEST_F(BudgetTest, BudgetStatus) {
    auto status = tracker_->check_budget_status(state_at(8.5));
    EXPECT_DOUBLE_EQ(status.budget_used, 8.5);
    EXPECT_DOUBLE_EQ(status.budget_remaining, 1.5);
    EXPECT_NEAR(status.budget_usage, 0.85, 1e-12);
    EXPECT_TRUE(status.is_warning);
    EXPECT_FALSE(status.is_exceeded);

    auto over = tracker_->check_budget_status(state_at(12.0));
    EXPECT_DOUBLE_EQ(over.budget_remaining, 0.0);
    EXPECT_TRUE(over.is_exceeded);
}

// ===========================================================================
// Guardrail staircase
// ===========================================================================

TEST_F(BudgetTest, StaircaseAtDocumentedCosts) {
    EXPECT_EQ(guardrail_->check(state_at(1.0)), GuardrailAction::Continue);
    EXPECT_EQ(guardrail_->check(state_at(8.50)), GuardrailAction::Warn);
    EXPECT_EQ(guardrail_->check(state_at(9.10)), GuardrailAction::Degrade);
    EXPECT_EQ(guardrail_->check(state_at(10.00)), GuardrailAction::Halt);
}

TEST_F(BudgetTest, StaircaseIsMonotonic) {
    GuardrailAction previous = GuardrailAction::Continue;
    for (int cents = 0; cents <= 1200; cents += 7) {
        auto action = guardrail_->check(state_at(cents / 100.0));
        EXPECT_GE(static_cast<int>(action), static_cast<int>(previous)) << "at $" << cents / 100.0;
        previous = action;
    }
}

TEST_F(BudgetTest, FullUsageHaltsRegardlessOfThresholds) {
    GuardrailConfig loose;
    loose.warning_threshold = 1.0;
    loose.soft_limit_threshold = 1.0;
    loose.hard_limit_threshold = 1.0;
    BudgetGuardrail guardrail(loose, tracker_);

    EXPECT_EQ(guardrail.check(state_at(10.0)), GuardrailAction::Halt);
    EXPECT_EQ(guardrail.check(state_at(25.0)), GuardrailAction::Halt);

    auto flagged = state_at(0.0);
    flagged.budget_exceeded = true;
    EXPECT_EQ(guardrail.check(flagged), GuardrailAction::Halt);
}

TEST_F(BudgetTest, HardLimitBelowOneHalts) {
    GuardrailConfig cfg;
    cfg.hard_limit_threshold = 0.95;
    BudgetGuardrail guardrail(cfg, tracker_);
    EXPECT_EQ(guardrail.check(state_at(9.6)), GuardrailAction::Halt);
}

TEST_F(BudgetTest, DegradationDisabledHaltsAtSoftLimit) {
    GuardrailConfig cfg;
    cfg.enable_graceful_degradation = false;
    BudgetGuardrail guardrail(cfg, tracker_);
    EXPECT_EQ(guardrail.check(state_at(9.1)), GuardrailAction::Halt);
    EXPECT_EQ(guardrail.check(state_at(8.5)), GuardrailAction::Warn);
}

TEST_F(BudgetTest, ProjectedCheckIncludesEstimate) {
    auto state = state_at(8.0);
    EXPECT_EQ(guardrail_->check(state), GuardrailAction::Warn);
    EXPECT_EQ(guardrail_->check_projected(state, 1.5), GuardrailAction::Degrade);
    EXPECT_EQ(guardrail_->check_projected(state, 2.5), GuardrailAction::Halt);
    EXPECT_DOUBLE_EQ(state.total_cost_usd, 8.0);
}

// ===========================================================================
// Degradation advice and errors
// ===========================================================================

TEST_F(BudgetTest, DegradationConfigOnlyWhenDegrading) {
    GuardrailConfig cfg;
    cfg.fallback_model = "claude-haiku";
    cfg.context_reduction_factor = 0.5;
    BudgetGuardrail guardrail(cfg, tracker_);

    EXPECT_FALSE(guardrail.degradation_config(state_at(5.0)).has_value());

    auto advice = guardrail.degradation_config(state_at(9.2));
    ASSERT_TRUE(advice.has_value());
    EXPECT_EQ(advice->model.value_or(""), "claude-haiku");
    EXPECT_EQ(advice->max_context_tokens.value_or(0), 4000);
}

TEST_F(BudgetTest, NoContextReductionWhenDisabled) {
    GuardrailConfig cfg;
    cfg.reduce_context_on_degradation = false;
    BudgetGuardrail guardrail(cfg, tracker_);

    auto advice = guardrail.degradation_advice(state_at(9.2));
    EXPECT_FALSE(advice.max_context_tokens.has_value());
    EXPECT_FALSE(advice.model.has_value());
}

TEST_F(BudgetTest, ExceededErrorDescribesState) {
    auto err = guardrail_->budget_exceeded_error(state_at(10.5));
    EXPECT_EQ(err.message, "Budget limit of $10.00 exceeded. Current cost: $10.50");
    EXPECT_DOUBLE_EQ(err.budget_limit_usd, 10.0);
    EXPECT_DOUBLE_EQ(err.current_cost_usd, 10.5);
    EXPECT_NEAR(err.budget_usage, 1.05, 1e-12);
    EXPECT_FALSE(err.suggestion.empty());
    EXPECT_TRUE(err.state_preserved);
}

TEST_F(BudgetTest, EnforceThrowsOnHalt) {
    EXPECT_NO_THROW(guardrail_->enforce(state_at(9.0)));
    EXPECT_TRUE(guardrail_->should_halt(state_at(10.0)));

    try {
        guardrail_->enforce(state_at(11.0));
        FAIL() << "Expected BudgetExceededException";
    } catch (const BudgetExceededException& e) {
        EXPECT_DOUBLE_EQ(e.current_cost(), 11.0);
        EXPECT_DOUBLE_EQ(e.limit(), 10.0);
        EXPECT_STREQ(e.what(), "Budget limit of $10.00 exceeded. Current cost: $11.00");
    }
}

TEST_F(BudgetTest, GuardrailRequiresTracker) {
    EXPECT_THROW(BudgetGuardrail(GuardrailConfig{}, nullptr), InvalidConfigException);
}
