#include <gtest/gtest.h>
#include <conductor/conductor.hpp>

#include <memory>
#include <string>
#include <vector>

#include "../test_support.hpp"

using namespace conductor;
using namespace conductor::test;

static MonitorEvent event_of(EventType type) {
    return make_event(type, to_string(type));
}

// ===========================================================================
// MetricsMonitor
// ===========================================================================

TEST(MetricsMonitorTest, CountsActionLifecycle) {
    MetricsMonitor metrics;

    metrics.on_event(event_of(EventType::ActionDispatched));
    metrics.on_event(event_of(EventType::ActionDispatched));
    metrics.on_event(event_of(EventType::ActionRetrying));
    metrics.on_event(event_of(EventType::ActionFailed));
    metrics.on_event(event_of(EventType::ActionSkipped));
    metrics.on_event(event_of(EventType::ActionCancelled));

    auto succeeded = event_of(EventType::ActionSucceeded);
    succeeded.latency_ms = 120.0;
    succeeded.cost_usd = 0.25;
    metrics.on_event(succeeded);
    succeeded.latency_ms = 80.0;
    succeeded.cost_usd = 0.5;
    metrics.on_event(succeeded);

    auto m = metrics.get_metrics();
    EXPECT_EQ(m.actions_dispatched, 2u);
    EXPECT_EQ(m.actions_retried, 1u);
    EXPECT_EQ(m.actions_failed, 1u);
    EXPECT_EQ(m.actions_skipped, 2u);
    EXPECT_EQ(m.actions_succeeded, 2u);
    EXPECT_DOUBLE_EQ(m.average_latency_ms, 100.0);
    EXPECT_DOUBLE_EQ(m.total_cost_usd, 0.75);
}

TEST(MetricsMonitorTest, CountsProviderAndBudgetEvents) {
    MetricsMonitor metrics;
    metrics.on_event(event_of(EventType::ProviderFailover));
    metrics.on_event(event_of(EventType::ProviderRequestFailed));
    metrics.on_event(event_of(EventType::RateLimited));
    metrics.on_event(event_of(EventType::BudgetWarning));
    metrics.on_event(event_of(EventType::BudgetDegraded));
    metrics.on_event(event_of(EventType::BudgetHalted));
    metrics.on_event(event_of(EventType::RequestDropped));

    auto m = metrics.get_metrics();
    EXPECT_EQ(m.provider_failovers, 1u);
    EXPECT_EQ(m.provider_errors, 1u);
    EXPECT_EQ(m.rate_limited, 1u);
    EXPECT_EQ(m.budget_warnings, 2u);
    EXPECT_EQ(m.budget_halts, 1u);
    EXPECT_EQ(m.requests_dropped, 1u);
}

TEST(MetricsMonitorTest, ResetClearsEverything) {
    MetricsMonitor metrics;
    auto succeeded = event_of(EventType::ActionSucceeded);
    succeeded.latency_ms = 50.0;
    metrics.on_event(succeeded);

    metrics.reset_metrics();
    auto m = metrics.get_metrics();
    EXPECT_EQ(m.actions_succeeded, 0u);
    EXPECT_DOUBLE_EQ(m.average_latency_ms, 0.0);
}

TEST(MetricsMonitorTest, UnhealthyAlertFires) {
    MetricsMonitor metrics;
    std::vector<std::string> alerts;
    metrics.set_unhealthy_alert([&alerts](const std::string& msg) { alerts.push_back(msg); });

    auto degraded = event_of(EventType::ProviderHealthChanged);
    degraded.provider_id = "p1";
    degraded.health_status = HealthStatus::Degraded;
    metrics.on_event(degraded);
    EXPECT_TRUE(alerts.empty());

    auto unhealthy = degraded;
    unhealthy.health_status = HealthStatus::Unhealthy;
    metrics.on_event(unhealthy);
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_NE(alerts[0].find("p1"), std::string::npos);
    EXPECT_EQ(metrics.get_metrics().health_changes, 2u);
}

TEST(MetricsMonitorTest, QueueSizeAlertFromSnapshot) {
    MetricsMonitor metrics;
    int fired = 0;
    metrics.set_queue_size_alert_threshold(10, [&fired](const std::string&) { fired++; });

    SystemSnapshot snap;
    snap.pending_requests = 5;
    metrics.on_snapshot(snap);
    EXPECT_EQ(fired, 0);

    snap.pending_requests = 11;
    metrics.on_snapshot(snap);
    EXPECT_EQ(fired, 1);
}

// ===========================================================================
// CompositeMonitor / ConsoleMonitor
// ===========================================================================

TEST(CompositeMonitorTest, FansOutToEveryMonitor) {
    auto first = std::make_shared<TestMonitor>();
    auto second = std::make_shared<TestMonitor>();
    CompositeMonitor composite;
    composite.add_monitor(first);
    composite.add_monitor(second);

    composite.on_event(event_of(EventType::PlanCreated));
    composite.on_snapshot(SystemSnapshot{});

    EXPECT_TRUE(first->has_event_type(EventType::PlanCreated));
    EXPECT_TRUE(second->has_event_type(EventType::PlanCreated));
    EXPECT_EQ(first->snapshot_count(), 1u);
    EXPECT_EQ(second->snapshot_count(), 1u);
}

TEST(ConsoleMonitorTest, QuietWritesNothing) {
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Quiet);
    testing::internal::CaptureStdout();
    console.on_event(event_of(EventType::BudgetHalted));
    console.on_snapshot(SystemSnapshot{});
    EXPECT_TRUE(testing::internal::GetCapturedStdout().empty());
}

TEST(ConsoleMonitorTest, NormalLogsImportantEventsOnly) {
    ConsoleMonitor console(ConsoleMonitor::Verbosity::Normal);

    auto halted = event_of(EventType::BudgetHalted);
    halted.action_id = "summarize";
    halted.guardrail_action = GuardrailAction::Halt;

    testing::internal::CaptureStdout();
    console.on_event(event_of(EventType::ActionDispatched));
    console.on_event(halted);
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out.find("ActionDispatched"), std::string::npos);
    EXPECT_NE(out.find("[Conductor] BudgetHalted"), std::string::npos);
    EXPECT_NE(out.find("action=summarize"), std::string::npos);
    EXPECT_NE(out.find("guardrail=Halt"), std::string::npos);
}

// ===========================================================================
// emit helper
// ===========================================================================

TEST(EmitTest, NullMonitorIsIgnored) {
    EXPECT_NO_THROW(emit(nullptr, event_of(EventType::PlanCreated)));
}
