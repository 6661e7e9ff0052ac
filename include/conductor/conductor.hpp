#pragma once

// Conductor: orchestration core for rate-limited, metered upstream providers
//
// Levels a batch of interdependent actions and dispatches them through a
// health-aware, budget-bounded, rate-limited router with failover.

// Core
#include "conductor/types.hpp"
#include "conductor/exceptions.hpp"
#include "conductor/config.hpp"
#include "conductor/action.hpp"
#include "conductor/monitor.hpp"
#include "conductor/cancellation.hpp"

// Admission control
#include "conductor/rate_limiter.hpp"
#include "conductor/request_queue.hpp"

// Providers
#include "conductor/health_monitor.hpp"
#include "conductor/provider.hpp"
#include "conductor/selection_strategy.hpp"
#include "conductor/router.hpp"

// Budget
#include "conductor/budget.hpp"
#include "conductor/guardrail.hpp"

// Execution
#include "conductor/coordinator.hpp"
#include "conductor/orchestrator.hpp"
