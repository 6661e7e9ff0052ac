#include "conductor/action.hpp"

#include <algorithm>

namespace conductor {

Duration RetryPolicy::delay_after(int attempt) const {
    if (attempt < 1) attempt = 1;

    Duration delay = base_delay;
    if (backoff == BackoffShape::Linear) {
        delay = base_delay * attempt;
    } else {
        // Cap the shift so large attempt counts cannot overflow
        int shift = std::min(attempt - 1, 30);
        delay = base_delay * (std::int64_t{1} << shift);
    }
    if (delay > max_delay || delay < Duration::zero()) {
        delay = max_delay;
    }
    return delay;
}

const ActionResult* ExecutionSummary::find(const ActionId& id) const {
    auto it = std::find_if(results.begin(), results.end(),
        [&id](const ActionResult& r) { return r.action_id == id; });
    return (it != results.end()) ? &*it : nullptr;
}

} // namespace conductor
