#pragma once

#include "conductor/types.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace conductor {

// Cooperative cancellation shared by a batch and the provider requests it
// issues. cancel() stops new dispatches, retries and admission waits at
// once; provider calls already running are left to finish or time out.
class CancellationToken {
public:
    void cancel();
    bool cancelled() const noexcept { return cancelled_.load(); }

    // Sleep up to `d`; returns true early if cancelled meanwhile
    bool wait_for(Duration d);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace conductor
