#include "conductor/cancellation.hpp"

namespace conductor {

void CancellationToken::cancel() {
    cancelled_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
}

bool CancellationToken::wait_for(Duration d) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, d, [this] { return cancelled_.load(); });
}

} // namespace conductor
