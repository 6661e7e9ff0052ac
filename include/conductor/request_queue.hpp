#pragma once

#include "conductor/types.hpp"
#include "conductor/config.hpp"
#include "conductor/monitor.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace conductor {

class RateLimiter;

enum class QueuedRequestStatus {
    Completed,
    Requeued,
    Dropped,
    Cancelled
};

struct QueuedRequest;
using QueuedRequestCallback = std::function<void(const QueuedRequest&, QueuedRequestStatus)>;

struct QueuedRequest {
    RequestId id{0};
    AgentKey agent_id;
    ParameterMap payload;
    RequestPriority priority{RequestPriority::Medium};
    Timestamp created_at{};
    int retry_count{0};
    int max_retries{-1};           // -1 = use the queue's configured value
    QueuedRequestCallback callback;
};

// Pending-request queue in front of the rate limiter.
//
// Priority mode keeps higher-priority requests ahead of lower-priority
// ones regardless of submission order; equal priorities stay FIFO.
class RequestQueue {
public:
    // Returns true when the request was handled successfully.
    using Handler = std::function<bool(const QueuedRequest&)>;

    struct Stats {
        std::uint64_t enqueued{0};
        std::uint64_t processed{0};
        std::uint64_t failed{0};
        std::uint64_t requeued{0};
        std::uint64_t dropped{0};
    };

    explicit RequestQueue(QueueConfig config = QueueConfig{});

    // Assigns and returns the RequestId. Throws QueueFullException.
    RequestId enqueue(QueuedRequest request);

    std::optional<QueuedRequest> dequeue();
    std::optional<QueuedRequest> peek() const;

    bool cancel(RequestId id);
    std::size_t cancel_all_for_agent(const AgentKey& agent_id);

    std::vector<QueuedRequest> get_all_pending() const;

    std::size_t size() const;
    bool empty() const;
    bool full() const;
    std::size_t max_size() const noexcept;
    QueueType type() const noexcept;

    // Block until a request is available or timeout elapses.
    std::optional<QueuedRequest> wait_and_dequeue(Duration timeout);

    // Process pending requests no faster than the limiter admits them.
    // Failed requests are re-enqueued until their retry limit, then dropped.
    // Returns when the queue is empty or once stop() has been called.
    void drain(RateLimiter& limiter, const Handler& handler, bool charge_global = true);

    void stop();
    void resume();
    Stats stats() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    QueueConfig config_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<QueuedRequest> requests_;
    RequestId next_request_id_{1};
    Stats stats_;
    std::atomic<bool> stopping_{false};
    std::shared_ptr<Monitor> monitor_;

    // Caller must hold mutex_
    void insert_ordered(QueuedRequest request);
    void handle_failure(QueuedRequest request, const std::string& reason);
};

// Per-agent queues plus an optional shared global queue.
class QueueManager {
public:
    struct QueueStats {
        std::size_t size{0};
        std::uint64_t processed{0};
        std::uint64_t failed{0};
        std::uint64_t dropped{0};
    };

    struct Stats {
        std::unordered_map<AgentKey, QueueStats> agent_queues;
        std::optional<QueueStats> global_queue;
    };

    explicit QueueManager(QueueConfig config = QueueConfig{});

    RequestQueue& get_or_create_queue(const AgentKey& agent_id);
    RequestQueue& global_queue();

    RequestId enqueue_request(QueuedRequest request, bool use_global = false);

    Stats stats() const;

private:
    QueueConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<AgentKey, std::unique_ptr<RequestQueue>> agent_queues_;
    std::unique_ptr<RequestQueue> global_queue_;
};

} // namespace conductor
