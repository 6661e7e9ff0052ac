#include "conductor/request_queue.hpp"
#include "conductor/exceptions.hpp"
#include "conductor/rate_limiter.hpp"

#include <algorithm>

namespace conductor {

RequestQueue::RequestQueue(QueueConfig config)
    : config_(std::move(config))
{}

RequestId RequestQueue::enqueue(QueuedRequest request) {
    RequestId id;
    std::shared_ptr<Monitor> monitor;
    auto event = make_event(EventType::RequestEnqueued, "Request enqueued");
    event.agent_id = request.agent_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.size() >= config_.max_size) {
            throw QueueFullException();
        }
        id = next_request_id_++;
        request.id = id;
        request.created_at = Clock::now();
        if (request.max_retries < 0) {
            request.max_retries = config_.max_retries;
        }
        insert_ordered(std::move(request));
        stats_.enqueued++;
        monitor = monitor_;
    }
    cv_.notify_one();
    emit(monitor, std::move(event));
    return id;
}

std::optional<QueuedRequest> RequestQueue::dequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.empty()) {
        return std::nullopt;
    }
    auto req = std::move(requests_.front());
    requests_.erase(requests_.begin());
    return req;
}

std::optional<QueuedRequest> RequestQueue::peek() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.empty()) {
        return std::nullopt;
    }
    return requests_.front();
}

bool RequestQueue::cancel(RequestId id) {
    std::optional<QueuedRequest> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(requests_.begin(), requests_.end(),
            [id](const QueuedRequest& r) { return r.id == id; });
        if (it == requests_.end()) {
            return false;
        }
        removed = std::move(*it);
        requests_.erase(it);
    }
    if (removed->callback) {
        removed->callback(*removed, QueuedRequestStatus::Cancelled);
    }
    return true;
}

std::size_t RequestQueue::cancel_all_for_agent(const AgentKey& agent_id) {
    std::vector<QueuedRequest> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.begin();
        while (it != requests_.end()) {
            if (it->agent_id == agent_id) {
                removed.push_back(std::move(*it));
                it = requests_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& req : removed) {
        if (req.callback) {
            req.callback(req, QueuedRequestStatus::Cancelled);
        }
    }
    return removed.size();
}

std::vector<QueuedRequest> RequestQueue::get_all_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::size_t RequestQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

bool RequestQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.empty();
}

bool RequestQueue::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size() >= config_.max_size;
}

std::size_t RequestQueue::max_size() const noexcept {
    return config_.max_size;
}

QueueType RequestQueue::type() const noexcept {
    return config_.type;
}

std::optional<QueuedRequest> RequestQueue::wait_and_dequeue(Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !requests_.empty(); })) {
        return std::nullopt;
    }
    auto req = std::move(requests_.front());
    requests_.erase(requests_.begin());
    return req;
}

void RequestQueue::drain(RateLimiter& limiter, const Handler& handler, bool charge_global) {
    while (!stopping_.load()) {
        auto next = peek();
        if (!next.has_value()) break;

        // Admission is checked for the head request; wait instead of polling
        auto admission = limiter.can_proceed(next->agent_id, Clock::now(), charge_global);
        if (!admission.admitted) {
            auto wait = std::min(admission.wait, Duration(std::chrono::seconds(1)));
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, wait, [this] { return stopping_.load(); });
            continue;
        }

        auto request = dequeue();
        if (!request.has_value()) break;

        bool ok = false;
        std::string reason = "Handler reported failure";
        try {
            ok = handler(*request);
        } catch (const std::exception& e) {
            reason = e.what();
        }

        if (ok) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.processed++;
            }
            if (request->callback) {
                request->callback(*request, QueuedRequestStatus::Completed);
            }
        } else {
            handle_failure(std::move(*request), reason);
        }
    }
}

void RequestQueue::stop() {
    stopping_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
}

void RequestQueue::resume() {
    stopping_.store(false);
}

RequestQueue::Stats RequestQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void RequestQueue::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

void RequestQueue::insert_ordered(QueuedRequest request) {
    if (config_.type == QueueType::Fifo) {
        requests_.push_back(std::move(request));
        return;
    }
    // First position holding a strictly lower priority
    auto pos = std::find_if(requests_.begin(), requests_.end(),
        [&request](const QueuedRequest& r) {
            return static_cast<int>(r.priority) < static_cast<int>(request.priority);
        });
    requests_.insert(pos, std::move(request));
}

void RequestQueue::handle_failure(QueuedRequest request, const std::string& reason) {
    std::shared_ptr<Monitor> monitor;
    QueuedRequestStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
        stats_.failed++;
        if (request.retry_count < request.max_retries) {
            request.retry_count++;
            stats_.requeued++;
            status = QueuedRequestStatus::Requeued;
            insert_ordered(request);
        } else {
            stats_.dropped++;
            status = QueuedRequestStatus::Dropped;
        }
    }

    auto event = make_event(status == QueuedRequestStatus::Requeued
                                ? EventType::RequestRequeued
                                : EventType::RequestDropped,
                            reason);
    event.agent_id = request.agent_id;
    event.attempt = request.retry_count;
    emit(monitor, std::move(event));

    if (request.callback) {
        request.callback(request, status);
    }
}

// ========== QueueManager ==========

QueueManager::QueueManager(QueueConfig config)
    : config_(std::move(config))
{}

RequestQueue& QueueManager::get_or_create_queue(const AgentKey& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = agent_queues_[agent_id];
    if (!slot) {
        slot = std::make_unique<RequestQueue>(config_);
    }
    return *slot;
}

RequestQueue& QueueManager::global_queue() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!global_queue_) {
        QueueConfig cfg = config_;
        cfg.type = QueueType::Priority;
        global_queue_ = std::make_unique<RequestQueue>(cfg);
    }
    return *global_queue_;
}

RequestId QueueManager::enqueue_request(QueuedRequest request, bool use_global) {
    RequestQueue& queue = use_global ? global_queue() : get_or_create_queue(request.agent_id);
    return queue.enqueue(std::move(request));
}

QueueManager::Stats QueueManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats result;
    auto summarize = [](const RequestQueue& q) {
        auto s = q.stats();
        QueueStats qs;
        qs.size = q.size();
        qs.processed = s.processed;
        qs.failed = s.failed;
        qs.dropped = s.dropped;
        return qs;
    };
    for (auto& [agent, queue] : agent_queues_) {
        result.agent_queues[agent] = summarize(*queue);
    }
    if (global_queue_) {
        result.global_queue = summarize(*global_queue_);
    }
    return result;
}

} // namespace conductor
