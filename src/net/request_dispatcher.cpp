#include "net/request_dispatcher.h"

namespace net {

LaneQueue::LaneQueue(std::size_t capacity, OverflowPolicy policy)
    : capacity_(capacity), policy_(policy) {}

EnqueueResult LaneQueue::push(RequestJob job) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto result = EnqueueResult::Queued;
    if (stopped_) {
        return EnqueueResult::Stopped;
    }
    if (fullLocked()) {
        switch (policy_) {
            case OverflowPolicy::Block:
                not_full_.wait(lock, [this] { return stopped_ || !fullLocked(); });
                if (stopped_) {
                    return EnqueueResult::Stopped;
                }
                break;
            case OverflowPolicy::DropNewest:
                return EnqueueResult::Dropped;
            case OverflowPolicy::DropOldest:
                jobs_.pop_front();
                result = EnqueueResult::DisplacedOldest;
                break;
        }
    }
    jobs_.push_back(std::move(job));
    lock.unlock();
    not_empty_.notify_one();
    return result;
}

bool LaneQueue::pop(RequestJob &job) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return stopped_ || !jobs_.empty(); });
    if (jobs_.empty()) {
        return false;
    }
    job = std::move(jobs_.front());
    jobs_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
}

void LaneQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

std::size_t LaneQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

bool LaneQueue::fullLocked() const {
    return capacity_ > 0 && jobs_.size() >= capacity_;
}

RequestDispatcher::RequestDispatcher(DispatcherConfig config, JobHandler handler)
    : config_(config), handler_(std::move(handler)) {
    if (config_.lanes == 0) {
        config_.lanes = 1;
    }
    lanes_.reserve(config_.lanes);
    for (std::size_t i = 0; i < config_.lanes; ++i) {
        lanes_.push_back(
            std::make_unique<LaneQueue>(config_.lane_capacity, config_.overflow_policy));
    }
}

RequestDispatcher::~RequestDispatcher() {
    stop();
}

void RequestDispatcher::start() {
    if (running_) {
        return;
    }
    running_ = true;
    threads_.reserve(lanes_.size());
    for (auto &lane : lanes_) {
        threads_.emplace_back(&RequestDispatcher::runLane, this, std::ref(*lane));
    }
}

void RequestDispatcher::stop() {
    if (!running_) {
        return;
    }
    for (auto &lane : lanes_) {
        lane->stop();
    }
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    running_ = false;
}

bool RequestDispatcher::enqueue(RequestJob job) {
    auto &lane = *lanes_[laneFor(job.route_key)];
    switch (lane.push(std::move(job))) {
        case EnqueueResult::Queued:
            return true;
        case EnqueueResult::DisplacedOldest:
            dropped_ += 1;
            return true;
        case EnqueueResult::Dropped:
            dropped_ += 1;
            return false;
        case EnqueueResult::Stopped:
            return false;
    }
    return false;
}

std::size_t RequestDispatcher::laneCount() const {
    return lanes_.size();
}

std::size_t RequestDispatcher::laneFor(std::uint64_t route_key) const {
    return static_cast<std::size_t>(route_key % lanes_.size());
}

std::size_t RequestDispatcher::droppedCount() const {
    return dropped_.load();
}

void RequestDispatcher::runLane(LaneQueue &lane) {
    RequestJob job;
    while (lane.pop(job)) {
        if (handler_) {
            handler_(job);
        }
        job = RequestJob{};
    }
}

}  // namespace net
