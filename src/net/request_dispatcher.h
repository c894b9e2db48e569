#pragma once

#include "net/codec.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace net {

struct RequestJob {
    std::uint64_t connection_id{0};
    // Jobs sharing a key run on one lane in arrival order.
    std::uint64_t route_key{0};
    FrameHeader header{};
    std::vector<std::uint8_t> payload{};
    std::chrono::steady_clock::time_point received_at{};
};

enum class OverflowPolicy {
    Block,
    DropNewest,
    DropOldest,
};

enum class EnqueueResult {
    Queued,
    // Queued after the lane's oldest job was discarded.
    DisplacedOldest,
    Dropped,
    Stopped,
};

// FIFO feeding one lane thread.
class LaneQueue {
public:
    // capacity 0 means unbounded.
    LaneQueue(std::size_t capacity, OverflowPolicy policy);

    EnqueueResult push(RequestJob job);
    // Blocks until a job arrives. false once stopped and drained.
    bool pop(RequestJob &job);
    void stop();
    std::size_t size() const;

private:
    bool fullLocked() const;

    std::deque<RequestJob> jobs_;
    std::size_t capacity_;
    OverflowPolicy policy_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool stopped_{false};
};

struct DispatcherConfig {
    std::size_t lanes{4};
    std::size_t lane_capacity{256};
    OverflowPolicy overflow_policy{OverflowPolicy::Block};
};

// One thread per lane; a job runs on lane `route_key % lanes`. Keyed by item,
// requests for one item queue behind each other on a single lane instead of
// holding several threads blocked on the same item lock.
class RequestDispatcher {
public:
    using JobHandler = std::function<void(const RequestJob &)>;

    RequestDispatcher(DispatcherConfig config, JobHandler handler);
    ~RequestDispatcher();

    RequestDispatcher(const RequestDispatcher &) = delete;
    RequestDispatcher &operator=(const RequestDispatcher &) = delete;

    void start();
    // Runs every job already queued, then joins the lanes.
    void stop();
    bool enqueue(RequestJob job);

    std::size_t laneCount() const;
    std::size_t laneFor(std::uint64_t route_key) const;
    std::size_t droppedCount() const;

private:
    void runLane(LaneQueue &lane);

    DispatcherConfig config_;
    JobHandler handler_;
    std::vector<std::unique_ptr<LaneQueue>> lanes_;
    std::vector<std::thread> threads_;
    std::atomic<std::size_t> dropped_{0};
    bool running_{false};
};

}  // namespace net
