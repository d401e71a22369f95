#pragma once
/**
 * @file frame_queue.hpp
 * @brief Unbounded, thread-safe FIFO of received CAN frames
 *
 * One producer thread (a socket or bus receiver) pushes, one consumer waits.
 * Each entry remembers when it arrived so a consumer can refuse frames that
 * predate its request and prune stale ones.
 */

#include "obdsim/can_frame.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace obdsim {

class FrameQueue {
public:
    using Clock = std::chrono::steady_clock;
    using Predicate = std::function<bool(const CANFrame&)>;

    struct Entry {
        CANFrame frame;
        Clock::time_point received;
    };

    FrameQueue() = default;

    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    /// Append a frame stamped with the current time and wake waiters
    void push(const CANFrame& frame);

    /// Pop the oldest frame without blocking
    bool try_pop(CANFrame& out);

    /// Pop the oldest frame, waiting up to `timeout` for one to arrive
    bool pop(CANFrame& out, std::chrono::milliseconds timeout);

    /**
     * @brief Remove and return the first frame matching `pred`
     *
     * Scans in arrival order, skipping frames received before `not_before`
     * and frames the predicate rejects; skipped frames keep their position.
     * Waits in slices of at most `poll` until `deadline`.
     *
     * @return true if a frame was taken, false when the deadline passed
     */
    bool take_first(const Predicate& pred, CANFrame& out,
                    Clock::time_point deadline,
                    std::chrono::milliseconds poll = std::chrono::milliseconds(10),
                    Clock::time_point not_before = Clock::time_point{});

    /// Drop entries received before `cutoff`; returns how many were dropped
    size_t prune_before(Clock::time_point cutoff);

    size_t size() const;
    bool empty() const { return size() == 0; }
    void clear();

private:
    bool take_locked(const Predicate& pred, CANFrame& out, Clock::time_point not_before);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Entry> entries_;
};

} // namespace obdsim
