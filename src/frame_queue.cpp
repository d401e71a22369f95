#include "obdsim/frame_queue.hpp"
#include <algorithm>

namespace obdsim {

void FrameQueue::push(const CANFrame& frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{frame, Clock::now()});
    }
    cv_.notify_all();
}

bool FrameQueue::try_pop(CANFrame& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) return false;
    out = entries_.front().frame;
    entries_.pop_front();
    return true;
}

bool FrameQueue::pop(CANFrame& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !entries_.empty(); })) {
        return false;
    }
    out = entries_.front().frame;
    entries_.pop_front();
    return true;
}

bool FrameQueue::take_locked(const Predicate& pred, CANFrame& out,
                             Clock::time_point not_before) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->received < not_before) continue;
        if (pred && !pred(it->frame)) continue;
        out = it->frame;
        entries_.erase(it);
        return true;
    }
    return false;
}

bool FrameQueue::take_first(const Predicate& pred, CANFrame& out,
                            Clock::time_point deadline,
                            std::chrono::milliseconds poll,
                            Clock::time_point not_before) {
    if (poll <= std::chrono::milliseconds(0)) {
        poll = std::chrono::milliseconds(1);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        if (take_locked(pred, out, not_before)) return true;

        auto now = Clock::now();
        if (now >= deadline) return false;

        // Wake on push or after one poll slice, whichever is first
        auto slice_end = std::min<Clock::time_point>(deadline, now + poll);
        cv_.wait_until(lock, slice_end);
    }
}

size_t FrameQueue::prune_before(Clock::time_point cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [cutoff](const Entry& e) { return e.received < cutoff; }),
                   entries_.end());
    return before - entries_.size();
}

size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void FrameQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace obdsim
