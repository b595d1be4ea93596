#include "EventQueue.hpp"
#include <algorithm>
#include <cctype>

namespace PollWatch {

bool parseOverflowPolicy(const std::string& name, OverflowPolicy& policy) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "block") {
        policy = OverflowPolicy::BLOCK;
    } else if (lower == "drop_oldest" || lower == "drop-oldest") {
        policy = OverflowPolicy::DROP_OLDEST;
    } else if (lower == "drop_newest" || lower == "drop-newest") {
        policy = OverflowPolicy::DROP_NEWEST;
    } else {
        return false;
    }
    return true;
}

std::string overflowPolicyToString(OverflowPolicy policy) {
    switch (policy) {
        case OverflowPolicy::BLOCK: return "block";
        case OverflowPolicy::DROP_OLDEST: return "drop_oldest";
        case OverflowPolicy::DROP_NEWEST: return "drop_newest";
        default: return "unknown";
    }
}

EventQueue::EventQueue(size_t capacity, OverflowPolicy policy, std::chrono::milliseconds blockTimeout)
    : capacity_(capacity == 0 ? 1 : capacity), policy_(policy), blockTimeout_(blockTimeout),
      closed_(false), pushed_(0), dropped_(0) {}

PushResult EventQueue::push(QueueEntry entry) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (closed_) {
        return PushResult::CLOSED;
    }

    PushResult result = PushResult::QUEUED;

    if (entries_.size() >= capacity_) {
        switch (policy_) {
            case OverflowPolicy::BLOCK:
                if (!notFull_.wait_for(lock, blockTimeout_, [this]() {
                        return closed_ || entries_.size() < capacity_;
                    })) {
                    dropped_++;
                    return PushResult::DROPPED;
                }
                if (closed_) {
                    return PushResult::CLOSED;
                }
                break;
            case OverflowPolicy::DROP_OLDEST:
                entries_.pop_front();
                dropped_++;
                result = PushResult::QUEUED_DROPPED_OLDEST;
                break;
            case OverflowPolicy::DROP_NEWEST:
                dropped_++;
                return PushResult::DROPPED;
        }
    }

    entries_.push_back(std::move(entry));
    pushed_++;
    lock.unlock();
    notEmpty_.notify_one();
    return result;
}

bool EventQueue::pop(QueueEntry& entry, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!notEmpty_.wait_for(lock, timeout, [this]() { return closed_ || !entries_.empty(); })) {
        return false;
    }
    if (entries_.empty()) {
        return false;
    }

    entry = std::move(entries_.front());
    entries_.pop_front();
    lock.unlock();
    notFull_.notify_one();
    return true;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    notEmpty_.notify_all();
    notFull_.notify_all();
}

bool EventQueue::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t EventQueue::pushedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pushed_;
}

uint64_t EventQueue::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace PollWatch
