#pragma once
#include "FileSystemEvent.hpp"
#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <string>
#include <cstddef>
#include <cstdint>

namespace PollWatch {

enum class OverflowPolicy {
    BLOCK,
    DROP_OLDEST,
    DROP_NEWEST
};

bool parseOverflowPolicy(const std::string& name, OverflowPolicy& policy);
std::string overflowPolicyToString(OverflowPolicy policy);

enum class PushResult {
    QUEUED,
    QUEUED_DROPPED_OLDEST,
    DROPPED,
    CLOSED
};

/**
 * @brief Bounded multi-producer/single-consumer FIFO of queue entries
 *
 * With BLOCK a full queue makes push() wait up to blockTimeout for room,
 * after which the entry is dropped. close() wakes every waiter; pop()
 * keeps returning queued entries until the queue is empty.
 */
class EventQueue {
public:
    EventQueue(size_t capacity, OverflowPolicy policy,
               std::chrono::milliseconds blockTimeout = std::chrono::milliseconds(5000));

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    PushResult push(QueueEntry entry);
    bool pop(QueueEntry& entry, std::chrono::milliseconds timeout);

    void close();
    bool isClosed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    OverflowPolicy policy() const { return policy_; }
    uint64_t pushedCount() const;
    uint64_t droppedCount() const;

private:
    const size_t capacity_;
    const OverflowPolicy policy_;
    const std::chrono::milliseconds blockTimeout_;

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<QueueEntry> entries_;
    bool closed_;
    uint64_t pushed_;
    uint64_t dropped_;
};

} // namespace PollWatch
