#pragma once
#include "WatchTypes.hpp"
#include "EventQueue.hpp"
#include "DirectorySnapshot.hpp"
#include "SnapshotDiff.hpp"
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>

namespace PollWatch {

/**
 * @brief Polls one watched root and turns consecutive snapshot diffs into events
 *
 * Owns one thread while started. The thread keeps the producer alive, so a
 * producer abandoned by join() on timeout never dangles; create producers
 * with std::make_shared.
 */
class EventProducer : public std::enable_shared_from_this<EventProducer> {
public:
    EventProducer(const WatchedPath& watch,
                  uint64_t ruleId,
                  std::shared_ptr<EventQueue> queue,
                  std::shared_ptr<SnapshotProvider> provider,
                  unsigned int degradedThreshold = 3,
                  ErrorCallback errorCallback = nullptr);
    ~EventProducer();

    EventProducer(const EventProducer&) = delete;
    EventProducer& operator=(const EventProducer&) = delete;

    /**
     * @brief Start the polling thread; the first poll happens one interval later
     * @return false if already started or stopped
     */
    bool start();

    /**
     * @brief Request the polling thread to exit; an in-flight poll completes
     */
    void stop();

    /**
     * @brief Wait for the polling thread to exit
     * @return false on timeout, in which case the thread is abandoned
     */
    bool join(std::chrono::milliseconds timeout);

    /**
     * @brief Run one poll on the calling thread
     * @return Number of events queued
     */
    size_t pollOnce();

    bool isRunning() const { return running_.load(); }
    bool isStopRequested() const { return stopRequested_.load(); }
    bool hasBaseline() const;

    WatchStatus status() const { return status_.load(); }
    unsigned int consecutiveFailures() const { return consecutiveFailures_.load(); }
    uint64_t pollCount() const { return pollCount_.load(); }
    uint64_t emittedCount() const { return emittedCount_.load(); }

    const WatchedPath& watchedPath() const { return watch_; }
    uint64_t ruleId() const { return ruleId_; }

private:
    void pollLoop();
    size_t emit(const DiffResult& diff);
    bool emitEvent(EventType type, const std::string& srcPath, const std::string& destPath = "");
    void onAcquisitionFailure(const std::string& reason);
    void onAcquisitionSuccess();
    void reportError(WatchErrorKind kind, const std::string& message);

    const WatchedPath watch_;
    const uint64_t ruleId_;
    std::shared_ptr<EventQueue> queue_;
    std::shared_ptr<SnapshotProvider> provider_;
    const unsigned int degradedThreshold_;
    ErrorCallback errorCallback_;

    std::thread thread_;
    std::atomic<bool> started_;
    std::atomic<bool> running_;
    std::atomic<bool> stopRequested_;
    std::mutex waitMutex_;
    std::condition_variable waitCondition_;
    std::condition_variable exitCondition_;

    // pollMutex_ serializes whole polls, snapshotMutex_ guards previous_
    std::mutex pollMutex_;
    mutable std::mutex snapshotMutex_;
    std::unique_ptr<DirectorySnapshot> previous_;

    std::atomic<WatchStatus> status_;
    std::atomic<unsigned int> consecutiveFailures_;
    std::atomic<uint64_t> pollCount_;
    std::atomic<uint64_t> emittedCount_;
};

} // namespace PollWatch
