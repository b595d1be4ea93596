#pragma once
#include "ConfigLoader.hpp"
#include "RuleTable.hpp"
#include "EventQueue.hpp"
#include "EventHandler.hpp"
#include "WatchTypes.hpp"
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>
#include <chrono>
#include <vector>
#include <string>

namespace PollWatch {

enum class ObserverState {
    CREATED,
    RUNNING,
    STOPPING,
    STOPPED
};

std::string observerStateToString(ObserverState state);

/**
 * @brief Owns the watched paths and serially dispatches their events
 *
 * run() blocks the calling thread, which becomes the dispatch thread, until
 * stop() has drained every producer. Handlers run on that thread and may
 * call addRule()/removeRule()/stop() themselves.
 */
class Observer {
public:
    explicit Observer(const ObserverConfig& config = ObserverConfig(),
                      std::shared_ptr<SnapshotProvider> provider = nullptr);
    ~Observer();

    Observer(const Observer&) = delete;
    Observer& operator=(const Observer&) = delete;

    /**
     * @brief Watch path with the default interval
     * @return true if a new rule was registered
     */
    bool addRule(const std::string& path, std::shared_ptr<EventHandler> handler);

    /**
     * @brief Watch path with its own interval; starts polling at once when running
     * @return true if a new rule was registered
     */
    bool addRule(const std::string& path, std::shared_ptr<EventHandler> handler,
                 std::chrono::milliseconds interval);

    /**
     * @brief Stop watching path; queued events of the rule are discarded
     * @return true if a rule was removed
     */
    bool removeRule(const std::string& path);

    /**
     * @brief Start all producers and dispatch until stopped
     * @return false if the observer was not in CREATED
     */
    bool run();

    /**
     * @brief Stop all producers and let run() drain and return
     *
     * From any thread but the dispatch thread this waits for STOPPED, bounded
     * by shutdownTimeoutMs.
     */
    void stop();

    /**
     * @brief Install the error channel; called on producer and dispatch threads
     */
    void setErrorCallback(ErrorCallback callback);

    ObserverState state() const;
    bool waitForState(ObserverState state, std::chrono::milliseconds timeout) const;

    std::vector<std::string> watchedPaths() const;
    bool isWatching(const std::string& path) const;
    bool watchStatus(const std::string& path, WatchStatus& status) const;

    uint64_t dispatchedCount() const { return dispatched_.load(); }
    uint64_t staleDropped() const { return staleDropped_.load(); }
    uint64_t handlerFailures() const { return handlerFailures_.load(); }
    uint64_t queueDropped() const { return queue_->droppedCount(); }
    size_t queueSize() const { return queue_->size(); }

    /**
     * @brief Producers removed by a handler whose threads are not yet joined
     */
    size_t retiredCount() const;

    const ObserverConfig& config() const { return config_; }

private:
    struct ErrorSink {
        std::mutex mutex;
        ErrorCallback callback;
    };

    static void report(const std::shared_ptr<ErrorSink>& sink, const WatchError& error);

    void dispatch(const QueueEntry& entry);
    bool drainComplete() const;
    void finishShutdown();
    void retireOrJoin(const std::shared_ptr<EventProducer>& producer);
    void reapRetired();

    const ObserverConfig config_;
    std::shared_ptr<SnapshotProvider> provider_;
    std::shared_ptr<EventQueue> queue_;
    std::shared_ptr<ErrorSink> errorSink_;
    std::unique_ptr<RuleTable> rules_;

    mutable std::mutex stateMutex_;
    mutable std::condition_variable stateCondition_;
    ObserverState state_;
    std::thread::id dispatchThread_;
    std::chrono::steady_clock::time_point stopDeadline_;

    mutable std::mutex retiredMutex_;
    std::vector<std::shared_ptr<EventProducer>> retired_;

    std::atomic<uint64_t> dispatched_;
    std::atomic<uint64_t> staleDropped_;
    std::atomic<uint64_t> handlerFailures_;
};

} // namespace PollWatch
