#include "Observer.hpp"
#include "Logger.hpp"
#include <algorithm>

namespace PollWatch {

std::string observerStateToString(ObserverState state) {
    switch (state) {
        case ObserverState::CREATED: return "CREATED";
        case ObserverState::RUNNING: return "RUNNING";
        case ObserverState::STOPPING: return "STOPPING";
        case ObserverState::STOPPED: return "STOPPED";
        default: return "UNKNOWN";
    }
}

Observer::Observer(const ObserverConfig& config, std::shared_ptr<SnapshotProvider> provider)
    : config_(config),
      provider_(provider ? std::move(provider) : std::make_shared<FilesystemSnapshotProvider>()),
      queue_(std::make_shared<EventQueue>(static_cast<size_t>(std::max(config.queueCapacity, 1)),
                                          config.overflowPolicy,
                                          std::chrono::milliseconds(config.blockTimeoutMs))),
      errorSink_(std::make_shared<ErrorSink>()),
      state_(ObserverState::CREATED),
      dispatched_(0),
      staleDropped_(0),
      handlerFailures_(0) {
    std::shared_ptr<ErrorSink> sink = errorSink_;
    rules_ = std::make_unique<RuleTable>(
        queue_, provider_, static_cast<unsigned int>(std::max(config.degradedThreshold, 0)),
        [sink](const WatchError& error) { Observer::report(sink, error); });
}

Observer::~Observer() {
    stop();
}

bool Observer::addRule(const std::string& path, std::shared_ptr<EventHandler> handler) {
    return addRule(path, std::move(handler), std::chrono::milliseconds(config_.defaultIntervalMs));
}

bool Observer::addRule(const std::string& path, std::shared_ptr<EventHandler> handler,
                       std::chrono::milliseconds interval) {
    if (!handler) {
        LOG_ERROR("Refusing rule for " + path + ": no handler");
        return false;
    }
    if (interval.count() <= 0) {
        LOG_ERROR("Refusing rule for " + path + ": interval must be positive");
        return false;
    }

    WatchedPath watch = WatchedPath::make(path, interval);
    if (watch.path.empty()) {
        LOG_ERROR("Refusing rule with empty path");
        return false;
    }

    std::lock_guard<std::mutex> lock(stateMutex_);

    if (state_ == ObserverState::STOPPING || state_ == ObserverState::STOPPED) {
        LOG_WARNING("Observer is " + observerStateToString(state_) + ", not adding rule for " + watch.path);
        return false;
    }

    auto producer = rules_->addRule(watch, std::move(handler));
    if (!producer) {
        return false;
    }

    if (state_ == ObserverState::RUNNING && !producer->start()) {
        LOG_ERROR("Could not start polling " + watch.path + ", rule dropped");
        rules_->removeRule(watch.path);
        return false;
    }
    return true;
}

bool Observer::removeRule(const std::string& path) {
    std::string canonical = WatchedPath::canonicalize(path);

    std::shared_ptr<EventProducer> producer;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        producer = rules_->removeRule(canonical);
    }

    if (!producer) {
        return false;
    }

    retireOrJoin(producer);
    return true;
}

void Observer::retireOrJoin(const std::shared_ptr<EventProducer>& producer) {
    bool onDispatchThread;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        onDispatchThread = dispatchThread_ == std::this_thread::get_id();
    }

    // The producer may be waiting for queue space only this thread can free
    if (onDispatchThread) {
        std::lock_guard<std::mutex> lock(retiredMutex_);
        retired_.push_back(producer);
        return;
    }

    producer->join(std::chrono::milliseconds(config_.shutdownTimeoutMs));
}

bool Observer::run() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ != ObserverState::CREATED) {
            LOG_ERROR("Observer cannot run from state " + observerStateToString(state_));
            return false;
        }

        state_ = ObserverState::RUNNING;
        dispatchThread_ = std::this_thread::get_id();

        for (const auto& producer : rules_->producers()) {
            if (!producer->start()) {
                LOG_ERROR("Could not start polling " + producer->watchedPath().path + ", rule dropped");
                rules_->removeRule(producer->watchedPath().path);
            }
        }
    }
    stateCondition_.notify_all();

    LOG_INFO("Observer running with " + std::to_string(rules_->size()) + " rule(s)");

    const std::chrono::milliseconds popTimeout(config_.popTimeoutMs);

    while (true) {
        QueueEntry entry;
        if (queue_->pop(entry, popTimeout)) {
            dispatch(entry);
        }
        reapRetired();

        ObserverState current;
        std::chrono::steady_clock::time_point deadline;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            current = state_;
            deadline = stopDeadline_;
        }

        if (current == ObserverState::STOPPING) {
            if (drainComplete()) {
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                LOG_WARNING("Shutdown deadline reached with " + std::to_string(queue_->size()) +
                            " queued event(s)");
                break;
            }
        }
    }

    finishShutdown();
    return true;
}

void Observer::stop() {
    std::unique_lock<std::mutex> lock(stateMutex_);

    switch (state_) {
        case ObserverState::CREATED:
            state_ = ObserverState::STOPPING;
            stopDeadline_ = std::chrono::steady_clock::now() +
                            std::chrono::milliseconds(config_.shutdownTimeoutMs);
            lock.unlock();
            finishShutdown();
            return;

        case ObserverState::RUNNING:
            LOG_INFO("Stopping observer...");
            state_ = ObserverState::STOPPING;
            stopDeadline_ = std::chrono::steady_clock::now() +
                            std::chrono::milliseconds(config_.shutdownTimeoutMs);
            for (const auto& producer : rules_->producers()) {
                producer->stop();
            }
            break;

        case ObserverState::STOPPING:
            break;

        case ObserverState::STOPPED:
            return;
    }

    if (dispatchThread_ == std::this_thread::get_id()) {
        // run() finishes the shutdown once the current handler returns
        return;
    }

    auto budget = std::chrono::milliseconds(config_.shutdownTimeoutMs + 2 * config_.popTimeoutMs);
    if (!stateCondition_.wait_for(lock, budget, [this]() { return state_ == ObserverState::STOPPED; })) {
        LOG_WARNING("Observer did not reach STOPPED within " + std::to_string(budget.count()) + "ms");
    }
}

void Observer::reapRetired() {
    std::vector<std::shared_ptr<EventProducer>> exited;
    {
        std::lock_guard<std::mutex> lock(retiredMutex_);
        auto it = std::partition(retired_.begin(), retired_.end(),
                                 [](const std::shared_ptr<EventProducer>& p) { return p->isRunning(); });
        exited.assign(it, retired_.end());
        retired_.erase(it, retired_.end());
    }

    for (const auto& producer : exited) {
        producer->join(std::chrono::milliseconds(0));
    }
}

size_t Observer::retiredCount() const {
    std::lock_guard<std::mutex> lock(retiredMutex_);
    return retired_.size();
}

bool Observer::drainComplete() const {
    for (const auto& producer : rules_->producers()) {
        if (producer->isRunning()) {
            return false;
        }
    }
    {
        std::lock_guard<std::mutex> lock(retiredMutex_);
        for (const auto& producer : retired_) {
            if (producer->isRunning()) {
                return false;
            }
        }
    }
    return queue_->size() == 0;
}

void Observer::finishShutdown() {
    queue_->close();

    QueueEntry entry;
    while (queue_->pop(entry, std::chrono::milliseconds(0))) {
        dispatch(entry);
    }

    std::vector<std::shared_ptr<EventProducer>> producers = rules_->removeAll();
    {
        std::lock_guard<std::mutex> lock(retiredMutex_);
        producers.insert(producers.end(), retired_.begin(), retired_.end());
        retired_.clear();
    }

    std::chrono::steady_clock::time_point deadline;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        deadline = stopDeadline_;
    }

    for (const auto& producer : producers) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        producer->join(std::max(remaining, std::chrono::milliseconds(0)));
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_ = ObserverState::STOPPED;
    }
    stateCondition_.notify_all();

    LOG_INFO("Observer stopped: " + std::to_string(dispatched_.load()) + " event(s) dispatched, " +
             std::to_string(staleDropped_.load()) + " stale, " +
             std::to_string(queue_->droppedCount()) + " dropped on overflow");
}

void Observer::dispatch(const QueueEntry& entry) {
    auto handler = rules_->findHandler(entry.watchedPath, entry.ruleId);
    if (!handler) {
        staleDropped_++;
        LOG_DEBUG("Discarding event for removed rule " + entry.watchedPath + ": " + entry.event.toString());
        return;
    }

    try {
        handler->dispatch(entry.event);
        dispatched_++;
    } catch (const std::exception& e) {
        handlerFailures_++;
        LOG_ERROR("Handler for " + entry.watchedPath + " failed on " + entry.event.toString() + ": " + e.what());
        report(errorSink_, WatchError{WatchErrorKind::HANDLER, entry.watchedPath, e.what()});
    } catch (...) {
        handlerFailures_++;
        LOG_ERROR("Handler for " + entry.watchedPath + " threw a non-standard exception on " +
                  entry.event.toString());
        report(errorSink_, WatchError{WatchErrorKind::HANDLER, entry.watchedPath, "non-standard exception"});
    }
}

void Observer::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(errorSink_->mutex);
    errorSink_->callback = std::move(callback);
}

void Observer::report(const std::shared_ptr<ErrorSink>& sink, const WatchError& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(sink->mutex);
        callback = sink->callback;
    }
    if (!callback) {
        return;
    }

    try {
        callback(error);
    } catch (const std::exception& e) {
        LOG_ERROR("Error callback threw: " + std::string(e.what()));
    }
}

ObserverState Observer::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

bool Observer::waitForState(ObserverState state, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(stateMutex_);
    return stateCondition_.wait_for(lock, timeout, [this, state]() { return state_ == state; });
}

std::vector<std::string> Observer::watchedPaths() const {
    return rules_->paths();
}

bool Observer::isWatching(const std::string& path) const {
    return rules_->contains(WatchedPath::canonicalize(path));
}

bool Observer::watchStatus(const std::string& path, WatchStatus& status) const {
    auto producer = rules_->findProducer(WatchedPath::canonicalize(path));
    if (!producer) {
        return false;
    }
    status = producer->status();
    return true;
}

} // namespace PollWatch
