#include "EventProducer.hpp"
#include "Logger.hpp"
#include <system_error>

namespace PollWatch {

EventProducer::EventProducer(const WatchedPath& watch,
                             uint64_t ruleId,
                             std::shared_ptr<EventQueue> queue,
                             std::shared_ptr<SnapshotProvider> provider,
                             unsigned int degradedThreshold,
                             ErrorCallback errorCallback)
    : watch_(watch),
      ruleId_(ruleId),
      queue_(std::move(queue)),
      provider_(std::move(provider)),
      degradedThreshold_(degradedThreshold),
      errorCallback_(std::move(errorCallback)),
      started_(false),
      running_(false),
      stopRequested_(false),
      status_(WatchStatus::HEALTHY),
      consecutiveFailures_(0),
      pollCount_(0),
      emittedCount_(0) {}

EventProducer::~EventProducer() {
    stop();
    if (thread_.joinable()) {
        // Last reference dropped by the polling thread itself
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

bool EventProducer::start() {
    if (stopRequested_.load()) {
        LOG_WARNING("Producer for " + watch_.path + " was stopped, not starting");
        return false;
    }
    if (started_.exchange(true)) {
        return false;
    }

    std::shared_ptr<EventProducer> self;
    try {
        self = shared_from_this();
    } catch (const std::bad_weak_ptr&) {
        LOG_ERROR("Producer for " + watch_.path + " must be owned by a shared_ptr to start");
        started_ = false;
        return false;
    }

    running_ = true;
    try {
        thread_ = std::thread([self]() {
            self->pollLoop();
        });
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start producer thread for " + watch_.path + ": " + e.what());
        running_ = false;
        started_ = false;
        return false;
    }

    LOG_INFO("Started polling " + watch_.path + " every " +
             std::to_string(watch_.interval.count()) + "ms");
    return true;
}

void EventProducer::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        if (stopRequested_.exchange(true)) {
            return;
        }
    }
    waitCondition_.notify_all();
    LOG_DEBUG("Stop requested for producer of " + watch_.path);
}

bool EventProducer::join(std::chrono::milliseconds timeout) {
    if (!thread_.joinable()) {
        return true;
    }
    if (thread_.get_id() == std::this_thread::get_id()) {
        return false;
    }

    bool exited;
    {
        std::unique_lock<std::mutex> lock(waitMutex_);
        exited = exitCondition_.wait_for(lock, timeout, [this]() { return !running_.load(); });
    }

    if (exited) {
        thread_.join();
        LOG_INFO("Stopped polling " + watch_.path);
    } else {
        LOG_ERROR("Producer for " + watch_.path + " did not exit within " +
                  std::to_string(timeout.count()) + "ms, abandoning it");
        thread_.detach();
    }
    return exited;
}

bool EventProducer::hasBaseline() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return previous_ != nullptr;
}

void EventProducer::pollLoop() {
    LOG_DEBUG("Poll loop started for " + watch_.path);

    while (!stopRequested_.load()) {
        {
            std::unique_lock<std::mutex> lock(waitMutex_);
            if (waitCondition_.wait_for(lock, watch_.interval, [this]() { return stopRequested_.load(); })) {
                break;
            }
        }
        pollOnce();
    }

    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        running_ = false;
    }
    exitCondition_.notify_all();
    LOG_DEBUG("Poll loop exited for " + watch_.path);
}

size_t EventProducer::pollOnce() {
    std::lock_guard<std::mutex> pollLock(pollMutex_);

    DiffResult diff;
    bool haveDiff = false;

    try {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        DirectorySnapshot current = provider_->capture(watch_.path);

        if (!previous_) {
            LOG_DEBUG("Baseline for " + watch_.path + ": " + std::to_string(current.size()) + " entries");
            previous_ = std::make_unique<DirectorySnapshot>(std::move(current));
        } else {
            diff = SnapshotDiff::compute(*previous_, current);
            *previous_ = std::move(current);
            haveDiff = true;
        }
    } catch (const SnapshotError& e) {
        onAcquisitionFailure(e.what());
        return 0;
    } catch (const std::exception& e) {
        onAcquisitionFailure("Unexpected snapshot failure for " + watch_.path + ": " + e.what());
        return 0;
    }

    pollCount_++;
    onAcquisitionSuccess();

    if (!haveDiff || diff.empty()) {
        return 0;
    }

    LOG_DEBUG(std::to_string(diff.totalChanges()) + " change(s) under " + watch_.path);
    return emit(diff);
}

size_t EventProducer::emit(const DiffResult& diff) {
    size_t queued = 0;

    for (const auto& path : diff.filesDeleted) {
        queued += emitEvent(EventType::FILE_DELETED, path) ? 1 : 0;
    }
    for (const auto& path : diff.filesModified) {
        queued += emitEvent(EventType::FILE_MODIFIED, path) ? 1 : 0;
    }
    for (const auto& path : diff.filesCreated) {
        queued += emitEvent(EventType::FILE_CREATED, path) ? 1 : 0;
    }
    for (const auto& move : diff.filesMoved) {
        queued += emitEvent(EventType::FILE_MOVED, move.first, move.second) ? 1 : 0;
    }
    for (const auto& path : diff.dirsDeleted) {
        queued += emitEvent(EventType::DIR_DELETED, path) ? 1 : 0;
    }
    for (const auto& path : diff.dirsModified) {
        queued += emitEvent(EventType::DIR_MODIFIED, path) ? 1 : 0;
    }
    for (const auto& path : diff.dirsCreated) {
        queued += emitEvent(EventType::DIR_CREATED, path) ? 1 : 0;
    }
    for (const auto& move : diff.dirsMoved) {
        queued += emitEvent(EventType::DIR_MOVED, move.first, move.second) ? 1 : 0;
    }

    emittedCount_ += queued;
    return queued;
}

bool EventProducer::emitEvent(EventType type, const std::string& srcPath, const std::string& destPath) {
    QueueEntry entry;
    entry.watchedPath = watch_.path;
    entry.ruleId = ruleId_;
    entry.event = FileSystemEvent(type, srcPath, destPath);

    switch (queue_->push(std::move(entry))) {
        case PushResult::QUEUED:
            return true;
        case PushResult::QUEUED_DROPPED_OLDEST:
            reportError(WatchErrorKind::OVERFLOW, "Event queue full, dropped oldest event");
            return true;
        case PushResult::DROPPED:
            reportError(WatchErrorKind::OVERFLOW,
                        "Event queue full, dropped " + eventTypeToString(type) + " " + srcPath);
            return false;
        case PushResult::CLOSED:
            LOG_DEBUG("Event queue closed, discarding " + eventTypeToString(type) + " " + srcPath);
            return false;
    }
    return false;
}

void EventProducer::onAcquisitionFailure(const std::string& reason) {
    unsigned int failures = ++consecutiveFailures_;
    LOG_WARNING("Poll of " + watch_.path + " failed (" + std::to_string(failures) + " in a row): " + reason);

    if (degradedThreshold_ > 0 && failures >= degradedThreshold_ &&
        status_.exchange(WatchStatus::DEGRADED) != WatchStatus::DEGRADED) {
        LOG_ERROR("Watch on " + watch_.path + " is degraded after " + std::to_string(failures) +
                  " failed polls, retrying every " + std::to_string(watch_.interval.count()) + "ms");
    }

    reportError(WatchErrorKind::ACQUISITION, reason);
}

void EventProducer::onAcquisitionSuccess() {
    consecutiveFailures_ = 0;
    if (status_.exchange(WatchStatus::HEALTHY) == WatchStatus::DEGRADED) {
        LOG_INFO("Watch on " + watch_.path + " recovered");
    }
}

void EventProducer::reportError(WatchErrorKind kind, const std::string& message) {
    if (kind == WatchErrorKind::OVERFLOW) {
        LOG_WARNING("[" + watch_.path + "] " + message);
    }
    if (!errorCallback_) {
        return;
    }

    try {
        errorCallback_(WatchError{kind, watch_.path, message});
    } catch (const std::exception& e) {
        LOG_ERROR("Error callback threw: " + std::string(e.what()));
    }
}

} // namespace PollWatch
