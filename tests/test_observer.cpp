#include "TestSupport.hpp"
#include "Observer.hpp"
#include "Logger.hpp"
#include <atomic>
#include <set>
#include <stdexcept>

using namespace PollWatch;

namespace {

ObserverConfig fastConfig() {
    ObserverConfig config;
    config.defaultIntervalMs = 100;
    config.popTimeoutMs = 50;
    config.shutdownTimeoutMs = 2000;
    return config;
}

/**
 * @brief Runs an observer on its own thread for the lifetime of the scope
 */
class RunningObserver {
public:
    explicit RunningObserver(Observer& observer)
        : observer_(observer), thread_([&observer]() { observer.run(); }) {
        observer_.waitForState(ObserverState::RUNNING, std::chrono::milliseconds(2000));
    }

    ~RunningObserver() {
        observer_.stop();
        join();
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    Observer& observer_;
    std::thread thread_;
};

/**
 * @brief Every capture replaces the single file of the tree with a new one
 */
class ChurnProvider : public SnapshotProvider {
public:
    DirectorySnapshot capture(const std::string& root) override {
        ino_t inode = static_cast<ino_t>(100 + counter_.fetch_add(1));

        EntryStat dirStat;
        dirStat.device = 3;
        dirStat.inode = static_cast<ino_t>(std::hash<std::string>()(root) % 50 + 1);
        dirStat.isDirectory = true;

        EntryStat fileStat;
        fileStat.device = 3;
        fileStat.inode = inode;
        fileStat.size = 1;

        DirectorySnapshot snapshot(root, {});
        snapshot.addEntry(root, dirStat);
        snapshot.addEntry(root + "/f" + std::to_string(inode), fileStat);
        return snapshot;
    }

private:
    std::atomic<int> counter_{0};
};

/**
 * @brief Second capture blocks for a while and then reports a new file
 */
class SlowSecondCaptureProvider : public SnapshotProvider {
public:
    DirectorySnapshot capture(const std::string& root) override {
        int n = captures_.fetch_add(1);
        if (n == 1) {
            inSlowCapture = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        EntryStat dirStat;
        dirStat.device = 4;
        dirStat.inode = 1;
        dirStat.isDirectory = true;

        DirectorySnapshot snapshot(root, {});
        snapshot.addEntry(root, dirStat);
        if (n >= 1) {
            EntryStat fileStat;
            fileStat.device = 4;
            fileStat.inode = 2;
            fileStat.size = 1;
            snapshot.addEntry(root + "/late.txt", fileStat);
        }
        return snapshot;
    }

    std::atomic<bool> inSlowCapture{false};

private:
    std::atomic<int> captures_{0};
};

void testScenario() {
    std::cout << "\n1. Create, modify, move, delete:" << std::endl;

    TestSupport::TempDir dir;
    Observer observer(fastConfig());
    auto handler = std::make_shared<TestSupport::RecordingHandler>();

    CHECK(observer.addRule(dir.path(), handler), "Rule registered before run()");
    CHECK(observer.state() == ObserverState::CREATED, "Observer starts in CREATED");

    RunningObserver running(observer);
    CHECK(observer.state() == ObserverState::RUNNING, "run() moves to RUNNING");
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    const std::chrono::milliseconds timeout(2000);

    TestSupport::writeFile(dir / "a.txt", "one");
    CHECK(TestSupport::waitUntil([&]() { return handler->contains(EventType::FILE_CREATED, dir / "a.txt"); }, timeout),
          "FILE_CREATED delivered");

    TestSupport::appendFile(dir / "a.txt", " two");
    CHECK(TestSupport::waitUntil([&]() { return handler->contains(EventType::FILE_MODIFIED, dir / "a.txt"); }, timeout),
          "FILE_MODIFIED delivered");

    std::filesystem::rename(dir / "a.txt", dir / "b.txt");
    CHECK(TestSupport::waitUntil([&]() {
              return handler->contains(EventType::FILE_MOVED, dir / "a.txt", dir / "b.txt");
          }, timeout),
          "FILE_MOVED delivered");

    std::filesystem::remove(dir / "b.txt");
    CHECK(TestSupport::waitUntil([&]() { return handler->contains(EventType::FILE_DELETED, dir / "b.txt"); }, timeout),
          "FILE_DELETED delivered");

    CHECK(handler->contains(EventType::DIR_MODIFIED, dir.path()), "Root directory modification delivered");
    CHECK(handler->countOf(EventType::FILE_CREATED, dir / "a.txt") == 1, "Creation delivered once");

    observer.stop();
    running.join();
    CHECK(observer.state() == ObserverState::STOPPED, "stop() ends in STOPPED");
    CHECK(observer.watchedPaths().empty(), "Rules cleared on shutdown");
}

void testAddWhileRunning() {
    std::cout << "\n2. Rules added while running:" << std::endl;

    TestSupport::TempDir first;
    TestSupport::TempDir second;
    Observer observer(fastConfig());
    auto handler = std::make_shared<TestSupport::RecordingHandler>();

    observer.addRule(first.path(), handler);
    RunningObserver running(observer);

    CHECK(observer.addRule(second.path(), handler, std::chrono::milliseconds(50)), "Rule added to a running observer");
    CHECK(!observer.addRule(second.path() + "/", handler), "Same directory under another spelling rejected");
    CHECK(observer.isWatching(second.path()), "isWatching() sees the new rule");
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    TestSupport::writeFile(second / "late.txt", "x");
    CHECK(TestSupport::waitUntil([&]() { return handler->contains(EventType::FILE_CREATED, second / "late.txt"); },
                                 std::chrono::milliseconds(2000)),
          "New rule starts polling without restart");
}

void testRemoveRule() {
    std::cout << "\n3. Removing a rule:" << std::endl;

    TestSupport::TempDir dir;
    Observer observer(fastConfig());
    auto handler = std::make_shared<TestSupport::RecordingHandler>();

    observer.addRule(dir.path(), handler);
    RunningObserver running(observer);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    CHECK(observer.removeRule(dir.path()), "removeRule() succeeds");
    CHECK(!observer.isWatching(dir.path()), "Path no longer watched");
    CHECK(!observer.removeRule(dir.path()), "Second removal reports false");

    TestSupport::writeFile(dir / "ignored.txt", "x");
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    CHECK(handler->count() == 0, "No events after removal");
}

void testStaleEventsDiscarded() {
    std::cout << "\n4. Queued events of a removed rule:" << std::endl;

    ObserverConfig config = fastConfig();
    config.defaultIntervalMs = 20;
    Observer observer(config, std::make_shared<ChurnProvider>());

    std::atomic<bool> release(false);
    std::atomic<int> oldCount(0);
    auto oldHandler = std::make_shared<CallbackEventHandler>([&](const FileSystemEvent&) {
        oldCount++;
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });
    auto newHandler = std::make_shared<TestSupport::RecordingHandler>();

    observer.addRule("/churn", oldHandler);
    RunningObserver running(observer);

    CHECK(TestSupport::waitUntil([&]() { return oldCount.load() == 1 && observer.queueSize() >= 4; },
                                 std::chrono::milliseconds(2000)),
          "Events pile up behind a busy handler");

    CHECK(observer.removeRule("/churn"), "Rule removed while its events are queued");
    CHECK(observer.addRule("/churn", newHandler), "Same path re-added at once");
    release = true;

    CHECK(TestSupport::waitUntil([&]() { return newHandler->count() >= 2; }, std::chrono::milliseconds(2000)),
          "Re-added rule receives its own events");
    CHECK(oldCount.load() == 1, "Removed rule's handler got nothing more");
    CHECK(observer.staleDropped() >= 3, "Queued events of the old rule were discarded");
}

void testHandlerFailureContained() {
    std::cout << "\n5. Handler exceptions:" << std::endl;

    TestSupport::TempDir dir;
    Observer observer(fastConfig());

    std::mutex errorsMutex;
    std::vector<WatchError> errors;
    observer.setErrorCallback([&](const WatchError& error) {
        std::lock_guard<std::mutex> lock(errorsMutex);
        errors.push_back(error);
    });

    std::atomic<int> calls(0);
    auto recorder = std::make_shared<TestSupport::RecordingHandler>();
    auto handler = std::make_shared<CallbackEventHandler>([&](const FileSystemEvent& event) {
        if (calls++ == 0) {
            throw std::runtime_error("handler failure");
        }
        recorder->dispatch(event);
    });

    observer.addRule(dir.path(), handler);
    RunningObserver running(observer);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    TestSupport::writeFile(dir / "first.txt", "x");
    CHECK(TestSupport::waitUntil([&]() { return observer.handlerFailures() == 1; }, std::chrono::milliseconds(2000)),
          "Failure counted");

    TestSupport::writeFile(dir / "second.txt", "x");
    CHECK(TestSupport::waitUntil([&]() { return recorder->contains(EventType::FILE_CREATED, dir / "second.txt"); },
                                 std::chrono::milliseconds(2000)),
          "Dispatch continues after a handler throws");
    CHECK(observer.state() == ObserverState::RUNNING, "Observer still running");

    std::lock_guard<std::mutex> lock(errorsMutex);
    bool reported = false;
    for (const auto& error : errors) {
        if (error.kind == WatchErrorKind::HANDLER && error.watchedPath == dir.path() &&
            error.message == "handler failure") {
            reported = true;
        }
    }
    CHECK(reported, "Failure reported through the error callback");
}

void testTwoRoots() {
    std::cout << "\n6. Two roots:" << std::endl;

    TestSupport::TempDir left;
    TestSupport::TempDir right;
    Observer observer(fastConfig());
    auto leftHandler = std::make_shared<TestSupport::RecordingHandler>();
    auto rightHandler = std::make_shared<TestSupport::RecordingHandler>();

    observer.addRule(left.path(), leftHandler);
    observer.addRule(right.path(), rightHandler);
    RunningObserver running(observer);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    const int files = 20;
    for (int i = 0; i < files; i++) {
        TestSupport::writeFile(left / ("l" + std::to_string(i)), "x");
        TestSupport::writeFile(right / ("r" + std::to_string(i)), "x");
    }

    auto createdCount = [](const TestSupport::RecordingHandler& handler) {
        int n = 0;
        for (const auto& event : handler.events()) {
            if (event.type == EventType::FILE_CREATED) {
                n++;
            }
        }
        return n;
    };

    CHECK(TestSupport::waitUntil([&]() {
              return createdCount(*leftHandler) == files && createdCount(*rightHandler) == files;
          }, std::chrono::milliseconds(3000)),
          "Every creation delivered on both roots");

    std::set<std::string> unique;
    bool separated = true;
    for (const auto& event : leftHandler->events()) {
        if (event.type == EventType::FILE_CREATED) {
            unique.insert(event.srcPath);
        }
        if (event.srcPath.compare(0, left.path().size(), left.path()) != 0) {
            separated = false;
        }
    }
    for (const auto& event : rightHandler->events()) {
        if (event.type == EventType::FILE_CREATED) {
            unique.insert(event.srcPath);
        }
        if (event.srcPath.compare(0, right.path().size(), right.path()) != 0) {
            separated = false;
        }
    }
    CHECK(unique.size() == static_cast<size_t>(2 * files), "No duplicate creations");
    CHECK(separated, "Each handler only sees its own root");
}

void testDegradedRoot() {
    std::cout << "\n7. Missing root:" << std::endl;

    TestSupport::TempDir dir;
    std::string root = dir / "watched";
    std::filesystem::create_directory(root);

    ObserverConfig config = fastConfig();
    config.degradedThreshold = 2;
    Observer observer(config);

    std::atomic<int> acquisitionErrors(0);
    observer.setErrorCallback([&](const WatchError& error) {
        if (error.kind == WatchErrorKind::ACQUISITION) {
            acquisitionErrors++;
        }
    });

    auto handler = std::make_shared<TestSupport::RecordingHandler>();
    observer.addRule(root, handler);
    RunningObserver running(observer);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    std::filesystem::remove(root);

    WatchStatus status = WatchStatus::HEALTHY;
    CHECK(TestSupport::waitUntil([&]() {
              return observer.watchStatus(root, status) && status == WatchStatus::DEGRADED;
          }, std::chrono::milliseconds(2000)),
          "Vanished root degrades the watch");
    CHECK(acquisitionErrors.load() >= 2, "Failures reported as ACQUISITION");
    CHECK(observer.isWatching(root), "Rule kept while degraded");

    std::filesystem::create_directory(root);
    CHECK(TestSupport::waitUntil([&]() {
              return observer.watchStatus(root, status) && status == WatchStatus::HEALTHY;
          }, std::chrono::milliseconds(2000)),
          "Watch recovers when the root comes back");
}

void testHandlerReentry() {
    std::cout << "\n8. Handlers calling back into the observer:" << std::endl;

    Observer observer(fastConfig(), std::make_shared<ChurnProvider>());
    std::atomic<int> calls(0);

    auto handler = std::make_shared<CallbackEventHandler>([&](const FileSystemEvent&) {
        if (calls++ == 0) {
            observer.removeRule("/self");
        }
    });
    observer.addRule("/self", handler, std::chrono::milliseconds(20));

    std::atomic<bool> stopped(false);
    auto stopper = std::make_shared<CallbackEventHandler>([&](const FileSystemEvent&) {
        observer.stop();
        stopped = true;
    });

    RunningObserver running(observer);

    CHECK(TestSupport::waitUntil([&]() { return !observer.isWatching("/self"); }, std::chrono::milliseconds(2000)),
          "Handler removed its own rule without deadlock");
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    CHECK(calls.load() == 1, "No further events for the removed rule");

    observer.addRule("/stopper", stopper, std::chrono::milliseconds(20));
    CHECK(observer.waitForState(ObserverState::STOPPED, std::chrono::milliseconds(3000)),
          "stop() from a handler ends run()");
    CHECK(stopped.load(), "Handler returned from stop()");
}

void testLifecycle() {
    std::cout << "\n9. Lifecycle:" << std::endl;

    TestSupport::TempDir dir;
    auto handler = std::make_shared<TestSupport::RecordingHandler>();

    Observer idle(fastConfig());
    idle.addRule(dir.path(), handler);
    idle.stop();
    CHECK(idle.state() == ObserverState::STOPPED, "stop() before run() goes straight to STOPPED");
    CHECK(!idle.run(), "run() after stop() is refused");
    CHECK(!idle.addRule(dir.path(), handler), "addRule() after stop() is refused");
    idle.stop();
    CHECK(idle.state() == ObserverState::STOPPED, "Second stop() is a no-op");

    ObserverConfig config = fastConfig();
    config.defaultIntervalMs = 10000;
    Observer slow(config);
    slow.addRule(dir.path(), handler);
    RunningObserver running(slow);

    auto begin = std::chrono::steady_clock::now();
    slow.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;
    CHECK(slow.state() == ObserverState::STOPPED, "Stopped while producers were mid-interval");
    CHECK(elapsed < std::chrono::milliseconds(1500), "Shutdown does not wait out the interval");

    Observer invalid(fastConfig());
    CHECK(!invalid.addRule(dir.path(), nullptr), "Rule without handler rejected");
    CHECK(!invalid.addRule(dir.path(), handler, std::chrono::milliseconds(0)), "Zero interval rejected");
    CHECK(!invalid.addRule("", handler), "Empty path rejected");
}

void testRetiredProducersReaped() {
    std::cout << "\n10. Rules cycled from a handler:" << std::endl;

    Observer observer(fastConfig(), std::make_shared<ChurnProvider>());
    std::atomic<int> cycles(0);
    std::atomic<size_t> maxRetired(0);

    std::shared_ptr<EventHandler> cycler;
    cycler = std::make_shared<CallbackEventHandler>([&](const FileSystemEvent&) {
        size_t retired = observer.retiredCount();
        if (retired > maxRetired.load()) {
            maxRetired = retired;
        }
        if (observer.removeRule("/cycle") && observer.addRule("/cycle", cycler, std::chrono::milliseconds(10))) {
            cycles++;
        }
    });
    observer.addRule("/cycle", cycler, std::chrono::milliseconds(10));

    {
        RunningObserver running(observer);
        CHECK(TestSupport::waitUntil([&]() { return cycles.load() >= 40; }, std::chrono::milliseconds(10000)),
              "Rule removed and re-added 40 times from its own handler");
        CHECK(maxRetired.load() <= 3, "Exited producers are joined while running (max retired " +
                                          std::to_string(maxRetired.load()) + ")");
        CHECK(observer.retiredCount() <= 3, "Retired set stays bounded");
    }

    CHECK(observer.state() == ObserverState::STOPPED, "Observer stopped after cycling");
    CHECK(observer.retiredCount() == 0, "Shutdown joins what is left");
}

void testInFlightPollSurvivesStop() {
    std::cout << "\n11. Poll in progress during stop():" << std::endl;

    auto provider = std::make_shared<SlowSecondCaptureProvider>();
    Observer observer(fastConfig(), provider);

    std::mutex deliveredMutex;
    std::vector<FileSystemEvent> delivered;
    std::vector<ObserverState> statesSeen;
    auto handler = std::make_shared<CallbackEventHandler>([&](const FileSystemEvent& event) {
        ObserverState current = observer.state();
        std::lock_guard<std::mutex> lock(deliveredMutex);
        delivered.push_back(event);
        statesSeen.push_back(current);
    });
    observer.addRule("/slow", handler);

    std::thread runner([&observer]() { observer.run(); });
    CHECK(TestSupport::waitUntil([&]() { return provider->inSlowCapture.load(); }, std::chrono::milliseconds(3000)),
          "Second capture started");

    auto begin = std::chrono::steady_clock::now();
    observer.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;
    runner.join();

    CHECK(observer.state() == ObserverState::STOPPED, "Observer reached STOPPED");
    CHECK(elapsed >= std::chrono::milliseconds(200), "stop() waited for the capture to finish");

    std::lock_guard<std::mutex> lock(deliveredMutex);
    CHECK(delivered.size() == 1 && delivered[0] == FileSystemEvent(EventType::FILE_CREATED, "/slow/late.txt"),
          "Event from the interrupted poll delivered");
    CHECK(statesSeen.size() == 1 && statesSeen[0] == ObserverState::STOPPING, "Delivered before STOPPED");
}

} // namespace

int main() {
    Logger::getInstance().setLogLevel(LogLevel::ERROR);

    std::cout << "=== Testing Observer ===" << std::endl;

    testScenario();
    testAddWhileRunning();
    testRemoveRule();
    testStaleEventsDiscarded();
    testHandlerFailureContained();
    testTwoRoots();
    testDegradedRoot();
    testHandlerReentry();
    testLifecycle();
    testRetiredProducersReaped();
    testInFlightPollSurvivesStop();

    return TestSupport::finish("Observer");
}
