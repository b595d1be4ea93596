#pragma once
#include "FileSystemEvent.hpp"
#include <functional>
#include <string>

namespace PollWatch {

/**
 * @brief Receives events on the observer's dispatch thread
 *
 * Handlers must not block for long: a slow handler delays delivery for
 * every watched path.
 */
class EventHandler {
public:
    virtual ~EventHandler() = default;
    virtual void dispatch(const FileSystemEvent& event) = 0;
};

/**
 * @brief Routes each event to onAnyEvent and then to its category hook
 */
class FileSystemEventHandler : public EventHandler {
public:
    void dispatch(const FileSystemEvent& event) override;

protected:
    virtual void onAnyEvent(const FileSystemEvent&) {}
    virtual void onCreated(const FileSystemEvent&) {}
    virtual void onDeleted(const FileSystemEvent&) {}
    virtual void onModified(const FileSystemEvent&) {}
    virtual void onMoved(const FileSystemEvent&) {}
};

/**
 * @brief Logs every event at INFO, as text or as a compact JSON line
 */
class LoggingEventHandler : public FileSystemEventHandler {
public:
    explicit LoggingEventHandler(bool jsonOutput = false);

    static std::string formatJson(const FileSystemEvent& event);

protected:
    void onAnyEvent(const FileSystemEvent& event) override;

private:
    bool jsonOutput_;
};

using EventCallback = std::function<void(const FileSystemEvent&)>;

class CallbackEventHandler : public EventHandler {
public:
    explicit CallbackEventHandler(EventCallback callback);
    void dispatch(const FileSystemEvent& event) override;

private:
    EventCallback callback_;
};

} // namespace PollWatch
