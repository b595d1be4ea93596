#include "EventHandler.hpp"
#include "Logger.hpp"
#include <memory>
#include <sstream>

namespace PollWatch {

void FileSystemEventHandler::dispatch(const FileSystemEvent& event) {
    onAnyEvent(event);

    switch (event.type) {
        case EventType::FILE_CREATED:
        case EventType::DIR_CREATED:
            onCreated(event);
            break;
        case EventType::FILE_DELETED:
        case EventType::DIR_DELETED:
            onDeleted(event);
            break;
        case EventType::FILE_MODIFIED:
        case EventType::DIR_MODIFIED:
            onModified(event);
            break;
        case EventType::FILE_MOVED:
        case EventType::DIR_MOVED:
            onMoved(event);
            break;
    }
}

LoggingEventHandler::LoggingEventHandler(bool jsonOutput) : jsonOutput_(jsonOutput) {}

std::string LoggingEventHandler::formatJson(const FileSystemEvent& event) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());

    std::ostringstream out;
    writer->write(event.toJson(), &out);
    return out.str();
}

void LoggingEventHandler::onAnyEvent(const FileSystemEvent& event) {
    if (jsonOutput_) {
        LOG_INFO(formatJson(event));
    } else {
        LOG_INFO(event.toString());
    }
}

CallbackEventHandler::CallbackEventHandler(EventCallback callback) : callback_(std::move(callback)) {}

void CallbackEventHandler::dispatch(const FileSystemEvent& event) {
    if (callback_) {
        callback_(event);
    }
}

} // namespace PollWatch
