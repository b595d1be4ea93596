#include "FileSystemEvent.hpp"

namespace PollWatch {

std::string eventTypeToString(EventType type) {
    switch (type) {
        case EventType::FILE_CREATED: return "FILE_CREATED";
        case EventType::FILE_MODIFIED: return "FILE_MODIFIED";
        case EventType::FILE_DELETED: return "FILE_DELETED";
        case EventType::FILE_MOVED: return "FILE_MOVED";
        case EventType::DIR_CREATED: return "DIR_CREATED";
        case EventType::DIR_MODIFIED: return "DIR_MODIFIED";
        case EventType::DIR_DELETED: return "DIR_DELETED";
        case EventType::DIR_MOVED: return "DIR_MOVED";
        default: return "UNKNOWN";
    }
}

bool FileSystemEvent::isDirectory() const {
    return type == EventType::DIR_CREATED || type == EventType::DIR_MODIFIED ||
           type == EventType::DIR_DELETED || type == EventType::DIR_MOVED;
}

bool FileSystemEvent::isMove() const {
    return type == EventType::FILE_MOVED || type == EventType::DIR_MOVED;
}

Json::Value FileSystemEvent::toJson() const {
    Json::Value eventJson;
    eventJson["eventType"] = eventTypeToString(type);
    eventJson["isDirectory"] = isDirectory();
    eventJson["srcPath"] = srcPath;
    if (isMove()) {
        eventJson["destPath"] = destPath;
    }
    return eventJson;
}

std::string FileSystemEvent::toString() const {
    if (isMove()) {
        return eventTypeToString(type) + " " + srcPath + " -> " + destPath;
    }
    return eventTypeToString(type) + " " + srcPath;
}

} // namespace PollWatch
