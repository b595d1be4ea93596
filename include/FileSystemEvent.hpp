#pragma once
#include <string>
#include <cstdint>
#include <utility>
#include <json/json.h>

namespace PollWatch {

enum class EventType {
    FILE_CREATED,
    FILE_MODIFIED,
    FILE_DELETED,
    FILE_MOVED,
    DIR_CREATED,
    DIR_MODIFIED,
    DIR_DELETED,
    DIR_MOVED
};

std::string eventTypeToString(EventType type);

/**
 * @brief A single categorized change below a watched root
 *
 * destPath is only set for FILE_MOVED and DIR_MOVED.
 */
struct FileSystemEvent {
    EventType type{EventType::FILE_MODIFIED};
    std::string srcPath;
    std::string destPath;

    FileSystemEvent() = default;
    FileSystemEvent(EventType eventType, std::string path, std::string newPath = "")
        : type(eventType), srcPath(std::move(path)), destPath(std::move(newPath)) {}

    bool isDirectory() const;
    bool isMove() const;

    Json::Value toJson() const;
    std::string toString() const;

    bool operator==(const FileSystemEvent& other) const {
        return type == other.type && srcPath == other.srcPath && destPath == other.destPath;
    }
    bool operator!=(const FileSystemEvent& other) const { return !(*this == other); }
};

/**
 * @brief Element of the shared event queue
 *
 * ruleId identifies the rule whose producer emitted the event so the
 * dispatcher can drop events of a rule that was removed and re-added.
 */
struct QueueEntry {
    std::string watchedPath;
    uint64_t ruleId{0};
    FileSystemEvent event;
};

} // namespace PollWatch
