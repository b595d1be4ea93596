#pragma once
#include <string>
#include <chrono>
#include <functional>

namespace PollWatch {

/**
 * @brief A watched root and its polling interval
 *
 * Identity is the canonical path; build instances with make() so the path
 * is canonicalized exactly once, at registration.
 */
struct WatchedPath {
    std::string path;
    std::chrono::milliseconds interval{1000};

    static WatchedPath make(const std::string& rawPath, std::chrono::milliseconds interval);
    static std::string canonicalize(const std::string& rawPath);
};

enum class WatchStatus {
    HEALTHY,
    DEGRADED
};

enum class WatchErrorKind {
    ACQUISITION,
    HANDLER,
    OVERFLOW
};

struct WatchError {
    WatchErrorKind kind;
    std::string watchedPath;
    std::string message;
};

using ErrorCallback = std::function<void(const WatchError&)>;

std::string watchStatusToString(WatchStatus status);
std::string watchErrorKindToString(WatchErrorKind kind);

} // namespace PollWatch
