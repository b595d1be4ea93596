#include "WatchTypes.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace PollWatch {

WatchedPath WatchedPath::make(const std::string& rawPath, std::chrono::milliseconds interval) {
    WatchedPath watched;
    watched.path = canonicalize(rawPath);
    watched.interval = interval;
    return watched;
}

std::string WatchedPath::canonicalize(const std::string& rawPath) {
    if (rawPath.empty()) {
        return rawPath;
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(rawPath, ec);
    if (ec) {
        absolute = fs::path(rawPath);
    }

    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        resolved = absolute.lexically_normal();
    }

    std::string result = resolved.string();
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

std::string watchStatusToString(WatchStatus status) {
    switch (status) {
        case WatchStatus::HEALTHY: return "HEALTHY";
        case WatchStatus::DEGRADED: return "DEGRADED";
        default: return "UNKNOWN";
    }
}

std::string watchErrorKindToString(WatchErrorKind kind) {
    switch (kind) {
        case WatchErrorKind::ACQUISITION: return "ACQUISITION";
        case WatchErrorKind::HANDLER: return "HANDLER";
        case WatchErrorKind::OVERFLOW: return "OVERFLOW";
        default: return "UNKNOWN";
    }
}

} // namespace PollWatch
