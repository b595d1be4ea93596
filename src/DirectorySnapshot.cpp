#include "DirectorySnapshot.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <vector>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace PollWatch {

const EntryStat* DirectorySnapshot::find(const std::string& path) const {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool FilesystemSnapshotProvider::statEntry(const std::string& path, EntryStat& stat) {
    struct stat fileStat;
    if (lstat(path.c_str(), &fileStat) != 0) {
        return false;
    }

    stat.device = fileStat.st_dev;
    stat.inode = fileStat.st_ino;
    stat.mtimeNs = static_cast<int64_t>(fileStat.st_mtim.tv_sec) * 1000000000LL + fileStat.st_mtim.tv_nsec;
    stat.size = static_cast<int64_t>(fileStat.st_size);
    stat.isDirectory = S_ISDIR(fileStat.st_mode);
    return true;
}

DirectorySnapshot FilesystemSnapshotProvider::capture(const std::string& root) {
    EntryStat rootStat;
    if (!statEntry(root, rootStat)) {
        throw SnapshotError(root, std::strerror(errno));
    }
    if (!rootStat.isDirectory) {
        throw SnapshotError(root, "not a directory");
    }

    DirectorySnapshot snapshot(root, {});
    snapshot.addEntry(root, rootStat);

    std::vector<std::string> pending;
    pending.push_back(root);

    while (!pending.empty()) {
        std::string dir = pending.back();
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            if (dir == root) {
                throw SnapshotError(root, ec.message());
            }
            // Removed or became unreadable while walking
            LOG_DEBUG("Skipping unreadable directory " + dir + ": " + ec.message());
            continue;
        }

        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                break;
            }
            std::string path = it->path().string();

            EntryStat entryStat;
            if (!statEntry(path, entryStat)) {
                continue;
            }
            snapshot.addEntry(path, entryStat);

            if (entryStat.isDirectory) {
                pending.push_back(path);
            }
        }

        if (ec) {
            if (dir == root) {
                throw SnapshotError(root, ec.message());
            }
            LOG_DEBUG("Listing of " + dir + " interrupted: " + ec.message());
        }
    }

    return snapshot;
}

} // namespace PollWatch
