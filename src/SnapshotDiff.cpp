#include "SnapshotDiff.hpp"
#include <map>
#include <set>

namespace PollWatch {

namespace {

using InodeKey = std::pair<dev_t, ino_t>;

InodeKey inodeKey(const EntryStat& stat) {
    return InodeKey(stat.device, stat.inode);
}

bool sameInode(const EntryStat& a, const EntryStat& b) {
    return a.device == b.device && a.inode == b.inode;
}

bool isModified(const EntryStat& previous, const EntryStat& current) {
    if (current.isDirectory) {
        return previous.mtimeNs != current.mtimeNs;
    }
    return previous.mtimeNs != current.mtimeNs || previous.size != current.size;
}

} // namespace

bool DiffResult::empty() const {
    return totalChanges() == 0;
}

size_t DiffResult::totalChanges() const {
    return filesCreated.size() + filesModified.size() + filesDeleted.size() + filesMoved.size() +
           dirsCreated.size() + dirsModified.size() + dirsDeleted.size() + dirsMoved.size();
}

DiffResult SnapshotDiff::compute(const DirectorySnapshot& previous, const DirectorySnapshot& current) {
    DiffResult diff;

    std::map<InodeKey, std::string> currentByInode;
    for (const auto& entry : current.entries()) {
        currentByInode.emplace(inodeKey(entry.second), entry.first);
    }

    std::set<std::string> moveTargets;

    for (const auto& entry : previous.entries()) {
        const std::string& path = entry.first;
        const EntryStat& oldStat = entry.second;

        const EntryStat* newStat = current.find(path);
        if (newStat && sameInode(oldStat, *newStat)) {
            if (isModified(oldStat, *newStat)) {
                if (newStat->isDirectory) {
                    diff.dirsModified.push_back(path);
                } else {
                    diff.filesModified.push_back(path);
                }
            }
            continue;
        }

        // The old inode may live on under another name
        auto moved = currentByInode.find(inodeKey(oldStat));
        if (moved != currentByInode.end() && moved->second != path) {
            const std::string& newPath = moved->second;
            const EntryStat* previousAtTarget = previous.find(newPath);
            if (!previousAtTarget || !sameInode(*previousAtTarget, oldStat)) {
                const EntryStat* targetStat = current.find(newPath);
                if (targetStat && targetStat->isDirectory) {
                    diff.dirsMoved.emplace_back(path, newPath);
                } else {
                    diff.filesMoved.emplace_back(path, newPath);
                }
                moveTargets.insert(newPath);
                continue;
            }
        }

        if (oldStat.isDirectory) {
            diff.dirsDeleted.push_back(path);
        } else {
            diff.filesDeleted.push_back(path);
        }
    }

    for (const auto& entry : current.entries()) {
        const std::string& path = entry.first;
        const EntryStat& newStat = entry.second;

        const EntryStat* oldStat = previous.find(path);
        if (oldStat && sameInode(*oldStat, newStat)) {
            continue;
        }
        if (moveTargets.count(path) != 0) {
            continue;
        }

        if (newStat.isDirectory) {
            diff.dirsCreated.push_back(path);
        } else {
            diff.filesCreated.push_back(path);
        }
    }

    return diff;
}

} // namespace PollWatch
