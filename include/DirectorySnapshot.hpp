#pragma once
#include <string>
#include <map>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <sys/types.h>

namespace PollWatch {

struct EntryStat {
    dev_t device{0};
    ino_t inode{0};
    int64_t mtimeNs{0};
    int64_t size{0};
    bool isDirectory{false};
};

/**
 * @brief Thrown when a watched root cannot be inventoried
 */
class SnapshotError : public std::runtime_error {
public:
    SnapshotError(const std::string& root, const std::string& reason)
        : std::runtime_error("Cannot snapshot " + root + ": " + reason), root_(root) {}

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

/**
 * @brief Point-in-time inventory of one watched tree, root included
 */
class DirectorySnapshot {
public:
    using EntryMap = std::map<std::string, EntryStat>;

    DirectorySnapshot() = default;
    DirectorySnapshot(std::string root, EntryMap entries)
        : root_(std::move(root)), entries_(std::move(entries)) {}

    const std::string& root() const { return root_; }
    const EntryMap& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool contains(const std::string& path) const { return entries_.count(path) != 0; }
    const EntryStat* find(const std::string& path) const;

    void addEntry(const std::string& path, const EntryStat& stat) { entries_[path] = stat; }

private:
    std::string root_;
    EntryMap entries_;
};

/**
 * @brief Source of snapshots for producers
 */
class SnapshotProvider {
public:
    virtual ~SnapshotProvider() = default;

    /**
     * @brief Inventory the tree below root
     * @throws SnapshotError when root is missing, unreadable or not a directory
     */
    virtual DirectorySnapshot capture(const std::string& root) = 0;
};

/**
 * @brief Walks the tree with lstat(2); symlinks are recorded, never followed
 */
class FilesystemSnapshotProvider : public SnapshotProvider {
public:
    DirectorySnapshot capture(const std::string& root) override;

    static bool statEntry(const std::string& path, EntryStat& stat);
};

} // namespace PollWatch
