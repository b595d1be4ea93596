#pragma once
#include "DirectorySnapshot.hpp"
#include <string>
#include <vector>
#include <utility>

namespace PollWatch {

using PathList = std::vector<std::string>;
using MoveList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Categorized delta between two snapshots of the same root
 *
 * Every collection is sorted by (old) path.
 */
struct DiffResult {
    PathList filesCreated;
    PathList filesModified;
    PathList filesDeleted;
    MoveList filesMoved;
    PathList dirsCreated;
    PathList dirsModified;
    PathList dirsDeleted;
    MoveList dirsMoved;

    bool empty() const;
    size_t totalChanges() const;
};

class SnapshotDiff {
public:
    /**
     * @brief Compare two snapshots; pure function of its inputs
     * @param previous Older snapshot
     * @param current Newer snapshot
     */
    static DiffResult compute(const DirectorySnapshot& previous, const DirectorySnapshot& current);
};

} // namespace PollWatch
