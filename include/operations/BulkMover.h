#ifndef FILE_COMMANDER_BULK_MOVER_H
#define FILE_COMMANDER_BULK_MOVER_H

#include "operations/Operation.h"
#include <string>
#include <functional>

namespace FileCommander {

/**
 * Progress of a bulk move, reported once per file before it is handled
 */
struct BulkMoveProgress {
    size_t index;          // 1-based
    size_t total;
    std::string fileName;
};

using BulkMoveCallback = std::function<void(const BulkMoveProgress&)>;

/**
 * Result of a bulk move
 */
struct BulkMoveResult {
    StepResult step;
    int moved = 0;
    int skipped = 0;
};

/**
 * Moves every regular file directly inside one directory into another.
 *
 * Subdirectories are left alone. A file whose name already exists in the
 * destination is skipped and both copies stay untouched.
 */
class BulkMover {
public:
    BulkMover() = default;

    void setProgressCallback(BulkMoveCallback callback) { m_progressCallback = callback; }

    /**
     * @param sourceDir Resolved source directory
     * @param destinationDir Resolved destination directory
     * @return Step result plus moved/skipped counters
     */
    BulkMoveResult moveAll(const std::string& sourceDir, const std::string& destinationDir) const;

private:
    BulkMoveCallback m_progressCallback;
};

} // namespace FileCommander

#endif // FILE_COMMANDER_BULK_MOVER_H
