#ifndef FILE_COMMANDER_TREE_WALK_H
#define FILE_COMMANDER_TREE_WALK_H

#include <string>
#include <functional>
#include <filesystem>

namespace FileCommander {

/**
 * Top-down directory walk.
 *
 * Each directory yields its files in name order, then its subdirectories
 * are walked in name order. Symlinked directories are not followed, and
 * directories that can't be read are skipped.
 */
class TreeWalk {
public:
    /**
     * Called for every non-directory entry
     * @return false to stop the walk
     */
    using Visitor = std::function<bool(const std::filesystem::path& directory,
                                       const std::string& fileName)>;

    /**
     * @param root Directory to walk
     * @param visitor Per-file callback
     * @return true if the walk ran to completion, false if the visitor stopped it
     */
    static bool walk(const std::filesystem::path& root, const Visitor& visitor);
};

} // namespace FileCommander

#endif // FILE_COMMANDER_TREE_WALK_H
