#ifndef FILE_OPERATIONS_H
#define FILE_OPERATIONS_H

#include "operations/Operation.h"
#include "operations/BulkMover.h"
#include "operations/FileSearch.h"
#include "operations/FuzzyMatcher.h"
#include "locations/LocationResolver.h"
#include "platform/Launcher.h"

#include <string>
#include <vector>
#include <system_error>

namespace FileCommander {

/**
 * Operation handler settings
 */
struct FileOperationsSettings {
    int maxSearchResults = FileSearch::DEFAULT_MAX_RESULTS;
    std::vector<std::string> mediaExtensions = FuzzyMatcher::defaultExtensions();
};

/**
 * Handles all local file and folder operations
 *
 * Every handler is total: filesystem failures come back as a failed
 * StepResult carrying the system's description, never as an exception.
 * Locations are resolved against the current path, which starts at the
 * user's home directory.
 */
class FileOperations {
public:
    FileOperations(const LocationResolver& resolver,
                   Launcher& launcher,
                   const std::string& currentPath,
                   const FileOperationsSettings& settings = {});

    /**
     * Create a folder (and any missing parents)
     * @param folderName Name of the new folder
     * @param location Where to create it; empty = current path
     * @return Fails if the folder already exists
     */
    StepResult createFolder(const std::string& folderName, const std::string& location);

    /**
     * Create a file with optional content
     * @param fileName Name of the new file
     * @param location Where to create it; empty = current path
     * @param content Initial content, may be empty
     * @return An existing file is left untouched and reported as succeeded
     *         with code FS_ALREADY_EXISTS
     */
    StepResult createFile(const std::string& fileName, const std::string& location,
                          const std::string& content);

    /**
     * Rename a file or folder inside one directory
     */
    StepResult renameItem(const std::string& oldName, const std::string& newName,
                          const std::string& location);

    /**
     * Move a file or folder. A destination that is an existing directory
     * receives the item under its own name.
     */
    StepResult moveItem(const std::string& source, const std::string& destination);

    /**
     * Move all direct files of one directory into another
     */
    StepResult moveAllFiles(const std::string& sourceDir, const std::string& destinationDir);

    StepResult openLocation(const std::string& location);

    /**
     * Name search below a location (see FileSearch)
     */
    StepResult searchFiles(const std::string& searchTerm, const std::string& searchPath);

    /**
     * Find the best-matching movie under the media root and play it
     */
    StepResult playBestMatch(const std::string& movieName);

    /**
     * Report each file as move_all_files moves it
     */
    void setBulkMoveProgressCallback(BulkMoveCallback callback);

private:
    const LocationResolver& m_resolver;
    Launcher& m_launcher;
    std::string m_currentPath;

    BulkMover m_bulkMover;
    FileSearch m_search;
    FuzzyMatcher m_matcher;

    std::string resolve(const std::string& token) const;

    StepResult ioFailure(const std::string& context, const std::error_code& ec,
                         const std::string& path) const;
};

} // namespace FileCommander

#endif // FILE_OPERATIONS_H
