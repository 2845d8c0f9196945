#ifndef FILE_COMMANDER_PATH_VALIDATOR_H
#define FILE_COMMANDER_PATH_VALIDATOR_H

#include <string>
#include <filesystem>
#include <system_error>

namespace FileCommander {

/**
 * Path checks and helpers shared by the operation handlers.
 *
 * Everything here is lexical except moveSafe(), which touches the disk.
 */
class PathValidator {
public:
    /**
     * Check if path contains null byte
     * @param path Path to check
     * @return true if path contains null byte
     */
    static bool containsNullByte(const std::string& path);

    /**
     * Check that a file or folder name can be used as a path component:
     * not blank and free of null bytes
     * @param name Name supplied by the plan
     * @return true if usable
     */
    static bool isValidName(const std::string& name);

    /**
     * Normalize path lexically (collapse ".", "..", repeated and trailing
     * separators). Leading ".." of a relative path is kept; ".." above the
     * root is dropped. An empty result becomes ".".
     * @param path Path to normalize
     * @return Normalized path
     */
    static std::string normalize(const std::string& path);

    /**
     * Join base and relative and normalize the result
     */
    static std::string join(const std::string& base, const std::string& relative);

    /**
     * Last path component ("movie.mkv" for "/films/movie.mkv")
     */
    static std::string baseName(const std::string& path);

    /**
     * Move a file or directory. Uses rename, and falls back to copy followed
     * by remove when source and destination are on different filesystems.
     * @param source Existing path
     * @param destination Target path (must not exist)
     * @param ec Set on failure
     * @return true if moved
     */
    static bool moveSafe(const std::filesystem::path& source,
                         const std::filesystem::path& destination,
                         std::error_code& ec);
};

} // namespace FileCommander

#endif // FILE_COMMANDER_PATH_VALIDATOR_H
