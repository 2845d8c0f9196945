#ifndef FILE_COMMANDER_LAUNCHER_H
#define FILE_COMMANDER_LAUNCHER_H

#include "core/Error.h"
#include <string>

namespace FileCommander {

/**
 * Hands a path to the desktop environment.
 *
 * Both calls are fire-and-forget: success means the helper program was
 * started, not that it managed to open anything.
 */
class Launcher {
public:
    virtual ~Launcher() = default;

    /**
     * Show a directory in the platform file manager
     */
    virtual Result<void> openInFileManager(const std::string& path) = 0;

    /**
     * Open a file with its default application (e.g. the media player)
     */
    virtual Result<void> openWithDefaultApplication(const std::string& path) = 0;
};

/**
 * Launcher backed by xdg-open (Linux), open (macOS) or explorer/start (Windows)
 */
class SystemLauncher : public Launcher {
public:
    Result<void> openInFileManager(const std::string& path) override;
    Result<void> openWithDefaultApplication(const std::string& path) override;

    /**
     * Name of the helper program used on this platform
     */
    static std::string helperProgram();

private:
    Result<void> spawnDetached(const std::string& path);
};

} // namespace FileCommander

#endif // FILE_COMMANDER_LAUNCHER_H
