#include "platform/Launcher.h"
#include "core/LogManager.h"

#include <cerrno>
#include <cstring>

#ifdef _WIN32
#include <process.h>
#else
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#endif

namespace FileCommander {

std::string SystemLauncher::helperProgram() {
#if defined(_WIN32)
    return "explorer";
#elif defined(__APPLE__)
    return "open";
#else
    return "xdg-open";
#endif
}

Result<void> SystemLauncher::openInFileManager(const std::string& path) {
    LogManager::instance().logWithPath(LogLevel::Info, LogCategory::Launcher,
        "open_file_manager", "Opening file manager", path);
    return spawnDetached(path);
}

Result<void> SystemLauncher::openWithDefaultApplication(const std::string& path) {
    LogManager::instance().logWithPath(LogLevel::Info, LogCategory::Launcher,
        "open_default_app", "Opening with default application", path);
#ifdef _WIN32
    // "start" picks the registered handler for the file type
    intptr_t rc = _spawnlp(_P_NOWAIT, "cmd", "cmd", "/c", "start", "\"\"",
                           ("\"" + path + "\"").c_str(), nullptr);
    if (rc == -1) {
        return Error(ErrorCode::FS_IO_FAILURE, "Failed to start default application",
                     std::strerror(errno));
    }
    return Result<void>();
#else
    return spawnDetached(path);
#endif
}

#ifdef _WIN32

Result<void> SystemLauncher::spawnDetached(const std::string& path) {
    std::string quoted = "\"" + path + "\"";
    intptr_t rc = _spawnlp(_P_NOWAIT, "explorer", "explorer", quoted.c_str(), nullptr);
    if (rc == -1) {
        return Error(ErrorCode::FS_IO_FAILURE, "Failed to start explorer", std::strerror(errno));
    }
    return Result<void>();
}

#else

Result<void> SystemLauncher::spawnDetached(const std::string& path) {
    const std::string program = helperProgram();

    // Double fork so the helper is reparented and never left as a zombie
    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        LogManager::instance().log(LogLevel::Error, LogCategory::Launcher, "spawn",
            "Failed to fork process", std::strerror(err));
        return Error(ErrorCode::FS_IO_FAILURE, "Failed to fork process", std::strerror(err))
            .withSystemError(err);
    }

    if (pid == 0) {
        // Child process
        pid_t grandchild = fork();
        if (grandchild != 0) {
            _exit(grandchild == -1 ? 1 : 0);
        }

        setsid();

        // Keep the helper's chatter off our terminal
        int devNull = open("/dev/null", O_RDWR);
        if (devNull != -1) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDOUT_FILENO);
            dup2(devNull, STDERR_FILENO);
            if (devNull > STDERR_FILENO) close(devNull);
        }

        // Explicit argument list, no shell
        execlp(program.c_str(), program.c_str(), path.c_str(), nullptr);

        // If exec fails
        _exit(127);
    }

    // Parent process
    int status = 0;
    if (waitpid(pid, &status, 0) == -1) {
        int err = errno;
        return Error(ErrorCode::FS_IO_FAILURE, "Failed to wait for launcher process",
                     std::strerror(err)).withSystemError(err);
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Error(ErrorCode::FS_IO_FAILURE, "Failed to start " + program);
    }

    return Result<void>();
}

#endif

} // namespace FileCommander
