#include "operations/FileOperations.h"
#include "core/PathValidator.h"
#include "core/StringUtils.h"
#include "core/LogManager.h"

#include <filesystem>
#include <fstream>
#include <cerrno>

namespace fs = std::filesystem;

namespace FileCommander {

namespace {

// Unreadable paths count as absent; the following call reports the real error
bool pathExists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

bool isDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec) && !ec;
}

void logStep(LogCategory category, const std::string& action,
             const StepResult& result, const std::string& path) {
    LogLevel level = result.succeeded ? LogLevel::Info : LogLevel::Warning;
    if (result.code == ErrorCode::FS_IO_FAILURE) {
        level = LogLevel::Error;
    }
    LogManager::instance().logWithPath(level, category, action, result.message, path,
                                       getCodeName(result.code));
}

} // anonymous namespace

FileOperations::FileOperations(const LocationResolver& resolver,
                               Launcher& launcher,
                               const std::string& currentPath,
                               const FileOperationsSettings& settings)
    : m_resolver(resolver)
    , m_launcher(launcher)
    , m_currentPath(currentPath)
    , m_search(settings.maxSearchResults)
    , m_matcher(settings.mediaExtensions) {
}

std::string FileOperations::resolve(const std::string& token) const {
    return m_resolver.resolve(token, m_currentPath);
}

void FileOperations::setBulkMoveProgressCallback(BulkMoveCallback callback) {
    m_bulkMover.setProgressCallback(callback);
}

StepResult FileOperations::ioFailure(const std::string& context, const std::error_code& ec,
                                     const std::string& path) const {
    Error error = Error::fromErrorCode(ec, context);
    return StepResult::failure(context + ": " + ec.message() + ": " + path, error.code());
}

// ==================== Folders and files ====================

StepResult FileOperations::createFolder(const std::string& folderName, const std::string& location) {
    std::string name = StringUtils::trim(folderName);
    if (!PathValidator::isValidName(name)) {
        StepResult result = StepResult::failure("Invalid folder name: '" + folderName + "'",
                                                ErrorCode::VALIDATION_INVALID_INPUT);
        logStep(LogCategory::Folder, "create_folder", result, location);
        return result;
    }

    fs::path folderPath = fs::path(resolve(location)) / name;
    StepResult result;

    if (pathExists(folderPath)) {
        result = StepResult::failure("Folder already exists: " + folderPath.string(),
                                     ErrorCode::FS_ALREADY_EXISTS);
    } else {
        std::error_code ec;
        fs::create_directories(folderPath, ec);
        if (ec) {
            result = ioFailure("Error creating folder", ec, folderPath.string());
        } else {
            result = StepResult::ok("Created folder: " + folderPath.string());
        }
    }

    logStep(LogCategory::Folder, "create_folder", result, folderPath.string());
    return result;
}

StepResult FileOperations::createFile(const std::string& fileName, const std::string& location,
                                      const std::string& content) {
    std::string name = StringUtils::trim(fileName);
    if (!PathValidator::isValidName(name)) {
        StepResult result = StepResult::failure("Invalid file name: '" + fileName + "'",
                                                ErrorCode::VALIDATION_INVALID_INPUT);
        logStep(LogCategory::File, "create_file", result, location);
        return result;
    }

    fs::path filePath = fs::path(resolve(location)) / name;
    StepResult result;

    if (pathExists(filePath)) {
        result = StepResult::ok("File already exists: " + filePath.string(),
                                ErrorCode::FS_ALREADY_EXISTS);
        logStep(LogCategory::File, "create_file", result, filePath.string());
        return result;
    }

    std::ofstream out(filePath, std::ios::out | std::ios::binary);
    if (!out.is_open()) {
        std::error_code ec(errno ? errno : EIO, std::generic_category());
        result = ioFailure("Error creating file", ec, filePath.string());
    } else {
        if (!content.empty()) {
            out << content;
        }
        out.close();
        if (out.fail()) {
            result = ioFailure("Error creating file", std::make_error_code(std::errc::io_error),
                               filePath.string());
        } else {
            result = StepResult::ok("Created file: " + filePath.string());
        }
    }

    logStep(LogCategory::File, "create_file", result, filePath.string());
    return result;
}

StepResult FileOperations::renameItem(const std::string& oldName, const std::string& newName,
                                      const std::string& location) {
    if (!PathValidator::isValidName(oldName) || !PathValidator::isValidName(newName)) {
        StepResult result = StepResult::failure(
            "Invalid name for rename: '" + oldName + "' -> '" + newName + "'",
            ErrorCode::VALIDATION_INVALID_INPUT);
        logStep(LogCategory::File, "rename_item", result, location);
        return result;
    }

    fs::path base(resolve(location));
    fs::path oldPath = base / oldName;
    fs::path newPath = base / newName;
    StepResult result;

    if (!pathExists(oldPath)) {
        result = StepResult::failure("Source does not exist: " + oldPath.string(),
                                     ErrorCode::FS_SOURCE_MISSING);
    } else if (pathExists(newPath)) {
        result = StepResult::failure("Destination already exists: " + newPath.string(),
                                     ErrorCode::FS_DESTINATION_EXISTS);
    } else {
        std::error_code ec;
        fs::rename(oldPath, newPath, ec);
        if (ec) {
            result = ioFailure("Error renaming item", ec, oldPath.string());
        } else {
            result = StepResult::ok("Renamed from " + oldPath.string() + " to " + newPath.string());
        }
    }

    logStep(LogCategory::File, "rename_item", result, oldPath.string());
    return result;
}

// ==================== Moves ====================

StepResult FileOperations::moveItem(const std::string& source, const std::string& destination) {
    if (StringUtils::trim(source).empty()) {
        StepResult result = StepResult::failure("No source specified for move.",
                                                ErrorCode::VALIDATION_MISSING_FIELD);
        logStep(LogCategory::Move, "move_item", result, "");
        return result;
    }

    std::string sourcePath = resolve(source);
    fs::path destPath(resolve(destination));
    StepResult result;

    if (!pathExists(sourcePath)) {
        result = StepResult::failure("Source does not exist: " + sourcePath,
                                     ErrorCode::FS_SOURCE_MISSING);
        logStep(LogCategory::Move, "move_item", result, sourcePath);
        return result;
    }

    if (isDirectory(destPath)) {
        destPath /= PathValidator::baseName(sourcePath);
    }

    if (pathExists(destPath)) {
        result = StepResult::failure("Destination already exists: " + destPath.string(),
                                     ErrorCode::FS_DESTINATION_EXISTS);
    } else {
        std::error_code ec;
        if (!PathValidator::moveSafe(sourcePath, destPath, ec)) {
            result = ioFailure("Error moving item", ec, sourcePath);
        } else {
            result = StepResult::ok("Moved from " + sourcePath + " to " + destPath.string());
        }
    }

    logStep(LogCategory::Move, "move_item", result, sourcePath);
    return result;
}

StepResult FileOperations::moveAllFiles(const std::string& sourceDir, const std::string& destinationDir) {
    std::string sourcePath = resolve(sourceDir);
    std::string destPath = resolve(destinationDir);

    BulkMoveResult bulk = m_bulkMover.moveAll(sourcePath, destPath);
    logStep(LogCategory::Move, "move_all_files", bulk.step, sourcePath);
    return bulk.step;
}

// ==================== Launching ====================

StepResult FileOperations::openLocation(const std::string& location) {
    std::string path = resolve(location);
    StepResult result;

    if (!pathExists(path)) {
        result = StepResult::failure("Location does not exist: " + path,
                                     ErrorCode::FS_SOURCE_MISSING);
    } else {
        Result<void> opened = m_launcher.openInFileManager(path);
        if (opened.isError()) {
            result = StepResult::failure("Error opening file explorer: " + opened.error().toString(),
                                         opened.error().code());
        } else {
            result = StepResult::ok("Opened file explorer at: " + path);
        }
    }

    logStep(LogCategory::Launcher, "open_file_explorer", result, path);
    return result;
}

StepResult FileOperations::searchFiles(const std::string& searchTerm, const std::string& searchPath) {
    if (searchTerm.empty()) {
        return StepResult::failure("No search term specified.", ErrorCode::VALIDATION_MISSING_FIELD);
    }
    return m_search.search(searchTerm, resolve(searchPath));
}

StepResult FileOperations::playBestMatch(const std::string& movieName) {
    if (movieName.empty()) {
        return StepResult::failure("No movie name specified.", ErrorCode::VALIDATION_MISSING_FIELD);
    }

    std::string moviesDir = m_resolver.aliases().mediaRoot();
    StepResult result;

    if (moviesDir.empty() || !pathExists(moviesDir)) {
        result = StepResult::failure("Movies directory does not exist: " + moviesDir,
                                     ErrorCode::FS_SOURCE_MISSING);
        logStep(LogCategory::Media, "play_movie", result, moviesDir);
        return result;
    }

    std::optional<FileMatch> best = m_matcher.findBest(movieName, moviesDir);
    if (!best) {
        result = StepResult::failure("No movie found with name '" + movieName + "'",
                                     ErrorCode::SEARCH_NO_MATCH);
        logStep(LogCategory::Media, "play_movie", result, moviesDir);
        return result;
    }

    Result<void> opened = m_launcher.openWithDefaultApplication(best->path);
    if (opened.isError()) {
        result = StepResult::failure("Error playing movie: " + opened.error().toString(),
                                     opened.error().code());
    } else {
        result = StepResult::ok("Playing movie: " + PathValidator::baseName(best->path));
    }

    logStep(LogCategory::Media, "play_movie", result, best->path);
    return result;
}

} // namespace FileCommander
