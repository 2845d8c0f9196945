#include "operations/BulkMover.h"
#include "core/PathValidator.h"
#include "core/LogManager.h"

#include <filesystem>
#include <algorithm>
#include <vector>

namespace fs = std::filesystem;

namespace FileCommander {

BulkMoveResult BulkMover::moveAll(const std::string& sourceDir, const std::string& destinationDir) const {
    BulkMoveResult result;
    std::error_code ec;

    if (!fs::exists(sourceDir, ec)) {
        result.step = StepResult::failure("Source directory does not exist: " + sourceDir,
                                          ErrorCode::FS_SOURCE_MISSING);
        return result;
    }
    if (!fs::is_directory(sourceDir, ec)) {
        result.step = StepResult::failure("Source is not a directory: " + sourceDir,
                                          ErrorCode::FS_NOT_A_DIRECTORY);
        return result;
    }
    if (!fs::exists(destinationDir, ec)) {
        result.step = StepResult::failure("Destination directory does not exist: " + destinationDir,
                                          ErrorCode::FS_DESTINATION_MISSING);
        return result;
    }
    if (!fs::is_directory(destinationDir, ec)) {
        result.step = StepResult::failure("Destination is not a directory: " + destinationDir,
                                          ErrorCode::FS_NOT_A_DIRECTORY);
        return result;
    }

    std::vector<std::string> files;
    fs::directory_iterator it(sourceDir, ec);
    if (ec) {
        Error error = Error::fromErrorCode(ec, "Error moving files");
        result.step = StepResult::failure("Error moving files: " + ec.message() + ": " + sourceDir,
                                          error.code());
        return result;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code statEc;
        if (it->is_regular_file(statEc)) {
            files.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        result.step = StepResult::failure("Error moving files: " + ec.message() + ": " + sourceDir,
                                          Error::fromErrorCode(ec, "Error moving files").code());
        return result;
    }

    if (files.empty()) {
        result.step = StepResult::ok("No files found in the source directory: " + sourceDir,
                                     ErrorCode::SEARCH_NO_FILES);
        return result;
    }

    std::sort(files.begin(), files.end());

    for (size_t i = 0; i < files.size(); ++i) {
        const std::string& name = files[i];

        if (m_progressCallback) {
            m_progressCallback({i + 1, files.size(), name});
        }

        fs::path sourceFile = fs::path(sourceDir) / name;
        fs::path destFile = fs::path(destinationDir) / name;

        std::error_code existsEc;
        if (fs::exists(destFile, existsEc)) {
            result.skipped++;
            LogManager::instance().logWithPath(LogLevel::Debug, LogCategory::Move, "move_all",
                "Skipped existing file", destFile.string());
            continue;
        }

        std::error_code moveEc;
        if (!PathValidator::moveSafe(sourceFile, destFile, moveEc)) {
            LogManager::instance().logWithPath(LogLevel::Error, LogCategory::Move, "move_all",
                "Failed to move file", sourceFile.string(), moveEc.message());
            result.step = StepResult::failure(
                "Error moving files: " + moveEc.message() + ": " + sourceFile.string() +
                " (moved " + std::to_string(result.moved) + " before failing)",
                Error::fromErrorCode(moveEc, "Error moving files").code());
            return result;
        }
        result.moved++;
    }

    std::string message = "Moved " + std::to_string(result.moved) + " files from " +
                          sourceDir + " to " + destinationDir;
    if (result.skipped > 0) {
        message += "\nSkipped " + std::to_string(result.skipped) +
                   " files that already exist in the destination.";
    }

    result.step = StepResult::ok(message);
    LogManager::instance().logWithPath(LogLevel::Info, LogCategory::Move, "move_all",
        "Moved " + std::to_string(result.moved) + ", skipped " + std::to_string(result.skipped),
        sourceDir + " -> " + destinationDir);
    return result;
}

} // namespace FileCommander
