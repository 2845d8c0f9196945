#include "operations/FileSearch.h"
#include "operations/TreeWalk.h"
#include "core/StringUtils.h"
#include "core/LogManager.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace FileCommander {

FileSearch::FileSearch(int maxResults)
    : m_maxResults(maxResults > 0 ? maxResults : DEFAULT_MAX_RESULTS) {
}

std::vector<std::string> FileSearch::scan(const std::string& term, const std::string& basePath) const {
    std::vector<std::string> found;
    const std::string needle = StringUtils::toLower(term);

    TreeWalk::walk(basePath, [&](const fs::path& directory, const std::string& fileName) {
        if (StringUtils::toLower(fileName).find(needle) != std::string::npos) {
            found.push_back((directory / fileName).string());
        }
        return static_cast<int>(found.size()) < m_maxResults;
    });

    return found;
}

StepResult FileSearch::search(const std::string& term, const std::string& basePath) const {
    if (term.empty()) {
        return StepResult::failure("No search term specified.", ErrorCode::VALIDATION_MISSING_FIELD);
    }

    std::error_code ec;
    if (!fs::exists(basePath, ec)) {
        LogManager::instance().logWithPath(LogLevel::Warning, LogCategory::Search, "search",
            "Search location does not exist", basePath);
        return StepResult::failure("Search location does not exist: " + basePath,
                                   ErrorCode::FS_SOURCE_MISSING);
    }

    std::vector<std::string> found = scan(term, basePath);

    if (found.empty()) {
        LogManager::instance().logWithPath(LogLevel::Info, LogCategory::Search, "search",
            "No files found for '" + term + "'", basePath);
        return StepResult::ok("No files found containing '" + term + "' in " + basePath,
                              ErrorCode::SEARCH_NO_FILES);
    }

    StepResult result = StepResult::ok("Found " + std::to_string(found.size()) +
                                       " files containing '" + term + "'");
    int index = 1;
    for (const auto& path : found) {
        fs::path p(path);
        SearchRow row;
        row.index = index++;
        row.fileName = p.filename().string();
        row.directory = p.parent_path().string();
        result.rows.push_back(row);
    }

    LogManager::instance().logWithPath(LogLevel::Info, LogCategory::Search, "search",
        result.message, basePath);
    return result;
}

} // namespace FileCommander
