#include "operations/FuzzyMatcher.h"
#include "operations/TreeWalk.h"
#include "core/StringUtils.h"
#include "core/LogManager.h"

#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace FileCommander {

FuzzyMatcher::FuzzyMatcher(std::vector<std::string> extensions) {
    if (extensions.empty()) {
        extensions = defaultExtensions();
    }
    for (auto& ext : extensions) {
        std::string lower = StringUtils::toLower(StringUtils::trim(ext));
        if (lower.empty()) continue;
        if (lower[0] != '.') {
            lower = "." + lower;
        }
        m_extensions.push_back(std::move(lower));
    }
}

std::vector<std::string> FuzzyMatcher::defaultExtensions() {
    return {".mp4", ".mkv", ".avi", ".mov", ".wmv", ".flv", ".webm",
            ".m4v", ".mpg", ".mpeg", ".3gp", ".3g2", ".m2ts"};
}

int FuzzyMatcher::score(const std::string& query, const std::string& fileName) {
    const std::string lowerQuery = StringUtils::toLower(query);
    const std::string lowerName = StringUtils::toLower(fileName);

    int total = 0;
    if (lowerName.find(lowerQuery) != std::string::npos) {
        total += 50;
    }

    for (const auto& word : StringUtils::splitWords(lowerQuery)) {
        if (lowerName.find(word) != std::string::npos) {
            total += 10;
        }
    }

    return total;
}

bool FuzzyMatcher::hasMediaExtension(const std::string& fileName) const {
    const std::string lowerName = StringUtils::toLower(fileName);
    for (const auto& ext : m_extensions) {
        if (StringUtils::endsWith(lowerName, ext)) {
            return true;
        }
    }
    return false;
}

std::vector<FileMatch> FuzzyMatcher::scan(const std::string& query, const std::string& rootPath) const {
    std::vector<FileMatch> candidates;

    TreeWalk::walk(rootPath, [&](const fs::path& directory, const std::string& fileName) {
        if (hasMediaExtension(fileName)) {
            int s = score(query, fileName);
            if (s > 0) {
                candidates.push_back({(directory / fileName).string(), s});
            }
        }
        return true;
    });

    return candidates;
}

std::optional<FileMatch> FuzzyMatcher::findBest(const std::string& query, const std::string& rootPath) const {
    std::vector<FileMatch> candidates = scan(query, rootPath);
    if (candidates.empty()) {
        return std::nullopt;
    }

    const FileMatch* best = &candidates.front();
    for (const auto& candidate : candidates) {
        if (candidate.score > best->score ||
            (candidate.score == best->score && candidate.path < best->path)) {
            best = &candidate;
        }
    }

    LOG_DEBUG(LogCategory::Media, "find_best",
              "Best of " + std::to_string(candidates.size()) + " candidates: " +
              best->path + " (score " + std::to_string(best->score) + ")");
    return *best;
}

} // namespace FileCommander
