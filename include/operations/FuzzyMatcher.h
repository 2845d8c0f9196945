#ifndef FILE_COMMANDER_FUZZY_MATCHER_H
#define FILE_COMMANDER_FUZZY_MATCHER_H

#include "operations/Operation.h"
#include <string>
#include <vector>
#include <optional>

namespace FileCommander {

/**
 * Picks the best-matching media file for a free-text title.
 *
 * Scoring (on lower-cased text):
 *   +50 if the whole query is a substring of the file name
 *   +10 for every whitespace-separated query word found in the file name
 *       (repeated words count again)
 * Only files with a media extension are scored; score 0 is discarded.
 */
class FuzzyMatcher {
public:
    explicit FuzzyMatcher(std::vector<std::string> extensions = defaultExtensions());

    static std::vector<std::string> defaultExtensions();

    static int score(const std::string& query, const std::string& fileName);

    bool hasMediaExtension(const std::string& fileName) const;

    /**
     * Score every media file under rootPath
     * @return Candidates with score > 0, in walk order
     */
    std::vector<FileMatch> scan(const std::string& query, const std::string& rootPath) const;

    /**
     * Highest-scoring candidate; equal scores resolve to the
     * lexicographically smallest path
     */
    std::optional<FileMatch> findBest(const std::string& query, const std::string& rootPath) const;

    const std::vector<std::string>& extensions() const { return m_extensions; }

private:
    std::vector<std::string> m_extensions;   // lower-case, with leading dot
};

} // namespace FileCommander

#endif // FILE_COMMANDER_FUZZY_MATCHER_H
