#ifndef FILE_COMMANDER_FILE_SEARCH_H
#define FILE_COMMANDER_FILE_SEARCH_H

#include "operations/Operation.h"
#include <string>
#include <vector>

namespace FileCommander {

/**
 * Bounded name search over a directory tree
 *
 * A file matches when the search term is a case-insensitive substring of
 * its name. The walk stops as soon as maxResults matches are collected.
 */
class FileSearch {
public:
    static constexpr int DEFAULT_MAX_RESULTS = 10;

    explicit FileSearch(int maxResults = DEFAULT_MAX_RESULTS);

    /**
     * Collect matching file paths in walk order
     * @param term Search term (non-empty)
     * @param basePath Existing directory to search
     * @return Full paths, at most maxResults of them
     */
    std::vector<std::string> scan(const std::string& term, const std::string& basePath) const;

    /**
     * Run a search and describe it as a step result with listing rows
     * @param term Search term
     * @param basePath Resolved directory to search
     */
    StepResult search(const std::string& term, const std::string& basePath) const;

    int maxResults() const { return m_maxResults; }

private:
    int m_maxResults;
};

} // namespace FileCommander

#endif // FILE_COMMANDER_FILE_SEARCH_H
