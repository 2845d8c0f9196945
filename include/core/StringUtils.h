#ifndef FILE_COMMANDER_STRING_UTILS_H
#define FILE_COMMANDER_STRING_UTILS_H

#include <string>
#include <vector>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace FileCommander {
namespace StringUtils {

// Bytewise in the C locale: only ASCII letters change
inline std::string toLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

inline std::string trim(const std::string& str) {
    const char* whitespace = " \t\r\n\f\v";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

/**
 * Split on runs of whitespace; empty words are never produced
 */
inline std::vector<std::string> splitWords(const std::string& str) {
    std::vector<std::string> words;
    std::istringstream ss(str);
    std::string word;
    while (ss >> word) {
        words.push_back(word);
    }
    return words;
}

inline bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace StringUtils
} // namespace FileCommander

#endif // FILE_COMMANDER_STRING_UTILS_H
