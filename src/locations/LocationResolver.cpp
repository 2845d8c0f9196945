#include "locations/LocationResolver.h"
#include "core/PathValidator.h"
#include "core/StringUtils.h"
#include "core/LogManager.h"

#include <regex>
#include <cctype>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace FileCommander {

LocationResolver::LocationResolver(AliasTable aliases)
    : m_aliases(std::move(aliases)) {
}

bool LocationResolver::isAbsolutePath(const std::string& path) {
    return fs::path(path).is_absolute();
}

std::optional<char> LocationResolver::parseVolumeReference(const std::string& token) {
    static const std::regex volumePattern(R"(^(?:drive\s+)?([a-z])[:\s]?$)",
                                          std::regex::icase);
    std::smatch match;
    if (!std::regex_match(token, match, volumePattern)) {
        return std::nullopt;
    }
    return static_cast<char>(std::tolower(static_cast<unsigned char>(match[1].str()[0])));
}

bool LocationResolver::hasVolumePrefix(const std::string& token) {
    return token.size() > 1 &&
           std::isalpha(static_cast<unsigned char>(token[0])) &&
           token[1] == ':';
}

std::string LocationResolver::resolve(const std::string& token, const std::string& currentPath) const {
    std::string path = StringUtils::trim(token);

    if (path.empty()) {
        return currentPath;
    }

    if (isAbsolutePath(path)) {
        return path;
    }

    if (auto aliased = m_aliases.lookup(path)) {
        LOG_DEBUG(LogCategory::Location, "resolve", "Alias '" + path + "' -> " + *aliased);
        return *aliased;
    }

    if (auto letter = parseVolumeReference(path)) {
        if (auto root = m_aliases.volumeRoot(*letter)) {
            return *root;
        }
    }

    if (hasVolumePrefix(path)) {
        return path;
    }

    return PathValidator::join(currentPath, path);
}

} // namespace FileCommander
