#ifndef FILE_COMMANDER_LOCATION_RESOLVER_H
#define FILE_COMMANDER_LOCATION_RESOLVER_H

#include "locations/AliasTable.h"
#include <string>
#include <optional>

namespace FileCommander {

/**
 * Turns a location token from a plan into an absolute path.
 *
 * Rules, first match wins:
 *  1. blank token            -> current path
 *  2. absolute path          -> unchanged
 *  3. known alias            -> aliased path
 *  4. volume reference ("d", "D:", "drive d") with a known root -> that root
 *  5. letter + ':' prefix    -> unchanged
 *  6. anything else          -> normalize(current / token)
 *
 * Never fails and never touches the disk; the result may not exist.
 */
class LocationResolver {
public:
    explicit LocationResolver(AliasTable aliases);

    /**
     * Resolve a token against the current path
     * @param token Raw location text, e.g. "Desktop", "drive D", "work/reports"
     * @param currentPath Base for relative tokens
     * @return Resolved path
     */
    std::string resolve(const std::string& token, const std::string& currentPath) const;

    const AliasTable& aliases() const { return m_aliases; }

    static bool isAbsolutePath(const std::string& path);

    /**
     * Extract the volume letter from "d", "D:", "d " or "drive d"
     * @return Lower-case letter, or nullopt if token isn't a volume reference
     */
    static std::optional<char> parseVolumeReference(const std::string& token);

    /**
     * True for "X:" prefixed paths such as "C:stuff" or "D:\\x"
     */
    static bool hasVolumePrefix(const std::string& token);

private:
    AliasTable m_aliases;
};

} // namespace FileCommander

#endif // FILE_COMMANDER_LOCATION_RESOLVER_H
