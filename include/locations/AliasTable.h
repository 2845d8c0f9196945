#ifndef FILE_COMMANDER_ALIAS_TABLE_H
#define FILE_COMMANDER_ALIAS_TABLE_H

#include "locations/PlatformLocations.h"
#include <string>
#include <map>
#include <optional>

namespace FileCommander {

/**
 * Immutable mapping of friendly location names to absolute paths.
 *
 * Keys are stored normalized (trimmed, lower-case), so lookups are
 * case-insensitive. Built once at startup and passed by value to the
 * resolver.
 */
class AliasTable {
public:
    AliasTable() = default;

    /**
     * Build the table from a platform seed
     *
     * Adds the well-known directories, their spelling variants
     * ("docs", "my documents", "pics", ...) and for every volume root the
     * aliases "x", "drive x", "drive_x" and "x_drive". Overrides are
     * applied last and win over seeded entries.
     *
     * @param seed Discovered platform locations
     * @param overrides Extra name -> path entries from configuration
     */
    static AliasTable fromSeed(const LocationSeed& seed,
                               const std::map<std::string, std::string>& overrides = {});

    /**
     * Look up a location name
     * @param name Raw name; trimmed and lower-cased before lookup
     * @return Mapped path, or nullopt
     */
    std::optional<std::string> lookup(const std::string& name) const;

    /**
     * Root of a volume by letter (case-insensitive)
     * @return Root path if the volume was present when the table was built
     */
    std::optional<std::string> volumeRoot(char letter) const;

    /**
     * Directory searched by the best-match player ("movies" entry)
     */
    std::string mediaRoot() const;

    const std::map<std::string, std::string>& entries() const { return m_entries; }
    const std::map<char, std::string>& volumeRoots() const { return m_volumeRoots; }
    size_t size() const { return m_entries.size(); }

    static std::string normalizeKey(const std::string& name);

private:
    std::map<std::string, std::string> m_entries;
    std::map<char, std::string> m_volumeRoots;
};

} // namespace FileCommander

#endif // FILE_COMMANDER_ALIAS_TABLE_H
