#ifndef FILE_COMMANDER_PLATFORM_LOCATIONS_H
#define FILE_COMMANDER_PLATFORM_LOCATIONS_H

#include <string>
#include <map>

namespace FileCommander {

/**
 * Well-known directories of the current user, plus volume roots.
 * Paths are recorded whether or not they exist on disk.
 */
struct LocationSeed {
    std::string home;
    std::string desktop;
    std::string downloads;
    std::string documents;
    std::string pictures;
    std::string music;
    std::string videos;
    std::string movies;

    // Lower-case volume letter -> root path; only roots that exist
    std::map<char, std::string> volumeRoots;
};

/**
 * Discovers per-platform locations used to seed the alias table
 */
class PlatformLocations {
public:
    /**
     * Home directory of the current user
     * Uses HOME (USERPROFILE on Windows), then the password database.
     * @return Home path, or empty string if it can't be determined
     */
    static std::string homeDirectory();

    /**
     * Build the seed for this machine
     * @param mediaRoot Movies directory override; empty = platform default
     * @param configuredVolumes Letter -> root path for non-Windows systems
     * @return Seed with all well-known directories filled in
     */
    static LocationSeed discover(const std::string& mediaRoot = "",
                                 const std::map<std::string, std::string>& configuredVolumes = {});

    /**
     * Seed rooted at an arbitrary home directory, without volume probing.
     * Movies defaults to <home>/Movies.
     */
    static LocationSeed fromHome(const std::string& home);

    /**
     * Default movies directory: D:\Movies on Windows, ~/Movies elsewhere
     */
    static std::string defaultMoviesDirectory(const std::string& home);
};

} // namespace FileCommander

#endif // FILE_COMMANDER_PLATFORM_LOCATIONS_H
