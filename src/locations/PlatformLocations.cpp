#include "locations/PlatformLocations.h"
#include "core/LogManager.h"

#include <cstdlib>
#include <cctype>
#include <filesystem>

#ifndef _WIN32
#include <pwd.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace FileCommander {

std::string PlatformLocations::homeDirectory() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (home && *home) {
        return home;
    }
    const char* drive = std::getenv("HOMEDRIVE");
    const char* path = std::getenv("HOMEPATH");
    if (drive && path) {
        return std::string(drive) + path;
    }
    return "";
#else
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return "";
#endif
}

std::string PlatformLocations::defaultMoviesDirectory(const std::string& home) {
#ifdef _WIN32
    (void)home;
    return "D:\\Movies";
#else
    return (fs::path(home) / "Movies").string();
#endif
}

LocationSeed PlatformLocations::fromHome(const std::string& home) {
    fs::path h(home);

    LocationSeed seed;
    seed.home = home;
    seed.desktop = (h / "Desktop").string();
    seed.downloads = (h / "Downloads").string();
    seed.documents = (h / "Documents").string();
    seed.pictures = (h / "Pictures").string();
    seed.music = (h / "Music").string();
    seed.videos = (h / "Videos").string();
    seed.movies = (h / "Movies").string();
    return seed;
}

LocationSeed PlatformLocations::discover(const std::string& mediaRoot,
                                         const std::map<std::string, std::string>& configuredVolumes) {
    std::string home = homeDirectory();
    if (home.empty()) {
        LOG_WARNING(LogCategory::Location, "discover",
                    "Could not determine home directory, using current directory");
        std::error_code ec;
        home = fs::current_path(ec).string();
    }

    LocationSeed seed = fromHome(home);
    seed.movies = mediaRoot.empty() ? defaultMoviesDirectory(home) : mediaRoot;

    std::error_code ec;

#ifdef _WIN32
    for (char letter = 'C'; letter <= 'Z'; ++letter) {
        std::string root = std::string(1, letter) + ":\\";
        if (fs::exists(root, ec)) {
            seed.volumeRoots[static_cast<char>(std::tolower(letter))] = root;
        }
    }
#endif

    for (const auto& volume : configuredVolumes) {
        if (volume.first.size() != 1 ||
            !std::isalpha(static_cast<unsigned char>(volume.first[0]))) {
            LOG_WARNING(LogCategory::Location, "discover",
                        "Ignoring volume with invalid letter: " + volume.first);
            continue;
        }
        if (!fs::exists(volume.second, ec)) {
            LOG_DEBUG(LogCategory::Location, "discover",
                      "Configured volume root does not exist: " + volume.second);
            continue;
        }
        char letter = static_cast<char>(std::tolower(static_cast<unsigned char>(volume.first[0])));
        seed.volumeRoots[letter] = volume.second;
    }

    return seed;
}

} // namespace FileCommander
