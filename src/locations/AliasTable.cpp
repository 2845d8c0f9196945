#include "locations/AliasTable.h"
#include "core/StringUtils.h"

#include <cctype>

namespace FileCommander {

std::string AliasTable::normalizeKey(const std::string& name) {
    return StringUtils::toLower(StringUtils::trim(name));
}

AliasTable AliasTable::fromSeed(const LocationSeed& seed,
                                const std::map<std::string, std::string>& overrides) {
    AliasTable table;
    auto& e = table.m_entries;

    e["home"] = seed.home;
    e["desktop"] = seed.desktop;
    e["downloads"] = seed.downloads;
    e["documents"] = seed.documents;
    e["pictures"] = seed.pictures;
    e["music"] = seed.music;
    e["videos"] = seed.videos;
    e["movies"] = seed.movies;

    // Common variations
    e["docs"] = seed.documents;
    e["my documents"] = seed.documents;
    e["my desktop"] = seed.desktop;
    e["my downloads"] = seed.downloads;
    e["pics"] = seed.pictures;
    e["photos"] = seed.pictures;

    for (const auto& volume : seed.volumeRoots) {
        char letter = static_cast<char>(std::tolower(static_cast<unsigned char>(volume.first)));
        std::string l(1, letter);
        table.m_volumeRoots[letter] = volume.second;

        e["drive_" + l] = volume.second;
        e[l + "_drive"] = volume.second;
        e[l] = volume.second;
        e["drive " + l] = volume.second;
    }

    for (const auto& entry : overrides) {
        std::string key = normalizeKey(entry.first);
        if (!key.empty()) {
            e[key] = entry.second;
        }
    }

    return table;
}

std::optional<std::string> AliasTable::lookup(const std::string& name) const {
    auto it = m_entries.find(normalizeKey(name));
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> AliasTable::volumeRoot(char letter) const {
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(letter)));
    auto it = m_volumeRoots.find(lower);
    if (it == m_volumeRoots.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string AliasTable::mediaRoot() const {
    auto it = m_entries.find("movies");
    return it != m_entries.end() ? it->second : std::string();
}

} // namespace FileCommander
