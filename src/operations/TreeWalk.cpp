#include "operations/TreeWalk.h"
#include "core/LogManager.h"

#include <vector>
#include <algorithm>

namespace fs = std::filesystem;

namespace FileCommander {

bool TreeWalk::walk(const fs::path& root, const Visitor& visitor) {
    std::vector<fs::path> pending{root};

    while (!pending.empty()) {
        fs::path directory = pending.back();
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            LOG_DEBUG(LogCategory::Search, "walk",
                      "Skipping unreadable directory " + directory.string() + ": " + ec.message());
            continue;
        }

        std::vector<std::string> files;
        std::vector<fs::path> subdirs;

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;

            const fs::directory_entry& entry = *it;
            std::error_code statEc;
            bool isDir = entry.is_directory(statEc);

            if (isDir) {
                if (!entry.is_symlink(statEc)) {
                    subdirs.push_back(entry.path());
                }
            } else {
                files.push_back(entry.path().filename().string());
            }
        }

        if (ec) {
            LOG_DEBUG(LogCategory::Search, "walk",
                      "Listing interrupted in " + directory.string() + ": " + ec.message());
        }

        std::sort(files.begin(), files.end());
        for (const auto& file : files) {
            if (!visitor(directory, file)) {
                return false;
            }
        }

        // Reverse order so the smallest name is walked first
        std::sort(subdirs.begin(), subdirs.end());
        for (auto rit = subdirs.rbegin(); rit != subdirs.rend(); ++rit) {
            pending.push_back(*rit);
        }
    }

    return true;
}

} // namespace FileCommander
