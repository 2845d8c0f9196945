#include "core/PathValidator.h"
#include "core/LogManager.h"
#include "core/StringUtils.h"

namespace FileCommander {

namespace fs = std::filesystem;

bool PathValidator::containsNullByte(const std::string& path) {
    return path.find('\0') != std::string::npos;
}

bool PathValidator::isValidName(const std::string& name) {
    if (StringUtils::trim(name).empty()) {
        return false;
    }

    if (containsNullByte(name)) {
        LogManager::instance().log(LogLevel::Warning, LogCategory::System,
            "isValidName", "Null byte detected in name");
        return false;
    }

    return true;
}

std::string PathValidator::normalize(const std::string& path) {
    if (path.empty()) {
        return ".";
    }

    fs::path p(path);
    fs::path normalized;

    for (const auto& part : p) {
        const std::string s = part.string();
        if (s.empty() || s == ".") {
            continue;
        }

        if (s == "..") {
            if (normalized.has_relative_path() && normalized.filename() != "..") {
                normalized = normalized.parent_path();
            } else if (!normalized.has_root_path()) {
                normalized /= part;
            }
            // ".." directly under the root stays at the root
            continue;
        }

        normalized /= part;
    }

    if (normalized.empty()) {
        return ".";
    }
    return normalized.string();
}

std::string PathValidator::join(const std::string& base, const std::string& relative) {
    if (relative.empty()) {
        return normalize(base);
    }
    return normalize((fs::path(base) / relative).string());
}

std::string PathValidator::baseName(const std::string& path) {
    fs::path p(path);
    if (!p.has_filename() && p.has_parent_path() && p.parent_path() != p) {
        p = p.parent_path();
    }
    return p.filename().string();
}

bool PathValidator::moveSafe(const fs::path& source, const fs::path& destination,
                             std::error_code& ec) {
    ec.clear();
    fs::rename(source, destination, ec);
    if (!ec) {
        return true;
    }

    if (ec != std::errc::cross_device_link) {
        return false;
    }

    LogManager::instance().log(LogLevel::Debug, LogCategory::Move, "moveSafe",
        "Cross-device move, copying instead", source.string() + " -> " + destination.string());

    ec.clear();
    fs::copy(source, destination,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        return false;
    }

    fs::remove_all(source, ec);
    return !ec;
}

} // namespace FileCommander
