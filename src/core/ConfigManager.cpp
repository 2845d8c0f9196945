#include "core/ConfigManager.h"
#include "core/LogManager.h"
#include "locations/PlatformLocations.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;

namespace FileCommander {

// Private constructor for singleton
ConfigManager::ConfigManager() {
    initializeDefaults();
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

std::string ConfigManager::defaultConfigPath() {
    std::string home = PlatformLocations::homeDirectory();
    if (home.empty()) {
        home = ".";
    }
    return (fs::path(home) / ".filecommander" / "config.json").string();
}

bool ConfigManager::loadConfig(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        LOG_WARNING(LogCategory::System, "load_config", "Failed to open config file: " + filePath);
        return false;
    }

    try {
        nlohmann::json loaded;
        file >> loaded;

        if (!loaded.is_object()) {
            LOG_ERROR(LogCategory::System, "load_config", "Config root must be an object: " + filePath);
            return false;
        }

        m_config = mergeConfigs(m_defaultConfig, loaded);
        m_configFilePath = filePath;
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR(LogCategory::System, "load_config",
                  "Error parsing config " + filePath + ": " + e.what());
        return false;
    }
}

bool ConfigManager::saveConfig(const std::string& filePath) {
    std::string targetPath = filePath.empty() ? m_configFilePath : filePath;
    if (targetPath.empty()) {
        LOG_ERROR(LogCategory::System, "save_config", "No config file path specified");
        return false;
    }

    std::error_code ec;
    fs::path parent = fs::path(targetPath).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::ofstream file(targetPath);
    if (!file.is_open()) {
        LOG_ERROR(LogCategory::System, "save_config",
                  "Failed to open config file for writing: " + targetPath);
        return false;
    }

    file << m_config.dump(4);
    return static_cast<bool>(file);
}

int ConfigManager::loadEnvFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return -1;
    }

    int exported = 0;
    std::string line;
    while (std::getline(file, line)) {
        // Strip comments and surrounding whitespace
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') continue;
        line = line.substr(start);

        if (line.compare(0, 7, "export ") == 0) {
            line = line.substr(7);
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        key.erase(key.find_last_not_of(" \t") + 1);
        size_t valueStart = value.find_first_not_of(" \t");
        value = (valueStart == std::string::npos) ? "" : value.substr(valueStart);
        value.erase(value.find_last_not_of(" \t\r") + 1);

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (std::getenv(key.c_str()) != nullptr) continue;

#ifdef _WIN32
        if (_putenv_s(key.c_str(), value.c_str()) == 0) {
#else
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
#endif
            exported++;
        }
    }

    LOG_DEBUG(LogCategory::System, "load_env",
              "Exported " + std::to_string(exported) + " variables from " + filePath);
    return exported;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    const nlohmann::json* value = navigateToKey(key);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    const nlohmann::json* value = navigateToKey(key);
    if (value && value->is_number_integer()) {
        return value->get<int>();
    }
    return defaultValue;
}

double ConfigManager::getDouble(const std::string& key, double defaultValue) const {
    const nlohmann::json* value = navigateToKey(key);
    if (value && value->is_number()) {
        return value->get<double>();
    }
    return defaultValue;
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    const nlohmann::json* value = navigateToKey(key);
    if (value && value->is_boolean()) {
        return value->get<bool>();
    }
    return defaultValue;
}

std::vector<std::string> ConfigManager::getArray(const std::string& key) const {
    std::vector<std::string> result;
    const nlohmann::json* value = navigateToKey(key);
    if (!value || !value->is_array()) {
        return result;
    }

    for (const auto& item : *value) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

std::map<std::string, std::string> ConfigManager::getStringMap(const std::string& key) const {
    std::map<std::string, std::string> result;
    const nlohmann::json* value = navigateToKey(key);
    if (!value || !value->is_object()) {
        return result;
    }

    for (auto it = value->begin(); it != value->end(); ++it) {
        if (it.value().is_string()) {
            result[it.key()] = it.value().get<std::string>();
        }
    }
    return result;
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    setValueAtKey(key, nlohmann::json(value));
}

void ConfigManager::setInt(const std::string& key, int value) {
    setValueAtKey(key, nlohmann::json(value));
}

void ConfigManager::setDouble(const std::string& key, double value) {
    setValueAtKey(key, nlohmann::json(value));
}

void ConfigManager::setBool(const std::string& key, bool value) {
    setValueAtKey(key, nlohmann::json(value));
}

bool ConfigManager::hasKey(const std::string& key) const {
    return navigateToKey(key) != nullptr;
}

std::optional<nlohmann::json> ConfigManager::getValue(const std::string& key) const {
    const nlohmann::json* value = navigateToKey(key);
    if (!value) {
        return std::nullopt;
    }
    return *value;
}

void ConfigManager::resetToDefaults() {
    m_config = m_defaultConfig;
    m_configFilePath.clear();
}

std::string ConfigManager::exportToJson(bool prettyPrint) const {
    if (prettyPrint) {
        return m_config.dump(4);
    }
    return m_config.dump();
}

// Helper methods
void ConfigManager::initializeDefaults() {
    m_defaultConfig = {
        {"interpreter", {
            {"endpoint", "https://openrouter.ai/api/v1/chat/completions"},
            {"model", "deepseek/deepseek-r1"},
            {"apiKeyEnv", "OPENROUTER_API_KEY"},
            {"timeout", 60},
            {"temperature", 0.0}
        }},
        {"media", {
            {"root", ""},
            {"extensions", {".mp4", ".mkv", ".avi", ".mov", ".wmv", ".flv", ".webm",
                            ".m4v", ".mpg", ".mpeg", ".3gp", ".3g2", ".m2ts"}}
        }},
        {"search", {
            {"maxResults", 10}
        }},
        {"locations", nlohmann::json::object()},
        {"volumes", nlohmann::json::object()},
        {"log", {
            {"level", "INFO"},
            {"console", false},
            {"directory", ""}
        }}
    };

    m_config = m_defaultConfig;
}

const nlohmann::json* ConfigManager::navigateToKey(const std::string& key) const {
    auto keys = splitKey(key);
    if (keys.empty()) return nullptr;

    const nlohmann::json* current = &m_config;

    for (const auto& k : keys) {
        if (!current->is_object()) return nullptr;
        auto it = current->find(k);
        if (it == current->end()) return nullptr;
        current = &(*it);
    }

    return current;
}

void ConfigManager::setValueAtKey(const std::string& key, const nlohmann::json& value) {
    auto keys = splitKey(key);
    if (keys.empty()) return;

    nlohmann::json* current = &m_config;

    for (size_t i = 0; i < keys.size() - 1; ++i) {
        if (!current->contains(keys[i]) || !(*current)[keys[i]].is_object()) {
            (*current)[keys[i]] = nlohmann::json::object();
        }
        current = &(*current)[keys[i]];
    }

    (*current)[keys.back()] = value;
}

std::vector<std::string> ConfigManager::splitKey(const std::string& key) const {
    std::vector<std::string> result;
    std::stringstream ss(key);
    std::string item;

    while (std::getline(ss, item, '.')) {
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

nlohmann::json ConfigManager::getDefaultConfig() {
    return getInstance().m_defaultConfig;
}

nlohmann::json ConfigManager::mergeConfigs(const nlohmann::json& base, const nlohmann::json& overlay) {
    nlohmann::json result = base;

    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& value = it.value();

        if (result.contains(key) && result[key].is_object() && value.is_object()) {
            result[key] = mergeConfigs(result[key], value);
        } else {
            result[key] = value;
        }
    }

    return result;
}

// Get specific configuration structures
ConfigManager::InterpreterConfig ConfigManager::getInterpreterConfig() const {
    InterpreterConfig config;
    config.endpoint = getString("interpreter.endpoint", "https://openrouter.ai/api/v1/chat/completions");
    config.model = getString("interpreter.model", "deepseek/deepseek-r1");
    config.apiKeyEnv = getString("interpreter.apiKeyEnv", "OPENROUTER_API_KEY");
    config.timeout = getInt("interpreter.timeout", 60);
    config.temperature = getDouble("interpreter.temperature", 0.0);
    return config;
}

ConfigManager::MediaConfig ConfigManager::getMediaConfig() const {
    MediaConfig config;
    config.root = getString("media.root", "");
    config.extensions = getArray("media.extensions");
    return config;
}

ConfigManager::SearchConfig ConfigManager::getSearchConfig() const {
    SearchConfig config;
    config.maxResults = getInt("search.maxResults", 10);
    if (config.maxResults <= 0) {
        config.maxResults = 10;
    }
    return config;
}

ConfigManager::LogConfig ConfigManager::getLogConfig() const {
    LogConfig config;
    config.level = getString("log.level", "INFO");
    config.console = getBool("log.console", false);
    config.directory = getString("log.directory", "");
    return config;
}

} // namespace FileCommander
