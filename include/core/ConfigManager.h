#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace FileCommander {

/**
 * Manages application configuration
 *
 * Values live in a single JSON document: built-in defaults overlaid with
 * the user's config file. Keys are addressed with dots, e.g.
 * "interpreter.model".
 */
class ConfigManager {
public:
    // Singleton pattern
    static ConfigManager& getInstance();

    // Delete copy constructor and assignment
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Load configuration from file, merged over the defaults
     * @param filePath Path to configuration file
     * @return true if loaded successfully
     */
    bool loadConfig(const std::string& filePath);

    /**
     * Save configuration to file
     * @param filePath Path to save configuration (empty = last loaded file)
     * @return true if saved successfully
     */
    bool saveConfig(const std::string& filePath = "");

    /**
     * Load KEY=VALUE pairs from a dotenv file into the process environment.
     * Variables that are already set are left alone.
     * @param filePath Path to the .env file
     * @return Number of variables exported, or -1 if the file can't be read
     */
    int loadEnvFile(const std::string& filePath);

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * Get an array of strings; non-string elements are skipped
     */
    std::vector<std::string> getArray(const std::string& key) const;

    /**
     * Get an object of string values as a map; non-string values are skipped
     */
    std::map<std::string, std::string> getStringMap(const std::string& key) const;

    void setString(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int value);
    void setDouble(const std::string& key, double value);
    void setBool(const std::string& key, bool value);

    bool hasKey(const std::string& key) const;

    /**
     * Raw JSON value at a dotted key
     * @return Copy of the value, or nullopt if the key is absent
     */
    std::optional<nlohmann::json> getValue(const std::string& key) const;

    /**
     * Reset to default configuration
     */
    void resetToDefaults();

    std::string exportToJson(bool prettyPrint = true) const;

    std::string getConfigFilePath() const { return m_configFilePath; }

    /**
     * Default location of the user config file (~/.filecommander/config.json)
     */
    static std::string defaultConfigPath();

    // Configuration sections

    struct InterpreterConfig {
        std::string endpoint;
        std::string model;
        std::string apiKeyEnv;
        int timeout;
        double temperature;
    };

    struct MediaConfig {
        std::string root;                     // empty = platform default
        std::vector<std::string> extensions;
    };

    struct SearchConfig {
        int maxResults;
    };

    struct LogConfig {
        std::string level;
        bool console;
        std::string directory;                // empty = ~/.filecommander/logs
    };

    InterpreterConfig getInterpreterConfig() const;
    MediaConfig getMediaConfig() const;
    SearchConfig getSearchConfig() const;
    LogConfig getLogConfig() const;

    static nlohmann::json getDefaultConfig();

    /**
     * Recursively merge overlay into base; objects merge, other values replace
     */
    static nlohmann::json mergeConfigs(const nlohmann::json& base,
                                       const nlohmann::json& overlay);

private:
    ConfigManager();
    ~ConfigManager() = default;

    nlohmann::json m_config;
    nlohmann::json m_defaultConfig;
    std::string m_configFilePath;

    void initializeDefaults();
    const nlohmann::json* navigateToKey(const std::string& key) const;
    void setValueAtKey(const std::string& key, const nlohmann::json& value);
    std::vector<std::string> splitKey(const std::string& key) const;
};

} // namespace FileCommander

#endif // CONFIG_MANAGER_H
