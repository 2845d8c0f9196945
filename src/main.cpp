/**
 * FileCommander
 * Main entry point
 */

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <filesystem>

#include <curl/curl.h>

#include "core/ConfigManager.h"
#include "core/LogManager.h"
#include "locations/PlatformLocations.h"
#include "cli/CommandRegistry.h"
#include "cli/Commands.h"

namespace fs = std::filesystem;

// Version information
#define APP_NAME "FileCommander"
#define APP_VERSION "1.0.0"
#define APP_DESCRIPTION "Natural language file management"

namespace {

struct GlobalOptions {
    std::string configFile;
    bool verbose = false;
};

/**
 * Pull global options out of argv; everything else is returned in order
 */
bool parseGlobalOptions(int argc, char* argv[], GlobalOptions& options,
                        std::vector<std::string>& remaining) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        // Options only count before the command name
        if (!remaining.empty()) {
            remaining.push_back(arg);
            continue;
        }

        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a file path\n";
                return false;
            }
            options.configFile = argv[++i];
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else {
            remaining.push_back(arg);
        }
    }
    return true;
}

/**
 * Load .env files and the config file, then apply logging settings
 */
bool initialize(const GlobalOptions& options) {
    FileCommander::ConfigManager& config = FileCommander::ConfigManager::getInstance();

    std::string home = FileCommander::PlatformLocations::homeDirectory();

    // Local .env first; existing variables are never overwritten
    config.loadEnvFile(".env");
    if (!home.empty()) {
        config.loadEnvFile((fs::path(home) / ".filecommander" / ".env").string());
    }

    if (!options.configFile.empty()) {
        if (!config.loadConfig(options.configFile)) {
            std::cerr << "Error: Could not load config file: " << options.configFile << "\n";
            return false;
        }
    } else {
        std::string defaultPath = FileCommander::ConfigManager::defaultConfigPath();
        std::error_code ec;
        if (fs::exists(defaultPath, ec) && !config.loadConfig(defaultPath)) {
            std::cerr << "Warning: Ignoring unreadable config file: " << defaultPath << "\n";
        }
    }

    FileCommander::ConfigManager::LogConfig logConfig = config.getLogConfig();
    FileCommander::LogManager& log = FileCommander::LogManager::instance();
    if (!logConfig.directory.empty()) {
        log.setLogDirectory(logConfig.directory);
    }
    log.setMinLevel(options.verbose ? FileCommander::LogLevel::Debug
                                    : FileCommander::LogManager::stringToLevel(logConfig.level));
    log.setConsoleOutput(options.verbose || logConfig.console);

    return true;
}

void registerCommands() {
    using namespace FileCommander::CLI;
    CommandRegistry& registry = CommandRegistry::instance();
    registry.setAppInfo(APP_NAME, APP_VERSION, APP_DESCRIPTION);
    registry.registerCommand(std::make_unique<RunCommand>());
    registry.registerCommand(std::make_unique<PlanCommand>());
    registry.registerCommand(std::make_unique<LocationsCommand>());
    registry.registerCommand(std::make_unique<ConfigCommand>());
}

} // anonymous namespace

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    const std::string programName = fs::path(argv[0]).filename().string();

    GlobalOptions options;
    std::vector<std::string> args;
    if (!parseGlobalOptions(argc, argv, options, args)) {
        return 1;
    }

    if (!initialize(options)) {
        return 1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    registerCommands();
    int exitCode = FileCommander::CLI::CommandRegistry::instance().dispatch(programName, args);

    FileCommander::LogManager::instance().flush();
    curl_global_cleanup();
    return exitCode;
}
