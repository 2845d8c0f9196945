#include "core/Commander.h"
#include "core/LogManager.h"
#include "locations/PlatformLocations.h"

#include <utility>

namespace FileCommander {

namespace {

AliasTable aliasesFromConfig(const ConfigManager& config) {
    ConfigManager::MediaConfig media = config.getMediaConfig();
    LocationSeed seed = PlatformLocations::discover(media.root, config.getStringMap("volumes"));
    AliasTable table = AliasTable::fromSeed(seed, config.getStringMap("locations"));

    LOG_DEBUG(LogCategory::Location, "aliases",
              "Alias table built with " + std::to_string(table.size()) + " entries");
    return table;
}

std::string startingPath() {
    std::string home = PlatformLocations::homeDirectory();
    return home.empty() ? std::string(".") : home;
}

} // anonymous namespace

FileOperationsSettings Commander::settingsFromConfig(const ConfigManager& config) {
    FileOperationsSettings settings;
    settings.maxSearchResults = config.getSearchConfig().maxResults;

    std::vector<std::string> extensions = config.getMediaConfig().extensions;
    if (!extensions.empty()) {
        settings.mediaExtensions = extensions;
    }
    return settings;
}

Commander::Commander(const ConfigManager& config)
    : Commander(aliasesFromConfig(config),
                std::make_unique<SystemLauncher>(),
                startingPath(),
                settingsFromConfig(config)) {
}

Commander::Commander(AliasTable aliases,
                     std::unique_ptr<Launcher> launcher,
                     const std::string& currentPath,
                     const FileOperationsSettings& settings)
    : m_resolver(std::move(aliases))
    , m_launcher(std::move(launcher))
    , m_operations(m_resolver, *m_launcher, currentPath, settings)
    , m_registry(m_operations)
    , m_runner(m_registry) {
}

std::vector<StepResult> Commander::execute(const Plan& plan) {
    return m_runner.run(plan);
}

} // namespace FileCommander
