#ifndef FILE_COMMANDER_COMMANDER_H
#define FILE_COMMANDER_COMMANDER_H

#include "core/ConfigManager.h"
#include "locations/AliasTable.h"
#include "locations/LocationResolver.h"
#include "operations/FileOperations.h"
#include "operations/OperationRegistry.h"
#include "operations/BatchRunner.h"
#include "platform/Launcher.h"

#include <memory>
#include <string>
#include <vector>

namespace FileCommander {

/**
 * Owns the long-lived pieces of one invocation: alias table, resolver,
 * launcher, handlers, registry and runner.
 */
class Commander {
public:
    /**
     * Build from configuration: discovers platform locations, applies the
     * "locations" and "volumes" overrides and uses the system launcher.
     */
    explicit Commander(const ConfigManager& config);

    /**
     * Build from explicit parts
     * @param aliases Alias table for the resolver
     * @param launcher Launcher used by open/play operations
     * @param currentPath Starting location for relative paths
     * @param settings Handler settings
     */
    Commander(AliasTable aliases,
              std::unique_ptr<Launcher> launcher,
              const std::string& currentPath,
              const FileOperationsSettings& settings = {});

    // Members hold references to each other
    Commander(const Commander&) = delete;
    Commander& operator=(const Commander&) = delete;

    /**
     * Run a plan; one result per step
     */
    std::vector<StepResult> execute(const Plan& plan);

    const AliasTable& aliases() const { return m_resolver.aliases(); }
    FileOperations& operations() { return m_operations; }
    BatchRunner& runner() { return m_runner; }

    static FileOperationsSettings settingsFromConfig(const ConfigManager& config);

private:
    LocationResolver m_resolver;
    std::unique_ptr<Launcher> m_launcher;
    FileOperations m_operations;
    OperationRegistry m_registry;
    BatchRunner m_runner;
};

} // namespace FileCommander

#endif // FILE_COMMANDER_COMMANDER_H
