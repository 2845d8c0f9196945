#ifndef CLI_COMMAND_REGISTRY_H
#define CLI_COMMAND_REGISTRY_H

#include "Command.h"
#include <map>
#include <string>
#include <memory>
#include <vector>

namespace FileCommander {
namespace CLI {

/**
 * Singleton registry for CLI commands
 *
 * Example:
 *   CommandRegistry::instance().registerCommand(std::make_unique<RunCommand>());
 *   return CommandRegistry::instance().dispatch("filecommander", args);
 */
class CommandRegistry {
public:
    static CommandRegistry& instance();

    // Non-copyable
    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    /**
     * Register a command
     * @param command Unique pointer to command (registry takes ownership)
     * @return true if registered successfully, false if name collision
     */
    bool registerCommand(CommandPtr command);

    /**
     * Get a command by name or alias
     * @return Pointer to command or nullptr if not found
     */
    Command* getCommand(const std::string& name) const;

    /**
     * Get all registered commands, sorted by name
     */
    std::vector<Command*> getAllCommands() const;

    /**
     * Find the command named by args[0] and run it with the rest
     * @param programName Used in usage messages
     * @param args Arguments after the program name (global options removed)
     * @return Exit code from command (or 1 if command not found)
     */
    int dispatch(const std::string& programName, const std::vector<std::string>& args);

    void printHelp(const std::string& programName) const;
    void printVersion() const;

    void setAppInfo(const std::string& name, const std::string& version,
                    const std::string& description);

    /**
     * Clear all registered commands
     * Primarily for testing
     */
    void clear();

private:
    CommandRegistry() = default;

    // Commands by name
    std::map<std::string, CommandPtr> m_commands;

    // Alias -> canonical name mapping
    std::map<std::string, std::string> m_aliases;

    std::string m_appName = "FileCommander";
    std::string m_appVersion = "1.0.0";
    std::string m_appDescription = "Natural language file management";
};

} // namespace CLI
} // namespace FileCommander

#endif // CLI_COMMAND_REGISTRY_H
