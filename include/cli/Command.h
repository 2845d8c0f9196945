#ifndef CLI_COMMAND_H
#define CLI_COMMAND_H

#include <string>
#include <vector>
#include <memory>

namespace FileCommander {
namespace CLI {

/**
 * Base class for all CLI command handlers
 *
 * Implement this interface to create new CLI commands.
 * Commands are registered with CommandRegistry and dispatched
 * based on the first argument to the program.
 *
 * Example usage:
 *   class LocationsCommand : public Command {
 *   public:
 *       std::string name() const override { return "locations"; }
 *       std::string description() const override { return "List location aliases"; }
 *       int execute(const std::vector<std::string>& args) override;
 *       void printHelp() const override;
 *   };
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Get the command name (used for dispatching)
     * Example: "run" for "filecommander run create folder reports"
     */
    virtual std::string name() const = 0;

    /**
     * Get a brief description for help text
     */
    virtual std::string description() const = 0;

    /**
     * Get command aliases (optional)
     */
    virtual std::vector<std::string> aliases() const { return {}; }

    /**
     * Execute the command with given arguments
     * @param args Arguments after the command name
     * @return Exit code (0 = success)
     */
    virtual int execute(const std::vector<std::string>& args) = 0;

    /**
     * Print detailed help for this command
     * Called when user runs "filecommander <command> --help"
     */
    virtual void printHelp() const = 0;
};

using CommandPtr = std::unique_ptr<Command>;

} // namespace CLI
} // namespace FileCommander

#endif // CLI_COMMAND_H
