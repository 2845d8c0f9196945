#ifndef CLI_COMMANDS_H
#define CLI_COMMANDS_H

#include "cli/Command.h"
#include "core/Commander.h"
#include "interpreter/CommandInterpreter.h"

#include <functional>
#include <memory>
#include <ostream>

namespace FileCommander {
namespace CLI {

using InterpreterFactory = std::function<std::unique_ptr<CommandInterpreter>()>;
using CommanderFactory = std::function<std::unique_ptr<Commander>()>;

/**
 * Default factory: Commander built from ConfigManager::getInstance()
 */
CommanderFactory defaultCommanderFactory();

/**
 * run <natural language command...>
 *
 * Interprets the command and executes the resulting plan.
 */
class RunCommand : public Command {
public:
    explicit RunCommand(InterpreterFactory interpreterFactory = nullptr,
                        CommanderFactory commanderFactory = nullptr,
                        std::ostream* out = nullptr);

    std::string name() const override { return "run"; }
    std::string description() const override { return "Interpret a natural language command and run it"; }
    std::vector<std::string> aliases() const override { return {"do"}; }
    int execute(const std::vector<std::string>& args) override;
    void printHelp() const override;

private:
    InterpreterFactory m_interpreterFactory;
    CommanderFactory m_commanderFactory;
    std::ostream& m_out;
};

/**
 * plan <file.json | ->
 *
 * Executes a plan written as JSON, no interpreter involved.
 */
class PlanCommand : public Command {
public:
    explicit PlanCommand(CommanderFactory commanderFactory = nullptr,
                         std::ostream* out = nullptr);

    std::string name() const override { return "plan"; }
    std::string description() const override { return "Execute a JSON operation plan"; }
    int execute(const std::vector<std::string>& args) override;
    void printHelp() const override;

private:
    CommanderFactory m_commanderFactory;
    std::ostream& m_out;
};

/**
 * locations: print the alias table
 */
class LocationsCommand : public Command {
public:
    explicit LocationsCommand(CommanderFactory commanderFactory = nullptr,
                              std::ostream* out = nullptr);

    std::string name() const override { return "locations"; }
    std::string description() const override { return "List known location names"; }
    int execute(const std::vector<std::string>& args) override;
    void printHelp() const override;

private:
    CommanderFactory m_commanderFactory;
    std::ostream& m_out;
};

/**
 * config [show | get <key> | set <key> <value>]
 */
class ConfigCommand : public Command {
public:
    explicit ConfigCommand(std::ostream* out = nullptr);

    std::string name() const override { return "config"; }
    std::string description() const override { return "Show the effective configuration"; }
    int execute(const std::vector<std::string>& args) override;
    void printHelp() const override;

private:
    std::ostream& m_out;
};

} // namespace CLI
} // namespace FileCommander

#endif // CLI_COMMANDS_H
