#include "cli/CommandRegistry.h"
#include <iostream>
#include <algorithm>
#include <iomanip>
#include <utility>

namespace FileCommander {
namespace CLI {

CommandRegistry& CommandRegistry::instance() {
    static CommandRegistry instance;
    return instance;
}

bool CommandRegistry::registerCommand(CommandPtr command) {
    if (!command) {
        return false;
    }

    const std::string name = command->name();

    if (m_commands.find(name) != m_commands.end() || m_aliases.find(name) != m_aliases.end()) {
        std::cerr << "Warning: Command '" << name << "' already registered\n";
        return false;
    }

    for (const auto& alias : command->aliases()) {
        if (m_commands.find(alias) != m_commands.end() ||
            m_aliases.find(alias) != m_aliases.end()) {
            std::cerr << "Warning: Alias '" << alias << "' collides with existing command\n";
            return false;
        }
    }

    for (const auto& alias : command->aliases()) {
        m_aliases[alias] = name;
    }

    m_commands[name] = std::move(command);
    return true;
}

Command* CommandRegistry::getCommand(const std::string& name) const {
    auto it = m_commands.find(name);
    if (it != m_commands.end()) {
        return it->second.get();
    }

    auto aliasIt = m_aliases.find(name);
    if (aliasIt != m_aliases.end()) {
        it = m_commands.find(aliasIt->second);
        if (it != m_commands.end()) {
            return it->second.get();
        }
    }

    return nullptr;
}

std::vector<Command*> CommandRegistry::getAllCommands() const {
    std::vector<Command*> commands;
    commands.reserve(m_commands.size());

    for (const auto& pair : m_commands) {
        commands.push_back(pair.second.get());
    }

    std::sort(commands.begin(), commands.end(),
              [](Command* a, Command* b) { return a->name() < b->name(); });

    return commands;
}

int CommandRegistry::dispatch(const std::string& programName, const std::vector<std::string>& args) {
    if (args.empty()) {
        printHelp(programName);
        return 1;
    }

    const std::string& commandName = args[0];

    // Built-in commands
    if (commandName == "help" || commandName == "--help" || commandName == "-h") {
        printHelp(programName);
        return 0;
    }

    if (commandName == "version" || commandName == "--version" || commandName == "-v") {
        printVersion();
        return 0;
    }

    Command* command = getCommand(commandName);
    if (!command) {
        std::cerr << "Error: Unknown command '" << commandName << "'\n";
        std::cerr << "Use '" << programName << " help' for usage information.\n";
        return 1;
    }

    std::vector<std::string> commandArgs(args.begin() + 1, args.end());

    if (!commandArgs.empty() && (commandArgs[0] == "--help" || commandArgs[0] == "-h")) {
        command->printHelp();
        return 0;
    }

    return command->execute(commandArgs);
}

void CommandRegistry::printHelp(const std::string& programName) const {
    std::cout << "\n";
    std::cout << "=================================================\n";
    std::cout << " " << m_appName << " v" << m_appVersion << "\n";
    std::cout << " " << m_appDescription << "\n";
    std::cout << "=================================================\n\n";

    std::cout << "Usage: " << programName << " [--config <file>] [--verbose] <command> [options]\n\n";
    std::cout << "Commands:\n";

    size_t maxLen = 7;  // "version"
    for (const auto& pair : m_commands) {
        maxLen = std::max(maxLen, pair.first.length());
    }

    for (const auto* cmd : getAllCommands()) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(maxLen + 2))
                  << cmd->name() << cmd->description() << "\n";
    }
    std::cout << "  " << std::left << std::setw(static_cast<int>(maxLen + 2))
              << "help" << "Show this help message\n";
    std::cout << "  " << std::left << std::setw(static_cast<int>(maxLen + 2))
              << "version" << "Show version information\n";

    std::cout << "\nExample commands:\n";
    std::cout << "  " << programName << " run Create folder reports on Desktop\n";
    std::cout << "  " << programName << " run Move document.txt from Downloads to Documents\n";
    std::cout << "  " << programName << " run Open file explorer in drive D\n";
    std::cout << "  " << programName << " run Play movie Inception\n";
    std::cout << "  " << programName << " run Search for budget files in Documents\n";
    std::cout << "  " << programName << " plan plan.json\n";

    std::cout << "\nUse '" << programName << " <command> --help' for command-specific help.\n";
}

void CommandRegistry::printVersion() const {
    std::cout << m_appName << " version " << m_appVersion << "\n";
}

void CommandRegistry::setAppInfo(const std::string& name, const std::string& version,
                                  const std::string& description) {
    m_appName = name;
    m_appVersion = version;
    m_appDescription = description;
}

void CommandRegistry::clear() {
    m_commands.clear();
    m_aliases.clear();
}

} // namespace CLI
} // namespace FileCommander
