#include "cli/Commands.h"
#include "cli/ResultPrinter.h"
#include "core/ConfigManager.h"
#include "core/LogManager.h"
#include "core/StringUtils.h"
#include "interpreter/LlmInterpreter.h"
#include "interpreter/PlanParser.h"
#include "operations/BatchRunner.h"

#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace fs = std::filesystem;

namespace FileCommander {
namespace CLI {

namespace {

/**
 * Turn a plan decoding outcome into something runnable.
 * @return false if there is nothing to run (message already printed)
 */
bool planOrFallback(const Result<Plan>& decoded, Plan& plan, std::ostream& out) {
    if (decoded.isOk()) {
        plan = decoded.value();
        return true;
    }

    const Error& error = decoded.error();
    if (error.code() == ErrorCode::PLAN_NO_OPERATIONS) {
        out << error.message() << "\n";
        return false;
    }

    // Anything else undecodable is reported as an unrecognized command
    std::cerr << "Warning: " << error.toString() << "\n";
    plan = Plan{UnrecognizedOp{}};
    return true;
}

int runPlan(Commander& commander, const Plan& plan, std::ostream& out) {
    // Progress goes to stderr; stdout carries the results
    commander.operations().setBulkMoveProgressCallback([](const BulkMoveProgress& progress) {
        std::cerr << "\rMoving files " << progress.index << "/" << progress.total
                  << ": " << progress.fileName << std::flush;
        if (progress.index == progress.total) {
            std::cerr << "\n";
        }
    });

    std::vector<StepResult> results = commander.execute(plan);
    ResultPrinter(out).print(results);
    return BatchRunner::allSucceeded(results) ? 0 : 1;
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) joined += " ";
        joined += arg;
    }
    return joined;
}

/**
 * Store a command-line value, typed after the value already at the key.
 * New keys are stored as strings.
 */
bool applySetting(ConfigManager& config, const std::string& key, const std::string& value) {
    if (!config.hasKey(key)) {
        config.setString(key, value);
        return true;
    }

    const nlohmann::json current = *config.getValue(key);

    if (current.is_object() || current.is_array()) {
        std::cerr << "Error: '" << key << "' is a section; set one of its entries instead\n";
        return false;
    }

    if (current.is_boolean()) {
        std::string lower = StringUtils::toLower(value);
        if (lower == "true" || lower == "yes") {
            config.setBool(key, true);
        } else if (lower == "false" || lower == "no") {
            config.setBool(key, false);
        } else {
            std::cerr << "Error: '" << key << "' expects true or false\n";
            return false;
        }
        return true;
    }

    if (current.is_number_integer()) {
        char* end = nullptr;
        errno = 0;
        long parsed = std::strtol(value.c_str(), &end, 10);
        if (value.empty() || *end != '\0' || errno == ERANGE ||
            parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
            std::cerr << "Error: '" << key << "' expects a whole number\n";
            return false;
        }
        config.setInt(key, static_cast<int>(parsed));
        return true;
    }

    if (current.is_number()) {
        char* end = nullptr;
        double parsed = std::strtod(value.c_str(), &end);
        if (value.empty() || *end != '\0') {
            std::cerr << "Error: '" << key << "' expects a number\n";
            return false;
        }
        config.setDouble(key, parsed);
        return true;
    }

    config.setString(key, value);
    return true;
}

} // anonymous namespace

CommanderFactory defaultCommanderFactory() {
    return []() {
        return std::make_unique<Commander>(ConfigManager::getInstance());
    };
}

// ==================== run ====================

RunCommand::RunCommand(InterpreterFactory interpreterFactory,
                       CommanderFactory commanderFactory,
                       std::ostream* out)
    : m_interpreterFactory(interpreterFactory)
    , m_commanderFactory(commanderFactory ? commanderFactory : defaultCommanderFactory())
    , m_out(out ? *out : std::cout) {
    if (!m_interpreterFactory) {
        m_interpreterFactory = []() -> std::unique_ptr<CommandInterpreter> {
            return std::make_unique<LlmInterpreter>(
                LlmInterpreter::fromConfig(ConfigManager::getInstance()));
        };
    }
}

int RunCommand::execute(const std::vector<std::string>& args) {
    if (args.empty()) {
        printHelp();
        return 1;
    }

    const std::string command = joinArgs(args);
    m_out << "Command: " << command << "\n";

    std::unique_ptr<CommandInterpreter> interpreter = m_interpreterFactory();
    Result<Plan> decoded = interpreter->interpret(command);

    if (decoded.isError() && decoded.error().code() == ErrorCode::INTERPRETER_NOT_CONFIGURED) {
        std::cerr << "Error: " << decoded.error().message() << "\n";
        if (!decoded.error().details().empty()) {
            std::cerr << decoded.error().details() << "\n";
        }
        return 1;
    }

    Plan plan;
    if (!planOrFallback(decoded, plan, m_out)) {
        return 1;
    }

    std::unique_ptr<Commander> commander = m_commanderFactory();
    return runPlan(*commander, plan, m_out);
}

void RunCommand::printHelp() const {
    std::cout << "Usage: filecommander run <command...>\n\n";
    std::cout << "Interprets a natural language command and performs it.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  filecommander run Create folder reports on Desktop\n";
    std::cout << "  filecommander run Move document.txt from Downloads to Documents\n";
    std::cout << "  filecommander run Rename folder old_stuff to archive\n";
    std::cout << "  filecommander run Play movie Inception\n";
    std::cout << "\nThe API key is read from the environment variable named by\n";
    std::cout << "interpreter.apiKeyEnv (default OPENROUTER_API_KEY), or from .env.\n";
}

// ==================== plan ====================

PlanCommand::PlanCommand(CommanderFactory commanderFactory, std::ostream* out)
    : m_commanderFactory(commanderFactory ? commanderFactory : defaultCommanderFactory())
    , m_out(out ? *out : std::cout) {
}

int PlanCommand::execute(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        printHelp();
        return 1;
    }

    std::string text;
    if (args[0] == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        text = ss.str();
    } else {
        std::ifstream file(args[0]);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot read plan file: " << args[0] << "\n";
            return 1;
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        text = ss.str();
    }

    Plan plan;
    if (!planOrFallback(PlanParser::parse(text), plan, m_out)) {
        return 1;
    }

    std::unique_ptr<Commander> commander = m_commanderFactory();
    return runPlan(*commander, plan, m_out);
}

void PlanCommand::printHelp() const {
    std::cout << "Usage: filecommander plan <file.json | ->\n\n";
    std::cout << "Executes a plan without contacting the interpreter. Use '-' to read stdin.\n\n";
    std::cout << "Single operation:\n";
    std::cout << "  {\"operation\": \"create_folder\", \"parameters\": {\"folder_name\": \"reports\", \"location\": \"Desktop\"}}\n\n";
    std::cout << "Several operations:\n";
    std::cout << "  {\"has_multiple_operations\": true, \"operations\": [ {...}, {...} ]}\n\n";
    std::cout << "Operations:\n";
    for (const auto& spec : OperationRegistry::catalog()) {
        std::cout << "  " << std::left << std::setw(20) << spec.name;
        for (size_t i = 0; i < spec.parameters.size(); ++i) {
            if (i > 0) std::cout << ", ";
            std::cout << spec.parameters[i].name << (spec.parameters[i].optional ? "?" : "");
        }
        std::cout << "\n";
    }
}

// ==================== locations ====================

LocationsCommand::LocationsCommand(CommanderFactory commanderFactory, std::ostream* out)
    : m_commanderFactory(commanderFactory ? commanderFactory : defaultCommanderFactory())
    , m_out(out ? *out : std::cout) {
}

int LocationsCommand::execute(const std::vector<std::string>& args) {
    if (!args.empty()) {
        printHelp();
        return 1;
    }

    std::unique_ptr<Commander> commander = m_commanderFactory();
    const AliasTable& aliases = commander->aliases();

    size_t width = 4;
    for (const auto& entry : aliases.entries()) {
        width = std::max(width, entry.first.size());
    }

    m_out << "Known locations:\n";
    for (const auto& entry : aliases.entries()) {
        std::error_code ec;
        bool exists = fs::exists(entry.second, ec);
        m_out << "  " << std::left << std::setw(static_cast<int>(width + 2)) << entry.first
              << entry.second << (exists ? "" : "  (missing)") << "\n";
    }

    m_out << "\nMedia root: " << aliases.mediaRoot() << "\n";
    if (!aliases.volumeRoots().empty()) {
        m_out << "Volumes:\n";
        for (const auto& volume : aliases.volumeRoots()) {
            m_out << "  " << volume.first << "  " << volume.second << "\n";
        }
    }
    return 0;
}

void LocationsCommand::printHelp() const {
    std::cout << "Usage: filecommander locations\n\n";
    std::cout << "Lists the location names understood in commands and plans.\n";
    std::cout << "Add your own under \"locations\" in ~/.filecommander/config.json.\n";
}

// ==================== config ====================

ConfigCommand::ConfigCommand(std::ostream* out)
    : m_out(out ? *out : std::cout) {
}

int ConfigCommand::execute(const std::vector<std::string>& args) {
    ConfigManager& config = ConfigManager::getInstance();

    if (args.empty() || args[0] == "show") {
        std::string path = config.getConfigFilePath();
        m_out << "Config file: " << (path.empty() ? "(defaults only)" : path) << "\n";
        m_out << config.exportToJson(true) << "\n";
        return 0;
    }

    if (args[0] == "get") {
        if (args.size() != 2) {
            std::cerr << "Usage: filecommander config get <key>\n";
            return 1;
        }
        std::optional<nlohmann::json> value = config.getValue(args[1]);
        if (!value) {
            std::cerr << "Error: Unknown config key '" << args[1] << "'\n";
            return 1;
        }
        if (value->is_string()) {
            m_out << value->get<std::string>() << "\n";
        } else {
            m_out << value->dump(4) << "\n";
        }
        return 0;
    }

    if (args[0] == "set") {
        if (args.size() != 3) {
            std::cerr << "Usage: filecommander config set <key> <value>\n";
            return 1;
        }
        if (!applySetting(config, args[1], args[2])) {
            return 1;
        }

        std::string path = config.getConfigFilePath();
        if (path.empty()) {
            path = ConfigManager::defaultConfigPath();
        }
        if (!config.saveConfig(path)) {
            std::cerr << "Error: Could not write config file: " << path << "\n";
            return 1;
        }
        m_out << "Set " << args[1] << " = " << args[2] << "\n";
        return 0;
    }

    std::cerr << "Error: Unknown config subcommand '" << args[0] << "'\n";
    printHelp();
    return 1;
}

void ConfigCommand::printHelp() const {
    std::cout << "Configuration Commands:\n";
    std::cout << "  show            Show current configuration\n";
    std::cout << "  get <key>       Get configuration value\n";
    std::cout << "  set <key> <v>   Set a value and save the config file\n";
    std::cout << "\nExamples:\n";
    std::cout << "  filecommander config show\n";
    std::cout << "  filecommander config get interpreter.model\n";
    std::cout << "  filecommander config set search.maxResults 25\n";
    std::cout << "  filecommander config set locations.projects ~/src\n";
    std::cout << "  filecommander --config ./my-config.json config show\n";
}

} // namespace CLI
} // namespace FileCommander
