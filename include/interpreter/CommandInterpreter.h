#ifndef FILE_COMMANDER_COMMAND_INTERPRETER_H
#define FILE_COMMANDER_COMMAND_INTERPRETER_H

#include "core/Error.h"
#include "operations/Operation.h"
#include <string>

namespace FileCommander {

/**
 * Turns a natural-language command into a plan
 */
class CommandInterpreter {
public:
    virtual ~CommandInterpreter() = default;

    /**
     * @param command Text typed by the user, e.g. "create folder reports on desktop"
     * @return Plan, or an interpreter/plan error
     */
    virtual Result<Plan> interpret(const std::string& command) = 0;
};

} // namespace FileCommander

#endif // FILE_COMMANDER_COMMAND_INTERPRETER_H
