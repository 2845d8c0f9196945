#ifndef FILE_COMMANDER_OPERATION_REGISTRY_H
#define FILE_COMMANDER_OPERATION_REGISTRY_H

#include "operations/Operation.h"
#include "operations/FileOperations.h"

#include <string>
#include <vector>
#include <map>

namespace FileCommander {

/**
 * Parameter of an operation as exposed to plan authors
 */
struct ParameterSpec {
    std::string name;
    bool optional;
};

/**
 * Catalog entry for one operation kind
 */
struct OperationSpec {
    OperationKind kind;
    std::string name;            // Wire name, e.g. "create_folder"
    std::string description;
    std::vector<ParameterSpec> parameters;
};

/**
 * Fixed catalog of operations and the dispatcher that runs them.
 *
 * The catalog drives both plan decoding (build) and the interpreter's
 * prompt, so a new kind only needs a variant alternative, a catalog entry
 * and a handler.
 */
class OperationRegistry {
public:
    static constexpr const char* UNRECOGNIZED_MESSAGE =
        "Sorry, I couldn't understand that command. Please try again.";

    explicit OperationRegistry(FileOperations& operations);

    /**
     * Run one operation
     * @return Its result; never throws
     */
    StepResult execute(const Operation& operation);

    /**
     * All recognized operations, in catalog order
     */
    static const std::vector<OperationSpec>& catalog();

    /**
     * Catalog entry by wire name
     * @return nullptr for unknown names
     */
    static const OperationSpec* findSpec(const std::string& name);

    static std::string kindName(OperationKind kind);

    /**
     * Build an operation from its wire name and string parameters.
     * Missing parameters become empty strings; unknown names yield
     * UnrecognizedOp.
     */
    static Operation build(const std::string& name,
                           const std::map<std::string, std::string>& parameters);

private:
    FileOperations& m_operations;
};

} // namespace FileCommander

#endif // FILE_COMMANDER_OPERATION_REGISTRY_H
