#ifndef FILE_COMMANDER_PLAN_PARSER_H
#define FILE_COMMANDER_PLAN_PARSER_H

#include "core/Error.h"
#include "operations/Operation.h"
#include <string>
#include <nlohmann/json.hpp>

namespace FileCommander {

/**
 * Decodes plan JSON into operations.
 *
 * Accepted shapes:
 *   {"operation": "create_folder", "parameters": {...}}
 *   {"has_multiple_operations": true, "operations": [{...}, {...}]}
 *
 * Unknown or missing operation names become UnrecognizedOp. Missing
 * parameters become empty strings; non-string values are kept as their
 * JSON text.
 */
class PlanParser {
public:
    /**
     * Parse plan text, tolerating a surrounding markdown code fence
     * @param text Raw text, typically an interpreter reply
     * @return Plan, PLAN_PARSE_ERROR or PLAN_NO_OPERATIONS
     */
    static Result<Plan> parse(const std::string& text);

    /**
     * Decode an already parsed document
     */
    static Result<Plan> fromJson(const nlohmann::json& document);

    /**
     * Decode a single {"operation", "parameters"} object
     */
    static Operation operationFromJson(const nlohmann::json& object);

    /**
     * Return the body of the first ``` or ```json fence, or the text
     * unchanged if there is none
     */
    static std::string stripCodeFences(const std::string& text);
};

} // namespace FileCommander

#endif // FILE_COMMANDER_PLAN_PARSER_H
