#include "interpreter/PlanParser.h"
#include "operations/OperationRegistry.h"
#include "core/StringUtils.h"
#include "core/LogManager.h"

#include <map>

namespace FileCommander {

namespace {

bool isTruthy(const nlohmann::json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string() || value.is_array() || value.is_object()) return !value.empty();
    return false;
}

std::string parameterText(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

} // anonymous namespace

std::string PlanParser::stripCodeFences(const std::string& text) {
    static const std::string fence = "```";

    size_t open = text.find(fence);
    if (open == std::string::npos) {
        return text;
    }

    size_t start = open + fence.size();
    if (text.compare(start, 4, "json") == 0) {
        start += 4;
    }

    size_t close = text.find(fence, start);
    if (close == std::string::npos) {
        return text;
    }

    return StringUtils::trim(text.substr(start, close - start));
}

Operation PlanParser::operationFromJson(const nlohmann::json& object) {
    if (!object.is_object()) {
        return UnrecognizedOp{};
    }

    std::string name;
    auto opIt = object.find("operation");
    if (opIt != object.end() && opIt->is_string()) {
        name = opIt->get<std::string>();
    }

    std::map<std::string, std::string> parameters;
    auto paramIt = object.find("parameters");
    if (paramIt != object.end() && paramIt->is_object()) {
        for (auto it = paramIt->begin(); it != paramIt->end(); ++it) {
            parameters[it.key()] = parameterText(it.value());
        }
    }

    return OperationRegistry::build(name, parameters);
}

Result<Plan> PlanParser::fromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Error::parseError("plan must be a JSON object");
    }

    Plan plan;

    auto multiIt = document.find("has_multiple_operations");
    if (multiIt != document.end() && isTruthy(*multiIt)) {
        auto opsIt = document.find("operations");
        if (opsIt == document.end() || !opsIt->is_array() || opsIt->empty()) {
            return Error(ErrorCode::PLAN_NO_OPERATIONS, "No valid operations found in the command.");
        }

        for (const auto& item : *opsIt) {
            plan.push_back(operationFromJson(item));
        }
    } else {
        plan.push_back(operationFromJson(document));
    }

    LOG_DEBUG(LogCategory::Plan, "parse", "Decoded plan with " + std::to_string(plan.size()) + " step(s)");
    return plan;
}

Result<Plan> PlanParser::parse(const std::string& text) {
    const std::string cleaned = stripCodeFences(text);

    nlohmann::json document = nlohmann::json::parse(cleaned, nullptr, false);
    if (document.is_discarded()) {
        LogManager::instance().log(LogLevel::Warning, LogCategory::Plan, "parse",
                                   "Could not parse plan JSON", text);
        return Error::parseError("response is not valid JSON").withDetails(text);
    }

    return fromJson(document);
}

} // namespace FileCommander
