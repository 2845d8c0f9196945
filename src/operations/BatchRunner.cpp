#include "operations/BatchRunner.h"
#include "core/LogManager.h"

#include <algorithm>
#include <utility>

namespace FileCommander {

BatchRunner::BatchRunner(OperationRegistry& registry)
    : m_registry(registry) {
}

std::vector<StepResult> BatchRunner::run(const Plan& plan) {
    std::vector<StepResult> results;
    results.reserve(plan.size());

    LOG_INFO(LogCategory::Plan, "run", "Running plan with " + std::to_string(plan.size()) + " step(s)");

    for (size_t i = 0; i < plan.size(); ++i) {
        StepResult result = m_registry.execute(plan[i]);

        if (!result.succeeded) {
            LogManager::instance().log(LogLevel::Warning, LogCategory::Plan, "run",
                "Step " + std::to_string(i + 1) + " failed: " + result.message);
        }

        if (m_stepCallback) {
            m_stepCallback(i + 1, plan[i], result);
        }
        results.push_back(std::move(result));
    }

    return results;
}

bool BatchRunner::allSucceeded(const std::vector<StepResult>& results) {
    return std::all_of(results.begin(), results.end(),
                       [](const StepResult& r) { return r.succeeded; });
}

} // namespace FileCommander
