#ifndef FILE_COMMANDER_BATCH_RUNNER_H
#define FILE_COMMANDER_BATCH_RUNNER_H

#include "operations/OperationRegistry.h"
#include <vector>
#include <functional>

namespace FileCommander {

/**
 * Called after each step with its 1-based index
 */
using StepCallback = std::function<void(size_t index, const Operation& operation,
                                        const StepResult& result)>;

/**
 * Runs a plan step by step.
 *
 * Steps execute strictly in order and a failed step never stops the plan;
 * there is no rollback.
 */
class BatchRunner {
public:
    explicit BatchRunner(OperationRegistry& registry);

    /**
     * @param plan Operations to run
     * @return One result per operation, in plan order
     */
    std::vector<StepResult> run(const Plan& plan);

    void setStepCallback(StepCallback callback) { m_stepCallback = callback; }

    static bool allSucceeded(const std::vector<StepResult>& results);

private:
    OperationRegistry& m_registry;
    StepCallback m_stepCallback;
};

} // namespace FileCommander

#endif // FILE_COMMANDER_BATCH_RUNNER_H
