#ifndef FILE_COMMANDER_LLM_INTERPRETER_H
#define FILE_COMMANDER_LLM_INTERPRETER_H

#include "interpreter/CommandInterpreter.h"
#include "core/ConfigManager.h"
#include <string>

namespace FileCommander {

/**
 * Interpreter backed by an OpenAI-compatible chat completions endpoint
 * (OpenRouter by default).
 *
 * The model is asked to answer with plan JSON only; its reply goes
 * through PlanParser.
 */
class LlmInterpreter : public CommandInterpreter {
public:
    /**
     * @param config Endpoint, model, timeout and temperature
     * @param apiKey Bearer token; empty means not configured
     */
    LlmInterpreter(const ConfigManager::InterpreterConfig& config, const std::string& apiKey);

    /**
     * Build from configuration, reading the key from the environment
     * variable named by interpreter.apiKeyEnv
     */
    static LlmInterpreter fromConfig(const ConfigManager& config);

    Result<Plan> interpret(const std::string& command) override;

    bool isConfigured() const { return !m_apiKey.empty(); }

    /**
     * Prompt describing every operation in the catalog
     */
    static std::string buildSystemPrompt();

    /**
     * Chat completions request body for one command
     */
    static std::string buildRequestBody(const std::string& model, double temperature,
                                        const std::string& systemPrompt,
                                        const std::string& command);

    /**
     * Pull choices[0].message.content out of a completions response
     */
    static Result<std::string> extractContent(const std::string& responseBody);

private:
    struct HttpResponse {
        int statusCode = 0;
        std::string body;
        std::string error;
    };

    ConfigManager::InterpreterConfig m_config;
    std::string m_apiKey;

    HttpResponse httpPost(const std::string& url, const std::string& body);
};

} // namespace FileCommander

#endif // FILE_COMMANDER_LLM_INTERPRETER_H
