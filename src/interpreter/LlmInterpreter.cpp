#include "interpreter/LlmInterpreter.h"
#include "interpreter/PlanParser.h"
#include "operations/OperationRegistry.h"
#include "core/LogManager.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <cstdlib>

namespace FileCommander {

// ==================== CURL Callback ====================

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// ==================== Construction ====================

LlmInterpreter::LlmInterpreter(const ConfigManager::InterpreterConfig& config, const std::string& apiKey)
    : m_config(config)
    , m_apiKey(apiKey) {
}

LlmInterpreter LlmInterpreter::fromConfig(const ConfigManager& config) {
    ConfigManager::InterpreterConfig interp = config.getInterpreterConfig();
    const char* key = std::getenv(interp.apiKeyEnv.c_str());
    return LlmInterpreter(interp, key ? key : "");
}

// ==================== Prompt ====================

std::string LlmInterpreter::buildSystemPrompt() {
    std::ostringstream ss;
    ss << "You are a file system command interpreter. Parse the natural language command "
          "into a structured format.\n\n"
          "Identify the operation(s) and parameters. The possible operations are:\n";

    int n = 1;
    for (const auto& spec : OperationRegistry::catalog()) {
        ss << n++ << ". " << spec.name << " - Parameters: ";
        for (size_t i = 0; i < spec.parameters.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << spec.parameters[i].name;
            if (spec.parameters[i].optional) ss << " (optional)";
        }
        ss << "\n";
    }

    ss << "\nThe command may contain several operations to perform in sequence.\n"
          "For a single operation, output a JSON object with the operation and parameters:\n"
          "{\"operation\": \"create_folder\", \"parameters\": {\"folder_name\": \"reports\", "
          "\"location\": \"Desktop\"}}\n\n"
          "For several sequential operations, output a JSON object with an \"operations\" array:\n"
          "{\"has_multiple_operations\": true, \"operations\": [\n"
          "  {\"operation\": \"create_folder\", \"parameters\": {\"folder_name\": \"movies\", "
          "\"location\": \"Desktop\"}},\n"
          "  {\"operation\": \"create_folder\", \"parameters\": {\"folder_name\": \"hollywood\", "
          "\"location\": \"Desktop/movies\"}}\n"
          "]}\n\n"
          "If the command is unclear, return:\n"
          "{\"operation\": \"unknown\", \"parameters\": {}}\n\n"
          "Always return only the JSON, without markdown formatting or code blocks.\n";
    return ss.str();
}

std::string LlmInterpreter::buildRequestBody(const std::string& model, double temperature,
                                             const std::string& systemPrompt,
                                             const std::string& command) {
    nlohmann::json body = {
        {"model", model},
        {"temperature", temperature},
        {"messages", nlohmann::json::array({
            {{"role", "system"}, {"content", systemPrompt}},
            {{"role", "user"}, {"content", "Command: " + command}}
        })}
    };
    return body.dump();
}

Result<std::string> LlmInterpreter::extractContent(const std::string& responseBody) {
    nlohmann::json response = nlohmann::json::parse(responseBody, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return Error(ErrorCode::INTERPRETER_BAD_RESPONSE, "Response is not JSON", responseBody);
    }

    auto errIt = response.find("error");
    if (errIt != response.end() && errIt->is_object()) {
        std::string message = errIt->value("message", std::string("unknown error"));
        return Error(ErrorCode::INTERPRETER_REQUEST_FAILED, "Interpreter service error", message);
    }

    auto choices = response.find("choices");
    if (choices == response.end() || !choices->is_array() || choices->empty()) {
        return Error(ErrorCode::INTERPRETER_BAD_RESPONSE, "Response has no choices");
    }

    const nlohmann::json& first = (*choices)[0];
    if (!first.is_object() || !first.contains("message") || !first["message"].is_object()) {
        return Error(ErrorCode::INTERPRETER_BAD_RESPONSE, "Response choice has no message");
    }

    const nlohmann::json& message = first["message"];
    auto content = message.find("content");
    if (content == message.end() || !content->is_string()) {
        return Error(ErrorCode::INTERPRETER_BAD_RESPONSE, "Response message has no content");
    }

    return content->get<std::string>();
}

// ==================== HTTP ====================

LlmInterpreter::HttpResponse LlmInterpreter::httpPost(const std::string& url, const std::string& body) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        return response;
    }

    std::string responseBody;
    struct curl_slist* headers = nullptr;

    std::string authHeader = "Authorization: Bearer " + m_apiKey;
    headers = curl_slist_append(headers, authHeader.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(m_config.timeout));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
    } else {
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        response.body = responseBody;
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    return response;
}

// ==================== Interpretation ====================

Result<Plan> LlmInterpreter::interpret(const std::string& command) {
    if (m_apiKey.empty()) {
        return Error(ErrorCode::INTERPRETER_NOT_CONFIGURED,
                     m_config.apiKeyEnv + " not set in environment variables.",
                     "Add your API key to the .env file");
    }

    LOG_INFO(LogCategory::Interpreter, "interpret", "Interpreting command with " + m_config.model);

    std::string body = buildRequestBody(m_config.model, m_config.temperature,
                                        buildSystemPrompt(), command);
    HttpResponse response = httpPost(m_config.endpoint, body);

    if (!response.error.empty()) {
        LogManager::instance().log(LogLevel::Error, LogCategory::Interpreter, "interpret",
                                   "Request failed", response.error);
        return Error(ErrorCode::INTERPRETER_REQUEST_FAILED, "Interpreter request failed", response.error);
    }

    if (response.statusCode < 200 || response.statusCode >= 300) {
        LogManager::instance().log(LogLevel::Error, LogCategory::Interpreter, "interpret",
                                   "HTTP " + std::to_string(response.statusCode), response.body);
        return Error(ErrorCode::INTERPRETER_REQUEST_FAILED,
                     "Interpreter returned HTTP " + std::to_string(response.statusCode),
                     response.body);
    }

    Result<std::string> content = extractContent(response.body);
    if (content.isError()) {
        LogManager::instance().log(LogLevel::Error, LogCategory::Interpreter, "interpret",
                                   content.error().message(), content.error().details());
        return content.error();
    }

    LOG_DEBUG(LogCategory::Interpreter, "interpret", "Reply: " + content.value());
    return PlanParser::parse(content.value());
}

} // namespace FileCommander
