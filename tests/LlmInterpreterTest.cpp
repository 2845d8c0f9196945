#include "interpreter/LlmInterpreter.h"
#include "operations/OperationRegistry.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cstdlib>

using namespace FileCommander;

namespace {

ConfigManager::InterpreterConfig testConfig() {
    ConfigManager::InterpreterConfig config;
    config.endpoint = "http://127.0.0.1:9/unused";
    config.model = "test/model";
    config.apiKeyEnv = "FC_TEST_API_KEY";
    config.timeout = 1;
    config.temperature = 0.0;
    return config;
}

} // anonymous namespace

TEST(LlmInterpreterTest, SystemPromptListsEveryOperation) {
    std::string prompt = LlmInterpreter::buildSystemPrompt();
    for (const auto& spec : OperationRegistry::catalog()) {
        EXPECT_NE(prompt.find(spec.name), std::string::npos) << spec.name;
    }
    EXPECT_NE(prompt.find("location (optional)"), std::string::npos);
    EXPECT_NE(prompt.find("has_multiple_operations"), std::string::npos);
}

TEST(LlmInterpreterTest, RequestBodyShape) {
    nlohmann::json body = nlohmann::json::parse(
        LlmInterpreter::buildRequestBody("test/model", 0.0, "SYSTEM", "Create folder x"));

    EXPECT_EQ(body["model"], "test/model");
    EXPECT_EQ(body["temperature"], 0.0);
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "system");
    EXPECT_EQ(body["messages"][0]["content"], "SYSTEM");
    EXPECT_EQ(body["messages"][1]["role"], "user");
    EXPECT_EQ(body["messages"][1]["content"], "Command: Create folder x");
}

TEST(LlmInterpreterTest, ExtractContentFromChoice) {
    Result<std::string> content = LlmInterpreter::extractContent(
        R"({"choices": [{"message": {"role": "assistant", "content": "{\"operation\": \"play_movie\"}"}}]})");
    ASSERT_TRUE(content.isOk());
    EXPECT_EQ(content.value(), "{\"operation\": \"play_movie\"}");
}

TEST(LlmInterpreterTest, ExtractContentErrors) {
    Result<std::string> serviceError =
        LlmInterpreter::extractContent(R"({"error": {"message": "rate limited"}})");
    ASSERT_TRUE(serviceError.isError());
    EXPECT_EQ(serviceError.error().code(), ErrorCode::INTERPRETER_REQUEST_FAILED);
    EXPECT_EQ(serviceError.error().details(), "rate limited");

    Result<std::string> noChoices = LlmInterpreter::extractContent(R"({"choices": []})");
    ASSERT_TRUE(noChoices.isError());
    EXPECT_EQ(noChoices.error().code(), ErrorCode::INTERPRETER_BAD_RESPONSE);

    Result<std::string> noContent =
        LlmInterpreter::extractContent(R"({"choices": [{"message": {"role": "assistant"}}]})");
    ASSERT_TRUE(noContent.isError());
    EXPECT_EQ(noContent.error().code(), ErrorCode::INTERPRETER_BAD_RESPONSE);

    Result<std::string> garbage = LlmInterpreter::extractContent("<html>");
    ASSERT_TRUE(garbage.isError());
    EXPECT_EQ(garbage.error().code(), ErrorCode::INTERPRETER_BAD_RESPONSE);
}

TEST(LlmInterpreterTest, MissingKeyIsNotConfigured) {
    LlmInterpreter interpreter(testConfig(), "");
    EXPECT_FALSE(interpreter.isConfigured());

    Result<Plan> plan = interpreter.interpret("Create folder x");
    ASSERT_TRUE(plan.isError());
    EXPECT_EQ(plan.error().code(), ErrorCode::INTERPRETER_NOT_CONFIGURED);
    EXPECT_EQ(plan.error().message(), "FC_TEST_API_KEY not set in environment variables.");
}

TEST(LlmInterpreterTest, FromConfigReadsNamedVariable) {
    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();
    config.setString("interpreter.apiKeyEnv", "FC_TEST_API_KEY");

    unsetenv("FC_TEST_API_KEY");
    EXPECT_FALSE(LlmInterpreter::fromConfig(config).isConfigured());

    setenv("FC_TEST_API_KEY", "sk-test", 1);
    EXPECT_TRUE(LlmInterpreter::fromConfig(config).isConfigured());

    unsetenv("FC_TEST_API_KEY");
    config.resetToDefaults();
}
