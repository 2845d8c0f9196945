#include "interpreter/PlanParser.h"

#include <gtest/gtest.h>

using namespace FileCommander;

TEST(PlanParserTest, SingleOperation) {
    Result<Plan> plan = PlanParser::parse(
        R"({"operation": "create_folder", "parameters": {"folder_name": "reports", "location": "Desktop"}})");

    ASSERT_TRUE(plan.isOk()) << plan.error().toString();
    ASSERT_EQ(plan.value().size(), 1u);
    ASSERT_TRUE(std::holds_alternative<CreateFolderOp>(plan.value()[0]));
    const CreateFolderOp& op = std::get<CreateFolderOp>(plan.value()[0]);
    EXPECT_EQ(op.folderName, "reports");
    EXPECT_EQ(op.location, "Desktop");
}

TEST(PlanParserTest, MultipleOperationsKeepOrder) {
    Result<Plan> plan = PlanParser::parse(R"({
        "has_multiple_operations": true,
        "operations": [
            {"operation": "create_folder", "parameters": {"folder_name": "movies", "location": "Desktop"}},
            {"operation": "create_folder", "parameters": {"folder_name": "hollywood", "location": "Desktop/movies"}},
            {"operation": "play_movie", "parameters": {"movie_name": "Inception"}}
        ]})");

    ASSERT_TRUE(plan.isOk());
    ASSERT_EQ(plan.value().size(), 3u);
    EXPECT_EQ(std::get<CreateFolderOp>(plan.value()[0]).folderName, "movies");
    EXPECT_EQ(std::get<CreateFolderOp>(plan.value()[1]).location, "Desktop/movies");
    EXPECT_EQ(std::get<PlayBestMatchOp>(plan.value()[2]).movieName, "Inception");
}

TEST(PlanParserTest, CodeFencesAreStripped) {
    std::string reply =
        "Here is the plan:\n"
        "```json\n"
        "{\"operation\": \"open_file_explorer\", \"parameters\": {\"location\": \"Downloads\"}}\n"
        "```\n";

    Result<Plan> plan = PlanParser::parse(reply);
    ASSERT_TRUE(plan.isOk());
    EXPECT_EQ(std::get<OpenLocationOp>(plan.value()[0]).location, "Downloads");

    EXPECT_EQ(PlanParser::stripCodeFences("```\n{}\n```"), "{}");
    EXPECT_EQ(PlanParser::stripCodeFences("{\"a\": 1}"), "{\"a\": 1}");
}

TEST(PlanParserTest, UnknownKindBecomesUnrecognized) {
    Result<Plan> plan = PlanParser::parse(R"({"operation": "delete_everything", "parameters": {}})");
    ASSERT_TRUE(plan.isOk());
    ASSERT_TRUE(std::holds_alternative<UnrecognizedOp>(plan.value()[0]));
    EXPECT_EQ(std::get<UnrecognizedOp>(plan.value()[0]).rawKind, "delete_everything");
}

TEST(PlanParserTest, MissingOperationFieldIsUnrecognized) {
    Result<Plan> plan = PlanParser::parse(R"({"parameters": {"folder_name": "x"}})");
    ASSERT_TRUE(plan.isOk());
    EXPECT_TRUE(std::holds_alternative<UnrecognizedOp>(plan.value()[0]));
}

TEST(PlanParserTest, MissingParametersBecomeEmpty) {
    Result<Plan> plan = PlanParser::parse(R"({"operation": "create_file"})");
    ASSERT_TRUE(plan.isOk());
    const CreateFileOp& op = std::get<CreateFileOp>(plan.value()[0]);
    EXPECT_EQ(op.fileName, "");
    EXPECT_EQ(op.location, "");
    EXPECT_EQ(op.content, "");
}

TEST(PlanParserTest, NonStringParametersAreStringified) {
    Result<Plan> plan = PlanParser::parse(
        R"({"operation": "create_file", "parameters": {"file_name": "n.txt", "content": 42, "location": null}})");
    ASSERT_TRUE(plan.isOk());
    const CreateFileOp& op = std::get<CreateFileOp>(plan.value()[0]);
    EXPECT_EQ(op.content, "42");
    EXPECT_EQ(op.location, "");
}

TEST(PlanParserTest, EmptyOperationsListIsAnError) {
    Result<Plan> plan = PlanParser::parse(R"({"has_multiple_operations": true, "operations": []})");
    ASSERT_TRUE(plan.isError());
    EXPECT_EQ(plan.error().code(), ErrorCode::PLAN_NO_OPERATIONS);
    EXPECT_EQ(plan.error().message(), "No valid operations found in the command.");

    Result<Plan> missing = PlanParser::parse(R"({"has_multiple_operations": true})");
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.error().code(), ErrorCode::PLAN_NO_OPERATIONS);
}

TEST(PlanParserTest, FalseMultipleFlagReadsSingleShape) {
    Result<Plan> plan = PlanParser::parse(
        R"({"has_multiple_operations": false, "operation": "search_files", "parameters": {"search_term": "budget"}})");
    ASSERT_TRUE(plan.isOk());
    EXPECT_EQ(std::get<SearchOp>(plan.value()[0]).searchTerm, "budget");
}

TEST(PlanParserTest, InvalidJsonIsParseError) {
    Result<Plan> plan = PlanParser::parse("I am not sure what you mean.");
    ASSERT_TRUE(plan.isError());
    EXPECT_EQ(plan.error().code(), ErrorCode::PLAN_PARSE_ERROR);
    EXPECT_EQ(plan.error().details(), "I am not sure what you mean.");

    Result<Plan> array = PlanParser::parse("[1, 2]");
    ASSERT_TRUE(array.isError());
    EXPECT_EQ(array.error().code(), ErrorCode::PLAN_PARSE_ERROR);
}

TEST(PlanParserTest, NonObjectEntryInListIsUnrecognized) {
    Result<Plan> plan = PlanParser::parse(
        R"({"has_multiple_operations": true, "operations": ["oops", {"operation": "play_movie", "parameters": {"movie_name": "Up"}}]})");
    ASSERT_TRUE(plan.isOk());
    ASSERT_EQ(plan.value().size(), 2u);
    EXPECT_TRUE(std::holds_alternative<UnrecognizedOp>(plan.value()[0]));
    EXPECT_TRUE(std::holds_alternative<PlayBestMatchOp>(plan.value()[1]));
}

TEST(PlanParserTest, LargeFencedContentParses) {
    const std::string content(200 * 1024, 'x');
    std::string reply =
        "```json\n"
        "{\"operation\": \"create_file\", \"parameters\": {\"file_name\": \"big.txt\", \"content\": \"" +
        content + "\"}}\n"
        "```\n";

    Result<Plan> plan = PlanParser::parse(reply);
    ASSERT_TRUE(plan.isOk()) << plan.error().toString();
    const CreateFileOp& op = std::get<CreateFileOp>(plan.value()[0]);
    EXPECT_EQ(op.fileName, "big.txt");
    EXPECT_EQ(op.content.size(), content.size());
}

TEST(PlanParserTest, UnclosedFenceLeavesTextAlone) {
    EXPECT_EQ(PlanParser::stripCodeFences("```json {\"a\": 1}"), "```json {\"a\": 1}");
    EXPECT_EQ(PlanParser::stripCodeFences("before ```json\n{\"a\": 1}\n``` after"), "{\"a\": 1}");
}
