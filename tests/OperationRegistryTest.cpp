#include "operations/OperationRegistry.h"
#include "locations/PlatformLocations.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

using namespace FileCommander;
using FileCommander::Testing::TempDir;
using FileCommander::Testing::FakeLauncher;

TEST(OperationRegistryTest, CatalogCoversEveryKind) {
    const auto& catalog = OperationRegistry::catalog();
    ASSERT_EQ(catalog.size(), 8u);

    std::vector<std::string> names;
    for (const auto& spec : catalog) {
        names.push_back(spec.name);
        EXPECT_EQ(OperationRegistry::kindName(spec.kind), spec.name);
    }
    std::vector<std::string> expected = {
        "create_folder", "create_file", "rename_item", "move_item",
        "move_all_files", "open_file_explorer", "search_files", "play_movie"};
    EXPECT_EQ(names, expected);
}

TEST(OperationRegistryTest, OptionalParametersAreMarked) {
    const OperationSpec* spec = OperationRegistry::findSpec("create_file");
    ASSERT_NE(spec, nullptr);
    ASSERT_EQ(spec->parameters.size(), 3u);
    EXPECT_FALSE(spec->parameters[0].optional);   // file_name
    EXPECT_TRUE(spec->parameters[1].optional);    // location
    EXPECT_TRUE(spec->parameters[2].optional);    // content

    EXPECT_EQ(OperationRegistry::findSpec("delete_everything"), nullptr);
}

TEST(OperationRegistryTest, BuildFillsMissingParametersWithEmpty) {
    Operation op = OperationRegistry::build("rename_item", {{"old_name", "a"}, {"new_name", "b"}});
    ASSERT_TRUE(std::holds_alternative<RenameOp>(op));
    const RenameOp& rename = std::get<RenameOp>(op);
    EXPECT_EQ(rename.oldName, "a");
    EXPECT_EQ(rename.newName, "b");
    EXPECT_EQ(rename.location, "");
    EXPECT_EQ(kindOf(op), OperationKind::Rename);
}

TEST(OperationRegistryTest, BuildUnknownNameIsUnrecognized) {
    Operation op = OperationRegistry::build("format_disk", {});
    ASSERT_TRUE(std::holds_alternative<UnrecognizedOp>(op));
    EXPECT_EQ(std::get<UnrecognizedOp>(op).rawKind, "format_disk");
    EXPECT_EQ(kindOf(op), OperationKind::Unrecognized);
}

class OperationDispatchTest : public ::testing::Test {
protected:
    OperationDispatchTest()
        : m_resolver(AliasTable::fromSeed(PlatformLocations::fromHome(m_home.str())))
        , m_ops(m_resolver, m_launcher, m_home.str())
        , m_registry(m_ops) {
    }

    TempDir m_home;
    FakeLauncher m_launcher;
    LocationResolver m_resolver;
    FileOperations m_ops;
    OperationRegistry m_registry;
};

TEST_F(OperationDispatchTest, UnrecognizedGivesFixedMessage) {
    StepResult result = m_registry.execute(UnrecognizedOp{"format_disk"});
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.code, ErrorCode::PLAN_UNRECOGNIZED_OPERATION);
    EXPECT_EQ(result.message, "Sorry, I couldn't understand that command. Please try again.");
}

TEST_F(OperationDispatchTest, DispatchesToHandler) {
    StepResult result = m_registry.execute(CreateFolderOp{"made", ""});
    EXPECT_TRUE(result.succeeded);
    EXPECT_TRUE(fs::is_directory(m_home / "made"));

    result = m_registry.execute(OpenLocationOp{""});
    EXPECT_TRUE(result.succeeded);
    ASSERT_EQ(m_launcher.openedLocations.size(), 1u);
    EXPECT_EQ(m_launcher.openedLocations[0], m_home.str());
}
