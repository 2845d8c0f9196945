#include "operations/FileOperations.h"
#include "locations/PlatformLocations.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

using namespace FileCommander;
using FileCommander::Testing::TempDir;
using FileCommander::Testing::FakeLauncher;
using FileCommander::Testing::writeFile;
using FileCommander::Testing::readFile;

class FileOperationsTest : public ::testing::Test {
protected:
    FileOperationsTest()
        : m_resolver(AliasTable::fromSeed(PlatformLocations::fromHome(m_home.str())))
        , m_ops(m_resolver, m_launcher, m_home.str()) {
        fs::create_directories(m_home / "Desktop");
        fs::create_directories(m_home / "Documents");
        fs::create_directories(m_home / "Downloads");
    }

    TempDir m_home;
    FakeLauncher m_launcher;
    LocationResolver m_resolver;
    FileOperations m_ops;
};

// ==================== create_folder ====================

TEST_F(FileOperationsTest, CreateFolderOnAlias) {
    StepResult result = m_ops.createFolder("reports", "Desktop");
    EXPECT_TRUE(result.succeeded);
    EXPECT_EQ(result.message, "Created folder: " + (m_home / "Desktop" / "reports").string());
    EXPECT_TRUE(fs::is_directory(m_home / "Desktop" / "reports"));
}

TEST_F(FileOperationsTest, CreateFolderDefaultsToCurrentPath) {
    StepResult result = m_ops.createFolder("here", "");
    EXPECT_TRUE(result.succeeded);
    EXPECT_TRUE(fs::is_directory(m_home / "here"));
}

TEST_F(FileOperationsTest, CreateFolderCreatesMissingParents) {
    StepResult result = m_ops.createFolder("leaf", "Desktop/a/b");
    EXPECT_TRUE(result.succeeded) << result.message;
    EXPECT_TRUE(fs::is_directory(m_home / "Desktop" / "a" / "b" / "leaf"));
}

TEST_F(FileOperationsTest, CreateFolderThatExistsFailsAndKeepsContents) {
    writeFile(m_home / "Desktop" / "reports" / "q1.txt", "numbers");

    StepResult result = m_ops.createFolder("reports", "Desktop");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.code, ErrorCode::FS_ALREADY_EXISTS);
    EXPECT_EQ(result.message, "Folder already exists: " + (m_home / "Desktop" / "reports").string());
    EXPECT_EQ(readFile(m_home / "Desktop" / "reports" / "q1.txt"), "numbers");
}

TEST_F(FileOperationsTest, CreateFolderRejectsBlankName) {
    StepResult result = m_ops.createFolder("  ", "Desktop");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.code, ErrorCode::VALIDATION_INVALID_INPUT);
}

// ==================== create_file ====================

TEST_F(FileOperationsTest, CreateFileWritesContent) {
    StepResult result = m_ops.createFile("todo.txt", "Documents", "buy milk");
    EXPECT_TRUE(result.succeeded);
    EXPECT_EQ(result.message, "Created file: " + (m_home / "Documents" / "todo.txt").string());
    EXPECT_EQ(readFile(m_home / "Documents" / "todo.txt"), "buy milk");
}

TEST_F(FileOperationsTest, CreateFileWithoutContentIsEmpty) {
    ASSERT_TRUE(m_ops.createFile("empty.txt", "Documents", "").succeeded);
    EXPECT_EQ(fs::file_size(m_home / "Documents" / "empty.txt"), 0u);
}

TEST_F(FileOperationsTest, CreateFileLeavesExistingFileAlone) {
    writeFile(m_home / "Documents" / "todo.txt", "original");

    StepResult result = m_ops.createFile("todo.txt", "Documents", "new text");
    EXPECT_TRUE(result.succeeded);
    EXPECT_EQ(result.code, ErrorCode::FS_ALREADY_EXISTS);
    EXPECT_EQ(result.message, "File already exists: " + (m_home / "Documents" / "todo.txt").string());
    EXPECT_EQ(readFile(m_home / "Documents" / "todo.txt"), "original");
}

TEST_F(FileOperationsTest, CreateFileInMissingDirectoryFails) {
    StepResult result = m_ops.createFile("x.txt", "no/such/dir", "");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.message.rfind("Error creating file", 0), 0u) << result.message;
}

// ==================== rename_item ====================

TEST_F(FileOperationsTest, RenameInLocation) {
    fs::create_directories(m_home / "Desktop" / "old_stuff");

    StepResult result = m_ops.renameItem("old_stuff", "archive", "Desktop");
    EXPECT_TRUE(result.succeeded);
    EXPECT_EQ(result.message, "Renamed from " + (m_home / "Desktop" / "old_stuff").string() +
                              " to " + (m_home / "Desktop" / "archive").string());
    EXPECT_TRUE(fs::is_directory(m_home / "Desktop" / "archive"));
    EXPECT_FALSE(fs::exists(m_home / "Desktop" / "old_stuff"));
}

TEST_F(FileOperationsTest, RenameMissingSourceFails) {
    StepResult result = m_ops.renameItem("ghost", "archive", "Desktop");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.code, ErrorCode::FS_SOURCE_MISSING);
    EXPECT_EQ(result.message, "Source does not exist: " + (m_home / "Desktop" / "ghost").string());
}

TEST_F(FileOperationsTest, RenameOntoExistingFails) {
    writeFile(m_home / "Desktop" / "a.txt", "a");
    writeFile(m_home / "Desktop" / "b.txt", "b");

    StepResult result = m_ops.renameItem("a.txt", "b.txt", "Desktop");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.code, ErrorCode::FS_DESTINATION_EXISTS);
    EXPECT_EQ(readFile(m_home / "Desktop" / "b.txt"), "b");
}

// ==================== move_item ====================

TEST_F(FileOperationsTest, MoveIntoExistingDirectoryKeepsName) {
    writeFile(m_home / "Downloads" / "document.txt", "text");

    StepResult result = m_ops.moveItem("Downloads/document.txt", "Documents");
    EXPECT_TRUE(result.succeeded) << result.message;
    EXPECT_EQ(result.message, "Moved from " + (m_home / "Downloads" / "document.txt").string() +
                              " to " + (m_home / "Documents" / "document.txt").string());
    EXPECT_EQ(readFile(m_home / "Documents" / "document.txt"), "text");
    EXPECT_FALSE(fs::exists(m_home / "Downloads" / "document.txt"));
}

TEST_F(FileOperationsTest, MoveToNewName) {
    writeFile(m_home / "draft.txt", "d");

    StepResult result = m_ops.moveItem("draft.txt", "Documents/final.txt");
    EXPECT_TRUE(result.succeeded);
    EXPECT_TRUE(fs::exists(m_home / "Documents" / "final.txt"));
}

TEST_F(FileOperationsTest, MoveRefusesToOverwrite) {
    writeFile(m_home / "Downloads" / "document.txt", "new");
    writeFile(m_home / "Documents" / "document.txt", "old");

    StepResult result = m_ops.moveItem("Downloads/document.txt", "Documents");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.code, ErrorCode::FS_DESTINATION_EXISTS);
    EXPECT_EQ(readFile(m_home / "Documents" / "document.txt"), "old");
    EXPECT_TRUE(fs::exists(m_home / "Downloads" / "document.txt"));
}

TEST_F(FileOperationsTest, MoveMissingSourceFails) {
    StepResult result = m_ops.moveItem("nothing.txt", "Documents");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.code, ErrorCode::FS_SOURCE_MISSING);
}

TEST_F(FileOperationsTest, MoveWithBlankSourceIsRejected) {
    StepResult result = m_ops.moveItem("", "Documents");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.code, ErrorCode::VALIDATION_MISSING_FIELD);
    EXPECT_TRUE(fs::is_directory(m_home / "Desktop"));
}

// ==================== open_file_explorer ====================

TEST_F(FileOperationsTest, OpenLocationUsesLauncher) {
    StepResult result = m_ops.openLocation("Downloads");
    EXPECT_TRUE(result.succeeded);
    EXPECT_EQ(result.message, "Opened file explorer at: " + (m_home / "Downloads").string());
    ASSERT_EQ(m_launcher.openedLocations.size(), 1u);
    EXPECT_EQ(m_launcher.openedLocations[0], (m_home / "Downloads").string());
}

TEST_F(FileOperationsTest, OpenMissingLocationFailsWithoutLaunching) {
    StepResult result = m_ops.openLocation("Videos");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.message, "Location does not exist: " + (m_home / "Videos").string());
    EXPECT_TRUE(m_launcher.openedLocations.empty());
}

TEST_F(FileOperationsTest, LauncherFailureIsReported) {
    m_launcher.nextResult = Error(ErrorCode::FS_IO_FAILURE, "spawn failed");
    StepResult result = m_ops.openLocation("Desktop");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.code, ErrorCode::FS_IO_FAILURE);
}

// ==================== search_files / play_movie ====================

TEST_F(FileOperationsTest, SearchResolvesLocation) {
    writeFile(m_home / "Documents" / "Budget2024.xlsx");

    StepResult result = m_ops.searchFiles("budget", "documents");
    EXPECT_TRUE(result.succeeded);
    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_EQ(result.rows[0].fileName, "Budget2024.xlsx");
}

TEST_F(FileOperationsTest, SearchNeedsTerm) {
    StepResult result = m_ops.searchFiles("", "documents");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.message, "No search term specified.");
}

TEST_F(FileOperationsTest, PlayBestMatchOpensTheMovie) {
    writeFile(m_home / "Movies" / "Inception (2010).mkv");
    writeFile(m_home / "Movies" / "Interstellar.mp4");

    StepResult result = m_ops.playBestMatch("inception");
    EXPECT_TRUE(result.succeeded);
    EXPECT_EQ(result.message, "Playing movie: Inception (2010).mkv");
    ASSERT_EQ(m_launcher.openedFiles.size(), 1u);
    EXPECT_EQ(m_launcher.openedFiles[0], (m_home / "Movies" / "Inception (2010).mkv").string());
}

TEST_F(FileOperationsTest, PlayWithoutMatch) {
    writeFile(m_home / "Movies" / "Interstellar.mp4");

    StepResult result = m_ops.playBestMatch("Casablanca");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.code, ErrorCode::SEARCH_NO_MATCH);
    EXPECT_EQ(result.message, "No movie found with name 'Casablanca'");
    EXPECT_TRUE(m_launcher.openedFiles.empty());
}

TEST_F(FileOperationsTest, PlayWithoutMoviesDirectory) {
    StepResult result = m_ops.playBestMatch("Inception");
    EXPECT_FALSE(result.succeeded);
    EXPECT_EQ(result.message, "Movies directory does not exist: " + (m_home / "Movies").string());
}
