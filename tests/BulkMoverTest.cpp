#include "operations/BulkMover.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

namespace fs = std::filesystem;

using namespace FileCommander;
using FileCommander::Testing::TempDir;
using FileCommander::Testing::writeFile;
using FileCommander::Testing::readFile;

class BulkMoverTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::create_directories(src());
        fs::create_directories(dst());
    }

    fs::path src() const { return m_dir / "src"; }
    fs::path dst() const { return m_dir / "dst"; }

    TempDir m_dir;
    BulkMover m_mover;
};

TEST_F(BulkMoverTest, MovesFilesAndSkipsCollisions) {
    writeFile(src() / "a.txt", "a");
    writeFile(src() / "b.txt", "new b");
    writeFile(dst() / "b.txt", "old b");

    BulkMoveResult result = m_mover.moveAll(src().string(), dst().string());

    EXPECT_TRUE(result.step.succeeded);
    EXPECT_EQ(result.moved, 1);
    EXPECT_EQ(result.skipped, 1);
    EXPECT_EQ(result.step.message,
              "Moved 1 files from " + src().string() + " to " + dst().string() +
              "\nSkipped 1 files that already exist in the destination.");

    EXPECT_EQ(readFile(dst() / "a.txt"), "a");
    EXPECT_EQ(readFile(dst() / "b.txt"), "old b");
    EXPECT_FALSE(fs::exists(src() / "a.txt"));
    EXPECT_EQ(readFile(src() / "b.txt"), "new b");
}

TEST_F(BulkMoverTest, SubdirectoriesStayBehind) {
    writeFile(src() / "top.txt");
    writeFile(src() / "nested" / "deep.txt");

    BulkMoveResult result = m_mover.moveAll(src().string(), dst().string());

    EXPECT_EQ(result.moved, 1);
    EXPECT_EQ(result.step.message, "Moved 1 files from " + src().string() + " to " + dst().string());
    EXPECT_TRUE(fs::exists(src() / "nested" / "deep.txt"));
    EXPECT_FALSE(fs::exists(dst() / "nested"));
}

TEST_F(BulkMoverTest, EmptySourceIsNotAnError) {
    fs::create_directories(src() / "only_a_dir");

    BulkMoveResult result = m_mover.moveAll(src().string(), dst().string());
    EXPECT_TRUE(result.step.succeeded);
    EXPECT_EQ(result.step.code, ErrorCode::SEARCH_NO_FILES);
    EXPECT_EQ(result.step.message, "No files found in the source directory: " + src().string());
}

TEST_F(BulkMoverTest, ValidatesBothDirectories) {
    std::string missing = (m_dir / "missing").string();
    writeFile(m_dir / "plain.txt");
    std::string plain = (m_dir / "plain.txt").string();

    BulkMoveResult r1 = m_mover.moveAll(missing, dst().string());
    EXPECT_FALSE(r1.step.succeeded);
    EXPECT_EQ(r1.step.code, ErrorCode::FS_SOURCE_MISSING);
    EXPECT_EQ(r1.step.message, "Source directory does not exist: " + missing);

    BulkMoveResult r2 = m_mover.moveAll(plain, dst().string());
    EXPECT_EQ(r2.step.code, ErrorCode::FS_NOT_A_DIRECTORY);
    EXPECT_EQ(r2.step.message, "Source is not a directory: " + plain);

    BulkMoveResult r3 = m_mover.moveAll(src().string(), missing);
    EXPECT_FALSE(r3.step.succeeded);
    EXPECT_EQ(r3.step.code, ErrorCode::FS_DESTINATION_MISSING);
    EXPECT_EQ(r3.step.message, "Destination directory does not exist: " + missing);

    BulkMoveResult r4 = m_mover.moveAll(src().string(), plain);
    EXPECT_EQ(r4.step.code, ErrorCode::FS_NOT_A_DIRECTORY);
    EXPECT_EQ(r4.step.message, "Destination is not a directory: " + plain);
}

TEST_F(BulkMoverTest, ReportsProgressInOrder) {
    writeFile(src() / "c.txt");
    writeFile(src() / "a.txt");
    writeFile(src() / "b.txt");

    std::vector<BulkMoveProgress> seen;
    m_mover.setProgressCallback([&](const BulkMoveProgress& p) { seen.push_back(p); });

    BulkMoveResult result = m_mover.moveAll(src().string(), dst().string());
    EXPECT_EQ(result.moved, 3);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].fileName, "a.txt");
    EXPECT_EQ(seen[0].index, 1u);
    EXPECT_EQ(seen[2].fileName, "c.txt");
    EXPECT_EQ(seen[2].total, 3u);
}
