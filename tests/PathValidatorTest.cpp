#include "core/PathValidator.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

using namespace FileCommander;
using FileCommander::Testing::TempDir;
using FileCommander::Testing::writeFile;
using FileCommander::Testing::readFile;

TEST(PathValidatorTest, Names) {
    EXPECT_TRUE(PathValidator::isValidName("reports"));
    EXPECT_TRUE(PathValidator::isValidName("my file.txt"));
    EXPECT_FALSE(PathValidator::isValidName(""));
    EXPECT_FALSE(PathValidator::isValidName("   "));
    EXPECT_FALSE(PathValidator::isValidName(std::string("bad\0name", 8)));
}

TEST(PathValidatorTest, NormalizeCollapsesDotSegments) {
    EXPECT_EQ(PathValidator::normalize("/a/./b/../c"), "/a/c");
    EXPECT_EQ(PathValidator::normalize("/a/b/"), "/a/b");
    EXPECT_EQ(PathValidator::normalize("/.."), "/");
    EXPECT_EQ(PathValidator::normalize("../x"), "../x");
    EXPECT_EQ(PathValidator::normalize("a/.."), ".");
    EXPECT_EQ(PathValidator::normalize(""), ".");
}

TEST(PathValidatorTest, JoinNormalizes) {
    EXPECT_EQ(PathValidator::join("/home/user", "notes"), "/home/user/notes");
    EXPECT_EQ(PathValidator::join("/home/user", "../other"), "/home/other");
    EXPECT_EQ(PathValidator::join("/home/user", ""), "/home/user");
}

TEST(PathValidatorTest, BaseName) {
    EXPECT_EQ(PathValidator::baseName("/a/b/file.txt"), "file.txt");
    EXPECT_EQ(PathValidator::baseName("file.txt"), "file.txt");
}

TEST(PathValidatorTest, MoveSafeRenamesFilesAndDirectories) {
    TempDir dir;
    writeFile(dir / "src" / "inner.txt", "payload");

    std::error_code ec;
    ASSERT_TRUE(PathValidator::moveSafe(dir / "src", dir / "dst", ec)) << ec.message();
    EXPECT_FALSE(std::filesystem::exists(dir / "src"));
    EXPECT_EQ(readFile(dir / "dst" / "inner.txt"), "payload");
}

TEST(PathValidatorTest, MoveSafeReportsMissingSource) {
    TempDir dir;
    std::error_code ec;
    EXPECT_FALSE(PathValidator::moveSafe(dir / "absent", dir / "dst", ec));
    EXPECT_TRUE(ec);
}
