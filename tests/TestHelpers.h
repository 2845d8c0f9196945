#ifndef FILE_COMMANDER_TEST_HELPERS_H
#define FILE_COMMANDER_TEST_HELPERS_H

#include "core/Error.h"
#include "core/LogManager.h"
#include "platform/Launcher.h"
#include "interpreter/CommandInterpreter.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace FileCommander {
namespace Testing {

namespace fs = std::filesystem;

/**
 * Unique scratch directory, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = fs::temp_directory_path() /
                 ("filecommander_test_" + std::to_string(stamp) + "_" +
                  std::to_string(counter++));
        fs::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return m_path; }
    std::string str() const { return m_path.string(); }

    fs::path operator/(const std::string& name) const { return m_path / name; }

private:
    fs::path m_path;
};

inline void writeFile(const fs::path& path, const std::string& content = "") {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * Records launch requests instead of starting programs
 */
class FakeLauncher : public Launcher {
public:
    Result<void> openInFileManager(const std::string& path) override {
        openedLocations.push_back(path);
        return nextResult;
    }

    Result<void> openWithDefaultApplication(const std::string& path) override {
        openedFiles.push_back(path);
        return nextResult;
    }

    std::vector<std::string> openedLocations;
    std::vector<std::string> openedFiles;
    Result<void> nextResult;
};

/**
 * Returns a canned interpretation
 */
class FakeInterpreter : public CommandInterpreter {
public:
    explicit FakeInterpreter(Result<Plan> reply) : m_reply(std::move(reply)) {}

    Result<Plan> interpret(const std::string& command) override {
        lastCommand = command;
        return m_reply;
    }

    std::string lastCommand;

private:
    Result<Plan> m_reply;
};

/**
 * Sends log output of the whole test run to a scratch directory
 */
class QuietLogEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        LogManager& log = LogManager::instance();
        log.setLogDirectory((fs::temp_directory_path() / "filecommander_test_logs").string());
        log.setConsoleOutput(false);
        log.setMinLevel(LogLevel::Debug);
    }
};

} // namespace Testing
} // namespace FileCommander

#endif // FILE_COMMANDER_TEST_HELPERS_H
