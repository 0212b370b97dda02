#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

#include "procguard/compositelogger.hpp"
#include "procguard/consolelogger.hpp"
#include "procguard/filelogger.hpp"

namespace fs = std::filesystem;

namespace {

// Временный каталог, удаляется вместе с содержимым
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() /
                ("procguard_logger_" +
                 std::to_string(
                     std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    fs::path path() const { return path_; }

private:
    fs::path path_;
};

std::string readAll(const fs::path& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

}  // namespace

TEST(LogLevelTest, ParsesNamesCaseInsensitive) {
    EXPECT_EQ(procguard::stringToLogLevel("debug"), procguard::LogLevel::LOG_DEBUG);
    EXPECT_EQ(procguard::stringToLogLevel("INFO"), procguard::LogLevel::LOG_INFO);
    EXPECT_EQ(procguard::stringToLogLevel("Warn"), procguard::LogLevel::LOG_WARNING);
    EXPECT_EQ(procguard::stringToLogLevel("error"), procguard::LogLevel::LOG_ERROR);
    EXPECT_EQ(procguard::stringToLogLevel("critical"),
              procguard::LogLevel::LOG_CRITICAL);
    EXPECT_THROW(procguard::stringToLogLevel("verbose"), std::invalid_argument);
}

TEST(LogLevelTest, LevelNames) {
    EXPECT_EQ(procguard::leveltoString(procguard::LogLevel::LOG_WARNING), "WARNING");
    EXPECT_EQ(procguard::leveltoString(procguard::LogLevel::LOG_CRITICAL),
              "CRITICAL");
}

TEST(TimeFormatterTest, RejectsEmptyFormat) {
    EXPECT_FALSE(procguard::TimeFormatter::setGlobalFormat(""));
}

TEST(TimeFormatterTest, UsesGlobalFormat) {
    ASSERT_TRUE(procguard::TimeFormatter::setGlobalFormat("%Y"));
    std::string year = procguard::TimeFormatter::format(
        std::chrono::system_clock::now());
    EXPECT_EQ(year.size(), 4u);
    ASSERT_TRUE(procguard::TimeFormatter::setGlobalFormat("%Y-%m-%d %T"));
}

class ConsoleLoggerTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    procguard::ConsoleLogger logger_{out_, false};
};

TEST_F(ConsoleLoggerTest, FormatsMessage) {
    logger_.init(procguard::LogLevel::LOG_DEBUG);
    logger_.info("Formatted message");
    std::string output = out_.str();
    EXPECT_NE(output.find("[INFO] Formatted message"), std::string::npos);
    EXPECT_EQ(output.back(), '\n');
}

TEST_F(ConsoleLoggerTest, SkipsLowerLevel) {
    logger_.init(procguard::LogLevel::LOG_WARNING);
    logger_.info("This should not appear");
    logger_.error("This should appear");
    EXPECT_EQ(out_.str().find("not appear"), std::string::npos);
    EXPECT_NE(out_.str().find("[ERROR] This should appear"), std::string::npos);
}

TEST_F(ConsoleLoggerTest, ColoredOutputIsReset) {
    logger_.init(procguard::LogLevel::LOG_DEBUG);
    logger_.setColored(true);
    logger_.critical("boom");
    EXPECT_NE(out_.str().find(ANSI_COLOR_RESET), std::string::npos);
}

TEST(FileLoggerTest, WritesToMainFile) {
    TempDir dir;
    procguard::FileLogger logger((dir.path() / "main.log").string(),
                                 (dir.path() / "fallback.log").string());
    logger.init(procguard::LogLevel::LOG_INFO);
    EXPECT_TRUE(logger.isMainOpen());

    logger.info("Test message to main file");
    logger.debug("filtered out");
    logger.flush();

    std::string content = readAll(dir.path() / "main.log");
    EXPECT_NE(content.find("Test message to main file"), std::string::npos);
    EXPECT_EQ(content.find("filtered out"), std::string::npos);
}

TEST(FileLoggerTest, FallsBackWhenMainCannotBeOpened) {
    TempDir dir;
    procguard::FileLogger logger(
        (dir.path() / "missing" / "main.log").string(),
        (dir.path() / "fallback.log").string());
    logger.init(procguard::LogLevel::LOG_INFO);
    EXPECT_FALSE(logger.isMainOpen());

    logger.warning("Test message to fallback");
    logger.flush();

    EXPECT_NE(readAll(dir.path() / "fallback.log").find("Test message to fallback"),
              std::string::npos);
}

TEST(FileLoggerTest, ReopenAfterExternalRemoval) {
    TempDir dir;
    fs::path mainPath = dir.path() / "main.log";
    procguard::FileLogger logger(mainPath.string());
    logger.init(procguard::LogLevel::LOG_INFO);
    logger.info("before");
    fs::remove(mainPath);

    logger.reopen();
    logger.info("after");
    logger.flush();

    std::string content = readAll(mainPath);
    EXPECT_EQ(content.find("before"), std::string::npos);
    EXPECT_NE(content.find("after"), std::string::npos);
}

TEST(CompositeLoggerTest, FansOutToEveryLogger) {
    std::ostringstream first;
    std::ostringstream second;
    auto a = std::make_shared<procguard::ConsoleLogger>(first, false);
    auto b = std::make_shared<procguard::ConsoleLogger>(second, false);

    procguard::CompositeLogger composite{a, b};
    composite.addLogger(nullptr);
    EXPECT_EQ(composite.size(), 2u);

    composite.init(procguard::LogLevel::LOG_INFO);
    composite.info("to both");
    b->setLogLevel(procguard::LogLevel::LOG_ERROR);
    composite.warning("only first");

    EXPECT_NE(first.str().find("to both"), std::string::npos);
    EXPECT_NE(second.str().find("to both"), std::string::npos);
    EXPECT_NE(first.str().find("only first"), std::string::npos);
    EXPECT_EQ(second.str().find("only first"), std::string::npos);
}
