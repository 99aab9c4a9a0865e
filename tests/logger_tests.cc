#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include "logger.hpp"

namespace {

namespace fs = std::filesystem;

class LogFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() / ("bambam_log_" + std::to_string(stamp) + ".log");
        initLogger(path_.string());
    }
    void TearDown() override {
        shutdownLogger();
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string contents() const {
        std::ifstream in(path_);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path path_;
};

TEST_F(LogFileTest, TaggedLinesReachTheFile) {
    LOG_WARN("Config", "Key 'dark' has the wrong type");
    LOG_ERROR("Engine", "no rule matched");

    const std::string text = contents();
    EXPECT_NE(text.find("[WARN][Config] Key 'dark' has the wrong type"), std::string::npos);
    EXPECT_NE(text.find("[ERROR][Engine] no rule matched"), std::string::npos);
}

TEST_F(LogFileTest, GroupedPhasesWaitForTheGroupEnd) {
    beginPhaseGroup();
    LOG_PHASE("Font lookup", false);
    EXPECT_EQ(contents().find("Font lookup"), std::string::npos);
    endPhaseGroup();

    const std::string text = contents();
    EXPECT_NE(text.find("| logger_tests.cc | Font lookup | FAILED |"), std::string::npos);
}

} // namespace
