#include "utils/logging.hpp"

#include <iostream>
#include <sstream>

#include "gtest/gtest.h"
#include "utils/common.hpp"

namespace {

using boxrun::utils::GetLogConfig;
using boxrun::utils::LogConfig;
using boxrun::utils::LogLevel;
using boxrun::utils::ParseLogLevel;
using boxrun::utils::SetLogConfig;

class CaptureStderr {
public:
    CaptureStderr() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~CaptureStderr() { std::cerr.rdbuf(previous_); }
    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

TEST(Logging, ParsesLevelNames) {
    LogLevel level = LogLevel::kInfo;
    ASSERT_TRUE(ParseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::kDebug);
    ASSERT_TRUE(ParseLogLevel("WARNING", level));
    EXPECT_EQ(level, LogLevel::kWarn);
    EXPECT_FALSE(ParseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::kWarn);
}

TEST(Logging, FormatsTagLevelAndFields) {
    const auto saved = GetLogConfig();
    SetLogConfig(LogConfig{LogLevel::kInfo});
    std::string text;
    {
        CaptureStderr capture;
        boxrun::utils::LogInfo("sandbox", "creating container", {{"image", "alpine:latest"}});
        boxrun::utils::LogWarn("pipeline", "command failed", {{"exit_code", "1"}});
        boxrun::utils::LogDebug("pipeline", "hidden");
        text = capture.str();
    }
    SetLogConfig(saved);
    EXPECT_EQ(text,
              "[sandbox] creating container image=alpine:latest\n"
              "[pipeline] WARN command failed exit_code=1\n");
}

TEST(Common, TrimJoinLower) {
    EXPECT_EQ(boxrun::utils::Trim("  numpy \n"), "numpy");
    EXPECT_EQ(boxrun::utils::Trim(" \t "), "");
    EXPECT_EQ(boxrun::utils::Join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(boxrun::utils::ToLower("UTF-8"), "utf-8");
}

}  // namespace
