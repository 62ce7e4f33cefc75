#include "reqkit/util/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace reqkit::util;

// Points the global logger at a temp file for the duration of a test.
class LogCapture {
public:
    explicit LogCapture(const std::string& name, bool json = false)
        : path_(::testing::TempDir() + name) {
        std::remove(path_.c_str());
        logger().setLevel(LogLevel::Trace);
        logger().setFormatJson(json);
        logger().setFile(path_);
    }
    ~LogCapture() {
        logger().setFile("");
        logger().setFormatJson(false);
        logger().setLevel(LogLevel::Info);
        std::remove(path_.c_str());
    }
    std::string contents() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
private:
    std::string path_;
};

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(parseLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("Error"), LogLevel::Error);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
}

TEST(LoggerTest, TextLineCarriesLevelMessageAndFields) {
    LogCapture cap("reqkit_log_text.log");
    logger().log(LogLevel::Warn, "transport failed", {{"url", "http://x/"}});
    auto out = cap.contents();
    EXPECT_NE(out.find("WARN"), std::string::npos);
    EXPECT_NE(out.find("transport failed"), std::string::npos);
    EXPECT_NE(out.find("url=http://x/"), std::string::npos);
}

TEST(LoggerTest, BelowLevelIsSuppressed) {
    LogCapture cap("reqkit_log_level.log");
    logger().setLevel(LogLevel::Warn);
    logger().log(LogLevel::Debug, "hidden");
    logger().log(LogLevel::Error, "shown");
    auto out = cap.contents();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("shown"), std::string::npos);
}

TEST(LoggerTest, JsonLineEscapes) {
    LogCapture cap("reqkit_log_json.log", true);
    logger().log(LogLevel::Info, "say \"hi\"", {{"k", "a\nb"}});
    auto out = cap.contents();
    EXPECT_EQ(out.front(), '{');
    EXPECT_NE(out.find("\"lvl\":\"INFO\""), std::string::npos);
    EXPECT_NE(out.find("say \\\"hi\\\""), std::string::npos);
    EXPECT_NE(out.find("\"k\":\"a\\nb\""), std::string::npos);
}

TEST(LoggerTest, ScopedContextIsAttachedAndRestored) {
    LogCapture cap("reqkit_log_scoped.log");
    {
        Logger::Scoped outer(std::vector<Field>{{"req", "one"}});
        {
            Logger::Scoped inner({{"req", "two"}, {"try", "1"}});
            logger().log(LogLevel::Info, "inner");
        }
        logger().log(LogLevel::Info, "outer");
    }
    logger().log(LogLevel::Info, "bare");

    std::istringstream lines(cap.contents());
    std::string l1, l2, l3;
    std::getline(lines, l1);
    std::getline(lines, l2);
    std::getline(lines, l3);
    EXPECT_NE(l1.find("req=two"), std::string::npos);
    EXPECT_NE(l1.find("try=1"), std::string::npos);
    EXPECT_NE(l2.find("req=one"), std::string::npos);
    EXPECT_EQ(l2.find("try="), std::string::npos);
    EXPECT_EQ(l3.find("req="), std::string::npos);
}
