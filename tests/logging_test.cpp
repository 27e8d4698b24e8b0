#include <gtest/gtest.h>
#include "logging.hpp"
#include <cstdio>
#include <string>

using namespace sectorcast;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        out_ = std::tmpfile();
        ASSERT_NE(out_, nullptr);
        saved_ = Logger::instance().level();
        Logger::instance().set_output(out_);
    }

    void TearDown() override {
        Logger::instance().set_output(nullptr);
        Logger::instance().set_level(saved_);
        std::fclose(out_);
    }

    std::string contents() {
        std::fflush(out_);
        std::rewind(out_);
        std::string s;
        char buf[256];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), out_)) > 0)
            s.append(buf, n);
        return s;
    }

    std::FILE* out_ = nullptr;
    LogLevel saved_ = LogLevel::INFO;
};

TEST_F(LoggingTest, FiltersBelowLevel) {
    Logger::instance().set_level(LogLevel::WARN);
    Logger::instance().log(LogLevel::DEBUG, "hidden %d", 1);
    Logger::instance().log(LogLevel::WARN, "segment %s stuck", "3/7");
    std::string s = contents();
    EXPECT_EQ(s.find("hidden"), std::string::npos);
    EXPECT_NE(s.find("[WARN] segment 3/7 stuck\n"), std::string::npos);
}

TEST(LogLevelTest, ParsesNames) {
    LogLevel lvl = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("debug", lvl));
    EXPECT_EQ(lvl, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("error", lvl));
    EXPECT_EQ(lvl, LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("loud", lvl));
    EXPECT_EQ(lvl, LogLevel::ERROR);
}
