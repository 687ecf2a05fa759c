#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace ifs::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_dir = make_temp_dir("logger_test");
        log_file = (log_dir / "ifs.log").string();
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        std::filesystem::remove_all(log_dir);
        ::init_logging();
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        std::ifstream file(log_file);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str().find(text) != std::string::npos;
    }

    std::filesystem::path log_dir;
    std::string log_file;
};

TEST_F(LoggerTest, ParseSeverity) {
    boost::log::trivial::severity_level level = boost::log::trivial::info;
    EXPECT_TRUE(parse_severity("trace", level));
    EXPECT_EQ(level, boost::log::trivial::trace);
    EXPECT_TRUE(parse_severity("error", level));
    EXPECT_EQ(level, boost::log::trivial::error);

    EXPECT_FALSE(parse_severity("loud", level));
    EXPECT_EQ(level, boost::log::trivial::error) << "Unknown names must leave the level untouched";
}

TEST_F(LoggerTest, WritesToFile) {
    ifs::logging::init_logging(boost::log::trivial::info, log_file);
    BOOST_LOG_TRIVIAL(info) << "Logger test: info message";
    EXPECT_TRUE(log_contains("Logger test: info message"));
    EXPECT_TRUE(log_contains("[info]"));
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    ifs::logging::init_logging(boost::log::trivial::warning, log_file);
    BOOST_LOG_TRIVIAL(info) << "Logger test: filtered";
    BOOST_LOG_TRIVIAL(warning) << "Logger test: kept";
    EXPECT_FALSE(log_contains("Logger test: filtered"));
    EXPECT_TRUE(log_contains("Logger test: kept"));

    set_log_level(boost::log::trivial::debug);
    BOOST_LOG_TRIVIAL(debug) << "Logger test: now visible";
    EXPECT_TRUE(log_contains("Logger test: now visible"));
}
