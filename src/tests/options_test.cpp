#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include "config/options.hpp"

using namespace ifs::config;

class OptionsTest : public ::testing::Test {
protected:
  ProgramOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "ifs_server");
    return parse_command_line(static_cast<int>(args.size()), args.data(), errors);
  }

  std::ostringstream errors;
};

TEST_F(OptionsTest, RequiredArguments) {
  const auto options = parse({"-h", "127.0.0.1", "-p", "3001"});
  ASSERT_TRUE(options.valid) << errors.str();
  EXPECT_EQ(options.host, "127.0.0.1");
  EXPECT_EQ(options.port, 3001);
  EXPECT_TRUE(options.store_path.empty());
  EXPECT_EQ(options.chunk_size, ifs::download::DEFAULT_CHUNK_SIZE);
  EXPECT_EQ(options.log_level, boost::log::trivial::info);
  EXPECT_FALSE(options.daemon);
}

TEST_F(OptionsTest, AllArguments) {
  const auto options = parse({"--host", "0.0.0.0", "--port", "4000", "--store", "/var/ifs", "--chunk-size", "65536",
                              "--log-level", "debug", "--log-file", "ifs.log", "--daemon"});
  ASSERT_TRUE(options.valid) << errors.str();
  EXPECT_EQ(options.store_path, "/var/ifs");
  EXPECT_EQ(options.chunk_size, 65536u);
  EXPECT_EQ(options.log_level, boost::log::trivial::debug);
  EXPECT_EQ(options.log_file, "ifs.log");
  EXPECT_TRUE(options.daemon);
}

TEST_F(OptionsTest, MissingHostOrPort) {
  EXPECT_FALSE(parse({"-h", "127.0.0.1"}).valid);
  EXPECT_FALSE(parse({"-p", "3001"}).valid);
  EXPECT_NE(errors.str().find("Usage:"), std::string::npos);
}

TEST_F(OptionsTest, InvalidValues) {
  EXPECT_FALSE(parse({"-h", "127.0.0.1", "-p", "70000"}).valid);
  EXPECT_FALSE(parse({"-h", "127.0.0.1", "-p", "12ab"}).valid);
  EXPECT_FALSE(parse({"-h", "127.0.0.1", "-p", "3001", "-c", "0"}).valid);
  EXPECT_FALSE(parse({"-h", "127.0.0.1", "-p", "3001", "-c", "999999999"}).valid);
  EXPECT_FALSE(parse({"-h", "127.0.0.1", "-p", "3001", "-l", "verbose"}).valid);
}

TEST_F(OptionsTest, UnknownOrIncompleteArguments) {
  EXPECT_FALSE(parse({"-h", "127.0.0.1", "-p", "3001", "--bogus", "x"}).valid);
  EXPECT_FALSE(parse({"-h", "127.0.0.1", "-p"}).valid);
  EXPECT_NE(errors.str().find("Unknown argument: --bogus"), std::string::npos);
}
