#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "cli/cli.hpp"
#include "store/memory_store.hpp"
#include "test_utils.hpp"

using namespace ifs;

class CLITest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
    test_dir = make_temp_dir("cli_test");
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }

  std::string write_file(const std::string& name, const std::string& content) {
    auto path = test_dir / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path.string();
  }

  static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  std::filesystem::path test_dir;
  store::MemoryStore store;
  download::DownloadService service{store, download::ServiceConfig{4}};
  std::istringstream input;
  std::ostringstream output;
  cli::CLI shell{store, service, input, output};
};

TEST_F(CLITest, PublishListAndDownload) {
  const std::string source = write_file("image.bin", "initial filesystem");
  const std::string target = (test_dir / "out.bin").string();

  EXPECT_TRUE(shell.execute("publish comp 1 " + source));
  EXPECT_TRUE(shell.execute("publish comp 3 " + source));
  EXPECT_TRUE(shell.execute("versions comp"));
  EXPECT_NE(output.str().find("Published comp@1 (18 bytes)"), std::string::npos) << output.str();
  EXPECT_NE(output.str().find("1\n3\n"), std::string::npos) << output.str();

  EXPECT_TRUE(shell.execute("download comp " + target));
  EXPECT_EQ(read_file(target), "initial filesystem");
  EXPECT_NE(output.str().find("Downloaded comp@3"), std::string::npos) << output.str();
}

TEST_F(CLITest, DownloadReportsNotFound) {
  EXPECT_TRUE(shell.execute("download comp 5 " + (test_dir / "out.bin").string()));
  EXPECT_NE(output.str().find("Download failed: Not found"), std::string::npos) << output.str();
}

TEST_F(CLITest, DuplicatePublishIsReported) {
  const std::string source = write_file("image.bin", "data");
  shell.execute("publish comp 1 " + source);
  shell.execute("publish comp 1 " + source);
  EXPECT_NE(output.str().find("Error publishing image"), std::string::npos) << output.str();
}

TEST_F(CLITest, InvalidInput) {
  EXPECT_TRUE(shell.execute("publish comp notanumber file"));
  EXPECT_TRUE(shell.execute("fetch nocolon comp out"));
  EXPECT_TRUE(shell.execute("frobnicate"));
  EXPECT_TRUE(shell.execute(""));
  EXPECT_NE(output.str().find("Invalid version"), std::string::npos);
  EXPECT_NE(output.str().find("Invalid format"), std::string::npos);
  EXPECT_NE(output.str().find("Unknown command"), std::string::npos);
}

TEST_F(CLITest, RunStopsOnQuit) {
  input.str("help\nquit\nversions comp\n");
  shell.run();
  EXPECT_NE(output.str().find("Available commands:"), std::string::npos);
  EXPECT_EQ(output.str().find("No versions published"), std::string::npos) << "Commands after quit must not run";
}
