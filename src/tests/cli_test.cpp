#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "cli/cli.hpp"
#include "store/local_container.hpp"
#include "test_utils.hpp"

using namespace blobstore;

class CLITest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<provider::BlobProvider> blob_provider;
  std::istringstream input;
  std::ostringstream output;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("cli_test");
    provider::ProviderOptions options;
    options.connection_string = "LocalStoragePath=" + (test_dir / "store").string();
    options.chunk_size = 5;
    blob_provider = std::make_unique<provider::BlobProvider>(options);
  }

  void TearDown() override {
    blob_provider.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  std::string write_local_file(const std::string& name, const std::string& content) {
    std::filesystem::path path = test_dir / name;
    std::ofstream file(path, std::ios::binary);
    file << content;
    return path.string();
  }

  std::string run(const std::string& script) {
    input.str(script);
    input.clear();
    output.str("");
    cli::CLI shell(*blob_provider, input, output);
    shell.run();
    return output.str();
  }

  // First line printed after the prompt of a put command
  provider::ProviderData put(const std::string& path) {
    std::string printed = run("put " + path + "\nquit\n");
    std::size_t start = printed.find('{');
    std::size_t end = printed.find('\n', start);
    return provider::deserialize(printed.substr(start, end - start));
  }
};

TEST_F(CLITest, PutThenCatRoundTrips) {
  std::string path = write_local_file("hello.txt", "hello from the shell");
  provider::ProviderData data = put(path);
  EXPECT_EQ(data.chunk_size, 5u);
  EXPECT_TRUE(blob_provider->exists(data.blob_id));

  std::string printed = run("cat " + data.blob_id + "\nquit\n");
  EXPECT_NE(printed.find("hello from the shell"), std::string::npos);
}

TEST_F(CLITest, GetWritesLocalFile) {
  std::string path = write_local_file("source.bin", "0123456789abc");
  provider::ProviderData data = put(path);

  std::string target = (test_dir / "copy.bin").string();
  run("get " + provider::serialize(data) + " " + target + "\nquit\n");

  std::ifstream copy(target, std::ios::binary);
  std::stringstream content;
  content << copy.rdbuf();
  EXPECT_EQ(content.str(), "0123456789abc");
}

TEST_F(CLITest, ExistsDeleteAndList) {
  provider::ProviderData data = put(write_local_file("a.txt", "abc"));

  EXPECT_NE(run("ls\nquit\n").find(data.blob_id), std::string::npos);
  EXPECT_NE(run("exists " + data.blob_id + "\nquit\n").find("true"), std::string::npos);
  EXPECT_NE(run("delete " + data.blob_id + "\nquit\n").find("Blob deleted successfully"), std::string::npos);
  EXPECT_NE(run("exists " + data.blob_id + "\nquit\n").find("false"), std::string::npos);
  EXPECT_NE(run("delete " + data.blob_id + "\nquit\n").find("Error deleting blob"), std::string::npos);
}

TEST_F(CLITest, ReportsBadInput) {
  EXPECT_NE(run("frobnicate\nquit\n").find("Unknown command"), std::string::npos);
  EXPECT_NE(run("put\nquit\n").find("Unknown command"), std::string::npos);
  EXPECT_NE(run("put /no/such/file\nquit\n").find("Error opening file"), std::string::npos);
  EXPECT_NE(run("help\nquit\n").find("Available commands"), std::string::npos);
}

TEST_F(CLITest, ExecuteStopsOnQuit) {
  cli::CLI shell(*blob_provider, input, output);
  EXPECT_TRUE(shell.execute(""));
  EXPECT_TRUE(shell.execute("help"));
  EXPECT_FALSE(shell.execute("quit"));
}
