// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <cassette_store.hpp>

#include "commands.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

namespace reel {
namespace cli {
namespace test {

using cassette::test::TempDirectory;

class CommandsTest : public ::testing::Test {
protected:
  void SetUp() override {
    unsetenv("REEL_CASSETTE_DIR");
  }

  void TearDown() override {
    unsetenv("REEL_CASSETTE_DIR");
  }

  void record(const std::string& name, int entries) {
    cassette::CassetteStore store(dir_.string());
    auto recorded = store.create(name);
    for (int i = 0; i < entries; ++i) {
      recorded->append(
        cassette::Request("/acme.v1.Library/GetBook", {{"id", i}}),
        cassette::Response("acme.v1.Book", {{"id", i}, {"title", "Book " + std::to_string(i)}})
      );
    }
    store.save(*recorded);
  }

  int run(std::vector<std::string> args) {
    args.insert(args.begin(), "reel_cassette");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(&arg[0]);
    }
    out_.str("");
    err_.str("");
    Commands commands(out_, err_);
    return commands.execute(static_cast<int>(argv.size()), argv.data());
  }

  TempDirectory dir_;
  std::ostringstream out_;
  std::ostringstream err_;
};

// =============================================================================
// Command parsing
// =============================================================================

TEST_F(CommandsTest, HandlesHelpCommand) {
  EXPECT_EQ(run({}), 0);
  EXPECT_NE(out_.str().find("Usage: reel_cassette"), std::string::npos);

  EXPECT_EQ(run({"--help"}), 0);
}

TEST_F(CommandsTest, HandlesUnknownCommand) {
  EXPECT_EQ(run({"--dir", dir_.string(), "rewind"}), 1);
  EXPECT_NE(err_.str().find("Unknown command 'rewind'"), std::string::npos);
}

TEST_F(CommandsTest, HandlesUnknownOption) {
  EXPECT_EQ(run({"--speed", "list"}), 1);
}

TEST_F(CommandsTest, MissingDirectoryIsAnError) {
  EXPECT_EQ(run({"list"}), 1);
  EXPECT_NE(err_.str().find("no cassette dir configured"), std::string::npos);

  EXPECT_EQ(run({"list", "--dir"}), 1);
}

// =============================================================================
// list / show / verify
// =============================================================================

TEST_F(CommandsTest, ListShowsEveryCassette) {
  record("alpha", 2);
  record("beta", 1);

  EXPECT_EQ(run({"--dir", dir_.string(), "list"}), 0);
  const std::string output = out_.str();
  EXPECT_NE(output.find("alpha  2 entries"), std::string::npos);
  EXPECT_NE(output.find("beta  1 entries"), std::string::npos);
  EXPECT_LT(output.find("alpha"), output.find("beta"));
}

TEST_F(CommandsTest, ListEmptyDirectory) {
  EXPECT_EQ(run({"--dir", dir_.string(), "list"}), 0);
  EXPECT_NE(out_.str().find("No cassettes"), std::string::npos);
}

TEST_F(CommandsTest, DirectoryFromEnvironment) {
  record("from_env", 1);
  setenv("REEL_CASSETTE_DIR", dir_.string().c_str(), 1);

  EXPECT_EQ(run({"list"}), 0);
  EXPECT_NE(out_.str().find("from_env"), std::string::npos);
}

TEST_F(CommandsTest, DirectoryFromConfigFile) {
  fs::create_directories(dir_.file("fixtures"));
  cassette::CassetteStore store(dir_.file("fixtures").string(), ".cassette");
  store.save(*store.create("configured"));
  dir_.write_file(
    "reel.yaml", "cassettes:\n  dir: " + dir_.file("fixtures").string() + "\n  extension: .cassette\n"
  );

  EXPECT_EQ(run({"--config", dir_.file("reel.yaml").string(), "list"}), 0);
  EXPECT_NE(out_.str().find("configured  0 entries"), std::string::npos);
}

TEST_F(CommandsTest, BadConfigFileIsAnError) {
  dir_.write_file("bad.yaml", "cassettes: [");
  EXPECT_EQ(run({"--config", dir_.file("bad.yaml").string(), "list"}), 1);
  EXPECT_FALSE(err_.str().empty());
}

TEST_F(CommandsTest, ShowPrintsRequests) {
  record("library", 2);

  EXPECT_EQ(run({"--dir", dir_.string(), "-v", "show", "library"}), 0);
  const std::string output = out_.str();
  EXPECT_NE(output.find("Version: 2"), std::string::npos);
  EXPECT_NE(output.find("Entries: 2"), std::string::npos);
  EXPECT_NE(output.find("[0] /acme.v1.Library/GetBook {\"id\":0}"), std::string::npos);
  EXPECT_NE(output.find("-> acme.v1.Book"), std::string::npos);
}

TEST_F(CommandsTest, ShowMissingCassetteFails) {
  EXPECT_EQ(run({"--dir", dir_.string(), "show", "nope"}), 1);
  EXPECT_NE(err_.str().find("not found"), std::string::npos);

  EXPECT_EQ(run({"--dir", dir_.string(), "show"}), 1);
}

TEST_F(CommandsTest, VerifyReportsBrokenCassettes) {
  record("good", 1);
  EXPECT_EQ(run({"--dir", dir_.string(), "verify"}), 0);
  EXPECT_NE(out_.str().find("OK    good"), std::string::npos);

  dir_.write_file("stale.json", R"({"version": 1, "reqs": []})");
  EXPECT_EQ(run({"--dir", dir_.string(), "verify"}), 1);
  EXPECT_NE(out_.str().find("FAIL  stale"), std::string::npos);
  EXPECT_NE(out_.str().find("1 of 2 cassettes valid"), std::string::npos);
}

// =============================================================================
// delete-all
// =============================================================================

TEST_F(CommandsTest, DeleteAllWithForce) {
  record("one", 1);
  record("two", 1);

  EXPECT_EQ(run({"--dir", dir_.string(), "delete-all", "--force"}), 0);
  EXPECT_NE(out_.str().find("Deleted 2 cassettes"), std::string::npos);
  EXPECT_TRUE(cassette::CassetteStore(dir_.string()).list().empty());
}

TEST_F(CommandsTest, DeleteAllWithoutConfirmationKeepsFiles) {
  record("keep", 1);

  // stdin is not a terminal under the test runner
  EXPECT_EQ(run({"--dir", dir_.string(), "delete-all"}), 0);
  EXPECT_NE(out_.str().find("Operation cancelled"), std::string::npos);
  EXPECT_EQ(cassette::CassetteStore(dir_.string()).list().size(), 1u);
}

}  // namespace test
}  // namespace cli
}  // namespace reel
