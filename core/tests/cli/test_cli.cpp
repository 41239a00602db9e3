// tests/cli/test_cli.cpp - seiri command-line behavior and exit codes

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

#include "seiri/test_support/temp_project.hpp"

namespace fs = std::filesystem;
using seiri::test_support::TempProject;

namespace
{

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

/// Run the CLI with `args`; stdout goes to `stdout_path` when given
int run_cli(const std::vector<std::string> & args, const fs::path & stdout_path = {})
{
#ifndef SEIRI_CLI_PATH
  (void)args;
  (void)stdout_path;
  return 0;
#else
  std::string cmd = shell_quote(SEIRI_CLI_PATH);
  for (const auto & a : args) {
    cmd += " " + shell_quote(a);
  }
  cmd += stdout_path.empty() ? " > /dev/null" : " > " + shell_quote(stdout_path.string());
  cmd += " 2>/dev/null";

  const int rc = std::system(cmd.c_str());

#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    return 127;
  }
  if (WIFEXITED(rc)) {
    return WEXITSTATUS(rc);
  }
  return 128;
#else
  return rc;
#endif
#endif
}

void write_clean_project(const TempProject & tmp)
{
  tmp.write("proj/main.py", "from util import helper\n\ndef run():\n    helper()\n");
  tmp.write("proj/util.py", "def helper():\n    return 1\n");
}

}  // namespace

#ifndef SEIRI_CLI_PATH
#define SKIP_WITHOUT_CLI() GTEST_SKIP() << "SEIRI_CLI_PATH is not configured (seiri target missing?)"
#else
#define SKIP_WITHOUT_CLI() (void)0
#endif

TEST(CliTest, HelpExitsZero)
{
  SKIP_WITHOUT_CLI();
  EXPECT_EQ(run_cli({}), 0);
  EXPECT_EQ(run_cli({"--help"}), 0);
}

TEST(CliTest, UsageErrorsAreFatal)
{
  SKIP_WITHOUT_CLI();
  TempProject tmp("seiri_cli_usage");
  write_clean_project(tmp);
  EXPECT_EQ(run_cli({tmp.path("proj").string(), "--bogus"}), 1);
  EXPECT_EQ(run_cli({tmp.path("proj").string(), "--format"}), 1);
  EXPECT_EQ(run_cli({tmp.path("proj").string(), "--format", "dot"}), 1);
}

TEST(CliTest, MissingPathIsFatal)
{
  SKIP_WITHOUT_CLI();
  TempProject tmp("seiri_cli_missing");
  EXPECT_EQ(run_cli({tmp.path("does-not-exist").string()}), 1);
}

TEST(CliTest, CleanProjectWritesJsonToStdout)
{
  SKIP_WITHOUT_CLI();
  TempProject tmp("seiri_cli_clean");
  write_clean_project(tmp);

  ASSERT_EQ(run_cli({tmp.path("proj").string()}, tmp.path("out.json")), 0);

  const auto j = nlohmann::json::parse(tmp.read("out.json"));
  EXPECT_EQ(j.at("version").get<int>(), 1);
  size_t files = 0;
  for (const auto & n : j.at("nodes")) {
    files += n.at("kind") == "file" ? 1 : 0;
  }
  EXPECT_EQ(files, 2U);
  EXPECT_FALSE(j.at("edges").empty());
}

TEST(CliTest, ParseFailureExitsTwo)
{
  SKIP_WITHOUT_CLI();
  TempProject tmp("seiri_cli_broken");
  write_clean_project(tmp);
  tmp.write("proj/broken.py", "def (:\n");

  EXPECT_EQ(run_cli({tmp.path("proj").string(), "-o", tmp.path("graph.json").string()}), 2);
  EXPECT_TRUE(fs::exists(tmp.path("graph.json")));
}

TEST(CliTest, SvgNeedsAnOutputFile)
{
  SKIP_WITHOUT_CLI();
  TempProject tmp("seiri_cli_svg");
  write_clean_project(tmp);

  EXPECT_EQ(run_cli({tmp.path("proj").string(), "--format", "svg"}), 1);

  ASSERT_EQ(
    run_cli({tmp.path("proj").string(), "--format", "svg", "-o", tmp.path("g.svg").string()}), 0);
  EXPECT_EQ(tmp.read("g.svg").rfind("<svg", 0), 0U);
}

TEST(CliTest, FactsFormat)
{
  SKIP_WITHOUT_CLI();
  TempProject tmp("seiri_cli_facts");
  write_clean_project(tmp);

  ASSERT_EQ(
    run_cli({tmp.path("proj").string(), "--format", "facts", "-o", tmp.path("f.json").string()}),
    0);
  const auto j = nlohmann::json::parse(tmp.read("f.json"));
  ASSERT_EQ(j.at("files").size(), 2U);
  EXPECT_EQ(j.at("files")[0].at("file"), "main.py");
}

TEST(CliTest, AnalyzeFlagAddsSummary)
{
  SKIP_WITHOUT_CLI();
  TempProject tmp("seiri_cli_analyze");
  write_clean_project(tmp);

  ASSERT_EQ(run_cli({tmp.path("proj").string(), "--analyze", "-j", "2"}, tmp.path("a.json")), 0);
  const auto j = nlohmann::json::parse(tmp.read("a.json"));
  ASSERT_TRUE(j.contains("analysis"));
  EXPECT_EQ(j.at("analysis").at("file_count").get<int>(), 2);
}

TEST(CliTest, ConfigFileIsHonored)
{
  SKIP_WITHOUT_CLI();
  TempProject tmp("seiri_cli_config");
  write_clean_project(tmp);
  tmp.write("proj/seiri.yaml", "output:\n  format: svg\n  path: out/graph.svg\n");
  fs::create_directories(tmp.path("proj/out"));

  ASSERT_EQ(run_cli({tmp.path("proj").string()}), 0);
  EXPECT_TRUE(fs::exists(tmp.path("proj/out/graph.svg")));
}

TEST(CliTest, InvalidConfigIsFatal)
{
  SKIP_WITHOUT_CLI();
  TempProject tmp("seiri_cli_bad_config");
  write_clean_project(tmp);
  tmp.write("proj/seiri.yaml", "output:\n  format: dot\n");

  EXPECT_EQ(run_cli({tmp.path("proj").string()}), 1);
}
