// test_cli_check.cpp - CLI integration tests for `flowlint check` / `flowlint init`

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

#include "flow_lint/test_support/agent_fixture.hpp"

namespace fs = std::filesystem;
using flow_lint::test_support::AgentFixture;
using flow_lint::test_support::json_handler;
using flow_lint::test_support::json_route_to;
using json = nlohmann::json;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

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

int run_cli(const std::string & args)
{
#ifndef FLOW_LINT_CLI_PATH
  (void)args;
  return 0;
#else
  const std::string cmd = shell_quote(FLOW_LINT_CLI_PATH) + " " + args + " > /dev/null 2>&1";

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

/// Start -> Menu; Menu listens and has both fallback handlers.
void write_clean_agent(AgentFixture & fx)
{
  fx.add_flow("Main", {{"transitionRoutes", json::array({json_route_to("Menu")})}});
  fx.add_page(
    "Main", "Menu",
    {
      {"transitionRoutes", json::array({{{"intent", "bye"}, {"targetFlow", "flows/Goodbye"}}})},
      {"eventHandlers", json::array({json_handler("sys.no-input-default"),
                                     json_handler("sys.no-match-default")})},
    });
}

/// Start -> Dead; Dead neither listens nor leaves.
void write_stuck_agent(AgentFixture & fx)
{
  fx.add_flow("Main", {{"transitionRoutes", json::array({json_route_to("Dead")})}});
  fx.add_page("Main", "Dead", json::object());
}

}  // namespace

TEST(CliCheckTest, CleanAgentExitsZero)
{
#ifndef FLOW_LINT_CLI_PATH
  GTEST_SKIP() << "FLOW_LINT_CLI_PATH is not configured (flowlint target missing?)";
#endif
  AgentFixture fx("flow_lint_cli_clean");
  write_clean_agent(fx);

  EXPECT_EQ(run_cli("check " + shell_quote(fx.root().string())), 0);
}

TEST(CliCheckTest, ErrorFindingExitsOne)
{
#ifndef FLOW_LINT_CLI_PATH
  GTEST_SKIP() << "FLOW_LINT_CLI_PATH is not configured (flowlint target missing?)";
#endif
  AgentFixture fx("flow_lint_cli_stuck");
  write_stuck_agent(fx);

  EXPECT_EQ(run_cli("check " + shell_quote(fx.root().string())), 1);
}

TEST(CliCheckTest, MissingAgentExitsOne)
{
#ifndef FLOW_LINT_CLI_PATH
  GTEST_SKIP() << "FLOW_LINT_CLI_PATH is not configured (flowlint target missing?)";
#endif
  AgentFixture fx("flow_lint_cli_missing");

  EXPECT_EQ(run_cli("check " + shell_quote((fx.root() / "absent").string())), 1);
}

TEST(CliCheckTest, JsonReportToFile)
{
#ifndef FLOW_LINT_CLI_PATH
  GTEST_SKIP() << "FLOW_LINT_CLI_PATH is not configured (flowlint target missing?)";
#endif
  AgentFixture fx("flow_lint_cli_json");
  write_stuck_agent(fx);
  const fs::path report = fx.root() / "report.json";

  EXPECT_EQ(
    run_cli(
      "check " + shell_quote(fx.root().string()) + " --format json -o " +
      shell_quote(report.string())),
    1);

  const json parsed = json::parse(read_all(report));
  EXPECT_EQ(parsed["summary"]["errors"], 1);
  ASSERT_EQ(parsed["findings"].size(), 1u);
  EXPECT_EQ(parsed["findings"][0]["page"], "Dead");
  EXPECT_EQ(parsed["findings"][0]["code"], "FL300");
}

TEST(CliCheckTest, ConfigCanDisableChecks)
{
#ifndef FLOW_LINT_CLI_PATH
  GTEST_SKIP() << "FLOW_LINT_CLI_PATH is not configured (flowlint target missing?)";
#endif
  AgentFixture fx("flow_lint_cli_config");
  write_stuck_agent(fx);
  const fs::path config = fx.write_text("flowlint.yaml", "checks:\n  stuck_pages: false\n");

  EXPECT_EQ(run_cli("check " + shell_quote(fx.root().string())), 0);
  EXPECT_EQ(
    run_cli("check " + shell_quote(fx.root().string()) + " --config " + shell_quote(config.string())),
    0);
}

TEST(CliCheckTest, InvalidConfigExitsOne)
{
#ifndef FLOW_LINT_CLI_PATH
  GTEST_SKIP() << "FLOW_LINT_CLI_PATH is not configured (flowlint target missing?)";
#endif
  AgentFixture fx("flow_lint_cli_bad_config");
  write_clean_agent(fx);
  const fs::path config = fx.write_text("flowlint.yaml", "loop_detection:\n  threshold: -3\n");

  EXPECT_EQ(run_cli("check " + shell_quote(fx.root().string())), 1);

  fs::remove(config);
  EXPECT_EQ(run_cli("check " + shell_quote(fx.root().string())), 0);
  EXPECT_EQ(run_cli("check " + shell_quote(fx.root().string()) + " --threshold abc"), 1);
}

TEST(CliInitTest, WritesDefaultConfigOnce)
{
#ifndef FLOW_LINT_CLI_PATH
  GTEST_SKIP() << "FLOW_LINT_CLI_PATH is not configured (flowlint target missing?)";
#endif
  AgentFixture fx("flow_lint_cli_init");
  const fs::path target = fx.root() / "new_agent";

  EXPECT_EQ(run_cli("init " + shell_quote(target.string())), 0);
  EXPECT_TRUE(fs::exists(target / "flowlint.yaml"));
  EXPECT_NE(read_all(target / "flowlint.yaml").find("loop_detection:"), std::string::npos);

  EXPECT_EQ(run_cli("init " + shell_quote(target.string())), 1);
}
