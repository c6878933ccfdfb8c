// tests/unit/report/test_report.cpp - Text and JSON report output

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "flow_lint/report/finding_printer.hpp"
#include "flow_lint/report/json_report.hpp"

using namespace flow_lint;

static FindingBag sample_findings()
{
  FindingBag bag;
  bag
    .report_warning(
      FindingCategory::UnreachablePage, "Main", "Orphan",
      "Unreachable Page: no route from Start leads to this page")
    .with_help("add a transition to this page or delete it");
  bag.report_error(
    FindingCategory::StuckPage, "Main", "End", "Potential Stuck Page (No Input, No True Route)");
  bag.report_info(FindingCategory::UnusedRouteGroup, "Main", k_no_page, "Unused Route Group: Chit");
  return bag;
}

TEST(SanitizeDisplayText, StripsControlCharacters)
{
  EXPECT_EQ(sanitize_display_text("plain text"), "plain text");
  EXPECT_EQ(sanitize_display_text("two\nlines\ttab"), "two lines tab");
  EXPECT_EQ(sanitize_display_text("\x1b[31mred\x1b[0m"), "[31mred[0m");
  EXPECT_EQ(sanitize_display_text(std::string("nul\0byte", 8)), "nulbyte");
  EXPECT_EQ(sanitize_display_text("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST(FindingPrinter, PrintsHeaderLocationAndHelp)
{
  std::ostringstream out;
  FindingPrinter printer(out, false);
  printer.print_all(sample_findings());

  const std::string text = out.str();
  EXPECT_NE(
    text.find("warning[FL100]: Unreachable Page: no route from Start leads to this page\n"),
    std::string::npos);
  EXPECT_NE(text.find("  --> flow 'Main', page 'Orphan'\n"), std::string::npos);
  EXPECT_NE(text.find("   = help: add a transition to this page or delete it\n"), std::string::npos);
  EXPECT_NE(text.find("error[FL300]: Potential Stuck Page"), std::string::npos);
  EXPECT_NE(text.find("info[FL400]: Unused Route Group: Chit\n  --> flow 'Main'\n"), std::string::npos);
  EXPECT_NE(text.find("1 error, 1 warning, 1 info\n"), std::string::npos);
  EXPECT_EQ(text.find('\x1b'), std::string::npos);
}

TEST(FindingPrinter, EmptyReport)
{
  std::ostringstream out;
  FindingPrinter printer(out, false);
  printer.print_all(FindingBag{});
  EXPECT_EQ(out.str(), "No graph issues found\n");
}

TEST(FindingPrinter, SanitizesAgentNames)
{
  FindingBag bag;
  bag.report_warning(FindingCategory::UnreachablePage, "Ma\x1b]0;x\ain", "Pa\nge", "msg");

  std::ostringstream out;
  FindingPrinter(out, false).print(bag.all()[0]);
  EXPECT_NE(out.str().find("flow 'Ma]0;xin', page 'Pa ge'"), std::string::npos);
}

TEST(JsonReport, HasRootSummaryAndOrderedFindings)
{
  const auto report = to_json(sample_findings(), "/agents/demo");

  EXPECT_EQ(report["root"], "/agents/demo");
  EXPECT_EQ(report["summary"]["errors"], 1);
  EXPECT_EQ(report["summary"]["warnings"], 1);
  EXPECT_EQ(report["summary"]["infos"], 1);
  EXPECT_EQ(report["summary"]["total"], 3);

  const auto & findings = report["findings"];
  ASSERT_TRUE(findings.is_array());
  ASSERT_EQ(findings.size(), 3u);

  const auto & first = findings[0];
  EXPECT_EQ(first["flow"], "Main");
  EXPECT_EQ(first["page"], "Orphan");
  EXPECT_EQ(first["category"], "Unreachable Page");
  EXPECT_EQ(first["code"], "FL100");
  EXPECT_EQ(first["severity"], "Warning");
  EXPECT_EQ(first["help"], "add a transition to this page or delete it");

  EXPECT_EQ(findings[1]["severity"], "Error");
  EXPECT_FALSE(findings[1].contains("help"));
  EXPECT_EQ(findings[2]["page"], "N/A");
}

TEST(JsonReport, EmptyReportStillHasFindingsArray)
{
  const auto report = to_json(FindingBag{}, "agent");
  ASSERT_TRUE(report["findings"].is_array());
  EXPECT_TRUE(report["findings"].empty());
  EXPECT_EQ(report["summary"]["total"], 0);
}

TEST(JsonReport, InvalidUtf8NamesAreReplaced)
{
  FindingBag bag;
  bag.report_warning(FindingCategory::UnreachablePage, "Main", "Pa\xffge", "Unreachable Page");

  std::string text;
  ASSERT_NO_THROW(text = dump_report(bag, "agent"));

  const auto parsed = nlohmann::json::parse(text);
  EXPECT_EQ(parsed["findings"][0]["page"], "Pa\xef\xbf\xbdge");
  EXPECT_EQ(parsed["findings"][0]["flow"], "Main");
}
