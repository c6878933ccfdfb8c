// tests/unit/model/test_agent_graph.cpp - AgentGraph lookups

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "flow_lint/model/agent_graph.hpp"
#include "flow_lint/test_support/agent_fixture.hpp"

using namespace flow_lint;
using namespace flow_lint::test_support;

static Flow named_flow(std::string id, std::string display)
{
  Flow f = make_flow(std::move(id), {});
  f.display_name = std::move(display);
  return f;
}

TEST(AgentGraph, FindFlowByIdDisplayNameAndSegment)
{
  std::vector<Flow> flows;
  flows.push_back(named_flow("projects/p/agents/a/flows/abc", "Billing"));
  flows.push_back(named_flow("def", "Support"));
  const AgentGraph graph = make_graph(std::move(flows));

  ASSERT_NE(graph.find_flow("projects/p/agents/a/flows/abc"), nullptr);
  EXPECT_EQ(graph.find_flow("projects/p/agents/a/flows/abc")->display_name, "Billing");
  EXPECT_EQ(graph.find_flow("Billing")->id, "projects/p/agents/a/flows/abc");
  EXPECT_EQ(graph.find_flow("abc")->display_name, "Billing");
  EXPECT_EQ(graph.find_flow("other/prefix/def")->display_name, "Support");
  EXPECT_EQ(graph.find_flow("missing"), nullptr);
}

TEST(AgentGraph, PageNameOfStartAndPages)
{
  std::vector<Page> pages;
  pages.push_back(make_page("p1"));
  pages.back().display_name = "First Page";
  std::vector<Flow> flows;
  flows.push_back(make_flow("f", {}, std::move(pages)));
  const AgentGraph graph = make_graph(std::move(flows));

  const Flow & flow = graph.flows()[0];
  EXPECT_EQ(flow.page_name(k_start_page), "Start");
  EXPECT_EQ(flow.page_name(0), "First Page");
}

TEST(AgentGraph, LastPathSegment)
{
  EXPECT_EQ(last_path_segment("a/b/c"), "c");
  EXPECT_EQ(last_path_segment("a/b/c/"), "c");
  EXPECT_EQ(last_path_segment("plain"), "plain");
  EXPECT_EQ(last_path_segment(""), "");
  EXPECT_EQ(last_path_segment("///"), "");
}
