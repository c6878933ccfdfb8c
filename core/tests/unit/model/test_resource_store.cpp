// tests/unit/model/test_resource_store.cpp - Agent directory loading

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "flow_lint/model/resource_store.hpp"
#include "flow_lint/test_support/agent_fixture.hpp"

using namespace flow_lint;
using flow_lint::test_support::AgentFixture;
using flow_lint::test_support::json_handler;
using flow_lint::test_support::json_intent_route;
using flow_lint::test_support::json_route_to;
using json = nlohmann::json;

TEST(ResourceStore, MissingRootIsLoadError)
{
  const AgentFixture fx("flow_lint_missing_root");
  const auto missing = fx.root() / "does_not_exist";

  const auto result = load_agent(missing);

  ASSERT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->path, missing);
  EXPECT_NE(result.error->message.find("not found"), std::string::npos);
}

TEST(ResourceStore, RootWithoutFlowsIsEmptyGraph)
{
  const AgentFixture fx("flow_lint_no_flows");

  const auto result = fx.load();

  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.graph.flows().empty());
  EXPECT_EQ(result.graph.page_count(), 0u);
  EXPECT_EQ(result.graph.root(), fx.root());
}

TEST(ResourceStore, LoadsFlowPagesAndRouteGroups)
{
  AgentFixture fx("flow_lint_full_agent");
  fx.add_flow(
    "Default Start Flow",
    {
      {"name", "00000000-0000-0000-0000-000000000000"},
      {"displayName", "Default Start Flow"},
      {"transitionRoutes", json::array({json_intent_route("Welcome", "Menu")})},
      {"eventHandlers", json::array({json_handler("sys.no-match-default")})},
      {"transitionRouteGroups", json::array({"Common"})},
    });
  json param = {{"displayName", "choice"}};
  param["fillBehavior"]["initialPromptFulfillment"]["messages"] = json::array({"Pick one"});
  param["fillBehavior"]["repromptEventHandlers"] = json::array({json_handler("no-match")});

  json menu = {{"displayName", "Menu"}};
  menu["entryFulfillment"]["messages"] = json::array({"Hi"});
  menu["form"]["parameters"] = json::array({param});
  menu["transitionRoutes"] = json::array({json_route_to("Done")});
  menu["transitionRouteGroups"] = json::array({"Common"});
  fx.add_page("Default Start Flow", "Menu", menu);

  fx.add_route_group(
    "Default Start Flow", "Common",
    {
      {"displayName", "Common"},
      {"transitionRoutes", json::array({json_intent_route("Help", "Menu")})},
    });

  const auto result = fx.load();
  ASSERT_TRUE(result.success) << result.error->to_string();
  ASSERT_EQ(result.graph.flows().size(), 1u);

  const Flow & flow = result.graph.flows()[0];
  EXPECT_EQ(flow.id, "00000000-0000-0000-0000-000000000000");
  EXPECT_EQ(flow.display_name, "Default Start Flow");
  ASSERT_EQ(flow.transition_routes.size(), 1u);
  EXPECT_EQ(flow.transition_routes[0].intent, "Welcome");
  EXPECT_FALSE(flow.transition_routes[0].condition.has_value());
  ASSERT_EQ(flow.event_handlers.size(), 1u);
  EXPECT_EQ(flow.event_handlers[0].event, "sys.no-match-default");
  EXPECT_TRUE(flow.event_handlers[0].has_trigger_fulfillment);
  EXPECT_EQ(flow.route_group_refs, std::vector<std::string>{"Common"});

  ASSERT_EQ(flow.pages.size(), 1u);
  const Page & page = flow.pages[0];
  EXPECT_EQ(page.id, "Menu");
  EXPECT_EQ(page.display_name, "Menu");
  EXPECT_TRUE(page.has_entry_action);
  ASSERT_TRUE(page.has_form());
  EXPECT_EQ(page.form_parameters[0].display_name, "choice");
  EXPECT_TRUE(page.form_parameters[0].has_initial_prompt);
  ASSERT_EQ(page.form_parameters[0].reprompt_event_handlers.size(), 1u);
  EXPECT_EQ(page.form_parameters[0].reprompt_event_handlers[0].event, "no-match");
  ASSERT_EQ(page.transition_routes.size(), 1u);
  EXPECT_EQ(page.transition_routes[0].condition, "true");
  EXPECT_EQ(page.transition_routes[0].target_page, "Done");

  ASSERT_EQ(flow.route_groups.size(), 1u);
  EXPECT_EQ(flow.route_groups[0].id, "Common");
  EXPECT_EQ(flow.route_groups[0].transition_routes.size(), 1u);

  EXPECT_EQ(result.graph.page_count(), 1u);
  EXPECT_EQ(result.graph.route_group_count(), 1u);
}

TEST(ResourceStore, IdentityFallsBackToFileAndDirectoryNames)
{
  AgentFixture fx("flow_lint_identity");
  fx.add_flow("Billing", json::object());
  fx.add_page("Billing", "Invoice", json::object());

  const auto result = fx.load();
  ASSERT_TRUE(result.success) << result.error->to_string();

  const Flow & flow = result.graph.flows()[0];
  EXPECT_EQ(flow.id, "Billing");
  EXPECT_EQ(flow.display_name, "Billing");
  ASSERT_EQ(flow.pages.size(), 1u);
  EXPECT_EQ(flow.pages[0].id, "Invoice");
  EXPECT_EQ(flow.pages[0].display_name, "Invoice");
}

TEST(ResourceStore, EmptyStringsReadAsAbsent)
{
  AgentFixture fx("flow_lint_empty_strings");
  fx.add_flow("Main", json::object());
  fx.add_page(
    "Main", "P",
    {
      {"displayName", ""},
      {"transitionRoutes", json::array({{{"condition", ""}, {"targetPage", ""}, {"intent", ""}}})},
      {"entryFulfillment", {{"messages", json::array()}, {"webhook", ""}}},
    });

  const auto result = fx.load();
  ASSERT_TRUE(result.success) << result.error->to_string();

  const Page & page = result.graph.flows()[0].pages[0];
  EXPECT_EQ(page.display_name, "P");
  EXPECT_FALSE(page.has_entry_action);
  ASSERT_EQ(page.transition_routes.size(), 1u);
  EXPECT_FALSE(page.transition_routes[0].condition.has_value());
  EXPECT_FALSE(page.transition_routes[0].intent.has_value());
  EXPECT_FALSE(page.transition_routes[0].target_page.has_value());
}

TEST(ResourceStore, PagesLoadInSortedOrder)
{
  AgentFixture fx("flow_lint_sorted");
  fx.add_flow("Main", json::object());
  fx.add_page("Main", "b_page", json::object());
  fx.add_page("Main", "c_page", json::object());
  fx.add_page("Main", "a_page", json::object());

  const auto first = fx.load();
  const auto second = fx.load();
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);

  const auto & pages = first.graph.flows()[0].pages;
  ASSERT_EQ(pages.size(), 3u);
  EXPECT_EQ(pages[0].id, "a_page");
  EXPECT_EQ(pages[1].id, "b_page");
  EXPECT_EQ(pages[2].id, "c_page");

  for (size_t i = 0; i < pages.size(); ++i) {
    EXPECT_EQ(pages[i].id, second.graph.flows()[0].pages[i].id);
  }
}

TEST(ResourceStore, IgnoresNonJsonFilesAndFlowDirsWithoutDocument)
{
  AgentFixture fx("flow_lint_tolerance");
  fx.add_flow("Main", json::object());
  fx.add_page("Main", "Real", json::object());
  fx.write_text("flows/Main/pages/notes.txt", "not json at all");
  fx.write_text("flows/Orphan/pages/Lost.json", "{}");

  const auto result = fx.load();
  ASSERT_TRUE(result.success) << result.error->to_string();
  ASSERT_EQ(result.graph.flows().size(), 1u);
  EXPECT_EQ(result.graph.flows()[0].id, "Main");
  EXPECT_EQ(result.graph.flows()[0].pages.size(), 1u);
}

TEST(ResourceStore, MalformedJsonIsLoadErrorWithPath)
{
  AgentFixture fx("flow_lint_bad_json");
  fx.add_flow("Main", json::object());
  const auto bad = fx.write_text("flows/Main/pages/Broken.json", "{ \"displayName\": ");

  const auto result = fx.load();

  ASSERT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->path.filename(), bad.filename());
  EXPECT_NE(result.error->message.find("failed to parse JSON"), std::string::npos);
  EXPECT_TRUE(result.graph.flows().empty());
}

TEST(ResourceStore, WrongFieldTypeIsLoadError)
{
  AgentFixture fx("flow_lint_bad_field");
  fx.add_flow("Main", json::object());
  fx.add_page("Main", "Broken", {{"transitionRoutes", "not-an-array"}});

  const auto result = fx.load();

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error->path.filename(), "Broken.json");
  EXPECT_NE(result.error->message.find("transitionRoutes"), std::string::npos);
}

TEST(ResourceStore, NonObjectDocumentIsLoadError)
{
  AgentFixture fx("flow_lint_array_doc");
  fx.write_text("flows/Main/Main.json", "[1, 2, 3]");

  const auto result = fx.load();

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error->path.filename(), "Main.json");
  EXPECT_NE(result.error->message.find("JSON object"), std::string::npos);
}

TEST(ResourceStore, LoadErrorFormatsPathAndMessage)
{
  const LoadError err{"agent/flows/Main/Main.json", "document must be a JSON object"};
  EXPECT_EQ(err.to_string(), "agent/flows/Main/Main.json: document must be a JSON object");
}
