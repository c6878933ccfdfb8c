// flow_lint/test_support/agent_fixture.hpp - helpers for unit/integration tests
//
// AgentFixture writes an exported-agent directory tree under the system temp
// directory. The free builders assemble the same model in memory for tests
// that exercise a single pass.
//
#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "flow_lint/model/agent_graph.hpp"
#include "flow_lint/model/resource_store.hpp"

namespace flow_lint::test_support
{

// ============================================================================
// On-disk fixtures
// ============================================================================

class AgentFixture
{
public:
  explicit AgentFixture(std::string_view prefix = "flow_lint_agent")
  {
    const auto base = std::filesystem::temp_directory_path();
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    static int counter = 0;
    root_ = base / (std::string(prefix) + "_" + std::to_string(now) + "_" +
                    std::to_string(counter++));
    std::filesystem::create_directories(root_);
  }

  ~AgentFixture()
  {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  AgentFixture(const AgentFixture &) = delete;
  AgentFixture & operator=(const AgentFixture &) = delete;

  [[nodiscard]] const std::filesystem::path & root() const noexcept { return root_; }

  /// flows/<dir>/<dir>.json
  std::filesystem::path add_flow(const std::string & dir, const nlohmann::json & doc)
  {
    return write_json(flow_dir(dir) / (dir + ".json"), doc);
  }

  /// flows/<dir>/pages/<stem>.json
  std::filesystem::path add_page(
    const std::string & dir, const std::string & stem, const nlohmann::json & doc)
  {
    return write_json(flow_dir(dir) / k_pages_dir_name / (stem + ".json"), doc);
  }

  /// flows/<dir>/transitionRouteGroups/<stem>.json
  std::filesystem::path add_route_group(
    const std::string & dir, const std::string & stem, const nlohmann::json & doc)
  {
    return write_json(flow_dir(dir) / k_route_groups_dir_name / (stem + ".json"), doc);
  }

  /// Write arbitrary text relative to the agent root.
  std::filesystem::path write_text(const std::filesystem::path & relative, const std::string & text)
  {
    const auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    if (!out.is_open()) {
      throw std::runtime_error("cannot write fixture file: " + path.string());
    }
    out << text;
    return path;
  }

  [[nodiscard]] AgentLoadResult load() const { return load_agent(root_); }

private:
  [[nodiscard]] std::filesystem::path flow_dir(const std::string & dir) const
  {
    return root_ / k_flows_dir_name / dir;
  }

  std::filesystem::path write_json(const std::filesystem::path & path, const nlohmann::json & doc)
  {
    return write_text(std::filesystem::relative(path, root_), doc.dump(2));
  }

  std::filesystem::path root_;
};

// ============================================================================
// Document builders (exported JSON shape)
// ============================================================================

[[nodiscard]] inline nlohmann::json json_route_to(
  const std::string & target_page, const std::string & condition = "true")
{
  return {{"condition", condition}, {"targetPage", target_page}};
}

[[nodiscard]] inline nlohmann::json json_intent_route(
  const std::string & intent, const std::string & target_page)
{
  return {{"intent", intent}, {"targetPage", target_page}};
}

[[nodiscard]] inline nlohmann::json json_handler(const std::string & event)
{
  return {{"event", event}, {"triggerFulfillment", {{"messages", nlohmann::json::array()}}}};
}

// ============================================================================
// In-memory builders
// ============================================================================

[[nodiscard]] inline TransitionRoute route_to(
  std::string target_page, std::optional<std::string> condition = std::string("true"))
{
  TransitionRoute r;
  r.condition = std::move(condition);
  r.target_page = std::move(target_page);
  return r;
}

[[nodiscard]] inline TransitionRoute intent_route(std::string intent, std::string target_page)
{
  TransitionRoute r;
  r.intent = std::move(intent);
  r.target_page = std::move(target_page);
  return r;
}

[[nodiscard]] inline EventHandler handler(
  std::string event, std::optional<std::string> target_page = std::nullopt)
{
  EventHandler h;
  h.event = std::move(event);
  h.target_page = std::move(target_page);
  return h;
}

[[nodiscard]] inline Page make_page(std::string id, std::vector<TransitionRoute> routes = {})
{
  Page p;
  p.display_name = id;
  p.id = std::move(id);
  p.transition_routes = std::move(routes);
  return p;
}

[[nodiscard]] inline Flow make_flow(
  std::string id, std::vector<TransitionRoute> start_routes, std::vector<Page> pages = {})
{
  Flow f;
  f.display_name = id;
  f.id = std::move(id);
  f.transition_routes = std::move(start_routes);
  f.pages = std::move(pages);
  return f;
}

[[nodiscard]] inline AgentGraph make_graph(std::vector<Flow> flows)
{
  AgentGraph graph;
  for (auto & f : flows) {
    graph.add_flow(std::move(f));
  }
  return graph;
}

}  // namespace flow_lint::test_support
