// flow_lint/model/agent_graph.hpp - In-memory model of an exported agent
//
// Flows own their pages and route groups. Everything here is built once by
// load_agent() and treated as immutable by the analysis passes.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flow_lint
{

// ============================================================================
// Addressing
// ============================================================================

/// Index of a page inside Flow::pages.
using PageIndex = std::size_t;

/// Address of the implicit "Start" page every flow has.
inline constexpr PageIndex k_start_page = std::numeric_limits<PageIndex>::max();

inline constexpr const char * k_start_page_name = "Start";

// ============================================================================
// Transitions
// ============================================================================

struct TransitionRoute
{
  std::optional<std::string> condition;
  std::optional<std::string> intent;
  std::optional<std::string> target_page;
  std::optional<std::string> target_flow;
  bool has_trigger_fulfillment = false;
};

struct EventHandler
{
  std::string event;
  std::optional<std::string> target_page;
  std::optional<std::string> target_flow;
  bool has_trigger_fulfillment = false;
};

struct FormParameter
{
  std::string display_name;
  bool has_initial_prompt = false;
  std::vector<EventHandler> reprompt_event_handlers;
};

// ============================================================================
// Resources
// ============================================================================

struct Page
{
  /// `name` field of the document, or the file stem when absent.
  std::string id;
  std::string display_name;

  bool has_entry_action = false;
  std::vector<FormParameter> form_parameters;

  std::vector<TransitionRoute> transition_routes;
  std::vector<EventHandler> event_handlers;
  std::vector<std::string> route_group_refs;

  std::filesystem::path source_path;

  [[nodiscard]] bool has_form() const noexcept { return !form_parameters.empty(); }
};

struct RouteGroup
{
  std::string id;
  std::string display_name;
  std::vector<TransitionRoute> transition_routes;

  std::filesystem::path source_path;
};

/**
 * Lookup tables for reference resolution, built once at load time.
 *
 * On key collisions the first entity in load order wins.
 */
struct FlowIndex
{
  std::unordered_map<std::string, PageIndex> page_by_id;
  std::unordered_map<std::string, PageIndex> page_by_name;
  std::unordered_map<std::string, PageIndex> page_by_segment;

  std::unordered_map<std::string, std::size_t> route_group_by_id;
  std::unordered_map<std::string, std::size_t> route_group_by_name;
};

struct Flow
{
  std::string id;
  std::string display_name;

  /// Routes, handlers and route groups of the implicit Start page.
  std::vector<TransitionRoute> transition_routes;
  std::vector<EventHandler> event_handlers;
  std::vector<std::string> route_group_refs;

  std::vector<Page> pages;
  std::vector<RouteGroup> route_groups;

  FlowIndex index;

  std::filesystem::path source_path;

  /// Display name of a page address ("Start" for k_start_page).
  [[nodiscard]] std::string_view page_name(PageIndex page) const noexcept;

  /// Register pages and route groups into `index`. AgentGraph::add_flow calls this.
  void rebuild_index();
};

// ============================================================================
// Agent Graph
// ============================================================================

class AgentGraph
{
public:
  AgentGraph() = default;

  AgentGraph(const AgentGraph &) = delete;
  AgentGraph & operator=(const AgentGraph &) = delete;
  AgentGraph(AgentGraph &&) = default;
  AgentGraph & operator=(AgentGraph &&) = default;

  [[nodiscard]] const std::vector<Flow> & flows() const noexcept { return flows_; }
  [[nodiscard]] const std::filesystem::path & root() const noexcept { return root_; }

  /// Find a flow by id, display name or final path segment of its id.
  [[nodiscard]] const Flow * find_flow(std::string_view ref) const;

  [[nodiscard]] std::size_t page_count() const noexcept;
  [[nodiscard]] std::size_t route_group_count() const noexcept;

  // Mutation is restricted to loading.
  void set_root(std::filesystem::path root) { root_ = std::move(root); }
  Flow & add_flow(Flow flow);

private:
  std::filesystem::path root_;
  std::vector<Flow> flows_;
  std::unordered_map<std::string, std::size_t> flow_by_id_;
  std::unordered_map<std::string, std::size_t> flow_by_name_;
};

/// Final '/'-separated segment of a resource reference.
[[nodiscard]] std::string_view last_path_segment(std::string_view ref) noexcept;

}  // namespace flow_lint
