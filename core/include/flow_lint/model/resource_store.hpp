// flow_lint/model/resource_store.hpp - Load an exported agent directory tree
//
// Expected layout (absent subtrees are treated as empty):
//
//   <root>/flows/<dir>/<dir>.json                  flow document
//   <root>/flows/<dir>/pages/*.json                page documents
//   <root>/flows/<dir>/transitionRouteGroups/*.json route group documents
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "flow_lint/model/agent_graph.hpp"

namespace flow_lint
{

// ============================================================================
// Load Result
// ============================================================================

/**
 * Fatal loading failure: the root is missing or a document is unreadable or
 * malformed.
 */
struct LoadError
{
  /// Offending file or directory
  std::filesystem::path path;

  std::string message;

  [[nodiscard]] std::string to_string() const { return path.string() + ": " + message; }
};

/**
 * Result of loading an agent directory.
 */
struct AgentLoadResult
{
  /// Loaded graph (only valid if success == true)
  AgentGraph graph;

  /// Whether loading succeeded
  bool success = false;

  /// Set when loading failed
  std::optional<LoadError> error;

  /// Create a successful result
  static AgentLoadResult ok(AgentGraph g)
  {
    AgentLoadResult r;
    r.graph = std::move(g);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static AgentLoadResult fail(std::filesystem::path path, std::string msg)
  {
    AgentLoadResult r;
    r.error = LoadError{std::move(path), std::move(msg)};
    r.success = false;
    return r;
  }
};

// ============================================================================
// Loading API
// ============================================================================

/**
 * Load every flow, page and route group under `root`.
 *
 * Directory listings are sorted by file name, so the resulting graph (and
 * every report computed from it) is stable run over run. No partial graph is
 * returned on failure.
 *
 * @param root Agent export root directory
 * @return AgentLoadResult with the graph or the LoadError
 */
[[nodiscard]] AgentLoadResult load_agent(const std::filesystem::path & root);

inline constexpr const char * k_flows_dir_name = "flows";
inline constexpr const char * k_pages_dir_name = "pages";
inline constexpr const char * k_route_groups_dir_name = "transitionRouteGroups";

}  // namespace flow_lint
