// flow_lint/driver/linter.hpp - Lint pipeline driver
//
// Single entry point for the load + analyze pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "flow_lint/analysis/finding_aggregator.hpp"
#include "flow_lint/basic/finding.hpp"
#include "flow_lint/model/resource_store.hpp"

namespace flow_lint
{

// ============================================================================
// Lint Result
// ============================================================================

struct LintResult
{
  /// Whether the agent loaded (findings are only meaningful if true)
  bool success = false;

  /// Set when loading failed; no analysis ran
  std::optional<LoadError> load_error;

  /// Findings of all enabled passes, in pass order
  FindingBag findings;

  /// Loaded graph (for introspection by callers)
  std::unique_ptr<AgentGraph> graph;
};

// ============================================================================
// Linter
// ============================================================================

/**
 * Driver that orchestrates the pipeline.
 *
 * The pipeline consists of:
 * 1. Loading the agent directory (sequential, all or nothing)
 * 2. Running the enabled analysis passes on the immutable graph
 * 3. Concatenating their findings in fixed order
 */
class Linter
{
public:
  /**
   * Load and analyze an exported agent directory.
   *
   * @param root Agent export root directory
   * @param options Analysis options
   * @return LintResult with findings, or the load error
   */
  [[nodiscard]] static LintResult lint_agent(
    const std::filesystem::path & root, const AnalysisOptions & options);

  /**
   * Analyze an already loaded graph.
   */
  [[nodiscard]] static FindingBag lint_graph(
    const AgentGraph & graph, const AnalysisOptions & options);
};

}  // namespace flow_lint
