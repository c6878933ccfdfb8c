// flow_lint/analysis/reachability_analyzer.hpp - Unreachable page detection
//
// Breadth-first search from each flow's implicit Start page. Pages the search
// never visits are reported as warnings.
//
#pragma once

#include <cstddef>
#include <vector>

#include "flow_lint/basic/finding.hpp"
#include "flow_lint/model/agent_graph.hpp"

namespace flow_lint
{

class ReachabilityAnalyzer
{
public:
  explicit ReachabilityAnalyzer(FindingBag * findings = nullptr) : findings_(findings) {}

  /**
   * Check every flow of the graph.
   *
   * @return true if no page is unreachable
   */
  bool check(const AgentGraph & graph);

  /// Check a single flow.
  bool check(const Flow & flow);

  /**
   * Reachability of each page of `flow` (indexed by PageIndex).
   *
   * Edges: own routes, referenced route groups' routes and event handlers.
   * Form reprompt handlers are not followed.
   */
  [[nodiscard]] static std::vector<bool> reachable_pages(const Flow & flow);

  [[nodiscard]] bool has_findings() const noexcept { return findingCount_ > 0; }
  [[nodiscard]] size_t finding_count() const noexcept { return findingCount_; }

private:
  FindingBag * findings_ = nullptr;
  size_t findingCount_ = 0;
};

}  // namespace flow_lint
